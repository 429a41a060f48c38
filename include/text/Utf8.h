#pragma once

#include <cstddef>
#include <cstdint>

namespace PcfText {

// U+FFFD, returned for code points outside the 16-bit range
constexpr uint16_t REPLACEMENT_CHARACTER = 0xFFFD;

/**
 * Decode one UTF-8 sequence into a 16-bit code point
 *
 * Code points above U+FFFF cannot be addressed by a PCF encoding table
 * and decode to REPLACEMENT_CHARACTER. Malformed or truncated sequences
 * yield the lead byte as a Latin-1 code point and consume one byte.
 *
 * @param text Pointer to the first byte of the sequence
 * @param length Bytes available from text, must be at least 1
 * @param bytes_consumed Receives the sequence length
 */
uint16_t decodeUtf8(const char* text, size_t length, size_t& bytes_consumed);

}  // namespace PcfText
