#pragma once

#include <cstdint>

// Integer decoding from raw byte slices. PCF table directories are
// little-endian; the tables used here are stored most significant byte first.
// No bounds checking: callers pass at least 2 or 4 readable bytes.

namespace PcfText {
namespace bytes {

inline uint16_t u16FromLe(const uint8_t* buf) {
  return static_cast<uint16_t>(buf[0] | (buf[1] << 8));
}

inline int16_t i16FromLe(const uint8_t* buf) {
  return static_cast<int16_t>(u16FromLe(buf));
}

inline uint16_t u16FromBe(const uint8_t* buf) {
  return static_cast<uint16_t>((buf[0] << 8) | buf[1]);
}

inline int16_t i16FromBe(const uint8_t* buf) {
  return static_cast<int16_t>(u16FromBe(buf));
}

inline uint32_t u32FromLe(const uint8_t* buf) {
  uint32_t value = 0;
  for (int i = 0; i < 4; i++) {
    value |= static_cast<uint32_t>(buf[i]) << (i * 8);
  }
  return value;
}

inline int32_t i32FromLe(const uint8_t* buf) {
  return static_cast<int32_t>(u32FromLe(buf));
}

inline uint32_t u32FromBe(const uint8_t* buf) {
  uint32_t value = 0;
  for (int i = 0; i < 4; i++) {
    value |= static_cast<uint32_t>(buf[i]) << ((3 - i) * 8);
  }
  return value;
}

inline int32_t i32FromBe(const uint8_t* buf) {
  return static_cast<int32_t>(u32FromBe(buf));
}

}  // namespace bytes
}  // namespace PcfText
