#include "text/Utf8.h"

namespace PcfText {

uint16_t decodeUtf8(const char* text, size_t length, size_t& bytes_consumed) {
  uint8_t lead = static_cast<unsigned char>(text[0]);
  bytes_consumed = 1;

  // ASCII
  if (lead < 0x80) {
    return lead;
  }

  size_t sequence_length;
  uint32_t code_point;
  if ((lead & 0xE0) == 0xC0) {
    sequence_length = 2;
    code_point = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    sequence_length = 3;
    code_point = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    sequence_length = 4;
    code_point = lead & 0x07;
  } else {
    return lead;  // stray continuation byte or invalid lead
  }

  if (sequence_length > length) {
    return lead;
  }
  for (size_t i = 1; i < sequence_length; i++) {
    uint8_t next = static_cast<unsigned char>(text[i]);
    if ((next & 0xC0) != 0x80) {
      return lead;
    }
    code_point = (code_point << 6) | (next & 0x3F);
  }

  bytes_consumed = sequence_length;
  if (code_point > 0xFFFF) {
    return REPLACEMENT_CHARACTER;
  }
  return static_cast<uint16_t>(code_point);
}

}  // namespace PcfText
