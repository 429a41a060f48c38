#include <unity.h>

#include "font/ByteOrder.h"
#include "font/PcfFont.h"

using namespace PcfText;

void setUp(void) {}

void tearDown(void) {}

// ============================================================================
// Integer decoding
// ============================================================================

void test_u16_both_orders() {
  const uint8_t data[] = {0x12, 0x34};
  TEST_ASSERT_EQUAL_HEX16(0x3412, bytes::u16FromLe(data));
  TEST_ASSERT_EQUAL_HEX16(0x1234, bytes::u16FromBe(data));
}

void test_i16_sign_extends() {
  const uint8_t data[] = {0xFF, 0xFE};
  TEST_ASSERT_EQUAL_INT16(-2, bytes::i16FromBe(data));
  TEST_ASSERT_EQUAL_INT16(-257, bytes::i16FromLe(data));
}

void test_u32_both_orders() {
  const uint8_t data[] = {0x01, 0x66, 0x63, 0x70};
  TEST_ASSERT_EQUAL_HEX32(0x70636601, bytes::u32FromLe(data));
  TEST_ASSERT_EQUAL_HEX32(0x01666370, bytes::u32FromBe(data));
}

void test_i32_negative() {
  const uint8_t data[] = {0xFF, 0xFF, 0xFF, 0xFD};
  TEST_ASSERT_EQUAL_INT32(-3, bytes::i32FromBe(data));
  const uint8_t le[] = {0xFD, 0xFF, 0xFF, 0xFF};
  TEST_ASSERT_EQUAL_INT32(-3, bytes::i32FromLe(le));
}

// ============================================================================
// Row padding
// ============================================================================

void test_bytes_per_row() {
  TEST_ASSERT_EQUAL_UINT32(2, bytesPerRow(9, 1));
  TEST_ASSERT_EQUAL_UINT32(1, bytesPerRow(8, 1));
  TEST_ASSERT_EQUAL_UINT32(2, bytesPerRow(5, 2));
  TEST_ASSERT_EQUAL_UINT32(4, bytesPerRow(8, 4));
  TEST_ASSERT_EQUAL_UINT32(8, bytesPerRow(33, 4));
  TEST_ASSERT_EQUAL_UINT32(0, bytesPerRow(0, 1));
  TEST_ASSERT_EQUAL_UINT32(0, bytesPerRow(0, 4));
}

void test_padding_bytes() {
  TEST_ASSERT_EQUAL_UINT32(1, paddingBytes(GlyphPadding::Byte));
  TEST_ASSERT_EQUAL_UINT32(2, paddingBytes(GlyphPadding::Short));
  TEST_ASSERT_EQUAL_UINT32(4, paddingBytes(GlyphPadding::Int));
}

void test_compressed_metrics_bias() {
  const uint8_t data[] = {0x81, 0x82, 0x83, 0x84, 0x85};
  MetricsEntry entry = MetricsEntry::fromCompressed(data);
  TEST_ASSERT_EQUAL_INT16(1, entry.left_side_bearing);
  TEST_ASSERT_EQUAL_INT16(2, entry.right_side_bearing);
  TEST_ASSERT_EQUAL_INT16(3, entry.character_width);
  TEST_ASSERT_EQUAL_INT16(4, entry.character_ascent);
  TEST_ASSERT_EQUAL_INT16(5, entry.character_descent);
  TEST_ASSERT_EQUAL_UINT16(0, entry.character_attributes);
}

void test_metrics_entry_decoding() {
  const uint8_t compressed[] = {0x7F, 0x85, 0x86, 0x87, 0x80};
  MetricsEntry entry = MetricsEntry::fromCompressed(compressed);
  TEST_ASSERT_EQUAL_INT16(-1, entry.left_side_bearing);
  TEST_ASSERT_EQUAL_INT16(5, entry.right_side_bearing);
  TEST_ASSERT_EQUAL_INT16(6, entry.character_width);
  TEST_ASSERT_EQUAL_INT16(7, entry.character_ascent);
  TEST_ASSERT_EQUAL_INT16(0, entry.character_descent);
  TEST_ASSERT_EQUAL_UINT16(0, entry.character_attributes);
  TEST_ASSERT_EQUAL(6, entry.glyphWidth());
  TEST_ASSERT_EQUAL(7, entry.glyphHeight());

  const uint8_t standard[] = {0xFF, 0xFF, 0x00, 0x05, 0x00, 0x06, 0x00, 0x07, 0xFF, 0xFE, 0x12, 0x34};
  entry = MetricsEntry::fromStandard(standard);
  TEST_ASSERT_EQUAL_INT16(-1, entry.left_side_bearing);
  TEST_ASSERT_EQUAL_INT16(5, entry.right_side_bearing);
  TEST_ASSERT_EQUAL_INT16(6, entry.character_width);
  TEST_ASSERT_EQUAL_INT16(7, entry.character_ascent);
  TEST_ASSERT_EQUAL_INT16(-2, entry.character_descent);
  TEST_ASSERT_EQUAL_HEX16(0x1234, entry.character_attributes);
}

void test_error_names() {
  TEST_ASSERT_EQUAL_STRING("None", errorName(Error::None));
  TEST_ASSERT_EQUAL_STRING("CorruptedData", errorName(Error::CorruptedData));
  TEST_ASSERT_EQUAL_STRING("Io", errorName(Error::Io));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_u16_both_orders);
  RUN_TEST(test_i16_sign_extends);
  RUN_TEST(test_u32_both_orders);
  RUN_TEST(test_i32_negative);
  RUN_TEST(test_bytes_per_row);
  RUN_TEST(test_padding_bytes);
  RUN_TEST(test_compressed_metrics_bias);
  RUN_TEST(test_metrics_entry_decoding);
  RUN_TEST(test_error_names);
  return UNITY_END();
}
