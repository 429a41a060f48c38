#include <unity.h>

#include "display/FrameBuffer.h"

using namespace PcfText;

void setUp(void) {}

void tearDown(void) {}

void test_new_buffer_is_clear() {
  FrameBuffer<uint8_t> buffer(4, 3, 7);
  TEST_ASSERT_EQUAL(4, buffer.getWidth());
  TEST_ASSERT_EQUAL(3, buffer.getHeight());
  TEST_ASSERT_EQUAL_UINT32(12, buffer.countPixels(7));
  TEST_ASSERT_TRUE(buffer.boundingBox() == Rectangle(Point(0, 0), Size(4, 3)));
}

void test_pixels_outside_are_ignored() {
  FrameBuffer<uint8_t> buffer(4, 3);
  buffer.setPixel(-1, 0, 1);
  buffer.setPixel(4, 0, 1);
  buffer.setPixel(0, 3, 1);
  TEST_ASSERT_EQUAL_UINT32(0, buffer.countPixels(1));
  TEST_ASSERT_FALSE(buffer.isValidPosition(4, 2));
  TEST_ASSERT_EQUAL_UINT8(0, buffer.getPixel(10, 10));

  buffer.setPixel(3, 2, 1);
  TEST_ASSERT_EQUAL_UINT8(1, buffer.getPixel(3, 2));
}

void test_fill_solid_clips() {
  FrameBuffer<uint8_t> buffer(4, 3);
  buffer.fillSolid(Rectangle(Point(-2, -1), Size(4, 3)), 5);
  // covers x 0..1, y 0..1
  TEST_ASSERT_EQUAL_UINT32(4, buffer.countPixels(5));
  TEST_ASSERT_EQUAL_UINT8(5, buffer.getPixel(1, 1));
  TEST_ASSERT_EQUAL_UINT8(0, buffer.getPixel(2, 1));

  buffer.fillSolid(Rectangle(Point(3, 2), Size(100, 100)), 6);
  TEST_ASSERT_EQUAL_UINT32(1, buffer.countPixels(6));

  buffer.fillSolid(Rectangle(Point(10, 10), Size(2, 2)), 6);
  TEST_ASSERT_EQUAL_UINT32(1, buffer.countPixels(6));
}

void test_draw_pixels() {
  FrameBuffer<uint8_t> buffer(4, 3);
  const Pixel<uint8_t> pixels[] = {
    {Point(0, 0), 1},
    {Point(3, 2), 2},
    {Point(-1, 1), 3},
  };
  buffer.drawPixels(pixels, 3);
  TEST_ASSERT_EQUAL_UINT8(1, buffer.getPixel(0, 0));
  TEST_ASSERT_EQUAL_UINT8(2, buffer.getPixel(3, 2));
  TEST_ASSERT_EQUAL_UINT32(0, buffer.countPixels(3));
}

void test_clear_and_compare() {
  FrameBuffer<uint8_t> a(4, 3);
  FrameBuffer<uint8_t> b(4, 3);
  a.fillBuffer(9);
  TEST_ASSERT_FALSE(a == b);
  a.clearBuffer();
  TEST_ASSERT_TRUE(a == b);
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_new_buffer_is_clear);
  RUN_TEST(test_pixels_outside_are_ignored);
  RUN_TEST(test_fill_solid_clips);
  RUN_TEST(test_draw_pixels);
  RUN_TEST(test_clear_and_compare);
  return UNITY_END();
}
