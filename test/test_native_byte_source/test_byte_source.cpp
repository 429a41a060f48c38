#include <unity.h>

#include <cstdio>

#include "font/ByteSource.h"

using namespace PcfText;

namespace {

const uint8_t DATA[] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
const char* const TEMP_PATH = "/tmp/pcftext_byte_source_test.bin";

}  // namespace

void setUp(void) {}

void tearDown(void) {
  std::remove(TEMP_PATH);
}

// ============================================================================
// MemoryByteSource
// ============================================================================

void test_memory_sequential_reads() {
  MemoryByteSource source(DATA, sizeof(DATA));
  uint8_t buffer[4] = {0};

  TEST_ASSERT_TRUE(source.readExact(buffer, 3));
  TEST_ASSERT_EQUAL_UINT8(0, buffer[0]);
  TEST_ASSERT_EQUAL_UINT8(2, buffer[2]);
  TEST_ASSERT_TRUE(source.readExact(buffer, 2));
  TEST_ASSERT_EQUAL_UINT8(3, buffer[0]);
  TEST_ASSERT_EQUAL_UINT32(5, source.position());
}

void test_memory_seek_bounds() {
  MemoryByteSource source(DATA, sizeof(DATA));
  TEST_ASSERT_TRUE(source.seek(10));   // end of data is a valid position
  TEST_ASSERT_FALSE(source.seek(11));
  TEST_ASSERT_EQUAL_UINT32(10, source.position());

  TEST_ASSERT_TRUE(source.seek(4));
  TEST_ASSERT_TRUE(source.seekRelative(-4));
  TEST_ASSERT_FALSE(source.seekRelative(-1));
  TEST_ASSERT_TRUE(source.seekRelative(10));
  TEST_ASSERT_FALSE(source.seekRelative(1));
}

void test_memory_short_read_fails() {
  MemoryByteSource source(DATA, sizeof(DATA));
  uint8_t buffer[4];
  TEST_ASSERT_TRUE(source.seek(8));
  TEST_ASSERT_FALSE(source.readExact(buffer, 3));
  TEST_ASSERT_EQUAL_UINT32(8, source.position());
  TEST_ASSERT_TRUE(source.readExact(buffer, 2));
  TEST_ASSERT_EQUAL_UINT8(9, buffer[1]);
  TEST_ASSERT_TRUE(source.readExact(buffer, 0));
}

void test_memory_clone_has_own_cursor() {
  MemoryByteSource source(DATA, sizeof(DATA));
  TEST_ASSERT_TRUE(source.seek(6));

  std::unique_ptr<MemoryByteSource> copy = source.clone();
  TEST_ASSERT_NOT_NULL(copy.get());
  TEST_ASSERT_EQUAL_UINT32(0, copy->position());
  TEST_ASSERT_EQUAL_UINT32(sizeof(DATA), copy->size());

  uint8_t a = 0;
  uint8_t b = 0;
  TEST_ASSERT_TRUE(copy->readExact(&a, 1));
  TEST_ASSERT_TRUE(source.readExact(&b, 1));
  TEST_ASSERT_EQUAL_UINT8(0, a);
  TEST_ASSERT_EQUAL_UINT8(6, b);
}

// ============================================================================
// FileByteSource
// ============================================================================

void test_file_missing_returns_null() {
  TEST_ASSERT_NULL(FileByteSource::open("/nonexistent/pcftext/font.pcf").get());
}

void test_file_seek_and_read() {
  std::FILE* file = std::fopen(TEMP_PATH, "wb");
  TEST_ASSERT_NOT_NULL(file);
  TEST_ASSERT_EQUAL_UINT32(sizeof(DATA), std::fwrite(DATA, 1, sizeof(DATA), file));
  std::fclose(file);

  std::unique_ptr<FileByteSource> source = FileByteSource::open(TEMP_PATH);
  TEST_ASSERT_NOT_NULL(source.get());

  uint8_t buffer[4] = {0};
  TEST_ASSERT_TRUE(source->seek(5));
  TEST_ASSERT_TRUE(source->readExact(buffer, 2));
  TEST_ASSERT_EQUAL_UINT8(5, buffer[0]);
  TEST_ASSERT_EQUAL_UINT8(6, buffer[1]);

  TEST_ASSERT_TRUE(source->seekRelative(-7));
  TEST_ASSERT_TRUE(source->readExact(buffer, 1));
  TEST_ASSERT_EQUAL_UINT8(0, buffer[0]);

  TEST_ASSERT_TRUE(source->seek(8));
  TEST_ASSERT_FALSE(source->readExact(buffer, 4));
}

int main(int argc, char** argv) {
  UNITY_BEGIN();
  RUN_TEST(test_memory_sequential_reads);
  RUN_TEST(test_memory_seek_bounds);
  RUN_TEST(test_memory_short_read_fails);
  RUN_TEST(test_memory_clone_has_own_cursor);
  RUN_TEST(test_file_missing_returns_null);
  RUN_TEST(test_file_seek_and_read);
  return UNITY_END();
}
