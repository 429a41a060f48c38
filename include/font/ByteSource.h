#ifndef PCF_BYTE_SOURCE_H
#define PCF_BYTE_SOURCE_H

#ifdef ARDUINO
#include <Arduino.h>
#else
#include <stdint.h>
#include <cstdio>
#endif
#include <cstddef>
#include <memory>

namespace PcfText {

/**
 * Abstract random-access byte stream a font is read from
 *
 * Fonts are never loaded into RAM as a whole; every glyph lookup seeks
 * and reads through this interface. Each source has a single cursor, so
 * one source must not be shared by two readers at the same time.
 */
class IByteSource {
public:
  virtual ~IByteSource() = default;

  /**
   * Move the cursor to an absolute offset
   *
   * @param offset Offset from the start of the data
   * @return true on success, false if the offset is out of range
   */
  virtual bool seek(uint32_t offset) = 0;

  /**
   * Move the cursor relative to its current position
   *
   * @param delta Signed byte count
   * @return true on success, false if the new position is out of range
   */
  virtual bool seekRelative(int32_t delta) = 0;

  /**
   * Read exactly length bytes at the cursor and advance it
   *
   * @param buffer Destination, at least length bytes
   * @param length Number of bytes to read
   * @return true if all bytes were read, false on short read or I/O error
   */
  virtual bool readExact(uint8_t* buffer, size_t length) = 0;
};

/**
 * Byte source over an immutable font blob in memory (PROGMEM on Arduino)
 *
 * The blob is not owned and must outlive the source. clone() hands out an
 * independent cursor over the same bytes for concurrent readers.
 */
class MemoryByteSource : public IByteSource {
public:
  MemoryByteSource(const uint8_t* data, size_t size);

  bool seek(uint32_t offset) override;
  bool seekRelative(int32_t delta) override;
  bool readExact(uint8_t* buffer, size_t length) override;

  std::unique_ptr<MemoryByteSource> clone() const;

  size_t size() const { return size_; }
  size_t position() const { return position_; }

private:
  const uint8_t* data_;
  size_t size_;
  size_t position_;
};

#ifndef ARDUINO
/**
 * Byte source over a file opened with stdio (host builds only)
 */
class FileByteSource : public IByteSource {
public:
  // Returns nullptr if the file cannot be opened
  static std::unique_ptr<FileByteSource> open(const char* path);

  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  bool seek(uint32_t offset) override;
  bool seekRelative(int32_t delta) override;
  bool readExact(uint8_t* buffer, size_t length) override;

private:
  explicit FileByteSource(std::FILE* file);

  std::FILE* file_;
};
#endif

}  // namespace PcfText

#endif // PCF_BYTE_SOURCE_H
