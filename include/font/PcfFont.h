#ifndef PCF_FONT_H
#define PCF_FONT_H

#include <cstddef>
#include <cstdint>
#include <memory>

#include "font/ByteSource.h"

namespace PcfText {

enum class Error : uint8_t {
  None = 0,
  UnsupportedFormat,  // recognized but unhandled encoding variant
  CorruptedData,      // count mismatch, missing table, reserved field value
  NotFound,           // code point has no glyph
  Io,                 // byte source failure, including out-of-range reads
  Other
};

const char* errorName(Error error);

// How each glyph row is padded in the bitmap table
enum class GlyphPadding : uint8_t {
  Byte = 0,
  Short = 1,
  Int = 2
};

// Bytes needed for one row of `width` pixels padded to `bytes_align` bytes
constexpr size_t bytesPerRow(size_t width, size_t bytes_align) {
  return (width + bytes_align * 8 - 1) / (bytes_align * 8) * bytes_align;
}

size_t paddingBytes(GlyphPadding padding);

struct MetricsEntry {
  int16_t left_side_bearing;
  int16_t right_side_bearing;
  int16_t character_width;
  int16_t character_ascent;
  int16_t character_descent;
  uint16_t character_attributes;

  // 5 bytes, each biased by 0x80
  static MetricsEntry fromCompressed(const uint8_t* data);
  // 12 bytes, big-endian
  static MetricsEntry fromStandard(const uint8_t* data);

  int glyphWidth() const { return right_side_bearing - left_side_bearing; }
  int glyphHeight() const { return character_ascent + character_descent; }
};

// Maximum glyph box of the font. y_offset is the negated maximum descent.
struct BoundingBox {
  int16_t width;
  int16_t height;
  int16_t x_offset;
  int16_t y_offset;

  int maxAscent() const { return height + y_offset; }
  int maxDescent() const { return y_offset; }
};

// Result of PcfFont::readGlyphRaw()
struct GlyphRaw {
  size_t length;  // bytes written, rows padded to whole bytes
  size_t width;   // glyph width in pixels
  MetricsEntry metrics;
};

/**
 * Opened PCF font
 *
 * Created only by PcfFont::load(), which validates the container and
 * derives the absolute offsets of the lookup tables. Glyphs are read on
 * demand from the owned byte source, so lookups move its cursor: a font
 * must not be used by two draw operations at the same time.
 */
class PcfFont {
public:
  /**
   * Validate a PCF container and open it
   *
   * @param source Byte source holding the font, ownership is taken
   * @param font Receives the opened font on success, untouched otherwise
   * @return Error::None, or the reason the container was rejected
   */
  static Error load(std::unique_ptr<IByteSource> source, std::unique_ptr<PcfFont>& font);

  const BoundingBox& boundingBox() const { return bounding_box_; }
  uint32_t glyphCount() const { return glyph_count_; }
  int32_t ascent() const { return ascent_; }
  int32_t descent() const { return descent_; }
  GlyphPadding rowPaddingMode() const { return row_padding_; }
  bool metricsCompressed() const { return metrics_compressed_; }
  uint16_t defaultChar() const { return default_char_; }

  // Bytes needed to hold the largest glyph of this font
  size_t maxBytesPerGlyph() const;

  // Code point drawn in place of characters the font has no glyph for
  void overrideDefaultChar(uint16_t code_point);

  /**
   * Read the bitmap of a glyph, rows normalized to whole bytes, MSBit first
   *
   * Empty glyphs (length 0) are valid and still have an advance width.
   *
   * @param code_point 16-bit code point
   * @param buffer Destination, see maxBytesPerGlyph()
   * @param buffer_size Capacity of buffer; Error::Other if too small
   * @param glyph Receives length, width and metrics
   */
  Error readGlyphRaw(uint16_t code_point, uint8_t* buffer, size_t buffer_size, GlyphRaw& glyph) const;

  // Metrics of a glyph without reading its bitmap.
  // Error::CorruptedData if the glyph box has a negative size.
  Error getGlyphMetrics(uint16_t code_point, MetricsEntry& metrics) const;

  Error getGlyphIndex(uint16_t code_point, uint16_t& glyph_index) const;

private:
  PcfFont() = default;

  Error getGlyphBitmapOffset(uint16_t glyph_index, uint32_t& offset) const;
  Error getMetrics(uint16_t glyph_index, MetricsEntry& metrics) const;

  // Cursor moves on every lookup; the font state itself never changes
  std::unique_ptr<IByteSource> data_;

  uint32_t glyph_count_{0};
  int32_t ascent_{0};
  int32_t descent_{0};
  bool metrics_compressed_{false};
  BoundingBox bounding_box_{0, 0, 0, 0};
  GlyphPadding row_padding_{GlyphPadding::Byte};

  uint16_t min_char_or_byte2_{0};
  uint16_t max_char_or_byte2_{0};
  uint16_t min_byte1_{0};
  uint16_t max_byte1_{0};
  uint16_t default_char_{0};

  uint32_t encoded_glyph_indices_location_{0};
  uint32_t bitmap_position_lut_location_{0};
  uint32_t bitmap_data_location_{0};
  uint32_t metrics_data_location_{0};
};

}  // namespace PcfText

#endif // PCF_FONT_H
