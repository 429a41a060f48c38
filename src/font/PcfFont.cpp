#include "font/PcfFont.h"

#include <cstring>
#include <utility>

#include "config/FontConfig.h"
#include "font/ByteOrder.h"
#include "platform/Log.h"

namespace PcfText {

namespace {

static const char* const TAG = "pcf";

struct TableTocEntry {
  bool present;
  uint32_t format;
  uint32_t size;
  uint32_t offset;
};

// Tables kept from the directory, everything else is skipped
enum TableSlot {
  SLOT_BITMAPS = 0,
  SLOT_METRICS,
  SLOT_ENCODINGS,
  SLOT_BDF_ACCELERATORS,
  SLOT_ACCELERATORS,
  SLOT_COUNT
};

// The four tables a font cannot be read without
constexpr int REQUIRED_SLOTS = SLOT_BDF_ACCELERATORS + 1;

int slotForTableType(uint32_t type) {
  switch (type) {
    case FontConfig::PCF_BITMAPS:          return SLOT_BITMAPS;
    case FontConfig::PCF_METRICS:          return SLOT_METRICS;
    case FontConfig::PCF_BDF_ENCODINGS:    return SLOT_ENCODINGS;
    case FontConfig::PCF_BDF_ACCELERATORS: return SLOT_BDF_ACCELERATORS;
    case FontConfig::PCF_ACCELERATORS:     return SLOT_ACCELERATORS;
    default:                               return -1;
  }
}

const char* slotName(int slot) {
  switch (slot) {
    case SLOT_BITMAPS:          return "bitmaps";
    case SLOT_METRICS:          return "metrics";
    case SLOT_ENCODINGS:        return "encodings";
    case SLOT_BDF_ACCELERATORS: return "accelerators";
    case SLOT_ACCELERATORS:     return "accelerators";
    default:                    return "unknown";
  }
}

bool readAt(IByteSource& source, uint64_t offset, uint8_t* buffer, size_t length) {
  if (offset > UINT32_MAX) {
    return false;
  }
  return source.seek(static_cast<uint32_t>(offset)) && source.readExact(buffer, length);
}

}  // namespace

const char* errorName(Error error) {
  switch (error) {
    case Error::None:              return "None";
    case Error::UnsupportedFormat: return "UnsupportedFormat";
    case Error::CorruptedData:     return "CorruptedData";
    case Error::NotFound:          return "NotFound";
    case Error::Io:                return "Io";
    case Error::Other:             return "Other";
  }
  return "Unknown";
}

size_t paddingBytes(GlyphPadding padding) {
  switch (padding) {
    case GlyphPadding::Short: return 2;
    case GlyphPadding::Int:   return 4;
    case GlyphPadding::Byte:
    default:                  return 1;
  }
}

MetricsEntry MetricsEntry::fromCompressed(const uint8_t* data) {
  const int16_t bias = FontConfig::METRICS_COMPRESSED_BIAS;
  MetricsEntry entry;
  entry.left_side_bearing = static_cast<int16_t>(data[0] - bias);
  entry.right_side_bearing = static_cast<int16_t>(data[1] - bias);
  entry.character_width = static_cast<int16_t>(data[2] - bias);
  entry.character_ascent = static_cast<int16_t>(data[3] - bias);
  entry.character_descent = static_cast<int16_t>(data[4] - bias);
  entry.character_attributes = 0;  // implied
  return entry;
}

MetricsEntry MetricsEntry::fromStandard(const uint8_t* data) {
  MetricsEntry entry;
  entry.left_side_bearing = bytes::i16FromBe(&data[0]);
  entry.right_side_bearing = bytes::i16FromBe(&data[2]);
  entry.character_width = bytes::i16FromBe(&data[4]);
  entry.character_ascent = bytes::i16FromBe(&data[6]);
  entry.character_descent = bytes::i16FromBe(&data[8]);
  entry.character_attributes = bytes::u16FromBe(&data[10]);
  return entry;
}

Error PcfFont::load(std::unique_ptr<IByteSource> source, std::unique_ptr<PcfFont>& font) {
  if (!source) {
    PCF_LOGW(TAG, "No byte source");
    return Error::Io;
  }

  uint8_t buffer[16];

  // Header
  if (!source->seek(0) || !source->readExact(buffer, 4)) {
    PCF_LOGW(TAG, "Cannot read header");
    return Error::Io;
  }
  if (std::memcmp(buffer, FontConfig::PCF_MAGIC, sizeof(FontConfig::PCF_MAGIC)) != 0) {
    PCF_LOGW(TAG, "Bad magic %02X %02X %02X %02X", buffer[0], buffer[1], buffer[2], buffer[3]);
    return Error::UnsupportedFormat;
  }

  // Table of contents
  TableTocEntry toc[SLOT_COUNT];
  for (int i = 0; i < SLOT_COUNT; i++) {
    toc[i] = TableTocEntry{false, 0, 0, 0};
  }

  if (!source->readExact(buffer, 4)) {
    PCF_LOGW(TAG, "Cannot read table count");
    return Error::Io;
  }
  uint32_t table_count = bytes::u32FromLe(buffer);
  for (uint32_t i = 0; i < table_count; i++) {
    if (!source->readExact(buffer, FontConfig::PCF_TOC_ENTRY_SIZE)) {
      PCF_LOGW(TAG, "Table directory truncated at entry %u of %u", i, table_count);
      return Error::Io;
    }
    int slot = slotForTableType(bytes::u32FromLe(&buffer[0]));
    if (slot < 0) {
      continue;
    }
    toc[slot].present = true;
    toc[slot].format = bytes::u32FromLe(&buffer[4]);
    toc[slot].size = bytes::u32FromLe(&buffer[8]);
    toc[slot].offset = bytes::u32FromLe(&buffer[12]);
  }

  // Both accelerator tables carry the same fields
  if (!toc[SLOT_BDF_ACCELERATORS].present) {
    toc[SLOT_BDF_ACCELERATORS] = toc[SLOT_ACCELERATORS];
  }

  const uint32_t order_mask = FontConfig::PCF_BYTE_MASK | FontConfig::PCF_BIT_MASK;
  for (int slot = 0; slot < REQUIRED_SLOTS; slot++) {
    if (!toc[slot].present) {
      PCF_LOGW(TAG, "Missing %s table", slotName(slot));
      return Error::CorruptedData;
    }
    // Only MSByte first, MSBit first data is supported
    if ((toc[slot].format & order_mask) != order_mask) {
      PCF_LOGW(TAG, "Unsupported byte/bit order in %s table (format 0x%08X)",
               slotName(slot), toc[slot].format);
      return Error::UnsupportedFormat;
    }
  }

  const TableTocEntry& bitmaps = toc[SLOT_BITMAPS];
  const TableTocEntry& metrics = toc[SLOT_METRICS];
  const TableTocEntry& encodings = toc[SLOT_ENCODINGS];
  const TableTocEntry& accelerators = toc[SLOT_BDF_ACCELERATORS];

  // Bitmap format: bits stored in bytes, rows padded to 1, 2 or 4 bytes
  if ((bitmaps.format & FontConfig::PCF_SCAN_UNIT_MASK) != 0) {
    PCF_LOGW(TAG, "Unsupported bitmap scan unit (format 0x%08X)", bitmaps.format);
    return Error::UnsupportedFormat;
  }
  uint32_t padding = bitmaps.format & FontConfig::PCF_GLYPH_PAD_MASK;
  if (padding == FontConfig::PCF_GLYPH_PAD_MASK) {
    PCF_LOGW(TAG, "Reserved glyph padding value");
    return Error::CorruptedData;
  }

  // Bitmaps table: format, glyph count, offsets[glyph_count], bitmapSizes[4]
  if (!readAt(*source, static_cast<uint64_t>(bitmaps.offset) + 4, buffer, 4)) {
    PCF_LOGW(TAG, "Cannot read glyph count");
    return Error::Io;
  }
  uint32_t glyph_count = bytes::u32FromBe(buffer);
  uint64_t bitmap_sizes_location =
      static_cast<uint64_t>(bitmaps.offset) + 8 + static_cast<uint64_t>(glyph_count) * 4;
  uint64_t bitmap_data_location = bitmap_sizes_location + FontConfig::BITMAP_SIZES_COUNT * 4;
  if (bitmap_data_location > UINT32_MAX) {
    PCF_LOGW(TAG, "Glyph count %u exceeds the container", glyph_count);
    return Error::CorruptedData;
  }
  if (!readAt(*source, bitmap_sizes_location, buffer, FontConfig::BITMAP_SIZES_COUNT * 4)) {
    PCF_LOGW(TAG, "Cannot read bitmap sizes");
    return Error::Io;
  }

  // Metrics table: format, count (u16 when compressed), entries
  bool metrics_compressed = (metrics.format & FontConfig::PCF_COMPRESSED_METRICS) != 0;
  if (!readAt(*source, static_cast<uint64_t>(metrics.offset) + 4, buffer, metrics_compressed ? 2 : 4)) {
    PCF_LOGW(TAG, "Cannot read metrics count");
    return Error::Io;
  }
  uint32_t metrics_count = metrics_compressed ? bytes::u16FromBe(buffer) : bytes::u32FromBe(buffer);
  if (metrics_count != glyph_count) {
    PCF_LOGW(TAG, "Metrics count %u does not match glyph count %u", metrics_count, glyph_count);
    return Error::CorruptedData;
  }

  // Encodings table: format, then the lookup domain and default char
  if (!readAt(*source, static_cast<uint64_t>(encodings.offset) + 4, buffer,
              FontConfig::ENCODING_HEADER_FIELDS * 2)) {
    PCF_LOGW(TAG, "Cannot read encoding header");
    return Error::Io;
  }
  uint16_t min_char_or_byte2 = bytes::u16FromBe(&buffer[0]);
  uint16_t max_char_or_byte2 = bytes::u16FromBe(&buffer[2]);
  uint16_t min_byte1 = bytes::u16FromBe(&buffer[4]);
  uint16_t max_byte1 = bytes::u16FromBe(&buffer[6]);
  uint16_t default_char = bytes::u16FromBe(&buffer[8]);

  // Accelerators table: format, 8 flag bytes, ascent, descent, maxOverlap,
  // minbounds, maxbounds and optionally the ink bounds
  if (!readAt(*source, static_cast<uint64_t>(accelerators.offset) + 4 + FontConfig::ACCEL_FLAG_BYTES,
              buffer, 8)) {
    PCF_LOGW(TAG, "Cannot read font ascent/descent");
    return Error::Io;
  }
  int32_t ascent = bytes::i32FromBe(&buffer[0]);
  int32_t descent = bytes::i32FromBe(&buffer[4]);

  int32_t skip = 4;  // maxOverlap
  if (accelerators.format & FontConfig::PCF_ACCEL_W_INKBOUNDS) {
    // prefer ink bounds over minbounds/maxbounds
    skip += 2 * FontConfig::METRICS_STANDARD_SIZE;
  }
  if (!source->seekRelative(skip)) {
    PCF_LOGW(TAG, "Accelerators table truncated");
    return Error::Io;
  }
  if (!source->readExact(buffer, FontConfig::METRICS_STANDARD_SIZE)) {
    PCF_LOGW(TAG, "Cannot read minbounds");
    return Error::Io;
  }
  MetricsEntry minbounds = MetricsEntry::fromStandard(buffer);
  if (!source->readExact(buffer, FontConfig::METRICS_STANDARD_SIZE)) {
    PCF_LOGW(TAG, "Cannot read maxbounds");
    return Error::Io;
  }
  MetricsEntry maxbounds = MetricsEntry::fromStandard(buffer);

  std::unique_ptr<PcfFont> opened(new PcfFont());
  opened->glyph_count_ = glyph_count;
  opened->ascent_ = ascent;
  opened->descent_ = descent;
  opened->metrics_compressed_ = metrics_compressed;
  opened->bounding_box_.width = static_cast<int16_t>(maxbounds.right_side_bearing - minbounds.left_side_bearing);
  opened->bounding_box_.height = static_cast<int16_t>(maxbounds.character_ascent + maxbounds.character_descent);
  opened->bounding_box_.x_offset = minbounds.left_side_bearing;
  opened->bounding_box_.y_offset = static_cast<int16_t>(-maxbounds.character_descent);
  opened->row_padding_ = static_cast<GlyphPadding>(padding);
  opened->min_char_or_byte2_ = min_char_or_byte2;
  opened->max_char_or_byte2_ = max_char_or_byte2;
  opened->min_byte1_ = min_byte1;
  opened->max_byte1_ = max_byte1;
  opened->default_char_ = default_char;
  opened->bitmap_position_lut_location_ = bitmaps.offset + 8;
  opened->bitmap_data_location_ = static_cast<uint32_t>(bitmap_data_location);
  opened->metrics_data_location_ = metrics.offset + 4 + (metrics_compressed ? 2 : 4);
  opened->encoded_glyph_indices_location_ =
      encodings.offset + 4 + static_cast<uint32_t>(FontConfig::ENCODING_HEADER_FIELDS * 2);
  opened->data_ = std::move(source);

  PCF_LOGI(TAG, "Loaded font: %u glyphs, bbox %dx%d%+d%+d, %s metrics, pad %u",
           glyph_count,
           opened->bounding_box_.width, opened->bounding_box_.height,
           opened->bounding_box_.x_offset, opened->bounding_box_.y_offset,
           metrics_compressed ? "compressed" : "standard",
           static_cast<unsigned>(paddingBytes(opened->row_padding_)));

  font = std::move(opened);
  return Error::None;
}

size_t PcfFont::maxBytesPerGlyph() const {
  if (bounding_box_.width <= 0 || bounding_box_.height <= 0) {
    return 0;
  }
  return static_cast<size_t>(bounding_box_.height) * bytesPerRow(static_cast<size_t>(bounding_box_.width), 1);
}

void PcfFont::overrideDefaultChar(uint16_t code_point) {
  default_char_ = code_point;
}

Error PcfFont::readGlyphRaw(uint16_t code_point, uint8_t* buffer, size_t buffer_size, GlyphRaw& glyph) const {
  uint16_t glyph_index = 0;
  Error error = getGlyphIndex(code_point, glyph_index);
  if (error != Error::None) {
    return error;
  }
  uint32_t bitmap_offset = 0;
  error = getGlyphBitmapOffset(glyph_index, bitmap_offset);
  if (error != Error::None) {
    return error;
  }
  MetricsEntry metrics;
  error = getMetrics(glyph_index, metrics);
  if (error != Error::None) {
    return error;
  }

  size_t glyph_width = static_cast<size_t>(metrics.glyphWidth());
  size_t glyph_height = static_cast<size_t>(metrics.glyphHeight());

  // all padding schemes are converted to whole bytes
  size_t source_row_bytes = bytesPerRow(glyph_width, paddingBytes(row_padding_));
  size_t standard_row_bytes = bytesPerRow(glyph_width, 1);
  size_t length = glyph_height * standard_row_bytes;
  if (length > buffer_size) {
    PCF_LOGD(TAG, "Glyph %u needs %u bytes, buffer holds %u", glyph_index,
             static_cast<unsigned>(length), static_cast<unsigned>(buffer_size));
    return Error::Other;
  }

  uint64_t location = static_cast<uint64_t>(bitmap_data_location_) + bitmap_offset;
  if (location > UINT32_MAX || !data_->seek(static_cast<uint32_t>(location))) {
    return Error::Io;
  }
  int32_t skip_count = static_cast<int32_t>(source_row_bytes - standard_row_bytes);
  for (size_t row = 0; row < glyph_height; row++) {
    if (!data_->readExact(&buffer[row * standard_row_bytes], standard_row_bytes)) {
      return Error::Io;
    }
    // skip the extra padding bytes before the next row
    if (skip_count > 0 && row + 1 < glyph_height && !data_->seekRelative(skip_count)) {
      return Error::Io;
    }
  }

  glyph.length = length;
  glyph.width = glyph_width;
  glyph.metrics = metrics;
  return Error::None;
}

Error PcfFont::getGlyphMetrics(uint16_t code_point, MetricsEntry& metrics) const {
  uint16_t glyph_index = 0;
  Error error = getGlyphIndex(code_point, glyph_index);
  if (error != Error::None) {
    return error;
  }
  return getMetrics(glyph_index, metrics);
}

Error PcfFont::getGlyphIndex(uint16_t code_point, uint16_t& glyph_index) const {
  uint16_t enc1 = (code_point >> 8) & 0xFF;
  uint16_t enc2 = code_point & 0xFF;
  if (enc1 < min_byte1_ || enc1 > max_byte1_ ||
      enc2 < min_char_or_byte2_ || enc2 > max_char_or_byte2_) {
    return Error::NotFound;
  }

  // one and two byte encodings share the same row-major layout
  uint32_t columns = static_cast<uint32_t>(max_char_or_byte2_ - min_char_or_byte2_) + 1;
  uint32_t index = static_cast<uint32_t>(enc1 - min_byte1_) * columns + (enc2 - min_char_or_byte2_);

  uint8_t buffer[2];
  if (!readAt(*data_, static_cast<uint64_t>(encoded_glyph_indices_location_) + index * 2, buffer, 2)) {
    return Error::Io;
  }
  uint16_t value = bytes::u16FromBe(buffer);
  if (value == FontConfig::NO_GLYPH) {
    return Error::NotFound;
  }
  glyph_index = value;
  return Error::None;
}

Error PcfFont::getGlyphBitmapOffset(uint16_t glyph_index, uint32_t& offset) const {
  uint8_t buffer[4];
  if (!readAt(*data_, static_cast<uint64_t>(bitmap_position_lut_location_) + glyph_index * 4u, buffer, 4)) {
    return Error::Io;
  }
  offset = bytes::u32FromBe(buffer);
  return Error::None;
}

Error PcfFont::getMetrics(uint16_t glyph_index, MetricsEntry& metrics) const {
  uint8_t buffer[FontConfig::METRICS_STANDARD_SIZE];
  if (metrics_compressed_) {
    uint64_t location = metrics_data_location_ +
        static_cast<uint64_t>(glyph_index) * FontConfig::METRICS_COMPRESSED_SIZE;
    if (!readAt(*data_, location, buffer, FontConfig::METRICS_COMPRESSED_SIZE)) {
      return Error::Io;
    }
    metrics = MetricsEntry::fromCompressed(buffer);
  } else {
    uint64_t location = metrics_data_location_ +
        static_cast<uint64_t>(glyph_index) * FontConfig::METRICS_STANDARD_SIZE;
    if (!readAt(*data_, location, buffer, FontConfig::METRICS_STANDARD_SIZE)) {
      return Error::Io;
    }
    metrics = MetricsEntry::fromStandard(buffer);
  }
  // a glyph without a usable box has no advance either
  if (metrics.glyphWidth() < 0 || metrics.glyphHeight() < 0) {
    PCF_LOGD(TAG, "Glyph %u has negative size", glyph_index);
    return Error::CorruptedData;
  }
  return Error::None;
}

}  // namespace PcfText
