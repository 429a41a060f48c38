#pragma once

/**
 * @file FontConfig.h
 * @brief PCF container constants & renderer limits
 *
 * Values that describe the on-disk PCF layout and the fixed memory budgets
 * used by the text renderer. Modify the budgets when targeting fonts with
 * larger glyphs.
 */

#include <cstddef>
#include <cstdint>

namespace FontConfig {

// ============================================================================
// PCF CONTAINER
// ============================================================================

// File signature "\1fcp"
constexpr uint8_t PCF_MAGIC[4] = {0x01, 0x66, 0x63, 0x70};
constexpr size_t PCF_TOC_ENTRY_SIZE = 16;

// Table types (one bit per table kind)
constexpr uint32_t PCF_PROPERTIES       = 1u << 0;
constexpr uint32_t PCF_ACCELERATORS     = 1u << 1;
constexpr uint32_t PCF_METRICS          = 1u << 2;
constexpr uint32_t PCF_BITMAPS          = 1u << 3;
constexpr uint32_t PCF_INK_METRICS      = 1u << 4;
constexpr uint32_t PCF_BDF_ENCODINGS    = 1u << 5;
constexpr uint32_t PCF_SWIDTHS          = 1u << 6;
constexpr uint32_t PCF_GLYPH_NAMES      = 1u << 7;
constexpr uint32_t PCF_BDF_ACCELERATORS = 1u << 8;

// Table format flags
constexpr uint32_t PCF_GLYPH_PAD_MASK     = 3u << 0;  // 0=>bytes, 1=>shorts, 2=>ints
constexpr uint32_t PCF_BYTE_MASK          = 1u << 2;  // MSByte first
constexpr uint32_t PCF_BIT_MASK           = 1u << 3;  // MSBit first
constexpr uint32_t PCF_SCAN_UNIT_MASK     = 3u << 4;  // 0=>bytes, 1=>shorts, 2=>ints
constexpr uint32_t PCF_ACCEL_W_INKBOUNDS  = 0x00000100;
constexpr uint32_t PCF_COMPRESSED_METRICS = 0x00000100;

// Entry sizes
constexpr size_t METRICS_COMPRESSED_SIZE = 5;
constexpr size_t METRICS_STANDARD_SIZE   = 12;
constexpr uint8_t METRICS_COMPRESSED_BIAS = 0x80;
constexpr size_t BITMAP_SIZES_COUNT      = 4;   // bitmapSizes[4] after the offsets array
constexpr size_t ENCODING_HEADER_FIELDS  = 5;   // min/max byte2, min/max byte1, default char
constexpr size_t ACCEL_FLAG_BYTES        = 8;   // noOverlap .. padding

// Encoded glyph index meaning "no glyph"
constexpr uint16_t NO_GLYPH = 0xFFFF;

// ============================================================================
// RENDERER
// ============================================================================

// Stack buffer used for one decoded glyph while drawing a string.
// 512 bytes covers glyphs up to 64x64 pixels.
constexpr size_t GLYPH_BUFFER_SIZE = 512;

// Pixels handed to the draw target per drawPixels() call
constexpr size_t PIXEL_BATCH_SIZE = 64;

// ============================================================================
// PREVIEW TOOL
// ============================================================================

constexpr char PREVIEW_ON_CHAR  = '#';
constexpr char PREVIEW_OFF_CHAR = '.';
constexpr int PREVIEW_MARGIN    = 1;

}  // namespace FontConfig
