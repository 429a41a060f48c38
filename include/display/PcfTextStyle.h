#ifndef PCF_TEXT_STYLE_H
#define PCF_TEXT_STYLE_H

#include <cstdint>
#include <string_view>
#include <vector>

#include "config/FontConfig.h"
#include "display/DrawTarget.h"
#include "display/Geometry.h"
#include "font/PcfFont.h"
#include "platform/Log.h"
#include "text/Utf8.h"

namespace PcfText {

// Vertical reference a draw position is anchored to
enum class Baseline : uint8_t {
  Top,
  Bottom,
  Middle,
  Alphabetic
};

template <typename Color>
struct DecorationColor {
  enum Kind : uint8_t {
    NONE = 0,
    TEXT_COLOR = 1,  // follow the text color
    CUSTOM = 2
  };

  Kind kind;
  Color color;

  static DecorationColor none() { return DecorationColor{NONE, Color()}; }
  static DecorationColor textColor() { return DecorationColor{TEXT_COLOR, Color()}; }
  static DecorationColor custom(Color value) { return DecorationColor{CUSTOM, value}; }

  bool isNone() const { return kind == NONE; }
};

struct TextMetrics {
  Rectangle bounding_box;
  Point next_position;
};

// Which colors a draw call paints, chosen once per call
enum class CompositeMode : uint8_t {
  Neither,
  ForegroundOnly,
  BackgroundOnly,
  Both
};

// How a character of a string was resolved to a glyph
enum class GlyphResolution : uint8_t {
  Direct,       // the code point's own glyph
  DefaultChar,  // code point missing, font default character used
  Skipped       // nothing usable, zero width
};

/**
 * Text renderer for an opened PCF font
 *
 * Holds the colors and decorations used to draw strings; the font is
 * borrowed and must outlive the style. Glyphs are read from the font on
 * every call, one at a time, into a stack buffer (or a heap buffer for
 * fonts whose largest glyph exceeds FontConfig::GLYPH_BUFFER_SIZE).
 *
 * Characters without a glyph are drawn with the font's default character.
 * When that fails too, or the glyph cannot be read, the character is
 * skipped with zero width. Measurement follows the same rule, so measured
 * and drawn widths always agree.
 */
template <typename Color>
class PcfTextStyle {
public:
  explicit PcfTextStyle(const PcfFont& font)
    : font_(font)
    , has_text_color_(false)
    , text_color_()
    , has_background_color_(false)
    , background_color_()
    , underline_color_(DecorationColor<Color>::none())
    , strikethrough_color_(DecorationColor<Color>::none())
  {
  }

  const PcfFont& font() const { return font_; }

  // Color configuration
  void setTextColor(Color color) {
    text_color_ = color;
    has_text_color_ = true;
  }
  void resetTextColor() { has_text_color_ = false; }
  bool hasTextColor() const { return has_text_color_; }
  Color textColor() const { return text_color_; }

  void setBackgroundColor(Color color) {
    background_color_ = color;
    has_background_color_ = true;
  }
  void resetBackgroundColor() { has_background_color_ = false; }
  bool hasBackgroundColor() const { return has_background_color_; }
  Color backgroundColor() const { return background_color_; }

  void setUnderlineColor(DecorationColor<Color> color) { underline_color_ = color; }
  void resetUnderline() { underline_color_ = DecorationColor<Color>::none(); }
  const DecorationColor<Color>& underlineColor() const { return underline_color_; }

  void setStrikethroughColor(DecorationColor<Color> color) { strikethrough_color_ = color; }
  void resetStrikethrough() { strikethrough_color_ = DecorationColor<Color>::none(); }
  const DecorationColor<Color>& strikethroughColor() const { return strikethrough_color_; }

  // True if nothing at all would be painted
  bool isTransparent() const {
    return !has_text_color_ && !has_background_color_ &&
           underline_color_.isNone() && strikethrough_color_.isNone();
  }

  CompositeMode compositeMode() const {
    if (has_text_color_ && has_background_color_) return CompositeMode::Both;
    if (has_text_color_) return CompositeMode::ForegroundOnly;
    if (has_background_color_) return CompositeMode::BackgroundOnly;
    return CompositeMode::Neither;
  }

  /**
   * Distance from a position anchored at baseline down to the glyph origin
   *
   * The 1s make the lower edge of the position pixel the alphabetic
   * baseline, the way other text renderers place it.
   */
  int baselineOffset(Baseline baseline) const {
    const BoundingBox& bbox = font_.boundingBox();
    switch (baseline) {
      case Baseline::Top:        return bbox.maxAscent();
      case Baseline::Bottom:     return 1 + bbox.maxDescent();
      case Baseline::Middle:     return 1 + bbox.height / 2 + bbox.maxDescent();
      case Baseline::Alphabetic:
      default:                   return 1;
    }
  }

  uint32_t lineHeight() const {
    int16_t height = font_.boundingBox().height;
    return height > 0 ? static_cast<uint32_t>(height) : 0;
  }

  /**
   * Draw a UTF-8 string
   *
   * @param text String to draw
   * @param position Anchor position
   * @param baseline Which line of the text box sits on position
   * @param target Surface to draw on
   * @return Position for the next string, anchored the same way
   */
  Point drawString(std::string_view text, Point position, Baseline baseline, IDrawTarget<Color>& target) const {
    const int offset = baselineOffset(baseline);
    const Point origin = position + Point(0, offset);

    Point next = origin;
    switch (compositeMode()) {
      case CompositeMode::Both:
        next = drawStringWith<CompositeMode::Both>(text, origin, target);
        break;
      case CompositeMode::ForegroundOnly:
        next = drawStringWith<CompositeMode::ForegroundOnly>(text, origin, target);
        break;
      case CompositeMode::BackgroundOnly:
        next = drawStringWith<CompositeMode::BackgroundOnly>(text, origin, target);
        break;
      case CompositeMode::Neither:
        next = drawStringWith<CompositeMode::Neither>(text, origin, target);
        break;
    }

    if (next.x > origin.x) {
      drawDecorations(static_cast<uint32_t>(next.x - origin.x), origin, target);
    }

    return next - Point(0, offset);
  }

  /**
   * Advance over a gap without drawing glyphs
   *
   * Fills the background of the gap and draws decorations across it.
   * Used by layout code that spaces words itself.
   */
  Point drawWhitespace(uint32_t width, Point position, Baseline baseline, IDrawTarget<Color>& target) const {
    if (width == 0) {
      return position;
    }

    const int max_ascent = font_.boundingBox().maxAscent();
    position.y += baselineOffset(baseline) - max_ascent;
    if (has_background_color_) {
      target.fillSolid(Rectangle(position, Size(width, lineHeight())), background_color_);
    }

    position.y += max_ascent;
    drawDecorations(width, position, target);
    position.y -= baselineOffset(baseline);
    position.x += width > static_cast<uint32_t>(INT32_MAX) ? INT32_MAX : static_cast<int32_t>(width);
    return position;
  }

  TextMetrics measureString(std::string_view text, Point position, Baseline baseline) const {
    const Point top_left = position + Point(0, baselineOffset(baseline) - baselineOffset(Baseline::Top));

    TextMetrics metrics;
    if (text.empty()) {
      metrics.bounding_box = Rectangle(top_left, Size(0, 0));
    } else {
      metrics.bounding_box = Rectangle(top_left, Size(advanceWidth(text), lineHeight()));
    }
    metrics.next_position = position + Point(static_cast<int32_t>(metrics.bounding_box.size.width), 0);
    return metrics;
  }

  // Resolve one code point to its glyph bitmap, falling back to the default character
  GlyphResolution resolveGlyph(uint16_t code_point, uint8_t* buffer, size_t buffer_size, GlyphRaw& glyph) const {
    Error error = font_.readGlyphRaw(code_point, buffer, buffer_size, glyph);
    if (error == Error::None) {
      return GlyphResolution::Direct;
    }
    if (error == Error::NotFound) {
      error = font_.readGlyphRaw(font_.defaultChar(), buffer, buffer_size, glyph);
      if (error == Error::None) {
        return GlyphResolution::DefaultChar;
      }
    }
    PCF_LOGD(TAG, "Skipping U+%04X: %s", code_point, errorName(error));
    return GlyphResolution::Skipped;
  }

  // Same resolution as resolveGlyph() without reading the bitmap
  GlyphResolution resolveMetrics(uint16_t code_point, MetricsEntry& metrics) const {
    Error error = font_.getGlyphMetrics(code_point, metrics);
    if (error == Error::None) {
      return GlyphResolution::Direct;
    }
    if (error == Error::NotFound) {
      error = font_.getGlyphMetrics(font_.defaultChar(), metrics);
      if (error == Error::None) {
        return GlyphResolution::DefaultChar;
      }
    }
    PCF_LOGD(TAG, "Skipping U+%04X: %s", code_point, errorName(error));
    return GlyphResolution::Skipped;
  }

private:
  static constexpr const char* TAG = "pcf.style";

  template <CompositeMode Mode>
  Point drawStringWith(std::string_view text, Point position, IDrawTarget<Color>& target) const {
    const bool paints_glyphs = Mode == CompositeMode::ForegroundOnly || Mode == CompositeMode::Both;
    const bool paints_background = Mode == CompositeMode::BackgroundOnly || Mode == CompositeMode::Both;

    // Glyphs don't necessarily cover their whole cell, so the background
    // is filled once for the whole string before any glyph is drawn
    if (paints_background) {
      fillStringBackground(text, position, target);
    }

    // Fonts with glyphs past the stack budget get a buffer sized for their
    // largest glyph, so every glyph with metrics also has a bitmap
    uint8_t stack_buffer[FontConfig::GLYPH_BUFFER_SIZE];
    std::vector<uint8_t> heap_buffer;
    uint8_t* buffer = stack_buffer;
    size_t buffer_size = sizeof(stack_buffer);
    if (paints_glyphs && font_.maxBytesPerGlyph() > buffer_size) {
      heap_buffer.resize(font_.maxBytesPerGlyph());
      buffer = heap_buffer.data();
      buffer_size = heap_buffer.size();
    }

    size_t pos = 0;
    while (pos < text.size()) {
      size_t consumed = 0;
      uint16_t code_point = decodeUtf8(text.data() + pos, text.size() - pos, consumed);
      pos += consumed;

      // The advance comes from the metrics, exactly as advanceWidth() counts it
      MetricsEntry metrics;
      GlyphResolution resolution = resolveMetrics(code_point, metrics);
      if (resolution == GlyphResolution::Skipped) {
        continue;
      }

      if (paints_glyphs) {
        uint16_t resolved = resolution == GlyphResolution::DefaultChar ? font_.defaultChar() : code_point;
        GlyphRaw glyph;
        Error error = font_.readGlyphRaw(resolved, buffer, buffer_size, glyph);
        if (error == Error::None) {
          blitGlyph(buffer, glyph, position, text_color_, target);
        } else {
          PCF_LOGD(TAG, "No bitmap for U+%04X: %s", resolved, errorName(error));
        }
      }
      position.x += metrics.character_width;
    }
    return position;
  }

  // Draw the set pixels of a byte-padded, MSBit first glyph bitmap
  void blitGlyph(const uint8_t* data, const GlyphRaw& glyph, Point position, Color color,
                 IDrawTarget<Color>& target) const {
    if (glyph.length == 0 || glyph.width == 0) {
      return;
    }

    const Point origin = position + Point(glyph.metrics.left_side_bearing, -glyph.metrics.character_ascent);
    const size_t row_bytes = bytesPerRow(glyph.width, 1);
    const size_t rows = glyph.length / row_bytes;

    Pixel<Color> batch[FontConfig::PIXEL_BATCH_SIZE];
    size_t count = 0;
    for (size_t row = 0; row < rows; row++) {
      const uint8_t* row_data = &data[row * row_bytes];
      for (size_t col = 0; col < glyph.width; col++) {
        if (!(row_data[col / 8] & (0x80 >> (col % 8)))) {
          continue;
        }
        batch[count].point = Point(origin.x + static_cast<int32_t>(col), origin.y + static_cast<int32_t>(row));
        batch[count].color = color;
        if (++count == FontConfig::PIXEL_BATCH_SIZE) {
          target.drawPixels(batch, count);
          count = 0;
        }
      }
    }
    if (count > 0) {
      target.drawPixels(batch, count);
    }
  }

  void fillStringBackground(std::string_view text, Point position, IDrawTarget<Color>& target) const {
    if (text.empty()) {
      return;
    }
    const Point top_left = position + Point(0, -font_.boundingBox().maxAscent());
    target.fillSolid(Rectangle(top_left, Size(advanceWidth(text), lineHeight())), background_color_);
  }

  // Sum of the advances of all characters, as drawString() would move the pen
  uint32_t advanceWidth(std::string_view text) const {
    int64_t width = 0;
    size_t pos = 0;
    while (pos < text.size()) {
      size_t consumed = 0;
      uint16_t code_point = decodeUtf8(text.data() + pos, text.size() - pos, consumed);
      pos += consumed;

      MetricsEntry metrics;
      if (resolveMetrics(code_point, metrics) != GlyphResolution::Skipped) {
        width += metrics.character_width;
      }
    }
    return width > 0 ? static_cast<uint32_t>(width) : 0;
  }

  bool decorationColor(const DecorationColor<Color>& decoration, Color& color) const {
    switch (decoration.kind) {
      case DecorationColor<Color>::CUSTOM:
        color = decoration.color;
        return true;
      case DecorationColor<Color>::TEXT_COLOR:
        color = text_color_;
        return has_text_color_;
      case DecorationColor<Color>::NONE:
      default:
        return false;
    }
  }

  // position is the glyph origin on the alphabetic baseline
  void drawDecorations(uint32_t width, Point position, IDrawTarget<Color>& target) const {
    Color color = Color();
    if (decorationColor(strikethrough_color_, color)) {
      const Point offset(0, -baselineOffset(Baseline::Middle));
      target.fillSolid(Rectangle(position + offset, Size(width, 1)), color);
    }
    // underline sits on the bottom row of the line box
    if (decorationColor(underline_color_, color)) {
      const Point offset(0, -baselineOffset(Baseline::Bottom));
      target.fillSolid(Rectangle(position + offset, Size(width, 1)), color);
    }
  }

  const PcfFont& font_;
  bool has_text_color_;
  Color text_color_;
  bool has_background_color_;
  Color background_color_;
  DecorationColor<Color> underline_color_;
  DecorationColor<Color> strikethrough_color_;
};

/**
 * Builder for PcfTextStyle
 *
 * All colors start transparent and decorations disabled.
 */
template <typename Color>
class PcfTextStyleBuilder {
public:
  explicit PcfTextStyleBuilder(const PcfFont& font) : style_(font) {}

  PcfTextStyleBuilder& textColor(Color color) {
    style_.setTextColor(color);
    return *this;
  }

  PcfTextStyleBuilder& backgroundColor(Color color) {
    style_.setBackgroundColor(color);
    return *this;
  }

  // Underline in the text color
  PcfTextStyleBuilder& underline() {
    style_.setUnderlineColor(DecorationColor<Color>::textColor());
    return *this;
  }

  PcfTextStyleBuilder& underlineWithColor(Color color) {
    style_.setUnderlineColor(DecorationColor<Color>::custom(color));
    return *this;
  }

  // Strikethrough in the text color
  PcfTextStyleBuilder& strikethrough() {
    style_.setStrikethroughColor(DecorationColor<Color>::textColor());
    return *this;
  }

  PcfTextStyleBuilder& strikethroughWithColor(Color color) {
    style_.setStrikethroughColor(DecorationColor<Color>::custom(color));
    return *this;
  }

  PcfTextStyleBuilder& resetTextColor() {
    style_.resetTextColor();
    return *this;
  }

  PcfTextStyleBuilder& resetBackgroundColor() {
    style_.resetBackgroundColor();
    return *this;
  }

  PcfTextStyleBuilder& resetUnderline() {
    style_.resetUnderline();
    return *this;
  }

  PcfTextStyleBuilder& resetStrikethrough() {
    style_.resetStrikethrough();
    return *this;
  }

  PcfTextStyle<Color> build() const { return style_; }

private:
  PcfTextStyle<Color> style_;
};

}  // namespace PcfText

#endif // PCF_TEXT_STYLE_H
