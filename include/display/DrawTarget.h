#ifndef PCF_DRAW_TARGET_H
#define PCF_DRAW_TARGET_H

#include <cstddef>

#include "display/Geometry.h"

namespace PcfText {

/**
 * Abstract pixel surface text is rendered onto
 *
 * Glyph bitmaps are 1 bit per pixel; the renderer maps them to the
 * caller's Color type (brightness level, RGB value, on/off...) and hands
 * them over as filled rectangles or sparse pixel runs.
 */
template <typename Color>
class IDrawTarget {
public:
  virtual ~IDrawTarget() = default;

  /**
   * Fill a rectangle with a single color
   *
   * @param area Rectangle to fill, may extend past the surface
   * @param color Fill color
   */
  virtual void fillSolid(const Rectangle& area, Color color) = 0;

  /**
   * Draw a batch of individually colored pixels
   *
   * @param pixels Pixels to draw, may lie outside the surface
   * @param count Number of pixels
   */
  virtual void drawPixels(const Pixel<Color>* pixels, size_t count) = 0;

  // Area covered by the surface
  virtual Rectangle boundingBox() const = 0;
};

}  // namespace PcfText

#endif // PCF_DRAW_TARGET_H
