#ifndef PCF_FRAME_BUFFER_H
#define PCF_FRAME_BUFFER_H

#include <vector>

#include "display/DrawTarget.h"

namespace PcfText {

// In-memory pixel surface, row-major, clipped to its own size
template <typename Color>
class FrameBuffer : public IDrawTarget<Color> {
public:
  FrameBuffer(int width, int height, Color clear_color = Color())
    : width_(width > 0 ? width : 0)
    , height_(height > 0 ? height : 0)
    , clear_color_(clear_color)
    , buffer_(static_cast<size_t>(width_) * static_cast<size_t>(height_), clear_color)
  {
  }

  int getWidth() const { return width_; }
  int getHeight() const { return height_; }

  bool isValidPosition(int x, int y) const {
    return x >= 0 && x < width_ && y >= 0 && y < height_;
  }

  void setPixel(int x, int y, Color color) {
    if (!isValidPosition(x, y)) return;
    buffer_[static_cast<size_t>(y) * width_ + x] = color;
  }

  Color getPixel(int x, int y) const {
    if (!isValidPosition(x, y)) return clear_color_;
    return buffer_[static_cast<size_t>(y) * width_ + x];
  }

  void clearBuffer() { fillBuffer(clear_color_); }

  void fillBuffer(Color color) {
    for (auto& pixel : buffer_) {
      pixel = color;
    }
  }

  // Number of pixels currently set to color
  size_t countPixels(Color color) const {
    size_t count = 0;
    for (const auto& pixel : buffer_) {
      if (pixel == color) count++;
    }
    return count;
  }

  bool operator==(const FrameBuffer& other) const {
    return width_ == other.width_ && height_ == other.height_ && buffer_ == other.buffer_;
  }

  // IDrawTarget
  void fillSolid(const Rectangle& area, Color color) override {
    int64_t x_end = static_cast<int64_t>(area.top_left.x) + area.size.width;
    int64_t y_end = static_cast<int64_t>(area.top_left.y) + area.size.height;
    int x0 = area.top_left.x < 0 ? 0 : area.top_left.x;
    int y0 = area.top_left.y < 0 ? 0 : area.top_left.y;
    int x1 = x_end > width_ ? width_ : static_cast<int>(x_end);
    int y1 = y_end > height_ ? height_ : static_cast<int>(y_end);
    for (int y = y0; y < y1; y++) {
      for (int x = x0; x < x1; x++) {
        buffer_[static_cast<size_t>(y) * width_ + x] = color;
      }
    }
  }

  void drawPixels(const Pixel<Color>* pixels, size_t count) override {
    for (size_t i = 0; i < count; i++) {
      setPixel(pixels[i].point.x, pixels[i].point.y, pixels[i].color);
    }
  }

  Rectangle boundingBox() const override {
    return Rectangle(Point(0, 0), Size(static_cast<uint32_t>(width_), static_cast<uint32_t>(height_)));
  }

private:
  int width_;
  int height_;
  Color clear_color_;
  std::vector<Color> buffer_;
};

}  // namespace PcfText

#endif // PCF_FRAME_BUFFER_H
