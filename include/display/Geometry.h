#pragma once

#include <cstdint>

namespace PcfText {

struct Point {
  int32_t x{0};
  int32_t y{0};

  Point() = default;
  Point(int32_t x_in, int32_t y_in) : x(x_in), y(y_in) {}

  Point operator+(const Point& other) const { return Point(x + other.x, y + other.y); }
  Point operator-(const Point& other) const { return Point(x - other.x, y - other.y); }
  bool operator==(const Point& other) const { return x == other.x && y == other.y; }
  bool operator!=(const Point& other) const { return !(*this == other); }
};

struct Size {
  uint32_t width{0};
  uint32_t height{0};

  Size() = default;
  Size(uint32_t width_in, uint32_t height_in) : width(width_in), height(height_in) {}

  bool operator==(const Size& other) const { return width == other.width && height == other.height; }
};

struct Rectangle {
  Point top_left;
  Size size;

  Rectangle() = default;
  Rectangle(Point top_left_in, Size size_in) : top_left(top_left_in), size(size_in) {}

  bool isEmpty() const { return size.width == 0 || size.height == 0; }

  bool contains(const Point& point) const {
    return point.x >= top_left.x && point.y >= top_left.y &&
           point.x - top_left.x < static_cast<int64_t>(size.width) &&
           point.y - top_left.y < static_cast<int64_t>(size.height);
  }

  bool operator==(const Rectangle& other) const {
    return top_left == other.top_left && size == other.size;
  }
};

template <typename Color>
struct Pixel {
  Point point;
  Color color;
};

}  // namespace PcfText
