// hidscan
// Copyright (C) 2025 Greg MacKenzie
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <cstdint>
#include <vector>

struct Color {
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};

  bool operator==(const Color& other) const { return r == other.r && g == other.g && b == other.b; }
  bool operator!=(const Color& other) const { return !(*this == other); }
};

namespace Colors {
  inline constexpr Color Black{0, 0, 0};
  inline constexpr Color White{255, 255, 255};
  inline constexpr Color Red{255, 0, 0};
  inline constexpr Color Green{0, 128, 0};
  inline constexpr Color Lime{0, 255, 0};
  inline constexpr Color Blue{0, 0, 255};
  inline constexpr Color Yellow{255, 255, 0};
  inline constexpr Color Cyan{0, 255, 255};
  inline constexpr Color Gray{128, 128, 128};
}

struct Rect {
  int x{0};
  int y{0};
  int width{0};
  int height{0};

  int right() const { return x + width; }
  int bottom() const { return y + height; }
  bool empty() const { return width <= 0 || height <= 0; }
  bool operator==(const Rect& other) const {
    return x == other.x && y == other.y && width == other.width && height == other.height;
  }
};

/**
 * @brief 24-bit RGB image, row major, 3 bytes per pixel.
 *
 * Drawing coordinates follow the usual raster convention: rectangles are
 * given by their inclusive corners (x0, y0) and (x1, y1), and every
 * primitive clips to the image.
 */
class Image
{
public:
  Image() = default;
  Image(int width, int height, Color fill = Colors::Black);

  int getWidth() const { return width; }
  int getHeight() const { return height; }
  bool empty() const { return width == 0 || height == 0; }

  uint8_t* data() { return pixels.data(); }
  const uint8_t* data() const { return pixels.data(); }
  size_t size() const { return pixels.size(); }

  Color get(int x, int y) const;
  void set(int x, int y, Color color);

  /**
   * @brief Blends a colour over a pixel.
   *
   * @param alpha Coverage 0-255.
   */
  void blend(int x, int y, Color color, uint8_t alpha);

  void fill(Color color);
  void fillRect(int x0, int y0, int x1, int y1, Color color);

  /**
   * @brief Draws a rectangle outline growing inwards from the given corners.
   */
  void drawRect(int x0, int y0, int x1, int y1, Color color, int lineWidth = 1);

  /**
   * @brief Blends a translucent filled rectangle.
   */
  void blendRect(int x0, int y0, int x1, int y1, Color color, uint8_t alpha);

  void drawLine(int x0, int y0, int x1, int y1, Color color, int lineWidth = 1);

  /**
   * @brief Copies another image with its top-left corner at (x, y).
   */
  void paste(const Image& src, int x, int y);

  /**
   * @brief Returns a nearest-neighbour scaled copy.
   */
  Image resized(int newWidth, int newHeight) const;

  /**
   * @brief Returns the pixels inside a rectangle, clipped to the image.
   */
  Image crop(const Rect& rect) const;

  /**
   * @brief Returns a copy rotated clockwise by 0, 90, 180 or 270 degrees.
   */
  Image rotated(int degrees) const;

  bool operator==(const Image& other) const {
    return width == other.width && height == other.height && pixels == other.pixels;
  }

private:
  int width = 0;
  int height = 0;
  std::vector<uint8_t> pixels;
};

// vim: set ts=2 sw=2 expandtab:
