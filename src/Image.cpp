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

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include "Image.h"

using namespace std;

Image::Image(int width, int height, Color fill) :
  width(width),
  height(height),
  pixels(static_cast<size_t>(max(width, 0)) * max(height, 0) * 3)
{
  if (width < 0 || height < 0) throw invalid_argument("Negative image size.");
  this->fill(fill);
}

Color Image::get(int x, int y) const
{
  if (x < 0 || y < 0 || x >= width || y >= height) return Colors::Black;
  const uint8_t* p = &pixels[(static_cast<size_t>(y) * width + x) * 3];
  return {p[0], p[1], p[2]};
}

void Image::set(int x, int y, Color color)
{
  if (x < 0 || y < 0 || x >= width || y >= height) return;
  uint8_t* p = &pixels[(static_cast<size_t>(y) * width + x) * 3];
  p[0] = color.r;
  p[1] = color.g;
  p[2] = color.b;
}

void Image::blend(int x, int y, Color color, uint8_t alpha)
{
  if (x < 0 || y < 0 || x >= width || y >= height) return;
  uint8_t* p = &pixels[(static_cast<size_t>(y) * width + x) * 3];
  p[0] = static_cast<uint8_t>((color.r * alpha + p[0] * (255 - alpha) + 127) / 255);
  p[1] = static_cast<uint8_t>((color.g * alpha + p[1] * (255 - alpha) + 127) / 255);
  p[2] = static_cast<uint8_t>((color.b * alpha + p[2] * (255 - alpha) + 127) / 255);
}

void Image::fill(Color color)
{
  for (size_t i = 0; i < pixels.size(); i += 3) {
    pixels[i] = color.r;
    pixels[i + 1] = color.g;
    pixels[i + 2] = color.b;
  }
}

void Image::fillRect(int x0, int y0, int x1, int y1, Color color)
{
  x0 = max(x0, 0);
  y0 = max(y0, 0);
  x1 = min(x1, width - 1);
  y1 = min(y1, height - 1);

  for (int y = y0; y <= y1; y++) {
    for (int x = x0; x <= x1; x++) set(x, y, color);
  }
}

void Image::drawRect(int x0, int y0, int x1, int y1, Color color, int lineWidth)
{
  for (int i = 0; i < lineWidth; i++) {
    if (x0 + i > x1 - i || y0 + i > y1 - i) break;
    fillRect(x0 + i, y0 + i, x1 - i, y0 + i, color);
    fillRect(x0 + i, y1 - i, x1 - i, y1 - i, color);
    fillRect(x0 + i, y0 + i, x0 + i, y1 - i, color);
    fillRect(x1 - i, y0 + i, x1 - i, y1 - i, color);
  }
}

void Image::blendRect(int x0, int y0, int x1, int y1, Color color, uint8_t alpha)
{
  x0 = max(x0, 0);
  y0 = max(y0, 0);
  x1 = min(x1, width - 1);
  y1 = min(y1, height - 1);

  for (int y = y0; y <= y1; y++) {
    for (int x = x0; x <= x1; x++) blend(x, y, color, alpha);
  }
}

void Image::drawLine(int x0, int y0, int x1, int y1, Color color, int lineWidth)
{
  int dx = abs(x1 - x0);
  int dy = -abs(y1 - y0);
  int sx = x0 < x1 ? 1 : -1;
  int sy = y0 < y1 ? 1 : -1;
  int err = dx + dy;

  // Thick lines are widened across their minor axis.
  bool steep = -dy > dx;
  int lo = -(lineWidth - 1) / 2;
  int hi = lineWidth / 2;

  while (true) {
    for (int o = lo; o <= hi; o++) {
      if (steep) set(x0 + o, y0, color);
      else set(x0, y0 + o, color);
    }

    if (x0 == x1 && y0 == y1) break;

    int e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x0 += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y0 += sy;
    }
  }
}

void Image::paste(const Image& src, int x, int y)
{
  for (int sy = 0; sy < src.height; sy++) {
    int dy = y + sy;
    if (dy < 0 || dy >= height) continue;

    int sx0 = max(0, -x);
    int sx1 = min(src.width, width - x);
    if (sx0 >= sx1) continue;

    const uint8_t* from = &src.pixels[(static_cast<size_t>(sy) * src.width + sx0) * 3];
    uint8_t* to = &pixels[(static_cast<size_t>(dy) * width + x + sx0) * 3];
    copy(from, from + (sx1 - sx0) * 3, to);
  }
}

Image Image::resized(int newWidth, int newHeight) const
{
  Image out(newWidth, newHeight);
  if (empty()) return out;

  for (int y = 0; y < newHeight; y++) {
    int sy = static_cast<int>((static_cast<int64_t>(y) * height) / newHeight);
    for (int x = 0; x < newWidth; x++) {
      int sx = static_cast<int>((static_cast<int64_t>(x) * width) / newWidth);
      const uint8_t* from = &pixels[(static_cast<size_t>(sy) * width + sx) * 3];
      uint8_t* to = &out.pixels[(static_cast<size_t>(y) * newWidth + x) * 3];
      to[0] = from[0];
      to[1] = from[1];
      to[2] = from[2];
    }
  }

  return out;
}

Image Image::crop(const Rect& rect) const
{
  int x0 = clamp(rect.x, 0, width);
  int y0 = clamp(rect.y, 0, height);
  int x1 = clamp(rect.right(), 0, width);
  int y1 = clamp(rect.bottom(), 0, height);

  Image out(max(x1 - x0, 0), max(y1 - y0, 0));
  if (out.empty()) return out;

  for (int y = y0; y < y1; y++) {
    const uint8_t* from = &pixels[(static_cast<size_t>(y) * width + x0) * 3];
    copy(from, from + (x1 - x0) * 3, &out.pixels[static_cast<size_t>(y - y0) * out.width * 3]);
  }

  return out;
}

Image Image::rotated(int degrees) const
{
  degrees = ((degrees % 360) + 360) % 360;
  if (degrees == 0) return *this;

  bool swap = degrees == 90 || degrees == 270;
  Image out(swap ? height : width, swap ? width : height);

  for (int y = 0; y < height; y++) {
    for (int x = 0; x < width; x++) {
      Color c = get(x, y);
      switch (degrees) {
      case 90: out.set(height - 1 - y, x, c); break;
      case 180: out.set(width - 1 - x, height - 1 - y, c); break;
      case 270: out.set(y, width - 1 - x, c); break;
      default: throw invalid_argument("Rotation must be a multiple of 90.");
      }
    }
  }

  return out;
}

// vim: set ts=2 sw=2 expandtab:
