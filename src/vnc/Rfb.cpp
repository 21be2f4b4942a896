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

#include "Rfb.h"

using namespace std;

void putU16(vector<uint8_t>& out, uint16_t value)
{
  out.push_back(value >> 8);
  out.push_back(value & 0xFF);
}

void putU32(vector<uint8_t>& out, uint32_t value)
{
  out.push_back(value >> 24);
  out.push_back((value >> 16) & 0xFF);
  out.push_back((value >> 8) & 0xFF);
  out.push_back(value & 0xFF);
}

uint16_t getU16(const uint8_t* data)
{
  return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

uint32_t getU32(const uint8_t* data)
{
  return (uint32_t(data[0]) << 24) | (uint32_t(data[1]) << 16) | (uint32_t(data[2]) << 8) | data[3];
}

PixelFormat PixelFormat::parse(const uint8_t* data)
{
  PixelFormat format;
  format.bitsPerPixel = data[0];
  format.depth = data[1];
  format.bigEndian = data[2] != 0;
  format.trueColour = data[3] != 0;
  format.redMax = getU16(data + 4);
  format.greenMax = getU16(data + 6);
  format.blueMax = getU16(data + 8);
  format.redShift = data[10];
  format.greenShift = data[11];
  format.blueShift = data[12];
  return format;
}

void PixelFormat::serialize(vector<uint8_t>& out) const
{
  out.push_back(bitsPerPixel);
  out.push_back(depth);
  out.push_back(bigEndian ? 1 : 0);
  out.push_back(trueColour ? 1 : 0);
  putU16(out, redMax);
  putU16(out, greenMax);
  putU16(out, blueMax);
  out.push_back(redShift);
  out.push_back(greenShift);
  out.push_back(blueShift);
  out.insert(out.end(), 3, 0);
}

uint32_t encodePixel(Color color, const PixelFormat& format)
{
  if (!format.trueColour) {
    return ((color.b >> 6) << 6) | ((color.g >> 5) << 3) | (color.r >> 5);
  }

  uint32_t r = (color.r * format.redMax + 127) / 255;
  uint32_t g = (color.g * format.greenMax + 127) / 255;
  uint32_t b = (color.b * format.blueMax + 127) / 255;

  return (r << format.redShift) | (g << format.greenShift) | (b << format.blueShift);
}

void encodeRaw(const Image& image, const Rect& rect, const PixelFormat& format, vector<uint8_t>& out)
{
  int bytes = max(format.bytesPerPixel(), 1);
  out.reserve(out.size() + static_cast<size_t>(rect.width) * rect.height * bytes);

  for (int y = rect.y; y < rect.bottom(); y++) {
    for (int x = rect.x; x < rect.right(); x++) {
      uint32_t pixel = encodePixel(image.get(x, y), format);

      for (int i = 0; i < bytes; i++) {
        int shift = format.bigEndian ? 8 * (bytes - 1 - i) : 8 * i;
        out.push_back((pixel >> shift) & 0xFF);
      }
    }
  }
}

vector<uint8_t> bgr233ColourMap()
{
  vector<uint8_t> out;
  out.push_back(RFB_SET_COLOUR_MAP_ENTRIES);
  out.push_back(0);
  putU16(out, 0);
  putU16(out, 256);

  for (int i = 0; i < 256; i++) {
    int r = i & 0x07;
    int g = (i >> 3) & 0x07;
    int b = (i >> 6) & 0x03;
    putU16(out, static_cast<uint16_t>(r * 65535 / 7));
    putU16(out, static_cast<uint16_t>(g * 65535 / 7));
    putU16(out, static_cast<uint16_t>(b * 65535 / 3));
  }

  return out;
}

Rect clipRect(const Rect& rect, int width, int height)
{
  int x0 = clamp(rect.x, 0, width);
  int y0 = clamp(rect.y, 0, height);
  int x1 = clamp(rect.right(), 0, width);
  int y1 = clamp(rect.bottom(), 0, height);
  return {x0, y0, max(x1 - x0, 0), max(y1 - y0, 0)};
}

Rect diffBounds(const Image& current, const Image& previous, const Rect& area)
{
  if (current.getWidth() != previous.getWidth() || current.getHeight() != previous.getHeight()) {
    return clipRect(area, current.getWidth(), current.getHeight());
  }

  Rect clipped = clipRect(area, current.getWidth(), current.getHeight());
  int x0 = clipped.right(), y0 = clipped.bottom(), x1 = clipped.x - 1, y1 = clipped.y - 1;

  for (int y = clipped.y; y < clipped.bottom(); y++) {
    for (int x = clipped.x; x < clipped.right(); x++) {
      if (current.get(x, y) == previous.get(x, y)) continue;
      x0 = min(x0, x);
      y0 = min(y0, y);
      x1 = max(x1, x);
      y1 = max(y1, y);
    }
  }

  if (x1 < x0) return {};
  return {x0, y0, x1 - x0 + 1, y1 - y0 + 1};
}

// vim: set ts=2 sw=2 expandtab:
