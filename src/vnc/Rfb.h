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
#include <string>
#include <vector>

#include "Image.h"

#define RFB_VERSION "RFB 003.008\n"
#define RFB_VERSION_LEN 12

#define RFB_SEC_INVALID 0
#define RFB_SEC_NONE 1
#define RFB_SEC_VNC_AUTH 2

#define RFB_ENCODING_RAW 0

// Client to server messages.
#define RFB_SET_PIXEL_FORMAT 0
#define RFB_SET_ENCODINGS 2
#define RFB_FB_UPDATE_REQUEST 3
#define RFB_KEY_EVENT 4
#define RFB_POINTER_EVENT 5
#define RFB_CLIENT_CUT_TEXT 6

// Server to client messages.
#define RFB_FB_UPDATE 0
#define RFB_SET_COLOUR_MAP_ENTRIES 1

/**
 * @brief RFB PIXEL_FORMAT structure.
 */
struct PixelFormat {
  uint8_t bitsPerPixel{32};
  uint8_t depth{24};
  bool bigEndian{false};
  bool trueColour{true};
  uint16_t redMax{255};
  uint16_t greenMax{255};
  uint16_t blueMax{255};
  uint8_t redShift{16};
  uint8_t greenShift{8};
  uint8_t blueShift{0};

  /**
   * @brief Parses the 16 byte wire form.
   */
  static PixelFormat parse(const uint8_t* data);

  /**
   * @brief Appends the 16 byte wire form.
   */
  void serialize(std::vector<uint8_t>& out) const;

  int bytesPerPixel() const { return bitsPerPixel / 8; }
};

/**
 * @brief Appends an unsigned big-endian integer.
 */
void putU16(std::vector<uint8_t>& out, uint16_t value);
void putU32(std::vector<uint8_t>& out, uint32_t value);

uint16_t getU16(const uint8_t* data);
uint32_t getU32(const uint8_t* data);

/**
 * @brief Encodes one pixel in a client pixel format.
 *
 * Colour map formats use the BGR233 palette (see bgr233ColourMap()).
 */
uint32_t encodePixel(Color color, const PixelFormat& format);

/**
 * @brief Appends the raw encoding of an image rectangle.
 */
void encodeRaw(const Image& image, const Rect& rect, const PixelFormat& format, std::vector<uint8_t>& out);

/**
 * @brief Builds a SetColourMapEntries message with the 256 entry BGR233 palette.
 */
std::vector<uint8_t> bgr233ColourMap();

/**
 * @brief Bounding box of the pixels that differ inside a rectangle.
 *
 * @return An empty rectangle when nothing changed.
 */
Rect diffBounds(const Image& current, const Image& previous, const Rect& area);

/**
 * @brief Clips a rectangle to an image.
 */
Rect clipRect(const Rect& rect, int width, int height);

// vim: set ts=2 sw=2 expandtab:
