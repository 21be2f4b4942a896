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

#include <gtest/gtest.h>

#include "Rfb.h"
#include "VncAuth.h"

using namespace std;

static PixelFormat rgb565()
{
  PixelFormat format;
  format.bitsPerPixel = 16;
  format.depth = 16;
  format.redMax = 31;
  format.greenMax = 63;
  format.blueMax = 31;
  format.redShift = 11;
  format.greenShift = 5;
  format.blueShift = 0;
  return format;
}

TEST(Rfb, BigEndianIntegers)
{
  vector<uint8_t> out;
  putU16(out, 0x1234);
  putU32(out, 0xDEADBEEF);

  EXPECT_EQ(out, (vector<uint8_t>{0x12, 0x34, 0xDE, 0xAD, 0xBE, 0xEF}));
  EXPECT_EQ(getU16(out.data()), 0x1234);
  EXPECT_EQ(getU32(out.data() + 2), 0xDEADBEEFu);
}

TEST(Rfb, DefaultPixelFormat)
{
  vector<uint8_t> out;
  PixelFormat().serialize(out);

  ASSERT_EQ(out.size(), 16u);
  EXPECT_EQ(out[0], 32);
  EXPECT_EQ(out[1], 24);
  EXPECT_EQ(out[2], 0);
  EXPECT_EQ(out[3], 1);
  EXPECT_EQ(out[10], 16);

  PixelFormat parsed = PixelFormat::parse(out.data());
  EXPECT_EQ(parsed.redShift, 16);
  EXPECT_EQ(parsed.blueMax, 255);
}

TEST(Rfb, EncodePixel)
{
  EXPECT_EQ(encodePixel(Colors::Red, PixelFormat()), 0xFF0000u);
  EXPECT_EQ(encodePixel(Colors::Blue, PixelFormat()), 0x0000FFu);
  EXPECT_EQ(encodePixel(Colors::White, rgb565()), 0xFFFFu);
  EXPECT_EQ(encodePixel(Colors::Lime, rgb565()), 0x07E0u);

  PixelFormat palette;
  palette.bitsPerPixel = 8;
  palette.trueColour = false;
  EXPECT_EQ(encodePixel(Colors::White, palette), 0xFFu);
  EXPECT_EQ(encodePixel(Colors::Red, palette), 0x07u);
  EXPECT_EQ(encodePixel(Colors::Blue, palette), 0xC0u);
}

TEST(Rfb, EncodeRawHonoursByteOrder)
{
  Image image(2, 1);
  image.set(1, 0, Colors::Lime);

  vector<uint8_t> little;
  encodeRaw(image, {1, 0, 1, 1}, rgb565(), little);
  EXPECT_EQ(little, (vector<uint8_t>{0xE0, 0x07}));

  PixelFormat format = rgb565();
  format.bigEndian = true;
  vector<uint8_t> big;
  encodeRaw(image, {0, 0, 2, 1}, format, big);
  EXPECT_EQ(big, (vector<uint8_t>{0x00, 0x00, 0x07, 0xE0}));
}

TEST(Rfb, ColourMapCoversBgr233)
{
  vector<uint8_t> map = bgr233ColourMap();
  ASSERT_EQ(map.size(), 6u + 256u * 6u);
  EXPECT_EQ(map[0], RFB_SET_COLOUR_MAP_ENTRIES);
  EXPECT_EQ(getU16(map.data() + 4), 256);

  // Entry 7 is full red.
  const uint8_t* entry = map.data() + 6 + 7 * 6;
  EXPECT_EQ(getU16(entry), 65535);
  EXPECT_EQ(getU16(entry + 2), 0);
  EXPECT_EQ(getU16(entry + 4), 0);
}

TEST(Rfb, DiffBounds)
{
  Image previous(10, 10);
  Image current = previous;
  Rect all{0, 0, 10, 10};

  EXPECT_TRUE(diffBounds(current, previous, all).empty());

  current.set(3, 4, Colors::White);
  current.set(6, 5, Colors::White);
  EXPECT_EQ(diffBounds(current, previous, all), (Rect{3, 4, 4, 2}));

  // Changes outside the requested area are not reported.
  EXPECT_TRUE(diffBounds(current, previous, {0, 0, 3, 3}).empty());
  EXPECT_EQ(diffBounds(current, previous, {5, 0, 5, 10}), (Rect{6, 5, 1, 1}));

  EXPECT_EQ(diffBounds(current, Image(5, 5), {0, 0, 20, 20}), all);
}

TEST(Rfb, ClipRect)
{
  EXPECT_EQ(clipRect({-5, 2, 10, 20}, 8, 8), (Rect{0, 2, 5, 6}));
  EXPECT_TRUE(clipRect({9, 9, 4, 4}, 8, 8).empty());
}

TEST(VncAuth, DesResponse)
{
  VncChallenge zeros{};
  VncChallenge response = vncAuthResponse("", zeros);

  VncChallenge expected = {0x8C, 0xA6, 0x4D, 0xE9, 0xC1, 0xB1, 0x23, 0xA7,
                           0x8C, 0xA6, 0x4D, 0xE9, 0xC1, 0xB1, 0x23, 0xA7};
  EXPECT_EQ(response, expected);
}

TEST(VncAuth, PasswordIsTruncatedToEightCharacters)
{
  VncChallenge challenge = makeVncChallenge();

  EXPECT_EQ(vncAuthResponse("password", challenge), vncAuthResponse("password123", challenge));
  EXPECT_NE(vncAuthResponse("password", challenge), vncAuthResponse("passwore", challenge));
  EXPECT_NE(makeVncChallenge(), challenge);
}

// vim: set ts=2 sw=2 expandtab:
