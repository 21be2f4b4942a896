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

#include "DisplayDevice.h"
#include "St7789.h"
#include "UserInterface.h"

using namespace std;

TEST(St7789, PacksRgb565BigEndian)
{
  Image image(3, 1);
  image.set(0, 0, Colors::Red);
  image.set(1, 0, Colors::Lime);
  image.set(2, 0, Colors::White);

  vector<uint8_t> expected = {0xF8, 0x00, 0x07, 0xE0, 0xFF, 0xFF};
  EXPECT_EQ(toRgb565(image), expected);
}

TEST(DisplayDevice, UnknownTypeHasNoFactory)
{
  Config config;
  config.display.type = "ili9341";

  EXPECT_TRUE(DisplayDevice::create(config) == nullptr);
  EXPECT_EQ(displayFactories.count("st7789"), 1u);
  EXPECT_EQ(displayFactories.count("x11"), 1u);
}

TEST(UserInterface, OverlayHeightIsBounded)
{
  EXPECT_EQ(UserInterface::overlayHeight(240, 1), 85);
  EXPECT_EQ(UserInterface::overlayHeight(240, 3), 86);
  EXPECT_EQ(UserInterface::overlayHeight(240, 4), 115);
  EXPECT_EQ(UserInterface::overlayHeight(240, 10), 144);
}

TEST(UserInterface, ScrollThumb)
{
  EXPECT_TRUE(UserInterface::scrollThumb(240, 240, 154, 0, 3, 3).empty());

  Rect top = UserInterface::scrollThumb(240, 240, 154, 0, 6, 3);
  EXPECT_EQ(top.x, 222);
  EXPECT_EQ(top.width, 10);
  EXPECT_EQ(top.y, 162);
  EXPECT_EQ(top.height, 35);

  Rect bottom = UserInterface::scrollThumb(240, 240, 154, 5, 6, 3);
  EXPECT_EQ(bottom.bottom(), 232);
}

TEST(UserInterface, ExitScreenDrawsWhiteCross)
{
  Image red = UserInterface::exitScreen(240, 240, Colors::Red);

  EXPECT_EQ(red.get(120, 120), Colors::White);
  EXPECT_EQ(red.get(0, 0), Colors::White);
  EXPECT_EQ(red.get(239, 0), Colors::White);
  EXPECT_EQ(red.get(120, 10), Colors::Red);

  Image blue = UserInterface::exitScreen(240, 240, Colors::Blue);
  EXPECT_EQ(blue.get(120, 10), Colors::Blue);
}

// vim: set ts=2 sw=2 expandtab:
