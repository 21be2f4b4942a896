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

#include <linux/videodev2.h>

#include "Camera.h"

TEST(Camera, ControlMappingKeepsNeutralOnDefault)
{
  ControlRange range{0, 255, 128};

  EXPECT_EQ(mapControlValue(0.0, -1.0, 0.0, 1.0, range), 128);
  EXPECT_EQ(mapControlValue(1.0, -1.0, 0.0, 1.0, range), 255);
  EXPECT_EQ(mapControlValue(-1.0, -1.0, 0.0, 1.0, range), 0);
  EXPECT_EQ(mapControlValue(0.5, -1.0, 0.0, 1.0, range), 192);
  EXPECT_EQ(mapControlValue(7.0, -1.0, 0.0, 1.0, range), 255);
}

TEST(Camera, ControlMappingWithNeutralAtMinimum)
{
  ControlRange range{0, 100, 0};

  EXPECT_EQ(mapControlValue(0.0, 0.0, 0.0, 16.0, range), 0);
  EXPECT_EQ(mapControlValue(8.0, 0.0, 0.0, 16.0, range), 50);
  EXPECT_EQ(mapControlValue(16.0, 0.0, 0.0, 16.0, range), 100);
}

static Frame greyFrame(int width, int height)
{
  Frame frame;
  frame.width = width;
  frame.height = height;
  frame.format = V4L2_PIX_FMT_GREY;
  frame.stride = width;
  frame.data.resize(static_cast<size_t>(width) * height);
  for (size_t i = 0; i < frame.data.size(); i++) frame.data[i] = static_cast<uint8_t>(i * 10);
  return frame;
}

TEST(Camera, GreyFrame)
{
  Frame frame = greyFrame(4, 2);

  EXPECT_EQ(frame.luma(1, 1), 50);
  EXPECT_EQ(frame.pixel(2, 0), (Color{20, 20, 20}));

  GrayImage crop = frame.gray({2, 1, 5, 5});
  ASSERT_EQ(crop.width, 2);
  ASSERT_EQ(crop.height, 1);
  EXPECT_EQ(crop.data[0], 60);
  EXPECT_EQ(crop.data[1], 70);

  Image preview = frame.preview(2, 1);
  EXPECT_EQ(preview.get(1, 0), (Color{20, 20, 20}));
}

TEST(Camera, YuyvFrame)
{
  Frame frame;
  frame.width = 2;
  frame.height = 1;
  frame.format = V4L2_PIX_FMT_YUYV;
  frame.stride = 4;
  frame.data = {235, 128, 16, 128};

  EXPECT_EQ(frame.luma(0, 0), 235);
  EXPECT_EQ(frame.luma(1, 0), 16);
  EXPECT_EQ(frame.pixel(0, 0), Colors::White);
  EXPECT_EQ(frame.pixel(1, 0), Colors::Black);
}

TEST(Camera, RgbFrames)
{
  Frame frame;
  frame.width = 1;
  frame.height = 1;
  frame.format = V4L2_PIX_FMT_BGR24;
  frame.stride = 3;
  frame.data = {10, 20, 30};
  EXPECT_EQ(frame.pixel(0, 0), (Color{30, 20, 10}));

  frame.format = V4L2_PIX_FMT_RGB24;
  EXPECT_EQ(frame.pixel(0, 0), (Color{10, 20, 30}));
}

TEST(Camera, MissingDeviceThrows)
{
  Camera camera("/dev/does-not-exist", 640, 480);
  EXPECT_THROW(camera.start(), std::runtime_error);

  Frame frame;
  EXPECT_FALSE(camera.capture(frame, 10));
  EXPECT_FALSE(camera.setControl(V4L2_CID_BRIGHTNESS, 0.0, -1.0, 0.0, 1.0));
}

// vim: set ts=2 sw=2 expandtab:
