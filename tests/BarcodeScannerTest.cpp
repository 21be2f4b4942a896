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

#include "BarcodeScanner.h"
#include "Ean13.h"

using namespace std;

class BarcodeScannerTest : public ::testing::Test
{
protected:
  BarcodeScannerTest() :
    camera("/dev/does-not-exist", 640, 480),
    scanner(camera, decoder, ScanGeometry(240, 240, 30, 640, 480), state, targetWidth, targetHeight)
  {
    scanner.onBarcode([this](const Barcode& barcode) { sent.push_back(barcode.data); });
  }

  static Frame frameWithBarcode()
  {
    Frame frame;
    frame.width = 640;
    frame.height = 480;
    frame.format = V4L2_PIX_FMT_GREY;
    frame.stride = 640;
    frame.data.assign(640 * 480, 255);

    GrayImage barcode = renderEan13("5901234123457");
    int left = (640 - barcode.width) / 2;
    int top = (480 - barcode.height) / 2;
    for (int y = 0; y < barcode.height; y++) {
      for (int x = 0; x < barcode.width; x++) {
        frame.data[(top + y) * 640 + left + x] = barcode.data[y * barcode.width + x];
      }
    }

    return frame;
  }

  static bool hasColor(const Image& image, Color color)
  {
    for (int y = 0; y < image.getHeight(); y++) {
      for (int x = 0; x < image.getWidth(); x++) {
        if (image.get(x, y) == color) return true;
      }
    }
    return false;
  }

  Camera camera;
  BarcodeDecoder decoder;
  atomic<UiState> state{UiState::Idle};
  atomic<int> targetWidth{200};
  atomic<int> targetHeight{150};
  vector<string> sent;
  BarcodeScanner scanner;
};

TEST_F(BarcodeScannerTest, IdleOnlyUpdatesViewfinder)
{
  EXPECT_TRUE(scanner.process(frameWithBarcode()).empty());
  EXPECT_TRUE(sent.empty());

  Image view = scanner.viewfinder();
  ASSERT_EQ(view.getWidth(), 240);
  ASSERT_EQ(view.getHeight(), 240);
  EXPECT_EQ(view.get(5, 5), Colors::Black);
  EXPECT_EQ(view.get(5, 100), Colors::White);
  EXPECT_FALSE(hasColor(view, Colors::Lime));
}

TEST_F(BarcodeScannerTest, ScanDecodesAndReturnsToIdle)
{
  state = UiState::Scan;

  vector<Barcode> found = scanner.process(frameWithBarcode());
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(state.load(), UiState::Idle);
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0], "5901234123457");
  EXPECT_TRUE(hasColor(scanner.viewfinder(), Colors::Lime));

  // One decode per trigger press.
  EXPECT_TRUE(scanner.process(frameWithBarcode()).empty());
  EXPECT_EQ(sent.size(), 1u);
}

TEST_F(BarcodeScannerTest, BarcodeOutsideTargetIsIgnored)
{
  state = UiState::Scan;
  targetWidth = 40;
  targetHeight = 40;

  EXPECT_TRUE(scanner.process(frameWithBarcode()).empty());
  EXPECT_EQ(state.load(), UiState::Scan);
  EXPECT_TRUE(sent.empty());
}

// vim: set ts=2 sw=2 expandtab:
