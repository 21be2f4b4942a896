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

#include <iostream>
#include <chrono>

#include "Log.h"
#include "BarcodeScanner.h"

using namespace std;

BarcodeScanner::BarcodeScanner(Camera& camera,
                               BarcodeDecoder& decoder,
                               const ScanGeometry& geometry,
                               atomic<UiState>& state,
                               const atomic<int>& targetWidth,
                               const atomic<int>& targetHeight) :
  camera(camera),
  decoder(decoder),
  geometry(geometry),
  state(state),
  targetWidth(targetWidth),
  targetHeight(targetHeight),
  latest(geometry.getDisplayWidth(), geometry.getDisplayHeight()) {}

BarcodeScanner::~BarcodeScanner()
{
  stop();
}

void BarcodeScanner::start()
{
  run = true;
  scanThread = thread(&BarcodeScanner::scan, this);
  cout << "Barcode scanner started." << endl;
}

void BarcodeScanner::stop()
{
  if (!run.exchange(false)) return;
  if (scanThread.joinable()) scanThread.join();
}

Image BarcodeScanner::viewfinder() const
{
  lock_guard<mutex> lock(imageMtx);
  return latest;
}

vector<Barcode> BarcodeScanner::process(const Frame& frame)
{
  int displayWidth = geometry.getDisplayWidth();
  int toolbarHeight = geometry.getDisplayHeight() - geometry.viewfinderHeight();

  Image image(displayWidth, geometry.getDisplayHeight());
  image.paste(frame.preview(displayWidth, geometry.viewfinderHeight()), 0, toolbarHeight);

  vector<Barcode> barcodes;

  if (state.load() == UiState::Scan) {
    int tw = targetWidth.load();
    int th = targetHeight.load();

    Rect crop = geometry.targetOnCamera(tw, th);
    barcodes = decoder.decode(frame.gray(crop));

    if (!barcodes.empty()) {
      UiState expected = UiState::Scan;
      state.compare_exchange_strong(expected, UiState::Idle);

      cout << "Found " << barcodes.size() << " barcode(s)." << endl;

      int best = geometry.closest(barcodes, crop, tw, th);
      const Barcode& closest = barcodes[best];
      cout << "Closest barcode: " << closest.type << " " << closest.data << endl;
      if (found) found(closest);

      for (const auto& barcode : barcodes) {
        Rect r = geometry.cropToDisplay(barcode.rect, crop, tw, th);
        image.fillRect(r.x, r.y, r.right(), r.bottom(), Colors::Lime);
      }
    }
  }

  lock_guard<mutex> lock(imageMtx);
  latest = move(image);
  return barcodes;
}

void BarcodeScanner::scan()
{
  Frame frame;

  while (run.load()) {
    if (!camera.capture(frame)) {
      Log::debug() << "No camera frame." << endl;
      this_thread::sleep_for(chrono::milliseconds(10));
      continue;
    }

    try {
      process(frame);
    }
    catch (const exception& e) {
      cerr << "Frame processing failed: " << e.what() << endl;
    }
  }
}

// vim: set ts=2 sw=2 expandtab:
