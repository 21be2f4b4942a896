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

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "BarcodeDecoder.h"
#include "Camera.h"
#include "Image.h"
#include "ScanGeometry.h"
#include "UiState.h"

/**
 * @brief Captures camera frames, publishes the viewfinder and decodes
 *        barcodes while the trigger is held.
 */
class BarcodeScanner
{
public:
  using Callback = std::function<void(const Barcode&)>;

  BarcodeScanner(Camera& camera,
                 BarcodeDecoder& decoder,
                 const ScanGeometry& geometry,
                 std::atomic<UiState>& state,
                 const std::atomic<int>& targetWidth,
                 const std::atomic<int>& targetHeight);
  ~BarcodeScanner();

  /**
   * @brief Sets the callback receiving the barcode closest to the target centre.
   */
  void onBarcode(Callback callback) { found = std::move(callback); }

  void start();
  void stop();

  /**
   * @brief Handles one frame.
   *
   * Builds the display sized viewfinder (camera image below the toolbar). In
   * SCAN the target area is decoded; on success the state returns to IDLE,
   * the callback receives the closest barcode and every barcode is filled
   * lime on the viewfinder.
   *
   * @return Barcodes found in this frame.
   */
  std::vector<Barcode> process(const Frame& frame);

  /**
   * @brief Copy of the latest viewfinder image.
   */
  Image viewfinder() const;

private:
  void scan();

  Camera& camera;
  BarcodeDecoder& decoder;
  const ScanGeometry geometry;
  std::atomic<UiState>& state;
  const std::atomic<int>& targetWidth;
  const std::atomic<int>& targetHeight;
  Callback found;

  mutable std::mutex imageMtx;
  Image latest;

  std::atomic<bool> run{false};
  std::thread scanThread;
};

// vim: set ts=2 sw=2 expandtab:
