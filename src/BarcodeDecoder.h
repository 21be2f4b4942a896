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

#include <memory>
#include <string>
#include <vector>

#include "Camera.h"
#include "ScanGeometry.h"

namespace zbar {
class ImageScanner;
}

/**
 * @brief Looks up a zbar symbology by name ("EAN13", "QRCODE", "CODE128"...).
 *
 * Names are case insensitive. Throws std::runtime_error for unknown names.
 *
 * @return The zbar_symbol_type_t value.
 */
int symbologyFromName(const std::string& name);

/**
 * @brief Finds barcodes in greyscale images with zbar.
 */
class BarcodeDecoder
{
public:
  /**
   * @param symbologies Symbologies to look for; empty enables every one.
   */
  explicit BarcodeDecoder(const std::vector<std::string>& symbologies = {});
  ~BarcodeDecoder();

  BarcodeDecoder(const BarcodeDecoder&) = delete;
  BarcodeDecoder& operator=(const BarcodeDecoder&) = delete;

  /**
   * @brief Scans an image.
   *
   * @return Every symbol found, with its bounding box in image coordinates.
   */
  std::vector<Barcode> decode(const GrayImage& image);

private:
  std::unique_ptr<zbar::ImageScanner> scanner;
};

// vim: set ts=2 sw=2 expandtab:
