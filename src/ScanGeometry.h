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

#include <vector>
#include <string>

#include "Image.h"

struct Barcode {
  std::string type;
  std::string data;
  Rect rect;      // In crop coordinates.
};

/**
 * @brief Maps the on-screen scan target to camera pixels and back.
 *
 * The viewfinder occupies the display below the toolbar. The target is
 * centred in the viewfinder and given in display pixels.
 */
class ScanGeometry
{
public:
  ScanGeometry(int displayWidth, int displayHeight, int toolbarHeight,
               int cameraWidth, int cameraHeight);

  int viewfinderHeight() const { return displayHeight - toolbarHeight; }
  int getDisplayWidth() const { return displayWidth; }
  int getDisplayHeight() const { return displayHeight; }

  /**
   * @brief Target rectangle in display coordinates.
   */
  Rect targetOnDisplay(int targetWidth, int targetHeight) const;

  /**
   * @brief Target rectangle in camera coordinates, clamped to the frame.
   */
  Rect targetOnCamera(int targetWidth, int targetHeight) const;

  /**
   * @brief Maps a barcode rectangle inside the camera crop to display coordinates.
   *
   * @param crop Crop actually decoded (see targetOnCamera()).
   */
  Rect cropToDisplay(const Rect& rect, const Rect& crop, int targetWidth, int targetHeight) const;

  /**
   * @brief Picks the barcode whose centre is closest to the target centre.
   *
   * @return Index into barcodes, or -1 if empty.
   */
  int closest(const std::vector<Barcode>& barcodes, const Rect& crop,
              int targetWidth, int targetHeight) const;

private:
  const int displayWidth;
  const int displayHeight;
  const int toolbarHeight;
  const int cameraWidth;
  const int cameraHeight;
};

// vim: set ts=2 sw=2 expandtab:
