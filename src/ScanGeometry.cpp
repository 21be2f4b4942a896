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
#include <limits>

#include "ScanGeometry.h"

using namespace std;

ScanGeometry::ScanGeometry(int displayWidth, int displayHeight, int toolbarHeight,
                           int cameraWidth, int cameraHeight) :
  displayWidth(displayWidth),
  displayHeight(displayHeight),
  toolbarHeight(toolbarHeight),
  cameraWidth(cameraWidth),
  cameraHeight(cameraHeight) {}

Rect ScanGeometry::targetOnDisplay(int targetWidth, int targetHeight) const
{
  int x0 = (displayWidth - targetWidth) / 2;
  int y0 = toolbarHeight + (viewfinderHeight() - targetHeight) / 2;
  return {x0, y0, targetWidth, targetHeight};
}

Rect ScanGeometry::targetOnCamera(int targetWidth, int targetHeight) const
{
  double scaleX = static_cast<double>(cameraWidth) / displayWidth;
  double scaleY = static_cast<double>(cameraHeight) / viewfinderHeight();

  int x0Display = (displayWidth - targetWidth) / 2;
  int y0Viewfinder = (viewfinderHeight() - targetHeight) / 2;

  int x0 = clamp(static_cast<int>(x0Display * scaleX), 0, cameraWidth);
  int y0 = clamp(static_cast<int>(y0Viewfinder * scaleY), 0, cameraHeight);
  int x1 = clamp(static_cast<int>((x0Display + targetWidth) * scaleX), 0, cameraWidth);
  int y1 = clamp(static_cast<int>((y0Viewfinder + targetHeight) * scaleY), 0, cameraHeight);

  return {x0, y0, max(x1 - x0, 0), max(y1 - y0, 0)};
}

Rect ScanGeometry::cropToDisplay(const Rect& rect, const Rect& crop,
                                 int targetWidth, int targetHeight) const
{
  Rect target = targetOnDisplay(targetWidth, targetHeight);
  if (crop.empty()) return {target.x, target.y, 0, 0};

  double scaleX = static_cast<double>(targetWidth) / crop.width;
  double scaleY = static_cast<double>(targetHeight) / crop.height;

  int x0 = static_cast<int>(target.x + rect.x * scaleX);
  int y0 = static_cast<int>(target.y + rect.y * scaleY);
  int w = static_cast<int>(rect.width * scaleX);
  int h = static_cast<int>(rect.height * scaleY);

  return {x0, y0, w, h};
}

int ScanGeometry::closest(const vector<Barcode>& barcodes, const Rect& crop,
                          int targetWidth, int targetHeight) const
{
  Rect target = targetOnDisplay(targetWidth, targetHeight);
  int cx = target.x + targetWidth / 2;
  int cy = target.y + targetHeight / 2;

  int best = -1;
  long bestDistance = numeric_limits<long>::max();

  for (size_t i = 0; i < barcodes.size(); i++) {
    Rect r = cropToDisplay(barcodes[i].rect, crop, targetWidth, targetHeight);
    long dx = r.x + r.width / 2 - cx;
    long dy = r.y + r.height / 2 - cy;
    long distance = dx * dx + dy * dy;

    if (distance < bestDistance) {
      bestDistance = distance;
      best = static_cast<int>(i);
    }
  }

  return best;
}

// vim: set ts=2 sw=2 expandtab:
