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
#include <vector>

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include "DisplayDevice.h"

/**
 * @brief Desktop preview window standing in for the LCD.
 *
 * Frames are scaled up by an integer factor.
 */
class X11Display : public DisplayDevice
{
public:
  explicit X11Display(const DisplayConfig& config);
  ~X11Display() override;

  int width() const override { return config.width; }
  int height() const override { return config.height; }
  void show(const Image& image) override;

private:
  void drainEvents();

  const DisplayConfig config;
  const int scale;

  Display* display = nullptr;
  Window window = None;
  GC gc = nullptr;
  XImage* ximage = nullptr;
  std::vector<uint32_t> buffer;
};

// vim: set ts=2 sw=2 expandtab:
