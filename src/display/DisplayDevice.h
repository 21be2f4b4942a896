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

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "Config.h"
#include "Image.h"

/**
 * @brief Output for composed UI frames.
 */
class DisplayDevice
{
public:
  virtual ~DisplayDevice() = default;

  /**
   * @brief Width of the frames show() expects, after rotation.
   */
  virtual int width() const = 0;

  /**
   * @brief Height of the frames show() expects, after rotation.
   */
  virtual int height() const = 0;

  /**
   * @brief Sends a full frame to the device.
   */
  virtual void show(const Image& image) = 0;

  /**
   * @brief Creates the display named by the configured type.
   *
   * @return A display, or nullptr when the type is unknown.
   */
  static std::unique_ptr<DisplayDevice> create(const Config& config);
};

using DisplayFactoryFunction = std::function<std::unique_ptr<DisplayDevice>(const Config&)>;
extern std::map<std::string, DisplayFactoryFunction> displayFactories;

// vim: set ts=2 sw=2 expandtab:
