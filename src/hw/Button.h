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

#include <chrono>
#include <functional>
#include <string>

#include "Config.h"
#include "GpioLine.h"
#include "GpioEventLoop.h"

/**
 * @brief Push button on a GPIO input.
 *
 * With a pull-up the button is active low.
 */
class Button
{
public:
  using Callback = std::function<void()>;

  Button(const std::string& chip, const ButtonConfig& config);

  /**
   * @brief Starts delivering press and release callbacks from the event loop.
   */
  void attach(GpioEventLoop& loop);

  bool isPressed() const;

  void onPress(Callback callback) { pressed = std::move(callback); }
  void onRelease(Callback callback) { released = std::move(callback); }

  std::chrono::milliseconds getHoldTime() const { return holdTime; }

private:
  void handle(const GpioEdge& edge);

  GpioLine line;
  const bool activeLow;
  const std::chrono::milliseconds holdTime;
  Callback pressed;
  Callback released;
};

// vim: set ts=2 sw=2 expandtab:
