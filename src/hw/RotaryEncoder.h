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
#include <string>

#include "GpioLine.h"
#include "GpioEventLoop.h"

/**
 * @brief Decodes the Gray code sequence of a two channel rotary encoder.
 *
 * One step is reported per detent, once the encoder is back in its rest
 * state after a full cycle. Half cycles that turn back are discarded.
 */
class QuadratureDecoder
{
public:
  /**
   * @param restA Level of channel A at a detent (high with pull-ups).
   * @param restB Level of channel B at a detent.
   */
  explicit QuadratureDecoder(bool restA = true, bool restB = true);

  /**
   * @brief Feeds the current channel levels.
   *
   * @return +1 for a clockwise detent (A leads), -1 counter-clockwise, 0 otherwise.
   */
  int update(bool a, bool b);

private:
  const int rest;
  int state;
  int count = 0;
};

/**
 * @brief Rotary encoder on two GPIO inputs with pull-ups.
 */
class RotaryEncoder
{
public:
  RotaryEncoder(const std::string& chip, unsigned int pinA, unsigned int pinB);

  void onRotate(std::function<void(int)> callback) { rotated = std::move(callback); }

  void attach(GpioEventLoop& loop);

private:
  void handle();

  GpioLine lineA;
  GpioLine lineB;
  QuadratureDecoder decoder;
  std::function<void(int)> rotated;
};

// vim: set ts=2 sw=2 expandtab:
