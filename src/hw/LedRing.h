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
#include <mutex>
#include <string>
#include <vector>

#include "Image.h"

#define WS2812_SPI_HZ 2400000
#define WS2812_RESET_BYTES 30

/**
 * @brief Encodes pixels as a WS2812 bit stream for SPI at 2.4 MHz.
 *
 * Every data bit becomes three SPI bits (110 for one, 100 for zero), colours
 * are sent in GRB order and the stream ends with a low reset period.
 *
 * @param pixels Colours in ring order.
 * @param brightness Scale 0.0-1.0 applied to every channel.
 */
std::vector<uint8_t> encodeWs2812(const std::vector<Color>& pixels, double brightness);

/**
 * @brief WS2812 LED ring driven from the SPI MOSI line.
 */
class LedRing
{
public:
  LedRing(const std::string& spiDevice, unsigned int count);
  ~LedRing();

  LedRing(const LedRing&) = delete;
  LedRing& operator=(const LedRing&) = delete;

  void setBrightness(double value);
  void setColor(Color value);

  /**
   * @brief Turns every LED off without changing colour or brightness.
   */
  void off();

private:
  void show(const std::vector<Color>& pixels, double brightness);

  int fd = -1;
  const unsigned int count;

  std::mutex mtx;
  Color color = Colors::White;
  double brightness = 0.2;
};

// vim: set ts=2 sw=2 expandtab:
