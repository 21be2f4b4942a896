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
#include <initializer_list>
#include <string>
#include <vector>

#include "DisplayDevice.h"
#include "GpioLine.h"

#define ST7789_SWRESET 0x01
#define ST7789_SLPOUT  0x11
#define ST7789_NORON   0x13
#define ST7789_INVON   0x21
#define ST7789_DISPON  0x29
#define ST7789_CASET   0x2A
#define ST7789_RASET   0x2B
#define ST7789_RAMWR   0x2C
#define ST7789_MADCTL  0x36
#define ST7789_COLMOD  0x3A

#define ST7789_CHUNK 4096

/**
 * @brief Converts an image to big-endian RGB565.
 */
std::vector<uint8_t> toRgb565(const Image& image);

/**
 * @brief ST7789 TFT controller on SPI with separate DC and RESET lines.
 */
class St7789 : public DisplayDevice
{
public:
  St7789(const DisplayConfig& config, const std::string& gpioChip);
  ~St7789() override;

  int width() const override;
  int height() const override;
  void show(const Image& image) override;

private:
  void reset();
  void init();
  void command(uint8_t cmd, std::initializer_list<uint8_t> params = {});
  void write(const uint8_t* data, size_t length);
  void setWindow(int x0, int y0, int x1, int y1);

  const DisplayConfig config;
  int spiFd = -1;
  GpioLine dc;
  GpioLine rst;
};

// vim: set ts=2 sw=2 expandtab:
