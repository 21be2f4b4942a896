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

#include <iostream>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/spi/spidev.h>

#include "St7789.h"

using namespace std;

static void delayMs(int ms)
{
  this_thread::sleep_for(chrono::milliseconds(ms));
}

vector<uint8_t> toRgb565(const Image& image)
{
  vector<uint8_t> out;
  out.reserve(static_cast<size_t>(image.getWidth()) * image.getHeight() * 2);

  const uint8_t* p = image.data();
  for (size_t i = 0; i < image.size(); i += 3) {
    uint16_t pixel = ((p[i] & 0xF8) << 8) | ((p[i + 1] & 0xFC) << 3) | (p[i + 2] >> 3);
    out.push_back(pixel >> 8);
    out.push_back(pixel & 0xFF);
  }

  return out;
}

St7789::St7789(const DisplayConfig& config, const string& gpioChip) :
  config(config),
  dc(GpioLine::output(gpioChip, config.dcPin, false)),
  rst(GpioLine::output(gpioChip, config.resetPin, true))
{
  spiFd = open(config.spiDevice.c_str(), O_RDWR | O_CLOEXEC);
  if (spiFd < 0) {
    throw runtime_error("Cannot open display SPI device " + config.spiDevice + ": " + strerror(errno));
  }

  uint8_t mode = SPI_MODE_0;
  uint8_t bits = 8;
  uint32_t speed = config.baudrate;

  if (ioctl(spiFd, SPI_IOC_WR_MODE, &mode) < 0 ||
      ioctl(spiFd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
      ioctl(spiFd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
    close(spiFd);
    throw runtime_error("Cannot configure display SPI device " + config.spiDevice);
  }

  reset();
  init();

  cout << "ST7789 display " << width() << "x" << height() << " on " << config.spiDevice << endl;
}

St7789::~St7789()
{
  if (spiFd >= 0) close(spiFd);
}

int St7789::width() const
{
  return config.rotation % 180 == 0 ? config.width : config.height;
}

int St7789::height() const
{
  return config.rotation % 180 == 0 ? config.height : config.width;
}

void St7789::reset()
{
  rst.set(true);
  delayMs(50);
  rst.set(false);
  delayMs(50);
  rst.set(true);
  delayMs(50);
}

void St7789::init()
{
  command(ST7789_SWRESET);
  delayMs(150);
  command(ST7789_SLPOUT);
  delayMs(10);
  command(ST7789_COLMOD, {0x55});
  command(ST7789_MADCTL, {0x08});
  command(ST7789_CASET, {0x00, 0x00, 0x00, 0xF0});
  command(ST7789_RASET, {0x00, 0x00, 0x00, 0xF0});
  command(ST7789_INVON);
  command(ST7789_NORON);
  command(ST7789_DISPON);
  delayMs(10);
  command(ST7789_MADCTL, {0xC0});
}

void St7789::write(const uint8_t* data, size_t length)
{
  for (size_t offset = 0; offset < length; offset += ST7789_CHUNK) {
    size_t n = min<size_t>(ST7789_CHUNK, length - offset);
    if (::write(spiFd, data + offset, n) != static_cast<ssize_t>(n)) {
      throw runtime_error("Display SPI write failed: " + string(strerror(errno)));
    }
  }
}

void St7789::command(uint8_t cmd, initializer_list<uint8_t> params)
{
  dc.set(false);
  write(&cmd, 1);

  if (params.size() > 0) {
    vector<uint8_t> data(params);
    dc.set(true);
    write(data.data(), data.size());
  }
}

void St7789::setWindow(int x0, int y0, int x1, int y1)
{
  x0 += config.xOffset;
  x1 += config.xOffset;
  y0 += config.yOffset;
  y1 += config.yOffset;

  command(ST7789_CASET, {uint8_t(x0 >> 8), uint8_t(x0), uint8_t(x1 >> 8), uint8_t(x1)});
  command(ST7789_RASET, {uint8_t(y0 >> 8), uint8_t(y0), uint8_t(y1 >> 8), uint8_t(y1)});
  command(ST7789_RAMWR);
}

void St7789::show(const Image& image)
{
  Image frame = image;
  if (frame.getWidth() != width() || frame.getHeight() != height()) {
    frame = frame.resized(width(), height());
  }

  // Back to panel orientation.
  frame = frame.rotated(config.rotation);

  vector<uint8_t> pixels = toRgb565(frame);

  setWindow(0, 0, config.width - 1, config.height - 1);
  dc.set(true);
  write(pixels.data(), pixels.size());
}

// vim: set ts=2 sw=2 expandtab:
