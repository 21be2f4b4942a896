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
#include <cmath>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/spi/spidev.h>

#include "Log.h"
#include "LedRing.h"

using namespace std;

vector<uint8_t> encodeWs2812(const vector<Color>& pixels, double brightness)
{
  brightness = clamp(brightness, 0.0, 1.0);

  vector<uint8_t> out;
  out.reserve(pixels.size() * 9 + WS2812_RESET_BYTES);

  uint32_t bits = 0;
  int pending = 0;

  auto push = [&](uint32_t value, int count) {
    bits = (bits << count) | value;
    pending += count;
    while (pending >= 8) {
      pending -= 8;
      out.push_back(static_cast<uint8_t>(bits >> pending));
    }
  };

  for (const auto& pixel : pixels) {
    uint8_t grb[3] = {pixel.g, pixel.r, pixel.b};
    for (uint8_t channel : grb) {
      auto level = static_cast<uint8_t>(lround(channel * brightness));
      for (int bit = 7; bit >= 0; bit--) {
        push((level >> bit) & 1 ? 0x6 : 0x4, 3);
      }
    }
  }

  out.insert(out.end(), WS2812_RESET_BYTES, 0);
  return out;
}

LedRing::LedRing(const string& spiDevice, unsigned int count) : count(count)
{
  fd = open(spiDevice.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    throw runtime_error("Cannot open LED SPI device " + spiDevice + ": " + strerror(errno));
  }

  uint8_t mode = SPI_MODE_0;
  uint8_t bitsPerWord = 8;
  uint32_t speed = WS2812_SPI_HZ;

  if (ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0 ||
      ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bitsPerWord) < 0 ||
      ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
    close(fd);
    throw runtime_error("Cannot configure LED SPI device " + spiDevice);
  }

  cout << "LED ring: " << count << " LEDs on " << spiDevice << endl;
}

LedRing::~LedRing()
{
  if (fd >= 0) close(fd);
}

void LedRing::setBrightness(double value)
{
  lock_guard<mutex> lock(mtx);
  brightness = value;
  show(vector<Color>(count, color), brightness);
}

void LedRing::setColor(Color value)
{
  lock_guard<mutex> lock(mtx);
  color = value;
  show(vector<Color>(count, color), brightness);
}

void LedRing::off()
{
  lock_guard<mutex> lock(mtx);
  show(vector<Color>(count, Colors::Black), 0);
}

void LedRing::show(const vector<Color>& pixels, double level)
{
  vector<uint8_t> stream = encodeWs2812(pixels, level);

  spi_ioc_transfer transfer{};
  transfer.tx_buf = reinterpret_cast<uintptr_t>(stream.data());
  transfer.len = static_cast<uint32_t>(stream.size());
  transfer.speed_hz = WS2812_SPI_HZ;
  transfer.bits_per_word = 8;

  if (ioctl(fd, SPI_IOC_MESSAGE(1), &transfer) < 0) {
    cerr << "LED ring update failed: " << strerror(errno) << endl;
    return;
  }

  Log::trace() << "LED ring level " << level << endl;
}

// vim: set ts=2 sw=2 expandtab:
