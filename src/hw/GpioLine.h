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
#include <string>

/**
 * @brief Edge reported by an input line.
 */
struct GpioEdge {
  unsigned int pin;
  bool rising;
  uint64_t timestampNs;
};

/**
 * @brief A single GPIO line requested through the GPIO character device.
 *
 * Uses the v2 uapi (linux/gpio.h). Input lines report both edges and can
 * have a kernel debounce period.
 */
class GpioLine
{
public:
  /**
   * @brief Requests an input line with edge detection.
   *
   * @param chip Path to the chip, e.g. /dev/gpiochip0.
   * @param pin Line offset (BCM number on a Raspberry Pi).
   * @param pullUp Bias pull-up when true, pull-down otherwise.
   * @param debounce Debounce period in seconds, 0 to disable.
   */
  static GpioLine input(const std::string& chip, unsigned int pin, bool pullUp, double debounce);

  /**
   * @brief Requests an output line.
   */
  static GpioLine output(const std::string& chip, unsigned int pin, bool value);

  GpioLine(GpioLine&& other) noexcept;
  GpioLine& operator=(GpioLine&& other) noexcept;
  GpioLine(const GpioLine&) = delete;
  GpioLine& operator=(const GpioLine&) = delete;
  ~GpioLine();

  bool get() const;
  void set(bool value);

  /**
   * @brief Reads one pending edge event.
   *
   * @return False if no event could be read.
   */
  bool readEdge(GpioEdge& edge);

  int getFd() const { return fd; }
  unsigned int getPin() const { return pin; }

private:
  GpioLine(int fd, unsigned int pin) : fd(fd), pin(pin) {}

  int fd = -1;
  unsigned int pin = 0;
};

// vim: set ts=2 sw=2 expandtab:
