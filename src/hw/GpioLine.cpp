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
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/gpio.h>

#include "GpioLine.h"

#define GPIO_CONSUMER "hidscan"

using namespace std;

static int requestLine(const string& chip, unsigned int pin, gpio_v2_line_request& req)
{
  int chipFd = open(chip.c_str(), O_RDWR | O_CLOEXEC);
  if (chipFd < 0) {
    throw runtime_error("Cannot open " + chip + ": " + strerror(errno));
  }

  req.offsets[0] = pin;
  req.num_lines = 1;
  strncpy(req.consumer, GPIO_CONSUMER, sizeof(req.consumer) - 1);

  int rc = ioctl(chipFd, GPIO_V2_GET_LINE_IOCTL, &req);
  int err = errno;
  close(chipFd);

  if (rc < 0) {
    throw runtime_error("Cannot request GPIO" + to_string(pin) + ": " + strerror(err));
  }

  return req.fd;
}

GpioLine GpioLine::input(const string& chip, unsigned int pin, bool pullUp, double debounce)
{
  gpio_v2_line_request req{};
  req.config.flags = GPIO_V2_LINE_FLAG_INPUT |
                     GPIO_V2_LINE_FLAG_EDGE_RISING |
                     GPIO_V2_LINE_FLAG_EDGE_FALLING |
                     (pullUp ? GPIO_V2_LINE_FLAG_BIAS_PULL_UP : GPIO_V2_LINE_FLAG_BIAS_PULL_DOWN);

  if (debounce > 0) {
    req.config.num_attrs = 1;
    req.config.attrs[0].mask = 1;
    req.config.attrs[0].attr.id = GPIO_V2_LINE_ATTR_ID_DEBOUNCE;
    req.config.attrs[0].attr.debounce_period_us = static_cast<uint32_t>(debounce * 1000000);
  }

  return GpioLine(requestLine(chip, pin, req), pin);
}

GpioLine GpioLine::output(const string& chip, unsigned int pin, bool value)
{
  gpio_v2_line_request req{};
  req.config.flags = GPIO_V2_LINE_FLAG_OUTPUT;
  req.config.num_attrs = 1;
  req.config.attrs[0].mask = 1;
  req.config.attrs[0].attr.id = GPIO_V2_LINE_ATTR_ID_OUTPUT_VALUES;
  req.config.attrs[0].attr.values = value ? 1 : 0;

  return GpioLine(requestLine(chip, pin, req), pin);
}

GpioLine::GpioLine(GpioLine&& other) noexcept : fd(other.fd), pin(other.pin)
{
  other.fd = -1;
}

GpioLine& GpioLine::operator=(GpioLine&& other) noexcept
{
  if (this != &other) {
    if (fd >= 0) close(fd);
    fd = other.fd;
    pin = other.pin;
    other.fd = -1;
  }
  return *this;
}

GpioLine::~GpioLine()
{
  if (fd >= 0) close(fd);
}

bool GpioLine::get() const
{
  gpio_v2_line_values values{};
  values.mask = 1;

  if (ioctl(fd, GPIO_V2_LINE_GET_VALUES_IOCTL, &values) < 0) {
    throw runtime_error("Cannot read GPIO" + to_string(pin) + ": " + strerror(errno));
  }

  return values.bits & 1;
}

void GpioLine::set(bool value)
{
  gpio_v2_line_values values{};
  values.mask = 1;
  values.bits = value ? 1 : 0;

  if (ioctl(fd, GPIO_V2_LINE_SET_VALUES_IOCTL, &values) < 0) {
    throw runtime_error("Cannot set GPIO" + to_string(pin) + ": " + strerror(errno));
  }
}

bool GpioLine::readEdge(GpioEdge& edge)
{
  gpio_v2_line_event event{};
  ssize_t n = read(fd, &event, sizeof(event));
  if (n != static_cast<ssize_t>(sizeof(event))) return false;

  edge.pin = pin;
  edge.rising = event.id == GPIO_V2_LINE_EVENT_RISING_EDGE;
  edge.timestampNs = event.timestamp_ns;
  return true;
}

// vim: set ts=2 sw=2 expandtab:
