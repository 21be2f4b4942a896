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

#include <memory>

#include "DisplayDevice.h"
#include "St7789.h"
#include "X11Display.h"

using namespace std;

std::map<std::string, DisplayFactoryFunction> displayFactories = {
  {"st7789", [](const Config& config) { return make_unique<St7789>(config.display, config.gpioChip); }},
  {"x11",    [](const Config& config) { return make_unique<X11Display>(config.display); }}
};

std::unique_ptr<DisplayDevice> DisplayDevice::create(const Config& config)
{
  auto it = displayFactories.find(config.display.type);

  if (it != displayFactories.end()) {
    return (it->second)(config);
  }

  return nullptr;
}

// vim: set ts=2 sw=2 expandtab:
