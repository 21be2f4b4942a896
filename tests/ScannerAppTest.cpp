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

#include <gtest/gtest.h>

#include <stdexcept>

#include "ScannerApp.h"
#include "TempDir.h"

using namespace std;

TEST(ScannerApp, UnknownDisplayFailsStartup)
{
  Config config;
  config.display.type = "ili9341";

  EXPECT_THROW(ScannerApp app(config), runtime_error);
}

TEST(ScannerApp, MissingDevicesFailStartup)
{
  TempDir dir;
  Config config;
  config.display.spiDevice = dir.file("spidev0.0");
  config.gpioChip = dir.file("gpiochip0");
  config.settingsFile = dir.file("settings.json");

  EXPECT_THROW(ScannerApp app(config), runtime_error);
}

// vim: set ts=2 sw=2 expandtab:
