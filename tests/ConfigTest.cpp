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

#include "Config.h"
#include "TempDir.h"

TEST(Config, DefaultsWhenEmpty)
{
  Config config = Config::parse(YAML::Load("{}"));

  EXPECT_EQ(config.settingsFile, "settings.json");
  EXPECT_EQ(config.hid.udc, DEFAULT_UDC);
  EXPECT_FALSE(config.hid.udcConfigured);
  EXPECT_EQ(config.hid.path, "/dev/hidg0");
  EXPECT_EQ(config.hid.terminator, "none");
  EXPECT_EQ(config.display.type, "st7789");
  EXPECT_EQ(config.display.rotation, 180);
  EXPECT_EQ(config.display.yOffset, 80);
  EXPECT_EQ(config.encoderButton.pin, 27u);
  EXPECT_EQ(config.trigger.pin, 26u);
  EXPECT_EQ(config.cameraWidth, 1920);
  EXPECT_EQ(config.cameraHeight, 1080);
  EXPECT_TRUE(config.vnc.enable);
  EXPECT_EQ(config.vnc.port, 5900);
  EXPECT_EQ(config.gui.toolbarHeight, 30);
  EXPECT_EQ(config.gui.menuItems, 3);
  EXPECT_TRUE(config.symbologies.empty());
}

TEST(Config, ParsesDeviceSection)
{
  Config config = Config::parse(YAML::Load(R"(
settings_file: /var/lib/hidscan/settings.json
hid:
  udc: fe980000.usb
  terminator: enter
device:
  display: { type: x11.X11, cs: CE1, dc: D22, reset: 23, width: 320, height: 240, rotation: 90, scale: 3 }
  encoder: { pin_a: D5, pin_b: D6, button: { pin: D13, hold_time: 1.0, pull_up: false } }
  camera: { device: /dev/video2, resolution: [640, 480] }
  vnc: { enable: false, port: 5901, password: secret, title: Bench }
gui:
  menu_items: 4
  regular_font: { name: FreeSans.ttf, size: 14 }
scanner:
  symbologies: [EAN13, QRCODE]
)"));

  EXPECT_EQ(config.settingsFile, "/var/lib/hidscan/settings.json");
  EXPECT_EQ(config.hid.udc, "fe980000.usb");
  EXPECT_TRUE(config.hid.udcConfigured);
  EXPECT_EQ(config.hid.terminator, "enter");

  EXPECT_EQ(config.display.type, "x11");
  EXPECT_EQ(config.display.spiDevice, "/dev/spidev0.1");
  EXPECT_EQ(config.display.dcPin, 22u);
  EXPECT_EQ(config.display.resetPin, 23u);
  EXPECT_EQ(config.display.width, 320);
  EXPECT_EQ(config.display.rotation, 90);
  EXPECT_EQ(config.display.scale, 3);
  EXPECT_EQ(config.display.title, "Bench");

  EXPECT_EQ(config.encoderPinA, 5u);
  EXPECT_EQ(config.encoderPinB, 6u);
  EXPECT_EQ(config.encoderButton.pin, 13u);
  EXPECT_DOUBLE_EQ(config.encoderButton.holdTime, 1.0);
  EXPECT_FALSE(config.encoderButton.pullUp);

  EXPECT_EQ(config.cameraDevice, "/dev/video2");
  EXPECT_EQ(config.cameraWidth, 640);
  EXPECT_EQ(config.cameraHeight, 480);

  EXPECT_FALSE(config.vnc.enable);
  EXPECT_EQ(config.vnc.port, 5901);
  EXPECT_EQ(config.vnc.password, "secret");

  EXPECT_EQ(config.gui.menuItems, 4);
  EXPECT_EQ(config.gui.regularFont.name, "FreeSans.ttf");
  EXPECT_EQ(config.gui.regularFont.size, 14);

  ASSERT_EQ(config.symbologies.size(), 2u);
  EXPECT_EQ(config.symbologies[1], "QRCODE");
}

TEST(Config, RejectsBadValues)
{
  EXPECT_THROW(Config::parse(YAML::Load("hid: { terminator: space }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("device: { display: { rotation: 45 } }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("device: { display: { cs: CE7 } }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("device: { vnc: { port: abc } }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("device: { camera: { resolution: [640] } }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("gui: { menu_items: 0 }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("device: { trigger: { pin: D99999999999999999999 } }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("device: { display: { width: 0 } }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("device: { display: { height: -240 } }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("device: { display: { scale: 0 } }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("device: { camera: { resolution: [0, 480] } }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("gui: { toolbar_height: 240 }")), std::runtime_error);
  EXPECT_THROW(Config::parse(YAML::Load("gui: { toolbar_height: -1 }")), std::runtime_error);
  EXPECT_NO_THROW(Config::parse(YAML::Load("gui: { toolbar_height: 0 }")));
}

TEST(Config, LoadReportsMissingAndMalformedFiles)
{
  TempDir dir;
  EXPECT_THROW(Config::load(dir.file("missing.yml")), std::runtime_error);

  dir.write("bad.yml", "hid: [unterminated\n");
  EXPECT_THROW(Config::load(dir.file("bad.yml")), std::runtime_error);

  dir.write("good.yml", "hid:\n  udc: 20980000.usb\n");
  EXPECT_EQ(Config::load(dir.file("good.yml")).hid.udc, "20980000.usb");
}

TEST(Config, PinNames)
{
  EXPECT_EQ(parsePinName("D25"), 25u);
  EXPECT_EQ(parsePinName("19"), 19u);
  EXPECT_THROW(parsePinName("GPIO19"), std::runtime_error);
  EXPECT_THROW(parsePinName("D"), std::runtime_error);
  EXPECT_THROW(parsePinName("D99999999999999999999"), std::runtime_error);
  EXPECT_THROW(parsePinName("D4294967296"), std::runtime_error);
  EXPECT_THROW(parsePinName("D\xc3\xa9"), std::runtime_error);
}

TEST(Config, DisplayTypeAndChipSelect)
{
  EXPECT_EQ(normalizeDisplayType("st7789.ST7789"), "st7789");
  EXPECT_EQ(normalizeDisplayType("X11"), "x11");
  EXPECT_EQ(normalizeDisplayType("\xc3\x89ST7789"), "\xc3\x89st7789");
  EXPECT_EQ(spiDeviceForChipSelect("CE0"), "/dev/spidev0.0");
  EXPECT_EQ(spiDeviceForChipSelect("/dev/spidev1.2"), "/dev/spidev1.2");
}

TEST(Config, ListsUdcs)
{
  TempDir dir;
  dir.mkdir("fe980000.usb");
  dir.mkdir("3f980000.usb");

  std::vector<std::string> udcs = listUdcs(dir.path);
  ASSERT_EQ(udcs.size(), 2u);
  EXPECT_EQ(udcs[0], "3f980000.usb");
  EXPECT_EQ(udcs[1], "fe980000.usb");

  EXPECT_TRUE(listUdcs(dir.file("none")).empty());
}

// vim: set ts=2 sw=2 expandtab:
