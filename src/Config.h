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
#include <vector>

#include <yaml-cpp/yaml.h>

#define DEFAULT_UDC "3f980000.usb"
#define UDC_CLASS_PATH "/sys/class/udc"

struct HidConfig {
  std::string udc{DEFAULT_UDC};
  std::string path{"/dev/hidg0"};
  std::string terminator{"none"};
  bool udcConfigured{false};
};

struct ButtonConfig {
  unsigned int pin{0};
  double bounceTime{0.02};
  double holdTime{0.5};
  bool pullUp{true};
};

struct DisplayConfig {
  std::string type{"st7789"};
  std::string spiDevice{"/dev/spidev0.0"};
  unsigned int dcPin{25};
  unsigned int resetPin{24};
  int width{240};
  int height{240};
  int rotation{180};
  uint32_t baudrate{60000000};
  int xOffset{0};
  int yOffset{80};
  int scale{2};
  std::string title{"Raspberry Pi Barcode Scanner"};
};

struct VncConfig {
  bool enable{true};
  int port{5900};
  std::string bind{"0.0.0.0"};
  std::string password;
  std::string title{"Raspberry Pi Barcode Scanner"};
};

struct FontConfig {
  std::string name{"DejaVuSans.ttf"};
  int size{18};
};

struct GuiConfig {
  int toolbarHeight{30};
  int menuItems{3};
  FontConfig toolbarFont{"DejaVuSans.ttf", 10};
  FontConfig regularFont{"DejaVuSans.ttf", 18};
};

struct Config {
  std::string settingsFile{"settings.json"};
  std::string gpioChip{"/dev/gpiochip0"};

  HidConfig hid;

  std::string ledSpiDevice{"/dev/spidev1.0"};
  unsigned int ledCount{16};

  unsigned int buzzerPin{19};
  unsigned int buzzerPwmChip{0};
  unsigned int buzzerPwmChannel{1};

  DisplayConfig display;

  unsigned int encoderPinA{17};
  unsigned int encoderPinB{18};
  ButtonConfig encoderButton{27, 0.02, 0.5, true};
  ButtonConfig trigger{26, 0.02, 0.5, true};

  std::string cameraDevice{"/dev/video0"};
  int cameraWidth{1920};
  int cameraHeight{1080};

  VncConfig vnc;
  GuiConfig gui;

  std::vector<std::string> symbologies;

  /**
   * @brief Loads the YAML configuration file.
   *
   * Missing keys keep their defaults. Throws std::runtime_error when the
   * file cannot be read or a value has the wrong type.
   *
   * @param path Path to config.yml.
   * @return The parsed configuration.
   */
  static Config load(const std::string& path);

  /**
   * @brief Builds a configuration from an already parsed YAML document.
   */
  static Config parse(const YAML::Node& root);

  /**
   * @brief Logs warnings for settings that are valid but questionable
   *        (default UDC, unknown UDC, VNC without password).
   */
  void warn() const;
};

/**
 * @brief Parses a Raspberry Pi pin name such as "D25" or "25".
 */
unsigned int parsePinName(const std::string& name);

/**
 * @brief Maps a SPI0 chip select name ("CE0", "CE1") to its spidev node.
 */
std::string spiDeviceForChipSelect(const std::string& cs);

/**
 * @brief Normalizes a display type ("st7789.ST7789" becomes "st7789").
 */
std::string normalizeDisplayType(const std::string& type);

/**
 * @brief Lists USB device controllers registered with the kernel.
 *
 * @param classPath Directory to enumerate, normally /sys/class/udc.
 */
std::vector<std::string> listUdcs(const std::string& classPath = UDC_CLASS_PATH);

// vim: set ts=2 sw=2 expandtab:
