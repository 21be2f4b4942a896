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
#include <cctype>
#include <limits>
#include <stdexcept>

#include <dirent.h>

#include "Config.h"

using namespace std;

static YAML::Node child(const YAML::Node& node, const char* key)
{
  if (!node || !node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
  return node[key];
}

template <typename T>
static void read(const YAML::Node& node, const char* key, T& value)
{
  const YAML::Node value_node = child(node, key);
  if (value_node) value = value_node.as<T>();
}

static void readPin(const YAML::Node& node, const char* key, unsigned int& pin)
{
  const YAML::Node value_node = child(node, key);
  if (value_node) pin = parsePinName(value_node.as<string>());
}

static void readButton(const YAML::Node& node, ButtonConfig& button)
{
  readPin(node, "pin", button.pin);
  read(node, "bounce_time", button.bounceTime);
  read(node, "hold_time", button.holdTime);
  read(node, "pull_up", button.pullUp);
}

static void readFont(const YAML::Node& node, FontConfig& font)
{
  read(node, "name", font.name);
  read(node, "size", font.size);
}

unsigned int parsePinName(const string& name)
{
  string digits = name;
  if (!digits.empty() && (digits[0] == 'D' || digits[0] == 'd')) digits.erase(0, 1);

  if (digits.empty() || !all_of(digits.begin(), digits.end(), [](unsigned char c) { return isdigit(c); })) {
    throw runtime_error("Invalid pin name: " + name);
  }

  unsigned long pin;
  try {
    pin = stoul(digits);
  }
  catch (const out_of_range&) {
    throw runtime_error("Pin number out of range: " + name);
  }

  if (pin > numeric_limits<unsigned int>::max()) {
    throw runtime_error("Pin number out of range: " + name);
  }

  return static_cast<unsigned int>(pin);
}

string spiDeviceForChipSelect(const string& cs)
{
  if (cs == "CE0") return "/dev/spidev0.0";
  if (cs == "CE1") return "/dev/spidev0.1";
  if (cs.rfind("/dev/", 0) == 0) return cs;

  throw runtime_error("Invalid display chip select: " + cs);
}

string normalizeDisplayType(const string& type)
{
  string base = type.substr(0, type.find('.'));
  transform(base.begin(), base.end(), base.begin(),
            [](unsigned char c) { return static_cast<char>(tolower(c)); });
  return base;
}

vector<string> listUdcs(const string& classPath)
{
  vector<string> udcs;

  DIR* dir = opendir(classPath.c_str());
  if (!dir) return udcs;

  while (struct dirent* entry = readdir(dir)) {
    if (entry->d_name[0] == '.') continue;
    udcs.emplace_back(entry->d_name);
  }

  closedir(dir);
  sort(udcs.begin(), udcs.end());
  return udcs;
}

Config Config::load(const string& path)
{
  try {
    return parse(YAML::LoadFile(path));
  }
  catch (const YAML::BadFile&) {
    throw runtime_error("Failed to open " + path);
  }
  catch (const YAML::Exception& e) {
    throw runtime_error("Failed to parse " + path + ": " + e.what());
  }
}

Config Config::parse(const YAML::Node& root)
{
  Config config;

  read(root, "settings_file", config.settingsFile);

  const YAML::Node hid = child(root, "hid");
  if (child(hid, "udc")) {
    config.hid.udc = hid["udc"].as<string>();
    config.hid.udcConfigured = true;
  }
  read(hid, "path", config.hid.path);
  read(hid, "terminator", config.hid.terminator);

  if (config.hid.terminator != "none" &&
      config.hid.terminator != "enter" &&
      config.hid.terminator != "tab") {
    throw runtime_error("Invalid hid terminator: " + config.hid.terminator);
  }

  const YAML::Node device = child(root, "device");

  read(child(device, "gpio"), "chip", config.gpioChip);

  const YAML::Node led = child(device, "led");
  read(led, "spi", config.ledSpiDevice);
  read(led, "count", config.ledCount);

  const YAML::Node buzzer = child(device, "buzzer");
  readPin(buzzer, "pin", config.buzzerPin);
  read(buzzer, "pwm_chip", config.buzzerPwmChip);
  read(buzzer, "pwm_channel", config.buzzerPwmChannel);

  const YAML::Node display = child(device, "display");
  if (display) {
    if (child(display, "type")) config.display.type = normalizeDisplayType(display["type"].as<string>());
    if (child(display, "cs")) config.display.spiDevice = spiDeviceForChipSelect(display["cs"].as<string>());
    readPin(display, "dc", config.display.dcPin);
    readPin(display, "reset", config.display.resetPin);
    read(display, "width", config.display.width);
    read(display, "height", config.display.height);
    read(display, "rotation", config.display.rotation);
    read(display, "baudrate", config.display.baudrate);
    read(display, "x_offset", config.display.xOffset);
    read(display, "y_offset", config.display.yOffset);
    read(display, "scale", config.display.scale);
  }

  if (config.display.width <= 0 || config.display.height <= 0) {
    throw runtime_error("Display width and height must be positive.");
  }

  if (config.display.scale < 1) {
    throw runtime_error("Display scale must be at least 1.");
  }

  if (config.display.rotation % 90 != 0) {
    throw runtime_error("Display rotation must be a multiple of 90.");
  }

  const YAML::Node encoder = child(device, "encoder");
  readPin(encoder, "pin_a", config.encoderPinA);
  readPin(encoder, "pin_b", config.encoderPinB);
  readButton(child(encoder, "button"), config.encoderButton);

  readButton(child(device, "trigger"), config.trigger);

  const YAML::Node camera = child(device, "camera");
  read(camera, "device", config.cameraDevice);
  const YAML::Node res = child(camera, "resolution");
  if (res) {
    if (!res.IsSequence() || res.size() != 2) {
      throw runtime_error("Camera resolution must be [width, height].");
    }
    config.cameraWidth = res[0].as<int>();
    config.cameraHeight = res[1].as<int>();
    if (config.cameraWidth <= 0 || config.cameraHeight <= 0) {
      throw runtime_error("Camera resolution must be positive.");
    }
  }

  const YAML::Node vnc = child(device, "vnc");
  read(vnc, "enable", config.vnc.enable);
  read(vnc, "port", config.vnc.port);
  read(vnc, "bind", config.vnc.bind);
  read(vnc, "password", config.vnc.password);
  read(vnc, "title", config.vnc.title);
  config.display.title = config.vnc.title;

  const YAML::Node gui = child(root, "gui");
  read(gui, "toolbar_height", config.gui.toolbarHeight);
  read(gui, "menu_items", config.gui.menuItems);
  readFont(child(gui, "toolbar_font"), config.gui.toolbarFont);
  readFont(child(gui, "regular_font"), config.gui.regularFont);

  if (config.gui.toolbarHeight < 0 || config.gui.toolbarHeight >= config.display.height) {
    throw runtime_error("gui.toolbar_height must be between 0 and the display height.");
  }

  if (config.gui.menuItems < 1) {
    throw runtime_error("gui.menu_items must be at least 1.");
  }

  const YAML::Node scanner = child(root, "scanner");
  read(scanner, "symbologies", config.symbologies);

  return config;
}

void Config::warn() const
{
  if (vnc.enable && vnc.password.empty()) {
    cerr << "Warning: VNC authentication is DISABLED." << endl;
  }
  else if (vnc.enable) {
    cerr << "Warning: VNC connection is unencrypted. Do not use VNC in production." << endl;
  }

  vector<string> udcs = listUdcs();
  bool found = find(udcs.begin(), udcs.end(), hid.udc) != udcs.end();

  if (!hid.udcConfigured) {
    cerr << "Warning: No UDC configured in hid settings, using default '" << DEFAULT_UDC
         << "'. The default will not work on all systems." << endl;
  }
  else if (!found) {
    cerr << "Warning: UDC '" << hid.udc << "' not found in " << UDC_CLASS_PATH << "." << endl;
  }

  if (!hid.udcConfigured || !found) {
    cerr << "Available UDCs:";
    for (const auto& udc : udcs) cerr << " " << udc;
    cerr << endl;
  }
}

// vim: set ts=2 sw=2 expandtab:
