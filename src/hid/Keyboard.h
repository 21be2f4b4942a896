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

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#define HID_MOD_LSHIFT 0x02
#define HID_KEY_ENTER 0x28
#define HID_KEY_TAB 0x2B

using HidReport = std::array<uint8_t, 8>;

struct KeyStroke {
  uint8_t modifier;
  uint8_t key;
};

/**
 * @brief Looks up the US layout key for a character.
 *
 * @return The key, or std::nullopt if the character cannot be typed.
 */
std::optional<KeyStroke> keyForChar(char c);

/**
 * @brief Builds the boot keyboard reports that type a string.
 *
 * Every key press is followed by an all-zero release report. Characters
 * without a key are skipped.
 *
 * @param text Text to type.
 * @param terminator "none", "enter" or "tab".
 */
std::vector<HidReport> buildReports(const std::string& text, const std::string& terminator);

/**
 * @brief Types text into a USB HID gadget keyboard device.
 */
class Keyboard
{
public:
  explicit Keyboard(std::string path) : path(std::move(path)) {}

  /**
   * @brief Types text.
   *
   * @param text Text to type.
   * @param delay Seconds to wait between key strokes.
   * @param terminator Key typed after the text ("none", "enter", "tab").
   * @return False if the device could not be opened or a write would block.
   */
  bool type(const std::string& text, double delay, const std::string& terminator);

private:
  const std::string path;
};

// vim: set ts=2 sw=2 expandtab:
