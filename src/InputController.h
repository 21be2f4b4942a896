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

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

#include "Setting.h"
#include "SettingsMenu.h"
#include "UiState.h"

#define TARGET_ADJUST_STEP 5

/**
 * @brief Turns encoder, encoder button and trigger events into UI state changes.
 *
 * Encoder and trigger callbacks arrive on the GPIO event thread, the button
 * is polled from the main loop. All menu and state changes happen under the
 * UI lock shared with the display thread.
 */
class InputController
{
public:
  using Clock = std::chrono::steady_clock;

  InputController(std::atomic<UiState>& state,
                  SettingsMenu& menu,
                  std::mutex& uiLock,
                  IntSetting* targetWidth,
                  IntSetting* targetHeight,
                  std::function<void()> save,
                  std::chrono::milliseconds holdTime);

  /**
   * @brief Handles one encoder detent.
   *
   * @param delta +1 clockwise, -1 counter-clockwise.
   */
  void onEncoder(int delta);

  /**
   * @brief Records the encoder button press time.
   */
  void onButtonPress(Clock::time_point now = Clock::now());

  /**
   * @brief Detects short and long presses of the encoder button.
   *
   * Called every 10 ms from the main loop. A short press is reported once the
   * button is released before the hold time, a long press as soon as the
   * button has been held for longer than the hold time.
   *
   * @param now Current time.
   * @param pressed Whether the button is currently held down.
   */
  void poll(Clock::time_point now, bool pressed);

  void onTriggerPress();
  void onTriggerRelease();

private:
  void shortPress();
  void longPress();
  void adjustTarget(IntSetting* setting, int delta);

  std::atomic<UiState>& state;
  SettingsMenu& menu;
  std::mutex& uiLock;
  IntSetting* targetWidth;
  IntSetting* targetHeight;
  std::function<void()> save;
  const std::chrono::milliseconds holdTime;

  std::optional<Clock::time_point> pressTime;
};

// vim: set ts=2 sw=2 expandtab:
