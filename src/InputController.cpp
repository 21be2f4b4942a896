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

#include "Log.h"
#include "InputController.h"

using namespace std;

InputController::InputController(atomic<UiState>& state,
                                 SettingsMenu& menu,
                                 mutex& uiLock,
                                 IntSetting* targetWidth,
                                 IntSetting* targetHeight,
                                 function<void()> save,
                                 chrono::milliseconds holdTime) :
  state(state),
  menu(menu),
  uiLock(uiLock),
  targetWidth(targetWidth),
  targetHeight(targetHeight),
  save(move(save)),
  holdTime(holdTime) {}

void InputController::adjustTarget(IntSetting* setting, int delta)
{
  if (!setting) return;

  setting->set(setting->get() + delta * TARGET_ADJUST_STEP);
  setting->apply();
  if (save) save();
}

void InputController::onEncoder(int delta)
{
  Log::trace() << "Encoder turned: delta=" << delta << endl;

  lock_guard<mutex> lock(uiLock);

  switch (state.load()) {
  case UiState::TargetAdjustW:
    adjustTarget(targetWidth, delta);
    Log::debug() << "Target width adjusted to " << targetWidth->get() << endl;
    break;

  case UiState::TargetAdjustH:
    adjustTarget(targetHeight, delta);
    Log::debug() << "Target height adjusted to " << targetHeight->get() << endl;
    break;

  case UiState::Settings: {
    Setting* active = menu.getActive();

    // Not editing, move the cursor.
    if (!active) {
      int last = static_cast<int>(menu.visible().size()) - 1;
      menu.setIndex(clamp(menu.getIndex() + delta, 0, max(last, 0)));
      break;
    }

    if (active->kind() == Setting::Kind::Action) break;

    active->adjust(delta);
    active->apply();
    if (save) save();
    break;
  }

  default:
    break;
  }
}

void InputController::onButtonPress(Clock::time_point now)
{
  pressTime = now;
  Log::debug() << "Button pressed." << endl;
}

void InputController::poll(Clock::time_point now, bool pressed)
{
  if (!pressTime) return;

  auto held = now - *pressTime;

  if (!pressed) {
    if (held < holdTime) shortPress();
    pressTime.reset();
    return;
  }

  if (held >= holdTime) {
    Log::debug() << "Long press detected." << endl;
    longPress();
    pressTime.reset();
  }
}

void InputController::shortPress()
{
  lock_guard<mutex> lock(uiLock);

  switch (state.load()) {
  case UiState::Settings: {
    Setting* selected = menu.selected();
    if (!selected) break;

    if (menu.getActive()) {
      menu.setActive(nullptr);
    }
    else if (menu.isExit(selected)) {
      if (!menu.pop()) {
        state = UiState::Idle;
        menu.reset();
      }
    }
    else if (selected->kind() == Setting::Kind::Group) {
      menu.push(static_cast<GroupSetting*>(selected));
    }
    else {
      menu.setActive(selected);
      if (selected->kind() == Setting::Kind::Action) selected->apply();
    }
    break;
  }

  case UiState::Idle:
    state = UiState::TargetAdjustW;
    break;

  case UiState::TargetAdjustW:
    state = UiState::TargetAdjustH;
    break;

  case UiState::TargetAdjustH:
    state = UiState::Idle;
    break;

  default:
    break;
  }

  cout << "State changed to " << uiStateName(state.load()) << endl;
}

void InputController::longPress()
{
  lock_guard<mutex> lock(uiLock);

  if (state == UiState::Idle) {
    state = UiState::Settings;
    menu.reset();
  }
  else if (state == UiState::Settings) {
    if (!menu.pop()) {
      state = UiState::Idle;
      menu.reset();
    }
  }

  cout << "State changed to " << uiStateName(state.load()) << endl;
}

void InputController::onTriggerPress()
{
  Log::debug() << "Trigger pressed." << endl;

  lock_guard<mutex> lock(uiLock);

  if (state == UiState::Idle) {
    state = UiState::Scan;
  }
  else if (state == UiState::Settings) {
    state = UiState::Idle;
    menu.reset();
  }
}

void InputController::onTriggerRelease()
{
  Log::debug() << "Trigger released." << endl;

  UiState expected = UiState::Scan;
  state.compare_exchange_strong(expected, UiState::Idle);
}

// vim: set ts=2 sw=2 expandtab:
