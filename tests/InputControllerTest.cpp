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

#include "InputController.h"

using namespace std;
using namespace std::chrono;

class InputControllerTest : public ::testing::Test
{
protected:
  InputControllerTest() :
    targetWidth("tgt_width", "Target Width", 40, 200, 120, [this](int v) { appliedWidth = v; }, 1),
    targetHeight("tgt_height", "Target Height", 40, 200, 80, nullptr, 1),
    connection("connection", "Connection", {"USB", "NONE"}, "USB", nullptr),
    camera("camera", "Camera Settings"),
    shutdown("shutdown", "Shutdown", [this]() { shutdownRuns++; }),
    input(state, menu, uiLock, &targetWidth, &targetHeight, [this]() { saves++; }, milliseconds(500))
  {
    brightness = camera.add(make_unique<FloatSetting>("brightness", "Brightness", -1.0, 1.0, 0.0, nullptr));
    menu.setRoot({&connection, &camera, &shutdown});
  }

  void shortPress()
  {
    auto now = InputController::Clock::now();
    input.onButtonPress(now);
    input.poll(now + milliseconds(100), false);
  }

  void longPress()
  {
    auto now = InputController::Clock::now();
    input.onButtonPress(now);
    input.poll(now + milliseconds(600), true);
    input.poll(now + milliseconds(700), false);
  }

  atomic<UiState> state{UiState::Idle};
  SettingsMenu menu;
  mutex uiLock;
  int appliedWidth = 0;
  int saves = 0;
  int shutdownRuns = 0;

  IntSetting targetWidth;
  IntSetting targetHeight;
  OptionSetting connection;
  GroupSetting camera;
  ActionSetting shutdown;
  FloatSetting* brightness = nullptr;

  InputController input;
};

TEST_F(InputControllerTest, ShortPressCyclesTargetAdjustment)
{
  shortPress();
  EXPECT_EQ(state.load(), UiState::TargetAdjustW);
  shortPress();
  EXPECT_EQ(state.load(), UiState::TargetAdjustH);
  shortPress();
  EXPECT_EQ(state.load(), UiState::Idle);
}

TEST_F(InputControllerTest, EncoderAdjustsTargetInSteps)
{
  state = UiState::TargetAdjustW;

  input.onEncoder(1);
  EXPECT_EQ(targetWidth.get(), 120 + TARGET_ADJUST_STEP);
  EXPECT_EQ(appliedWidth, 120 + TARGET_ADJUST_STEP);
  EXPECT_EQ(saves, 1);

  for (int i = 0; i < 50; i++) input.onEncoder(1);
  EXPECT_EQ(targetWidth.get(), 200);

  state = UiState::TargetAdjustH;
  input.onEncoder(-1);
  EXPECT_EQ(targetHeight.get(), 80 - TARGET_ADJUST_STEP);
}

TEST_F(InputControllerTest, EncoderIgnoredWhileIdle)
{
  input.onEncoder(3);
  EXPECT_EQ(targetWidth.get(), 120);
  EXPECT_EQ(saves, 0);
}

TEST_F(InputControllerTest, HeldButtonWaitsForRelease)
{
  auto now = InputController::Clock::now();
  input.onButtonPress(now);

  input.poll(now + milliseconds(200), true);
  EXPECT_EQ(state.load(), UiState::Idle);

  input.poll(now + milliseconds(300), false);
  EXPECT_EQ(state.load(), UiState::TargetAdjustW);
}

TEST_F(InputControllerTest, LongPressFiresAtHoldTime)
{
  auto now = InputController::Clock::now();
  input.onButtonPress(now);

  input.poll(now + milliseconds(499), true);
  EXPECT_EQ(state.load(), UiState::Idle);

  input.poll(now + milliseconds(500), true);
  EXPECT_EQ(state.load(), UiState::Settings);

  input.poll(now + milliseconds(510), false);
  EXPECT_EQ(state.load(), UiState::Settings);
}

TEST_F(InputControllerTest, LongPressOpensAndClosesSettings)
{
  state = UiState::TargetAdjustH;
  longPress();
  EXPECT_EQ(state.load(), UiState::TargetAdjustH);

  state = UiState::Idle;
  longPress();
  EXPECT_EQ(state.load(), UiState::Settings);
  EXPECT_TRUE(menu.atRoot());

  longPress();
  EXPECT_EQ(state.load(), UiState::Idle);
}

TEST_F(InputControllerTest, MenuNavigation)
{
  longPress();
  ASSERT_EQ(state.load(), UiState::Settings);

  input.onEncoder(-1);
  EXPECT_EQ(menu.getIndex(), 0);
  input.onEncoder(5);
  EXPECT_EQ(menu.getIndex(), 2);
  input.onEncoder(-1);
  EXPECT_EQ(menu.getIndex(), 1);

  // Enter the camera group.
  shortPress();
  EXPECT_FALSE(menu.atRoot());
  EXPECT_EQ(menu.getIndex(), 0);

  // Edit brightness.
  input.onEncoder(1);
  shortPress();
  EXPECT_EQ(menu.getActive(), brightness);

  input.onEncoder(2);
  EXPECT_DOUBLE_EQ(brightness->get(), 0.2);
  EXPECT_EQ(saves, 1);

  // Deselect, then take the exit item back to the root.
  shortPress();
  EXPECT_EQ(menu.getActive(), nullptr);
  input.onEncoder(-1);
  shortPress();
  EXPECT_TRUE(menu.atRoot());
  EXPECT_EQ(state.load(), UiState::Settings);

  // Long press at the root leaves the menu.
  longPress();
  EXPECT_EQ(state.load(), UiState::Idle);
}

TEST_F(InputControllerTest, LongPressInsideGroupPopsOneLevel)
{
  longPress();
  input.onEncoder(1);
  shortPress();
  ASSERT_FALSE(menu.atRoot());

  longPress();
  EXPECT_TRUE(menu.atRoot());
  EXPECT_EQ(state.load(), UiState::Settings);
}

TEST_F(InputControllerTest, ActionRunsOnSelect)
{
  longPress();
  input.onEncoder(2);
  shortPress();

  EXPECT_EQ(shutdownRuns, 1);
  EXPECT_EQ(menu.getActive(), &shutdown);

  // Turning the encoder does not edit or re-run an action.
  input.onEncoder(1);
  EXPECT_EQ(shutdownRuns, 1);
  EXPECT_EQ(saves, 0);
}

TEST_F(InputControllerTest, TriggerScansOnlyFromIdle)
{
  input.onTriggerPress();
  EXPECT_EQ(state.load(), UiState::Scan);
  input.onTriggerRelease();
  EXPECT_EQ(state.load(), UiState::Idle);

  state = UiState::TargetAdjustW;
  input.onTriggerPress();
  EXPECT_EQ(state.load(), UiState::TargetAdjustW);
  input.onTriggerRelease();
  EXPECT_EQ(state.load(), UiState::TargetAdjustW);
}

TEST_F(InputControllerTest, TriggerClosesSettings)
{
  longPress();
  input.onEncoder(1);
  shortPress();

  input.onTriggerPress();
  EXPECT_EQ(state.load(), UiState::Idle);
  EXPECT_TRUE(menu.atRoot());
}

// vim: set ts=2 sw=2 expandtab:
