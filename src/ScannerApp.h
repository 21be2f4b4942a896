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
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "Config.h"
#include "Image.h"
#include "Setting.h"
#include "SettingsMenu.h"
#include "SettingsStore.h"
#include "UiState.h"
#include "DisplayDevice.h"
#include "GpioEventLoop.h"
#include "Button.h"
#include "RotaryEncoder.h"
#include "TonePlayer.h"
#include "LedRing.h"
#include "Camera.h"
#include "BarcodeDecoder.h"
#include "BarcodeScanner.h"
#include "HidInterface.h"
#include "InputController.h"
#include "UserInterface.h"
#include "VncServer.h"

#define DISPLAY_FPS 15

/**
 * @brief The scanner appliance: hardware, settings, UI and worker threads.
 */
class ScannerApp
{
public:
  enum class Exit { Stop, Shutdown };

  /**
   * @brief Opens every device and starts the worker threads.
   *
   * Throws std::runtime_error when a device cannot be opened.
   */
  explicit ScannerApp(const Config& config);
  ~ScannerApp();

  /**
   * @brief Polls the encoder button every 10 ms until a stop is requested.
   *
   * @param running Cleared by the signal handler.
   * @return Why the loop ended.
   */
  Exit run(const std::atomic<bool>& running);

  /**
   * @brief Stops every thread, shows the exit screen and turns the LEDs off.
   *
   * @param exit Stop shows a red screen, Shutdown a blue one.
   */
  void stop(Exit exit);

private:
  void init();
  void buildSettings();
  void saveSettings();
  void displayLoop();
  void applyCameraControl(uint32_t id, double value, double lo, double def, double hi);

  const Config config;

  std::unique_ptr<DisplayDevice> display;
  GpioEventLoop gpioLoop;
  std::unique_ptr<RotaryEncoder> encoder;
  std::unique_ptr<Button> button;
  std::unique_ptr<Button> trigger;
  std::unique_ptr<TonePlayer> buzzer;
  std::unique_ptr<LedRing> led;
  std::unique_ptr<Camera> camera;
  std::unique_ptr<BarcodeDecoder> decoder;
  std::unique_ptr<HidInterface> hid;

  std::vector<std::unique_ptr<Setting>> settings;
  std::unique_ptr<SettingsStore> store;
  SettingsMenu menu;
  IntSetting* targetWidthSetting = nullptr;
  IntSetting* targetHeightSetting = nullptr;

  std::mutex uiLock;
  std::atomic<UiState> state{UiState::Idle};
  std::atomic<int> targetWidth{100};
  std::atomic<int> targetHeight{50};
  std::atomic<bool> hidEnabled{true};
  std::atomic<bool> shutdownRequested{false};
  std::mutex ledMtx;
  Color ledColor = Colors::White;

  std::unique_ptr<UserInterface> ui;
  std::unique_ptr<InputController> input;
  std::unique_ptr<BarcodeScanner> scanner;
  std::unique_ptr<VncServer> vnc;

  std::mutex frameMtx;
  Image frame;

  std::atomic<bool> displayRunning{false};
  std::thread displayThread;
  bool stopped = false;
};

// vim: set ts=2 sw=2 expandtab:
