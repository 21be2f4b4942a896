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
#include <chrono>

#include <linux/videodev2.h>

#include "Log.h"
#include "ScannerApp.h"

using namespace std;

ScannerApp::ScannerApp(const Config& config) : config(config)
{
  // The destructor does not run for a partly built app, so worker threads
  // already started must be stopped here before the members go away.
  try {
    init();
  }
  catch (...) {
    stop(Exit::Stop);
    throw;
  }
}

void ScannerApp::init()
{
  display = DisplayDevice::create(config);
  if (!display) {
    throw runtime_error("Unknown display type: " + config.display.type);
  }
  Log::debug() << "Display initialized" << endl;

  encoder = make_unique<RotaryEncoder>(config.gpioChip, config.encoderPinA, config.encoderPinB);
  button = make_unique<Button>(config.gpioChip, config.encoderButton);
  trigger = make_unique<Button>(config.gpioChip, config.trigger);
  Log::debug() << "Encoder and buttons initialized" << endl;

  buzzer = make_unique<TonePlayer>(config.buzzerPwmChip, config.buzzerPwmChannel);
  buzzer->start();
  Log::debug() << "Buzzer initialized (GPIO" << config.buzzerPin << ")" << endl;

  led = make_unique<LedRing>(config.ledSpiDevice, config.ledCount);
  Log::debug() << "LED initialized" << endl;

  camera = make_unique<Camera>(config.cameraDevice, config.cameraWidth, config.cameraHeight);
  camera->start();
  decoder = make_unique<BarcodeDecoder>(config.symbologies);
  Log::debug() << "Camera initialized" << endl;

  hid = make_unique<HidInterface>(config.hid, [this]() { return hidEnabled.load(); });
  hid->start();

  buildSettings();
  store = make_unique<SettingsStore>(config.settingsFile);

  vector<Setting*> flat = flattenSettings(menu.getRoot());
  int restored = store->load(flat);
  Log::debug() << "Restored " << restored << " setting(s) from " << store->getPath() << endl;

  for (Setting* setting : flat) {
    if (setting->kind() != Setting::Kind::Action) setting->apply();
  }
  Log::debug() << "Settings initialized" << endl;

  ui = make_unique<UserInterface>(config.gui, display->width(), display->height());
  input = make_unique<InputController>(state, menu, uiLock, targetWidthSetting, targetHeightSetting,
                                       [this]() { saveSettings(); }, button->getHoldTime());

  encoder->onRotate([this](int delta) { input->onEncoder(delta); });
  button->onPress([this]() { input->onButtonPress(); });
  trigger->onPress([this]() { input->onTriggerPress(); });
  trigger->onRelease([this]() { input->onTriggerRelease(); });

  encoder->attach(gpioLoop);
  button->attach(gpioLoop);
  trigger->attach(gpioLoop);
  gpioLoop.start();
  Log::debug() << "UI loaded" << endl;

  buzzer->play({{523, 0.3}, {659, 0.3}, {784, 0.3}, {1047, 0.3}});

  frame = Image(display->width(), display->height());

  if (config.vnc.enable) {
    vnc = make_unique<VncServer>(config.vnc, [this]() {
      lock_guard<mutex> lock(frameMtx);
      return frame;
    });
    vnc->start();
  }

  ScanGeometry geometry(display->width(), display->height(), config.gui.toolbarHeight,
                        camera->getWidth(), camera->getHeight());
  scanner = make_unique<BarcodeScanner>(*camera, *decoder, geometry, state, targetWidth, targetHeight);
  scanner->onBarcode([this](const Barcode& barcode) {
    buzzer->play({{3000, 0.1}, {4000, 0.1}});
    if (hidEnabled.load()) hid->send(barcode.data);
  });
  scanner->start();

  displayRunning = true;
  displayThread = thread(&ScannerApp::displayLoop, this);

  cout << "Threads started" << endl;
}

ScannerApp::~ScannerApp()
{
  stop(Exit::Stop);
}

void ScannerApp::applyCameraControl(uint32_t id, double value, double lo, double def, double hi)
{
  if (!camera->setControl(id, value, lo, def, hi)) {
    Log::debug() << "Camera control 0x" << hex << id << dec << " skipped." << endl;
  }
}

void ScannerApp::buildSettings()
{
  settings.push_back(make_unique<OptionSetting>(
    "connection", "Connection", vector<string>{"USB", "NONE"}, "USB",
    [this](const string& value) {
      cout << "Connection set to " << value << endl;
      hidEnabled = value == "USB";
    }));

  auto cameraGroup = make_unique<GroupSetting>("camera", "Camera Settings");
  cameraGroup->add(make_unique<FloatSetting>(
    "brightness", "Brightness", -1.0, 1.0, 0.0,
    [this](double v) { applyCameraControl(V4L2_CID_BRIGHTNESS, v, -1.0, 0.0, 1.0); }));
  cameraGroup->add(make_unique<FloatSetting>(
    "contrast", "Contrast", 0.0, 2.0, 1.0,
    [this](double v) { applyCameraControl(V4L2_CID_CONTRAST, v, 0.0, 1.0, 2.0); }));
  cameraGroup->add(make_unique<FloatSetting>(
    "exposure", "Exposure", -8.0, 8.0, 0.0,
    [this](double v) { applyCameraControl(V4L2_CID_AUTO_EXPOSURE_BIAS, v, -8.0, 0.0, 8.0); }));
  cameraGroup->add(make_unique<FloatSetting>(
    "gain", "Gain", 0.0, 16.0, 1.0,
    [this](double v) {
      if (!camera->setControl(V4L2_CID_ANALOGUE_GAIN, v, 0.0, 1.0, 16.0)) {
        applyCameraControl(V4L2_CID_GAIN, v, 0.0, 1.0, 16.0);
      }
    },
    2, 0.1));
  cameraGroup->add(make_unique<IntSetting>(
    "ae", "AEC/AGC", 0, 1, 1,
    [this](int v) { camera->setAutoExposure(v != 0); },
    1));
  cameraGroup->add(make_unique<FloatSetting>(
    "sharpness", "Sharpness", 0.0, 16.0, 0.0,
    [this](double v) { applyCameraControl(V4L2_CID_SHARPNESS, v, 0.0, 0.0, 16.0); }));
  cameraGroup->add(make_unique<FloatSetting>(
    "saturation", "Saturation", 0.0, 16.0, 0.0,
    [this](double v) { applyCameraControl(V4L2_CID_SATURATION, v, 0.0, 0.0, 16.0); }));
  settings.push_back(move(cameraGroup));

  auto ledGroup = make_unique<GroupSetting>("led", "LED Control");
  ledGroup->add(make_unique<FloatSetting>(
    "led", "LED Bright", 0.0, 1.0, 0.2,
    [this](double v) {
      cout << "Set LED brightness to " << v << endl;
      led->setBrightness(v);
    },
    2, 0.05));

  auto ledChannel = [this](uint8_t Color::*channel, const char* name) {
    return [this, channel, name](int v) {
      Log::debug() << "Set LED " << name << " to " << v << endl;
      lock_guard<mutex> lock(ledMtx);
      ledColor.*channel = static_cast<uint8_t>(v);
      led->setColor(ledColor);
    };
  };

  ledGroup->add(make_unique<IntSetting>("led_red", "LED Red", 0, 255, 255, ledChannel(&Color::r, "red"), 5));
  ledGroup->add(make_unique<IntSetting>("led_green", "LED Green", 0, 255, 255, ledChannel(&Color::g, "green"), 5));
  ledGroup->add(make_unique<IntSetting>("led_blue", "LED Blue", 0, 255, 255, ledChannel(&Color::b, "blue"), 5));
  settings.push_back(move(ledGroup));

  int w = display->width();
  int h = display->height();

  auto targetGroup = make_unique<GroupSetting>("target", "Target Settings");
  targetWidthSetting = targetGroup->add(make_unique<IntSetting>(
    "tgt_width", "Target Width", w / 6, static_cast<int>(w / 1.2), w / 2,
    [this](int v) {
      cout << "Set target width to " << v << endl;
      targetWidth = v;
    },
    1));
  targetHeightSetting = targetGroup->add(make_unique<IntSetting>(
    "tgt_height", "Target Height", h / 6, static_cast<int>(h / 1.2), h / 3,
    [this](int v) {
      cout << "Set target height to " << v << endl;
      targetHeight = v;
    },
    1));
  settings.push_back(move(targetGroup));

  auto hidGroup = make_unique<GroupSetting>("hid", "HID Settings");
  hidGroup->add(make_unique<FloatSetting>(
    "hid_delay", "Key Delay", 0.0, 1.0, 0.0,
    [this](double v) { hid->setDelay(v); },
    2, 0.01, "s"));
  settings.push_back(move(hidGroup));

  settings.push_back(make_unique<ActionSetting>(
    "shutdown", "Shutdown",
    [this]() { shutdownRequested = true; }));

  vector<Setting*> root;
  for (auto& setting : settings) root.push_back(setting.get());
  menu.setRoot(root);
}

void ScannerApp::saveSettings()
{
  if (store->save(flattenSettings(menu.getRoot()))) {
    Log::debug() << "Settings saved" << endl;
  }
}

void ScannerApp::displayLoop()
{
  const auto frameTime = chrono::microseconds(1000000 / DISPLAY_FPS);

  while (displayRunning.load()) {
    auto start = chrono::steady_clock::now();
    Image image;

    try {
      Image viewfinder = scanner->viewfinder();
      UiParams params{config.gui.toolbarHeight, targetWidth.load(), targetHeight.load(), config.gui.menuItems};
      bool showConnection = hidEnabled.load();

      {
        lock_guard<mutex> lock(uiLock);
        image = ui->draw(viewfinder, menu, showConnection, hid->isConnected(), params, state.load());
      }

      if (vnc) {
        lock_guard<mutex> lock(frameMtx);
        frame = image;
      }

      display->show(image);
    }
    catch (const runtime_error& e) {
      cerr << "Display update failed: " << e.what() << endl;
    }

    this_thread::sleep_until(start + frameTime);

    double elapsed = chrono::duration<double>(chrono::steady_clock::now() - start).count();
    Log::trace() << "FPS: " << 1.0 / elapsed << endl;
  }
}

ScannerApp::Exit ScannerApp::run(const atomic<bool>& running)
{
  while (running.load()) {
    input->poll(InputController::Clock::now(), button->isPressed());
    this_thread::sleep_for(chrono::milliseconds(10));

    if (shutdownRequested.load()) return Exit::Shutdown;
  }

  return Exit::Stop;
}

void ScannerApp::stop(Exit exit)
{
  if (stopped) return;
  stopped = true;

  cout << "Shutting down" << endl;
  state = UiState::Null;

  gpioLoop.stop();
  if (scanner) scanner->stop();

  if (displayRunning.exchange(false) && displayThread.joinable()) displayThread.join();

  if (vnc) vnc->stop();
  if (hid) hid->stop();
  if (buzzer) buzzer->stop();
  if (camera) camera->stop();

  cout << "Threads stopped" << endl;

  try {
    if (display) {
      Color background = exit == Exit::Shutdown ? Colors::Blue : Colors::Red;
      display->show(UserInterface::exitScreen(display->width(), display->height(), background));
    }
  }
  catch (const runtime_error& e) {
    cerr << "Failed to show exit screen: " << e.what() << endl;
  }

  if (led) led->off();
}

// vim: set ts=2 sw=2 expandtab:
