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
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "Config.h"
#include "Keyboard.h"

/**
 * @brief Reads the suspended flag of the gadget bound to a UDC.
 *
 * @param classPath Normally /sys/class/udc.
 * @param udc Controller name.
 * @return True when suspended, false when awake, std::nullopt when no gadget
 *         is bound to the controller.
 */
std::optional<bool> readUdcSuspended(const std::string& classPath, const std::string& udc);

/**
 * @brief Sends decoded barcodes to the host as keyboard input.
 *
 * One thread types queued barcodes, another watches the UDC so the UI can
 * show whether a host is connected.
 */
class HidInterface
{
public:
  HidInterface(const HidConfig& config, std::function<bool()> checkEnabled,
               std::string classPath = UDC_CLASS_PATH);
  ~HidInterface();

  void start();
  void stop();

  /**
   * @brief Queues a barcode for typing.
   */
  void send(const std::string& data);

  void setDelay(double seconds) { delay = seconds; }
  double getDelay() const { return delay; }

  bool isConnected() const { return connected.load(); }

private:
  void sender();
  void monitor();

  const HidConfig config;
  const std::string classPath;
  std::function<bool()> checkEnabled;
  Keyboard keyboard;

  std::atomic<double> delay{0.0};
  std::atomic<bool> connected{false};

  std::deque<std::string> queue;
  std::mutex queueMtx;
  std::condition_variable queueCv;

  std::mutex monitorMtx;
  std::condition_variable monitorCv;

  std::atomic<bool> run{false};
  std::thread senderThread;
  std::thread monitorThread;
};

// vim: set ts=2 sw=2 expandtab:
