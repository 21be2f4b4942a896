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
#include <fstream>
#include <chrono>

#include "Log.h"
#include "HidInterface.h"

using namespace std;

optional<bool> readUdcSuspended(const string& classPath, const string& udc)
{
  ifstream file(classPath + "/" + udc + "/gadget/suspended");
  if (!file) return nullopt;

  string value;
  file >> value;
  if (value.empty()) return nullopt;

  return value != "0";
}

HidInterface::HidInterface(const HidConfig& config, function<bool()> checkEnabled, string classPath) :
  config(config),
  classPath(move(classPath)),
  checkEnabled(move(checkEnabled)),
  keyboard(config.path) {}

HidInterface::~HidInterface()
{
  stop();
}

void HidInterface::start()
{
  run = true;
  senderThread = thread(&HidInterface::sender, this);
  monitorThread = thread(&HidInterface::monitor, this);
  cout << "HID keyboard on " << config.path << " (UDC " << config.udc << ")" << endl;
}

void HidInterface::stop()
{
  if (!run.exchange(false)) return;
  queueCv.notify_all();
  monitorCv.notify_all();
  if (senderThread.joinable()) senderThread.join();
  if (monitorThread.joinable()) monitorThread.join();
}

void HidInterface::send(const string& data)
{
  {
    lock_guard<mutex> lock(queueMtx);
    queue.push_back(data);
  }
  queueCv.notify_one();
}

void HidInterface::sender()
{
  while (run.load()) {
    string code;

    {
      unique_lock<mutex> lock(queueMtx);
      if (!queueCv.wait_for(lock, chrono::milliseconds(100), [this]() {
            return !run.load() || !queue.empty();
          })) {
        continue;
      }
      if (!run.load()) break;

      code = queue.front();
      queue.pop_front();
    }

    if (!checkEnabled()) {
      Log::debug() << "HID output disabled, dropping barcode." << endl;
      continue;
    }

    Log::debug() << "Sending barcode over HID: " << code << endl;
    if (!keyboard.type(code, delay.load(), config.terminator)) {
      cerr << "Barcode not sent: " << code << endl;
    }
  }
}

void HidInterface::monitor()
{
  bool last = false;
  bool first = true;

  while (run.load()) {
    optional<bool> suspended = readUdcSuspended(classPath, config.udc);
    bool now = suspended.has_value() && !*suspended;
    connected = now;

    if (first || now != last) {
      cout << "USB host " << (now ? "connected" : "not connected") << "." << endl;
      last = now;
      first = false;
    }

    unique_lock<mutex> lock(monitorMtx);
    monitorCv.wait_for(lock, chrono::milliseconds(500), [this]() { return !run.load(); });
  }
}

// vim: set ts=2 sw=2 expandtab:
