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
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

#include "Keyboard.h"

using namespace std;

static const char* unshiftedPunct = "-=[]\\;'`,./";
static const char* shiftedPunct = "_+{}|:\"~<>?";
static const uint8_t punctKeys[] = {0x2D, 0x2E, 0x2F, 0x30, 0x31, 0x33, 0x34, 0x35, 0x36, 0x37, 0x38};
static const char* shiftedDigits = ")!@#$%^&*(";

optional<KeyStroke> keyForChar(char c)
{
  if (c >= 'a' && c <= 'z') return KeyStroke{0, uint8_t(0x04 + c - 'a')};
  if (c >= 'A' && c <= 'Z') return KeyStroke{HID_MOD_LSHIFT, uint8_t(0x04 + c - 'A')};
  if (c >= '1' && c <= '9') return KeyStroke{0, uint8_t(0x1E + c - '1')};
  if (c == '0') return KeyStroke{0, 0x27};

  switch (c) {
  case '\n': return KeyStroke{0, HID_KEY_ENTER};
  case '\t': return KeyStroke{0, HID_KEY_TAB};
  case ' ': return KeyStroke{0, 0x2C};
  default: break;
  }

  if (c == '\0') return nullopt;

  if (const char* p = strchr(shiftedDigits, c)) {
    int digit = static_cast<int>(p - shiftedDigits);
    return KeyStroke{HID_MOD_LSHIFT, uint8_t(digit == 0 ? 0x27 : 0x1E + digit - 1)};
  }

  if (const char* p = strchr(unshiftedPunct, c)) {
    return KeyStroke{0, punctKeys[p - unshiftedPunct]};
  }

  if (const char* p = strchr(shiftedPunct, c)) {
    return KeyStroke{HID_MOD_LSHIFT, punctKeys[p - shiftedPunct]};
  }

  return nullopt;
}

vector<HidReport> buildReports(const string& text, const string& terminator)
{
  vector<HidReport> reports;
  const HidReport release{};

  auto press = [&](const KeyStroke& stroke) {
    HidReport report{};
    report[0] = stroke.modifier;
    report[2] = stroke.key;
    reports.push_back(report);
    reports.push_back(release);
  };

  for (char c : text) {
    if (auto stroke = keyForChar(c)) {
      press(*stroke);
    }
    else {
      cerr << "No US keyboard key for character 0x" << hex << (static_cast<unsigned>(c) & 0xFF) << dec
           << ", skipped." << endl;
    }
  }

  if (terminator == "enter") press({0, HID_KEY_ENTER});
  else if (terminator == "tab") press({0, HID_KEY_TAB});

  return reports;
}

bool Keyboard::type(const string& text, double delay, const string& terminator)
{
  vector<HidReport> reports = buildReports(text, terminator);

  int fd = open(path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    cerr << "Failed to open HID interface " << path << ": " << strerror(errno) << endl;
    return false;
  }

  bool ok = true;

  for (size_t i = 0; i < reports.size(); i++) {
    ssize_t n = write(fd, reports[i].data(), reports[i].size());

    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      cerr << "Failed to write to HID interface: " << path
           << ". Is USB cable connected and Gadget module installed?" << endl;
      ok = false;
      break;
    }

    if (n != static_cast<ssize_t>(reports[i].size())) {
      cerr << "Failed to write to HID interface: " << path << ": " << strerror(errno) << endl;
      ok = false;
      break;
    }

    // Delay after each release report, i.e. between key strokes.
    if (delay > 0 && i % 2 == 1) {
      this_thread::sleep_for(chrono::duration<double>(delay));
    }
  }

  close(fd);
  return ok;
}

// vim: set ts=2 sw=2 expandtab:
