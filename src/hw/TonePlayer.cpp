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
#include <cmath>
#include <stdexcept>

#include <sys/stat.h>

#include "Log.h"
#include "TonePlayer.h"

using namespace std;

static bool exists(const string& path)
{
  struct stat buf;
  return stat(path.c_str(), &buf) == 0;
}

TonePlayer::TonePlayer(unsigned int chip, unsigned int channel, string classPath) :
  chipPath(classPath + "/pwmchip" + to_string(chip)),
  channelPath(chipPath + "/pwm" + to_string(channel)),
  channel(channel) {}

TonePlayer::~TonePlayer()
{
  stop();
}

unsigned long TonePlayer::periodNs(double frequency)
{
  if (frequency <= 0) return 0;
  return static_cast<unsigned long>(lround(1e9 / frequency));
}

bool TonePlayer::writeAttribute(const string& name, const string& value)
{
  ofstream out(channelPath + "/" + name);
  out << value;
  out.flush();

  if (!out) {
    cerr << "Failed to write " << channelPath << "/" << name << endl;
    return false;
  }

  return true;
}

void TonePlayer::start()
{
  if (!exists(channelPath)) {
    ofstream exportFile(chipPath + "/export");
    exportFile << channel;
    exportFile.flush();

    if (!exportFile) {
      throw runtime_error("Cannot export PWM channel " + channelPath);
    }

    // udev needs a moment to hand out the new attributes.
    for (int i = 0; i < 20 && !exists(channelPath + "/period"); i++) {
      this_thread::sleep_for(chrono::milliseconds(50));
    }
  }

  writeAttribute("enable", "0");

  run = true;
  playThread = thread(&TonePlayer::loop, this);
  Log::debug() << "Buzzer on " << channelPath << endl;
}

void TonePlayer::stop()
{
  if (!run.exchange(false)) return;
  queueCv.notify_one();
  if (playThread.joinable()) playThread.join();
  output(0);
}

void TonePlayer::play(const vector<Tone>& tones)
{
  {
    lock_guard<mutex> lock(queueMtx);
    queue.insert(queue.end(), tones.begin(), tones.end());
  }
  queueCv.notify_one();
}

void TonePlayer::output(double frequency)
{
  unsigned long period = periodNs(frequency);

  if (period == 0) {
    writeAttribute("enable", "0");
    return;
  }

  // The duty cycle must never exceed the period, including the old one.
  writeAttribute("duty_cycle", "0");
  writeAttribute("period", to_string(period));
  writeAttribute("duty_cycle", to_string(period / 2));
  writeAttribute("enable", "1");
}

void TonePlayer::loop()
{
  while (run.load()) {
    Tone tone{0, 0};

    {
      unique_lock<mutex> lock(queueMtx);
      queueCv.wait(lock, [this]() { return !run.load() || !queue.empty(); });
      if (!run.load()) break;

      tone = queue.front();
      queue.pop_front();
    }

    output(tone.frequency);
    this_thread::sleep_for(chrono::duration<double>(tone.duration));

    bool more;
    {
      lock_guard<mutex> lock(queueMtx);
      more = !queue.empty();
    }
    if (!more) output(0);
  }
}

// vim: set ts=2 sw=2 expandtab:
