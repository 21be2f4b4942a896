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
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#define PWM_CLASS_PATH "/sys/class/pwm"

struct Tone {
  double frequency;   // Hz, 0 for silence
  double duration;    // Seconds
};

/**
 * @brief Plays tones on a piezo buzzer through a sysfs PWM channel.
 *
 * Tones are queued and played in order on a worker thread at 50% duty.
 */
class TonePlayer
{
public:
  TonePlayer(unsigned int chip, unsigned int channel, std::string classPath = PWM_CLASS_PATH);
  ~TonePlayer();

  /**
   * @brief Exports the PWM channel and starts the worker thread.
   *
   * Throws std::runtime_error if the channel cannot be exported.
   */
  void start();

  void stop();

  /**
   * @brief Queues a sequence of tones.
   */
  void play(const std::vector<Tone>& tones);

  /**
   * @brief PWM period for a frequency, in nanoseconds.
   */
  static unsigned long periodNs(double frequency);

private:
  void loop();
  void output(double frequency);
  bool writeAttribute(const std::string& name, const std::string& value);

  const std::string chipPath;
  const std::string channelPath;
  const unsigned int channel;

  std::deque<Tone> queue;
  std::mutex queueMtx;
  std::condition_variable queueCv;

  std::atomic<bool> run{false};
  std::thread playThread;
};

// vim: set ts=2 sw=2 expandtab:
