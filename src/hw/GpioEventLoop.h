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
#include <functional>
#include <thread>
#include <vector>

#include "GpioLine.h"

/**
 * @brief Waits for edges on input lines and dispatches them on one thread.
 */
class GpioEventLoop
{
public:
  using Handler = std::function<void(const GpioEdge&)>;

  GpioEventLoop();
  ~GpioEventLoop();

  /**
   * @brief Registers a line. Must be called before start().
   *
   * The line must outlive the loop.
   */
  void add(GpioLine& line, Handler handler);

  void start();
  void stop();

private:
  void loop();

  struct Watch {
    GpioLine* line;
    Handler handler;
  };

  std::vector<Watch> watches;
  int wakePipe[2] = {-1, -1};

  std::atomic<bool> run{false};
  std::thread eventThread;
};

// vim: set ts=2 sw=2 expandtab:
