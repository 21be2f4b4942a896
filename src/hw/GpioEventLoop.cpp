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
#include <cerrno>
#include <stdexcept>

#include <unistd.h>
#include <sys/select.h>

#include "GpioEventLoop.h"

using namespace std;

GpioEventLoop::GpioEventLoop()
{
  if (pipe(wakePipe) == -1) {
    throw runtime_error("Failed to create wake pipe.");
  }
}

GpioEventLoop::~GpioEventLoop()
{
  stop();
  if (wakePipe[0] >= 0) close(wakePipe[0]);
  if (wakePipe[1] >= 0) close(wakePipe[1]);
}

void GpioEventLoop::add(GpioLine& line, Handler handler)
{
  watches.push_back({&line, move(handler)});
}

void GpioEventLoop::start()
{
  run = true;
  eventThread = thread(&GpioEventLoop::loop, this);
}

void GpioEventLoop::stop()
{
  if (!run.exchange(false)) return;
  if (write(wakePipe[1], "", 1) < 0) cerr << "Failed to wake GPIO thread." << endl;
  if (eventThread.joinable()) eventThread.join();
}

void GpioEventLoop::loop()
{
  while (run.load()) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(wakePipe[0], &readfds);

    int maxFd = wakePipe[0];
    for (const auto& watch : watches) {
      FD_SET(watch.line->getFd(), &readfds);
      maxFd = max(maxFd, watch.line->getFd());
    }

    int rc = select(maxFd + 1, &readfds, nullptr, nullptr, nullptr);
    if (rc < 0) {
      if (errno == EINTR) continue;
      cerr << "GPIO select failed." << endl;
      break;
    }

    // Break loop if wakePipe[1] is written to.
    if (FD_ISSET(wakePipe[0], &readfds)) break;

    for (auto& watch : watches) {
      if (!FD_ISSET(watch.line->getFd(), &readfds)) continue;

      GpioEdge edge;
      if (!watch.line->readEdge(edge)) continue;

      try {
        watch.handler(edge);
      }
      catch (const exception& e) {
        cerr << "GPIO" << edge.pin << " handler failed: " << e.what() << endl;
      }
    }
  }
}

// vim: set ts=2 sw=2 expandtab:
