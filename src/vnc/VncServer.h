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
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "Config.h"
#include "VncSession.h"

/**
 * @brief Accepts VNC clients and runs each session on its own thread.
 */
class VncServer
{
public:
  VncServer(const VncConfig& config, VncSession::ImageSource source);
  ~VncServer();

  /**
   * @brief Binds the listening socket and starts accepting.
   *
   * Throws std::runtime_error if the address cannot be bound.
   */
  void start();

  /**
   * @brief Stops accepting and disconnects every client.
   */
  void stop();

private:
  struct Client {
    std::unique_ptr<VncSession> session;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void accept();
  void reap();

  const VncConfig config;
  VncSession::ImageSource source;

  int listenFd = -1;
  int wakePipe[2] = {-1, -1};

  std::mutex clientsMtx;
  std::list<Client> clients;

  std::atomic<bool> run{false};
  std::thread acceptThread;
};

// vim: set ts=2 sw=2 expandtab:
