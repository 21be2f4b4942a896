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

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "Config.h"
#include "Image.h"
#include "Rfb.h"

#define VNC_HANDSHAKE_TIMEOUT 30
#define VNC_MIN_UPDATE_INTERVAL std::chrono::milliseconds(50)

/**
 * @brief One RFB client connection.
 *
 * Runs the handshake and then serves framebuffer updates from the image
 * source until the client disconnects. The socket is owned by the session.
 */
class VncSession
{
public:
  using ImageSource = std::function<Image()>;

  VncSession(int fd, const VncConfig& config, ImageSource source);
  ~VncSession();

  VncSession(const VncSession&) = delete;
  VncSession& operator=(const VncSession&) = delete;

  /**
   * @brief Serves the client until it disconnects or misbehaves.
   */
  void run();

  /**
   * @brief Wakes a blocked run() by shutting the socket down.
   */
  void close();

private:
  bool handshake();
  bool authenticate(int minor);
  bool sendFailure(int minor, const std::string& reason);
  bool serverInit();
  bool handleMessage(uint8_t type);
  bool sendUpdate(bool incremental, const Rect& request);

  bool readExact(void* data, size_t length);
  bool writeAll(const void* data, size_t length);
  bool writeAll(const std::vector<uint8_t>& data) { return writeAll(data.data(), data.size()); }
  void setReceiveTimeout(int seconds);

  int fd;
  const VncConfig config;
  ImageSource source;

  int width = 0;
  int height = 0;
  PixelFormat format;
  Image lastSent;
  std::chrono::steady_clock::time_point lastUpdate{};
};

// vim: set ts=2 sw=2 expandtab:
