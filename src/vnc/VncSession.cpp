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
#include <cstdio>
#include <cstring>
#include <thread>

#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>

#include "Log.h"
#include "VncAuth.h"
#include "VncSession.h"

using namespace std;

VncSession::VncSession(int fd, const VncConfig& config, ImageSource source) :
  fd(fd),
  config(config),
  source(move(source)) {}

VncSession::~VncSession()
{
  if (fd >= 0) ::close(fd);
}

void VncSession::close()
{
  if (fd >= 0) shutdown(fd, SHUT_RDWR);
}

bool VncSession::readExact(void* data, size_t length)
{
  auto* p = static_cast<uint8_t*>(data);

  while (length > 0) {
    ssize_t n = recv(fd, p, length, 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    p += n;
    length -= n;
  }

  return true;
}

bool VncSession::writeAll(const void* data, size_t length)
{
  auto* p = static_cast<const uint8_t*>(data);

  while (length > 0) {
    ssize_t n = send(fd, p, length, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    p += n;
    length -= n;
  }

  return true;
}

void VncSession::setReceiveTimeout(int seconds)
{
  timeval tv{seconds, 0};
  if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    Log::debug() << "VNC: cannot set receive timeout: " << strerror(errno) << endl;
  }
}

void VncSession::run()
{
  if (handshake()) {
    uint8_t type;
    while (readExact(&type, 1)) {
      if (!handleMessage(type)) break;
    }

    Log::debug() << "VNC: client disconnected." << endl;
  }
  else {
    cerr << "VNC: error negotiating client init." << endl;
  }

  close();
}

bool VncSession::sendFailure(int minor, const string& reason)
{
  vector<uint8_t> out;
  putU32(out, 1);

  if (minor >= 8) {
    putU32(out, static_cast<uint32_t>(reason.size()));
    out.insert(out.end(), reason.begin(), reason.end());
  }

  writeAll(out);
  return false;
}

bool VncSession::handshake()
{
  setReceiveTimeout(VNC_HANDSHAKE_TIMEOUT);

  if (!writeAll(RFB_VERSION, RFB_VERSION_LEN)) return false;

  char version[RFB_VERSION_LEN + 1] = {0};
  if (!readExact(version, RFB_VERSION_LEN)) return false;

  int major = 0, minor = 0;
  if (sscanf(version, "RFB %3d.%3d\n", &major, &minor) != 2 || major != 3) {
    cerr << "VNC: bad protocol version from client." << endl;
    return false;
  }

  Log::debug() << "VNC: client protocol 3." << minor << endl;

  if (!authenticate(minor)) return false;

  uint8_t shared;
  if (!readExact(&shared, 1)) return false;

  if (!serverInit()) return false;

  setReceiveTimeout(0);
  return true;
}

bool VncSession::authenticate(int minor)
{
  uint8_t offered = config.password.empty() ? RFB_SEC_NONE : RFB_SEC_VNC_AUTH;

  if (minor < 7) {
    // 3.3: the server decides.
    vector<uint8_t> out;
    putU32(out, offered);
    if (!writeAll(out)) return false;
  }
  else {
    uint8_t types[2] = {1, offered};
    if (!writeAll(types, sizeof(types))) return false;

    uint8_t chosen;
    if (!readExact(&chosen, 1)) return false;

    if (chosen != offered) {
      cerr << "VNC: incompatible security type " << int(chosen) << endl;
      return sendFailure(minor, "Incompatible security type");
    }
  }

  if (offered == RFB_SEC_VNC_AUTH) {
    VncChallenge challenge = makeVncChallenge();
    VncChallenge response;

    if (!writeAll(challenge.data(), challenge.size())) return false;
    if (!readExact(response.data(), response.size())) return false;

    if (response != vncAuthResponse(config.password, challenge)) {
      cerr << "VNC: authentication failed." << endl;
      return sendFailure(minor, "Auth failed.");
    }
  }
  else if (minor < 8) {
    return true;
  }

  vector<uint8_t> ok;
  putU32(ok, 0);
  return writeAll(ok);
}

bool VncSession::serverInit()
{
  Image screen = source();
  width = screen.getWidth();
  height = screen.getHeight();
  format = PixelFormat();

  vector<uint8_t> out;
  putU16(out, static_cast<uint16_t>(width));
  putU16(out, static_cast<uint16_t>(height));
  format.serialize(out);
  putU32(out, static_cast<uint32_t>(config.title.size()));
  out.insert(out.end(), config.title.begin(), config.title.end());

  return writeAll(out);
}

bool VncSession::handleMessage(uint8_t type)
{
  uint8_t buf[19];

  switch (type) {
  case RFB_SET_PIXEL_FORMAT: {
    if (!readExact(buf, 19)) return false;
    format = PixelFormat::parse(buf + 3);

    if (format.bitsPerPixel != 8 && format.bitsPerPixel != 16 && format.bitsPerPixel != 32) {
      cerr << "VNC: unsupported pixel format " << int(format.bitsPerPixel) << " bpp." << endl;
      return false;
    }

    Log::debug() << "VNC: pixel format " << int(format.bitsPerPixel) << " bpp"
                 << (format.trueColour ? "" : " colour map") << endl;

    // Force a full update in the new format.
    lastSent = Image();

    if (!format.trueColour) return writeAll(bgr233ColourMap());
    return true;
  }

  case RFB_SET_ENCODINGS: {
    if (!readExact(buf, 3)) return false;
    uint16_t count = getU16(buf + 1);
    vector<uint8_t> encodings(static_cast<size_t>(count) * 4);
    return readExact(encodings.data(), encodings.size());
  }

  case RFB_FB_UPDATE_REQUEST: {
    if (!readExact(buf, 9)) return false;
    Rect request{getU16(buf + 1), getU16(buf + 3), getU16(buf + 5), getU16(buf + 7)};
    return sendUpdate(buf[0] != 0, request);
  }

  case RFB_KEY_EVENT:
    return readExact(buf, 7);

  case RFB_POINTER_EVENT:
    return readExact(buf, 5);

  case RFB_CLIENT_CUT_TEXT: {
    if (!readExact(buf, 7)) return false;
    uint32_t length = getU32(buf + 3);
    vector<uint8_t> text(length);
    return readExact(text.data(), text.size());
  }

  default:
    cerr << "VNC: unknown message type " << int(type) << endl;
    return false;
  }
}

bool VncSession::sendUpdate(bool incremental, const Rect& request)
{
  vector<uint8_t> out;
  out.push_back(RFB_FB_UPDATE);
  out.push_back(0);

  // Clients ask again as soon as an update arrives, so empty replies are
  // held back for the rest of the update interval.
  auto now = chrono::steady_clock::now();
  if (now - lastUpdate < VNC_MIN_UPDATE_INTERVAL) {
    this_thread::sleep_for(lastUpdate + VNC_MIN_UPDATE_INTERVAL - now);
    putU16(out, 0);
    return writeAll(out);
  }
  lastUpdate = now;

  Image screen = source();
  if (screen.getWidth() != width || screen.getHeight() != height) {
    screen = screen.resized(width, height);
  }

  Rect area = clipRect(request, width, height);
  if (incremental && !lastSent.empty()) {
    area = diffBounds(screen, lastSent, area);
  }

  if (area.empty()) {
    this_thread::sleep_for(VNC_MIN_UPDATE_INTERVAL);
    putU16(out, 0);
    return writeAll(out);
  }

  putU16(out, 1);
  putU16(out, static_cast<uint16_t>(area.x));
  putU16(out, static_cast<uint16_t>(area.y));
  putU16(out, static_cast<uint16_t>(area.width));
  putU16(out, static_cast<uint16_t>(area.height));
  putU32(out, RFB_ENCODING_RAW);
  encodeRaw(screen, area, format, out);

  if (lastSent.empty()) lastSent = Image(width, height);
  lastSent.paste(screen.crop(area), area.x, area.y);

  Log::trace() << "VNC: update " << area.width << "x" << area.height
               << " at " << area.x << "," << area.y << endl;
  return writeAll(out);
}

// vim: set ts=2 sw=2 expandtab:
