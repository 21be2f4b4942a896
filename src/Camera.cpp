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
#include <cmath>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <linux/videodev2.h>

#include "Log.h"
#include "Camera.h"

#define CAMERA_BUFFERS 4

using namespace std;

static int xioctl(int fd, unsigned long request, void* arg)
{
  int r;
  do {
    r = ioctl(fd, request, arg);
  } while (r == -1 && errno == EINTR);
  return r;
}

static string fourcc(uint32_t f)
{
  string s(4, ' ');
  for (int i = 0; i < 4; i++) s[i] = static_cast<char>((f >> (8 * i)) & 0xff);
  return s;
}

static uint8_t clampByte(int v)
{
  return static_cast<uint8_t>(clamp(v, 0, 255));
}

Color Frame::pixel(int x, int y) const
{
  const uint8_t* row = &data[static_cast<size_t>(y) * stride];

  switch (format) {
  case V4L2_PIX_FMT_YUYV: {
    const uint8_t* pair = row + (x & ~1) * 2;
    int c = row[x * 2] - 16;
    int d = pair[1] - 128;
    int e = pair[3] - 128;
    return {clampByte((298 * c + 409 * e + 128) >> 8),
            clampByte((298 * c - 100 * d - 208 * e + 128) >> 8),
            clampByte((298 * c + 516 * d + 128) >> 8)};
  }
  case V4L2_PIX_FMT_RGB24:
    return {row[x * 3], row[x * 3 + 1], row[x * 3 + 2]};
  case V4L2_PIX_FMT_BGR24:
    return {row[x * 3 + 2], row[x * 3 + 1], row[x * 3]};
  case V4L2_PIX_FMT_GREY:
    return {row[x], row[x], row[x]};
  default:
    return Colors::Black;
  }
}

uint8_t Frame::luma(int x, int y) const
{
  const uint8_t* row = &data[static_cast<size_t>(y) * stride];

  switch (format) {
  case V4L2_PIX_FMT_YUYV:
    return row[x * 2];
  case V4L2_PIX_FMT_GREY:
    return row[x];
  default: {
    Color c = pixel(x, y);
    return static_cast<uint8_t>((77 * c.r + 150 * c.g + 29 * c.b) >> 8);
  }
  }
}

Image Frame::preview(int previewWidth, int previewHeight) const
{
  Image out(previewWidth, previewHeight);
  if (width == 0 || height == 0) return out;

  for (int y = 0; y < previewHeight; y++) {
    int sy = static_cast<int>(static_cast<int64_t>(y) * height / previewHeight);
    for (int x = 0; x < previewWidth; x++) {
      int sx = static_cast<int>(static_cast<int64_t>(x) * width / previewWidth);
      out.set(x, y, pixel(sx, sy));
    }
  }

  return out;
}

GrayImage Frame::gray(const Rect& rect) const
{
  int x0 = clamp(rect.x, 0, width);
  int y0 = clamp(rect.y, 0, height);
  int x1 = clamp(rect.right(), 0, width);
  int y1 = clamp(rect.bottom(), 0, height);

  GrayImage out;
  out.width = max(x1 - x0, 0);
  out.height = max(y1 - y0, 0);
  out.data.resize(static_cast<size_t>(out.width) * out.height);

  size_t i = 0;
  for (int y = y0; y < y1; y++) {
    for (int x = x0; x < x1; x++) out.data[i++] = luma(x, y);
  }

  return out;
}

int32_t mapControlValue(double value, double lo, double neutral, double hi, const ControlRange& range)
{
  value = clamp(value, lo, hi);
  double mapped;

  if (value >= neutral) {
    double span = hi - neutral;
    mapped = range.defaultValue + (span > 0 ? (value - neutral) / span : 0) * (range.maximum - range.defaultValue);
  }
  else {
    double span = neutral - lo;
    mapped = range.defaultValue - (span > 0 ? (neutral - value) / span : 0) * (range.defaultValue - range.minimum);
  }

  return clamp(static_cast<int32_t>(lround(mapped)), range.minimum, range.maximum);
}

Camera::Camera(string device, int width, int height) :
  device(move(device)),
  width(width),
  height(height) {}

Camera::~Camera()
{
  stop();
}

void Camera::start()
{
  fd = open(device.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    throw runtime_error("Cannot open camera " + device + ": " + strerror(errno));
  }

  v4l2_capability cap{};
  if (xioctl(fd, VIDIOC_QUERYCAP, &cap) == -1 ||
      !(cap.capabilities & V4L2_CAP_VIDEO_CAPTURE) ||
      !(cap.capabilities & V4L2_CAP_STREAMING)) {
    stop();
    throw runtime_error(device + " is not a streaming capture device.");
  }

  Log::debug() << "Camera: " << reinterpret_cast<const char*>(cap.card) << endl;

  v4l2_format fmt{};
  fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  fmt.fmt.pix.width = width;
  fmt.fmt.pix.height = height;
  fmt.fmt.pix.pixelformat = V4L2_PIX_FMT_YUYV;
  fmt.fmt.pix.field = V4L2_FIELD_NONE;

  if (xioctl(fd, VIDIOC_S_FMT, &fmt) == -1) {
    stop();
    throw runtime_error("Cannot set camera format: " + string(strerror(errno)));
  }

  format = fmt.fmt.pix.pixelformat;
  if (format != V4L2_PIX_FMT_YUYV && format != V4L2_PIX_FMT_RGB24 &&
      format != V4L2_PIX_FMT_BGR24 && format != V4L2_PIX_FMT_GREY) {
    stop();
    throw runtime_error("Unsupported camera pixel format " + fourcc(format));
  }

  if (static_cast<int>(fmt.fmt.pix.width) != width || static_cast<int>(fmt.fmt.pix.height) != height) {
    cerr << "Camera resolution " << width << "x" << height << " not available, using "
         << fmt.fmt.pix.width << "x" << fmt.fmt.pix.height << endl;
    width = fmt.fmt.pix.width;
    height = fmt.fmt.pix.height;
  }

  stride = fmt.fmt.pix.bytesperline;

  v4l2_requestbuffers req{};
  req.count = CAMERA_BUFFERS;
  req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  req.memory = V4L2_MEMORY_MMAP;

  if (xioctl(fd, VIDIOC_REQBUFS, &req) == -1 || req.count < 2) {
    stop();
    throw runtime_error("Cannot allocate camera buffers.");
  }

  for (uint32_t i = 0; i < req.count; i++) {
    v4l2_buffer buf{};
    buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;
    buf.index = i;

    if (xioctl(fd, VIDIOC_QUERYBUF, &buf) == -1) {
      stop();
      throw runtime_error("Cannot query camera buffer.");
    }

    void* start = mmap(nullptr, buf.length, PROT_READ | PROT_WRITE, MAP_SHARED, fd, buf.m.offset);
    if (start == MAP_FAILED) {
      stop();
      throw runtime_error("Cannot map camera buffer.");
    }

    buffers.push_back({start, buf.length});

    if (xioctl(fd, VIDIOC_QBUF, &buf) == -1) {
      stop();
      throw runtime_error("Cannot queue camera buffer.");
    }
  }

  v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (xioctl(fd, VIDIOC_STREAMON, &type) == -1) {
    stop();
    throw runtime_error("Cannot start camera stream: " + string(strerror(errno)));
  }

  streaming = true;
  cout << "Camera started: " << width << "x" << height << " " << fourcc(format) << endl;
}

void Camera::releaseBuffers()
{
  for (auto& buffer : buffers) munmap(buffer.start, buffer.length);
  buffers.clear();
}

void Camera::stop()
{
  if (fd < 0) return;

  if (streaming) {
    v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    if (xioctl(fd, VIDIOC_STREAMOFF, &type) == -1) {
      cerr << "Failed to stop camera stream: " << strerror(errno) << endl;
    }
    streaming = false;
  }

  releaseBuffers();
  close(fd);
  fd = -1;
}

bool Camera::capture(Frame& frame, int timeoutMs)
{
  if (!streaming) return false;

  pollfd pfd{fd, POLLIN, 0};
  int rc = poll(&pfd, 1, timeoutMs);
  if (rc <= 0) {
    if (rc < 0 && errno != EINTR) cerr << "Camera poll failed: " << strerror(errno) << endl;
    return false;
  }

  v4l2_buffer buf{};
  buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  buf.memory = V4L2_MEMORY_MMAP;

  if (xioctl(fd, VIDIOC_DQBUF, &buf) == -1) {
    if (errno != EAGAIN) cerr << "Camera dequeue failed: " << strerror(errno) << endl;
    return false;
  }

  const uint8_t* start = static_cast<const uint8_t*>(buffers[buf.index].start);
  size_t used = min<size_t>(buf.bytesused, buffers[buf.index].length);

  frame.width = width;
  frame.height = height;
  frame.format = format;
  frame.stride = stride;
  frame.data.assign(start, start + used);

  if (xioctl(fd, VIDIOC_QBUF, &buf) == -1) {
    cerr << "Camera requeue failed: " << strerror(errno) << endl;
  }

  return frame.data.size() >= static_cast<size_t>(stride) * height;
}

bool Camera::queryControl(uint32_t id, ControlRange& range)
{
  v4l2_queryctrl query{};
  query.id = id;

  if (xioctl(fd, VIDIOC_QUERYCTRL, &query) == -1 || (query.flags & V4L2_CTRL_FLAG_DISABLED)) {
    return false;
  }

  range = {query.minimum, query.maximum, query.default_value};
  return true;
}

bool Camera::writeControl(uint32_t id, int32_t value)
{
  v4l2_control control{};
  control.id = id;
  control.value = value;

  if (xioctl(fd, VIDIOC_S_CTRL, &control) == -1) {
    Log::debug() << "Camera control 0x" << hex << id << dec << " rejected: " << strerror(errno) << endl;
    return false;
  }

  return true;
}

bool Camera::setControl(uint32_t id, double value, double lo, double neutral, double hi)
{
  if (fd < 0) return false;

  ControlRange range;
  if (!queryControl(id, range)) {
    Log::debug() << "Camera control 0x" << hex << id << dec << " not supported." << endl;
    return false;
  }

  return writeControl(id, mapControlValue(value, lo, neutral, hi, range));
}

void Camera::setAutoExposure(bool enable)
{
  if (fd < 0) return;

  ControlRange range;

  if (queryControl(V4L2_CID_EXPOSURE_AUTO, range)) {
    if (!enable) {
      writeControl(V4L2_CID_EXPOSURE_AUTO, V4L2_EXPOSURE_MANUAL);
    }
    else if (!writeControl(V4L2_CID_EXPOSURE_AUTO, V4L2_EXPOSURE_AUTO)) {
      writeControl(V4L2_CID_EXPOSURE_AUTO, V4L2_EXPOSURE_APERTURE_PRIORITY);
    }
  }

  if (queryControl(V4L2_CID_AUTOGAIN, range)) {
    writeControl(V4L2_CID_AUTOGAIN, enable ? 1 : 0);
  }
}

// vim: set ts=2 sw=2 expandtab:
