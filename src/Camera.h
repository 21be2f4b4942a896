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

#include <cstdint>
#include <string>
#include <vector>

#include "Image.h"

struct GrayImage {
  int width{0};
  int height{0};
  std::vector<uint8_t> data;
};

/**
 * @brief One captured frame in the camera's native pixel format.
 */
struct Frame {
  int width{0};
  int height{0};
  uint32_t format{0};   // V4L2 fourcc
  uint32_t stride{0};   // Bytes per line
  std::vector<uint8_t> data;

  Color pixel(int x, int y) const;
  uint8_t luma(int x, int y) const;

  /**
   * @brief Nearest-neighbour scaled RGB copy of the whole frame.
   */
  Image preview(int previewWidth, int previewHeight) const;

  /**
   * @brief Greyscale copy of a rectangle, clipped to the frame.
   */
  GrayImage gray(const Rect& rect) const;
};

/**
 * @brief Range reported by VIDIOC_QUERYCTRL.
 */
struct ControlRange {
  int32_t minimum;
  int32_t maximum;
  int32_t defaultValue;
};

/**
 * @brief Maps a setting value onto a V4L2 control.
 *
 * The setting range [lo, hi] is mapped piecewise linearly so that lo lands on
 * the control minimum, neutral on the control default and hi on the maximum.
 */
int32_t mapControlValue(double value, double lo, double neutral, double hi, const ControlRange& range);

/**
 * @brief V4L2 video capture device using mmap streaming I/O.
 */
class Camera
{
public:
  Camera(std::string device, int width, int height);
  ~Camera();

  Camera(const Camera&) = delete;
  Camera& operator=(const Camera&) = delete;

  /**
   * @brief Opens the device, negotiates the format and starts streaming.
   *
   * Throws std::runtime_error on failure.
   */
  void start();

  /**
   * @brief Stops streaming and releases the device.
   */
  void stop();

  /**
   * @brief Waits for the next frame and copies it out.
   *
   * @param frame Receives the frame.
   * @param timeoutMs Maximum time to wait.
   * @return False on timeout or when not streaming.
   */
  bool capture(Frame& frame, int timeoutMs = 2000);

  /**
   * @brief Sets a control from a setting value (see mapControlValue()).
   *
   * @return False when the device does not support the control.
   */
  bool setControl(uint32_t id, double value, double lo, double neutral, double hi);

  /**
   * @brief Switches automatic exposure and gain on or off.
   */
  void setAutoExposure(bool enable);

  int getWidth() const { return width; }
  int getHeight() const { return height; }

private:
  struct Buffer {
    void* start;
    size_t length;
  };

  bool queryControl(uint32_t id, ControlRange& range);
  bool writeControl(uint32_t id, int32_t value);
  void releaseBuffers();

  const std::string device;
  int width;
  int height;
  uint32_t format = 0;
  uint32_t stride = 0;

  int fd = -1;
  bool streaming = false;
  std::vector<Buffer> buffers;
};

// vim: set ts=2 sw=2 expandtab:
