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
#include <cstdlib>
#include <stdexcept>

#include "X11Display.h"

using namespace std;

X11Display::X11Display(const DisplayConfig& config) :
  config(config),
  scale(max(config.scale, 1))
{
  XInitThreads();
  setenv("DISPLAY", ":0", 0);

  display = XOpenDisplay(nullptr);
  if (!display) {
    throw runtime_error("Failed to open X11 display.");
  }

  int screen = DefaultScreen(display);
  int ww = config.width * scale;
  int wh = config.height * scale;

  if (DefaultDepth(display, screen) < 24) {
    XCloseDisplay(display);
    throw runtime_error("X11 preview needs a 24-bit visual.");
  }

  window = XCreateSimpleWindow(
    display,
    RootWindow(display, screen),
    0,
    0,
    ww,
    wh,
    0,
    BlackPixel(display, screen),
    BlackPixel(display, screen));

  XSizeHints hints = {};
  hints.flags = PSize | PMinSize | PMaxSize;
  hints.width = hints.base_width = hints.min_width = hints.max_width = ww;
  hints.height = hints.base_height = hints.min_height = hints.max_height = wh;

  XSetWMNormalHints(display, window, &hints);
  XStoreName(display, window, config.title.c_str());
  XSelectInput(display, window, ExposureMask);
  XMapWindow(display, window);

  gc = XCreateGC(display, window, 0, nullptr);

  buffer.resize(static_cast<size_t>(ww) * wh);
  ximage = XCreateImage(
    display,
    DefaultVisual(display, screen),
    DefaultDepth(display, screen),
    ZPixmap,
    0,
    reinterpret_cast<char*>(buffer.data()),
    ww,
    wh,
    32,
    0);

  if (!ximage) {
    XFreeGC(display, gc);
    XDestroyWindow(display, window);
    XCloseDisplay(display);
    throw runtime_error("Failed to create X11 image.");
  }

  XSync(display, False);
  cout << "X11 preview window " << ww << "x" << wh << endl;
}

X11Display::~X11Display()
{
  if (ximage) {
    // The pixel buffer belongs to us.
    ximage->data = nullptr;
    XDestroyImage(ximage);
  }
  if (gc) XFreeGC(display, gc);
  if (window != None) XDestroyWindow(display, window);
  if (display) XCloseDisplay(display);
}

void X11Display::drainEvents()
{
  while (XPending(display) > 0) {
    XEvent event;
    XNextEvent(display, &event);
  }
}

void X11Display::show(const Image& image)
{
  drainEvents();

  Image frame = image;
  if (frame.getWidth() != config.width || frame.getHeight() != config.height) {
    frame = frame.resized(config.width, config.height);
  }

  int ww = config.width * scale;
  for (int y = 0; y < config.height; y++) {
    for (int x = 0; x < config.width; x++) {
      Color c = frame.get(x, y);
      uint32_t pixel = (uint32_t(c.r) << 16) | (uint32_t(c.g) << 8) | c.b;

      for (int dy = 0; dy < scale; dy++) {
        uint32_t* row = &buffer[static_cast<size_t>(y * scale + dy) * ww + x * scale];
        fill(row, row + scale, pixel);
      }
    }
  }

  XPutImage(display, window, gc, ximage, 0, 0, 0, 0, ww, config.height * scale);
  XFlush(display);
}

// vim: set ts=2 sw=2 expandtab:
