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

#include "Log.h"
#include "Button.h"

using namespace std;

Button::Button(const string& chip, const ButtonConfig& config) :
  line(GpioLine::input(chip, config.pin, config.pullUp, config.bounceTime)),
  activeLow(config.pullUp),
  holdTime(static_cast<long>(config.holdTime * 1000)) {}

void Button::attach(GpioEventLoop& loop)
{
  loop.add(line, [this](const GpioEdge& edge) { handle(edge); });
}

bool Button::isPressed() const
{
  return line.get() != activeLow;
}

void Button::handle(const GpioEdge& edge)
{
  bool down = edge.rising != activeLow;
  Log::trace() << "GPIO" << edge.pin << (down ? " pressed" : " released") << endl;

  if (down && pressed) pressed();
  if (!down && released) released();
}

// vim: set ts=2 sw=2 expandtab:
