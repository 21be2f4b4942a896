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
#include "RotaryEncoder.h"

using namespace std;

// Indexed by (previous state << 2) | current state, state = (A << 1) | B.
// Clockwise from rest runs 11, 01, 00, 10, 11.
static const int transitions[16] = {
   0, -1,  1,  0,
   1,  0,  0, -1,
  -1,  0,  0,  1,
   0,  1, -1,  0,
};

QuadratureDecoder::QuadratureDecoder(bool restA, bool restB) :
  rest((restA ? 2 : 0) | (restB ? 1 : 0)),
  state(rest) {}

int QuadratureDecoder::update(bool a, bool b)
{
  int next = (a ? 2 : 0) | (b ? 1 : 0);
  if (next == state) return 0;

  // Transitions between each side of the rest state are given relative to 11.
  int prevRel = state ^ rest ^ 3;
  int nextRel = next ^ rest ^ 3;
  count += transitions[(prevRel << 2) | nextRel];
  state = next;

  if (state != rest) return 0;

  int step = count >= 2 ? 1 : count <= -2 ? -1 : 0;
  count = 0;
  return step;
}

RotaryEncoder::RotaryEncoder(const string& chip, unsigned int pinA, unsigned int pinB) :
  lineA(GpioLine::input(chip, pinA, true, 0)),
  lineB(GpioLine::input(chip, pinB, true, 0)) {}

void RotaryEncoder::attach(GpioEventLoop& loop)
{
  loop.add(lineA, [this](const GpioEdge&) { handle(); });
  loop.add(lineB, [this](const GpioEdge&) { handle(); });
}

void RotaryEncoder::handle()
{
  int step = decoder.update(lineA.get(), lineB.get());
  if (step == 0) return;

  Log::trace() << "Encoder " << (step > 0 ? "+1" : "-1") << endl;
  if (rotated) rotated(step);
}

// vim: set ts=2 sw=2 expandtab:
