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

using namespace std;

namespace Log {

atomic<Verbosity> verbosity{Verbosity::Normal};

static ostream nullStream(nullptr);

ostream& debug()
{
  return verbosity.load() >= Verbosity::Verbose ? cout : nullStream;
}

ostream& trace()
{
  return verbosity.load() >= Verbosity::Trace ? cout : nullStream;
}

}

// vim: set ts=2 sw=2 expandtab:
