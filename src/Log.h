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
#include <iostream>

namespace Log {

enum class Verbosity { Normal, Verbose, Trace };

extern std::atomic<Verbosity> verbosity;

/**
 * @brief Stream for debug output.
 *
 * @return std::cout when running with -v or -t, a discarding stream otherwise.
 */
std::ostream& debug();

/**
 * @brief Stream for trace output (per frame, per encoder step).
 *
 * @return std::cout when running with -t, a discarding stream otherwise.
 */
std::ostream& trace();

}

// vim: set ts=2 sw=2 expandtab:
