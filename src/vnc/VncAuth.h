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

#include <array>
#include <cstdint>
#include <string>

using VncChallenge = std::array<uint8_t, 16>;

/**
 * @brief Fills a VNC authentication challenge with random bytes.
 *
 * Throws std::runtime_error if no randomness is available.
 */
VncChallenge makeVncChallenge();

/**
 * @brief Computes the expected response to a VNC authentication challenge.
 *
 * The challenge is DES encrypted (ECB, two blocks) with the password as
 * key: truncated or zero padded to 8 bytes, each byte bit-reversed.
 */
VncChallenge vncAuthResponse(const std::string& password, const VncChallenge& challenge);

// vim: set ts=2 sw=2 expandtab:
