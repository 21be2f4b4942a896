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

#define OPENSSL_SUPPRESS_DEPRECATED

#include <algorithm>
#include <stdexcept>

#include <openssl/des.h>
#include <openssl/rand.h>

#include "VncAuth.h"

using namespace std;

static uint8_t reverseBits(uint8_t b)
{
  b = static_cast<uint8_t>((b & 0xF0) >> 4 | (b & 0x0F) << 4);
  b = static_cast<uint8_t>((b & 0xCC) >> 2 | (b & 0x33) << 2);
  b = static_cast<uint8_t>((b & 0xAA) >> 1 | (b & 0x55) << 1);
  return b;
}

VncChallenge makeVncChallenge()
{
  VncChallenge challenge;
  if (RAND_bytes(challenge.data(), static_cast<int>(challenge.size())) != 1) {
    throw runtime_error("Failed to generate VNC challenge.");
  }
  return challenge;
}

VncChallenge vncAuthResponse(const string& password, const VncChallenge& challenge)
{
  DES_cblock key = {0};
  for (size_t i = 0; i < sizeof(key) && i < password.size(); i++) {
    key[i] = reverseBits(static_cast<uint8_t>(password[i]));
  }

  DES_key_schedule schedule;
  DES_set_key_unchecked(&key, &schedule);

  VncChallenge response;
  for (size_t block = 0; block < challenge.size(); block += 8) {
    DES_cblock in;
    DES_cblock out;
    copy(challenge.begin() + block, challenge.begin() + block + 8, in);
    DES_ecb_encrypt(&in, &out, &schedule, DES_ENCRYPT);
    copy(out, out + 8, response.begin() + block);
  }

  return response;
}

// vim: set ts=2 sw=2 expandtab:
