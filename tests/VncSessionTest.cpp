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

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>

#include "VncAuth.h"
#include "VncSession.h"

using namespace std;

class VncSessionTest : public ::testing::Test
{
protected:
  VncSessionTest() : screen(4, 2, Colors::Red)
  {
    config.title = "Scanner";
  }

  ~VncSessionTest() override
  {
    if (client >= 0) close(client);
    if (server.joinable()) server.join();
  }

  void connect()
  {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    client = fds[1];

    timeval tv{5, 0};
    setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    session.reset(new VncSession(fds[0], config, [this]() {
      lock_guard<mutex> lock(screenMtx);
      return screen;
    }));
    server = thread([this]() { session->run(); });
  }

  vector<uint8_t> receive(size_t length)
  {
    vector<uint8_t> data(length);
    size_t got = 0;
    while (got < length) {
      ssize_t n = recv(client, data.data() + got, length - got, 0);
      if (n <= 0) break;
      got += n;
    }
    data.resize(got);
    return data;
  }

  void transmit(const vector<uint8_t>& data)
  {
    ASSERT_EQ(send(client, data.data(), data.size(), MSG_NOSIGNAL), static_cast<ssize_t>(data.size()));
  }

  void transmit(const string& text) { transmit(vector<uint8_t>(text.begin(), text.end())); }

  bool disconnected()
  {
    uint8_t byte;
    return recv(client, &byte, 1, 0) == 0;
  }

  // Reads ServerInit and checks the framebuffer size and name.
  void expectServerInit()
  {
    vector<uint8_t> init = receive(24 + config.title.size());
    ASSERT_EQ(init.size(), 24 + config.title.size());
    EXPECT_EQ(getU16(init.data()), 4);
    EXPECT_EQ(getU16(init.data() + 2), 2);
    EXPECT_EQ(init[4], 32);
    EXPECT_EQ(getU32(init.data() + 20), config.title.size());
    EXPECT_EQ(string(init.begin() + 24, init.end()), config.title);
  }

  void handshake38()
  {
    EXPECT_EQ(receive(12), (vector<uint8_t>{'R', 'F', 'B', ' ', '0', '0', '3', '.', '0', '0', '8', '\n'}));
    transmit(string("RFB 003.008\n"));
    EXPECT_EQ(receive(2), (vector<uint8_t>{1, RFB_SEC_NONE}));
    transmit(vector<uint8_t>{RFB_SEC_NONE});
    EXPECT_EQ(receive(4), (vector<uint8_t>{0, 0, 0, 0}));
    transmit(vector<uint8_t>{1});
    expectServerInit();
  }

  static vector<uint8_t> updateRequest(bool incremental, uint16_t x, uint16_t y, uint16_t w, uint16_t h)
  {
    vector<uint8_t> out{RFB_FB_UPDATE_REQUEST, static_cast<uint8_t>(incremental ? 1 : 0)};
    putU16(out, x);
    putU16(out, y);
    putU16(out, w);
    putU16(out, h);
    return out;
  }

  VncConfig config;
  mutex screenMtx;
  Image screen;
  unique_ptr<VncSession> session;
  thread server;
  int client = -1;
};

TEST_F(VncSessionTest, NoAuthHandshakeAndFullUpdate)
{
  connect();
  handshake38();

  transmit(updateRequest(false, 0, 0, 4, 2));

  vector<uint8_t> header = receive(16);
  ASSERT_EQ(header.size(), 16u);
  EXPECT_EQ(header[0], RFB_FB_UPDATE);
  EXPECT_EQ(getU16(header.data() + 2), 1);
  EXPECT_EQ(getU16(header.data() + 4), 0);
  EXPECT_EQ(getU16(header.data() + 8), 4);
  EXPECT_EQ(getU16(header.data() + 10), 2);
  EXPECT_EQ(getU32(header.data() + 12), static_cast<uint32_t>(RFB_ENCODING_RAW));

  vector<uint8_t> pixels = receive(4 * 2 * 4);
  ASSERT_EQ(pixels.size(), 32u);
  EXPECT_EQ(pixels[0], 0x00);
  EXPECT_EQ(pixels[1], 0x00);
  EXPECT_EQ(pixels[2], 0xFF);
  EXPECT_EQ(pixels[3], 0x00);
}

TEST_F(VncSessionTest, IncrementalUpdateSendsChangedArea)
{
  connect();
  handshake38();

  transmit(updateRequest(false, 0, 0, 4, 2));
  EXPECT_EQ(receive(16 + 32).size(), 48u);

  // Too soon after the previous update.
  transmit(updateRequest(true, 0, 0, 4, 2));
  EXPECT_EQ(receive(4), (vector<uint8_t>{RFB_FB_UPDATE, 0, 0, 0}));

  {
    lock_guard<mutex> lock(screenMtx);
    screen.set(2, 1, Colors::Blue);
  }
  this_thread::sleep_for(chrono::milliseconds(80));

  transmit(updateRequest(true, 0, 0, 4, 2));
  vector<uint8_t> header = receive(16);
  ASSERT_EQ(header.size(), 16u);
  EXPECT_EQ(getU16(header.data() + 2), 1);
  EXPECT_EQ(getU16(header.data() + 4), 2);
  EXPECT_EQ(getU16(header.data() + 6), 1);
  EXPECT_EQ(getU16(header.data() + 8), 1);
  EXPECT_EQ(getU16(header.data() + 10), 1);
  EXPECT_EQ(receive(4), (vector<uint8_t>{0xFF, 0x00, 0x00, 0x00}));

  // Nothing changed since.
  this_thread::sleep_for(chrono::milliseconds(80));
  transmit(updateRequest(true, 0, 0, 4, 2));
  EXPECT_EQ(receive(4), (vector<uint8_t>{RFB_FB_UPDATE, 0, 0, 0}));
}

TEST_F(VncSessionTest, RequestInsideIntervalWaitsBeforeEmptyReply)
{
  connect();
  handshake38();

  transmit(updateRequest(false, 0, 0, 4, 2));
  EXPECT_EQ(receive(16 + 32).size(), 48u);

  {
    lock_guard<mutex> lock(screenMtx);
    screen.set(0, 0, Colors::Blue);
  }

  auto start = chrono::steady_clock::now();
  transmit(updateRequest(true, 0, 0, 4, 2));
  EXPECT_EQ(receive(4), (vector<uint8_t>{RFB_FB_UPDATE, 0, 0, 0}));
  EXPECT_GE(chrono::steady_clock::now() - start, chrono::milliseconds(40));

  // The change is delivered on the next request.
  transmit(updateRequest(true, 0, 0, 4, 2));
  vector<uint8_t> header = receive(16);
  ASSERT_EQ(header.size(), 16u);
  EXPECT_EQ(getU16(header.data() + 2), 1);
  EXPECT_EQ(getU16(header.data() + 8), 1);
  EXPECT_EQ(getU16(header.data() + 10), 1);
  EXPECT_EQ(receive(4).size(), 4u);
}

TEST_F(VncSessionTest, StaticScreenRepliesAreRateLimited)
{
  connect();
  handshake38();

  transmit(updateRequest(false, 0, 0, 4, 2));
  EXPECT_EQ(receive(16 + 32).size(), 48u);

  int replies = 0;
  auto end = chrono::steady_clock::now() + chrono::seconds(1);
  while (chrono::steady_clock::now() < end) {
    transmit(updateRequest(true, 0, 0, 4, 2));
    ASSERT_EQ(receive(4), (vector<uint8_t>{RFB_FB_UPDATE, 0, 0, 0}));
    replies++;
  }

  EXPECT_LE(replies, 25);
  EXPECT_GE(replies, 5);
}

TEST_F(VncSessionTest, ColourMapClient)
{
  connect();
  handshake38();

  vector<uint8_t> format{RFB_SET_PIXEL_FORMAT, 0, 0, 0};
  PixelFormat palette;
  palette.bitsPerPixel = 8;
  palette.depth = 8;
  palette.trueColour = false;
  palette.serialize(format);
  transmit(format);

  vector<uint8_t> map = receive(6 + 256 * 6);
  ASSERT_EQ(map.size(), 6u + 256u * 6u);
  EXPECT_EQ(map[0], RFB_SET_COLOUR_MAP_ENTRIES);

  transmit(updateRequest(false, 0, 0, 1, 1));
  vector<uint8_t> update = receive(16 + 1);
  ASSERT_EQ(update.size(), 17u);
  EXPECT_EQ(update[16], 0x07);
}

TEST_F(VncSessionTest, ClientMessagesAreConsumed)
{
  connect();
  handshake38();

  vector<uint8_t> messages{RFB_SET_ENCODINGS, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0, 1};
  messages.insert(messages.end(), {RFB_KEY_EVENT, 1, 0, 0, 0, 0, 0, 0x41});
  messages.insert(messages.end(), {RFB_POINTER_EVENT, 0, 0, 1, 0, 1});
  messages.insert(messages.end(), {RFB_CLIENT_CUT_TEXT, 0, 0, 0, 0, 0, 0, 3, 'a', 'b', 'c'});
  transmit(messages);

  transmit(updateRequest(false, 0, 0, 1, 1));
  EXPECT_EQ(receive(16 + 4).size(), 20u);
}

TEST_F(VncSessionTest, UnknownMessageClosesConnection)
{
  connect();
  handshake38();

  transmit(vector<uint8_t>{99});
  EXPECT_TRUE(disconnected());
}

TEST_F(VncSessionTest, PasswordAuthentication)
{
  config.password = "secret";
  connect();

  receive(12);
  transmit(string("RFB 003.008\n"));
  EXPECT_EQ(receive(2), (vector<uint8_t>{1, RFB_SEC_VNC_AUTH}));
  transmit(vector<uint8_t>{RFB_SEC_VNC_AUTH});

  vector<uint8_t> challenge = receive(16);
  ASSERT_EQ(challenge.size(), 16u);

  VncChallenge c;
  copy(challenge.begin(), challenge.end(), c.begin());
  VncChallenge response = vncAuthResponse("secret", c);
  transmit(vector<uint8_t>(response.begin(), response.end()));

  EXPECT_EQ(receive(4), (vector<uint8_t>{0, 0, 0, 0}));
  transmit(vector<uint8_t>{0});
  expectServerInit();
}

TEST_F(VncSessionTest, WrongPasswordIsRejected)
{
  config.password = "secret";
  connect();

  receive(12);
  transmit(string("RFB 003.008\n"));
  receive(2);
  transmit(vector<uint8_t>{RFB_SEC_VNC_AUTH});

  vector<uint8_t> challenge = receive(16);
  VncChallenge c;
  copy(challenge.begin(), challenge.end(), c.begin());
  VncChallenge response = vncAuthResponse("guess", c);
  transmit(vector<uint8_t>(response.begin(), response.end()));

  vector<uint8_t> result = receive(8);
  ASSERT_EQ(result.size(), 8u);
  EXPECT_EQ(getU32(result.data()), 1u);
  uint32_t length = getU32(result.data() + 4);
  vector<uint8_t> reason = receive(length);
  EXPECT_EQ(string(reason.begin(), reason.end()), "Auth failed.");
  EXPECT_TRUE(disconnected());
}

TEST_F(VncSessionTest, IncompatibleSecurityType)
{
  config.password = "secret";
  connect();

  receive(12);
  transmit(string("RFB 003.008\n"));
  receive(2);
  transmit(vector<uint8_t>{RFB_SEC_NONE});

  vector<uint8_t> result = receive(8);
  ASSERT_EQ(result.size(), 8u);
  EXPECT_EQ(getU32(result.data()), 1u);
}

TEST_F(VncSessionTest, Version33ServerChoosesSecurity)
{
  connect();

  receive(12);
  transmit(string("RFB 003.003\n"));
  EXPECT_EQ(receive(4), (vector<uint8_t>{0, 0, 0, RFB_SEC_NONE}));
  transmit(vector<uint8_t>{1});
  expectServerInit();
}

TEST_F(VncSessionTest, Version37NoSecurityResultForNone)
{
  connect();

  receive(12);
  transmit(string("RFB 003.007\n"));
  EXPECT_EQ(receive(2), (vector<uint8_t>{1, RFB_SEC_NONE}));
  transmit(vector<uint8_t>{RFB_SEC_NONE});
  transmit(vector<uint8_t>{1});
  expectServerInit();
}

TEST_F(VncSessionTest, Version33WrongPasswordHasNoReason)
{
  config.password = "secret";
  connect();

  receive(12);
  transmit(string("RFB 003.003\n"));
  EXPECT_EQ(receive(4), (vector<uint8_t>{0, 0, 0, RFB_SEC_VNC_AUTH}));
  receive(16);
  transmit(vector<uint8_t>(16, 0));

  EXPECT_EQ(receive(4), (vector<uint8_t>{0, 0, 0, 1}));
  EXPECT_TRUE(disconnected());
}

TEST_F(VncSessionTest, BadVersionIsRejected)
{
  connect();

  receive(12);
  transmit(string("HTTP/1.1 200"));
  EXPECT_TRUE(disconnected());
}

// vim: set ts=2 sw=2 expandtab:
