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

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include "HidInterface.h"
#include "TempDir.h"

using namespace std;

static bool waitFor(const function<bool()>& condition, chrono::milliseconds timeout = chrono::milliseconds(3000))
{
  auto deadline = chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (chrono::steady_clock::now() > deadline) return false;
    this_thread::sleep_for(chrono::milliseconds(10));
  }
  return true;
}

TEST(HidInterface, ReadsUdcSuspendedState)
{
  TempDir dir;
  EXPECT_FALSE(readUdcSuspended(dir.path, "3f980000.usb").has_value());

  dir.mkdir("3f980000.usb");
  dir.mkdir("3f980000.usb/gadget");

  dir.write("3f980000.usb/gadget/suspended", "0\n");
  EXPECT_EQ(readUdcSuspended(dir.path, "3f980000.usb"), false);

  dir.write("3f980000.usb/gadget/suspended", "1\n");
  EXPECT_EQ(readUdcSuspended(dir.path, "3f980000.usb"), true);

  dir.write("3f980000.usb/gadget/suspended", "");
  EXPECT_FALSE(readUdcSuspended(dir.path, "3f980000.usb").has_value());
}

class HidInterfaceTest : public ::testing::Test
{
protected:
  HidInterfaceTest()
  {
    dir.mkdir("fe980000.usb");
    dir.mkdir("fe980000.usb/gadget");
    dir.write("fe980000.usb/gadget/suspended", "0");
    dir.write("hidg0", "");

    config.udc = "fe980000.usb";
    config.path = dir.file("hidg0");
    config.terminator = "none";
  }

  TempDir dir;
  HidConfig config;
  atomic<bool> enabled{true};
};

TEST_F(HidInterfaceTest, TypesQueuedBarcodes)
{
  HidInterface hid(config, [this]() { return enabled.load(); }, dir.path);
  hid.start();

  EXPECT_TRUE(waitFor([&]() { return hid.isConnected(); }));

  hid.send("ab");
  hid.send("1");
  EXPECT_TRUE(waitFor([&]() { return dir.read("hidg0").size() == 6u * 8u; }));

  hid.stop();
}

TEST_F(HidInterfaceTest, DropsBarcodesWhileDisabled)
{
  enabled = false;

  HidInterface hid(config, [this]() { return enabled.load(); }, dir.path);
  hid.start();

  hid.send("123");
  this_thread::sleep_for(chrono::milliseconds(300));
  EXPECT_TRUE(dir.read("hidg0").empty());

  hid.stop();
}

TEST_F(HidInterfaceTest, TracksHostConnection)
{
  HidInterface hid(config, [this]() { return enabled.load(); }, dir.path);
  hid.start();
  EXPECT_TRUE(waitFor([&]() { return hid.isConnected(); }));

  dir.write("fe980000.usb/gadget/suspended", "1");
  EXPECT_TRUE(waitFor([&]() { return !hid.isConnected(); }));

  remove(dir.file("fe980000.usb/gadget/suspended").c_str());
  dir.write("fe980000.usb/gadget/suspended", "0");
  EXPECT_TRUE(waitFor([&]() { return hid.isConnected(); }));

  hid.stop();
}

TEST_F(HidInterfaceTest, MissingUdcIsNotConnected)
{
  config.udc = "20980000.usb";

  HidInterface hid(config, [this]() { return enabled.load(); }, dir.path);
  hid.start();
  this_thread::sleep_for(chrono::milliseconds(100));
  EXPECT_FALSE(hid.isConnected());

  hid.setDelay(0.25);
  EXPECT_DOUBLE_EQ(hid.getDelay(), 0.25);

  hid.stop();
}

// vim: set ts=2 sw=2 expandtab:
