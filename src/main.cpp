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

#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <csignal>
#include <cstring>
#include <iostream>
#include <system_error>
#include <thread>
#include <vector>

#include <unistd.h>
#include <signal.h>

#include "main.h"
#include "Config.h"
#include "Log.h"
#include "version.h"

using namespace std;

atomic<bool> isRunning{false};

unique_ptr<ScannerApp> app = nullptr;

/**
 * Stops every worker thread and releases the hardware.
 * Called on normal exit and after a signal ends the main loop.
 */
static void cleanup()
{
  cout << "Exiting." << endl << "Cleaning up..." << endl;

  isRunning.store(false);

  if (app) app.reset();

  cout << "Cleanup complete." << endl;
}

/**
 * Prints usage information for the program.
 */
static void printUsage()
{
  cerr << "Barcode to USB HID scanner (" << Version::NAME << ") v" << Version::FULL << "\n\n";
  cerr << " -c <file> Configuration file.\n";
  cerr << "           Defaults to " << DEFAULT_CONFIG << ".\n\n";
  cerr << " -v        Verbose output.\n\n";
  cerr << " -t        Trace output (implies -v).\n\n";
  cerr << " -n        Do not elevate privileges with sudo.\n\n";
  cerr << " -l        List USB device controllers.\n\n";
  cerr << " -d        Fork to background (daemon mode).\n\n";
  cerr << " -h        Displays usage.\n" << endl;
}

/**
 * Prints the USB device controllers the kernel knows about.
 */
static void printUdcs()
{
  vector<string> udcs = listUdcs();

  if (udcs.empty()) {
    cerr << "No USB device controllers found in " << UDC_CLASS_PATH << endl;
    return;
  }

  for (const auto& udc : udcs) cout << "  " << udc << "\n";
  cout.flush();
}

/**
 * Re-runs this executable through sudo with the same arguments.
 * Only returns if exec fails.
 */
static void elevate(int argc, char** argv)
{
  char self[PATH_MAX];
  if (!realpath("/proc/self/exe", self)) {
    cerr << "Cannot resolve executable path: " << strerror(errno) << endl;
    return;
  }

  vector<char*> args;
  args.push_back(const_cast<char*>("sudo"));
  args.push_back(self);
  for (int i = 1; i < argc; i++) args.push_back(argv[i]);
  args.push_back(nullptr);

  cout << "Restarting with sudo..." << endl;
  execvp("sudo", args.data());
  cerr << "Failed to run sudo: " << strerror(errno) << endl;
}

/**
 * Signal handler for SIGINT and SIGTERM.
 * Ends the main loop so the scanner shuts down in order.
 *
 * @param signum The signal number that was received
 */
static void signalHandler(int signum)
{
  (void)signum;
  isRunning.store(false);
}

/**
 * Main entry point for the barcode scanner.
 *
 * @param argc Number of command line arguments
 * @param argv Array of command line arguments
 * @return Exit status code
 */
int main(int argc, char** argv)
{
  int opt, noElevate = 0, daemonize = 0;
  string configFile = DEFAULT_CONFIG;
  pid_t pid;

  for (optind = 1;;) {
    if ((opt = getopt(argc, argv, "c:vtnldh")) == -1) break;

    switch (opt) {
    case 'h':
      printUsage();
      return 0;

    case 'l':
      printUdcs();
      return 0;

    case 'c':
      configFile = optarg;
      break;

    case 'v':
      if (Log::verbosity.load() == Log::Verbosity::Normal) {
        Log::verbosity.store(Log::Verbosity::Verbose);
      }
      break;

    case 't':
      Log::verbosity.store(Log::Verbosity::Trace);
      break;

    case 'n':
      noElevate = 1;
      break;

    case 'd':
      daemonize = 1;
      break;

    default:
      printUsage();
      return 1;
    }
  }

  if (geteuid() != 0) {
    if (!noElevate) elevate(argc, argv);
    cerr << "hidscan must run as root." << endl;
    return 1;
  }

  if (daemonize) {
    pid = fork();

    if (pid < 0) {
      cerr << "Failed to fork" << endl;
      exit(EXIT_FAILURE);
    }

    if (pid > 0) exit(0);
  }

  cout << Version::NAME << " v" << Version::FULL << endl;

  Config config;

  try {
    config = Config::load(configFile);
    config.warn();
  }
  catch (const runtime_error& e) {
    cerr << e.what() << endl;
    exit(EXIT_FAILURE);
  }

  isRunning.store(true);

  atexit(cleanup);
  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  ScannerApp::Exit result;

  try {
    app = make_unique<ScannerApp>(config);
    result = app->run(isRunning);
  }
  catch (const system_error& e) {
    cerr << e.what() << endl;
    exit(EXIT_FAILURE);
  }
  catch (const runtime_error& e) {
    cerr << e.what() << endl;
    exit(EXIT_FAILURE);
  }

  app->stop(result);
  app.reset();

  if (result == ScannerApp::Exit::Shutdown) {
    this_thread::sleep_for(chrono::milliseconds(500));
    cout << "Powering off." << endl;
    if (system("systemctl poweroff") != 0) {
      cerr << "systemctl poweroff failed." << endl;
      return 1;
    }
  }

  return 0;
}

// vim: set ts=2 sw=2 expandtab:
