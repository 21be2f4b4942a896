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
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>

#include "Log.h"
#include "VncServer.h"

using namespace std;

VncServer::VncServer(const VncConfig& config, VncSession::ImageSource source) :
  config(config),
  source(move(source))
{
  if (pipe(wakePipe) == -1) {
    throw runtime_error("Failed to create wake pipe.");
  }
}

VncServer::~VncServer()
{
  stop();
  if (wakePipe[0] >= 0) close(wakePipe[0]);
  if (wakePipe[1] >= 0) close(wakePipe[1]);
}

void VncServer::start()
{
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(config.port));

  if (inet_pton(AF_INET, config.bind.c_str(), &addr.sin_addr) != 1) {
    throw runtime_error("Invalid VNC bind address: " + config.bind);
  }

  listenFd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listenFd < 0) {
    throw runtime_error("Cannot create VNC socket: " + string(strerror(errno)));
  }

  int reuse = 1;
  if (setsockopt(listenFd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    cerr << "Cannot set SO_REUSEADDR on VNC socket." << endl;
  }

  if (bind(listenFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || listen(listenFd, 4) < 0) {
    int err = errno;
    close(listenFd);
    listenFd = -1;
    throw runtime_error("Cannot listen on " + config.bind + ":" + to_string(config.port) + ": " + strerror(err));
  }

  run = true;
  acceptThread = thread(&VncServer::accept, this);
  cout << "VNC server listening on " << config.bind << ":" << config.port << endl;
}

void VncServer::stop()
{
  if (!run.exchange(false)) return;
  if (write(wakePipe[1], "", 1) < 0) cerr << "Failed to wake VNC thread." << endl;
  if (acceptThread.joinable()) acceptThread.join();

  {
    lock_guard<mutex> lock(clientsMtx);
    for (auto& client : clients) client.session->close();
  }

  for (auto& client : clients) {
    if (client.thread.joinable()) client.thread.join();
  }
  clients.clear();

  if (listenFd >= 0) {
    close(listenFd);
    listenFd = -1;
  }
}

void VncServer::reap()
{
  lock_guard<mutex> lock(clientsMtx);

  for (auto it = clients.begin(); it != clients.end();) {
    if (it->done.load()) {
      if (it->thread.joinable()) it->thread.join();
      it = clients.erase(it);
    }
    else {
      ++it;
    }
  }
}

void VncServer::accept()
{
  while (run.load()) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(listenFd, &readfds);
    FD_SET(wakePipe[0], &readfds);

    int rc = select(max(listenFd, wakePipe[0]) + 1, &readfds, nullptr, nullptr, nullptr);
    if (rc < 0) {
      if (errno == EINTR) continue;
      cerr << "VNC select failed." << endl;
      break;
    }

    // Break loop if wakePipe[1] is written to.
    if (FD_ISSET(wakePipe[0], &readfds)) break;
    if (!FD_ISSET(listenFd, &readfds)) continue;

    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    int fd = ::accept4(listenFd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
    if (fd < 0) continue;

    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
    cout << "VNC client connected from " << ip << ":" << ntohs(peer.sin_port) << endl;

    reap();

    lock_guard<mutex> lock(clientsMtx);
    clients.emplace_back();
    Client& client = clients.back();
    client.session = make_unique<VncSession>(fd, config, source);
    client.thread = thread([&client]() {
      try {
        client.session->run();
      }
      catch (const runtime_error& e) {
        cerr << "VNC session failed: " << e.what() << endl;
        client.session->close();
      }
      client.done = true;
    });
  }
}

// vim: set ts=2 sw=2 expandtab:
