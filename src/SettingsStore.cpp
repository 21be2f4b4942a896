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
#include <fstream>
#include <map>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

#include "Log.h"
#include "SettingsStore.h"

using namespace std;

int SettingsStore::load(const vector<Setting*>& settings) const
{
  struct stat buf;
  if (stat(path.c_str(), &buf) != 0) {
    Log::debug() << "No settings file found, using defaults." << endl;
    return 0;
  }

  ifstream file(path);
  if (!file.is_open()) {
    cerr << "Failed to open " << path << endl;
    return 0;
  }

  Json::Value root;
  Json::CharReaderBuilder builder;
  string errors;
  if (!Json::parseFromStream(builder, file, &root, &errors) || !root.isArray()) {
    cerr << "Failed to parse " << path << ": " << errors << endl;
    return 0;
  }

  map<string, Setting*> byId;
  for (Setting* setting : settings) byId[setting->getId()] = setting;

  int restored = 0;
  for (const auto& saved : root) {
    if (!saved.isObject() || !saved["id"].isString()) continue;

    auto it = byId.find(saved["id"].asString());
    if (it == byId.end()) continue;

    if (it->second->restore(saved["value"])) {
      Log::debug() << "Loaded setting " << it->first << ": " << it->second->value() << endl;
      ++restored;
    }
    else {
      cerr << "Ignoring invalid value for setting " << it->first << endl;
    }
  }

  return restored;
}

bool SettingsStore::save(const vector<Setting*>& settings) const
{
  Json::Value root(Json::arrayValue);

  for (Setting* setting : settings) {
    if (setting->kind() == Setting::Kind::Action) continue;

    Json::Value entry;
    entry["id"] = setting->getId();
    entry["value"] = setting->value();
    root.append(entry);
  }

  // Written beside the target and renamed over it, so a power cut leaves
  // either the old or the new file.
  string tmpPath = path + ".tmp";
  ofstream file(tmpPath);
  if (!file.is_open()) {
    cerr << "Failed to write " << tmpPath << ": " << strerror(errno) << endl;
    return false;
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  file << Json::writeString(builder, root);
  file.close();

  if (file.fail()) {
    cerr << "Failed to write " << tmpPath << endl;
    unlink(tmpPath.c_str());
    return false;
  }

  int fd = open(tmpPath.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd >= 0) {
    if (fsync(fd) != 0) cerr << "Failed to sync " << tmpPath << ": " << strerror(errno) << endl;
    close(fd);
  }

  if (rename(tmpPath.c_str(), path.c_str()) != 0) {
    cerr << "Failed to replace " << path << ": " << strerror(errno) << endl;
    unlink(tmpPath.c_str());
    return false;
  }

  Log::debug() << "Settings saved." << endl;
  return true;
}

// vim: set ts=2 sw=2 expandtab:
