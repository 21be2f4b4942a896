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

#include <string>
#include <vector>

#include "Setting.h"

/**
 * @brief Persists menu settings as a JSON array of {"id", "value"} objects.
 */
class SettingsStore
{
public:
  explicit SettingsStore(std::string path) : path(std::move(path)) {}

  /**
   * @brief Restores saved values into the given settings.
   *
   * A missing file leaves the defaults in place. An unreadable or malformed
   * file is reported and also leaves the defaults in place.
   *
   * @param settings Flattened settings (see flattenSettings()).
   * @return Number of settings restored.
   */
  int load(const std::vector<Setting*>& settings) const;

  /**
   * @brief Writes the current values of the given settings.
   *
   * @return False if the file could not be written.
   */
  bool save(const std::vector<Setting*>& settings) const;

  const std::string& getPath() const { return path; }

private:
  const std::string path;
};

// vim: set ts=2 sw=2 expandtab:
