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

#include <vector>

#include "Setting.h"

#define MENU_EXIT_ID "exit"

/**
 * @brief Navigation state of the settings menu.
 *
 * The root level lists the top-level settings. Entering a group pushes it
 * on the stack; inside a group the list starts with an "Exit" item.
 * Callers serialize access (the UI lock).
 */
class SettingsMenu
{
public:
  explicit SettingsMenu(std::vector<Setting*> root = {});

  void setRoot(std::vector<Setting*> settings) { root = std::move(settings); }
  const std::vector<Setting*>& getRoot() const { return root; }

  /**
   * @brief Items of the current menu level, in display order.
   */
  std::vector<Setting*> visible() const;

  /**
   * @brief Returns to the root level with the cursor on the first item.
   */
  void reset();

  /**
   * @brief Enters a group.
   */
  void push(GroupSetting* group);

  /**
   * @brief Leaves the current group.
   *
   * @return False when already at the root level.
   */
  bool pop();

  bool atRoot() const { return stack.empty(); }
  bool isExit(const Setting* setting) const { return setting == &exitItem; }

  int getIndex() const { return index; }
  void setIndex(int i) { index = i; }

  Setting* getActive() const { return active; }
  void setActive(Setting* setting) { active = setting; }

  Setting* selected() const;

private:
  std::vector<Setting*> root;
  std::vector<GroupSetting*> stack;
  mutable OptionSetting exitItem;
  int index = 0;
  Setting* active = nullptr;
};

// vim: set ts=2 sw=2 expandtab:
