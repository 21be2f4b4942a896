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

#include "SettingsMenu.h"

using namespace std;

SettingsMenu::SettingsMenu(vector<Setting*> root) :
  root(move(root)),
  exitItem(MENU_EXIT_ID, "\xe2\x86\x90 Exit", {""}, "", nullptr) {}

vector<Setting*> SettingsMenu::visible() const
{
  if (stack.empty()) return root;

  vector<Setting*> items{&exitItem};
  auto children = stack.back()->getChildren();
  items.insert(items.end(), children.begin(), children.end());
  return items;
}

void SettingsMenu::reset()
{
  stack.clear();
  index = 0;
  active = nullptr;
}

void SettingsMenu::push(GroupSetting* group)
{
  stack.push_back(group);
  index = 0;
  active = nullptr;
}

bool SettingsMenu::pop()
{
  if (stack.empty()) return false;

  stack.pop_back();
  index = 0;
  active = nullptr;
  return true;
}

Setting* SettingsMenu::selected() const
{
  auto items = visible();
  if (index < 0 || index >= static_cast<int>(items.size())) return nullptr;
  return items[index];
}

// vim: set ts=2 sw=2 expandtab:
