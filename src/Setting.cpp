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

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "Log.h"
#include "Setting.h"

using namespace std;

double roundTo(double value, int precision)
{
  double factor = pow(10.0, precision);
  return round(value * factor) / factor;
}

string formatDecimal(double value, int precision)
{
  char buf[32];
  snprintf(buf, sizeof(buf), "%.*f", max(precision, 1), roundTo(value, precision));

  string text(buf);
  size_t dot = text.find('.');
  while (text.size() > dot + 2 && text.back() == '0') text.pop_back();

  if (text == "-0.0") text = "0.0";
  return text;
}

FloatSetting::FloatSetting(string id, string name, double min, double max, double def,
                           Callback callback, int precision, double step, string suffix) :
  Setting(move(id), move(name)),
  minValue(min),
  maxValue(max),
  precision(precision),
  step(step),
  suffix(move(suffix)),
  current(def),
  callback(move(callback)) {}

void FloatSetting::apply()
{
  Log::debug() << "Applying setting " << getId() << ": " << current << endl;
  if (callback) callback(current);
}

void FloatSetting::set(double value)
{
  current = clamp(value, minValue, maxValue);
}

void FloatSetting::adjust(int delta)
{
  set(roundTo(current + delta * step, precision));
}

string FloatSetting::label() const
{
  return getName() + ": " + formatDecimal(current, precision) + suffix;
}

bool FloatSetting::restore(const Json::Value& value)
{
  if (!value.isNumeric()) return false;
  set(value.asDouble());
  return true;
}

IntSetting::IntSetting(string id, string name, int min, int max, int def,
                       Callback callback, int step, string suffix) :
  Setting(move(id), move(name)),
  minValue(min),
  maxValue(max),
  step(step),
  suffix(move(suffix)),
  current(def),
  callback(move(callback)) {}

void IntSetting::apply()
{
  Log::debug() << "Applying setting " << getId() << ": " << current << endl;
  if (callback) callback(current);
}

void IntSetting::set(int value)
{
  current = clamp(value, minValue, maxValue);
}

void IntSetting::adjust(int delta)
{
  set(current + delta * step);
}

string IntSetting::label() const
{
  return getName() + ": " + to_string(current) + suffix;
}

bool IntSetting::restore(const Json::Value& value)
{
  if (!value.isNumeric()) return false;
  set(static_cast<int>(lround(value.asDouble())));
  return true;
}

OptionSetting::OptionSetting(string id, string name, vector<string> options,
                             string def, Callback callback) :
  Setting(move(id), move(name)),
  options(move(options)),
  current(move(def)),
  callback(move(callback)) {}

void OptionSetting::apply()
{
  Log::debug() << "Applying setting " << getId() << ": " << current << endl;
  if (callback) callback(current);
}

void OptionSetting::adjust(int delta)
{
  if (options.empty()) return;

  auto it = find(options.begin(), options.end(), current);
  int n = static_cast<int>(options.size());
  int index = it != options.end() ? static_cast<int>(it - options.begin()) : 0;

  index = ((index + delta) % n + n) % n;
  current = options[index];
}

string OptionSetting::label() const
{
  return getName() + ": " + current;
}

bool OptionSetting::restore(const Json::Value& value)
{
  if (!value.isString()) return false;
  if (find(options.begin(), options.end(), value.asString()) == options.end()) return false;
  current = value.asString();
  return true;
}

void ActionSetting::apply()
{
  Log::debug() << "Running action " << getId() << endl;
  if (callback) callback();
}

void GroupSetting::apply()
{
  for (auto& child : children) child->apply();
}

vector<Setting*> GroupSetting::getChildren() const
{
  vector<Setting*> list;
  for (const auto& child : children) list.push_back(child.get());
  return list;
}

vector<Setting*> flattenSettings(const vector<Setting*>& settings)
{
  vector<Setting*> flat;

  for (Setting* setting : settings) {
    if (setting->kind() == Setting::Kind::Group) {
      auto children = flattenSettings(static_cast<GroupSetting*>(setting)->getChildren());
      flat.insert(flat.end(), children.begin(), children.end());
    }
    else {
      flat.push_back(setting);
    }
  }

  return flat;
}

vector<pair<size_t, Setting*>> visibleMenuItems(const vector<Setting*>& list,
                                                int currentIndex, int visibleCount)
{
  vector<pair<size_t, Setting*>> items;
  if (list.empty() || visibleCount <= 0) return items;

  int total = static_cast<int>(list.size());
  visibleCount = min(visibleCount, total);
  currentIndex = clamp(currentIndex, 0, total - 1);

  int start = currentIndex - visibleCount / 2;
  int end = start + visibleCount;

  if (start < 0) {
    start = 0;
    end = visibleCount;
  }
  if (end > total) {
    end = total;
    start = total - visibleCount;
  }

  for (int i = start; i < end; i++) items.emplace_back(i, list[i]);
  return items;
}

// vim: set ts=2 sw=2 expandtab:
