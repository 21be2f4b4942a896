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
#include <memory>
#include <functional>
#include <utility>

#include <json/json.h>

/**
 * @brief A user adjustable value shown in the settings menu.
 *
 * Each setting carries a callback that pushes its value to the hardware
 * (camera control, LED ring, HID delay...). Values are persisted by id.
 */
class Setting
{
public:
  enum class Kind { Float, Int, Option, Action, Group };

  Setting(std::string id, std::string name) : id(std::move(id)), name(std::move(name)) {}
  virtual ~Setting() = default;

  const std::string& getId() const { return id; }
  const std::string& getName() const { return name; }

  virtual Kind kind() const = 0;

  /**
   * @brief Pushes the current value through the apply callback.
   */
  virtual void apply() = 0;

  /**
   * @brief Changes the value by a number of encoder steps.
   *
   * @param delta Encoder steps, negative when turning counter-clockwise.
   */
  virtual void adjust(int delta) { (void)delta; }

  /**
   * @brief Text shown for this setting in the menu.
   */
  virtual std::string label() const = 0;

  /**
   * @brief Current value for persistence, null for settings without one.
   */
  virtual Json::Value value() const { return Json::Value(); }

  /**
   * @brief Restores a persisted value, clamping it into range.
   *
   * @return False when the value has the wrong type or is not allowed.
   */
  virtual bool restore(const Json::Value& value) { (void)value; return false; }

private:
  const std::string id;
  const std::string name;
};

class FloatSetting : public Setting
{
public:
  using Callback = std::function<void(double)>;

  FloatSetting(std::string id, std::string name, double min, double max, double def,
               Callback callback, int precision = 1, double step = 0.1, std::string suffix = "");

  Kind kind() const override { return Kind::Float; }
  void apply() override;
  void adjust(int delta) override;
  std::string label() const override;
  Json::Value value() const override { return current; }
  bool restore(const Json::Value& value) override;

  double get() const { return current; }
  void set(double value);

private:
  const double minValue;
  const double maxValue;
  const int precision;
  const double step;
  const std::string suffix;
  double current;
  Callback callback;
};

class IntSetting : public Setting
{
public:
  using Callback = std::function<void(int)>;

  IntSetting(std::string id, std::string name, int min, int max, int def,
             Callback callback, int step = 5, std::string suffix = "");

  Kind kind() const override { return Kind::Int; }
  void apply() override;
  void adjust(int delta) override;
  std::string label() const override;
  Json::Value value() const override { return current; }
  bool restore(const Json::Value& value) override;

  int get() const { return current; }
  int getMin() const { return minValue; }
  int getMax() const { return maxValue; }
  void set(int value);

private:
  const int minValue;
  const int maxValue;
  const int step;
  const std::string suffix;
  int current;
  Callback callback;
};

class OptionSetting : public Setting
{
public:
  using Callback = std::function<void(const std::string&)>;

  OptionSetting(std::string id, std::string name, std::vector<std::string> options,
                std::string def, Callback callback);

  Kind kind() const override { return Kind::Option; }
  void apply() override;
  void adjust(int delta) override;
  std::string label() const override;
  Json::Value value() const override { return current; }
  bool restore(const Json::Value& value) override;

  const std::string& get() const { return current; }

private:
  const std::vector<std::string> options;
  std::string current;
  Callback callback;
};

class ActionSetting : public Setting
{
public:
  using Callback = std::function<void()>;

  ActionSetting(std::string id, std::string name, Callback callback) :
    Setting(std::move(id), std::move(name)), callback(std::move(callback)) {}

  Kind kind() const override { return Kind::Action; }
  void apply() override;
  std::string label() const override { return "<" + getName() + ">"; }

private:
  Callback callback;
};

class GroupSetting : public Setting
{
public:
  GroupSetting(std::string id, std::string name) : Setting(std::move(id), std::move(name)) {}

  Kind kind() const override { return Kind::Group; }
  void apply() override;
  std::string label() const override { return getName(); }

  /**
   * @brief Adds a child and returns a typed pointer to it.
   */
  template <typename T>
  T* add(std::unique_ptr<T> setting)
  {
    T* raw = setting.get();
    children.push_back(std::move(setting));
    return raw;
  }

  std::vector<Setting*> getChildren() const;

private:
  std::vector<std::unique_ptr<Setting>> children;
};

/**
 * @brief Formats a float the way the menu shows it: rounded to precision,
 *        trailing zeros trimmed, at least one decimal ("0.2", "1.0", "0.05").
 */
std::string formatDecimal(double value, int precision);

/**
 * @brief Rounds to a number of decimals.
 */
double roundTo(double value, int precision);

/**
 * @brief Returns every non-group setting in the tree, depth first.
 */
std::vector<Setting*> flattenSettings(const std::vector<Setting*>& settings);

/**
 * @brief Selects the menu items to show around the cursor.
 *
 * Up to visibleCount items are returned, centred on currentIndex without
 * wrapping around the ends of the list.
 *
 * @return Pairs of (index in list, setting).
 */
std::vector<std::pair<size_t, Setting*>> visibleMenuItems(
  const std::vector<Setting*>& list, int currentIndex, int visibleCount);

// vim: set ts=2 sw=2 expandtab:
