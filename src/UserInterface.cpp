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

#include "Log.h"
#include "UserInterface.h"

using namespace std;

UserInterface::UserInterface(const GuiConfig& gui, int width, int height) :
  width(width),
  height(height),
  toolbarFont(gui.toolbarFont.name, gui.toolbarFont.size),
  regularFont(gui.regularFont.name, gui.regularFont.size)
{
  Log::debug() << "Toolbar font: " << toolbarFont.getPath() << endl;
  Log::debug() << "Regular font: " << regularFont.getPath() << endl;
}

int UserInterface::overlayHeight(int displayHeight, int visibleCount)
{
  int minHeight = static_cast<int>(displayHeight / 2.8);
  int maxHeight = static_cast<int>(displayHeight * 0.6);
  return max(minHeight, min(maxHeight, static_cast<int>(displayHeight * 0.12 * visibleCount)));
}

Rect UserInterface::scrollThumb(int displayWidth, int displayHeight, int overlayTop,
                                int index, int total, int visibleCount)
{
  if (total <= visibleCount) return {};

  int left = displayWidth - 18;
  int right = displayWidth - 8;
  int top = overlayTop + 8;
  int bottom = displayHeight - 8;
  int track = bottom - top;

  int thumb = max(10, static_cast<int>(track * (static_cast<double>(visibleCount) / total)));
  int maxScroll = total - visibleCount;
  int scrollPos = min(max(index - visibleCount / 2, 0), maxScroll);
  double ratio = maxScroll > 0 ? static_cast<double>(scrollPos) / maxScroll : 0;
  int thumbTop = top + static_cast<int>((track - thumb) * ratio);

  return {left, thumbTop, right - left, thumb};
}

Image UserInterface::exitScreen(int width, int height, Color background)
{
  Image image(width, height, background);
  image.drawLine(0, 0, width, height, Colors::White, 10);
  image.drawLine(width, 0, 0, height, Colors::White, 10);
  return image;
}

void UserInterface::drawToolbar(Image& image, bool showConnection, bool connected,
                                int toolbarHeight, UiState state)
{
  image.fillRect(0, 0, width, toolbarHeight, Colors::Black);

  string stateText = string("State: ") + uiStateName(state);
  Font::Extent extent = toolbarFont.measure(stateText);
  toolbarFont.draw(image, 10, (toolbarHeight - extent.height) / 2, stateText, Colors::White);

  if (!showConnection) return;

  string connText = string("Conn: ") + (connected ? "OK" : "NO");
  extent = toolbarFont.measure(connText);
  toolbarFont.draw(image, width - extent.width - 10, (toolbarHeight - extent.height) / 2, connText,
                   connected ? Colors::Green : Colors::Red);
}

void UserInterface::drawTarget(Image& image, const UiParams& params, UiState state)
{
  Color color;
  switch (state) {
  case UiState::Idle: color = Colors::Red; break;
  case UiState::Scan: color = Colors::Blue; break;
  default: color = Colors::Yellow; break;
  }

  int x0 = (width - params.targetWidth) / 2;
  int y0 = params.toolbarHeight + ((height - params.toolbarHeight) - params.targetHeight) / 2;
  int x1 = x0 + params.targetWidth;
  int y1 = y0 + params.targetHeight;

  image.drawRect(x0, y0, x1, y1, color, 3);

  // Crosshair
  image.drawLine(x0 + params.targetWidth / 2, y0, x0 + params.targetWidth / 2, y1, color);
  image.drawLine(x0, y0 + params.targetHeight / 2, x1, y0 + params.targetHeight / 2, color);
}

void UserInterface::drawMenu(Image& image, const SettingsMenu& menu, int visibleCount)
{
  vector<Setting*> list = menu.visible();
  auto items = visibleMenuItems(list, menu.getIndex(), visibleCount);

  int overlay = overlayHeight(height, visibleCount);
  int top = height - overlay;
  image.blendRect(0, top, width, height, Colors::Black, 200);

  int itemHeight = overlay / visibleCount;
  int padding = max(8, itemHeight / 8);

  for (size_t row = 0; row < items.size(); row++) {
    size_t i = items[row].first;
    Setting* setting = items[row].second;

    Color color = Colors::White;
    if (static_cast<int>(i) == menu.getIndex()) {
      color = setting == menu.getActive() ? Colors::Cyan : Colors::Yellow;
    }

    string text = menu.isExit(setting) ? setting->getName() : setting->label();
    int y = top + padding / 2 + static_cast<int>(row) * itemHeight;
    regularFont.draw(image, 16, y, text, color);
  }

  Rect thumb = scrollThumb(width, height, top, menu.getIndex(), static_cast<int>(list.size()), visibleCount);
  if (!thumb.empty()) {
    image.fillRect(thumb.x, thumb.y, thumb.right(), thumb.bottom(), Colors::Gray);
  }
}

Image UserInterface::draw(const Image& viewfinder, const SettingsMenu& menu, bool showConnection,
                          bool connected, const UiParams& params, UiState state)
{
  Image image = viewfinder;
  if (image.getWidth() != width || image.getHeight() != height) {
    image = Image(width, height);
    image.paste(viewfinder, 0, 0);
  }

  drawToolbar(image, showConnection, connected, params.toolbarHeight, state);

  switch (state) {
  case UiState::Idle:
  case UiState::Scan:
  case UiState::TargetAdjustW:
  case UiState::TargetAdjustH:
    drawTarget(image, params, state);
    break;
  case UiState::Settings:
    drawMenu(image, menu, params.visibleSettings);
    break;
  default:
    break;
  }

  return image;
}

// vim: set ts=2 sw=2 expandtab:
