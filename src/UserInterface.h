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

#include "Config.h"
#include "Font.h"
#include "Image.h"
#include "ScanGeometry.h"
#include "SettingsMenu.h"
#include "UiState.h"

struct UiParams {
  int toolbarHeight;
  int targetWidth;
  int targetHeight;
  int visibleSettings;
};

/**
 * @brief Composes the toolbar, scan target and settings menu over the viewfinder.
 */
class UserInterface
{
public:
  UserInterface(const GuiConfig& gui, int width, int height);

  /**
   * @brief Draws one frame.
   *
   * The caller holds the UI lock so the menu cannot change while drawing.
   *
   * @param viewfinder Display sized camera image, toolbar area left blank.
   * @param menu Settings menu.
   * @param showConnection Whether to show the USB connection indicator.
   * @param connected USB host connection state.
   * @param params Layout parameters.
   * @param state Current UI state.
   * @return The composed frame.
   */
  Image draw(const Image& viewfinder, const SettingsMenu& menu, bool showConnection, bool connected,
             const UiParams& params, UiState state);

  /**
   * @brief Height of the settings overlay for a number of visible items.
   */
  static int overlayHeight(int displayHeight, int visibleCount);

  /**
   * @brief Scrollbar thumb for a menu list, as inclusive corners in a Rect.
   *
   * @return An empty rectangle when every item fits.
   */
  static Rect scrollThumb(int displayWidth, int displayHeight, int overlayTop,
                          int index, int total, int visibleCount);

  /**
   * @brief Full screen shown on exit: solid background with a white X.
   */
  static Image exitScreen(int width, int height, Color background);

private:
  void drawToolbar(Image& image, bool showConnection, bool connected, int toolbarHeight, UiState state);
  void drawTarget(Image& image, const UiParams& params, UiState state);
  void drawMenu(Image& image, const SettingsMenu& menu, int visibleCount);

  const int width;
  const int height;
  Font toolbarFont;
  Font regularFont;
};

// vim: set ts=2 sw=2 expandtab:
