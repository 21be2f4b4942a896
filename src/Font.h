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

#include <ft2build.h>
#include FT_FREETYPE_H

#include "Image.h"

/**
 * @brief A TrueType font at a fixed pixel size.
 */
class Font
{
public:
  struct Extent {
    int width;
    int height;
  };

  /**
   * @brief Opens a font.
   *
   * @param name Font file name known to fontconfig ("DejaVuSans.ttf"),
   *             a family name, or a path to a font file.
   * @param size Pixel size.
   */
  Font(const std::string& name, int size);
  ~Font();

  Font(const Font&) = delete;
  Font& operator=(const Font&) = delete;

  /**
   * @brief Measures a UTF-8 string.
   *
   * The height is the line height (ascender to descender) so strings of the
   * same font centre consistently.
   */
  Extent measure(const std::string& text);

  /**
   * @brief Draws a UTF-8 string with its top-left corner at (x, y).
   */
  void draw(Image& image, int x, int y, const std::string& text, Color color);

  const std::string& getPath() const { return path; }

private:
  FT_Library library = nullptr;
  FT_Face face = nullptr;
  std::string path;
  int ascender = 0;
  int descender = 0;
};

/**
 * @brief Finds the file for a font name using fontconfig.
 *
 * @return Path to the font file, or an empty string if nothing matched.
 */
std::string findFontFile(const std::string& name);

/**
 * @brief Decodes a UTF-8 string into code points; invalid bytes map to '?'.
 */
std::u32string decodeUtf8(const std::string& text);

// vim: set ts=2 sw=2 expandtab:
