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
#include <stdexcept>

#include <sys/stat.h>
#include <fontconfig/fontconfig.h>

#include "Font.h"

using namespace std;

static string baseName(const string& path)
{
  size_t slash = path.rfind('/');
  return slash == string::npos ? path : path.substr(slash + 1);
}

string findFontFile(const string& name)
{
  struct stat buf;
  if (name.find('/') != string::npos && stat(name.c_str(), &buf) == 0) return name;

  FcConfig* config = FcInitLoadConfigAndFonts();
  if (!config) return "";

  string found;

  // Look for an installed font file with exactly this name first.
  FcPattern* all = FcPatternCreate();
  FcObjectSet* os = FcObjectSetBuild(FC_FILE, nullptr);
  FcFontSet* fonts = FcFontList(config, all, os);

  if (fonts) {
    for (int i = 0; i < fonts->nfont && found.empty(); i++) {
      FcChar8* file = nullptr;
      if (FcPatternGetString(fonts->fonts[i], FC_FILE, 0, &file) == FcResultMatch &&
          baseName(reinterpret_cast<const char*>(file)) == name) {
        found = reinterpret_cast<const char*>(file);
      }
    }
    FcFontSetDestroy(fonts);
  }

  FcObjectSetDestroy(os);
  FcPatternDestroy(all);

  // Otherwise treat it as a family name and let fontconfig pick the best match.
  if (found.empty()) {
    string family = name.substr(0, name.rfind('.'));
    FcPattern* pattern = FcNameParse(reinterpret_cast<const FcChar8*>(family.c_str()));

    if (pattern) {
      FcConfigSubstitute(config, pattern, FcMatchPattern);
      FcDefaultSubstitute(pattern);

      FcResult result;
      FcPattern* match = FcFontMatch(config, pattern, &result);
      if (match) {
        FcChar8* file = nullptr;
        if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch) {
          found = reinterpret_cast<const char*>(file);
        }
        FcPatternDestroy(match);
      }
      FcPatternDestroy(pattern);
    }
  }

  FcConfigDestroy(config);
  return found;
}

u32string decodeUtf8(const string& text)
{
  u32string out;

  for (size_t i = 0; i < text.size();) {
    unsigned char c = text[i];
    int extra = c < 0x80 ? 0 : (c >> 5) == 0x6 ? 1 : (c >> 4) == 0xe ? 2 : (c >> 3) == 0x1e ? 3 : -1;

    if (extra < 0 || i + extra >= text.size()) {
      out.push_back(U'?');
      i++;
      continue;
    }

    char32_t cp = extra == 0 ? c : c & (0x3f >> extra);
    bool valid = true;
    for (int k = 1; k <= extra; k++) {
      unsigned char cc = text[i + k];
      if ((cc & 0xc0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (cc & 0x3f);
    }

    if (!valid) {
      out.push_back(U'?');
      i++;
      continue;
    }

    out.push_back(cp);
    i += extra + 1;
  }

  return out;
}

Font::Font(const string& name, int size)
{
  path = findFontFile(name);
  if (path.empty()) {
    throw runtime_error("Font not found: " + name);
  }

  if (FT_Init_FreeType(&library) != 0) {
    throw runtime_error("Failed to initialize FreeType.");
  }

  if (FT_New_Face(library, path.c_str(), 0, &face) != 0) {
    FT_Done_FreeType(library);
    throw runtime_error("Failed to load font " + path);
  }

  FT_Set_Pixel_Sizes(face, 0, size);
  ascender = static_cast<int>(face->size->metrics.ascender >> 6);
  descender = static_cast<int>(face->size->metrics.descender >> 6);
}

Font::~Font()
{
  if (face) FT_Done_Face(face);
  if (library) FT_Done_FreeType(library);
}

Font::Extent Font::measure(const string& text)
{
  int width = 0;

  for (char32_t cp : decodeUtf8(text)) {
    if (FT_Load_Char(face, cp, FT_LOAD_DEFAULT) != 0) continue;
    width += static_cast<int>(face->glyph->advance.x >> 6);
  }

  return {width, ascender - descender};
}

void Font::draw(Image& image, int x, int y, const string& text, Color color)
{
  int penX = x;
  int baseline = y + ascender;

  for (char32_t cp : decodeUtf8(text)) {
    if (FT_Load_Char(face, cp, FT_LOAD_RENDER) != 0) continue;

    FT_GlyphSlot glyph = face->glyph;
    const FT_Bitmap& bitmap = glyph->bitmap;
    int left = penX + glyph->bitmap_left;
    int top = baseline - glyph->bitmap_top;

    for (int row = 0; row < static_cast<int>(bitmap.rows); row++) {
      for (int col = 0; col < static_cast<int>(bitmap.width); col++) {
        uint8_t coverage = bitmap.buffer[row * bitmap.pitch + col];
        if (coverage) image.blend(left + col, top + row, color, coverage);
      }
    }

    penX += static_cast<int>(glyph->advance.x >> 6);
  }
}

// vim: set ts=2 sw=2 expandtab:
