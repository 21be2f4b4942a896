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
#include <cctype>
#include <climits>
#include <map>
#include <stdexcept>

#include <zbar.h>

#include "Log.h"
#include "BarcodeDecoder.h"

using namespace std;

static const map<string, zbar::zbar_symbol_type_t> symbologies = {
  {"EAN8", zbar::ZBAR_EAN8},
  {"UPCE", zbar::ZBAR_UPCE},
  {"ISBN10", zbar::ZBAR_ISBN10},
  {"UPCA", zbar::ZBAR_UPCA},
  {"EAN13", zbar::ZBAR_EAN13},
  {"ISBN13", zbar::ZBAR_ISBN13},
  {"I25", zbar::ZBAR_I25},
  {"DATABAR", zbar::ZBAR_DATABAR},
  {"DATABAR_EXP", zbar::ZBAR_DATABAR_EXP},
  {"CODABAR", zbar::ZBAR_CODABAR},
  {"CODE39", zbar::ZBAR_CODE39},
  {"PDF417", zbar::ZBAR_PDF417},
  {"QRCODE", zbar::ZBAR_QRCODE},
  {"CODE93", zbar::ZBAR_CODE93},
  {"CODE128", zbar::ZBAR_CODE128},
};

int symbologyFromName(const string& name)
{
  string key = name;
  transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return toupper(c); });

  auto it = symbologies.find(key);
  if (it == symbologies.end()) {
    throw runtime_error("Unknown barcode symbology: " + name);
  }

  return it->second;
}

BarcodeDecoder::BarcodeDecoder(const vector<string>& names) :
  scanner(make_unique<zbar::ImageScanner>())
{
  if (names.empty()) {
    scanner->set_config(zbar::ZBAR_NONE, zbar::ZBAR_CFG_ENABLE, 1);
    return;
  }

  scanner->set_config(zbar::ZBAR_NONE, zbar::ZBAR_CFG_ENABLE, 0);
  for (const auto& name : names) {
    scanner->set_config(static_cast<zbar::zbar_symbol_type_t>(symbologyFromName(name)), zbar::ZBAR_CFG_ENABLE, 1);
  }
}

BarcodeDecoder::~BarcodeDecoder() = default;

vector<Barcode> BarcodeDecoder::decode(const GrayImage& gray)
{
  vector<Barcode> found;
  if (gray.width <= 0 || gray.height <= 0) return found;

  zbar::Image image(gray.width, gray.height, "Y800", gray.data.data(), gray.data.size());
  if (scanner->scan(image) <= 0) return found;

  for (zbar::Image::SymbolIterator symbol = image.symbol_begin(); symbol != image.symbol_end(); ++symbol) {
    int x0 = INT_MAX, y0 = INT_MAX, x1 = INT_MIN, y1 = INT_MIN;

    for (int i = 0; i < symbol->get_location_size(); i++) {
      x0 = min(x0, symbol->get_location_x(i));
      y0 = min(y0, symbol->get_location_y(i));
      x1 = max(x1, symbol->get_location_x(i));
      y1 = max(y1, symbol->get_location_y(i));
    }

    Rect rect;
    if (symbol->get_location_size() > 0) rect = {x0, y0, x1 - x0 + 1, y1 - y0 + 1};

    Log::debug() << "Decoded " << symbol->get_type_name() << ": " << symbol->get_data() << endl;
    found.push_back({symbol->get_type_name(), symbol->get_data(), rect});
  }

  return found;
}

// vim: set ts=2 sw=2 expandtab:
