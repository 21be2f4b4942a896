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

enum class UiState { Idle, Scan, TargetAdjustW, TargetAdjustH, Settings, Null };

/**
 * @brief Short name shown in the toolbar.
 */
inline const char* uiStateName(UiState state)
{
  switch (state) {
  case UiState::Idle: return "IDLE";
  case UiState::Scan: return "SCAN";
  case UiState::TargetAdjustW: return "TGT-W";
  case UiState::TargetAdjustH: return "TGT-H";
  case UiState::Settings: return "SETTINGS";
  case UiState::Null: return "NULL";
  }
  return "NULL";
}

// vim: set ts=2 sw=2 expandtab:
