/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "core/hid_transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace padlink::linux {

struct HidrawSysfsInfo {
  std::string sysname;          // hidrawN
  std::uint16_t vendor = 0;
  std::uint16_t product = 0;
  std::string hid_name;         // HID_NAME, usually "<manufacturer> <product>"
  std::string serial;           // HID_UNIQ
  std::string manufacturer;     // from the parent USB device, when present
  std::string product_name;
  int connected_duration_sec = 0;

  std::string devnode() const;
  std::string describe() const;
  core::HardwareInfo to_hardware_info() const;
};

// Exact vendor/product (and serial when given) match, or, for an empty
// identification, a case-insensitive product name containing name_hint.
bool matches(const HidrawSysfsInfo& info, const core::DeviceId& id, std::string_view name_hint);

std::vector<HidrawSysfsInfo> enumerate_hidraw_sysfs();

} // namespace padlink::linux
