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

#include "platform/linux/sysfs_hid.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace padlink::linux {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kSysHidraw = "/sys/class/hidraw";

std::string read_text_file(const fs::path& p) {
  std::ifstream in(p);
  if (!in.is_open()) return {};
  std::string s;
  std::getline(in, s);
  return std::string(core::trim(s));
}

// HID_ID=<bus>:<vendor>:<product>, each field hex and zero padded to 4 or 8.
bool parse_hid_id(std::string_view v, std::uint16_t& vendor, std::uint16_t& product) {
  const auto a = v.find(':');
  if (a == std::string_view::npos) return false;
  const auto b = v.find(':', a + 1);
  if (b == std::string_view::npos) return false;

  auto field = [](std::string_view f) -> std::optional<std::uint16_t> {
    while (f.size() > 4 && f.front() == '0') f.remove_prefix(1);
    return core::parse_u16(f, 16);
  };

  const auto vend = field(v.substr(a + 1, b - a - 1));
  const auto prod = field(v.substr(b + 1));
  if (!vend || !prod) return false;
  vendor = *vend;
  product = *prod;
  return true;
}

// hidrawN/device is the HID device; its parent is the USB interface and the
// grandparent the USB device carrying the string descriptors.
void load_usb_strings(const fs::path& hid_dev, HidrawSysfsInfo& out) {
  std::error_code ec;
  const fs::path real = fs::canonical(hid_dev, ec);
  if (ec) return;

  const fs::path usb = real.parent_path().parent_path();
  if (!fs::exists(usb / "idVendor", ec)) return;

  out.manufacturer = read_text_file(usb / "manufacturer");
  out.product_name = read_text_file(usb / "product");
  if (out.serial.empty()) out.serial = read_text_file(usb / "serial");

  if (auto ms = core::parse_int(read_text_file(usb / "power" / "connected_duration"))) {
    out.connected_duration_sec = *ms / 1000;
  }
}

std::optional<HidrawSysfsInfo> load_one(const fs::path& dir, std::string sysname) {
  std::ifstream in(dir / "device" / "uevent");
  if (!in.is_open()) return std::nullopt;

  HidrawSysfsInfo out;
  out.sysname = std::move(sysname);

  bool have_id = false;
  std::string line;
  while (std::getline(in, line)) {
    const std::string_view l = core::trim(line);
    const auto eq = l.find('=');
    if (eq == std::string_view::npos) continue;
    const auto key = l.substr(0, eq);
    const auto val = l.substr(eq + 1);

    if (key == "HID_ID") have_id = parse_hid_id(val, out.vendor, out.product);
    else if (key == "HID_NAME") out.hid_name = std::string(val);
    else if (key == "HID_UNIQ") out.serial = std::string(val);
  }
  if (!have_id) return std::nullopt;

  load_usb_strings(dir / "device", out);
  if (out.product_name.empty()) out.product_name = out.hid_name;
  return out;
}

int node_number(std::string_view sysname) {
  sysname.remove_prefix(std::min(sysname.size(), std::string_view("hidraw").size()));
  return core::parse_int(sysname).value_or(-1);
}

} // namespace

std::string HidrawSysfsInfo::devnode() const { return "/dev/" + sysname; }

std::string HidrawSysfsInfo::describe() const {
  return fmt::format("{} [{:04x}:{:04x}] {}{}", devnode(), vendor, product,
                     hid_name.empty() ? product_name : hid_name,
                     serial.empty() ? std::string() : fmt::format(" (serial {})", serial));
}

core::HardwareInfo HidrawSysfsInfo::to_hardware_info() const {
  return core::HardwareInfo{
    .path = devnode(),
    .vendor = vendor,
    .product = product,
    .manufacturer = manufacturer,
    .product_name = product_name,
    .serial = serial,
  };
}

bool matches(const HidrawSysfsInfo& info, const core::DeviceId& id, std::string_view name_hint) {
  const bool by_name = id.vendor == 0 && id.product == 0 && !id.serial;
  if (by_name) {
    if (name_hint.empty()) return false;
    return core::contains_ci(info.hid_name, name_hint) || core::contains_ci(info.product_name, name_hint);
  }

  if (info.vendor != id.vendor || info.product != id.product) return false;
  if (id.serial && *id.serial != info.serial) return false;
  return true;
}

std::vector<HidrawSysfsInfo> enumerate_hidraw_sysfs() {
  std::vector<HidrawSysfsInfo> out;

  std::error_code ec;
  const fs::path base{kSysHidraw};
  if (!fs::is_directory(base, ec)) return out;

  for (const auto& entry : fs::directory_iterator(base, ec)) {
    const auto sysname = entry.path().filename().string();

    auto info = load_one(entry.path(), sysname);
    if (!info) continue;

    spdlog::debug("Found HID device: {}", info->describe());
    out.push_back(std::move(*info));
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return node_number(a.sysname) < node_number(b.sysname);
  });

  return out;
}

} // namespace padlink::linux
