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

#include "core/status.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace padlink::core {

struct DeviceId {
  std::uint16_t vendor = 0;
  std::uint16_t product = 0;
  std::optional<std::string> serial;
};

struct HardwareInfo {
  std::string path;
  std::uint16_t vendor = 0;
  std::uint16_t product = 0;
  std::string manufacturer;
  std::string product_name;
  std::string serial;
};

class IHidTransport {
 public:
  virtual ~IHidTransport() = default;

  // An empty vendor/product pair with no serial means "match by name hint".
  virtual Status open(const DeviceId& id) = 0;
  virtual void close() noexcept = 0;
  virtual bool is_open() const noexcept = 0;

  virtual HardwareInfo info() const = 0;

  // Returns the number of bytes read, 0 when nothing arrived within
  // timeout_ms. The first byte is the HID report id.
  virtual Result<std::size_t> read(std::span<std::uint8_t> out, int timeout_ms) = 0;

  // `report` starts with the HID report id.
  virtual Status write(std::span<const std::uint8_t> report) = 0;
};

} // namespace padlink::core
