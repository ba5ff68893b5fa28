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
#include "platform/linux/sysfs_hid.hpp"
#include "platform/posix-common/filehandle.hpp"

#include <string>

namespace padlink::linux {

// IHidTransport over /dev/hidrawN. Reads and writes carry the report id in
// the first byte, which is exactly what hidraw expects for numbered reports.
class HidrawDevice final : public core::IHidTransport {
 public:
  explicit HidrawDevice(std::string name_hint = "mutenix");
  ~HidrawDevice() override;

  HidrawDevice(const HidrawDevice&) = delete;
  HidrawDevice& operator=(const HidrawDevice&) = delete;

  core::Status open(const core::DeviceId& id) override;
  void close() noexcept override;
  bool is_open() const noexcept override { return fd_.valid(); }

  core::HardwareInfo info() const override { return info_; }

  core::Result<std::size_t> read(std::span<std::uint8_t> out, int timeout_ms) override;
  core::Status write(std::span<const std::uint8_t> report) override;

 private:
  std::string name_hint_;
  FileHandle fd_;
  core::HardwareInfo info_{};
};

} // namespace padlink::linux
