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

#include "platform/linux/hidraw_device.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <linux/hidraw.h>
#include <sys/ioctl.h>

#include <spdlog/spdlog.h>

namespace padlink::linux {

HidrawDevice::HidrawDevice(std::string name_hint) : name_hint_(std::move(name_hint)) {}
HidrawDevice::~HidrawDevice() { close(); }

core::Status HidrawDevice::open(const core::DeviceId& id) {
  close();

  const auto devices = enumerate_hidraw_sysfs();
  for (const auto& d : devices) {
    if (!matches(d, id, name_hint_)) continue;

    const std::string node = d.devnode();
    const int fd = do_open(node.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
      const int e = errno;
      spdlog::warn("Cannot open {}: {}", node, std::strerror(e));
      continue;
    }

    FileHandle h;
    h.take(fd);

    // sysfs and the node can disagree if the device was swapped in between.
    hidraw_devinfo raw{};
    if (do_ioctl(h, HIDIOCGRAWINFO, &raw) < 0) continue;
    const auto vid = static_cast<std::uint16_t>(raw.vendor);
    const auto pid = static_cast<std::uint16_t>(raw.product);
    if (vid != d.vendor || pid != d.product) {
      spdlog::warn("{} changed identity ({:04x}:{:04x}), skipping", node, vid, pid);
      continue;
    }

    fd_ = std::move(h);
    info_ = d.to_hardware_info();
    spdlog::debug("Opened {}", d.describe());
    return core::Status::Ok();
  }

  if (id.vendor == 0 && id.product == 0 && !id.serial)
    return core::Status::Failf(core::Errc::Transport, "no HID device named like '{}'", name_hint_);
  return core::Status::Failf(core::Errc::Transport, "no openable HID device {:04x}:{:04x}{}", id.vendor, id.product,
                             id.serial ? fmt::format(" serial {}", *id.serial) : std::string());
}

void HidrawDevice::close() noexcept {
  fd_.close();
  info_ = {};
}

core::Result<std::size_t> HidrawDevice::read(std::span<std::uint8_t> out, int timeout_ms) {
  using R = core::Result<std::size_t>;
  if (!fd_.valid()) return R::Fail(core::Errc::Transport, "device not open");

  const int ready = do_poll_in(fd_, timeout_ms);
  if (ready < 0) return R::Failf(core::Errc::Transport, "poll {}: {}", info_.path, std::strerror(errno));
  if (ready == 0) return R::Ok(0);

  const int n = do_read(fd_, out.data(), out.size());
  if (n < 0) return R::Failf(core::Errc::Transport, "read {}: {}", info_.path, std::strerror(errno));
  if (n == 0) return R::Failf(core::Errc::Transport, "read {}: device gone", info_.path);

  return R::Ok(static_cast<std::size_t>(n));
}

core::Status HidrawDevice::write(std::span<const std::uint8_t> report) {
  if (!fd_.valid()) return core::Status::Fail(core::Errc::Transport, "device not open");

  const int n = do_write(fd_, report.data(), report.size());
  if (n < 0) return core::Status::Failf(core::Errc::Transport, "write {}: {}", info_.path, std::strerror(errno));
  if (static_cast<std::size_t>(n) != report.size())
    return core::Status::Failf(core::Errc::Transport, "short write to {}: {} of {} bytes", info_.path, n, report.size());
  return core::Status::Ok();
}

} // namespace padlink::linux
