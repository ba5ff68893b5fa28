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
#include "protocol/keypad/keypad_wire.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace padlink::keypad {

// Button event (inbound 0x01).
struct ButtonStatus {
  std::uint8_t button = 0;
  bool triggered = false;
  bool long_pressed = false;
  bool pressed = false;
  bool released = false;
};

struct VersionInfo {
  std::uint8_t major = 0;
  std::uint8_t minor = 0;
  std::uint8_t patch = 0;
  HardwareType hardware = HardwareType::Unknown;

  std::string version() const;
};

// The device asks the host to resend the LED state.
struct StatusRequest {};

struct ChunkAck {
  std::uint16_t file_id = 0;
  std::uint16_t package = 0;
  std::uint8_t type = 0;
};

struct UpdateError {
  std::string reason;
};

enum class DeviceLogLevel { Debug, Error };

struct LogMessage {
  DeviceLogLevel level = DeviceLogLevel::Debug;
  std::string text;
};

struct Unknown {
  std::vector<std::uint8_t> raw;
};

using InboundMessage =
    std::variant<ButtonStatus, VersionInfo, StatusRequest, ChunkAck, UpdateError, LogMessage, Unknown>;

HardwareType hardware_type(std::uint8_t raw) noexcept;
std::string_view hardware_name(HardwareType t) noexcept;

// `report` starts with the HID report id. Fails only with Errc::Truncated;
// unrecognised identifiers decode to Unknown.
core::Result<InboundMessage> decode(std::span<const std::uint8_t> report);

std::string describe(const InboundMessage& msg);

} // namespace padlink::keypad

template <>
struct fmt::formatter<padlink::keypad::InboundMessage> : fmt::formatter<std::string_view> {
  template <class Ctx>
  auto format(const padlink::keypad::InboundMessage& m, Ctx& ctx) const {
    return fmt::formatter<std::string_view>::format(padlink::keypad::describe(m), ctx);
  }
};
