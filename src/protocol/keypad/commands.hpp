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

#include "protocol/keypad/keypad_wire.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace padlink::keypad {

enum class LedColor { Red, Green, Blue, White, Black, Yellow, Cyan, Magenta, Orange, Purple };

std::array<std::uint8_t, 4> rgbw(LedColor c) noexcept;
std::string_view color_name(LedColor c) noexcept;
std::optional<LedColor> parse_color(std::string_view name) noexcept;

struct SetLed {
  std::uint8_t led = 0;
  LedColor color = LedColor::Black;
};

// Unset fields leave the device setting unchanged.
struct UpdateConfig {
  std::optional<bool> serial_console;
  std::optional<bool> filesystem;
};

struct Ping {};
struct PrepareUpdate {};
struct Reset {};

using Command = std::variant<SetLed, UpdateConfig, Ping, PrepareUpdate, Reset>;

using CommandReport = std::array<std::uint8_t, kCommandReportSize>;

OutCommandId command_id(const Command& cmd) noexcept;

CommandReport encode(const Command& cmd, std::uint8_t counter) noexcept;

std::string describe(const Command& cmd);

} // namespace padlink::keypad

template <>
struct fmt::formatter<padlink::keypad::Command> : fmt::formatter<std::string_view> {
  template <class Ctx>
  auto format(const padlink::keypad::Command& c, Ctx& ctx) const {
    return fmt::formatter<std::string_view>::format(padlink::keypad::describe(c), ctx);
  }
};
