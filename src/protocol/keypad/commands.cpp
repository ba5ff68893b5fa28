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

#include "protocol/keypad/commands.hpp"

#include "core/overloaded.hpp"
#include "core/str.hpp"

namespace padlink::keypad {

namespace {

struct ColorRow {
  LedColor color;
  std::string_view name;
  std::array<std::uint8_t, 4> rgbw;
};

constexpr ColorRow kColors[] = {
  {LedColor::Red,     "red",     {0x0A, 0x00, 0x00, 0x00}},
  {LedColor::Green,   "green",   {0x00, 0x0A, 0x00, 0x00}},
  {LedColor::Blue,    "blue",    {0x00, 0x00, 0x0A, 0x00}},
  {LedColor::White,   "white",   {0x00, 0x00, 0x00, 0x0A}},
  {LedColor::Black,   "black",   {0x00, 0x00, 0x00, 0x00}},
  {LedColor::Yellow,  "yellow",  {0x0A, 0x0A, 0x00, 0x00}},
  {LedColor::Cyan,    "cyan",    {0x00, 0x0A, 0x0A, 0x00}},
  {LedColor::Magenta, "magenta", {0x0A, 0x00, 0x0A, 0x00}},
  {LedColor::Orange,  "orange",  {0x0A, 0x08, 0x00, 0x00}},
  {LedColor::Purple,  "purple",  {0x09, 0x00, 0x09, 0x00}},
};

constexpr std::uint8_t tri_state(const std::optional<bool>& v) noexcept {
  if (!v) return 0;
  return *v ? 2 : 1;
}

constexpr std::string_view tri_name(const std::optional<bool>& v) noexcept {
  if (!v) return "unchanged";
  return *v ? "on" : "off";
}

} // namespace

std::array<std::uint8_t, 4> rgbw(LedColor c) noexcept {
  for (const auto& row : kColors)
    if (row.color == c) return row.rgbw;
  return {};
}

std::string_view color_name(LedColor c) noexcept {
  for (const auto& row : kColors)
    if (row.color == c) return row.name;
  return "?";
}

std::optional<LedColor> parse_color(std::string_view name) noexcept {
  for (const auto& row : kColors)
    if (padlink::core::equals_ci(name, row.name)) return row.color;
  return std::nullopt;
}

OutCommandId command_id(const Command& cmd) noexcept {
  return std::visit(core::overloaded{
    [](const SetLed&)        { return OutCommandId::SetLed; },
    [](const UpdateConfig&)  { return OutCommandId::UpdateConfig; },
    [](const Ping&)          { return OutCommandId::Ping; },
    [](const PrepareUpdate&) { return OutCommandId::PrepareUpdate; },
    [](const Reset&)         { return OutCommandId::Reset; },
  }, cmd);
}

CommandReport encode(const Command& cmd, std::uint8_t counter) noexcept {
  CommandReport r{};
  r[0] = static_cast<std::uint8_t>(command_id(cmd));

  std::visit(core::overloaded{
    [&](const SetLed& c) {
      const auto color = rgbw(c.color);
      r[1] = c.led;
      r[2] = color[0];
      r[3] = color[1];
      r[4] = color[2];
      r[5] = color[3];
    },
    [&](const UpdateConfig& c) {
      r[1] = tri_state(c.serial_console);
      r[2] = tri_state(c.filesystem);
    },
    [](const auto&) {},
  }, cmd);

  r[kCommandReportSize - 1] = counter;
  return r;
}

std::string describe(const Command& cmd) {
  return std::visit(core::overloaded{
    [](const SetLed& c) { return fmt::format("SetLed {{ id: {}, color: {} }}", c.led, color_name(c.color)); },
    [](const UpdateConfig& c) {
      return fmt::format("UpdateConfig {{ serial console: {}, filesystem: {} }}",
                         tri_name(c.serial_console), tri_name(c.filesystem));
    },
    [](const Ping&)          { return std::string("Ping"); },
    [](const PrepareUpdate&) { return std::string("PrepareUpdate"); },
    [](const Reset&)         { return std::string("Reset"); },
  }, cmd);
}

} // namespace padlink::keypad
