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
#include "core/status.hpp"
#include "protocol/keypad/commands.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace padlink::app {

struct Options {
    bool help = false;
    bool version = false;
    bool list = false;
    bool monitor = false;
    bool verbose = false;

    std::vector<core::DeviceId> devices; // empty: built-in ids, then name hint
    std::string name_hint = "mutenix";

    std::vector<keypad::SetLed> leds;
    std::optional<bool> serial_console;
    std::optional<bool> filesystem;

    std::vector<std::filesystem::path> update_files;

    std::chrono::milliseconds ping_interval{4000};
    std::chrono::milliseconds ack_timeout{1000};
    unsigned retries = 3;

    bool _no_args = false;
};

core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

// "VID:PID" or "VID:PID:SERIAL", ids in hex with optional 0x prefix.
core::Result<core::DeviceId> parse_device_id(std::string_view s) noexcept;

// "ID:COLOR", e.g. "1:red".
core::Result<keypad::SetLed> parse_led(std::string_view s) noexcept;

} // namespace padlink::app
