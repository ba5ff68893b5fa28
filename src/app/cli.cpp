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

#include "app/cli.hpp"
#include "app/version.hpp"

#include "core/str.hpp"

#include <spdlog/spdlog.h>

#include <string_view>

namespace padlink::app {

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                        std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return core::Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return core::Result<std::string_view>::Failf(core::Errc::InvalidArgument, "{} requires value", opt);
  return core::Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

static core::Result<bool> read_switch_value(int& i, int argc, char** argv,
                                            std::string_view a, std::string_view opt) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return core::Result<bool>::Fail(std::move(vr.st));
  if (core::equals_ci(vr.value, "on")) return core::Result<bool>::Ok(true);
  if (core::equals_ci(vr.value, "off")) return core::Result<bool>::Ok(false);
  return core::Result<bool>::Failf(core::Errc::InvalidArgument, "{} expects on|off, got '{}'", opt, vr.value);
}

static core::Result<int> read_positive_value(int& i, int argc, char** argv,
                                             std::string_view a, std::string_view opt) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return core::Result<int>::Fail(std::move(vr.st));
  const auto v = core::parse_int(vr.value);
  if (!v || *v < 0) return core::Result<int>::Failf(core::Errc::InvalidArgument, "{} expects a non-negative number, got '{}'", opt, vr.value);
  return core::Result<int>::Ok(*v);
}

core::Result<core::DeviceId> parse_device_id(std::string_view s) noexcept {
  using R = core::Result<core::DeviceId>;

  const auto c1 = s.find(':');
  if (c1 == std::string_view::npos) return R::Failf(core::Errc::InvalidArgument, "expected VID:PID[:SERIAL], got '{}'", s);
  const auto c2 = s.find(':', c1 + 1);

  const auto vid = core::parse_u16(s.substr(0, c1), 16);
  const auto pid = core::parse_u16(s.substr(c1 + 1, c2 == std::string_view::npos ? std::string_view::npos : c2 - c1 - 1), 16);
  if (!vid || !pid) return R::Failf(core::Errc::InvalidArgument, "invalid vendor/product id in '{}'", s);

  core::DeviceId id;
  id.vendor = *vid;
  id.product = *pid;
  if (c2 != std::string_view::npos) {
    const auto serial = s.substr(c2 + 1);
    if (serial.empty()) return R::Failf(core::Errc::InvalidArgument, "empty serial in '{}'", s);
    id.serial = std::string(serial);
  }
  return R::Ok(std::move(id));
}

core::Result<keypad::SetLed> parse_led(std::string_view s) noexcept {
  using R = core::Result<keypad::SetLed>;

  const auto c = s.find(':');
  if (c == std::string_view::npos) return R::Failf(core::Errc::InvalidArgument, "expected ID:COLOR, got '{}'", s);

  const auto led = core::parse_int(s.substr(0, c));
  if (!led || *led < 0 || *led > 0xFF) return R::Failf(core::Errc::InvalidArgument, "invalid LED id in '{}'", s);

  const auto color = keypad::parse_color(s.substr(c + 1));
  if (!color) return R::Failf(core::Errc::InvalidArgument, "unknown color in '{}'", s);

  return R::Ok(keypad::SetLed{static_cast<std::uint8_t>(*led), *color});
}

std::string usage_text() {
  std::string out;
  out.reserve(2048);

  out += "padlink v";
  out += version_string();
  out += "\n\n";

  out += R"(Usage:
  padlink --list
  padlink [--device VID:PID[:SERIAL]]... --led ID:COLOR [--led ID:COLOR]...
  padlink [--device ...] --serial-console on|off [--filesystem on|off]
  padlink [--device ...] --update FILE [FILE...]
  padlink [--device ...] --monitor [--led ID:COLOR]...

Options:
  --help, -h
  --version
  --list                       print HID devices and mark the ones padlink would use
  --device VID:PID[:SERIAL]    device identification to try, in order (repeatable, hex ids)
  --name-hint NAME             match by product name when no --device is given (default: mutenix)
  --led ID:COLOR               set an LED; colors: red green blue white black yellow cyan magenta orange purple
  --serial-console on|off      enable or disable the device serial console
  --filesystem on|off          expose or hide the device filesystem
  --update FILE...             transfer files and restart the device; NAME.delete removes NAME
  --monitor                    stay connected and print device events until interrupted
  --ping-interval MS           keep-alive period (default 4000)
  --ack-timeout MS             per-chunk acknowledgment timeout (default 1000)
  --retries N                  resends per chunk before giving up (default 3)
  --verbose, -v                enable verbose logging
)";
  return out;
}

core::Result<Options> parse_cli(int argc, char** argv) noexcept {
  using R = core::Result<Options>;
  Options o;
  bool in_update = false;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (!a.starts_with("-")) {
      if (!in_update) return R::Failf(core::Errc::InvalidArgument, "Positional arguments are not supported: {}", a);
      o.update_files.emplace_back(std::string(a));
      continue;
    }
    in_update = false;

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }
    if (a == "--list") { o.list = true; continue; }
    if (a == "--monitor") { o.monitor = true; continue; }

    if (a == "--verbose" || a == "-v") {
      o.verbose = true;
      spdlog::set_level(spdlog::level::debug);
      continue;
    }

    if (is_opt(a, "--device")) {
      auto vr = read_string_value(i, argc, argv, a, "--device");
      if (!vr) return R::Fail(std::move(vr.st));
      auto id = parse_device_id(vr.value);
      if (!id) return R::Fail(std::move(id.st));
      o.devices.push_back(std::move(id.value));
      continue;
    }

    if (is_opt(a, "--name-hint")) {
      auto vr = read_string_value(i, argc, argv, a, "--name-hint");
      if (!vr) return R::Fail(std::move(vr.st));
      if (vr.value.empty()) return R::Fail(core::Errc::InvalidArgument, "--name-hint must not be empty");
      o.name_hint = std::string(vr.value);
      continue;
    }

    if (is_opt(a, "--led")) {
      auto vr = read_string_value(i, argc, argv, a, "--led");
      if (!vr) return R::Fail(std::move(vr.st));
      auto led = parse_led(vr.value);
      if (!led) return R::Fail(std::move(led.st));
      o.leds.push_back(led.value);
      continue;
    }

    if (is_opt(a, "--serial-console")) {
      auto vr = read_switch_value(i, argc, argv, a, "--serial-console");
      if (!vr) return R::Fail(std::move(vr.st));
      o.serial_console = vr.value;
      continue;
    }
    if (is_opt(a, "--filesystem")) {
      auto vr = read_switch_value(i, argc, argv, a, "--filesystem");
      if (!vr) return R::Fail(std::move(vr.st));
      o.filesystem = vr.value;
      continue;
    }

    if (is_opt(a, "--update")) {
      auto vr = read_string_value(i, argc, argv, a, "--update");
      if (!vr) return R::Fail(std::move(vr.st));
      o.update_files.emplace_back(std::string(vr.value));
      in_update = true;
      continue;
    }

    if (is_opt(a, "--ping-interval")) {
      auto vr = read_positive_value(i, argc, argv, a, "--ping-interval");
      if (!vr) return R::Fail(std::move(vr.st));
      if (vr.value == 0) return R::Fail(core::Errc::InvalidArgument, "--ping-interval must be positive");
      o.ping_interval = std::chrono::milliseconds(vr.value);
      continue;
    }
    if (is_opt(a, "--ack-timeout")) {
      auto vr = read_positive_value(i, argc, argv, a, "--ack-timeout");
      if (!vr) return R::Fail(std::move(vr.st));
      if (vr.value == 0) return R::Fail(core::Errc::InvalidArgument, "--ack-timeout must be positive");
      o.ack_timeout = std::chrono::milliseconds(vr.value);
      continue;
    }
    if (is_opt(a, "--retries")) {
      auto vr = read_positive_value(i, argc, argv, a, "--retries");
      if (!vr) return R::Fail(std::move(vr.st));
      o.retries = static_cast<unsigned>(vr.value);
      continue;
    }

    return R::Failf(core::Errc::InvalidArgument, "Unknown option: {}", a);
  }

  if (o.list && (o.monitor || !o.leds.empty() || !o.update_files.empty() || o.serial_console || o.filesystem))
    return R::Fail(core::Errc::InvalidArgument, "--list cannot be combined with device operations");

  if (!o.update_files.empty() && o.monitor)
    return R::Fail(core::Errc::InvalidArgument, "--update cannot be combined with --monitor");

  if (argc == 1) o._no_args = true;
  return R::Ok(std::move(o));
}

} // namespace padlink::app
