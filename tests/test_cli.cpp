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

#include <spdlog/spdlog.h>

#include <cstdio>
#include <initializer_list>
#include <string>
#include <vector>

using namespace padlink;
using namespace padlink::app;

static int g_pass = 0;
static int g_fail = 0;

template <class T>
static void check_eq(const char* label, T got, T expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static void check(const char* label, bool ok) { check_eq(label, ok, true); }

static core::Result<Options> parse(std::initializer_list<const char*> args) {
  std::vector<std::string> storage{"padlink"};
  for (const char* a : args) storage.emplace_back(a);
  std::vector<char*> argv;
  for (auto& s : storage) argv.push_back(s.data());
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

// ----- tests -----

static void test_device_ids() {
  auto a = parse_device_id("1d50:6189");
  check("id_ok", static_cast<bool>(a));
  check_eq("id_vendor", a.value.vendor, std::uint16_t{0x1d50});
  check_eq("id_product", a.value.product, std::uint16_t{0x6189});
  check("id_no_serial", !a.value.serial.has_value());

  auto b = parse_device_id("0x1D50:0x6189:ABC123");
  check("id_serial_ok", static_cast<bool>(b));
  check_eq("id_serial", b.value.serial.value_or(""), std::string("ABC123"));

  check("id_missing_colon", !parse_device_id("1d506189"));
  check("id_bad_hex", !parse_device_id("zz:6189"));
  check("id_too_wide", !parse_device_id("12345:1"));
  check("id_empty_serial", !parse_device_id("1d50:6189:"));
  check("id_error_code", parse_device_id("x").st.code == core::Errc::InvalidArgument);
}

static void test_leds() {
  auto a = parse_led("3:Red");
  check("led_ok", static_cast<bool>(a));
  check_eq("led_id", a.value.led, std::uint8_t{3});
  check("led_color", a.value.color == keypad::LedColor::Red);

  check("led_no_colon", !parse_led("3red"));
  check("led_bad_color", !parse_led("1:mauve"));
  check("led_negative", !parse_led("-1:red"));
  check("led_out_of_range", !parse_led("256:red"));
}

static void test_options() {
  auto none = parse({});
  check("none_ok", static_cast<bool>(none));
  check("none_flag", none.value._no_args);

  auto leds = parse({"--device", "1d50:6189", "--led", "1:green", "--led=2:blue", "--serial-console", "off"});
  check("leds_ok", static_cast<bool>(leds));
  check_eq("leds_devices", leds.value.devices.size(), std::size_t{1});
  check_eq("leds_count", leds.value.leds.size(), std::size_t{2});
  check("leds_serial_off", leds.value.serial_console == std::optional<bool>(false));
  check("leds_filesystem_unset", !leds.value.filesystem.has_value());

  auto up = parse({"--update", "main.py", "lib.py", "old.py.delete", "--retries", "5"});
  check("update_ok", static_cast<bool>(up));
  check_eq("update_files", up.value.update_files.size(), std::size_t{3});
  check_eq("update_retries", up.value.retries, 5u);

  auto timing = parse({"--monitor", "--ping-interval=250", "--ack-timeout", "300", "--name-hint", "pad"});
  check("timing_ok", static_cast<bool>(timing));
  check("timing_monitor", timing.value.monitor);
  check_eq("timing_ping", timing.value.ping_interval.count(), std::chrono::milliseconds::rep{250});
  check_eq("timing_ack", timing.value.ack_timeout.count(), std::chrono::milliseconds::rep{300});
  check_eq("timing_hint", timing.value.name_hint, std::string("pad"));
}

static void test_rejections() {
  check("unknown_option", !parse({"--frobnicate"}));
  check("stray_positional", !parse({"main.py"}));
  check("missing_value", !parse({"--led"}));
  check("bad_switch", !parse({"--filesystem", "maybe"}));
  check("zero_ping", !parse({"--ping-interval", "0"}));
  check("negative_retries", !parse({"--retries", "-2"}));
  check("list_with_led", !parse({"--list", "--led", "1:red"}));
  check("update_with_monitor", !parse({"--monitor", "--update", "a.py"}));
  check("empty_hint", !parse({"--name-hint="}));
  check("rejection_code", parse({"--nope"}).st.code == core::Errc::InvalidArgument);
}

int main() {
  spdlog::set_level(spdlog::level::off);

  test_device_ids();
  test_leds();
  test_options();
  test_rejections();

  std::fprintf(stdout, "cli: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
