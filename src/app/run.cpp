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

#include "app/run.hpp"

#include "engine/device_engine.hpp"
#include "engine/update_engine.hpp"
#include "platform/platform_all.hpp"
#include "protocol/keypad/keypad_wire.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace padlink::app {

using namespace std::chrono_literals;

static constexpr auto kCommandTimeout = 2000ms;

static std::vector<core::DeviceId> default_ids() {
  std::vector<core::DeviceId> out;
  for (const auto& k : keypad::kDefaultIds) out.push_back(core::DeviceId{k.vendor, k.product, std::nullopt});
  out.push_back(core::DeviceId{}); // name hint
  return out;
}

static std::vector<core::DeviceId> identifications(const Options& opt) {
  return opt.devices.empty() ? default_ids() : opt.devices;
}

static void print_devices(const Options& opt) {
  const auto ids = identifications(opt);
  const auto devices = platform::enumerate_hidraw_sysfs();
  if (devices.empty()) {
    spdlog::info("No HID devices found");
    return;
  }
  for (const auto& d : devices) {
    const bool usable = std::any_of(ids.begin(), ids.end(), [&](const auto& id) { return platform::matches(d, id, opt.name_hint); });
    std::cout << (usable ? "* " : "  ") << d.describe() << "\n";
  }
}

static void log_event(const engine::Event& ev) {
  std::visit([](const auto& e) {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, engine::UpdateProgress>) {
      if (e.state == engine::UpdateState::Transferring) spdlog::debug("Update: {}", e);
      else spdlog::info("Update: {}", e);
    } else {
      spdlog::info("{}", e);
    }
  }, ev);
}

// Monitor mode queues the settings so they go out whenever a device shows up.
static core::Status apply_settings(engine::DeviceEngine& eng, const Options& opt) {
  auto send = [&](keypad::Command cmd) {
    return opt.monitor ? eng.send_command(std::move(cmd)) : eng.send_command_sync(std::move(cmd), kCommandTimeout);
  };

  for (const auto& led : opt.leds) {
    PADLINK_TRY(send(led));
  }
  if (opt.serial_console || opt.filesystem) {
    PADLINK_TRY(send(keypad::UpdateConfig{opt.serial_console, opt.filesystem}));
  }
  return core::Status::Ok();
}

RunResult run(const Options& opt) {
  if (opt.list) {
    print_devices(opt);
    return RunResult::Success;
  }

  const bool has_work = opt.monitor || !opt.leds.empty() || !opt.update_files.empty() ||
                        opt.serial_console.has_value() || opt.filesystem.has_value();
  if (!has_work) {
    spdlog::error("Nothing to do. Use --help to see usage.");
    return RunResult::InvalidUsage;
  }

  std::vector<engine::UpdateFile> files;
  if (!opt.update_files.empty()) {
    auto fr = engine::load_update_files(opt.update_files);
    if (!fr) { spdlog::error("{}", fr.st.msg); return RunResult::InvalidUsage; }
    files = std::move(fr.value);
  }

  platform::HidrawDevice dev(opt.name_hint);

  engine::EngineCfg ecfg;
  ecfg.ping_period = opt.ping_interval;
  engine::DeviceEngine eng(dev, ecfg);

  InterruptGuard guard(eng);
  if (auto st = guard.arm(); !st) spdlog::warn("Signals not handled, Ctrl-C will terminate abruptly: {}", st);

  eng.register_callback(log_event);
  if (opt.monitor && !opt.leds.empty()) {
    // The device asks for the LED state after it restarts.
    eng.register_callback([&eng, leds = opt.leds](const engine::Event& ev) {
      const auto* msg = std::get_if<keypad::InboundMessage>(&ev);
      if (!msg || !std::holds_alternative<keypad::StatusRequest>(*msg)) return;
      for (const auto& led : leds) {
        if (auto st = eng.send_command(led); !st) spdlog::warn("Cannot resend LED state: {}", st);
      }
    });
  }

  const auto cst = eng.connect(identifications(opt));
  if (!cst && !opt.monitor) {
    spdlog::error("No device: {}", cst);
    return RunResult::NoDevice;
  }

  if (cst) {
    const auto hw = eng.hardware_info();
    spdlog::info("Using {} {}{}", hw.manufacturer, hw.product_name, hw.serial.empty() ? "" : fmt::format(" (serial {})", hw.serial));
  }

  eng.start();

  if (auto st = apply_settings(eng, opt); !st) {
    spdlog::error("{}", st);
    eng.stop();
    return RunResult::IOFail;
  }

  if (!files.empty()) {
    engine::UpdateCfg ucfg;
    ucfg.ack_timeout = opt.ack_timeout;
    ucfg.retries = opt.retries;

    engine::UpdateEngine updater(eng, ucfg);
    const auto st = updater.begin_update(std::move(files));
    eng.stop();
    return st ? RunResult::Success : RunResult::UpdateFailed;
  }

  if (opt.monitor) {
    spdlog::info("Monitoring, press Ctrl-C to stop");
    eng.run();
    return RunResult::Success;
  }

  // Let queued writes (and a possible ping) finish before closing.
  eng.close_queue();
  eng.run();
  return guard.interrupts() ? RunResult::IOFail : RunResult::Success;
}

} // namespace padlink::app
