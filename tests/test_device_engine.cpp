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

#include "engine/device_engine.hpp"
#include "fake_hid_transport.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace padlink;
using namespace padlink::engine;
using namespace std::chrono_literals;
using padlink::test::FakeHidTransport;
using padlink::test::Report;

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

static EngineCfg fast_cfg(std::chrono::milliseconds ping = 10s, std::chrono::milliseconds backoff = 20ms) {
  EngineCfg c;
  c.ping_period = ping;
  c.read_timeout = 10ms;
  c.supervisor.backoff = backoff;
  return c;
}

template <class Pred>
static bool eventually(Pred p, std::chrono::milliseconds limit = 3s) {
  const auto end = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < end) {
    if (p()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return p();
}

static std::vector<Report> commands_with_id(const FakeHidTransport& t, std::uint8_t id) {
  std::vector<Report> out;
  for (auto& w : t.writes())
    if (test::is_command(w) && w[1] == id) out.push_back(w);
  return out;
}

// Records inbound messages delivered to callbacks.
struct Inbox {
  std::mutex m;
  std::vector<keypad::InboundMessage> msgs;

  Callback callback() {
    return [this](const Event& ev) {
      if (const auto* msg = std::get_if<keypad::InboundMessage>(&ev)) {
        std::lock_guard lk(m);
        msgs.push_back(*msg);
      }
    };
  }

  std::size_t size() {
    std::lock_guard lk(m);
    return msgs.size();
  }
};

// ----- tests -----

static void test_fifo_order_survives_pings() {
  FakeHidTransport t;
  DeviceEngine eng(t, fast_cfg(15ms));
  check("fifo_connect", static_cast<bool>(eng.connect({})));
  eng.start();

  for (std::uint8_t led = 0; led < 20; ++led) {
    check("fifo_enqueue", static_cast<bool>(eng.send_command(keypad::SetLed{led, keypad::LedColor::Green})));
    if (led % 5 == 4) std::this_thread::sleep_for(40ms);  // let keep-alive fire in between
  }

  check("fifo_all_written", eventually([&] { return commands_with_id(t, 0x01).size() == 20; }));
  check("fifo_pings_sent", eventually([&] { return !commands_with_id(t, 0xF0).empty(); }));

  const auto leds = commands_with_id(t, 0x01);
  bool ordered = leds.size() == 20;
  for (std::size_t i = 0; ordered && i < leds.size(); ++i) ordered = leds[i][2] == i;
  check("fifo_order", ordered);

  eng.stop();
}

static void test_no_ping_while_busy() {
  FakeHidTransport t;
  DeviceEngine eng(t, fast_cfg(200ms));
  check("busy_connect", static_cast<bool>(eng.connect({})));
  eng.start();

  // A write every 50ms keeps the link busy for longer than one ping period.
  for (int i = 0; i < 8; ++i) {
    (void)eng.send_command_sync(keypad::SetLed{1, keypad::LedColor::Red}, 1s);
    std::this_thread::sleep_for(50ms);
  }
  check("busy_no_ping", commands_with_id(t, 0xF0).empty());
  eng.stop();
}

static void test_counter_increments_and_resets() {
  FakeHidTransport t;
  DeviceEngine eng(t, fast_cfg());
  check("counter_connect", static_cast<bool>(eng.connect({})));
  eng.start();

  for (int i = 0; i < 3; ++i)
    check("counter_sync_send", static_cast<bool>(eng.send_command_sync(keypad::SetLed{1, keypad::LedColor::Blue}, 1s)));

  auto w = t.writes();
  check_eq("counter_writes", w.size(), std::size_t{3});
  if (w.size() == 3) {
    check_eq("counter_0", w[0][8], std::uint8_t{0});
    check_eq("counter_1", w[1][8], std::uint8_t{1});
    check_eq("counter_2", w[2][8], std::uint8_t{2});
  }

  t.fail_next_reads();
  check("counter_reopened", t.wait_for_open_calls(2, 3s));
  check("counter_connected_again", eventually([&] { return eng.connection_status() == ConnectionState::Connected; }));

  check("counter_send_after_reconnect",
        static_cast<bool>(eng.send_command_sync(keypad::SetLed{2, keypad::LedColor::Blue}, 1s)));
  w = t.writes();
  check("counter_restarted", !w.empty() && w.back()[8] == 0);

  eng.stop();
}

static void test_read_failure_disconnects_then_reconnects() {
  FakeHidTransport t;
  DeviceEngine eng(t, fast_cfg(10s, 300ms));
  check("rf_connect", static_cast<bool>(eng.connect({})));
  eng.start();
  check("rf_connected", eng.connection_status() == ConnectionState::Connected);
  check_eq("rf_hw_product", eng.hardware_info().product_name, std::string("Fake Keypad"));
  check_eq("rf_hw_serial", eng.hardware_info().serial, std::string("0001"));

  t.fail_next_reads();
  check("rf_disconnected", eventually([&] { return eng.connection_status() == ConnectionState::Disconnected; }));
  check("rf_reconnected", eventually([&] { return eng.connection_status() == ConnectionState::Connected; }));
  check_eq("rf_open_calls", t.open_calls(), 2);

  eng.stop();
}

static void test_write_failure_keeps_queue() {
  FakeHidTransport t;
  DeviceEngine eng(t, fast_cfg());
  check("wf_connect", static_cast<bool>(eng.connect({})));

  t.fail_next_writes();
  check("wf_enqueue_1", static_cast<bool>(eng.send_command(keypad::SetLed{1, keypad::LedColor::Red})));
  check("wf_enqueue_2", static_cast<bool>(eng.send_command(keypad::SetLed{2, keypad::LedColor::Red})));
  check("wf_enqueue_3", static_cast<bool>(eng.send_command(keypad::SetLed{3, keypad::LedColor::Red})));
  eng.start();

  check("wf_rest_written", eventually([&] { return commands_with_id(t, 0x01).size() == 2; }));
  const auto leds = commands_with_id(t, 0x01);
  check("wf_order_kept", leds.size() == 2 && leds[0][2] == 2 && leds[1][2] == 3);
  check_eq("wf_reopened", t.open_calls(), 2);

  eng.stop();
}

static void test_sync_send_while_disconnected() {
  FakeHidTransport t;
  t.fail_next_opens(1000);
  DeviceEngine eng(t, fast_cfg());
  check("offline_connect_fails", !eng.connect({}));
  eng.start();

  const auto st = eng.send_command_sync(keypad::Ping{}, 1s);
  check("offline_sync_transport", !st && st.code == core::Errc::Transport);

  eng.stop();
  check("offline_nothing_written", t.write_count() == 0);
}

static void test_inbound_dispatch() {
  FakeHidTransport t;
  DeviceEngine eng(t, fast_cfg());
  Inbox first, second;
  eng.register_callback(first.callback());
  eng.register_callback(second.callback());
  check("rx_connect", static_cast<bool>(eng.connect({})));
  eng.start();

  t.push_inbound(test::status_report(2, true, false, true, false));
  t.push_inbound(Report{0x01});                       // truncated, dropped
  t.push_inbound(test::ack_report(0, 0, 1));          // no update running: goes to callbacks
  t.push_inbound(Report{0x01, 'L', 'D', 'o', 'k', 0});

  check("rx_three_delivered", eventually([&] { return first.size() == 3 && second.size() == 3; }));
  std::this_thread::sleep_for(30ms);
  check_eq("rx_truncated_dropped", first.size(), std::size_t{3});
  check("rx_still_connected", eng.connection_status() == ConnectionState::Connected);

  {
    std::lock_guard lk(first.m);
    check("rx_order_status", first.msgs.size() == 3 && std::holds_alternative<keypad::ButtonStatus>(first.msgs[0]));
    check("rx_order_ack", first.msgs.size() == 3 && std::holds_alternative<keypad::ChunkAck>(first.msgs[1]));
    check("rx_order_log", first.msgs.size() == 3 && std::holds_alternative<keypad::LogMessage>(first.msgs[2]));
  }

  eng.stop();
}

static void test_acks_claimed_while_tracking() {
  FakeHidTransport t;
  DeviceEngine eng(t, fast_cfg());
  Inbox inbox;
  eng.register_callback(inbox.callback());
  check("claim_connect", static_cast<bool>(eng.connect({})));
  eng.start();

  eng.acks().activate();
  t.push_inbound(test::ack_report(1, 2, 2));
  auto r = eng.acks().wait(AckTracker::clock::now() + 2s);
  check("claim_received", static_cast<bool>(r));
  check("claim_is_ack", r && std::holds_alternative<keypad::ChunkAck>(r.value));
  check_eq("claim_not_dispatched", inbox.size(), std::size_t{0});

  t.fail_next_reads();
  auto f = eng.acks().wait(AckTracker::clock::now() + 2s);
  check("claim_disconnect_fails_wait", !f && f.st.code == core::Errc::Transport);
  eng.acks().deactivate();

  eng.stop();
}

static void test_close_queue_lets_run_return() {
  FakeHidTransport t;
  DeviceEngine eng(t, fast_cfg());
  check("cq_connect", static_cast<bool>(eng.connect({})));
  check("cq_enqueue", static_cast<bool>(eng.send_command(keypad::SetLed{4, keypad::LedColor::White})));
  eng.close_queue();
  eng.run();
  check_eq("cq_written", commands_with_id(t, 0x01).size(), std::size_t{1});
  check("cq_rejects_after_close", !eng.send_command(keypad::Ping{}));
}

int main() {
  spdlog::set_level(spdlog::level::warn);

  test_fifo_order_survives_pings();
  test_no_ping_while_busy();
  test_counter_increments_and_resets();
  test_read_failure_disconnects_then_reconnects();
  test_write_failure_keeps_queue();
  test_sync_send_while_disconnected();
  test_inbound_dispatch();
  test_acks_claimed_while_tracking();
  test_close_queue_lets_run_return();

  std::fprintf(stdout, "device engine: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
