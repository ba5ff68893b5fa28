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

#include "core/channel.hpp"
#include "core/hid_transport.hpp"
#include "core/status.hpp"
#include "engine/ack_tracker.hpp"
#include "engine/connection_supervisor.hpp"
#include "engine/events.hpp"
#include "protocol/keypad/chunks.hpp"
#include "protocol/keypad/commands.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <thread>
#include <variant>
#include <vector>

namespace padlink::engine {

struct EngineCfg {
  std::chrono::milliseconds ping_period{4000};
  std::chrono::milliseconds read_timeout{100};
  SupervisorCfg supervisor{};
};

// Single owner of the device channel. Three duties run concurrently once
// started: receive (poll, decode, dispatch), transmit (drain the outbound
// queue in FIFO order) and keep-alive (ping when idle).
class DeviceEngine {
public:
  using clock = std::chrono::steady_clock;

  explicit DeviceEngine(core::IHidTransport& transport, EngineCfg cfg = {});
  ~DeviceEngine();

  DeviceEngine(const DeviceEngine&) = delete;
  DeviceEngine& operator=(const DeviceEngine&) = delete;

  core::Status connect(std::vector<core::DeviceId> ids) noexcept;

  // Callbacks run on the receive duty (inbound messages) or on the update
  // caller's thread (progress), in registration order. They must not call
  // stop().
  void register_callback(Callback fn);

  core::Status send_command(keypad::Command cmd) noexcept;

  // Enqueue, then wait for the write outcome. A report enqueued on one
  // connection is never written on the next one.
  core::Status send_command_sync(keypad::Command cmd, std::chrono::milliseconds timeout) noexcept;
  core::Status send_transfer_sync(keypad::TransferChunk chunk, std::chrono::milliseconds timeout) noexcept;

  void start();

  // start() and block until stop() or until the queue was closed and drained.
  void run();
  // Final: a stopped engine does not start again, and run() returns at once.
  void stop() noexcept;

  // Reject further sends; run() returns once the queued reports are written.
  void close_queue() noexcept;

  ConnectionState connection_status() const noexcept { return sup_.state(); }
  core::HardwareInfo hardware_info() const { return sup_.hardware_info(); }

  AckTracker& acks() noexcept { return acks_; }
  void publish(const Event& ev);

private:
  struct Completion {
    std::promise<core::Status> promise;
    std::atomic_bool abandoned{false};
  };

  using Payload = std::variant<keypad::Command, keypad::TransferChunk>;

  struct OutboundItem {
    Payload payload;
    std::shared_ptr<Completion> done;
    std::optional<std::uint64_t> generation;
  };

  core::Status enqueue_(Payload p) noexcept;
  core::Status send_sync_(Payload p, std::chrono::milliseconds timeout) noexcept;

  void receive_duty_(std::stop_token st);
  void transmit_duty_(std::stop_token st);
  void keepalive_duty_(std::stop_token st);

  void handle_report_(std::span<const std::uint8_t> report);
  void write_item_(OutboundItem& item);
  void on_state_change_(ConnectionState s);

  static void resolve_(OutboundItem& item, core::Status st);

private:
  EngineCfg cfg_;
  ConnectionSupervisor sup_;
  AckTracker acks_;

  core::Channel<OutboundItem> queue_;

  mutable std::shared_mutex cb_m_;
  std::vector<Callback> callbacks_;

  // Owned by the transmit duty.
  std::uint8_t counter_ = 0;
  std::uint64_t counter_gen_ = 0;

  std::atomic<clock::rep> last_tx_{0};

  std::jthread rx_;
  std::jthread tx_;
  std::jthread ka_;

  std::mutex run_m_;
  std::condition_variable run_cv_;
  bool started_ = false;
  bool stopped_ = false;
  bool finished_ = false;
};

} // namespace padlink::engine
