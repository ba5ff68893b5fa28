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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <stop_token>
#include <string_view>
#include <thread>
#include <vector>

namespace padlink::engine {

enum class ConnectionState { Disconnected, Connected };

constexpr std::string_view connection_state_name(ConnectionState s) noexcept {
  return s == ConnectionState::Connected ? "connected" : "disconnected";
}

struct SupervisorCfg {
  std::chrono::milliseconds backoff{1000};
};

// Owns the transport handle and the connection state. Duties do their I/O
// through read()/write(), which hold the handle lock shared; open and close
// hold it exclusively. A failed read or write closes the handle and drops
// the state to Disconnected; the reconnect loop then retries every backoff.
class ConnectionSupervisor {
public:
  using Listener = std::function<void(ConnectionState)>;

  explicit ConnectionSupervisor(core::IHidTransport& transport, SupervisorCfg cfg = {});
  ~ConnectionSupervisor();

  ConnectionSupervisor(const ConnectionSupervisor&) = delete;
  ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

  // Invoked on every state change, serialized. Must not call back into the
  // supervisor's connect() or close().
  void set_listener(Listener fn);

  // Replaces the identification list and tries each entry once, in order.
  // An empty list matches by product name (see IHidTransport::open).
  core::Status connect(std::vector<core::DeviceId> ids);
  core::Status connect();

  void close() noexcept;

  void start();
  void stop() noexcept;

  ConnectionState state() const noexcept { return state_.load(std::memory_order_acquire); }
  std::uint64_t generation() const noexcept { return generation_.load(std::memory_order_acquire); }
  core::HardwareInfo hardware_info() const;

  // Blocks until Connected, stop, or timeout. Returns true when Connected.
  bool wait_connected(std::stop_token st, std::chrono::milliseconds timeout);

  core::Result<std::size_t> read(std::span<std::uint8_t> out, int timeout_ms);
  core::Status write(std::span<const std::uint8_t> report);

private:
  void loop_(std::stop_token st);
  void mark_disconnected_(std::uint64_t gen, const core::Status& why);
  void transition_(ConnectionState to);

private:
  core::IHidTransport& transport_;
  SupervisorCfg cfg_;

  std::mutex transition_m_;         // serializes open/close and listener calls
  mutable std::shared_mutex io_m_;  // guards the transport handle

  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  std::atomic<std::uint64_t> generation_{0};

  std::vector<core::DeviceId> ids_;
  core::HardwareInfo info_{};
  Listener listener_;

  std::mutex wait_m_;
  std::condition_variable_any wait_cv_;

  std::jthread loop_thread_;
};

} // namespace padlink::engine
