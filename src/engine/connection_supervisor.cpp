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

#include "engine/connection_supervisor.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace padlink::engine {

ConnectionSupervisor::ConnectionSupervisor(core::IHidTransport& transport, SupervisorCfg cfg)
    : transport_(transport), cfg_(cfg) {}

ConnectionSupervisor::~ConnectionSupervisor() { stop(); }

void ConnectionSupervisor::set_listener(Listener fn) {
  std::lock_guard lk(transition_m_);
  listener_ = std::move(fn);
}

core::Status ConnectionSupervisor::connect(std::vector<core::DeviceId> ids) {
  {
    std::lock_guard lk(transition_m_);
    ids_ = std::move(ids);
  }
  return connect();
}

core::Status ConnectionSupervisor::connect() {
  std::lock_guard tl(transition_m_);
  if (state() == ConnectionState::Connected) return core::Status::Ok();

  const std::vector<core::DeviceId> candidates = ids_.empty() ? std::vector<core::DeviceId>{core::DeviceId{}} : ids_;

  core::Status last = core::Status::Fail(core::Errc::Transport, "no candidate identifications");
  {
    std::unique_lock io(io_m_);
    for (const auto& id : candidates) {
      last = transport_.open(id);
      if (!last) {
        spdlog::debug("Open {:04x}:{:04x} failed: {}", id.vendor, id.product, last);
        continue;
      }
      info_ = transport_.info();
      generation_.fetch_add(1, std::memory_order_acq_rel);
      state_.store(ConnectionState::Connected, std::memory_order_release);
      break;
    }
  }

  if (!last) return last;

  spdlog::info("Connected to {} [{:04x}:{:04x}] {}", info_.product_name.empty() ? "device" : info_.product_name,
               info_.vendor, info_.product, info_.path);
  transition_(ConnectionState::Connected);
  return core::Status::Ok();
}

void ConnectionSupervisor::close() noexcept {
  std::lock_guard tl(transition_m_);
  {
    std::unique_lock io(io_m_);
    if (state() == ConnectionState::Disconnected) {
      transport_.close();
      return;
    }
    transport_.close();
    state_.store(ConnectionState::Disconnected, std::memory_order_release);
  }
  spdlog::info("Disconnected");
  transition_(ConnectionState::Disconnected);
}

void ConnectionSupervisor::start() {
  if (loop_thread_.joinable()) return;
  loop_thread_ = std::jthread([this](std::stop_token st) { loop_(st); });
}

void ConnectionSupervisor::stop() noexcept {
  if (loop_thread_.joinable()) {
    loop_thread_.request_stop();
    loop_thread_.join();
  }
}

core::HardwareInfo ConnectionSupervisor::hardware_info() const {
  std::shared_lock io(io_m_);
  return info_;
}

bool ConnectionSupervisor::wait_connected(std::stop_token st, std::chrono::milliseconds timeout) {
  std::unique_lock lk(wait_m_);
  return wait_cv_.wait_for(lk, st, timeout, [&] { return state() == ConnectionState::Connected; });
}

core::Result<std::size_t> ConnectionSupervisor::read(std::span<std::uint8_t> out, int timeout_ms) {
  std::uint64_t gen = 0;
  core::Result<std::size_t> r;
  {
    std::shared_lock io(io_m_);
    if (state() != ConnectionState::Connected)
      return core::Result<std::size_t>::Fail(core::Errc::Transport, "not connected");
    gen = generation();
    r = transport_.read(out, timeout_ms);
  }
  if (!r) mark_disconnected_(gen, r.st);
  return r;
}

core::Status ConnectionSupervisor::write(std::span<const std::uint8_t> report) {
  std::uint64_t gen = 0;
  core::Status st;
  {
    std::shared_lock io(io_m_);
    if (state() != ConnectionState::Connected) return core::Status::Fail(core::Errc::Transport, "not connected");
    gen = generation();
    st = transport_.write(report);
  }
  if (!st) mark_disconnected_(gen, st);
  return st;
}

void ConnectionSupervisor::mark_disconnected_(std::uint64_t gen, const core::Status& why) {
  std::lock_guard tl(transition_m_);
  {
    std::unique_lock io(io_m_);
    // A failure observed on an older handle must not close a fresh one.
    if (gen != generation() || state() != ConnectionState::Connected) return;
    transport_.close();
    state_.store(ConnectionState::Disconnected, std::memory_order_release);
  }
  spdlog::warn("Device lost: {}", why);
  transition_(ConnectionState::Disconnected);
}

// Called with transition_m_ held.
void ConnectionSupervisor::transition_(ConnectionState to) {
  { std::lock_guard lk(wait_m_); }
  wait_cv_.notify_all();
  if (listener_) listener_(to);
}

void ConnectionSupervisor::loop_(std::stop_token st) {
  bool quiet = false;

  while (!st.stop_requested()) {
    {
      std::unique_lock lk(wait_m_);
      wait_cv_.wait(lk, st, [&] { return state() == ConnectionState::Disconnected; });
      if (st.stop_requested()) break;

      (void)wait_cv_.wait_for(lk, st, cfg_.backoff, [] { return false; });
      if (st.stop_requested()) break;
    }

    const auto s = connect();
    if (s) {
      quiet = false;
    } else if (!quiet) {
      spdlog::warn("Reconnect failed, retrying every {} ms: {}", cfg_.backoff.count(), s);
      quiet = true;
    } else {
      spdlog::debug("Reconnect failed: {}", s);
    }
  }
}

} // namespace padlink::engine
