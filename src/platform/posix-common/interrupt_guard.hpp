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

#include "core/status.hpp"

#include <atomic>
#include <chrono>
#include <signal.h>
#include <thread>

namespace padlink {

namespace engine { class DeviceEngine; }

// Turns SIGINT, SIGTERM and SIGHUP into an orderly engine shutdown. The first
// signal calls DeviceEngine::stop(): pending sync sends and an update in
// progress end with Cancelled, queued reports are drained and the device is
// closed. Later signals are counted and logged only.
//
// arm() must run before the engine starts its duties; threads created
// afterwards inherit the blocked mask, so the signals reach the watcher only.
class InterruptGuard {
public:
  explicit InterruptGuard(engine::DeviceEngine& eng,
                          std::chrono::milliseconds poll = std::chrono::milliseconds(100));
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard&) = delete;
  InterruptGuard& operator=(const InterruptGuard&) = delete;

  core::Status arm() noexcept;
  // Joins the watcher and restores the previous signal mask.
  void disarm() noexcept;

  bool armed() const noexcept { return armed_; }
  int interrupts() const noexcept { return interrupts_.load(std::memory_order_acquire); }
  int last_signal() const noexcept { return last_signal_.load(std::memory_order_acquire); }

private:
  void watch_(std::stop_token st);
  void on_signal_(int signo);

  engine::DeviceEngine& eng_;
  std::chrono::milliseconds poll_;

  sigset_t set_{};
  sigset_t old_mask_{};
  bool armed_ = false;

  std::atomic_int interrupts_{0};
  std::atomic_int last_signal_{0};
  std::jthread watcher_{};
};

} // namespace padlink
