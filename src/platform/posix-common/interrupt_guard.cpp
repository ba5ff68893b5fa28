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

#include "platform/posix-common/interrupt_guard.hpp"

#include "engine/device_engine.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <ctime>

#include <pthread.h>

namespace padlink {

namespace {

sigset_t shutdown_signals() {
  sigset_t set{};
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGHUP);
  return set;
}

const char* signal_name(int signo) {
  switch (signo) {
    case SIGINT: return "SIGINT";
    case SIGTERM: return "SIGTERM";
    case SIGHUP: return "SIGHUP";
    default: return "signal";
  }
}

} // namespace

InterruptGuard::InterruptGuard(engine::DeviceEngine& eng, std::chrono::milliseconds poll)
    : eng_(eng), poll_(poll), set_(shutdown_signals()) {}

InterruptGuard::~InterruptGuard() { disarm(); }

core::Status InterruptGuard::arm() noexcept {
  if (armed_) return core::Status::Ok();

  if (const int rc = ::pthread_sigmask(SIG_BLOCK, &set_, &old_mask_); rc != 0)
    return core::Status::Failf(core::Errc::InvalidArgument, "pthread_sigmask: {}", std::strerror(rc));

  armed_ = true;
  watcher_ = std::jthread([this](std::stop_token st) { watch_(st); });
  return core::Status::Ok();
}

void InterruptGuard::disarm() noexcept {
  if (!armed_) return;

  watcher_.request_stop();
  if (watcher_.joinable()) watcher_.join();

  (void)::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
  armed_ = false;
}

// sigtimedwait in slices so a disarm never needs to signal the watcher.
void InterruptGuard::watch_(std::stop_token st) {
  const auto ms = poll_.count();
  const timespec slice{static_cast<std::time_t>(ms / 1000), static_cast<long>((ms % 1000) * 1'000'000)};

  while (!st.stop_requested()) {
    const int signo = ::sigtimedwait(&set_, nullptr, &slice);
    if (signo < 0) {
      if (errno != EAGAIN && errno != EINTR) spdlog::error("sigtimedwait: {}", std::strerror(errno));
      continue;
    }
    on_signal_(signo);
  }
}

void InterruptGuard::on_signal_(int signo) {
  last_signal_.store(signo, std::memory_order_release);
  const int n = interrupts_.fetch_add(1, std::memory_order_acq_rel) + 1;

  if (n > 1) {
    spdlog::warn("{} ignored ({} times), still shutting down", signal_name(signo), n);
    return;
  }

  spdlog::warn("{} received, stopping", signal_name(signo));
  eng_.stop();
}

} // namespace padlink
