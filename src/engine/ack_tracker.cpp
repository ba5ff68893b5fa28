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

#include "engine/ack_tracker.hpp"

namespace padlink::engine {

void AckTracker::activate() {
  std::lock_guard lk(m_);
  q_.clear();
  failure_.reset();
  active_ = true;
}

void AckTracker::deactivate() {
  {
    std::lock_guard lk(m_);
    active_ = false;
    q_.clear();
    failure_.reset();
  }
  cv_.notify_all();
}

bool AckTracker::active() const {
  std::lock_guard lk(m_);
  return active_;
}

bool AckTracker::offer(const keypad::InboundMessage& msg) {
  {
    std::lock_guard lk(m_);
    if (!active_) return false;

    if (const auto* a = std::get_if<keypad::ChunkAck>(&msg)) q_.emplace_back(*a);
    else if (const auto* e = std::get_if<keypad::UpdateError>(&msg)) q_.emplace_back(*e);
    else return false;
  }
  cv_.notify_all();
  return true;
}

void AckTracker::fail(core::Status st) {
  {
    std::lock_guard lk(m_);
    if (!active_ || failure_) return;
    failure_ = std::move(st);
  }
  cv_.notify_all();
}

core::Result<AckTracker::Item> AckTracker::wait(clock::time_point deadline) {
  using R = core::Result<Item>;

  std::unique_lock lk(m_);
  (void)cv_.wait_until(lk, deadline, [&] { return !q_.empty() || failure_.has_value() || !active_; });

  // Messages that arrived before a failure are still delivered first.
  if (!q_.empty()) {
    Item it = std::move(q_.front());
    q_.pop_front();
    return R::Ok(std::move(it));
  }
  if (failure_) return R::Fail(*failure_);
  if (!active_) return R::Fail(core::Errc::Cancelled, "acknowledgment tracker inactive");
  return R::Fail(core::Errc::Timeout, "acknowledgment deadline passed");
}

} // namespace padlink::engine
