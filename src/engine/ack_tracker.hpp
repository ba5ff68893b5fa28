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
#include "protocol/keypad/messages.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>

namespace padlink::engine {

// Hand-off point between the receive duty and the update engine. While
// active it claims ChunkAck and UpdateError messages in arrival order; a
// failure (disconnect, stop) is sticky until the next activate().
class AckTracker {
public:
  using clock = std::chrono::steady_clock;
  using Item = std::variant<keypad::ChunkAck, keypad::UpdateError>;

  void activate();
  void deactivate();
  bool active() const;

  // Returns true when the message was claimed.
  bool offer(const keypad::InboundMessage& msg);

  // No effect while inactive.
  void fail(core::Status st);

  // Next claimed message, Errc::Timeout at the deadline, or the failure
  // passed to fail().
  core::Result<Item> wait(clock::time_point deadline);

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::deque<Item> q_;
  std::optional<core::Status> failure_;
  bool active_ = false;
};

} // namespace padlink::engine
