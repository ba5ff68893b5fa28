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

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace padlink::core {

// Multi-producer, single-consumer FIFO. Closing wakes the consumer; items
// already queued stay poppable until drained.
template <class T>
class Channel {
public:
  Channel() = default;

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  Status push(T item) {
    {
      std::lock_guard lk(m_);
      if (closed_) return Status::Fail(Errc::Cancelled, "channel closed");
      q_.push_back(std::move(item));
    }
    cv_.notify_one();
    return Status::Ok();
  }

  std::optional<T> pop(std::stop_token st) {
    std::unique_lock lk(m_);
    cv_.wait(lk, st, [&] { return closed_ || !q_.empty(); });
    if (q_.empty()) return std::nullopt;

    T item = std::move(q_.front());
    q_.pop_front();
    return item;
  }

  void close() noexcept {
    {
      std::lock_guard lk(m_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  std::vector<T> drain() {
    std::lock_guard lk(m_);
    std::vector<T> out;
    out.reserve(q_.size());
    for (auto& it : q_) out.push_back(std::move(it));
    q_.clear();
    return out;
  }

  bool closed() const noexcept {
    std::lock_guard lk(m_);
    return closed_;
  }

  std::size_t size() const noexcept {
    std::lock_guard lk(m_);
    return q_.size();
  }

private:
  mutable std::mutex m_;
  std::condition_variable_any cv_;
  std::deque<T> q_;
  bool closed_ = false;
};

} // namespace padlink::core
