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

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>

namespace padlink::core {

// Fixed-period ticker. Deadlines are computed from the start point, not from
// the wake-up time, so jitter does not accumulate. Ticks that were missed
// while the caller was busy are skipped, never delivered late in a burst.
class Ticker {
public:
  using clock = std::chrono::steady_clock;

  explicit Ticker(clock::duration period, clock::time_point start = clock::now())
      : period_(period > clock::duration::zero() ? period : clock::duration(1)), next_(start + period_) {}

  // Blocks until the next tick. Returns false when stop was requested.
  bool wait(std::stop_token st) {
    {
      std::unique_lock lk(m_);
      (void)cv_.wait_until(lk, st, next_, [] { return false; });
      if (st.stop_requested()) return false;
    }
    advance(clock::now());
    return true;
  }

  // Moves the deadline past `now`, dropping any whole periods already gone.
  // Returns how many ticks were skipped.
  std::uint64_t advance(clock::time_point now) noexcept {
    std::uint64_t skipped = 0;
    next_ += period_;
    if (next_ <= now) {
      const auto behind = now - next_;
      const auto n = static_cast<std::uint64_t>(behind / period_) + 1;
      next_ += period_ * static_cast<std::int64_t>(n);
      skipped = n;
    }
    skipped_ += skipped;
    return skipped;
  }

  clock::time_point next_deadline() const noexcept { return next_; }
  clock::duration period() const noexcept { return period_; }
  std::uint64_t skipped() const noexcept { return skipped_; }

private:
  clock::duration period_;
  clock::time_point next_;
  std::uint64_t skipped_ = 0;

  std::mutex m_;
  std::condition_variable_any cv_;
};

} // namespace padlink::core
