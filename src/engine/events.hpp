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

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace padlink::engine {

enum class UpdateState { Idle, Preparing, Transferring, Finalizing, Resetting, Aborted };

constexpr std::string_view update_state_name(UpdateState s) noexcept {
  switch (s) {
    case UpdateState::Idle: return "idle";
    case UpdateState::Preparing: return "preparing";
    case UpdateState::Transferring: return "transferring";
    case UpdateState::Finalizing: return "finalizing";
    case UpdateState::Resetting: return "resetting";
    case UpdateState::Aborted: return "aborted";
  }
  return "unknown";
}

// Published on every stage change and every acknowledged chunk. The status
// field carries the failure when state == Aborted.
struct UpdateProgress {
  UpdateState state = UpdateState::Idle;
  std::size_t file_index = 0;
  std::size_t file_count = 0;
  std::string file_name;
  std::size_t chunks_acked = 0;
  std::size_t chunks_total = 0;
  core::Status status{};
};

using Event = std::variant<keypad::InboundMessage, UpdateProgress>;
using Callback = std::function<void(const Event&)>;

} // namespace padlink::engine

template <>
struct fmt::formatter<padlink::engine::UpdateProgress> : fmt::formatter<std::string_view> {
  template <class Ctx>
  auto format(const padlink::engine::UpdateProgress& p, Ctx& ctx) const {
    using padlink::engine::UpdateState;
    switch (p.state) {
      case UpdateState::Transferring:
        return fmt::format_to(ctx.out(), "transferring {} ({}/{}): {}/{} chunks", p.file_name, p.file_index + 1,
                              p.file_count, p.chunks_acked, p.chunks_total);
      case UpdateState::Aborted:
        return fmt::format_to(ctx.out(), "aborted: {}", p.status);
      default:
        return fmt::formatter<std::string_view>::format(padlink::engine::update_state_name(p.state), ctx);
    }
  }
};
