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
#include "engine/device_engine.hpp"
#include "engine/events.hpp"
#include "protocol/keypad/chunks.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace padlink::engine {

struct UpdateFile {
  std::string name;                 // destination name on the device
  std::vector<std::uint8_t> bytes;
  bool remove = false;              // send FileDelete instead of the contents
};

struct UpdateCfg {
  std::chrono::milliseconds ack_timeout{1000};
  unsigned retries = 3;
  std::chrono::milliseconds settle{500};
  std::chrono::milliseconds write_timeout{2000};
};

// Drives prepare, transfer, finalize and reset on top of a running
// DeviceEngine. One update at a time; begin_update blocks until the update
// reaches Idle again or Aborted, and returns the terminal result.
class UpdateEngine {
public:
  explicit UpdateEngine(DeviceEngine& engine, UpdateCfg cfg = {});

  UpdateEngine(const UpdateEngine&) = delete;
  UpdateEngine& operator=(const UpdateEngine&) = delete;

  core::Status begin_update(std::vector<UpdateFile> files) noexcept;

  UpdateState state() const noexcept { return state_.load(std::memory_order_acquire); }
  core::Status last_error() const;

private:
  struct Session {
    std::size_t index = 0;
    keypad::ChunkSequence seq;
    std::size_t cursor = 0;
    std::optional<keypad::ChunkAck> last_acked;
    unsigned retries = 0;
  };

  core::Status run_(const std::vector<UpdateFile>& files);
  core::Status prepare_();
  core::Status transfer_(Session& s, std::size_t file_count);
  core::Status send_acked_(Session& s, const keypad::TransferChunk& chunk);
  core::Status finalize_();
  core::Status settle_();

  void set_state_(UpdateState st);
  void progress_(const Session* s, std::size_t file_count, core::Status status = {});

private:
  DeviceEngine& engine_;
  UpdateCfg cfg_;

  std::atomic<UpdateState> state_{UpdateState::Idle};
  std::atomic_bool running_{false};

  mutable std::mutex err_m_;
  core::Status last_error_{};
};

// Reads each path into an UpdateFile named after its base name. A path
// ending in ".delete" produces a deletion of the name without that suffix;
// the file itself is not read.
core::Result<std::vector<UpdateFile>> load_update_files(std::span<const std::filesystem::path> paths);

} // namespace padlink::engine
