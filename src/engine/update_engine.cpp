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

#include "engine/update_engine.hpp"

#include "core/overloaded.hpp"
#include "core/str.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <utility>
#include <variant>

namespace padlink::engine {

namespace {

constexpr std::string_view kDeleteSuffix = ".delete";

bool same_ack(const keypad::ChunkAck& a, const keypad::ChunkAck& b) noexcept {
  return a.file_id == b.file_id && a.package == b.package && a.type == b.type;
}

keypad::ChunkAck ack_for(const keypad::TransferChunk& c) noexcept {
  return keypad::ChunkAck{keypad::chunk_file_id(c), keypad::chunk_package(c),
                          static_cast<std::uint8_t>(keypad::chunk_type(c))};
}

} // namespace

UpdateEngine::UpdateEngine(DeviceEngine& engine, UpdateCfg cfg) : engine_(engine), cfg_(cfg) {}

core::Status UpdateEngine::last_error() const {
  std::lock_guard lk(err_m_);
  return last_error_;
}

void UpdateEngine::set_state_(UpdateState st) {
  state_.store(st, std::memory_order_release);
}

void UpdateEngine::progress_(const Session* s, std::size_t file_count, core::Status status) {
  UpdateProgress p;
  p.state = state();
  p.file_count = file_count;
  p.status = std::move(status);
  if (s) {
    p.file_index = s->index;
    p.file_name = s->seq.name();
    p.chunks_acked = s->cursor;
    p.chunks_total = s->seq.size();
  }
  engine_.publish(Event{std::move(p)});
}

core::Status UpdateEngine::begin_update(std::vector<UpdateFile> files) noexcept {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true))
    return core::Status::Fail(core::Errc::Busy, "an update is already running");

  struct Release {
    std::atomic_bool& flag;
    ~Release() { flag.store(false, std::memory_order_release); }
  } release{running_};

  if (files.empty()) return core::Status::Fail(core::Errc::InvalidArgument, "no files to update");
  if (files.size() > 0xFFFF) return core::Status::Fail(core::Errc::InvalidArgument, "too many files");

  for (const auto& f : files) {
    if (f.remove) {
      PADLINK_TRY(keypad::check_transferable({}, f.name));
    } else {
      PADLINK_TRY(keypad::check_transferable(f.bytes, f.name));
    }
  }

  if (engine_.connection_status() != ConnectionState::Connected)
    return core::Status::Fail(core::Errc::Transport, "device not connected");

  {
    std::lock_guard lk(err_m_);
    last_error_ = core::Status::Ok();
  }

  auto& acks = engine_.acks();
  acks.activate();
  auto st = run_(files);
  acks.deactivate();

  if (!st) {
    set_state_(UpdateState::Aborted);
    spdlog::error("Update aborted: {}", st);
    progress_(nullptr, files.size(), st);
    std::lock_guard lk(err_m_);
    last_error_ = st;
    return st;
  }

  set_state_(UpdateState::Idle);
  progress_(nullptr, files.size());
  spdlog::info("Update finished, device is restarting");
  return st;
}

core::Status UpdateEngine::run_(const std::vector<UpdateFile>& files) {
  set_state_(UpdateState::Preparing);
  spdlog::info("Preparing update of {} file(s)", files.size());
  progress_(nullptr, files.size());
  PADLINK_TRY(prepare_());

  set_state_(UpdateState::Transferring);

  // A late repeat of the previous file's FileEnd ack may arrive while the
  // next FileStart waits, so the last ack carries across files.
  std::optional<keypad::ChunkAck> last_acked;

  for (std::size_t i = 0; i < files.size(); ++i) {
    const auto& f = files[i];
    const auto id = static_cast<std::uint16_t>(i);

    Session s;
    s.index = i;
    s.last_acked = last_acked;
    if (f.remove) {
      s.seq = keypad::ChunkSequence::for_delete(id, f.name);
    } else {
      auto seq = keypad::split(f.bytes, id, f.name);
      if (!seq) return seq.st;
      s.seq = std::move(seq.value);
    }

    if (f.remove) spdlog::info("Deleting {} ({}/{})", f.name, i + 1, files.size());
    else spdlog::info("Sending {} ({} bytes, {} chunks) ({}/{})", f.name, f.bytes.size(), s.seq.total_chunks(), i + 1,
                      files.size());

    PADLINK_TRY(transfer_(s, files.size()));
    last_acked = s.last_acked;
  }

  set_state_(UpdateState::Finalizing);
  progress_(nullptr, files.size());
  PADLINK_TRY(finalize_());

  set_state_(UpdateState::Resetting);
  progress_(nullptr, files.size());
  PADLINK_TRY(engine_.send_command_sync(keypad::Reset{}, cfg_.write_timeout));
  return core::Status::Ok();
}

core::Status UpdateEngine::prepare_() {
  PADLINK_TRY(engine_.send_command_sync(keypad::PrepareUpdate{}, cfg_.write_timeout));
  return settle_();
}

core::Status UpdateEngine::finalize_() {
  PADLINK_TRY(engine_.send_transfer_sync(keypad::Completed{}, cfg_.write_timeout));
  return settle_();
}

// Quiet period after a command the device does not acknowledge. Silence
// means acceptance; an UpdateError rejects.
core::Status UpdateEngine::settle_() {
  const auto deadline = AckTracker::clock::now() + cfg_.settle;
  auto& acks = engine_.acks();

  for (;;) {
    auto r = acks.wait(deadline);
    if (!r) {
      if (r.st.code == core::Errc::Timeout) return core::Status::Ok();
      return r.st;
    }
    if (const auto* e = std::get_if<keypad::UpdateError>(&r.value))
      return core::Status::Fail(core::Errc::DeviceReported, e->reason);

    spdlog::debug("Ignoring stray acknowledgment while settling");
  }
}

core::Status UpdateEngine::transfer_(Session& s, std::size_t file_count) {
  for (s.cursor = 0; s.cursor < s.seq.size();) {
    const auto chunk = s.seq.at(s.cursor);
    PADLINK_TRY(send_acked_(s, chunk));

    s.last_acked = ack_for(chunk);
    ++s.cursor;
    spdlog::debug("{} acknowledged ({}/{})", chunk, s.cursor, s.seq.size());
    progress_(&s, file_count);
  }
  return core::Status::Ok();
}

core::Status UpdateEngine::send_acked_(Session& s, const keypad::TransferChunk& chunk) {
  auto& acks = engine_.acks();

  for (s.retries = 0;; ++s.retries) {
    if (s.retries > 0) spdlog::warn("No acknowledgment for {}, resending ({}/{})", chunk, s.retries, cfg_.retries);

    PADLINK_TRY(engine_.send_transfer_sync(chunk, cfg_.write_timeout));

    const auto deadline = AckTracker::clock::now() + cfg_.ack_timeout;
    for (;;) {
      auto r = acks.wait(deadline);
      if (!r) {
        if (r.st.code == core::Errc::Timeout) break;
        return r.st;
      }

      auto verdict = std::visit(core::overloaded{
        [](const keypad::UpdateError& e) -> std::optional<core::Status> {
          return core::Status::Fail(core::Errc::DeviceReported, e.reason);
        },
        [&](const keypad::ChunkAck& a) -> std::optional<core::Status> {
          if (keypad::validate_ack(chunk, a)) return core::Status::Ok();
          if (s.last_acked && same_ack(*s.last_acked, a)) {
            spdlog::debug("Ignoring duplicate acknowledgment ({})", keypad::InboundMessage{a});
            return std::nullopt;
          }
          return core::Status::Failf(core::Errc::ProtocolViolation, "unexpected acknowledgment ({}) for {}",
                                     keypad::InboundMessage{a}, chunk);
        },
      }, r.value);

      if (verdict) return std::move(*verdict);
    }

    if (s.retries >= cfg_.retries)
      return core::Status::Failf(core::Errc::Timeout, "no acknowledgment for {} after {} retries", chunk, cfg_.retries);
  }
}

core::Result<std::vector<UpdateFile>> load_update_files(std::span<const std::filesystem::path> paths) {
  using R = core::Result<std::vector<UpdateFile>>;
  std::vector<UpdateFile> out;
  out.reserve(paths.size());

  for (const auto& p : paths) {
    const std::string base = p.filename().string();

    if (core::ends_with_ci(base, kDeleteSuffix)) {
      UpdateFile f;
      f.name = base.substr(0, base.size() - kDeleteSuffix.size());
      f.remove = true;
      if (auto st = keypad::check_transferable({}, f.name); !st) return R::Fail(std::move(st));
      out.push_back(std::move(f));
      continue;
    }

    std::error_code ec;
    const auto sz = std::filesystem::file_size(p, ec);
    if (ec) return R::Failf(core::Errc::InvalidArgument, "Cannot stat file: {}", p.string());
    if (sz > keypad::kMaxFileSize)
      return R::Failf(core::Errc::InvalidArgument, "File too large ({} bytes, max {}): {}", sz, keypad::kMaxFileSize,
                      p.string());

    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) return R::Failf(core::Errc::InvalidArgument, "Cannot open file: {}", p.string());

    UpdateFile f;
    f.name = base;
    f.bytes.resize(static_cast<std::size_t>(sz));
    if (!f.bytes.empty()) {
      in.read(reinterpret_cast<char*>(f.bytes.data()), static_cast<std::streamsize>(f.bytes.size()));
      if (!in.good()) return R::Failf(core::Errc::InvalidArgument, "Read failed: {}", p.string());
    }
    if (auto st = keypad::check_transferable(f.bytes, f.name); !st) return R::Fail(std::move(st));
    out.push_back(std::move(f));
  }

  return R::Ok(std::move(out));
}

} // namespace padlink::engine
