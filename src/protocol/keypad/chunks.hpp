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
#include "protocol/keypad/keypad_wire.hpp"
#include "protocol/keypad/messages.hpp"

#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace padlink::keypad {

struct FileStart {
  std::uint16_t file_id = 0;
  std::uint16_t total_chunks = 0;
  std::uint16_t file_size = 0;
  std::string name;
};

struct FileChunk {
  std::uint16_t file_id = 0;
  std::uint16_t package = 0;
  std::uint16_t total_chunks = 0;
  std::array<std::uint8_t, kMaxChunkPayload> data{};
  std::uint8_t size = 0;

  std::span<const std::uint8_t> payload() const noexcept { return {data.data(), size}; }
};

struct FileEnd {
  std::uint16_t file_id = 0;
};

struct FileDelete {
  std::uint16_t file_id = 0;
  std::string name;
};

struct Completed {};

using TransferChunk = std::variant<FileStart, FileChunk, FileEnd, FileDelete, Completed>;

using TransferReport = std::array<std::uint8_t, kTransferReportSize>;

ChunkType chunk_type(const TransferChunk& c) noexcept;
std::uint16_t chunk_file_id(const TransferChunk& c) noexcept;
std::uint16_t chunk_package(const TransferChunk& c) noexcept;

// Little-endian header. FileChunk bodies are space-padded to 52 bytes, the
// other kinds zero-padded.
TransferReport encode_chunk(const TransferChunk& c) noexcept;

// Longest name a FileStart payload can carry: [len][name][2][size:2].
inline constexpr std::size_t kMaxFileName = kMaxChunkPayload - 4;
inline constexpr std::size_t kMaxFileSize = 0xFFFF;

core::Status check_transferable(std::span<const std::uint8_t> bytes, std::string_view name);

class ChunkSequence;

// Fails with InvalidArgument when `bytes` exceeds kMaxFileSize.
core::Result<ChunkSequence> split(std::span<const std::uint8_t> bytes, std::uint16_t file_id, std::string name = {});

// Deterministic, restartable view of one file's transfer:
//   FileStart, FileChunk[0..total_chunks), FileEnd
// or, for a deletion, a single FileDelete. The sequence borrows `bytes`; the
// caller keeps them alive while it is in use.
class ChunkSequence {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = TransferChunk;
    using difference_type = std::ptrdiff_t;

    iterator() = default;
    iterator(const ChunkSequence* seq, std::size_t idx) : seq_(seq), idx_(idx) {}

    TransferChunk operator*() const { return seq_->at(idx_); }
    iterator& operator++() { ++idx_; return *this; }
    iterator operator++(int) { auto t = *this; ++idx_; return t; }
    bool operator==(const iterator& o) const noexcept { return idx_ == o.idx_; }

  private:
    const ChunkSequence* seq_ = nullptr;
    std::size_t idx_ = 0;
  };

  ChunkSequence() = default;

  static ChunkSequence for_delete(std::uint16_t file_id, std::string name);

  std::size_t size() const noexcept;
  TransferChunk at(std::size_t idx) const;

  std::uint16_t file_id() const noexcept { return file_id_; }
  std::uint16_t total_chunks() const noexcept { return total_chunks_; }
  bool is_delete() const noexcept { return delete_; }
  const std::string& name() const noexcept { return name_; }

  iterator begin() const { return {this, 0}; }
  iterator end() const { return {this, size()}; }

  std::vector<TransferChunk> materialize() const;

private:
  friend core::Result<ChunkSequence> split(std::span<const std::uint8_t>, std::uint16_t, std::string);

  // `bytes` must fit the 16-bit size field; split() checks it.
  static ChunkSequence for_file(std::span<const std::uint8_t> bytes, std::uint16_t file_id, std::string name);

  std::span<const std::uint8_t> bytes_{};
  std::uint16_t file_id_ = 0;
  std::uint16_t total_chunks_ = 0;
  std::string name_;
  bool delete_ = false;
};

// True when `ack` confirms exactly `sent` (file id, package index and type).
bool validate_ack(const TransferChunk& sent, const ChunkAck& ack) noexcept;

// Concatenates FileChunk payloads of one file, checking the ordering
// invariant (single file id, FileStart first, contiguous packages, FileEnd
// last, matching count and size).
core::Result<std::vector<std::uint8_t>> reassemble(std::span<const TransferChunk> chunks);

std::string describe(const TransferChunk& c);

} // namespace padlink::keypad

template <>
struct fmt::formatter<padlink::keypad::TransferChunk> : fmt::formatter<std::string_view> {
  template <class Ctx>
  auto format(const padlink::keypad::TransferChunk& c, Ctx& ctx) const {
    return fmt::formatter<std::string_view>::format(padlink::keypad::describe(c), ctx);
  }
};
