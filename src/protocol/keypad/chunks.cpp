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

#include "protocol/keypad/chunks.hpp"

#include "core/endian.hpp"
#include "core/overloaded.hpp"

#include <algorithm>
#include <cstring>

namespace padlink::keypad {

namespace {

// Size marker the firmware expects between the file name and its length.
constexpr std::uint8_t kFileSizeWidth = 2;

// The header has no payload length, so the device stores the whole body.
// Spaces keep a short last chunk from leaving NULs at the end of the file.
constexpr std::uint8_t kChunkPadding = 0x20;

struct Header {
  ChunkType type;
  std::uint16_t file_id;
  std::uint16_t total;
  std::uint16_t package;
};

Header header_of(const TransferChunk& c) noexcept {
  return std::visit(core::overloaded{
    [](const FileStart& s) { return Header{ChunkType::FileStart, s.file_id, s.total_chunks, 0}; },
    [](const FileChunk& d) { return Header{ChunkType::FileChunk, d.file_id, d.total_chunks, d.package}; },
    [](const FileEnd& e) { return Header{ChunkType::FileEnd, e.file_id, 0, 0}; },
    [](const FileDelete& d) { return Header{ChunkType::FileDelete, d.file_id, 0, 0}; },
    [](const Completed&) { return Header{ChunkType::Completed, 0, 0, 0}; },
  }, c);
}

std::size_t put_name(std::span<std::uint8_t> out, std::string_view name) noexcept {
  const std::size_t n = std::min(name.size(), kMaxFileName);
  out[0] = static_cast<std::uint8_t>(n);
  std::memcpy(out.data() + 1, name.data(), n);
  return 1 + n;
}

std::uint16_t ceil_chunks(std::size_t n) noexcept {
  return static_cast<std::uint16_t>((n + kMaxChunkPayload - 1) / kMaxChunkPayload);
}

} // namespace

ChunkType chunk_type(const TransferChunk& c) noexcept { return header_of(c).type; }
std::uint16_t chunk_file_id(const TransferChunk& c) noexcept { return header_of(c).file_id; }
std::uint16_t chunk_package(const TransferChunk& c) noexcept { return header_of(c).package; }

TransferReport encode_chunk(const TransferChunk& c) noexcept {
  TransferReport r{};
  const auto h = header_of(c);
  const std::span<std::uint8_t> out{r};

  core::store_le(out.subspan(0), static_cast<std::uint16_t>(h.type));
  core::store_le(out.subspan(2), h.file_id);
  core::store_le(out.subspan(4), h.total);
  core::store_le(out.subspan(6), h.package);

  const auto body = out.subspan(kChunkHeaderSize);
  std::visit(core::overloaded{
    [&](const FileStart& s) {
      const std::size_t off = put_name(body, s.name);
      body[off] = kFileSizeWidth;
      core::store_le(body.subspan(off + 1), s.file_size);
    },
    [&](const FileChunk& d) {
      std::memcpy(body.data(), d.data.data(), d.size);
      std::fill(body.begin() + d.size, body.begin() + kMaxChunkPayload, kChunkPadding);
    },
    [&](const FileDelete& d) { (void)put_name(body, d.name); },
    [](const auto&) {},
  }, c);

  return r;
}

core::Status check_transferable(std::span<const std::uint8_t> bytes, std::string_view name) {
  if (name.empty()) return core::Status::Fail(core::Errc::InvalidArgument, "empty destination name");
  if (name.size() > kMaxFileName)
    return core::Status::Failf(core::Errc::InvalidArgument, "destination name too long ({} > {}): {}",
                               name.size(), kMaxFileName, name);
  if (bytes.size() > kMaxFileSize)
    return core::Status::Failf(core::Errc::InvalidArgument, "file too large ({} > {} bytes): {}",
                               bytes.size(), kMaxFileSize, name);
  return core::Status::Ok();
}

ChunkSequence ChunkSequence::for_file(std::span<const std::uint8_t> bytes, std::uint16_t file_id, std::string name) {
  ChunkSequence s;
  s.bytes_ = bytes;
  s.file_id_ = file_id;
  s.total_chunks_ = ceil_chunks(bytes.size());
  s.name_ = std::move(name);
  return s;
}

ChunkSequence ChunkSequence::for_delete(std::uint16_t file_id, std::string name) {
  ChunkSequence s;
  s.file_id_ = file_id;
  s.name_ = std::move(name);
  s.delete_ = true;
  return s;
}

std::size_t ChunkSequence::size() const noexcept {
  return delete_ ? 1 : static_cast<std::size_t>(total_chunks_) + 2;
}

TransferChunk ChunkSequence::at(std::size_t idx) const {
  if (delete_) return FileDelete{file_id_, name_};

  if (idx == 0) {
    return FileStart{file_id_, total_chunks_, static_cast<std::uint16_t>(bytes_.size()), name_};
  }
  if (idx > total_chunks_) return FileEnd{file_id_};

  const std::size_t package = idx - 1;
  const std::size_t off = package * kMaxChunkPayload;
  const std::size_t n = std::min(kMaxChunkPayload, bytes_.size() - off);

  FileChunk d;
  d.file_id = file_id_;
  d.package = static_cast<std::uint16_t>(package);
  d.total_chunks = total_chunks_;
  d.size = static_cast<std::uint8_t>(n);
  std::memcpy(d.data.data(), bytes_.data() + off, n);
  return d;
}

std::vector<TransferChunk> ChunkSequence::materialize() const {
  std::vector<TransferChunk> out;
  out.reserve(size());
  for (auto c : *this) out.push_back(std::move(c));
  return out;
}

core::Result<ChunkSequence> split(std::span<const std::uint8_t> bytes, std::uint16_t file_id, std::string name) {
  using R = core::Result<ChunkSequence>;
  if (bytes.size() > kMaxFileSize)
    return R::Failf(core::Errc::InvalidArgument, "file too large ({} > {} bytes): {}", bytes.size(), kMaxFileSize, name);
  return R::Ok(ChunkSequence::for_file(bytes, file_id, std::move(name)));
}

bool validate_ack(const TransferChunk& sent, const ChunkAck& ack) noexcept {
  const auto h = header_of(sent);
  return ack.file_id == h.file_id
      && ack.package == h.package
      && ack.type == static_cast<std::uint8_t>(h.type);
}

core::Result<std::vector<std::uint8_t>> reassemble(std::span<const TransferChunk> chunks) {
  using R = core::Result<std::vector<std::uint8_t>>;

  if (chunks.size() < 2) return R::Fail(core::Errc::ProtocolViolation, "sequence too short");

  const auto* start = std::get_if<FileStart>(&chunks.front());
  if (!start) return R::Fail(core::Errc::ProtocolViolation, "sequence does not begin with FileStart");

  const auto* end = std::get_if<FileEnd>(&chunks.back());
  if (!end || end->file_id != start->file_id)
    return R::Fail(core::Errc::ProtocolViolation, "sequence does not end with FileEnd");

  std::vector<std::uint8_t> out;
  out.reserve(start->file_size);

  std::uint16_t expect = 0;
  for (const auto& c : chunks.subspan(1, chunks.size() - 2)) {
    const auto* d = std::get_if<FileChunk>(&c);
    if (!d) return R::Failf(core::Errc::ProtocolViolation, "unexpected {} inside file body", describe(c));
    if (d->file_id != start->file_id)
      return R::Failf(core::Errc::ProtocolViolation, "chunk for file {} inside file {}", d->file_id, start->file_id);
    if (d->package != expect)
      return R::Failf(core::Errc::ProtocolViolation, "package {} out of order (expected {})", d->package, expect);

    const auto p = d->payload();
    out.insert(out.end(), p.begin(), p.end());
    ++expect;
  }

  if (expect != start->total_chunks)
    return R::Failf(core::Errc::ProtocolViolation, "got {} chunks, FileStart announced {}", expect, start->total_chunks);
  if (out.size() != start->file_size)
    return R::Failf(core::Errc::ProtocolViolation, "got {} bytes, FileStart announced {}", out.size(), start->file_size);

  return R::Ok(std::move(out));
}

std::string describe(const TransferChunk& c) {
  return std::visit(core::overloaded{
    [](const FileStart& s) {
      return fmt::format("FileStart {{ file: {}, name: {}, size: {}, chunks: {} }}",
                         s.file_id, s.name, s.file_size, s.total_chunks);
    },
    [](const FileChunk& d) {
      return fmt::format("FileChunk {{ file: {}, package: {}/{}, bytes: {} }}",
                         d.file_id, d.package, d.total_chunks, d.size);
    },
    [](const FileEnd& e) { return fmt::format("FileEnd {{ file: {} }}", e.file_id); },
    [](const FileDelete& d) { return fmt::format("FileDelete {{ file: {}, name: {} }}", d.file_id, d.name); },
    [](const Completed&) { return std::string("Completed"); },
  }, c);
}

} // namespace padlink::keypad
