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

#include "protocol/keypad/messages.hpp"

#include "core/endian.hpp"
#include "core/overloaded.hpp"

#include <algorithm>

namespace padlink::keypad {

namespace {

using Bytes = std::span<const std::uint8_t>;
using DecodeResult = core::Result<InboundMessage>;

// The reference host reads at least this many error characters regardless
// of the length byte; some firmware builds send a short length.
constexpr std::size_t kMinErrorText = 33;

bool has_tag(Bytes body, const std::array<std::uint8_t, 2>& tag) noexcept {
  return body.size() >= 2 && body[0] == tag[0] && body[1] == tag[1];
}

std::string text_until_nul(Bytes b) {
  const auto end = std::find(b.begin(), b.end(), std::uint8_t{0});
  return std::string(b.begin(), end);
}

DecodeResult truncated(std::string_view what, std::size_t need, std::size_t got) {
  return DecodeResult::Failf(core::Errc::Truncated, "{} report truncated: need {} bytes, got {}", what, need, got);
}

DecodeResult decode_chunk_ack(Bytes body) {
  constexpr std::size_t need = 2 + 2 + 2 + 1;
  if (body.size() < need) return truncated("ChunkAck", need, body.size());

  ChunkAck a;
  a.file_id = core::load_le<std::uint16_t>(body.subspan(2));
  a.package = core::load_le<std::uint16_t>(body.subspan(4));
  a.type = body[6];
  return DecodeResult::Ok(a);
}

DecodeResult decode_update_error(Bytes body) {
  if (body.size() < 3) return truncated("UpdateError", 3, body.size());

  const std::size_t len = std::max<std::size_t>(body[2], kMinErrorText);
  const Bytes text = body.subspan(3, std::min(len, body.size() - 3));
  return DecodeResult::Ok(UpdateError{text_until_nul(text)});
}

DecodeResult decode_log(Bytes body, DeviceLogLevel level) {
  return DecodeResult::Ok(LogMessage{level, text_until_nul(body.subspan(2))});
}

DecodeResult decode_status(Bytes payload) {
  if (payload.size() < kStatusPayloadSize) return truncated("Status", kStatusPayloadSize, payload.size());

  ButtonStatus s;
  s.button = payload[0];
  s.triggered = payload[1] != 0;
  s.long_pressed = payload[2] != 0;
  s.pressed = payload[3] != 0;
  s.released = payload[4] != 0;
  return DecodeResult::Ok(s);
}

DecodeResult decode_version(Bytes payload) {
  if (payload.size() < kStatusPayloadSize) return truncated("VersionInfo", kStatusPayloadSize, payload.size());

  VersionInfo v;
  v.major = payload[0];
  v.minor = payload[1];
  v.patch = payload[2];
  v.hardware = hardware_type(payload[3]);
  return DecodeResult::Ok(v);
}

} // namespace

std::string VersionInfo::version() const {
  return fmt::format("{}.{}.{}", major, minor, patch);
}

HardwareType hardware_type(std::uint8_t raw) noexcept {
  switch (raw) {
    case 0x02: return HardwareType::FiveButtonUsbV1;
    case 0x03: return HardwareType::FiveButtonUsb;
    case 0x04: return HardwareType::FiveButtonBt;
    case 0x05: return HardwareType::TenButtonUsb;
    case 0x06: return HardwareType::TenButtonBt;
    default: return HardwareType::Unknown;
  }
}

std::string_view hardware_name(HardwareType t) noexcept {
  switch (t) {
    case HardwareType::FiveButtonUsbV1: return "Five Button USB V1";
    case HardwareType::FiveButtonUsb: return "Five Button USB";
    case HardwareType::FiveButtonBt: return "Five Button BT";
    case HardwareType::TenButtonUsb: return "Ten Button USB";
    case HardwareType::TenButtonBt: return "Ten Button BT";
    case HardwareType::Unknown: break;
  }
  return "Unknown";
}

core::Result<InboundMessage> decode(std::span<const std::uint8_t> report) {
  if (report.size() < kMinInboundSize) return truncated("Inbound", kMinInboundSize, report.size());

  const Bytes body = report.subspan(1);

  if (has_tag(body, kTagChunkAck)) return decode_chunk_ack(body);
  if (has_tag(body, kTagUpdateError)) return decode_update_error(body);
  if (has_tag(body, kTagLogDebug)) return decode_log(body, DeviceLogLevel::Debug);
  if (has_tag(body, kTagLogError)) return decode_log(body, DeviceLogLevel::Error);

  const Bytes payload = body.subspan(1);
  switch (static_cast<InCommandId>(body[0])) {
    case InCommandId::Status: return decode_status(payload);
    case InCommandId::VersionInfo: return decode_version(payload);
    case InCommandId::StatusRequest: return DecodeResult::Ok(StatusRequest{});
  }

  return DecodeResult::Ok(Unknown{std::vector<std::uint8_t>(report.begin(), report.end())});
}

std::string describe(const InboundMessage& msg) {
  return std::visit(core::overloaded{
    [](const ButtonStatus& s) {
      return fmt::format("Status {{ button: {}, triggered: {}, longpress: {}, pressed: {}, released: {} }}",
                         s.button, s.triggered, s.long_pressed, s.pressed, s.released);
    },
    [](const VersionInfo& v) {
      return fmt::format("Version Info: {}, type {}", v.version(), hardware_name(v.hardware));
    },
    [](const StatusRequest&) { return std::string("Status Request"); },
    [](const ChunkAck& a) {
      return fmt::format("File: {}, Type: {}, Package: {}", a.file_id, a.type, a.package);
    },
    [](const UpdateError& e) { return fmt::format("Error: {}", e.reason); },
    [](const LogMessage& l) {
      return fmt::format("{}: {}", l.level == DeviceLogLevel::Debug ? "debug" : "error", l.text);
    },
    [](const Unknown& u) {
      return fmt::format("Unknown report ({} bytes, id 0x{:02x})", u.raw.size(), u.raw.size() > 1 ? u.raw[1] : 0);
    },
  }, msg);
}

} // namespace padlink::keypad
