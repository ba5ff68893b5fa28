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

#include <array>
#include <cstddef>
#include <cstdint>

namespace padlink::keypad {

enum class ReportId : std::uint8_t {
  Communication = 1,
  Transfer      = 2,
};

enum class OutCommandId : std::uint8_t {
  SetLed        = 0x01,
  PrepareUpdate = 0xE0,
  Reset         = 0xE1,
  UpdateConfig  = 0xE2,
  Ping          = 0xF0,
};

enum class InCommandId : std::uint8_t {
  Status        = 0x01,
  StatusRequest = 0x02,
  VersionInfo   = 0x99,
};

enum class ChunkType : std::uint16_t {
  FileStart  = 1,
  FileChunk  = 2,
  FileEnd    = 3,
  Completed  = 4,
  FileDelete = 5,
};

enum class HardwareType : std::uint8_t {
  Unknown         = 0x00,
  FiveButtonUsbV1 = 0x02,
  FiveButtonUsb   = 0x03,
  FiveButtonBt    = 0x04,
  TenButtonUsb    = 0x05,
  TenButtonBt     = 0x06,
};

// Communication report: [command_id][param1..param6][counter]
inline constexpr std::size_t kCommandReportSize = 8;
inline constexpr std::size_t kCommandParamCount = 6;

// Transfer report: [type:2][file_id:2][total_chunks:2][package_index:2][data:52]
inline constexpr std::size_t kTransferReportSize = 60;
inline constexpr std::size_t kChunkHeaderSize    = 8;
inline constexpr std::size_t kMaxChunkPayload    = kTransferReportSize - kChunkHeaderSize;

// Inbound: report id + one identifier byte at minimum.
inline constexpr std::size_t kMinInboundSize   = 2;
inline constexpr std::size_t kStatusPayloadSize = 6;
inline constexpr std::size_t kMaxInboundSize   = 64;

// Update-channel identifiers sent by the firmware as two ASCII characters.
inline constexpr std::array<std::uint8_t, 2> kTagChunkAck{'A', 'K'};
inline constexpr std::array<std::uint8_t, 2> kTagUpdateError{'E', 'R'};
inline constexpr std::array<std::uint8_t, 2> kTagLogDebug{'L', 'D'};
inline constexpr std::array<std::uint8_t, 2> kTagLogError{'L', 'E'};

// Known keypad identifications, tried in this order when none are configured.
struct KnownId {
  std::uint16_t vendor;
  std::uint16_t product;
};
inline constexpr KnownId kDefaultIds[] = {
  {0x1D50, 0x6189},
  {0x1D50, 0x60C6},
  {0x1209, 0x0001},
};

} // namespace padlink::keypad
