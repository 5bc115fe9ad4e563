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

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>

namespace sindri::sparse {

inline constexpr std::uint32_t SPARSE_MAGIC = 0xED26FF3A;
inline constexpr std::uint16_t SPARSE_MAJOR_VERSION = 1;
inline constexpr std::size_t FILE_HEADER_SIZE = 28;
inline constexpr std::size_t CHUNK_HEADER_SIZE = 12;
inline constexpr std::uint32_t DEFAULT_BLOCK_SIZE = 4096;

#pragma pack(push, 1)
struct FileHeaderWire {
  std::uint32_t magic;
  std::uint16_t major_version;
  std::uint16_t minor_version;
  std::uint16_t file_hdr_sz;
  std::uint16_t chunk_hdr_sz;
  std::uint32_t blk_sz;
  std::uint32_t total_blks;
  std::uint32_t total_chunks;
  std::uint32_t image_checksum;
};
#pragma pack(pop)
static_assert(sizeof(FileHeaderWire) == FILE_HEADER_SIZE);

#pragma pack(push, 1)
struct ChunkHeaderWire {
  std::uint16_t chunk_type;
  std::uint16_t reserved1;
  std::uint32_t chunk_sz;
  std::uint32_t total_sz;
};
#pragma pack(pop)
static_assert(sizeof(ChunkHeaderWire) == CHUNK_HEADER_SIZE);

enum class ChunkType : std::uint16_t {
  Raw      = 0xCAC1,
  Fill     = 0xCAC2,
  DontCare = 0xCAC3,
  Crc32    = 0xCAC4,
};

std::string_view chunk_type_name(ChunkType t) noexcept;

struct FileHeader {
  std::uint16_t major_version = SPARSE_MAJOR_VERSION;
  std::uint16_t minor_version = 0;
  std::uint32_t block_size = DEFAULT_BLOCK_SIZE;
  std::uint32_t total_blocks = 0;
  std::uint32_t total_chunks = 0;
  std::uint32_t checksum = 0;

  std::uint64_t expanded_size() const noexcept {
    return static_cast<std::uint64_t>(total_blocks) * block_size;
  }

  bool operator==(const FileHeader&) const = default;
};

struct ChunkHeader {
  ChunkType type = ChunkType::DontCare;
  std::uint32_t chunk_size = 0;  // output blocks
  std::uint32_t total_size = static_cast<std::uint32_t>(CHUNK_HEADER_SIZE);
  std::uint16_t reserved = 0;  // carried through as read, written as given

  // Payload bytes following the header.
  std::uint64_t data_size() const noexcept {
    return total_size >= CHUNK_HEADER_SIZE ? total_size - CHUNK_HEADER_SIZE : 0;
  }

  // Bytes this chunk contributes to the expanded image.
  std::uint64_t out_size(std::uint32_t block_size) const noexcept {
    if (type == ChunkType::Crc32) return 0;
    return static_cast<std::uint64_t>(chunk_size) * block_size;
  }

  // Largest Raw chunk whose total_size still fits the 32-bit field.
  static constexpr std::uint32_t max_raw_blocks(std::uint32_t block_size) noexcept {
    return block_size ? static_cast<std::uint32_t>((std::numeric_limits<std::uint32_t>::max() - CHUNK_HEADER_SIZE) / block_size) : 0;
  }

  static ChunkHeader raw(std::uint32_t blocks, std::uint32_t block_size) noexcept {
    return {ChunkType::Raw, blocks, static_cast<std::uint32_t>(CHUNK_HEADER_SIZE + static_cast<std::uint64_t>(blocks) * block_size)};
  }
  static ChunkHeader fill(std::uint32_t blocks) noexcept {
    return {ChunkType::Fill, blocks, static_cast<std::uint32_t>(CHUNK_HEADER_SIZE + 4)};
  }
  static ChunkHeader dont_care(std::uint32_t blocks) noexcept {
    return {ChunkType::DontCare, blocks, static_cast<std::uint32_t>(CHUNK_HEADER_SIZE)};
  }
  static ChunkHeader crc32() noexcept {
    return {ChunkType::Crc32, 0, static_cast<std::uint32_t>(CHUNK_HEADER_SIZE + 4)};
  }

  bool operator==(const ChunkHeader&) const = default;
};

using FileHeaderBytes = std::array<std::byte, FILE_HEADER_SIZE>;
using ChunkHeaderBytes = std::array<std::byte, CHUNK_HEADER_SIZE>;

bool has_magic(std::span<const std::byte> bytes) noexcept;

sindri::core::Result<FileHeader> parse_file_header(std::span<const std::byte> bytes) noexcept;
sindri::core::Result<ChunkHeader> parse_chunk_header(std::span<const std::byte> bytes) noexcept;

// Payload size rule per chunk type, all products in 64 bits.
sindri::core::Status validate_chunk(const ChunkHeader& c, std::uint32_t block_size) noexcept;

FileHeaderBytes serialize(const FileHeader& h) noexcept;
ChunkHeaderBytes serialize(const ChunkHeader& c) noexcept;

} // namespace sindri::sparse
