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

#include "sparse/sparse_format.hpp"

#include "core/endian.hpp"

#include <cstring>

#include <spdlog/spdlog.h>

namespace sindri::sparse {

namespace {

using sindri::core::Errc;

bool known_chunk_type(std::uint16_t t) noexcept {
  switch (static_cast<ChunkType>(t)) {
    case ChunkType::Raw:
    case ChunkType::Fill:
    case ChunkType::DontCare:
    case ChunkType::Crc32:
      return true;
  }
  return false;
}

} // namespace

std::string_view chunk_type_name(ChunkType t) noexcept {
  switch (t) {
    case ChunkType::Raw: return "raw";
    case ChunkType::Fill: return "fill";
    case ChunkType::DontCare: return "dont-care";
    case ChunkType::Crc32: return "crc32";
  }
  return "unknown";
}

bool has_magic(std::span<const std::byte> bytes) noexcept {
  if (bytes.size() < sizeof(std::uint32_t)) return false;
  return sindri::core::load_le<std::uint32_t>(bytes) == SPARSE_MAGIC;
}

sindri::core::Result<FileHeader> parse_file_header(std::span<const std::byte> bytes) noexcept {
  if (bytes.size() < sizeof(FileHeaderWire)) {
    return sindri::core::failf(Errc::Format, "sparse header: need {} bytes, have {}", sizeof(FileHeaderWire), bytes.size());
  }

  FileHeaderWire w{};
  std::memcpy(&w, bytes.data(), sizeof(w));

  w.magic          = sindri::core::le_to_host(w.magic);
  w.major_version  = sindri::core::le_to_host(w.major_version);
  w.minor_version  = sindri::core::le_to_host(w.minor_version);
  w.file_hdr_sz    = sindri::core::le_to_host(w.file_hdr_sz);
  w.chunk_hdr_sz   = sindri::core::le_to_host(w.chunk_hdr_sz);
  w.blk_sz         = sindri::core::le_to_host(w.blk_sz);
  w.total_blks     = sindri::core::le_to_host(w.total_blks);
  w.total_chunks   = sindri::core::le_to_host(w.total_chunks);
  w.image_checksum = sindri::core::le_to_host(w.image_checksum);

  if (w.magic != SPARSE_MAGIC) return sindri::core::failf(Errc::Format, "sparse header: bad magic 0x{:08x}", w.magic);
  if (w.major_version != SPARSE_MAJOR_VERSION) {
    return sindri::core::failf(Errc::Format, "sparse header: unsupported major version {}", w.major_version);
  }
  if (w.file_hdr_sz != FILE_HEADER_SIZE) {
    return sindri::core::failf(Errc::Format, "sparse header: header size {} (expected {})", w.file_hdr_sz, FILE_HEADER_SIZE);
  }
  if (w.chunk_hdr_sz != CHUNK_HEADER_SIZE) {
    return sindri::core::failf(Errc::Format, "sparse header: chunk header size {} (expected {})", w.chunk_hdr_sz, CHUNK_HEADER_SIZE);
  }
  if (w.blk_sz == 0 || (w.blk_sz % 4) != 0) {
    return sindri::core::failf(Errc::Format, "sparse header: invalid block size {}", w.blk_sz);
  }

  if (w.minor_version != 0) spdlog::debug("sparse header: minor version {}", w.minor_version);

  FileHeader h;
  h.major_version = w.major_version;
  h.minor_version = w.minor_version;
  h.block_size = w.blk_sz;
  h.total_blocks = w.total_blks;
  h.total_chunks = w.total_chunks;
  h.checksum = w.image_checksum;
  return h;
}

sindri::core::Result<ChunkHeader> parse_chunk_header(std::span<const std::byte> bytes) noexcept {
  if (bytes.size() < sizeof(ChunkHeaderWire)) {
    return sindri::core::failf(Errc::Format, "chunk header: need {} bytes, have {}", sizeof(ChunkHeaderWire), bytes.size());
  }

  ChunkHeaderWire w{};
  std::memcpy(&w, bytes.data(), sizeof(w));

  w.chunk_type = sindri::core::le_to_host(w.chunk_type);
  w.reserved1  = sindri::core::le_to_host(w.reserved1);
  w.chunk_sz   = sindri::core::le_to_host(w.chunk_sz);
  w.total_sz   = sindri::core::le_to_host(w.total_sz);

  if (!known_chunk_type(w.chunk_type)) return sindri::core::failf(Errc::Format, "chunk header: unknown type 0x{:04x}", w.chunk_type);
  if (w.total_sz < CHUNK_HEADER_SIZE) {
    return sindri::core::failf(Errc::Format, "chunk header: total size {} smaller than header", w.total_sz);
  }

  ChunkHeader c;
  c.type = static_cast<ChunkType>(w.chunk_type);
  c.chunk_size = w.chunk_sz;
  c.total_size = w.total_sz;
  c.reserved = w.reserved1;
  return c;
}

sindri::core::Status validate_chunk(const ChunkHeader& c, std::uint32_t block_size) noexcept {
  if (c.total_size < CHUNK_HEADER_SIZE) {
    return sindri::core::failf(Errc::Format, "{} chunk: total size {} smaller than header", chunk_type_name(c.type), c.total_size);
  }

  std::uint64_t want = 0;
  switch (c.type) {
    case ChunkType::Raw: want = static_cast<std::uint64_t>(c.chunk_size) * block_size; break;
    case ChunkType::Fill: want = 4; break;
    case ChunkType::DontCare: want = 0; break;
    case ChunkType::Crc32: want = 4; break;
  }

  if (c.data_size() != want) {
    return sindri::core::failf(Errc::Format, "{} chunk: payload {} bytes, expected {} ({} blocks of {})",
                               chunk_type_name(c.type), c.data_size(), want, c.chunk_size, block_size);
  }
  return {};
}

FileHeaderBytes serialize(const FileHeader& h) noexcept {
  FileHeaderWire w{};
  w.magic          = sindri::core::host_to_le(SPARSE_MAGIC);
  w.major_version  = sindri::core::host_to_le(h.major_version);
  w.minor_version  = sindri::core::host_to_le(h.minor_version);
  w.file_hdr_sz    = sindri::core::host_to_le(static_cast<std::uint16_t>(FILE_HEADER_SIZE));
  w.chunk_hdr_sz   = sindri::core::host_to_le(static_cast<std::uint16_t>(CHUNK_HEADER_SIZE));
  w.blk_sz         = sindri::core::host_to_le(h.block_size);
  w.total_blks     = sindri::core::host_to_le(h.total_blocks);
  w.total_chunks   = sindri::core::host_to_le(h.total_chunks);
  w.image_checksum = sindri::core::host_to_le(h.checksum);

  FileHeaderBytes out{};
  std::memcpy(out.data(), &w, sizeof(w));
  return out;
}

ChunkHeaderBytes serialize(const ChunkHeader& c) noexcept {
  ChunkHeaderWire w{};
  w.chunk_type = sindri::core::host_to_le(static_cast<std::uint16_t>(c.type));
  w.reserved1  = sindri::core::host_to_le(c.reserved);
  w.chunk_sz   = sindri::core::host_to_le(c.chunk_size);
  w.total_sz   = sindri::core::host_to_le(c.total_size);

  ChunkHeaderBytes out{};
  std::memcpy(out.data(), &w, sizeof(w));
  return out;
}

} // namespace sindri::sparse
