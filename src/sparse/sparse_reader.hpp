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
#include "io/source.hpp"
#include "sparse/sparse_format.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace sindri::sparse {

struct Chunk {
  ChunkHeader header;
  std::uint32_t index = 0;
  std::uint64_t payload_offset = 0;  // input offset of the first payload byte
  std::uint64_t out_offset = 0;      // expanded-image offset of the first output byte
  std::uint32_t value = 0;           // fill pattern or crc32, decoded eagerly
};

struct Cursor {
  std::uint64_t offset = FILE_HEADER_SIZE;  // next chunk header in the input
  std::uint32_t chunks_remaining = 0;
  std::uint64_t out_offset = 0;
  std::uint64_t out_blocks = 0;
};

// Forward-only chunk iterator over a sparse stream. The source must outlive
// the reader.
class SparseReader {
public:
  static sindri::core::Result<SparseReader> open(sindri::io::ByteSource& src) noexcept;

  const FileHeader& header() const noexcept { return hdr_; }
  const Cursor& cursor() const noexcept { return cur_; }
  sindri::io::ByteSource& source() noexcept { return *src_; }

  // nullopt once every declared chunk has been produced. Unread payload of the
  // previous chunk is skipped.
  sindri::core::Result<std::optional<Chunk>> next() noexcept;

  // Raw payload of the chunk last returned by next(). Returns 0 once drained.
  sindri::core::Result<std::size_t> read_payload(std::span<std::byte> out) noexcept;
  std::uint64_t payload_remaining() const noexcept { return payload_left_; }

  // Back to the first chunk; the header is read and validated again.
  sindri::core::Status restart() noexcept;

private:
  explicit SparseReader(sindri::io::ByteSource& src) noexcept : src_(&src) {}

  sindri::core::Status read_header_() noexcept;

  sindri::io::ByteSource* src_;
  FileHeader hdr_{};
  Cursor cur_{};
  std::uint32_t next_index_ = 0;
  std::uint64_t payload_left_ = 0;
  bool done_ = false;
};

} // namespace sindri::sparse
