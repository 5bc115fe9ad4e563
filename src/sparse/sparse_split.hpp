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
#include "sparse/sparse_format.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace sindri::sparse {

// Write header, then size bytes of the input starting at offset.
struct SplitChunk {
  ChunkHeader header;
  std::uint64_t offset = 0;
  std::uint64_t size = 0;

  bool operator==(const SplitChunk&) const = default;
};

struct Split {
  FileHeader header;
  std::vector<SplitChunk> chunks;

  std::uint64_t sparse_size() const noexcept;

  bool operator==(const Split&) const = default;
};

// Smallest max_size that can hold a header, a leading DontCare and one Raw block.
constexpr std::uint64_t min_split_size(std::uint32_t block_size) noexcept {
  return FILE_HEADER_SIZE + 2 * CHUNK_HEADER_SIZE + static_cast<std::uint64_t>(block_size);
}

// Splits an existing sparse image into images of at most max_size bytes.
// Every split after the first opens with a DontCare over the blocks already
// covered. Crc32 chunks are dropped since they no longer match a split.
sindri::core::Result<std::vector<Split>> split_image(const FileHeader& header, std::span<const ChunkHeader> chunks,
                                                     std::uint32_t max_size) noexcept;

// Same for a raw image of raw_size bytes, in DEFAULT_BLOCK_SIZE blocks. Offsets
// refer to the raw image; the last block may need zero padding.
sindri::core::Result<std::vector<Split>> split_raw(std::uint64_t raw_size, std::uint32_t max_size) noexcept;

} // namespace sindri::sparse
