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

#include "sparse/sparse_split.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

namespace sindri::sparse {

namespace {

using sindri::core::Errc;

class SplitBuilder {
public:
  SplitBuilder(std::uint32_t block_size, std::uint32_t space, std::uint32_t blocks_offset)
    : space_(space - static_cast<std::uint32_t>(FILE_HEADER_SIZE)), block_size_(block_size)
  {
    if (blocks_offset) {
      const auto h = ChunkHeader::dont_care(blocks_offset);
      space_ -= h.total_size;
      chunks_.push_back(SplitChunk{h, 0, 0});
    }
  }

  bool try_add_chunk(const ChunkHeader& c, std::uint64_t image_offset) {
    if (space_ <= c.total_size) return false;
    chunks_.push_back(SplitChunk{c, image_offset, c.data_size()});
    space_ -= c.total_size;
    return true;
  }

  // Adds as many raw blocks as fit; returns the count taken.
  std::uint32_t add_raw(std::uint64_t image_offset, std::uint32_t blocks) {
    const std::uint32_t left = space_ > CHUNK_HEADER_SIZE ? space_ - static_cast<std::uint32_t>(CHUNK_HEADER_SIZE) : 0;
    const std::uint32_t fit = left / block_size_;
    if (!fit) return 0;

    const std::uint32_t n = std::min(blocks, fit);
    const auto h = ChunkHeader::raw(n, block_size_);
    space_ -= h.total_size;
    chunks_.push_back(SplitChunk{h, image_offset, h.data_size()});
    return n;
  }

  Split finish() && {
    Split s;
    s.header.block_size = block_size_;
    s.header.total_chunks = static_cast<std::uint32_t>(chunks_.size());
    std::uint32_t blocks = 0;
    for (const auto& c : chunks_) blocks += c.header.chunk_size;
    s.header.total_blocks = blocks;
    s.chunks = std::move(chunks_);
    return s;
  }

private:
  std::uint32_t space_;
  std::uint32_t block_size_;
  std::vector<SplitChunk> chunks_;
};

sindri::core::Status check_minimal_size(std::uint32_t size, std::uint32_t block_size) noexcept {
  if (size < min_split_size(block_size)) {
    return sindri::core::failf(Errc::InvalidArgument, "split size {} too small for block size {} (need at least {})", size,
                               block_size, min_split_size(block_size));
  }
  return {};
}

} // namespace

std::uint64_t Split::sparse_size() const noexcept {
  std::uint64_t n = FILE_HEADER_SIZE;
  for (const auto& c : chunks) n += c.header.total_size;
  return n;
}

sindri::core::Result<std::vector<Split>> split_image(const FileHeader& header, std::span<const ChunkHeader> chunks,
                                                     std::uint32_t max_size) noexcept {
  if (header.block_size == 0) return sindri::core::fail(Errc::InvalidArgument, "split: zero block size");
  SINDRI_TRY(check_minimal_size(max_size, header.block_size));

  std::vector<Split> splits;
  SplitBuilder builder(header.block_size, max_size, 0);

  std::uint32_t block_offset = 0;
  std::uint64_t image_offset = FILE_HEADER_SIZE + CHUNK_HEADER_SIZE;

  for (const auto& chunk : chunks) {
    if (chunk.type == ChunkType::Crc32) {
      image_offset += chunk.total_size;
      continue;
    }

    if (!builder.try_add_chunk(chunk, image_offset)) {
      if (chunk.type == ChunkType::Raw) {
        std::uint32_t done = 0;
        for (;;) {
          done += builder.add_raw(image_offset + static_cast<std::uint64_t>(done) * header.block_size,
                                  chunk.chunk_size - done);
          if (done >= chunk.chunk_size) break;
          splits.push_back(std::move(builder).finish());
          builder = SplitBuilder(header.block_size, max_size, block_offset + done);
        }
      } else {
        splits.push_back(std::move(builder).finish());
        builder = SplitBuilder(header.block_size, max_size, block_offset);
        if (!builder.try_add_chunk(chunk, image_offset)) {
          return sindri::core::failf(Errc::InvalidArgument, "split size {} cannot hold a {} chunk", max_size,
                                     chunk_type_name(chunk.type));
        }
      }
    }

    block_offset += chunk.chunk_size;
    image_offset += chunk.total_size;
  }

  splits.push_back(std::move(builder).finish());
  spdlog::debug("split {} chunks into {} images of at most {} bytes", chunks.size(), splits.size(), max_size);
  return splits;
}

sindri::core::Result<std::vector<Split>> split_raw(std::uint64_t raw_size, std::uint32_t max_size) noexcept {
  SINDRI_TRY(check_minimal_size(max_size, DEFAULT_BLOCK_SIZE));

  const std::uint64_t raw_blocks64 = (raw_size + DEFAULT_BLOCK_SIZE - 1) / DEFAULT_BLOCK_SIZE;
  if (raw_blocks64 > std::numeric_limits<std::uint32_t>::max()) {
    return sindri::core::failf(Errc::InvalidArgument, "raw image of {} bytes is too large to split", raw_size);
  }
  const auto raw_blocks = static_cast<std::uint32_t>(raw_blocks64);

  std::vector<Split> splits;
  std::uint32_t block_offset = 0;
  while (raw_blocks > block_offset) {
    SplitBuilder builder(DEFAULT_BLOCK_SIZE, max_size, block_offset);
    block_offset += builder.add_raw(static_cast<std::uint64_t>(block_offset) * DEFAULT_BLOCK_SIZE, raw_blocks - block_offset);
    splits.push_back(std::move(builder).finish());
  }
  return splits;
}

} // namespace sindri::sparse
