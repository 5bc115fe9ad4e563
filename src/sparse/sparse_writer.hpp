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
#include "io/sink.hpp"
#include "io/source.hpp"
#include "sparse/sparse_format.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sindri::sparse {

// One logical run of output blocks. Raw regions carry exactly
// blocks * block_size bytes of data.
struct Region {
  ChunkType type = ChunkType::DontCare;
  std::uint32_t blocks = 0;
  std::uint32_t fill_value = 0;
  std::span<const std::byte> data;

  static Region raw(std::span<const std::byte> d, std::uint32_t blocks) noexcept { return {ChunkType::Raw, blocks, 0, d}; }
  static Region fill(std::uint32_t value, std::uint32_t blocks) noexcept { return {ChunkType::Fill, blocks, value, {}}; }
  static Region dont_care(std::uint32_t blocks) noexcept { return {ChunkType::DontCare, blocks, 0, {}}; }
};

// Same classification without the data; first_block locates it in the image.
struct BlockRun {
  ChunkType type = ChunkType::DontCare;
  std::uint64_t first_block = 0;
  std::uint32_t blocks = 0;
  std::uint32_t fill_value = 0;
};

struct EncodeStats {
  std::uint32_t blocks = 0;
  std::uint32_t chunks = 0;
  std::uint64_t bytes_written = 0;
};

// Classifies one block: all zero -> DontCare, one repeated non-zero word -> Fill, else Raw.
BlockRun classify_block(std::span<const std::byte> block) noexcept;

sindri::core::Result<EncodeStats> encode(std::span<const Region> regions, std::uint32_t block_size,
                                         sindri::io::ByteSink& sink) noexcept;

// image.size() must be a whole number of blocks.
sindri::core::Result<std::vector<Region>> detect_regions(std::span<const std::byte> image,
                                                         std::uint32_t block_size) noexcept;

// Scans the source, then emits the sparse stream. A trailing partial block is
// zero-padded.
sindri::core::Result<std::vector<BlockRun>> scan_runs(sindri::io::ByteSource& src, std::uint32_t block_size) noexcept;
sindri::core::Result<EncodeStats> encode_image(sindri::io::ByteSource& src, std::uint32_t block_size,
                                               sindri::io::ByteSink& sink) noexcept;

} // namespace sindri::sparse
