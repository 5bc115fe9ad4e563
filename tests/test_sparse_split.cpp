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

#include "check.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using sindri::core::Errc;
using namespace sindri::sparse;

static constexpr std::uint64_t FH = FILE_HEADER_SIZE;
static constexpr std::uint64_t CH = CHUNK_HEADER_SIZE;

static FileHeader header_of(std::uint32_t blocks, std::uint32_t chunks) {
  FileHeader h;
  h.block_size = 4096;
  h.total_blocks = blocks;
  h.total_chunks = chunks;
  return h;
}

static void test_split_fits() {
  const auto header = header_of(1024, 2);
  const ChunkHeader chunks[] = {ChunkHeader::fill(8), ChunkHeader::raw(1024 - 8, 4096)};

  auto splits = split_image(header, chunks, 1024 * 4096);
  if (!check_ok("fits", splits)) return;
  check_eq("fits_count", splits->size(), std::size_t{1});
  if (splits->empty()) return;

  const auto& s = splits->front();
  check_true("fits_header", s.header == header);
  check_eq("fits_chunks", s.chunks.size(), std::size_t{2});
  if (s.chunks.size() != 2) return;
  check_true("fits_fill", s.chunks[0] == SplitChunk{chunks[0], FH + CH, 4});
  check_true("fits_raw", s.chunks[1] == SplitChunk{chunks[1], FH + 2 * CH + 4, chunks[1].data_size()});
}

static void test_split_multiple() {
  const auto header = header_of(2048, 4);
  const ChunkHeader chunks[] = {ChunkHeader::fill(8), ChunkHeader::raw(1024 - 8, 4096), ChunkHeader::raw(1024 - 8, 4096),
                                ChunkHeader::fill(8)};

  const std::vector<Split> expected = {
    {header_of(519, 2),
     {
       {ChunkHeader::fill(8), FH + CH, 4},
       {ChunkHeader::raw(511, 4096), FH + 2 * CH + 4, 511 * 4096},
     }},
    // Rest of the first raw chunk, then the start of the second.
    {header_of(519 + 511, 3),
     {
       {ChunkHeader::dont_care(519), 0, 0},
       {ChunkHeader::raw(505, 4096), FH + 2 * CH + 4 + 511 * 4096, 505 * 4096},
       {ChunkHeader::raw(6, 4096), FH + 3 * CH + 4 + 1016 * 4096, 6 * 4096},
     }},
    {header_of(519 + 511 + 511, 2),
     {
       {ChunkHeader::dont_care(519 + 511), 0, 0},
       {ChunkHeader::raw(511, 4096), FH + 3 * CH + 4 + 1016 * 4096 + 6 * 4096, 511 * 4096},
     }},
    {header_of(2048, 3),
     {
       {ChunkHeader::dont_care(519 + 511 + 511), 0, 0},
       {ChunkHeader::raw(499, 4096), FH + 3 * CH + 4 + 1016 * 4096 + 517 * 4096, 499 * 4096},
       {ChunkHeader::fill(8), FH + 4 * CH + 4 + 1016 * 4096 + 1016 * 4096, 4},
     }},
  };

  auto splits = split_image(header, chunks, 512 * 4096);
  if (!check_ok("multiple", splits)) return;
  check_eq("multiple_count", splits->size(), expected.size());
  for (std::size_t i = 0; i < std::min(splits->size(), expected.size()); ++i) {
    const std::string label = "multiple_split_" + std::to_string(i);
    check_true(label.c_str(), (*splits)[i] == expected[i]);
    check_true((label + "_fits").c_str(), (*splits)[i].sparse_size() <= 512 * 4096);
  }
}

static void test_split_drops_crc() {
  const auto header = header_of(16, 3);
  const ChunkHeader chunks[] = {ChunkHeader::dont_care(8), ChunkHeader::crc32(), ChunkHeader::fill(8)};

  auto splits = split_image(header, chunks, 1024 * 1024);
  if (!check_ok("crc", splits)) return;
  check_eq("crc_count", splits->size(), std::size_t{1});
  if (splits->empty()) return;
  const auto& s = splits->front();
  check_eq("crc_chunks", s.chunks.size(), std::size_t{2});
  check_eq("crc_total_chunks", s.header.total_chunks, std::uint32_t{2});
  if (s.chunks.size() == 2) {
    // The fill payload sits after the skipped crc chunk.
    check_eq("crc_fill_offset", s.chunks[1].offset, FH + 2 * CH + 16);
  }
}

static void test_split_raw() {
  auto splits = split_raw(8 * 4096, 3 * 4096);
  if (!check_ok("raw", splits)) return;
  check_eq("raw_count", splits->size(), std::size_t{4});

  for (std::size_t i = 0; i < splits->size(); ++i) {
    const auto& s = (*splits)[i];
    const std::string label = "raw_" + std::to_string(i);
    check_eq((label + "_block_size").c_str(), s.header.block_size, std::uint32_t{4096});
    check_eq((label + "_checksum").c_str(), s.header.checksum, std::uint32_t{0});

    const std::size_t want_chunks = i == 0 ? 1 : 2;
    check_eq((label + "_chunks").c_str(), s.chunks.size(), want_chunks);
    check_eq((label + "_hdr_chunks").c_str(), s.header.total_chunks, static_cast<std::uint32_t>(want_chunks));
    if (s.chunks.size() != want_chunks) continue;

    if (i) {
      const SplitChunk skip{ChunkHeader{ChunkType::DontCare, static_cast<std::uint32_t>(2 * i), 12}, 0, 0};
      check_true((label + "_skip").c_str(), s.chunks[0] == skip);
    }
    const SplitChunk raw{ChunkHeader{ChunkType::Raw, 2, 2 * 4096 + 12}, 2 * i * 4096, 2 * 4096};
    check_true((label + "_raw").c_str(), s.chunks.back() == raw);
  }
}

static void test_split_raw_partial_tail() {
  auto splits = split_raw(4096 + 1, 1024 * 1024);
  if (!check_ok("raw_tail", splits)) return;
  check_eq("raw_tail_count", splits->size(), std::size_t{1});
  if (!splits->empty()) check_eq("raw_tail_blocks", splits->front().header.total_blocks, std::uint32_t{2});
}

static void test_split_too_small() {
  const auto header = header_of(1, 1);
  const ChunkHeader chunks[] = {ChunkHeader::raw(1, 4096)};
  check_err("too_small_image", split_image(header, chunks, static_cast<std::uint32_t>(min_split_size(4096) - 1)),
            Errc::InvalidArgument);
  check_err("too_small_raw", split_raw(4096, 100), Errc::InvalidArgument);
}

int main() {
  test_split_fits();
  test_split_multiple();
  test_split_drops_crc();
  test_split_raw();
  test_split_raw_partial_tail();
  test_split_too_small();

  return report("sparse_split");
}
