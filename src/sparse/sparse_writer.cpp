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

#include "sparse/sparse_writer.hpp"

#include "core/endian.hpp"
#include "io/read_exact.hpp"

#include <algorithm>
#include <array>
#include <limits>

#include <spdlog/spdlog.h>

namespace sindri::sparse {

namespace {

using sindri::core::Errc;

constexpr std::size_t COPY_BUF = 1024 * 1024;

sindri::core::Status check_block_size(std::uint32_t bs) noexcept {
  if (bs == 0 || (bs % 4) != 0) return sindri::core::failf(Errc::InvalidArgument, "block size {} is not a non-zero multiple of 4", bs);
  return {};
}

// Appends a block to the run list, merging with the previous run when it matches.
void push_block(std::vector<BlockRun>& runs, const BlockRun& b, std::uint32_t max_raw) {
  if (!runs.empty()) {
    auto& last = runs.back();
    const bool same = last.type == b.type && (b.type != ChunkType::Fill || last.fill_value == b.fill_value);
    const std::uint32_t cap = b.type == ChunkType::Raw ? max_raw : std::numeric_limits<std::uint32_t>::max();
    if (same && last.first_block + last.blocks == b.first_block && last.blocks < cap) {
      ++last.blocks;
      return;
    }
  }
  runs.push_back(b);
}

class CountingSink {
public:
  explicit CountingSink(sindri::io::ByteSink& s) : s_(s) {}

  sindri::core::Status write(std::span<const std::byte> d) noexcept {
    SINDRI_TRY(s_.write(d));
    n_ += d.size();
    return {};
  }

  std::uint64_t written() const noexcept { return n_; }

private:
  sindri::io::ByteSink& s_;
  std::uint64_t n_ = 0;
};

sindri::core::Status write_fill_payload(CountingSink& out, std::uint32_t value) noexcept {
  std::array<std::byte, 4> v{};
  sindri::core::store_le<std::uint32_t>(v, value);
  return out.write(v);
}

sindri::core::Result<FileHeader> plan_header(std::uint64_t blocks, std::uint64_t chunks, std::uint32_t bs) noexcept {
  if (blocks > std::numeric_limits<std::uint32_t>::max()) {
    return sindri::core::failf(Errc::InvalidArgument, "image of {} blocks does not fit a sparse header", blocks);
  }
  if (chunks > std::numeric_limits<std::uint32_t>::max()) {
    return sindri::core::failf(Errc::InvalidArgument, "{} chunks do not fit a sparse header", chunks);
  }
  FileHeader h;
  h.block_size = bs;
  h.total_blocks = static_cast<std::uint32_t>(blocks);
  h.total_chunks = static_cast<std::uint32_t>(chunks);
  return h;
}

} // namespace

BlockRun classify_block(std::span<const std::byte> block) noexcept {
  BlockRun r;
  r.blocks = 1;
  if (block.size() < 4) {
    r.type = ChunkType::Raw;
    return r;
  }

  const std::uint32_t first = sindri::core::load_le<std::uint32_t>(block);
  for (std::size_t off = 4; off + 4 <= block.size(); off += 4) {
    if (sindri::core::load_le<std::uint32_t>(block.subspan(off)) != first) {
      r.type = ChunkType::Raw;
      return r;
    }
  }

  if (first == 0) {
    r.type = ChunkType::DontCare;
  } else {
    r.type = ChunkType::Fill;
    r.fill_value = first;
  }
  return r;
}

sindri::core::Result<EncodeStats> encode(std::span<const Region> regions, std::uint32_t block_size,
                                         sindri::io::ByteSink& sink) noexcept {
  SINDRI_TRY(check_block_size(block_size));
  const std::uint32_t max_raw = ChunkHeader::max_raw_blocks(block_size);

  std::uint64_t blocks = 0;
  std::uint64_t chunks = 0;
  for (const auto& r : regions) {
    switch (r.type) {
      case ChunkType::Raw:
        if (r.data.size() != static_cast<std::uint64_t>(r.blocks) * block_size) {
          return sindri::core::failf(Errc::InvalidArgument, "raw region has {} bytes, expected {} blocks of {}",
                                     r.data.size(), r.blocks, block_size);
        }
        chunks += r.blocks ? (r.blocks + max_raw - 1) / max_raw : 1;
        break;
      case ChunkType::Fill:
      case ChunkType::DontCare:
        chunks += 1;
        break;
      case ChunkType::Crc32:
        return sindri::core::fail(Errc::InvalidArgument, "crc32 is not a region type");
    }
    blocks += r.blocks;
  }

  auto hdr = plan_header(blocks, chunks, block_size);
  if (!hdr) return sindri::core::forward(std::move(hdr.error()));

  CountingSink out(sink);
  SINDRI_TRY(out.write(serialize(*hdr)));

  for (const auto& r : regions) {
    switch (r.type) {
      case ChunkType::Raw: {
        std::uint32_t left = r.blocks;
        std::size_t off = 0;
        do {
          const std::uint32_t n = std::min(left, max_raw);
          const std::size_t bytes = static_cast<std::size_t>(n) * block_size;
          SINDRI_TRY(out.write(serialize(ChunkHeader::raw(n, block_size))));
          SINDRI_TRY(out.write(r.data.subspan(off, bytes)));
          off += bytes;
          left -= n;
        } while (left);
        break;
      }
      case ChunkType::Fill:
        SINDRI_TRY(out.write(serialize(ChunkHeader::fill(r.blocks))));
        SINDRI_TRY(write_fill_payload(out, r.fill_value));
        break;
      case ChunkType::DontCare:
        SINDRI_TRY(out.write(serialize(ChunkHeader::dont_care(r.blocks))));
        break;
      case ChunkType::Crc32:
        break;
    }
  }

  EncodeStats st;
  st.blocks = hdr->total_blocks;
  st.chunks = hdr->total_chunks;
  st.bytes_written = out.written();
  return st;
}

sindri::core::Result<std::vector<Region>> detect_regions(std::span<const std::byte> image,
                                                         std::uint32_t block_size) noexcept {
  SINDRI_TRY(check_block_size(block_size));
  if (image.size() % block_size) {
    return sindri::core::failf(Errc::InvalidArgument, "image size {} is not a multiple of block size {}", image.size(), block_size);
  }

  const std::uint32_t max_raw = ChunkHeader::max_raw_blocks(block_size);
  const std::uint64_t nblocks = image.size() / block_size;

  std::vector<BlockRun> runs;
  for (std::uint64_t b = 0; b < nblocks; ++b) {
    auto r = classify_block(image.subspan(static_cast<std::size_t>(b * block_size), block_size));
    r.first_block = b;
    push_block(runs, r, max_raw);
  }

  std::vector<Region> out;
  out.reserve(runs.size());
  for (const auto& r : runs) {
    switch (r.type) {
      case ChunkType::Raw:
        out.push_back(Region::raw(image.subspan(static_cast<std::size_t>(r.first_block * block_size),
                                                static_cast<std::size_t>(r.blocks) * block_size),
                                  r.blocks));
        break;
      case ChunkType::Fill: out.push_back(Region::fill(r.fill_value, r.blocks)); break;
      case ChunkType::DontCare: out.push_back(Region::dont_care(r.blocks)); break;
      case ChunkType::Crc32:
        return sindri::core::fail(Errc::InvalidArgument, "block classified as crc32");
    }
  }
  return out;
}

sindri::core::Result<std::vector<BlockRun>> scan_runs(sindri::io::ByteSource& src, std::uint32_t block_size) noexcept {
  SINDRI_TRY(check_block_size(block_size));
  SINDRI_TRY(src.seek(0));

  const std::uint64_t size = src.size();
  const std::uint64_t nblocks = (size + block_size - 1) / block_size;
  if (nblocks > std::numeric_limits<std::uint32_t>::max()) {
    return sindri::core::failf(Errc::InvalidArgument, "{}: {} blocks do not fit a sparse header", src.display_name(), nblocks);
  }

  const std::uint32_t max_raw = ChunkHeader::max_raw_blocks(block_size);
  std::vector<std::byte> block(block_size);
  std::vector<BlockRun> runs;

  for (std::uint64_t b = 0; b < nblocks; ++b) {
    const std::uint64_t have = std::min<std::uint64_t>(block_size, size - b * block_size);
    if (have < block_size) std::fill(block.begin() + static_cast<std::ptrdiff_t>(have), block.end(), std::byte{0});
    SINDRI_TRY(sindri::io::read_exact(src, std::span(block).first(static_cast<std::size_t>(have))));

    auto r = classify_block(block);
    r.first_block = b;
    push_block(runs, r, max_raw);
  }

  spdlog::debug("{}: {} blocks in {} runs", src.display_name(), nblocks, runs.size());
  return runs;
}

sindri::core::Result<EncodeStats> encode_image(sindri::io::ByteSource& src, std::uint32_t block_size,
                                               sindri::io::ByteSink& sink) noexcept {
  auto runs = scan_runs(src, block_size);
  if (!runs) return sindri::core::forward(std::move(runs.error()));

  std::uint64_t blocks = 0;
  for (const auto& r : *runs) blocks += r.blocks;

  auto hdr = plan_header(blocks, runs->size(), block_size);
  if (!hdr) return sindri::core::forward(std::move(hdr.error()));

  CountingSink out(sink);
  SINDRI_TRY(out.write(serialize(*hdr)));

  std::vector<std::byte> buf(std::max<std::size_t>(COPY_BUF - COPY_BUF % block_size, block_size));

  for (const auto& r : *runs) {
    switch (r.type) {
      case ChunkType::Raw: {
        SINDRI_TRY(out.write(serialize(ChunkHeader::raw(r.blocks, block_size))));
        const std::uint64_t start = r.first_block * block_size;
        std::uint64_t left = static_cast<std::uint64_t>(r.blocks) * block_size;
        SINDRI_TRY(src.seek(start));
        while (left) {
          const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(left, buf.size()));
          const std::size_t from_src = static_cast<std::size_t>(std::min<std::uint64_t>(n, src.remaining()));
          SINDRI_TRY(sindri::io::read_exact(src, std::span(buf).first(from_src)));
          std::fill(buf.begin() + static_cast<std::ptrdiff_t>(from_src), buf.begin() + static_cast<std::ptrdiff_t>(n), std::byte{0});
          SINDRI_TRY(out.write(std::span(buf).first(n)));
          left -= n;
        }
        break;
      }
      case ChunkType::Fill:
        SINDRI_TRY(out.write(serialize(ChunkHeader::fill(r.blocks))));
        SINDRI_TRY(write_fill_payload(out, r.fill_value));
        break;
      case ChunkType::DontCare:
        SINDRI_TRY(out.write(serialize(ChunkHeader::dont_care(r.blocks))));
        break;
      case ChunkType::Crc32:
        return sindri::core::fail(Errc::InvalidArgument, "block run classified as crc32");
    }
  }

  EncodeStats st;
  st.blocks = hdr->total_blocks;
  st.chunks = hdr->total_chunks;
  st.bytes_written = out.written();
  spdlog::info("{}: {} blocks -> {} chunks, {} bytes", src.display_name(), st.blocks, st.chunks, st.bytes_written);
  return st;
}

} // namespace sindri::sparse
