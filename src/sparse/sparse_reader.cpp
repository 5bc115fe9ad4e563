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

#include "sparse/sparse_reader.hpp"

#include "core/endian.hpp"
#include "io/read_exact.hpp"

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>

namespace sindri::sparse {

namespace {

using sindri::core::Errc;

std::uint64_t chunk_blocks(const ChunkHeader& c) noexcept {
  return c.type == ChunkType::Crc32 ? 0 : c.chunk_size;
}

} // namespace

sindri::core::Result<SparseReader> SparseReader::open(sindri::io::ByteSource& src) noexcept {
  SparseReader r(src);
  SINDRI_TRY(r.restart());
  return r;
}

sindri::core::Status SparseReader::read_header_() noexcept {
  FileHeaderBytes raw{};
  if (src_->size() < raw.size()) {
    const auto have = static_cast<std::size_t>(src_->size());
    SINDRI_TRY(sindri::io::read_exact(*src_, std::span(raw).first(have)));
    if (!has_magic(std::span<const std::byte>(raw).first(have))) {
      return sindri::core::failf(Errc::Format, "{}: not a sparse image (bad magic, {} bytes)", src_->display_name(), have);
    }
    return sindri::core::failf(Errc::Format, "{}: sparse header truncated ({} of {} bytes)", src_->display_name(), have,
                               raw.size());
  }
  SINDRI_TRY(sindri::io::read_exact(*src_, raw));

  auto h = parse_file_header(raw);
  if (!h) return sindri::core::forward(std::move(h.error()));
  hdr_ = *h;

  spdlog::debug("{}: sparse v{}.{}, block {} x {}, {} chunks", src_->display_name(), hdr_.major_version,
                hdr_.minor_version, hdr_.block_size, hdr_.total_blocks, hdr_.total_chunks);
  return {};
}

sindri::core::Status SparseReader::restart() noexcept {
  SINDRI_TRY(src_->seek(0));
  SINDRI_TRY(read_header_());

  cur_ = Cursor{};
  cur_.chunks_remaining = hdr_.total_chunks;
  next_index_ = 0;
  payload_left_ = 0;
  done_ = false;
  return {};
}

sindri::core::Result<std::optional<Chunk>> SparseReader::next() noexcept {
  payload_left_ = 0;

  if (cur_.chunks_remaining == 0) {
    if (!done_ && cur_.out_blocks != hdr_.total_blocks) {
      return sindri::core::failf(Errc::Format, "{}: chunks cover {} blocks, header declares {}", src_->display_name(),
                                 cur_.out_blocks, hdr_.total_blocks);
    }
    done_ = true;
    return std::optional<Chunk>{};
  }

  if (cur_.offset + CHUNK_HEADER_SIZE > src_->size()) {
    return sindri::core::failf(Errc::Format, "{}: chunk {} header truncated at offset {}", src_->display_name(), next_index_,
                               cur_.offset);
  }
  if (src_->tell() != cur_.offset) SINDRI_TRY(src_->seek(cur_.offset));

  ChunkHeaderBytes raw{};
  SINDRI_TRY(sindri::io::read_exact(*src_, raw));

  auto h = parse_chunk_header(raw);
  if (!h) return sindri::core::forward(std::move(h.error()));
  SINDRI_TRY(validate_chunk(*h, hdr_.block_size));

  const std::uint64_t payload_at = cur_.offset + CHUNK_HEADER_SIZE;
  if (h->data_size() > src_->size() - std::min(src_->size(), payload_at)) {
    return sindri::core::failf(Errc::Format, "{}: chunk {} payload truncated ({} bytes at offset {})", src_->display_name(),
                               next_index_, h->data_size(), payload_at);
  }

  const std::uint64_t blocks = cur_.out_blocks + chunk_blocks(*h);
  if (blocks > hdr_.total_blocks) {
    return sindri::core::failf(Errc::Format, "{}: chunk {} overruns the declared {} blocks", src_->display_name(),
                               next_index_, hdr_.total_blocks);
  }

  Chunk c;
  c.header = *h;
  c.index = next_index_;
  c.payload_offset = payload_at;
  c.out_offset = cur_.out_offset;

  if (h->type == ChunkType::Fill || h->type == ChunkType::Crc32) {
    std::array<std::byte, 4> v{};
    SINDRI_TRY(sindri::io::read_exact(*src_, v));
    c.value = sindri::core::load_le<std::uint32_t>(v);
  }

  cur_.offset = payload_at + h->data_size();
  cur_.chunks_remaining -= 1;
  cur_.out_offset += h->out_size(hdr_.block_size);
  cur_.out_blocks = blocks;
  ++next_index_;

  if (h->type == ChunkType::Raw) payload_left_ = h->data_size();

  spdlog::trace("chunk {}: {} blocks={} total={} out@{}", c.index, chunk_type_name(h->type), h->chunk_size,
                h->total_size, c.out_offset);
  return std::optional<Chunk>{c};
}

sindri::core::Result<std::size_t> SparseReader::read_payload(std::span<std::byte> out) noexcept {
  if (!payload_left_ || out.empty()) return std::size_t{0};
  const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(out.size(), payload_left_));
  SINDRI_TRY(sindri::io::read_exact(*src_, out.first(n)));
  payload_left_ -= n;
  return n;
}

} // namespace sindri::sparse
