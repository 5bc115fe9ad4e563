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

#include "sparse/sparse_expand.hpp"

#include "core/endian.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <vector>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace sindri::sparse {

namespace {

using sindri::core::Errc;

constexpr std::size_t BUF_SIZE = 1024 * 1024;

class Crc {
public:
  void update(std::span<const std::byte> d) noexcept {
    while (!d.empty()) {
      const auto n = static_cast<uInt>(std::min<std::size_t>(d.size(), std::numeric_limits<uInt>::max()));
      crc_ = ::crc32(crc_, reinterpret_cast<const Bytef*>(d.data()), n);
      d = d.subspan(n);
    }
  }

  std::uint32_t value() const noexcept { return static_cast<std::uint32_t>(crc_); }

private:
  uLong crc_ = ::crc32(0L, Z_NULL, 0);
};

// Runs the pattern buffer over n output bytes, writing and/or hashing it.
sindri::core::Status emit_pattern(std::span<const std::byte> pattern, std::uint64_t n, sindri::io::ByteSink* sink,
                                  Crc* crc) noexcept {
  while (n) {
    const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(n, pattern.size()));
    if (sink) SINDRI_TRY(sink->write(pattern.first(take)));
    if (crc) crc->update(pattern.first(take));
    n -= take;
  }
  return {};
}

} // namespace

sindri::core::Result<ExpandStats> expand(SparseReader& reader, sindri::io::ByteSink& sink, bool verify_crc,
                                         const ExpandProgress& progress) noexcept {
  const auto& hdr = reader.header();
  const std::uint64_t total = hdr.expanded_size();

  std::vector<std::byte> buf(BUF_SIZE);
  std::vector<std::byte> zeros;
  Crc crc;
  ExpandStats st;

  for (;;) {
    auto next = reader.next();
    if (!next) return sindri::core::forward(std::move(next.error()));
    if (!*next) break;
    const Chunk& c = **next;
    const std::uint64_t out = c.header.out_size(hdr.block_size);

    switch (c.header.type) {
      case ChunkType::Raw:
        for (;;) {
          auto got = reader.read_payload(buf);
          if (!got) return sindri::core::forward(std::move(got.error()));
          if (!*got) break;
          const auto data = std::span<const std::byte>(buf).first(*got);
          SINDRI_TRY(sink.write(data));
          if (verify_crc) crc.update(data);
        }
        break;

      case ChunkType::Fill: {
        // Fill the scratch buffer with the pattern once per chunk.
        std::array<std::byte, 4> word{};
        sindri::core::store_le<std::uint32_t>(word, c.value);
        const std::size_t len = static_cast<std::size_t>(std::min<std::uint64_t>(buf.size(), std::max<std::uint64_t>(out, 4)));
        for (std::size_t i = 0; i < len; ++i) buf[i] = word[i % 4];
        SINDRI_TRY(emit_pattern(std::span<const std::byte>(buf).first(len - len % 4), out, &sink, verify_crc ? &crc : nullptr));
        break;
      }

      case ChunkType::DontCare:
        SINDRI_TRY(sink.skip(out));
        if (verify_crc) {
          if (zeros.empty()) zeros.assign(BUF_SIZE, std::byte{0});
          SINDRI_TRY(emit_pattern(zeros, out, nullptr, &crc));
        }
        break;

      case ChunkType::Crc32:
        if (verify_crc) {
          if (c.value != crc.value()) {
            return sindri::core::failf(Errc::Format, "{}: crc32 mismatch at chunk {} (stored {:08x}, computed {:08x})",
                                       reader.source().display_name(), c.index, c.value, crc.value());
          }
          ++st.crc_checked;
        }
        break;
    }

    st.bytes_out += out;
    ++st.chunks;
    if (progress) progress(st.bytes_out, total);
  }

  SINDRI_TRY(sink.finish());

  spdlog::debug("expanded {} chunks into {} bytes ({} crc checks)", st.chunks, st.bytes_out, st.crc_checked);
  return st;
}

} // namespace sindri::sparse
