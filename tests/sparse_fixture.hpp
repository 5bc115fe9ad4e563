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

#include "core/endian.hpp"
#include "sparse/sparse_format.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Hand-assembled sparse streams for the reader, expander and flasher tests.
class SparseImageBuilder {
public:
  explicit SparseImageBuilder(std::uint32_t block_size = sindri::sparse::DEFAULT_BLOCK_SIZE) { hdr_.block_size = block_size; }

  SparseImageBuilder& raw(std::span<const std::byte> data) {
    const auto blocks = static_cast<std::uint32_t>(data.size() / hdr_.block_size);
    add_(sindri::sparse::ChunkHeader::raw(blocks, hdr_.block_size), blocks);
    body_.insert(body_.end(), data.begin(), data.end());
    return *this;
  }

  SparseImageBuilder& raw_filled(std::uint32_t blocks, std::byte b) {
    std::vector<std::byte> data(static_cast<std::size_t>(blocks) * hdr_.block_size, b);
    return raw(data);
  }

  SparseImageBuilder& fill(std::uint32_t blocks, std::uint32_t value) {
    add_(sindri::sparse::ChunkHeader::fill(blocks), blocks);
    word_(value);
    return *this;
  }

  SparseImageBuilder& dont_care(std::uint32_t blocks) {
    add_(sindri::sparse::ChunkHeader::dont_care(blocks), blocks);
    return *this;
  }

  SparseImageBuilder& crc32(std::uint32_t value) {
    add_(sindri::sparse::ChunkHeader::crc32(), 0);
    word_(value);
    return *this;
  }

  // Appends a header verbatim, for malformed streams.
  SparseImageBuilder& chunk(const sindri::sparse::ChunkHeader& c, std::span<const std::byte> payload, std::uint32_t blocks) {
    add_(c, blocks);
    body_.insert(body_.end(), payload.begin(), payload.end());
    return *this;
  }

  sindri::sparse::FileHeader& header() { return hdr_; }

  std::vector<std::byte> build() const {
    auto h = sindri::sparse::serialize(hdr_);
    std::vector<std::byte> out(h.begin(), h.end());
    out.insert(out.end(), body_.begin(), body_.end());
    return out;
  }

private:
  void add_(const sindri::sparse::ChunkHeader& c, std::uint32_t blocks) {
    auto b = sindri::sparse::serialize(c);
    body_.insert(body_.end(), b.begin(), b.end());
    hdr_.total_chunks += 1;
    hdr_.total_blocks += blocks;
  }

  void word_(std::uint32_t v) {
    std::byte w[4];
    sindri::core::store_le<std::uint32_t>(w, v);
    body_.insert(body_.end(), w, w + 4);
  }

  sindri::sparse::FileHeader hdr_{};
  std::vector<std::byte> body_;
};
