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
#include "sparse/sparse_reader.hpp"

#include <cstdint>
#include <functional>

namespace sindri::sparse {

struct ExpandStats {
  std::uint64_t bytes_out = 0;
  std::uint32_t chunks = 0;
  std::uint32_t crc_checked = 0;
};

using ExpandProgress = std::function<void(std::uint64_t done, std::uint64_t total)>;

// Writes the expanded image. DontCare ranges are skipped on the sink. With
// verify_crc, each Crc32 chunk must match the CRC32 of all output before it.
sindri::core::Result<ExpandStats> expand(SparseReader& reader, sindri::io::ByteSink& sink, bool verify_crc,
                                         const ExpandProgress& progress = {}) noexcept;

} // namespace sindri::sparse
