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
#include "protocol/fastboot/fastboot_cmd.hpp"

#include <cstdint>
#include <functional>
#include <string_view>

namespace sindri::fastboot {

inline constexpr std::uint64_t DEFAULT_DOWNLOAD_LIMIT = 256ull * 1024 * 1024;

struct FlashOptions {
  // Used when the device does not report max-download-size.
  std::uint64_t default_download_limit = DEFAULT_DOWNLOAD_LIMIT;
  // Non-zero caps the device limit further.
  std::uint64_t download_limit_override = 0;
};

struct FlashPlan {
  bool sparse = false;
  std::uint32_t parts = 0;
  std::uint64_t bytes_total = 0;
};

using FlashProgress = std::function<void(std::uint64_t done, std::uint64_t total)>;
using PartCallback = std::function<void(std::uint32_t index, std::uint32_t count)>;

// Reads max-download-size; hex with 0x prefix or decimal.
sindri::core::Result<std::uint64_t> query_download_limit(FastbootCommands& fb, const FlashOptions& opt) noexcept;

// Streams a raw or sparse image, split to the download limit, and flashes
// every part to the partition.
sindri::core::Result<FlashPlan> flash_image(FastbootCommands& fb, std::string_view partition, sindri::io::ByteSource& image,
                                            const FlashOptions& opt = {}, const FlashProgress& progress = {},
                                            const PartCallback& on_part = {}) noexcept;

} // namespace sindri::fastboot
