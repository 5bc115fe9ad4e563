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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sindri::app {

struct Options {
    bool help = false;
    bool version = false;
    bool verbose = false;

    std::optional<std::string> serial;        // -s, falls back to ANDROID_SERIAL
    std::optional<std::string> target_sysname;
    std::optional<int> timeout_ms;

    // sparse expand / create
    bool verify_crc = true;
    std::optional<std::uint32_t> block_size;

    std::string command;
    std::vector<std::string> args;
};

sindri::core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace sindri::app
