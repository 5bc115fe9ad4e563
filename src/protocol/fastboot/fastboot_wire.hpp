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

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace sindri::fastboot {

inline constexpr std::size_t MAX_COMMAND_LEN = 64;
inline constexpr std::size_t MAX_RESPONSE_LEN = 64;
inline constexpr std::size_t RESPONSE_PREFIX_LEN = 4;
inline constexpr std::size_t DATA_LEN_DIGITS = 8;

inline constexpr std::string_view CMD_GETVAR = "getvar";
inline constexpr std::string_view CMD_DOWNLOAD = "download";
inline constexpr std::string_view CMD_UPLOAD = "upload";
inline constexpr std::string_view CMD_FLASH = "flash";
inline constexpr std::string_view CMD_ERASE = "erase";
inline constexpr std::string_view CMD_REBOOT = "reboot";
inline constexpr std::string_view CMD_REBOOT_BOOTLOADER = "reboot-bootloader";

enum class ResponseKind { Okay, Fail, Data, Info };

std::string_view response_kind_name(ResponseKind k) noexcept;

struct Response {
  ResponseKind kind = ResponseKind::Okay;
  std::string text;            // OKAY / FAIL / INFO payload
  std::uint32_t data_size = 0; // DATA only

  bool operator==(const Response&) const = default;
};

// "verb" or "verb:arg". Over-long or non-printable lines are rejected, never truncated.
sindri::core::Result<std::string> make_command(std::string_view verb, std::string_view arg = {});
std::string download_command(std::uint32_t size);

sindri::core::Result<Response> parse_response(std::span<const std::byte> bytes);

} // namespace sindri::fastboot
