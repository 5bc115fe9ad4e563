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

#include "protocol/fastboot/fastboot_wire.hpp"

#include "core/bytes.hpp"
#include "core/str.hpp"

#include <fmt/format.h>

namespace sindri::fastboot {

namespace {

using sindri::core::Errc;

constexpr std::string_view PREFIX_OKAY = "OKAY";
constexpr std::string_view PREFIX_FAIL = "FAIL";
constexpr std::string_view PREFIX_DATA = "DATA";
constexpr std::string_view PREFIX_INFO = "INFO";

constexpr bool is_printable(char c) noexcept {
  return c >= 0x20 && c < 0x7f;
}

constexpr bool is_hex(char c) noexcept {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Some bootloaders NUL-terminate their replies.
std::string_view strip_nul(std::string_view s) noexcept {
  while (!s.empty() && s.back() == '\0') s.remove_suffix(1);
  return s;
}

} // namespace

std::string_view response_kind_name(ResponseKind k) noexcept {
  switch (k) {
    case ResponseKind::Okay: return "OKAY";
    case ResponseKind::Fail: return "FAIL";
    case ResponseKind::Data: return "DATA";
    case ResponseKind::Info: return "INFO";
  }
  return "????";
}

sindri::core::Result<std::string> make_command(std::string_view verb, std::string_view arg) {
  std::string line = arg.empty() ? std::string(verb) : fmt::format("{}:{}", verb, arg);

  if (line.empty()) return sindri::core::fail(Errc::InvalidArgument, "empty fastboot command");
  if (line.size() > MAX_COMMAND_LEN) {
    return sindri::core::failf(Errc::InvalidArgument, "command '{}' is {} bytes (limit {})", line, line.size(), MAX_COMMAND_LEN);
  }
  for (const char c : line) {
    if (!is_printable(c)) return sindri::core::failf(Errc::InvalidArgument, "command contains non-printable byte 0x{:02x}", static_cast<unsigned char>(c));
  }
  return line;
}

std::string download_command(std::uint32_t size) {
  return fmt::format("{}:{:08x}", CMD_DOWNLOAD, size);
}

sindri::core::Result<Response> parse_response(std::span<const std::byte> bytes) {
  const std::string_view s = sindri::core::as_text(bytes);
  if (s.size() < RESPONSE_PREFIX_LEN) {
    return sindri::core::failf(Errc::Format, "reply too short ({} bytes)", s.size());
  }

  const std::string_view prefix = s.substr(0, RESPONSE_PREFIX_LEN);
  const std::string_view rest = strip_nul(s.substr(RESPONSE_PREFIX_LEN));

  Response r;
  if (prefix == PREFIX_OKAY) {
    r.kind = ResponseKind::Okay;
  } else if (prefix == PREFIX_FAIL) {
    r.kind = ResponseKind::Fail;
  } else if (prefix == PREFIX_INFO) {
    r.kind = ResponseKind::Info;
  } else if (prefix == PREFIX_DATA) {
    if (rest.size() != DATA_LEN_DIGITS) {
      return sindri::core::failf(Errc::Format, "DATA length '{}' is not {} hex digits", rest, DATA_LEN_DIGITS);
    }
    for (const char c : rest) {
      if (!is_hex(c)) return sindri::core::failf(Errc::Format, "DATA length '{}' is not hex", rest);
    }
    const auto n = sindri::core::parse_uint<std::uint32_t>(rest, 16);
    if (!n) return sindri::core::failf(Errc::Format, "DATA length '{}' is not hex", rest);
    r.kind = ResponseKind::Data;
    r.data_size = *n;
    return r;
  } else {
    std::string shown;
    for (const char c : prefix) shown += is_printable(c) ? c : '.';
    return sindri::core::failf(Errc::Format, "unknown reply prefix '{}'", shown);
  }

  r.text = std::string(rest);
  return r;
}

} // namespace sindri::fastboot
