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

#include <fmt/format.h>

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace sindri::core {

enum class Errc {
  Format,          // malformed sparse stream or fastboot reply
  Protocol,        // device said FAIL, or disagreed with us about sizes / ordering
  Io,
  Timeout,
  NotFound,
  Busy,
  InvalidArgument,
};

constexpr std::string_view errc_name(Errc c) noexcept {
  switch (c) {
    case Errc::Format: return "format error";
    case Errc::Protocol: return "protocol error";
    case Errc::Io: return "I/O error";
    case Errc::Timeout: return "timeout";
    case Errc::NotFound: return "not found";
    case Errc::Busy: return "busy";
    case Errc::InvalidArgument: return "invalid argument";
  }
  return "unknown error";
}

struct Error {
  Errc code = Errc::Io;
  std::string msg;

  std::string describe() const { return fmt::format("{}: {}", errc_name(code), msg); }
};

using Status = std::expected<void, Error>;

template <class T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(Errc code, std::string msg) {
  return std::unexpected<Error>(Error{code, std::move(msg)});
}

template <class... Args>
std::unexpected<Error> failf(Errc code, fmt::format_string<Args...> f, Args&&... args) {
  return fail(code, fmt::format(f, std::forward<Args>(args)...));
}

// Re-wraps an error from a Result<U> into any other Result<T>/Status.
inline std::unexpected<Error> forward(Error e) { return std::unexpected<Error>(std::move(e)); }

} // namespace sindri::core

#define SINDRI_TRY(expr) do { auto _st = (expr); if (!_st) return ::sindri::core::forward(std::move(_st.error())); } while (0)
