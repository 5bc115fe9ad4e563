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
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace sindri::core {

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

constexpr std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

constexpr bool starts_with_ci(std::string_view s, std::string_view pre) noexcept {
    if (s.size() < pre.size()) return false;
    for (std::size_t i = 0; i < pre.size(); ++i) {
        char a = s[i], b = pre[i];
        if (a >= 'A' && a <= 'Z') a = static_cast<char>(a - 'A' + 'a');
        if (b >= 'A' && b <= 'Z') b = static_cast<char>(b - 'A' + 'a');
        if (a != b) return false;
    }
    return true;
}

// Whole-string parse; trailing garbage is a failure.
template <class T>
std::optional<T> parse_uint(std::string_view s, int base) noexcept {
    if (s.empty()) return std::nullopt;
    T v{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, base);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

// "0x1000" or "1000" (hex either way).
inline std::optional<std::uint32_t> parse_hex_u32(std::string_view s) noexcept {
    s = trim(s);
    if (starts_with_ci(s, "0x")) s.remove_prefix(2);
    return parse_uint<std::uint32_t>(s, 16);
}

// "0x..." is hex, anything else decimal. Used for getvar values.
inline std::optional<std::uint64_t> parse_size(std::string_view s) noexcept {
    s = trim(s);
    if (starts_with_ci(s, "0x")) return parse_uint<std::uint64_t>(s.substr(2), 16);
    return parse_uint<std::uint64_t>(s, 10);
}

inline std::optional<std::pair<std::string_view, std::string_view>> split_last(std::string_view s, char sep) noexcept {
    const auto pos = s.rfind(sep);
    if (pos == std::string_view::npos) return std::nullopt;
    return std::pair{s.substr(0, pos), s.substr(pos + 1)};
}

} // namespace sindri::core
