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

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sindri::app {

// Single-line transfer progress. Redraws in place on a terminal, falls back
// to periodic log lines otherwise.
class TransferInterface {
public:
  explicit TransferInterface(bool is_tty_enabled);
  ~TransferInterface();

  TransferInterface(const TransferInterface &) = delete;
  TransferInterface &operator=(const TransferInterface &) = delete;

  void stage(std::string stage);
  void part(std::uint32_t index, std::uint32_t count);
  void progress(std::uint64_t done, std::uint64_t total);
  void done();

  static std::string bytes_h(std::uint64_t b);
  static std::string rate_h(double bytes_per_sec);
  static std::string eta_h(std::optional<std::chrono::seconds> eta);

private:
  void redraw_(bool force);
  std::string bar_(double frac, std::size_t width_cols) const;

  static bool is_tty_();
  static bool utf8_enabled_();

  bool tty_ = false, utf8_ = false;
  bool line_open_ = false;

  std::string stage_;
  std::uint32_t part_index_ = 0, part_count_ = 0;

  std::uint64_t done_ = 0, total_ = 0;
  int last_logged_pct_ = -1;

  std::chrono::steady_clock::time_point start_{}, last_rate_ts_{}, last_redraw_{};
  std::uint64_t last_rate_bytes_ = 0;
  double ema_rate_bps_ = 0.0;
};

} // namespace sindri::app
