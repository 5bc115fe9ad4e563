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

#include "app/interface.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace sindri::app {

namespace {

constexpr std::size_t kBarWidth = 30;

bool env_has_utf8() {
  auto has = [](const char *v) {
    if (!v || !*v) return false;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
  };
  return has(std::getenv("LC_ALL")) || has(std::getenv("LC_CTYPE")) || has(std::getenv("LANG"));
}

} // namespace

bool TransferInterface::is_tty_() { return ::isatty(2) == 1; }

bool TransferInterface::utf8_enabled_() { return is_tty_() && env_has_utf8(); }

TransferInterface::TransferInterface(bool is_tty_enabled) {
  if (is_tty_enabled) {
    tty_ = is_tty_();
    utf8_ = utf8_enabled_();
  }
  start_ = last_rate_ts_ = last_redraw_ = std::chrono::steady_clock::now();
}

TransferInterface::~TransferInterface() {
  if (line_open_) std::cerr << "\n" << std::flush;
}

void TransferInterface::stage(std::string stage) {
  if (line_open_) {
    std::cerr << "\n";
    line_open_ = false;
  }
  stage_ = std::move(stage);
  part_index_ = part_count_ = 0;
  done_ = total_ = 0;
  last_logged_pct_ = -1;
  last_rate_bytes_ = 0;
  ema_rate_bps_ = 0.0;
  start_ = last_rate_ts_ = std::chrono::steady_clock::now();
  spdlog::info("{}", stage_);
}

void TransferInterface::part(std::uint32_t index, std::uint32_t count) {
  part_index_ = index;
  part_count_ = count;
  if (count > 1) {
    if (line_open_) {
      std::cerr << "\n";
      line_open_ = false;
    }
    spdlog::info("Sending sparse part {}/{}", index + 1, count);
  }
}

void TransferInterface::progress(std::uint64_t done, std::uint64_t total) {
  done_ = done;
  total_ = total;

  const auto now = std::chrono::steady_clock::now();
  if (done_ < last_rate_bytes_) {
    last_rate_ts_ = now;
    last_rate_bytes_ = done_;
    ema_rate_bps_ = 0.0;
    redraw_(false);
    return;
  }

  const auto dt = std::chrono::duration_cast<std::chrono::duration<double>>(now - last_rate_ts_).count();
  const auto db = static_cast<double>(done_ - last_rate_bytes_);

  if (dt >= 0.2) {
    const double inst = (dt > 0.0) ? (db / dt) : 0.0;
    ema_rate_bps_ = (ema_rate_bps_ <= 1e-9) ? inst : (ema_rate_bps_ * 0.90 + inst * 0.10);
    last_rate_ts_ = now;
    last_rate_bytes_ = done_;
    redraw_(false);
  } else if (done_ == total_ && total_ > 0) {
    redraw_(true);
  }
}

void TransferInterface::done() {
  if (line_open_) {
    std::cerr << "\n" << std::flush;
    line_open_ = false;
  }
  const auto secs = std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start_).count();
  spdlog::info("{}: OKAY [{:.3f}s]", stage_, secs);
}

void TransferInterface::redraw_(bool force) {
  const double frac = total_ ? static_cast<double>(done_) / static_cast<double>(total_) : 0.0;

  if (!tty_) {
    const int pct = static_cast<int>(frac * 100.0);
    if (pct == last_logged_pct_ || (!force && last_logged_pct_ >= 0 && pct / 10 == last_logged_pct_ / 10)) return;
    last_logged_pct_ = pct;
    spdlog::info("{}: {}% ({} / {})", stage_, pct, bytes_h(done_), bytes_h(total_));
    return;
  }

  const auto now = std::chrono::steady_clock::now();
  if (!force && now - last_redraw_ < std::chrono::milliseconds(100)) return;
  last_redraw_ = now;

  std::optional<std::chrono::seconds> eta;
  if (ema_rate_bps_ > 1e-9 && total_ >= done_) {
    eta = std::chrono::seconds(static_cast<std::int64_t>(static_cast<double>(total_ - done_) / ema_rate_bps_));
  }

  std::string line = fmt::format("\r{} [{}] {:3d}% {} / {} {} ETA {}", stage_, bar_(frac, kBarWidth),
                                 static_cast<int>(frac * 100.0), bytes_h(done_), bytes_h(total_),
                                 rate_h(ema_rate_bps_), eta_h(eta));
  std::cerr << line << "\x1b[K" << std::flush;
  line_open_ = true;
}

std::string TransferInterface::bytes_h(std::uint64_t b) {
  const char *u[] = {"B", "KB", "MB", "GB", "TB"};
  int i = 0;
  double v = static_cast<double>(b);
  while (v >= 1024.0 && i < 4) {
    v /= 1024.0;
    ++i;
  }
  std::ostringstream oss;
  if (!i)
    oss << static_cast<std::uint64_t>(v) << u[i];
  else
    oss << std::fixed << std::setprecision(v >= 10 ? 1 : 2) << v << u[i];
  return oss.str();
}

std::string TransferInterface::rate_h(double bps) {
  if (bps <= 1e-9) return "0B/s";
  return bytes_h(static_cast<std::uint64_t>(bps)) + "/s";
}

std::string TransferInterface::eta_h(std::optional<std::chrono::seconds> eta) {
  if (!eta) return "--:--";
  auto s = eta->count();
  const auto h = s / 3600; s %= 3600;
  const auto m = s / 60;   s %= 60;
  std::ostringstream oss;
  if (h) oss << h << "h";
  oss << std::setw(2) << std::setfill('0') << m << "m" << std::setw(2) << s << "s";
  return oss.str();
}

std::string TransferInterface::bar_(double frac, std::size_t w) const {
  frac = std::clamp(frac, 0.0, 1.0);
  const std::size_t filled = static_cast<std::size_t>(std::llround(frac * static_cast<double>(w)));

  std::string s;
  if (utf8_) {
    s.reserve(w * 3);
    for (std::size_t i = 0; i < w; ++i) s.append(i < filled ? "█" : "░");
    return s;
  }

  s.reserve(w);
  for (std::size_t i = 0; i < w; ++i) s.push_back(i < filled ? '=' : '-');
  return s;
}

} // namespace sindri::app
