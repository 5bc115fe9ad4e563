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

namespace sindri::core {

// Request/response bulk pipe. One call is one transfer, bounded by
// max_transfer_size(); callers loop for larger payloads.
class IByteTransport {
 public:
  virtual ~IByteTransport() = default;

  virtual bool connected() const noexcept = 0;

  virtual void set_timeout_ms(int ms) noexcept = 0;
  virtual int timeout_ms() const noexcept = 0;

  virtual std::size_t max_transfer_size() const noexcept = 0;

  // Returns bytes accepted by the device (at most max_transfer_size()).
  virtual Result<std::size_t> send(std::span<const std::uint8_t> data) noexcept = 0;

  // Returns bytes received in one transfer; a short count ends a packet.
  virtual Result<std::size_t> recv(std::span<std::uint8_t> data) noexcept = 0;
};

// Restores the previous timeout when leaving scope.
class ScopedTimeout {
 public:
  ScopedTimeout(IByteTransport& t, int ms) noexcept : t_(t), prev_(t.timeout_ms()) { t_.set_timeout_ms(ms); }
  ~ScopedTimeout() { t_.set_timeout_ms(prev_); }

  ScopedTimeout(const ScopedTimeout&) = delete;
  ScopedTimeout& operator=(const ScopedTimeout&) = delete;

 private:
  IByteTransport& t_;
  int prev_;
};

} // namespace sindri::core
