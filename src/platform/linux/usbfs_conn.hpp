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

#include "core/byte_transport.hpp"
#include "platform/linux/usbfs_device.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace sindri::linux {

// Bulk pipe over a claimed usbfs interface. No retries: a failed or timed
// out transfer is reported as-is.
class UsbFsConnection : public sindri::core::IByteTransport {
public:
  explicit UsbFsConnection(UsbFsDevice &dev);

  sindri::core::Status open() noexcept;
  void close() noexcept;
  bool connected() const noexcept override { return connected_; }

  void set_timeout_ms(int ms) noexcept override { timeout_ms_ = ms; }
  int timeout_ms() const noexcept override { return timeout_ms_; }

  std::size_t max_transfer_size() const noexcept override { return max_pack_size_; }

  sindri::core::Result<std::size_t> send(std::span<const std::uint8_t> data) noexcept override;
  sindri::core::Result<std::size_t> recv(std::span<std::uint8_t> data) noexcept override;

private:
  sindri::core::Result<std::size_t> bulk_(std::uint8_t ep, std::uint8_t *data, std::size_t len, const char *what) noexcept;

  UsbFsDevice &dev_;
  bool connected_ = false;
  int timeout_ms_ = 5000;

  std::size_t max_pack_size_ = 16 * 1024;
};

} // namespace sindri::linux
