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

#include "platform/linux/usbfs_conn.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <linux/usbdevice_fs.h>
#include <sys/ioctl.h>

#include <spdlog/spdlog.h>

namespace sindri::linux {

namespace {
constexpr std::size_t BULK_BUFFER_LENGTH_LIMIT = 16 * 1024;
constexpr std::size_t BULK_BUFFER_LENGTH_NO_LIMIT = 128 * 1024;
} // namespace

UsbFsConnection::UsbFsConnection(UsbFsDevice &dev) : dev_(dev) {}

sindri::core::Status UsbFsConnection::open() noexcept {
  if (connected_) {
    spdlog::warn("UsbFsConnection::open: already connected");
    return {};
  }
  if (!dev_.is_open()) return sindri::core::fail(sindri::core::Errc::Io, "UsbFsConnection::open: device not open");

  const auto eps = dev_.endpoints();
  if (!eps.bulk_in || !eps.bulk_out) return sindri::core::fail(sindri::core::Errc::NotFound, "UsbFsConnection::open: missing bulk endpoints");

  max_pack_size_ = dev_.has_packet_size_limit() ? BULK_BUFFER_LENGTH_LIMIT
                                                : BULK_BUFFER_LENGTH_NO_LIMIT;
  connected_ = true;
  return {};
}

void UsbFsConnection::close() noexcept { connected_ = false; }

sindri::core::Result<std::size_t> UsbFsConnection::bulk_(std::uint8_t ep, std::uint8_t *data, std::size_t len,
                                                         const char *what) noexcept {
  if (!connected_) return sindri::core::failf(sindri::core::Errc::Io, "UsbFsConnection::{}: not connected", what);

  usbdevfs_bulktransfer bulk{};
  bulk.ep = ep;
  bulk.len = static_cast<unsigned>(std::min(len, max_pack_size_));
  bulk.timeout = static_cast<unsigned>(std::max(timeout_ms_, 0));
  bulk.data = data;

  const int rc = ::ioctl(dev_.fd(), USBDEVFS_BULK, &bulk);
  if (rc < 0) {
    const int e = errno;
    if (e == ETIMEDOUT) {
      return sindri::core::failf(sindri::core::Errc::Timeout, "UsbFsConnection::{}: timed out after {} ms", what, timeout_ms_);
    }
    if (e == ENODEV || e == ESHUTDOWN) {
      return sindri::core::failf(sindri::core::Errc::Io, "UsbFsConnection::{}: device disconnected", what);
    }
    return sindri::core::failf(sindri::core::Errc::Io, "UsbFsConnection::{}: bulk transfer error: {}", what, std::strerror(e));
  }
  return static_cast<std::size_t>(rc);
}

sindri::core::Result<std::size_t> UsbFsConnection::send(std::span<const std::uint8_t> data) noexcept {
  return bulk_(dev_.endpoints().bulk_out, const_cast<std::uint8_t *>(data.data()), data.size(), "send");
}

sindri::core::Result<std::size_t> UsbFsConnection::recv(std::span<std::uint8_t> data) noexcept {
  return bulk_(dev_.endpoints().bulk_in, data.data(), data.size(), "recv");
}

} // namespace sindri::linux
