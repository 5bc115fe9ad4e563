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

#include "platform/linux/usbfs_device.hpp"

#include "core/endian.hpp"
#include "platform/linux/sysfs_usb.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <linux/usb/ch9.h>
#include <linux/usbdevice_fs.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace sindri::linux {

namespace {

using sindri::core::Errc;

#ifndef IOCTL_USBDEVFS_GET_CAPABILITIES
#   define IOCTL_USBDEVFS_GET_CAPABILITIES  _IOR('U', 26, __u32)
#endif

#ifndef USBFS_CAP_NO_PACKET_SIZE_LIM
#   define USBFS_CAP_NO_PACKET_SIZE_LIM    0x04
#endif

Errc errc_from_errno(int e) noexcept {
  switch (e) {
    case ENOENT:
    case ENODEV:
    case ENXIO: return Errc::NotFound;
    case EBUSY: return Errc::Busy;
    default: return Errc::Io;
  }
}

} // namespace

sindri::core::Result<FastbootInterface> find_fastboot_interface(std::span<const std::uint8_t> buf, UsbIds* ids) noexcept {
  if (buf.size() < USB_DT_DEVICE_SIZE) return sindri::core::fail(Errc::Io, "descriptor dump too short");

  usb_device_descriptor dev{};
  std::memcpy(&dev, buf.data(), USB_DT_DEVICE_SIZE);
  if (dev.bLength < USB_DT_DEVICE_SIZE || dev.bDescriptorType != USB_DT_DEVICE) {
    return sindri::core::fail(Errc::Io, "bad device descriptor");
  }
  if (ids) *ids = UsbIds{sindri::core::le_to_host<std::uint16_t>(dev.idVendor), sindri::core::le_to_host<std::uint16_t>(dev.idProduct)};

  std::size_t off = dev.bLength;
  if (off + USB_DT_CONFIG_SIZE > buf.size()) return sindri::core::fail(Errc::Io, "missing configuration descriptor");

  usb_config_descriptor cfg{};
  std::memcpy(&cfg, buf.data() + off, USB_DT_CONFIG_SIZE);
  if (cfg.bLength < USB_DT_CONFIG_SIZE || cfg.bDescriptorType != USB_DT_CONFIG) {
    return sindri::core::fail(Errc::Io, "bad configuration descriptor");
  }

  const std::size_t cfg_off = off;
  const std::size_t cfg_total = sindri::core::le_to_host<std::uint16_t>(cfg.wTotalLength);
  if (cfg_total < cfg.bLength || cfg_off + cfg_total > buf.size()) {
    return sindri::core::fail(Errc::Io, "truncated configuration descriptor");
  }

  FastbootInterface found{};
  bool cur_fastboot = false;
  int cur_ifc = -1;
  UsbEndpoints cur_eps{};

  auto commit_ifc = [&] {
    if (found.number >= 0 || !cur_fastboot) return;
    if (cur_eps.bulk_in && cur_eps.bulk_out) {
      found.number = cur_ifc;
      found.eps = cur_eps;
    }
  };

  off = cfg_off + cfg.bLength;
  const std::size_t end = cfg_off + cfg_total;

  while (off + 2 <= end) {
    const std::uint8_t bLength = buf[off + 0];
    const std::uint8_t bType   = buf[off + 1];
    if (bLength == 0) break;
    if (off + bLength > end) break;

    if (bType == USB_DT_INTERFACE) {
      commit_ifc();

      if (bLength < USB_DT_INTERFACE_SIZE) return sindri::core::fail(Errc::Io, "short interface descriptor");
      usb_interface_descriptor ifc{};
      std::memcpy(&ifc, buf.data() + off, USB_DT_INTERFACE_SIZE);
      cur_ifc = ifc.bInterfaceNumber;
      cur_fastboot = ifc.bAlternateSetting == 0 &&
                     is_fastboot_interface(ifc.bInterfaceClass, ifc.bInterfaceSubClass, ifc.bInterfaceProtocol);
      cur_eps = {};
    } else if (bType == USB_DT_ENDPOINT) {
      if (bLength < USB_DT_ENDPOINT_SIZE) return sindri::core::fail(Errc::Io, "short endpoint descriptor");
      usb_endpoint_descriptor ep{};
      std::memcpy(&ep, buf.data() + off, USB_DT_ENDPOINT_SIZE);

      const bool is_bulk = ((ep.bmAttributes & 0x03) == 0x02);
      if (is_bulk) {
        const std::uint16_t mps = sindri::core::le_to_host<std::uint16_t>(ep.wMaxPacketSize);
        if (ep.bEndpointAddress & 0x80) {
          cur_eps.bulk_in = ep.bEndpointAddress;
          cur_eps.bulk_in_max_packet = mps;
        } else {
          cur_eps.bulk_out = ep.bEndpointAddress;
          cur_eps.bulk_out_max_packet = mps;
        }
      }
    }

    off += bLength;
  }

  commit_ifc();

  if (found.number < 0) return sindri::core::fail(Errc::NotFound, "no fastboot interface with bulk endpoints");
  return found;
}

UsbFsDevice::UsbFsDevice(std::string devnode) : devnode_(std::move(devnode)) {}
UsbFsDevice::~UsbFsDevice() { close(); }

UsbFsDevice::UsbFsDevice(UsbFsDevice&& o) noexcept { *this = std::move(o); }

UsbFsDevice& UsbFsDevice::operator=(UsbFsDevice&& o) noexcept {
  if (this == &o) return *this;
  close();

  devnode_ = std::move(o.devnode_);
  fd_ = std::move(o.fd_);

  claimed_ = o.claimed_; o.claimed_ = false;
  driver_detached_ = o.driver_detached_; o.driver_detached_ = false;

  ids_ = o.ids_;
  eps_ = o.eps_;
  ifc_num_ = o.ifc_num_;
  caps_ = o.caps_;
  return *this;
}

sindri::core::Status UsbFsDevice::open_and_init() noexcept {
  close();

  const int fd = ::open(devnode_.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    const int e = errno;
    return sindri::core::failf(errc_from_errno(e), "open {}: {}", devnode_, std::strerror(e));
  }
  fd_.take(fd);

  if (auto st = parse_descriptors_(); !st) {
    close();
    return st;
  }

  query_caps_();

  if (kernel_driver_active_()) {
    if (!detach_kernel_driver_()) {
      close();
      return sindri::core::failf(Errc::Busy, "cannot detach kernel driver from {} interface {}", devnode_, ifc_num_);
    }
    driver_detached_ = true;
  }

  if (auto st = claim_interface_(); !st) {
    if (driver_detached_) (void)attach_kernel_driver_();
    driver_detached_ = false;
    close();
    return st;
  }
  claimed_ = true;

  spdlog::debug("Opened {} ({:04x}:{:04x}), interface {}, EP IN 0x{:02x} OUT 0x{:02x}", devnode_, ids_.vendor, ids_.product,
                ifc_num_, eps_.bulk_in, eps_.bulk_out);
  return {};
}

void UsbFsDevice::close() noexcept {
  if (!fd_.valid()) return;

  if (claimed_) {
    release_interface_();
    claimed_ = false;
  }

  if (driver_detached_) {
    (void)attach_kernel_driver_();
    driver_detached_ = false;
  }

  fd_.close();
}

bool UsbFsDevice::has_packet_size_limit() const noexcept {
  return !(caps_ & USBFS_CAP_NO_PACKET_SIZE_LIM);
}

bool UsbFsDevice::kernel_driver_active_() const noexcept {
  if (!fd_.valid() || ifc_num_ < 0) return false;
  usbdevfs_getdriver gd{};
  gd.interface = static_cast<unsigned>(ifc_num_);
  return (::ioctl(fd_.fd, USBDEVFS_GETDRIVER, &gd) == 0);
}

bool UsbFsDevice::detach_kernel_driver_() noexcept {
  if (!fd_.valid() || ifc_num_ < 0) return true;
  if (!kernel_driver_active_()) return true;

  usbdevfs_ioctl cmd{};
  cmd.ifno = ifc_num_;
  cmd.ioctl_code = USBDEVFS_DISCONNECT;
  cmd.data = nullptr;
  return do_ioctl(fd_, USBDEVFS_IOCTL, &cmd) == 0;
}

bool UsbFsDevice::attach_kernel_driver_() noexcept {
  if (!fd_.valid() || ifc_num_ < 0) return true;

  usbdevfs_ioctl cmd{};
  cmd.ifno = ifc_num_;
  cmd.ioctl_code = USBDEVFS_CONNECT;
  cmd.data = nullptr;
  return do_ioctl(fd_, USBDEVFS_IOCTL, &cmd) == 0;
}

sindri::core::Status UsbFsDevice::claim_interface_() noexcept {
  int ifc = ifc_num_;
  if (::ioctl(fd_.fd, USBDEVFS_CLAIMINTERFACE, &ifc) == 0) return {};
  const int e = errno;
  return sindri::core::failf(errc_from_errno(e), "claim interface {} on {}: {}", ifc_num_, devnode_, std::strerror(e));
}

void UsbFsDevice::release_interface_() noexcept {
  int ifc = ifc_num_;
  (void)do_ioctl(fd_, USBDEVFS_RELEASEINTERFACE, &ifc);
}

void UsbFsDevice::query_caps_() noexcept {
  std::uint32_t caps{};
  const int r = ::ioctl(fd_.fd, IOCTL_USBDEVFS_GET_CAPABILITIES, &caps);
  caps_ = (r < 0) ? 0u : caps;
}

sindri::core::Status UsbFsDevice::parse_descriptors_() noexcept {
  std::vector<std::uint8_t> buf(64 * 1024);
  const int n = do_read(fd_, buf.data(), buf.size());
  if (n <= 0) return sindri::core::failf(Errc::Io, "read descriptors from {} failed", devnode_);
  buf.resize(static_cast<std::size_t>(n));

  auto ifc = find_fastboot_interface(buf, &ids_);
  if (!ifc) return sindri::core::failf(ifc.error().code, "{}: {}", devnode_, ifc.error().msg);

  ifc_num_ = ifc->number;
  eps_ = ifc->eps;
  return {};
}

} // namespace sindri::linux
