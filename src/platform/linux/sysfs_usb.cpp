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

#include "platform/linux/sysfs_usb.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <fstream>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace sindri::linux {

namespace fs = std::filesystem;

namespace {

std::string read_text_file(const fs::path &p) {
  std::ifstream in(p);
  if (!in.is_open())
    return {};
  std::string s;
  std::getline(in, s);
  return std::string(sindri::core::trim(s));
}

std::optional<int> parse_int_dec(const std::string &s) {
  return sindri::core::parse_uint<int>(sindri::core::trim(s), 10);
}

std::optional<std::uint16_t> parse_u16_hex(const std::string &s) {
  return sindri::core::parse_uint<std::uint16_t>(sindri::core::trim(s), 16);
}

std::optional<std::uint8_t> parse_u8_hex(const std::string &s) {
  return sindri::core::parse_uint<std::uint8_t>(sindri::core::trim(s), 16);
}

// Interface directories are named "<sysname>:<config>.<interface>".
int find_fastboot_interface(const fs::path &dir, const std::string &sysname) {
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    const auto name = entry.path().filename().string();
    if (!name.starts_with(sysname + ":"))
      continue;

    const auto cls = parse_u8_hex(read_text_file(entry.path() / "bInterfaceClass"));
    const auto sub = parse_u8_hex(read_text_file(entry.path() / "bInterfaceSubClass"));
    const auto proto = parse_u8_hex(read_text_file(entry.path() / "bInterfaceProtocol"));
    const auto num = parse_u8_hex(read_text_file(entry.path() / "bInterfaceNumber"));
    if (!cls || !sub || !proto || !num)
      continue;

    if (is_fastboot_interface(*cls, *sub, *proto))
      return *num;
  }
  return -1;
}

std::optional<UsbDeviceSysfsInfo> load_one(const fs::path &dir,
                                           std::string sysname) {
  const fs::path idVendorPath = dir / "idVendor";
  const fs::path idProductPath = dir / "idProduct";
  const fs::path busnumPath = dir / "busnum";
  const fs::path devnumPath = dir / "devnum";

  if (!fs::exists(idVendorPath) || !fs::exists(idProductPath) ||
      !fs::exists(busnumPath) || !fs::exists(devnumPath)) {
    return std::nullopt;
  }

  const auto vend = parse_u16_hex(read_text_file(idVendorPath));
  const auto prod = parse_u16_hex(read_text_file(idProductPath));
  const auto bus = parse_int_dec(read_text_file(busnumPath));
  const auto dev = parse_int_dec(read_text_file(devnumPath));

  if (!vend || !prod || !bus || !dev)
    return std::nullopt;

  UsbDeviceSysfsInfo out;
  out.vendor = *vend;
  out.product = *prod;
  out.busnum = *bus;
  out.devnum = *dev;
  out.serial = read_text_file(dir / "serial");
  out.manufacturer = read_text_file(dir / "manufacturer");
  out.product_name = read_text_file(dir / "product");
  out.fastboot_interface = find_fastboot_interface(dir, sysname);
  out.sysname = std::move(sysname);

  const fs::path cdPath = dir / "power" / "connected_duration";
  if (fs::exists(cdPath)) {
    if (auto ms = parse_int_dec(read_text_file(cdPath))) {
      out.connected_duration_sec = *ms / 1000;
    }
  }

  return out;
}

} // namespace

std::string UsbDeviceSysfsInfo::devnode() const {
  return fmt::format("/dev/bus/usb/{:03d}/{:03d}", busnum, devnum);
}

std::string UsbDeviceSysfsInfo::describe() const {
  return fmt::format("{} [{}] {:04x}:{:04x} {} {}", serial.empty() ? "?" : serial, sysname, vendor, product,
                     manufacturer, product_name);
}

std::vector<UsbDeviceSysfsInfo> enumerate_fastboot_devices(const fs::path &root) {
  std::vector<UsbDeviceSysfsInfo> out;

  std::error_code ec;
  if (!fs::is_directory(root, ec))
    return out;

  for (const auto &entry : fs::directory_iterator(root, ec)) {
    if (!entry.is_directory())
      continue;
    const auto sysname = entry.path().filename().string();
    if (sysname.find(':') != std::string::npos)
      continue;

    auto info = load_one(entry.path(), sysname);
    if (!info)
      continue;

    spdlog::debug("Found USB device: {} (VID: 0x{:04x}, PID: 0x{:04x})",
                  info->sysname, info->vendor, info->product);

    if (info->fastboot_interface < 0)
      continue;

    spdlog::debug("Matched fastboot device: {} (interface {}, connected for {} seconds)",
                  info->sysname, info->fastboot_interface, info->connected_duration_sec);

    out.push_back(std::move(*info));
  }

  std::sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
    return a.connected_duration_sec > b.connected_duration_sec;
  });

  return out;
}

std::optional<UsbDeviceSysfsInfo> find_by_sysname(std::string_view sysname, const fs::path &root) {
  const fs::path dir = root / std::string(sysname);
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return std::nullopt;
  return load_one(dir, std::string(sysname));
}

std::optional<UsbDeviceSysfsInfo> find_by_serial(std::string_view serial, const fs::path &root) {
  for (auto &d : enumerate_fastboot_devices(root)) {
    if (d.serial == serial)
      return std::move(d);
  }
  return std::nullopt;
}

} // namespace sindri::linux
