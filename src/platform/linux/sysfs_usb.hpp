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

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sindri::linux {

inline constexpr std::uint8_t FASTBOOT_CLASS = 0xFF;
inline constexpr std::uint8_t FASTBOOT_SUBCLASS = 0x42;
inline constexpr std::uint8_t FASTBOOT_PROTOCOL = 0x03;

constexpr bool is_fastboot_interface(std::uint8_t cls, std::uint8_t subclass, std::uint8_t proto) noexcept {
  return cls == FASTBOOT_CLASS && subclass == FASTBOOT_SUBCLASS && proto == FASTBOOT_PROTOCOL;
}

struct UsbDeviceSysfsInfo {
  std::string sysname;
  int busnum = -1;
  int devnum = -1;
  std::uint16_t vendor = 0;
  std::uint16_t product = 0;
  std::string serial;
  std::string manufacturer;
  std::string product_name;
  int fastboot_interface = -1;
  int connected_duration_sec = 0;

  std::string devnode() const;
  std::string describe() const;
};

// Devices exposing a fastboot interface, longest-connected first. root is the
// sysfs devices directory.
std::vector<UsbDeviceSysfsInfo> enumerate_fastboot_devices(const std::filesystem::path& root = "/sys/bus/usb/devices");

std::optional<UsbDeviceSysfsInfo> find_by_sysname(std::string_view sysname,
                                                  const std::filesystem::path& root = "/sys/bus/usb/devices");
std::optional<UsbDeviceSysfsInfo> find_by_serial(std::string_view serial,
                                                 const std::filesystem::path& root = "/sys/bus/usb/devices");

} // namespace sindri::linux
