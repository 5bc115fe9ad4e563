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
#include "platform/platform_all.hpp"
#include "protocol/fastboot/fastboot_cmd.hpp"
#include "protocol/fastboot/flash.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sindri::app {

struct ClientConfig {
  sindri::fastboot::Timeouts timeouts{};
  sindri::fastboot::FlashOptions flash{};
};

// One claimed fastboot device: usbfs handle, bulk pipe and command engine.
class FastbootClient {
public:
  static sindri::core::Result<std::unique_ptr<FastbootClient>> open(const sindri::platform::UsbDeviceSysfsInfo& device,
                                                                    const ClientConfig& cfg = {}) noexcept;

  FastbootClient(const FastbootClient&) = delete;
  FastbootClient& operator=(const FastbootClient&) = delete;

  const sindri::platform::UsbDeviceSysfsInfo& info() const noexcept { return info_; }
  const ClientConfig& config() const noexcept { return cfg_; }

  sindri::fastboot::FastbootCommands& commands() noexcept { return cmd_; }

  // After a transport failure every call fails; open a new client to recover.
  bool needs_reopen() const noexcept { return cmd_.needs_reopen(); }

  sindri::core::Result<std::string> get_var(std::string_view name) noexcept { return cmd_.get_var(name); }
  sindri::core::Result<sindri::fastboot::VarList> get_all_vars() noexcept { return cmd_.get_all_vars(); }

  sindri::core::Status download(std::span<const std::byte> data) noexcept { return cmd_.download(data); }
  sindri::core::Status download(sindri::io::ByteSource& src, std::uint64_t size) noexcept { return cmd_.download(src, size); }
  sindri::core::Result<std::vector<std::byte>> upload() noexcept { return cmd_.upload(); }
  sindri::core::Status upload(sindri::io::ByteSink& sink) noexcept { return cmd_.upload(sink); }

  sindri::core::Status flash(std::string_view partition) noexcept { return cmd_.flash(partition); }
  sindri::core::Status erase(std::string_view partition) noexcept { return cmd_.erase(partition); }
  sindri::core::Status reboot() noexcept { return cmd_.reboot(); }
  sindri::core::Status reboot_bootloader() noexcept { return cmd_.reboot_bootloader(); }
  sindri::core::Result<sindri::fastboot::Response> raw_command(std::string_view line) noexcept { return cmd_.raw_command(line); }

  sindri::core::Result<sindri::fastboot::FlashPlan> flash_image(std::string_view partition, sindri::io::ByteSource& image,
                                                                const sindri::fastboot::FlashProgress& progress = {},
                                                                const sindri::fastboot::PartCallback& on_part = {}) noexcept;

private:
  FastbootClient(sindri::platform::UsbDeviceSysfsInfo info, const ClientConfig& cfg);

  sindri::core::Status connect_() noexcept;

  sindri::platform::UsbDeviceSysfsInfo info_;
  ClientConfig cfg_;

  sindri::platform::UsbFsDevice dev_;
  sindri::platform::UsbFsConnection conn_;
  sindri::fastboot::FastbootCommands cmd_;
};

} // namespace sindri::app
