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

#include "app/client.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace sindri::app {

FastbootClient::FastbootClient(sindri::platform::UsbDeviceSysfsInfo info, const ClientConfig& cfg)
  : info_(std::move(info)), cfg_(cfg), dev_(info_.devnode()), conn_(dev_), cmd_(conn_, cfg_.timeouts) {}

sindri::core::Result<std::unique_ptr<FastbootClient>> FastbootClient::open(const sindri::platform::UsbDeviceSysfsInfo& device,
                                                                           const ClientConfig& cfg) noexcept {
  std::unique_ptr<FastbootClient> c(new FastbootClient(device, cfg));
  SINDRI_TRY(c->connect_());
  spdlog::debug("Connected to {}", c->info_.describe());
  return c;
}

sindri::core::Status FastbootClient::connect_() noexcept {
  if (auto st = dev_.open_and_init(); !st) {
    return sindri::core::failf(st.error().code, "{}: {}", info_.sysname, st.error().msg);
  }
  SINDRI_TRY(conn_.open());
  conn_.set_timeout_ms(cfg_.timeouts.command_ms);
  return {};
}

sindri::core::Result<sindri::fastboot::FlashPlan> FastbootClient::flash_image(std::string_view partition, sindri::io::ByteSource& image,
                                                                              const sindri::fastboot::FlashProgress& progress,
                                                                              const sindri::fastboot::PartCallback& on_part) noexcept {
  return sindri::fastboot::flash_image(cmd_, partition, image, cfg_.flash, progress, on_part);
}

} // namespace sindri::app
