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

#if defined(SINDRI_PLATFORM_LINUX)
  #include "platform/linux/sysfs_usb.hpp"
  #include "platform/linux/usbfs_conn.hpp"
  #include "platform/linux/usbfs_device.hpp"

namespace sindri::platform {
using namespace linux;
} // namespace sindri::platform

#else
  #error "Unsupported platform"
#endif
