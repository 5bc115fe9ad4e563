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
#include "core/status.hpp"
#include "io/sink.hpp"
#include "io/source.hpp"
#include "protocol/fastboot/fastboot_wire.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sindri::fastboot {

enum class State { Idle, AwaitingResponse, ReceivingInfo, ReceivingData, Terminal };

std::string_view state_name(State s) noexcept;

struct Timeouts {
  int command_ms = 5000;
  int flash_ms = 60000;
};

using InfoCallback = std::function<void(std::string_view)>;
using ProgressCallback = std::function<void(std::uint64_t done, std::uint64_t total)>;
using VarList = std::vector<std::pair<std::string, std::string>>;

// Drives one fastboot exchange at a time over a borrowed transport.
class FastbootCommands {
public:
  explicit FastbootCommands(sindri::core::IByteTransport& t, Timeouts tm = {}) noexcept : conn_(t), tm_(tm) {}

  FastbootCommands(const FastbootCommands&) = delete;
  FastbootCommands& operator=(const FastbootCommands&) = delete;

  State state() const noexcept { return state_; }
  bool needs_reopen() const noexcept { return needs_reopen_; }
  const Timeouts& timeouts() const noexcept { return tm_; }

  // Bytes still owed in the current data phase.
  std::uint64_t data_remaining() const noexcept { return data_left_; }

  void set_info_callback(InfoCallback cb) { on_info_ = std::move(cb); }
  void set_progress_callback(ProgressCallback cb) { on_progress_ = std::move(cb); }

  sindri::core::Result<std::string> get_var(std::string_view name) noexcept;
  sindri::core::Result<VarList> get_all_vars() noexcept;

  sindri::core::Status download(std::span<const std::byte> data) noexcept;
  sindri::core::Status download(sindri::io::ByteSource& src, std::uint64_t size) noexcept;

  sindri::core::Status begin_download(std::uint32_t size) noexcept;
  sindri::core::Status send_data(std::span<const std::byte> data) noexcept;
  sindri::core::Status finish_download() noexcept;

  // Whole blob in memory. The sink overload streams it instead.
  sindri::core::Result<std::vector<std::byte>> upload() noexcept;
  sindri::core::Status upload(sindri::io::ByteSink& sink) noexcept;
  sindri::core::Result<std::size_t> receive_data(std::span<std::byte> out) noexcept;
  sindri::core::Status finish_upload() noexcept;

  sindri::core::Status flash(std::string_view partition) noexcept;
  sindri::core::Status erase(std::string_view partition) noexcept;
  sindri::core::Status reboot() noexcept;
  sindri::core::Status reboot_bootloader() noexcept;

  // First non-INFO reply. FAIL comes back as a response; DATA leaves the
  // engine in ReceivingData for send_data/receive_data.
  sindri::core::Result<Response> raw_command(std::string_view line) noexcept;

  // Gives up on the current data phase. The device still expects the rest of
  // it, so the connection has to be reopened.
  std::unexpected<sindri::core::Error> abort_transfer(sindri::core::Error e) noexcept;

private:
  sindri::core::Status start_(const std::string& line) noexcept;
  sindri::core::Result<Response> read_reply_(VarList* vars = nullptr) noexcept;
  sindri::core::Result<std::string> await_terminal_(VarList* vars = nullptr) noexcept;
  sindri::core::Result<std::string> run_(std::string_view verb, std::string_view arg, int timeout_ms) noexcept;
  sindri::core::Status finish_data_() noexcept;

  sindri::core::Status usable_() const noexcept;
  std::unexpected<sindri::core::Error> transport_failed_(sindri::core::Error e) noexcept;
  std::unexpected<sindri::core::Error> op_failed_(sindri::core::Error e) noexcept;

private:
  sindri::core::IByteTransport& conn_;
  Timeouts tm_;

  State state_ = State::Idle;
  bool needs_reopen_ = false;

  std::uint64_t data_total_ = 0;
  std::uint64_t data_left_ = 0;

  InfoCallback on_info_;
  ProgressCallback on_progress_;
};

} // namespace sindri::fastboot
