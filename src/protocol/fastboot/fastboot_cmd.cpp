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

#include "protocol/fastboot/fastboot_cmd.hpp"

#include "core/bytes.hpp"
#include "core/str.hpp"
#include "io/read_exact.hpp"

#include <algorithm>
#include <array>
#include <limits>

#include <spdlog/spdlog.h>

namespace sindri::fastboot {

namespace {

using sindri::core::Errc;

constexpr std::size_t STREAM_CHUNK = 1024 * 1024;

inline std::size_t transfer_limit(const sindri::core::IByteTransport& c, std::uint64_t want) noexcept {
  const std::size_t max = c.max_transfer_size() ? c.max_transfer_size() : std::numeric_limits<std::size_t>::max();
  return static_cast<std::size_t>(std::min<std::uint64_t>(want, max));
}

} // namespace

std::string_view state_name(State s) noexcept {
  switch (s) {
    case State::Idle: return "idle";
    case State::AwaitingResponse: return "awaiting-response";
    case State::ReceivingInfo: return "receiving-info";
    case State::ReceivingData: return "receiving-data";
    case State::Terminal: return "terminal";
  }
  return "unknown";
}

sindri::core::Status FastbootCommands::usable_() const noexcept {
  if (needs_reopen_) return sindri::core::fail(Errc::Io, "connection must be reopened after a transport failure");
  if (state_ != State::Idle && state_ != State::Terminal) {
    return sindri::core::failf(Errc::Protocol, "another operation is in progress ({})", state_name(state_));
  }
  return {};
}

std::unexpected<sindri::core::Error> FastbootCommands::transport_failed_(sindri::core::Error e) noexcept {
  spdlog::debug("transport failure in state {}: {}", state_name(state_), e.msg);
  needs_reopen_ = true;
  state_ = State::Terminal;
  data_left_ = 0;
  return sindri::core::forward(std::move(e));
}

std::unexpected<sindri::core::Error> FastbootCommands::op_failed_(sindri::core::Error e) noexcept {
  state_ = State::Terminal;
  data_left_ = 0;
  return sindri::core::forward(std::move(e));
}

sindri::core::Status FastbootCommands::start_(const std::string& line) noexcept {
  SINDRI_TRY(usable_());
  if (!conn_.connected()) return transport_failed_(sindri::core::Error{Errc::Io, "transport not connected"});

  state_ = State::AwaitingResponse;
  data_total_ = data_left_ = 0;

  spdlog::debug("-> {}", line);
  auto sent = conn_.send(sindri::core::u8(sindri::core::as_bytes(line)));
  if (!sent) return transport_failed_(std::move(sent.error()));
  if (*sent != line.size()) {
    return transport_failed_(sindri::core::Error{Errc::Io, fmt::format("short command write ({} of {})", *sent, line.size())});
  }
  return {};
}

sindri::core::Result<Response> FastbootCommands::read_reply_(VarList* vars) noexcept {
  for (;;) {
    std::array<std::uint8_t, MAX_RESPONSE_LEN> buf{};
    auto got = conn_.recv(buf);
    if (!got) return transport_failed_(std::move(got.error()));

    auto r = parse_response(std::as_bytes(std::span(buf).first(*got)));
    if (!r) return op_failed_(std::move(r.error()));

    spdlog::debug("<- {}{}", response_kind_name(r->kind),
                  r->kind == ResponseKind::Data ? fmt::format("{:08x}", r->data_size) : r->text);

    if (r->kind != ResponseKind::Info) return r;

    state_ = State::ReceivingInfo;
    if (vars) {
      if (auto kv = sindri::core::split_last(r->text, ':')) {
        vars->emplace_back(std::string(sindri::core::trim(kv->first)), std::string(sindri::core::trim(kv->second)));
      } else {
        spdlog::warn("Ignoring malformed variable line: '{}'", r->text);
      }
    } else {
      spdlog::info("(bootloader) {}", r->text);
      if (on_info_) on_info_(r->text);
    }
    state_ = State::AwaitingResponse;
  }
}

sindri::core::Result<std::string> FastbootCommands::await_terminal_(VarList* vars) noexcept {
  auto r = read_reply_(vars);
  if (!r) return sindri::core::forward(std::move(r.error()));

  switch (r->kind) {
    case ResponseKind::Okay:
      state_ = State::Terminal;
      return std::move(r->text);
    case ResponseKind::Fail:
      return op_failed_(sindri::core::Error{Errc::Protocol, fmt::format("remote: '{}'", r->text)});
    case ResponseKind::Data:
      return op_failed_(sindri::core::Error{Errc::Protocol, fmt::format("unexpected DATA{:08x} reply", r->data_size)});
    case ResponseKind::Info:
      break;
  }
  return op_failed_(sindri::core::Error{Errc::Format, "unterminated reply sequence"});
}

sindri::core::Result<std::string> FastbootCommands::run_(std::string_view verb, std::string_view arg, int timeout_ms) noexcept {
  auto cmd = make_command(verb, arg);
  if (!cmd) return sindri::core::forward(std::move(cmd.error()));

  sindri::core::ScopedTimeout to(conn_, timeout_ms);
  SINDRI_TRY(start_(*cmd));
  return await_terminal_();
}

sindri::core::Result<std::string> FastbootCommands::get_var(std::string_view name) noexcept {
  auto r = run_(CMD_GETVAR, name, tm_.command_ms);
  if (!r) return r;
  return std::string(sindri::core::trim(*r));
}

sindri::core::Result<VarList> FastbootCommands::get_all_vars() noexcept {
  auto cmd = make_command(CMD_GETVAR, "all");
  if (!cmd) return sindri::core::forward(std::move(cmd.error()));

  sindri::core::ScopedTimeout to(conn_, tm_.command_ms);
  SINDRI_TRY(start_(*cmd));

  VarList vars;
  auto r = await_terminal_(&vars);
  if (!r) return sindri::core::forward(std::move(r.error()));
  return vars;
}

sindri::core::Status FastbootCommands::begin_download(std::uint32_t size) noexcept {
  sindri::core::ScopedTimeout to(conn_, tm_.command_ms);
  SINDRI_TRY(start_(download_command(size)));

  auto r = read_reply_();
  if (!r) return sindri::core::forward(std::move(r.error()));

  switch (r->kind) {
    case ResponseKind::Data:
      if (r->data_size != size) {
        return op_failed_(sindri::core::Error{
          Errc::Protocol, fmt::format("device announced {} bytes, payload is {}", r->data_size, size)});
      }
      state_ = State::ReceivingData;
      data_total_ = data_left_ = size;
      return {};
    case ResponseKind::Fail:
      return op_failed_(sindri::core::Error{Errc::Protocol, fmt::format("remote: '{}'", r->text)});
    case ResponseKind::Okay:
    case ResponseKind::Info:
      break;
  }
  return op_failed_(sindri::core::Error{Errc::Protocol, fmt::format("download: expected DATA, got {}", response_kind_name(r->kind))});
}

sindri::core::Status FastbootCommands::send_data(std::span<const std::byte> data) noexcept {
  if (needs_reopen_) return sindri::core::fail(Errc::Io, "connection must be reopened after a transport failure");
  if (state_ != State::ReceivingData) return sindri::core::failf(Errc::Protocol, "no data phase in progress ({})", state_name(state_));
  if (data.size() > data_left_) {
    return sindri::core::failf(Errc::Protocol, "{} bytes exceed the {} still announced", data.size(), data_left_);
  }

  sindri::core::ScopedTimeout to(conn_, tm_.command_ms);

  std::size_t off = 0;
  while (off < data.size()) {
    const std::size_t n = transfer_limit(conn_, data.size() - off);
    auto sent = conn_.send(sindri::core::u8(data.subspan(off, n)));
    if (!sent) return transport_failed_(std::move(sent.error()));
    if (*sent == 0) return transport_failed_(sindri::core::Error{Errc::Io, "device accepted no data"});

    off += *sent;
    data_left_ -= *sent;
    if (on_progress_) on_progress_(data_total_ - data_left_, data_total_);
  }
  return {};
}

sindri::core::Status FastbootCommands::finish_data_() noexcept {
  if (needs_reopen_) return sindri::core::fail(Errc::Io, "connection must be reopened after a transport failure");
  if (state_ != State::ReceivingData) return sindri::core::failf(Errc::Protocol, "no data phase in progress ({})", state_name(state_));
  if (data_left_) {
    return sindri::core::failf(Errc::Protocol, "{} of {} announced bytes not transferred", data_left_, data_total_);
  }

  sindri::core::ScopedTimeout to(conn_, tm_.command_ms);
  state_ = State::AwaitingResponse;
  auto r = await_terminal_();
  if (!r) return sindri::core::forward(std::move(r.error()));
  return {};
}

sindri::core::Status FastbootCommands::finish_download() noexcept { return finish_data_(); }
sindri::core::Status FastbootCommands::finish_upload() noexcept { return finish_data_(); }

sindri::core::Status FastbootCommands::download(std::span<const std::byte> data) noexcept {
  if (data.size() > std::numeric_limits<std::uint32_t>::max()) {
    return sindri::core::failf(Errc::InvalidArgument, "payload of {} bytes exceeds the download limit", data.size());
  }
  SINDRI_TRY(begin_download(static_cast<std::uint32_t>(data.size())));
  SINDRI_TRY(send_data(data));
  return finish_download();
}

sindri::core::Status FastbootCommands::download(sindri::io::ByteSource& src, std::uint64_t size) noexcept {
  if (size > std::numeric_limits<std::uint32_t>::max()) {
    return sindri::core::failf(Errc::InvalidArgument, "payload of {} bytes exceeds the download limit", size);
  }
  if (size > src.remaining()) {
    return sindri::core::failf(Errc::InvalidArgument, "{}: {} bytes requested, {} available", src.display_name(), size, src.remaining());
  }

  SINDRI_TRY(begin_download(static_cast<std::uint32_t>(size)));

  std::vector<std::byte> buf(static_cast<std::size_t>(std::min<std::uint64_t>(size, STREAM_CHUNK)));
  std::uint64_t left = size;
  while (left) {
    const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(left, buf.size()));
    auto st = sindri::io::read_exact(src, std::span(buf).first(n));
    if (!st) return abort_transfer(std::move(st.error()));
    SINDRI_TRY(send_data(std::span<const std::byte>(buf).first(n)));
    left -= n;
  }

  return finish_download();
}

sindri::core::Result<std::size_t> FastbootCommands::receive_data(std::span<std::byte> out) noexcept {
  if (needs_reopen_) return sindri::core::fail(Errc::Io, "connection must be reopened after a transport failure");
  if (state_ != State::ReceivingData) return sindri::core::failf(Errc::Protocol, "no data phase in progress ({})", state_name(state_));

  const std::size_t n = transfer_limit(conn_, std::min<std::uint64_t>(out.size(), data_left_));
  if (!n) return std::size_t{0};

  sindri::core::ScopedTimeout to(conn_, tm_.command_ms);
  auto got = conn_.recv(sindri::core::u8(out.first(n)));
  if (!got) return transport_failed_(std::move(got.error()));
  if (*got == 0) return transport_failed_(sindri::core::Error{Errc::Io, "empty transfer during data phase"});

  data_left_ -= *got;
  if (on_progress_) on_progress_(data_total_ - data_left_, data_total_);
  return *got;
}

sindri::core::Status FastbootCommands::upload(sindri::io::ByteSink& sink) noexcept {
  auto cmd = make_command(CMD_UPLOAD);
  if (!cmd) return sindri::core::forward(std::move(cmd.error()));

  {
    sindri::core::ScopedTimeout to(conn_, tm_.command_ms);
    SINDRI_TRY(start_(*cmd));

    auto r = read_reply_();
    if (!r) return sindri::core::forward(std::move(r.error()));
    if (r->kind == ResponseKind::Fail) return op_failed_(sindri::core::Error{Errc::Protocol, fmt::format("remote: '{}'", r->text)});
    if (r->kind != ResponseKind::Data) {
      return op_failed_(sindri::core::Error{Errc::Protocol, fmt::format("upload: expected DATA, got {}", response_kind_name(r->kind))});
    }

    state_ = State::ReceivingData;
    data_total_ = data_left_ = r->data_size;
  }

  std::vector<std::byte> buf(static_cast<std::size_t>(std::clamp<std::uint64_t>(data_total_, 1, STREAM_CHUNK)));
  while (data_left_) {
    auto got = receive_data(buf);
    if (!got) return sindri::core::forward(std::move(got.error()));
    auto st = sink.write(std::span<const std::byte>(buf).first(*got));
    if (!st) return abort_transfer(std::move(st.error()));
  }

  return finish_upload();
}

sindri::core::Result<std::vector<std::byte>> FastbootCommands::upload() noexcept {
  std::vector<std::byte> out;
  sindri::io::MemorySink sink(out);
  SINDRI_TRY(upload(sink));
  return out;
}

std::unexpected<sindri::core::Error> FastbootCommands::abort_transfer(sindri::core::Error e) noexcept {
  if (state_ == State::ReceivingData) {
    spdlog::debug("data phase aborted with {} of {} bytes outstanding", data_left_, data_total_);
    needs_reopen_ = true;
  }
  return op_failed_(std::move(e));
}

sindri::core::Status FastbootCommands::flash(std::string_view partition) noexcept {
  auto r = run_(CMD_FLASH, partition, tm_.flash_ms);
  if (!r) return sindri::core::forward(std::move(r.error()));
  return {};
}

sindri::core::Status FastbootCommands::erase(std::string_view partition) noexcept {
  auto r = run_(CMD_ERASE, partition, tm_.flash_ms);
  if (!r) return sindri::core::forward(std::move(r.error()));
  return {};
}

sindri::core::Status FastbootCommands::reboot() noexcept {
  auto r = run_(CMD_REBOOT, {}, tm_.command_ms);
  if (!r) return sindri::core::forward(std::move(r.error()));
  return {};
}

sindri::core::Status FastbootCommands::reboot_bootloader() noexcept {
  auto r = run_(CMD_REBOOT_BOOTLOADER, {}, tm_.command_ms);
  if (!r) return sindri::core::forward(std::move(r.error()));
  return {};
}

sindri::core::Result<Response> FastbootCommands::raw_command(std::string_view line) noexcept {
  auto cmd = make_command(line);
  if (!cmd) return sindri::core::forward(std::move(cmd.error()));

  sindri::core::ScopedTimeout to(conn_, tm_.command_ms);
  SINDRI_TRY(start_(*cmd));

  auto r = read_reply_();
  if (!r) return r;

  if (r->kind == ResponseKind::Data) {
    state_ = State::ReceivingData;
    data_total_ = data_left_ = r->data_size;
  } else {
    state_ = State::Terminal;
  }
  return r;
}

} // namespace sindri::fastboot
