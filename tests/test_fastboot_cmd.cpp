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

#include "io/sink.hpp"
#include "io/source.hpp"
#include "protocol/fastboot/fastboot_cmd.hpp"

#include "check.hpp"
#include "scripted_transport.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

using sindri::core::Errc;
using namespace sindri::fastboot;

static std::vector<std::byte> payload_of(std::size_t n) {
  std::vector<std::byte> v(n);
  for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<std::byte>(i ^ (i >> 8));
  return v;
}

static bool same_bytes(const std::vector<std::uint8_t>& a, const std::vector<std::byte>& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](std::uint8_t x, std::byte y) {
           return x == static_cast<std::uint8_t>(y);
         });
}

static void test_getvar() {
  ScriptedTransport t;
  t.reply("OKAY1.0");
  FastbootCommands fb(t);

  auto v = fb.get_var("version");
  if (check_ok("getvar", v)) check_eq("getvar_value", *v, std::string("1.0"));
  check_eq("getvar_wire", t.write_text(0), std::string("getvar:version"));
  check_eq("getvar_one_write", t.writes().size(), std::size_t{1});
  check_eq("getvar_state", fb.state(), State::Terminal);
}

static void test_info_before_okay() {
  ScriptedTransport t;
  t.reply("INFOerasing userdata");
  t.reply("INFOformatting");
  t.reply("INFOdone");
  t.reply("OKAY");
  FastbootCommands fb(t);

  std::vector<std::string> seen;
  fb.set_info_callback([&](std::string_view s) { seen.emplace_back(s); });

  check_ok("info_many", fb.erase("userdata"));
  check_eq("info_many_wire", t.write_text(0), std::string("erase:userdata"));
  check_eq("info_many_count", seen.size(), std::size_t{3});
  if (seen.size() == 3) {
    check_eq("info_many_0", seen[0], std::string("erasing userdata"));
    check_eq("info_many_2", seen[2], std::string("done"));
  }
  check_eq("info_many_consumed", t.pending_replies(), std::size_t{0});
  check_eq("info_many_recvs", t.recv_calls(), std::size_t{4});

  ScriptedTransport t1;
  t1.reply("INFOonly one");
  t1.reply("OKAY");
  FastbootCommands fb1(t1);
  int n = 0;
  fb1.set_info_callback([&](std::string_view) { ++n; });
  check_ok("info_one", fb1.reboot());
  check_eq("info_one_count", n, 1);
}

static void test_fail_reply() {
  ScriptedTransport t;
  t.reply("INFOchecking");
  t.reply("FAILpartition does not exist");
  FastbootCommands fb(t);

  auto st = fb.flash("nope");
  check_err("fail_reply", st, Errc::Protocol);
  if (!st) check_true("fail_reply_text", st.error().msg.find("partition does not exist") != std::string::npos);
  check_eq("fail_reply_no_reopen", fb.needs_reopen(), false);

  // The connection stays usable after a FAIL.
  t.reply("OKAY");
  check_ok("fail_then_ok", fb.reboot());
}

static void test_malformed_reply() {
  ScriptedTransport t;
  t.reply("HUH?");
  FastbootCommands fb(t);
  check_err("unknown_prefix", fb.get_var("product"), Errc::Format);
  check_eq("unknown_prefix_no_reopen", fb.needs_reopen(), false);

  ScriptedTransport t2;
  t2.reply("OK");
  FastbootCommands fb2(t2);
  check_err("short_reply", fb2.get_var("product"), Errc::Format);
}

static void test_download_example() {
  ScriptedTransport t(512);
  t.reply("DATA00001000");
  t.reply("OKAY");
  FastbootCommands fb(t);

  std::uint64_t last_done = 0, last_total = 0;
  fb.set_progress_callback([&](std::uint64_t d, std::uint64_t tot) { last_done = d; last_total = tot; });

  const auto data = payload_of(4096);
  check_ok("download", fb.download(data));
  check_eq("download_wire", t.write_text(0), std::string("download:00001000"));
  check_true("download_payload", same_bytes(t.payload(1), data));
  check_eq("download_transfers", t.writes().size(), std::size_t{1 + 4096 / 512});
  check_eq("download_progress_done", last_done, std::uint64_t{4096});
  check_eq("download_progress_total", last_total, std::uint64_t{4096});
  check_eq("download_state", fb.state(), State::Terminal);
}

static void test_download_size_mismatch() {
  ScriptedTransport t;
  t.reply("DATA00000800");
  FastbootCommands fb(t);

  check_err("mismatch", fb.download(payload_of(4096)), Errc::Protocol);
  check_eq("mismatch_no_payload", t.writes().size(), std::size_t{1});
  check_eq("mismatch_no_reopen", fb.needs_reopen(), false);
}

static void test_download_refused() {
  ScriptedTransport t;
  t.reply("FAILdata too large");
  FastbootCommands fb(t);
  check_err("download_refused", fb.download(payload_of(64)), Errc::Protocol);
  check_eq("download_refused_writes", t.writes().size(), std::size_t{1});
}

static void test_download_from_source() {
  const auto data = payload_of(3000);
  sindri::io::MemorySource src(data);

  ScriptedTransport t(1024);
  t.reply("DATA00000bb8");
  t.reply("OKAY");
  FastbootCommands fb(t);

  check_ok("stream", fb.download(src, data.size()));
  check_true("stream_payload", same_bytes(t.payload(1), data));

  sindri::io::MemorySource small(data);
  ScriptedTransport t2;
  FastbootCommands fb2(t2);
  check_err("stream_too_big", fb2.download(small, data.size() + 1), Errc::InvalidArgument);
  check_eq("stream_too_big_nothing_sent", t2.writes().size(), std::size_t{0});
}

static void test_transport_failure_poisons() {
  ScriptedTransport t(256);
  t.reply("DATA00000400");
  t.fail_sends_after(2, Errc::Io);
  FastbootCommands fb(t);

  check_err("send_fail", fb.download(payload_of(1024)), Errc::Io);
  check_eq("send_fail_reopen", fb.needs_reopen(), true);
  check_eq("send_fail_state", fb.state(), State::Terminal);

  const auto before = t.send_calls();
  check_err("poisoned", fb.get_var("version"), Errc::Io);
  check_eq("poisoned_untouched", t.send_calls(), before);
}

static void test_timeout() {
  ScriptedTransport t;
  FastbootCommands fb(t, Timeouts{250, 1000});

  check_err("timeout", fb.get_var("version"), Errc::Timeout);
  check_eq("timeout_reopen", fb.needs_reopen(), true);
  check_true("timeout_applied", !t.timeouts().empty() && t.timeouts().front() == 250);
  check_eq("timeout_restored", t.timeout_ms(), 1000 /* ScriptedTransport default */);
}

static void test_flash_timeout() {
  ScriptedTransport t;
  t.reply("OKAY");
  FastbootCommands fb(t, Timeouts{100, 9000});
  check_ok("flash_timeout", fb.flash("boot"));
  check_true("flash_timeout_applied", std::find(t.timeouts().begin(), t.timeouts().end(), 9000) != t.timeouts().end());
}

static void test_one_operation_at_a_time() {
  ScriptedTransport t;
  t.reply("DATA00000010");
  FastbootCommands fb(t);

  check_ok("begin", fb.begin_download(16));
  check_eq("begin_state", fb.state(), State::ReceivingData);
  check_eq("begin_remaining", fb.data_remaining(), std::uint64_t{16});

  check_err("busy_getvar", fb.get_var("version"), Errc::Protocol);
  check_err("busy_download", fb.begin_download(8), Errc::Protocol);
  check_eq("busy_untouched", t.writes().size(), std::size_t{1});

  check_err("finish_early", fb.finish_download(), Errc::Protocol);

  const auto data = payload_of(16);
  check_err("send_too_much", fb.send_data(payload_of(17)), Errc::Protocol);
  check_ok("send_half", fb.send_data(std::span<const std::byte>(data).first(8)));
  check_ok("send_rest", fb.send_data(std::span<const std::byte>(data).subspan(8)));

  t.reply("OKAY");
  check_ok("finish", fb.finish_download());
  check_eq("finish_state", fb.state(), State::Terminal);

  check_err("send_outside_phase", fb.send_data(data), Errc::Protocol);
}

static void test_upload() {
  const auto data = payload_of(768);
  ScriptedTransport t(512);
  t.reply("DATA00000300");
  t.reply_bytes(data);
  t.reply("OKAY");
  FastbootCommands fb(t);

  auto got = fb.upload();
  if (check_ok("upload", got)) check_true("upload_data", *got == data);
  check_eq("upload_wire", t.write_text(0), std::string("upload"));
  check_eq("upload_state", fb.state(), State::Terminal);

  ScriptedTransport t2;
  t2.reply("OKAY");
  FastbootCommands fb2(t2);
  check_err("upload_no_data", fb2.upload(), Errc::Protocol);
}

// Takes the first `room` bytes, then refuses.
class FullSink final : public sindri::io::ByteSink {
public:
  explicit FullSink(std::size_t room) : room_(room) {}

  std::string display_name() const override { return "full"; }
  sindri::core::Status write(std::span<const std::byte> data) noexcept override {
    if (data.size() > room_) return sindri::core::fail(Errc::Io, "no space left on device");
    room_ -= data.size();
    pos_ += data.size();
    return {};
  }
  sindri::core::Status skip(std::uint64_t n) noexcept override {
    pos_ += n;
    return {};
  }
  sindri::core::Status finish() noexcept override { return {}; }
  std::uint64_t position() const noexcept override { return pos_; }

private:
  std::size_t room_;
  std::uint64_t pos_ = 0;
};

static void test_upload_streaming() {
  // Announced size far beyond what arrives: bytes stream into the sink as they come.
  const auto head = payload_of(100);
  ScriptedTransport t(512);
  t.reply("DATAffffffff");
  t.reply_bytes(head);
  FastbootCommands fb(t);

  std::vector<std::byte> got;
  sindri::io::MemorySink sink(got);
  check_err("upload_huge", fb.upload(sink), Errc::Timeout);
  check_true("upload_huge_partial", got == head);
  check_true("upload_huge_reopen", fb.needs_reopen());

  ScriptedTransport t2(512);
  t2.reply("DATA00000300");
  t2.reply_bytes(payload_of(768));
  FastbootCommands fb2(t2);
  FullSink full(100);
  check_err("upload_sink_full", fb2.upload(full), Errc::Io);
  check_true("upload_sink_full_reopen", fb2.needs_reopen());
  check_eq("upload_sink_full_state", fb2.state(), State::Terminal);
  check_err("upload_sink_full_next", fb2.get_var("version"), Errc::Io);
}

static void test_get_all_vars() {
  ScriptedTransport t;
  t.reply("INFOversion: 0.4");
  t.reply("INFOpartition-size:system: 0x40000000");
  t.reply("INFOno separator here");
  t.reply("OKAY");
  FastbootCommands fb(t);

  int infos = 0;
  fb.set_info_callback([&](std::string_view) { ++infos; });

  auto vars = fb.get_all_vars();
  if (!check_ok("getvar_all", vars)) return;
  check_eq("getvar_all_wire", t.write_text(0), std::string("getvar:all"));
  check_eq("getvar_all_count", vars->size(), std::size_t{2});
  if (vars->size() == 2) {
    check_eq("getvar_all_k0", (*vars)[0].first, std::string("version"));
    check_eq("getvar_all_v0", (*vars)[0].second, std::string("0.4"));
    check_eq("getvar_all_k1", (*vars)[1].first, std::string("partition-size:system"));
    check_eq("getvar_all_v1", (*vars)[1].second, std::string("0x40000000"));
  }
  check_eq("getvar_all_no_info_cb", infos, 0);
}

static void test_raw_command() {
  ScriptedTransport t;
  t.reply("FAILunknown command");
  FastbootCommands fb(t);

  auto r = fb.raw_command("oem unlock");
  if (check_ok("raw_fail", r)) {
    check_eq("raw_fail_kind", r->kind, ResponseKind::Fail);
    check_eq("raw_fail_text", r->text, std::string("unknown command"));
  }
  check_eq("raw_fail_state", fb.state(), State::Terminal);

  t.reply("DATA00000004");
  auto d = fb.raw_command("download:00000004");
  if (check_ok("raw_data", d)) check_eq("raw_data_kind", d->kind, ResponseKind::Data);
  check_eq("raw_data_state", fb.state(), State::ReceivingData);

  t.reply("OKAY");
  check_ok("raw_data_send", fb.send_data(payload_of(4)));
  check_ok("raw_data_finish", fb.finish_download());
}

static void test_disconnected() {
  ScriptedTransport t;
  t.disconnect();
  FastbootCommands fb(t);
  check_err("disconnected", fb.reboot(), Errc::Io);
  check_eq("disconnected_nothing_sent", t.writes().size(), std::size_t{0});
}

int main() {
  test_getvar();
  test_info_before_okay();
  test_fail_reply();
  test_malformed_reply();
  test_download_example();
  test_download_size_mismatch();
  test_download_refused();
  test_download_from_source();
  test_transport_failure_poisons();
  test_timeout();
  test_flash_timeout();
  test_one_operation_at_a_time();
  test_upload();
  test_upload_streaming();
  test_get_all_vars();
  test_raw_command();
  test_disconnected();

  return report("fastboot_cmd");
}
