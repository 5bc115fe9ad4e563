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

#include "app/run.hpp"

#include "app/client.hpp"
#include "app/interface.hpp"

#include "io/sink.hpp"
#include "io/source.hpp"
#include "platform/platform_all.hpp"
#include "sparse/sparse_expand.hpp"
#include "sparse/sparse_reader.hpp"
#include "sparse/sparse_writer.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace sindri::app {

using sindri::core::Errc;
using sindri::platform::UsbDeviceSysfsInfo;

static RunResult result_for(const sindri::core::Error& e) {
  switch (e.code) {
    case Errc::NotFound:
    case Errc::Busy: return RunResult::NoDevice;
    case Errc::InvalidArgument: return RunResult::InvalidUsage;
    case Errc::Protocol: return RunResult::RemoteFail;
    case Errc::Io:
    case Errc::Timeout: return RunResult::kIOFail;
    case Errc::Format: return RunResult::Failed;
  }
  return RunResult::Failed;
}

static RunResult report(const sindri::core::Error& e) {
  spdlog::error("{}", e.msg);
  return result_for(e);
}

static void print_connected(bool verbose) {
  for (const auto& d : sindri::platform::enumerate_fastboot_devices()) {
    if (verbose) spdlog::info("Found device: {}", d.describe());
    std::cout << (d.serial.empty() ? d.sysname : d.serial) << "\tfastboot\n";
  }
  std::cout << std::flush;
}

static std::optional<std::string> wanted_serial(const Options& opt) {
  if (opt.serial) return opt.serial;
  if (const char* env = std::getenv("ANDROID_SERIAL"); env && *env) return std::string(env);
  return std::nullopt;
}

static sindri::core::Result<UsbDeviceSysfsInfo> select_target(const Options& opt) {
  if (opt.target_sysname) {
    auto info = sindri::platform::find_by_sysname(*opt.target_sysname);
    if (!info) return sindri::core::failf(Errc::NotFound, "No device found with sysname: {}", *opt.target_sysname);
    if (info->fastboot_interface < 0) {
      return sindri::core::failf(Errc::NotFound, "Device {} has no fastboot interface", info->sysname);
    }
    return *info;
  }

  if (auto serial = wanted_serial(opt)) {
    auto info = sindri::platform::find_by_serial(*serial);
    if (!info) return sindri::core::failf(Errc::NotFound, "No fastboot device with serial: {}", *serial);
    return *info;
  }

  auto devs = sindri::platform::enumerate_fastboot_devices();
  if (devs.empty()) return sindri::core::fail(Errc::NotFound, "No fastboot devices found");
  if (devs.size() > 1) {
    std::vector<std::string> ids;
    for (const auto& d : devs) ids.push_back(d.sysname);
    return sindri::core::failf(Errc::InvalidArgument, "More than one device connected ({}); use -s or --target",
                               fmt::join(ids, " "));
  }
  return devs.front();
}

static ClientConfig make_config(const Options& opt) {
  ClientConfig cfg;
  if (opt.timeout_ms) cfg.timeouts.command_ms = *opt.timeout_ms;
  return cfg;
}

static RunResult run_getvar(FastbootClient& c, std::string_view name) {
  if (name == "all") {
    auto vars = c.get_all_vars();
    if (!vars) return report(vars.error());
    for (const auto& [k, v] : *vars) std::cout << k << ": " << v << "\n";
    std::cout << std::flush;
    return RunResult::Success;
  }

  auto v = c.get_var(name);
  if (!v) return report(v.error());
  std::cout << name << ": " << *v << std::endl;
  return RunResult::Success;
}

static RunResult run_flash(FastbootClient& c, const std::string& partition, const std::string& path) {
  auto src = sindri::io::open_raw_file(path);
  if (!src) return report(src.error());

  TransferInterface ui(true);
  ui.stage(fmt::format("Flashing '{}' from {}", partition, path));

  auto plan = c.flash_image(partition, **src,
                            [&](std::uint64_t done, std::uint64_t total) { ui.progress(done, total); },
                            [&](std::uint32_t i, std::uint32_t n) { ui.part(i, n); });
  if (!plan) return report(plan.error());

  ui.done();
  spdlog::info("Wrote {} to '{}' ({} {} image, {} part{})", TransferInterface::bytes_h(plan->bytes_total), partition,
               plan->sparse ? "sparse" : "raw", path, plan->parts, plan->parts == 1 ? "" : "s");
  return RunResult::Success;
}

static RunResult run_download(FastbootClient& c, const std::string& path) {
  auto src = sindri::io::open_raw_file(path);
  if (!src) return report(src.error());

  TransferInterface ui(true);
  ui.stage(fmt::format("Sending {}", path));
  c.commands().set_progress_callback([&](std::uint64_t done, std::uint64_t total) { ui.progress(done, total); });

  auto st = c.download(**src, (*src)->size());
  c.commands().set_progress_callback({});
  if (!st) return report(st.error());
  ui.done();
  return RunResult::Success;
}

static RunResult run_upload(FastbootClient& c, const std::string& path) {
  auto sink = sindri::io::FileSink::create(path);
  if (!sink) return report(sink.error());

  TransferInterface ui(true);
  ui.stage(fmt::format("Receiving {}", path));
  c.commands().set_progress_callback([&](std::uint64_t done, std::uint64_t total) { ui.progress(done, total); });

  auto st = c.upload(**sink);
  c.commands().set_progress_callback({});
  if (!st) return report(st.error());
  if (auto fin = (*sink)->finish(); !fin) return report(fin.error());

  ui.done();
  spdlog::info("Received {} into {}", TransferInterface::bytes_h((*sink)->position()), path);
  return RunResult::Success;
}

static RunResult run_oem(FastbootClient& c, const std::vector<std::string>& args) {
  const std::string line = fmt::format("oem {}", fmt::join(args, " "));
  auto r = c.raw_command(line);
  if (!r) return report(r.error());

  switch (r->kind) {
    case sindri::fastboot::ResponseKind::Okay:
      if (!r->text.empty()) std::cout << r->text << std::endl;
      return RunResult::Success;
    case sindri::fastboot::ResponseKind::Fail:
      spdlog::error("remote: '{}'", r->text);
      return RunResult::RemoteFail;
    default:
      spdlog::error("'{}' started a data phase, which oem does not support", line);
      return RunResult::RemoteFail;
  }
}

static RunResult dispatch(FastbootClient& c, const std::string& cmd, const std::vector<std::string>& a) {
  if (cmd == "getvar") return run_getvar(c, a[0]);
  if (cmd == "flash") return run_flash(c, a[0], a[1]);
  if (cmd == "download") return run_download(c, a[0]);
  if (cmd == "upload") return run_upload(c, a[0]);
  if (cmd == "oem") return run_oem(c, a);

  sindri::core::Status st{};
  if (cmd == "erase") st = c.erase(a[0]);
  else if (cmd == "reboot") st = c.reboot();
  else if (cmd == "reboot-bootloader") st = c.reboot_bootloader();
  else return report(sindri::core::Error{Errc::InvalidArgument, fmt::format("Unknown command: {}", cmd)});

  if (!st) return report(st.error());
  spdlog::info("{}: OKAY", cmd);
  return RunResult::Success;
}

static RunResult run_device_command(const Options& opt) {
  auto target = select_target(opt);
  if (!target) return report(target.error());

  auto client = FastbootClient::open(*target, make_config(opt));
  if (!client) return report(client.error());
  auto& c = **client;

  const auto ret = dispatch(c, opt.command, opt.args);
  if (ret != RunResult::Success && c.needs_reopen()) {
    spdlog::warn("{} was left mid-transfer; reconnect it before the next command", c.info().sysname);
  }
  return ret;
}

static RunResult sparse_inspect(const std::string& path) {
  auto src = sindri::io::open_raw_file(path);
  if (!src) return report(src.error());

  auto reader = sindri::sparse::SparseReader::open(**src);
  if (!reader) return report(reader.error());

  const auto& h = reader->header();
  std::cout << fmt::format("{}: sparse v{}.{}, block size {}, {} blocks ({} bytes), {} chunks, checksum 0x{:08x}\n",
                           path, h.major_version, h.minor_version, h.block_size, h.total_blocks, h.expanded_size(),
                           h.total_chunks, h.checksum);

  for (;;) {
    auto next = reader->next();
    if (!next) return report(next.error());
    if (!*next) break;

    const auto& ch = **next;
    std::string extra;
    if (ch.header.type == sindri::sparse::ChunkType::Fill) extra = fmt::format(" fill 0x{:08x}", ch.value);
    if (ch.header.type == sindri::sparse::ChunkType::Crc32) extra = fmt::format(" crc 0x{:08x}", ch.value);

    std::cout << fmt::format("  #{:<5} {:<9} {:>8} blocks  out 0x{:010x}  in 0x{:010x}{}\n", ch.index,
                             sindri::sparse::chunk_type_name(ch.header.type), ch.header.chunk_size, ch.out_offset,
                             ch.payload_offset, extra);
  }
  std::cout << std::flush;
  return RunResult::Success;
}

static RunResult sparse_expand(const std::string& in, const std::string& out, bool verify_crc) {
  auto src = sindri::io::open_raw_file(in);
  if (!src) return report(src.error());

  auto reader = sindri::sparse::SparseReader::open(**src);
  if (!reader) return report(reader.error());

  auto sink = sindri::io::FileSink::create(out);
  if (!sink) return report(sink.error());

  TransferInterface ui(true);
  ui.stage(fmt::format("Expanding {}", in));

  auto stats = sindri::sparse::expand(*reader, **sink, verify_crc,
                                      [&](std::uint64_t done, std::uint64_t total) { ui.progress(done, total); });
  if (!stats) return report(stats.error());

  ui.done();
  spdlog::info("Wrote {} ({} chunks, {} CRC checks) to {}", TransferInterface::bytes_h(stats->bytes_out), stats->chunks,
               stats->crc_checked, out);
  return RunResult::Success;
}

static RunResult sparse_create(const std::string& in, const std::string& out, std::uint32_t block_size) {
  auto src = sindri::io::open_raw_file(in);
  if (!src) return report(src.error());

  auto sink = sindri::io::FileSink::create(out);
  if (!sink) return report(sink.error());

  auto stats = sindri::sparse::encode_image(**src, block_size, **sink);
  if (!stats) return report(stats.error());
  if (auto st = (*sink)->finish(); !st) return report(st.error());

  spdlog::info("Wrote {}: {} blocks in {} chunks, {}", out, stats->blocks, stats->chunks,
               TransferInterface::bytes_h(stats->bytes_written));
  return RunResult::Success;
}

static RunResult run_sparse(const Options& opt) {
  const auto& sub = opt.args[0];
  if (sub == "inspect") return sparse_inspect(opt.args[1]);
  if (sub == "expand") return sparse_expand(opt.args[1], opt.args[2], opt.verify_crc);
  return sparse_create(opt.args[1], opt.args[2], opt.block_size.value_or(sindri::sparse::DEFAULT_BLOCK_SIZE));
}

RunResult run(const Options& opt) {
  if (opt.command == "devices") {
    print_connected(opt.verbose);
    return RunResult::Success;
  }
  if (opt.command == "sparse") return run_sparse(opt);
  return run_device_command(opt);
}

} // namespace sindri::app
