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

#include "app/cli.hpp"
#include "app/version.hpp"

#include "core/str.hpp"

#include <spdlog/spdlog.h>

#include <string_view>

namespace sindri::app {

namespace {

using sindri::core::Errc;

struct CommandArity {
  std::string_view name;
  std::size_t min_args;
  std::size_t max_args;
};

constexpr CommandArity COMMANDS[] = {
  {"devices", 0, 0},
  {"getvar", 1, 1},
  {"flash", 2, 2},
  {"erase", 1, 1},
  {"download", 1, 1},
  {"upload", 1, 1},
  {"oem", 1, 64},
  {"reboot", 0, 0},
  {"reboot-bootloader", 0, 0},
  {"sparse", 2, 3},
};

} // namespace

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static sindri::core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                                std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return *ov;
  if (i + 1 >= argc) return sindri::core::failf(Errc::InvalidArgument, "{} requires a value", opt);
  return std::string_view(argv[++i]);
}

std::string usage_text() {
  std::string out;
  out.reserve(2048);

  out += "Sindri v";
  out += sindri::app::version_string();
  out += "\n\n";

  out += R"(Usage:
  sindri [options] devices
  sindri [options] getvar <name|all>
  sindri [options] flash <partition> <image>
  sindri [options] erase <partition>
  sindri [options] download <file>
  sindri [options] upload <out>
  sindri [options] oem <args...>
  sindri [options] reboot
  sindri [options] reboot-bootloader
  sindri sparse inspect <image>
  sindri sparse expand <image> <out> [--no-verify]
  sindri sparse create <raw> <out> [--block-size N]

Options:
  -s, --serial <serial>        select device by USB serial (default: $ANDROID_SERIAL)
  --target <sysname>           select device by sysfs name, e.g. 1-1.4
  --timeout <ms>               command timeout in milliseconds (default 5000)
  --no-verify                  sparse expand: skip CRC32 chunk verification
  --block-size <N>             sparse create: output block size (default 4096)
  --verbose, -v                enable verbose logging
  --help, -h
  --version
)";
  return out;
}

sindri::core::Result<Options> parse_cli(int argc, char** argv) noexcept {
  Options o;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }

    if (a == "--verbose" || a == "-v") {
      o.verbose = true;
      spdlog::set_level(spdlog::level::debug);
      continue;
    }

    if (a == "--no-verify") { o.verify_crc = false; continue; }

    if (a == "-s" || is_opt(a, "--serial")) {
      auto vr = read_string_value(i, argc, argv, a, a == "-s" ? "-s" : "--serial");
      if (!vr) return sindri::core::forward(std::move(vr.error()));
      o.serial = std::string(*vr);
      continue;
    }

    if (is_opt(a, "--target")) {
      auto vr = read_string_value(i, argc, argv, a, "--target");
      if (!vr) return sindri::core::forward(std::move(vr.error()));
      o.target_sysname = std::string(*vr);
      continue;
    }

    if (is_opt(a, "--timeout")) {
      auto vr = read_string_value(i, argc, argv, a, "--timeout");
      if (!vr) return sindri::core::forward(std::move(vr.error()));
      auto ms = sindri::core::parse_uint<int>(*vr, 10);
      if (!ms || *ms <= 0) return sindri::core::failf(Errc::InvalidArgument, "--timeout: invalid value '{}'", *vr);
      o.timeout_ms = *ms;
      continue;
    }

    if (is_opt(a, "--block-size")) {
      auto vr = read_string_value(i, argc, argv, a, "--block-size");
      if (!vr) return sindri::core::forward(std::move(vr.error()));
      auto bs = sindri::core::parse_uint<std::uint32_t>(*vr, 10);
      if (!bs || *bs == 0 || (*bs % 4) != 0) {
        return sindri::core::failf(Errc::InvalidArgument, "--block-size: '{}' is not a non-zero multiple of 4", *vr);
      }
      o.block_size = *bs;
      continue;
    }

    // Everything after "oem" belongs to the device, dashes included.
    if (!positional.empty() && positional.front() == "oem") {
      positional.emplace_back(a);
      continue;
    }

    if (a.size() > 1 && a.starts_with("-")) {
      return sindri::core::failf(Errc::InvalidArgument, "Unknown option: {}", a);
    }

    positional.emplace_back(a);
  }

  if (o.help || o.version) return o;

  if (positional.empty()) return sindri::core::fail(Errc::InvalidArgument, "No command given");

  o.command = positional.front();
  o.args.assign(positional.begin() + 1, positional.end());

  const CommandArity* arity = nullptr;
  for (const auto& c : COMMANDS) {
    if (c.name == o.command) arity = &c;
  }
  if (!arity) return sindri::core::failf(Errc::InvalidArgument, "Unknown command: {}", o.command);
  if (o.args.size() < arity->min_args || o.args.size() > arity->max_args) {
    return sindri::core::failf(Errc::InvalidArgument, "{}: wrong number of arguments", o.command);
  }

  if (o.command == "sparse") {
    const auto& sub = o.args.front();
    const std::size_t want = sub == "inspect" ? 2 : (sub == "expand" || sub == "create") ? 3 : 0;
    if (!want) return sindri::core::failf(Errc::InvalidArgument, "Unknown sparse command: {}", sub);
    if (o.args.size() != want) return sindri::core::failf(Errc::InvalidArgument, "sparse {}: wrong number of arguments", sub);
  }

  if (!o.verify_crc && !(o.command == "sparse" && o.args.front() == "expand")) {
    return sindri::core::fail(Errc::InvalidArgument, "--no-verify only applies to sparse expand");
  }
  if (o.block_size && !(o.command == "sparse" && o.args.front() == "create")) {
    return sindri::core::fail(Errc::InvalidArgument, "--block-size only applies to sparse create");
  }
  if (o.serial && o.target_sysname) return sindri::core::fail(Errc::InvalidArgument, "--serial cannot be used with --target");

  return o;
}

} // namespace sindri::app
