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

#include "protocol/fastboot/fastboot_wire.hpp"

#include "core/bytes.hpp"

#include "check.hpp"

#include <cstdint>
#include <string>

using sindri::core::Errc;
using sindri::core::as_bytes;
using namespace sindri::fastboot;

static void test_make_command() {
  auto c = make_command(CMD_GETVAR, "version");
  if (check_ok("cmd_getvar", c)) check_eq("cmd_getvar_text", *c, std::string("getvar:version"));

  auto r = make_command(CMD_REBOOT);
  if (check_ok("cmd_reboot", r)) check_eq("cmd_reboot_text", *r, std::string("reboot"));

  check_eq("download_cmd", download_command(4096), std::string("download:00001000"));
  check_eq("download_cmd_max", download_command(0xFFFFFFFF), std::string("download:ffffffff"));

  check_ok("cmd_64", make_command(CMD_FLASH, std::string(58, 'p')));
  check_err("cmd_65", make_command(CMD_FLASH, std::string(59, 'p')), Errc::InvalidArgument);
  check_err("cmd_newline", make_command(CMD_GETVAR, "version\n"), Errc::InvalidArgument);
  check_err("cmd_empty", make_command(""), Errc::InvalidArgument);
}

static void test_parse_okay_fail_info() {
  auto ok = parse_response(as_bytes("OKAY1.0"));
  if (check_ok("okay", ok)) {
    check_eq("okay_kind", ok->kind, ResponseKind::Okay);
    check_eq("okay_text", ok->text, std::string("1.0"));
  }

  auto empty = parse_response(as_bytes("OKAY"));
  if (check_ok("okay_empty", empty)) check_eq("okay_empty_text", empty->text, std::string());

  auto fail = parse_response(as_bytes("FAILpartition does not exist"));
  if (check_ok("fail", fail)) {
    check_eq("fail_kind", fail->kind, ResponseKind::Fail);
    check_eq("fail_text", fail->text, std::string("partition does not exist"));
  }

  auto info = parse_response(as_bytes("INFOerasing..."));
  if (check_ok("info", info)) check_eq("info_kind", info->kind, ResponseKind::Info);

  const char nul_terminated[] = "OKAYabc\0\0";
  auto nul = parse_response(as_bytes(std::string_view(nul_terminated, sizeof(nul_terminated) - 1)));
  if (check_ok("nul", nul)) check_eq("nul_text", nul->text, std::string("abc"));
}

static void test_parse_data() {
  auto d = parse_response(as_bytes("DATA00001000"));
  if (check_ok("data", d)) {
    check_eq("data_kind", d->kind, ResponseKind::Data);
    check_eq("data_size", d->data_size, std::uint32_t{0x1000});
  }

  auto upper = parse_response(as_bytes("DATA0000ABCD"));
  if (check_ok("data_upper", upper)) check_eq("data_upper_size", upper->data_size, std::uint32_t{0xABCD});

  check_err("data_short", parse_response(as_bytes("DATA1000")), Errc::Format);
  check_err("data_long", parse_response(as_bytes("DATA000010000")), Errc::Format);
  check_err("data_nonhex", parse_response(as_bytes("DATA0000100g")), Errc::Format);
  check_err("data_sign", parse_response(as_bytes("DATA+0001000")), Errc::Format);
}

static void test_parse_rejects() {
  check_err("too_short", parse_response(as_bytes("OKA")), Errc::Format);
  check_err("empty", parse_response(as_bytes("")), Errc::Format);
  check_err("unknown_prefix", parse_response(as_bytes("WHAT is this")), Errc::Format);
  check_err("lowercase_prefix", parse_response(as_bytes("okay")), Errc::Format);
  check_err("text_prefix", parse_response(as_bytes("TEXTsome text")), Errc::Format);
}

int main() {
  test_make_command();
  test_parse_okay_fail_info();
  test_parse_data();
  test_parse_rejects();

  return report("fastboot_wire");
}
