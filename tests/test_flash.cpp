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

#include "io/source.hpp"
#include "protocol/fastboot/flash.hpp"
#include "sparse/sparse_reader.hpp"

#include "check.hpp"
#include "scripted_transport.hpp"
#include "sparse_fixture.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

using sindri::core::Errc;
using sindri::io::MemorySource;
using namespace sindri::fastboot;

static constexpr std::uint32_t BS = 4096;

static std::vector<std::byte> blocks_of(std::size_t n) {
  std::vector<std::byte> v(n);
  for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<std::byte>((i / BS) * 31 + (i % 253));
  return v;
}

// Indices of writes that are exactly `text`.
static std::vector<std::size_t> find_writes(const ScriptedTransport& t, const std::string& text) {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < t.writes().size(); ++i) {
    if (t.write_text(i) == text) out.push_back(i);
  }
  return out;
}

// Bytes sent between write `first` (exclusive) and write `last` (exclusive).
static std::vector<std::byte> between(const ScriptedTransport& t, std::size_t first, std::size_t last) {
  std::vector<std::byte> out;
  for (std::size_t i = first + 1; i < last && i < t.writes().size(); ++i) {
    for (auto b : t.writes()[i]) out.push_back(static_cast<std::byte>(b));
  }
  return out;
}

// Serves the first `good` bytes, then every read fails.
class FailingSource final : public sindri::io::ByteSource {
public:
  FailingSource(std::vector<std::byte> data, std::uint64_t good) : data_(std::move(data)), good_(good) {}

  std::string display_name() const override { return "failing.img"; }
  std::uint64_t size() const override { return data_.size(); }

  std::size_t read(std::span<std::byte> out) override {
    if (pos_ >= good_) {
      st_ = sindri::core::fail(Errc::Io, "read failed: failing.img");
      return 0;
    }
    const auto n = static_cast<std::size_t>(std::min<std::uint64_t>({out.size(), good_ - pos_, data_.size() - pos_}));
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, out.begin());
    pos_ += n;
    return n;
  }

  sindri::core::Status seek(std::uint64_t offset) noexcept override {
    pos_ = offset;
    return {};
  }
  std::uint64_t tell() const noexcept override { return pos_; }
  sindri::core::Status status() const noexcept override { return st_; }

private:
  std::vector<std::byte> data_;
  std::uint64_t good_;
  std::uint64_t pos_ = 0;
  sindri::core::Status st_{};
};

static void script_part(ScriptedTransport& t, std::uint32_t size) {
  t.reply(fmt::format("DATA{:08x}", size));
  t.reply("OKAY");
  t.reply("OKAY");
}

static void test_raw_fits() {
  const auto image = blocks_of(5000);
  MemorySource src(image, "boot.img");

  ScriptedTransport t(1 << 20);
  t.reply("OKAY0x10000000");
  script_part(t, 5000);
  FastbootCommands fb(t);

  std::uint64_t done = 0;
  std::vector<std::pair<std::uint32_t, std::uint32_t>> parts;
  auto plan = flash_image(fb, "boot", src, {}, [&](std::uint64_t d, std::uint64_t) { done = d; },
                          [&](std::uint32_t i, std::uint32_t n) { parts.emplace_back(i, n); });
  if (!check_ok("raw_fits", plan)) return;

  check_eq("raw_fits_sparse", plan->sparse, false);
  check_eq("raw_fits_parts", plan->parts, std::uint32_t{1});
  check_eq("raw_fits_w0", t.write_text(0), std::string("getvar:max-download-size"));
  check_eq("raw_fits_w1", t.write_text(1), std::string("download:00001388"));
  check_eq("raw_fits_last", t.write_text(t.writes().size() - 1), std::string("flash:boot"));
  check_true("raw_fits_payload", between(t, 1, t.writes().size() - 1) == image);
  check_eq("raw_fits_progress", done, std::uint64_t{5000});
  check_eq("raw_fits_on_part", parts.size(), std::size_t{1});
}

static void test_sparse_single_part() {
  const auto image = SparseImageBuilder{}.fill(8, 0xDEADBEEF).raw(blocks_of(4 * BS)).build();
  MemorySource src(image, "system.img");

  ScriptedTransport t(1 << 20);
  t.reply("OKAY268435456");
  script_part(t, static_cast<std::uint32_t>(image.size()));
  FastbootCommands fb(t);

  auto plan = flash_image(fb, "system", src);
  if (!check_ok("sparse_one", plan)) return;
  check_eq("sparse_one_sparse", plan->sparse, true);
  check_eq("sparse_one_parts", plan->parts, std::uint32_t{1});
  check_eq("sparse_one_bytes", plan->bytes_total, std::uint64_t{image.size()});
  check_eq("sparse_one_dl", t.write_text(1), fmt::format("download:{:08x}", image.size()));

  const auto flashes = find_writes(t, "flash:system");
  check_eq("sparse_one_flashes", flashes.size(), std::size_t{1});
  // A single part re-sends the image unchanged.
  if (!flashes.empty()) check_true("sparse_one_payload", between(t, 1, flashes[0]) == image);
}

static void test_sparse_split_parts() {
  const auto raw = blocks_of(4 * BS);
  const auto image = SparseImageBuilder{}.raw(raw).build();
  MemorySource src(image, "vendor.img");

  ScriptedTransport t(1 << 20);
  t.reply("OKAY0x3000");
  script_part(t, 28 + 12 + 2 * BS);
  script_part(t, 28 + 12 + 12 + 2 * BS);
  FastbootCommands fb(t);

  std::vector<std::pair<std::uint32_t, std::uint32_t>> parts;
  auto plan = flash_image(fb, "vendor", src, {}, {}, [&](std::uint32_t i, std::uint32_t n) { parts.emplace_back(i, n); });
  if (!check_ok("sparse_split", plan)) return;
  check_eq("sparse_split_parts", plan->parts, std::uint32_t{2});
  check_eq("sparse_split_on_part", parts.size(), std::size_t{2});
  if (parts.size() == 2) check_true("sparse_split_on_part_1", parts[1] == std::pair<std::uint32_t, std::uint32_t>{1, 2});

  const auto downloads = find_writes(t, "download:00002034");
  const auto flashes = find_writes(t, "flash:vendor");
  check_eq("sparse_split_flashes", flashes.size(), std::size_t{2});
  check_eq("sparse_split_second_dl", downloads.size(), std::size_t{1});
  if (flashes.size() != 2 || downloads.size() != 1) return;

  // The second part skips the blocks the first one wrote.
  const auto part = between(t, downloads[0], flashes[1]);
  MemorySource ps(part);
  auto r = sindri::sparse::SparseReader::open(ps);
  if (!check_ok("sparse_split_part_open", r)) return;
  auto c0 = r->next();
  auto c1 = r->next();
  if (!check_ok("sparse_split_c0", c0) || !check_ok("sparse_split_c1", c1) || !*c0 || !*c1) return;
  check_eq("sparse_split_skip", (*c0)->header.type, sindri::sparse::ChunkType::DontCare);
  check_eq("sparse_split_skip_blocks", (*c0)->header.chunk_size, std::uint32_t{2});
  check_eq("sparse_split_raw_blocks", (*c1)->header.chunk_size, std::uint32_t{2});
  const auto tail = std::span<const std::byte>(part).subspan((*c1)->payload_offset, 2 * BS);
  check_true("sparse_split_raw_data", std::equal(tail.begin(), tail.end(), raw.begin() + 2 * BS));
}

static void test_raw_too_large() {
  const auto image = blocks_of(3 * BS + 100);
  MemorySource src(image, "big.img");

  ScriptedTransport t(1 << 20);
  t.reply("OKAY0x3000");
  script_part(t, 28 + 12 + 2 * BS);
  script_part(t, 28 + 12 + 12 + 2 * BS);
  FastbootCommands fb(t);

  auto plan = flash_image(fb, "super", src);
  if (!check_ok("raw_split", plan)) return;
  check_eq("raw_split_sparse", plan->sparse, false);
  check_eq("raw_split_parts", plan->parts, std::uint32_t{2});

  const auto downloads = find_writes(t, "download:00002034");
  const auto flashes = find_writes(t, "flash:super");
  if (downloads.size() != 1 || flashes.size() != 2) {
    check_true("raw_split_sequence", false);
    return;
  }

  // Second part: blocks 2 and 3, the last one only 100 bytes into the image.
  const auto part = between(t, downloads[0], flashes[1]);
  check_eq("raw_split_part_size", part.size(), std::size_t{28 + 12 + 12 + 2 * BS});
  const auto data = std::span<const std::byte>(part).subspan(28 + 12 + 12);
  const std::size_t have = image.size() - 2 * BS;
  check_true("raw_split_tail", std::equal(data.begin(), data.begin() + have, image.begin() + 2 * BS));
  check_true("raw_split_pad", std::all_of(data.begin() + have, data.end(), [](std::byte b) { return b == std::byte{0}; }));
}

static void test_download_limit() {
  {
    ScriptedTransport t;
    t.reply("FAILunknown variable");
    FastbootCommands fb(t);
    auto l = query_download_limit(fb, FlashOptions{1234, 0});
    if (check_ok("limit_default", l)) check_eq("limit_default_value", *l, std::uint64_t{1234});
  }
  {
    ScriptedTransport t;
    t.reply("OKAY0x20000000");
    FastbootCommands fb(t);
    auto l = query_download_limit(fb, FlashOptions{DEFAULT_DOWNLOAD_LIMIT, 4096 * 16});
    if (check_ok("limit_override", l)) check_eq("limit_override_value", *l, std::uint64_t{4096 * 16});
  }
  {
    ScriptedTransport t;
    t.reply("OKAYlots");
    FastbootCommands fb(t);
    check_err("limit_garbage", query_download_limit(fb, {}), Errc::Format);
  }
  {
    ScriptedTransport t;
    FastbootCommands fb(t);
    check_err("limit_timeout", query_download_limit(fb, {}), Errc::Timeout);
  }
}

static void test_bad_sparse_header() {
  SparseImageBuilder b;
  b.raw(blocks_of(BS));
  b.header().major_version = 2;
  const auto image = b.build();
  MemorySource src(image);

  ScriptedTransport t;
  t.reply("OKAY0x10000000");
  FastbootCommands fb(t);
  check_err("bad_sparse", flash_image(fb, "boot", src), Errc::Format);
  check_eq("bad_sparse_nothing_sent", t.writes().size(), std::size_t{1});
}

static void test_remote_flash_failure() {
  const auto image = blocks_of(64);
  MemorySource src(image);

  ScriptedTransport t(1 << 20);
  t.reply("OKAY0x10000000");
  t.reply("DATA00000040");
  t.reply("OKAY");
  t.reply("FAILpartition table doesn't exist");
  FastbootCommands fb(t);
  check_err("remote_flash_fail", flash_image(fb, "boot", src), Errc::Protocol);
}

static void test_huge_chunk_count() {
  SparseImageBuilder b;
  b.dont_care(1);
  b.header().total_chunks = 0xffffffffu;
  const auto image = b.build();
  MemorySource src(image);

  ScriptedTransport t;
  t.reply("OKAY0x10000000");
  FastbootCommands fb(t);
  check_err("huge_chunks", flash_image(fb, "boot", src), Errc::Format);
  check_eq("huge_chunks_nothing_sent", t.writes().size(), std::size_t{1});
}

static void test_source_failure_mid_part() {
  FailingSource src(blocks_of(3 * BS), BS);

  ScriptedTransport t(1 << 20);
  t.reply("OKAY8192");
  script_part(t, 28 + 12 + BS);
  t.reply(fmt::format("DATA{:08x}", 28 + 12 + 12 + BS));
  FastbootCommands fb(t);

  check_err("source_fail", flash_image(fb, "userdata", src), Errc::Io);
  check_true("source_fail_reopen", fb.needs_reopen());
  check_eq("source_fail_state", fb.state(), State::Terminal);

  const auto sends = t.send_calls();
  check_err("source_fail_next_op", fb.get_var("version"), Errc::Io);
  check_eq("source_fail_untouched", t.send_calls(), sends);
}

int main() {
  test_raw_fits();
  test_sparse_single_part();
  test_sparse_split_parts();
  test_raw_too_large();
  test_download_limit();
  test_bad_sparse_header();
  test_remote_flash_failure();
  test_huge_chunk_count();
  test_source_failure_mid_part();

  return report("flash");
}
