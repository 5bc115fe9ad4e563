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

#include "protocol/fastboot/flash.hpp"

#include "core/str.hpp"
#include "io/read_exact.hpp"
#include "sparse/sparse_format.hpp"
#include "sparse/sparse_reader.hpp"
#include "sparse/sparse_split.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <vector>

#include <spdlog/spdlog.h>

namespace sindri::fastboot {

namespace {

using sindri::core::Errc;

constexpr std::size_t COPY_CHUNK = 1024 * 1024;

// Tracks overall progress across every download of one flash_image call.
class PartSender {
public:
  PartSender(FastbootCommands& fb, sindri::io::ByteSource& src, std::uint64_t total, const FlashProgress& progress)
    : fb_(fb), src_(src), total_(total), progress_(progress), buf_(COPY_CHUNK)
  {}

  sindri::core::Status send(std::span<const std::byte> d) noexcept {
    SINDRI_TRY(fb_.send_data(d));
    done_ += d.size();
    if (progress_) progress_(done_, total_);
    return {};
  }

  // Copies size bytes from the image at offset; bytes past its end are sent as zeros.
  sindri::core::Status copy(std::uint64_t offset, std::uint64_t size) noexcept {
    const std::uint64_t avail = offset < src_.size() ? src_.size() - offset : 0;
    std::uint64_t from_src = std::min(size, avail);
    std::uint64_t pad = size - from_src;

    if (from_src) {
      if (auto st = src_.seek(offset); !st) return fb_.abort_transfer(std::move(st.error()));
    }
    while (from_src) {
      const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(from_src, buf_.size()));
      if (auto st = sindri::io::read_exact(src_, std::span(buf_).first(n)); !st) {
        return fb_.abort_transfer(std::move(st.error()));
      }
      SINDRI_TRY(send(std::span<const std::byte>(buf_).first(n)));
      from_src -= n;
    }

    if (pad) std::fill(buf_.begin(), buf_.end(), std::byte{0});
    while (pad) {
      const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(pad, buf_.size()));
      SINDRI_TRY(send(std::span<const std::byte>(buf_).first(n)));
      pad -= n;
    }
    return {};
  }

private:
  FastbootCommands& fb_;
  sindri::io::ByteSource& src_;
  std::uint64_t total_;
  std::uint64_t done_ = 0;
  const FlashProgress& progress_;
  std::vector<std::byte> buf_;
};

sindri::core::Result<std::vector<sindri::sparse::ChunkHeader>> read_chunk_headers(sindri::sparse::SparseReader& r) noexcept {
  // Each chunk takes at least a header in the input, whatever total_chunks claims.
  const std::uint64_t fit = (r.source().size() - sindri::sparse::FILE_HEADER_SIZE) / sindri::sparse::CHUNK_HEADER_SIZE;
  std::vector<sindri::sparse::ChunkHeader> out;
  out.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(r.header().total_chunks, fit)));
  for (;;) {
    auto c = r.next();
    if (!c) return sindri::core::forward(std::move(c.error()));
    if (!*c) break;
    out.push_back((*c)->header);
  }
  return out;
}

sindri::core::Status send_splits(FastbootCommands& fb, std::string_view partition, sindri::io::ByteSource& image,
                                        const std::vector<sindri::sparse::Split>& splits, const FlashProgress& progress,
                                        const PartCallback& on_part) noexcept {
  std::uint64_t total = 0;
  for (const auto& s : splits) total += s.sparse_size();

  PartSender out(fb, image, total, progress);
  const auto count = static_cast<std::uint32_t>(splits.size());

  for (std::uint32_t i = 0; i < count; ++i) {
    const auto& s = splits[i];
    if (on_part) on_part(i, count);
    spdlog::info("Sending sparse '{}' {}/{} ({} bytes)", partition, i + 1, count, s.sparse_size());

    SINDRI_TRY(fb.begin_download(static_cast<std::uint32_t>(s.sparse_size())));
    SINDRI_TRY(out.send(sindri::sparse::serialize(s.header)));
    for (const auto& c : s.chunks) {
      SINDRI_TRY(out.send(sindri::sparse::serialize(c.header)));
      if (c.size) SINDRI_TRY(out.copy(c.offset, c.size));
    }
    SINDRI_TRY(fb.finish_download());

    spdlog::info("Writing '{}' {}/{}", partition, i + 1, count);
    SINDRI_TRY(fb.flash(partition));
  }
  return {};
}

} // namespace

sindri::core::Result<std::uint64_t> query_download_limit(FastbootCommands& fb, const FlashOptions& opt) noexcept {
  std::uint64_t limit = opt.default_download_limit;

  auto v = fb.get_var("max-download-size");
  if (!v) {
    if (v.error().code != Errc::Protocol) return sindri::core::forward(std::move(v.error()));
    spdlog::warn("max-download-size unavailable ({}), using {} bytes", v.error().msg, limit);
  } else {
    const auto parsed = sindri::core::parse_size(*v);
    if (!parsed) return sindri::core::failf(Errc::Format, "cannot parse max-download-size '{}'", *v);
    if (*parsed) limit = *parsed;
  }

  if (opt.download_limit_override && opt.download_limit_override < limit) limit = opt.download_limit_override;
  limit = std::min<std::uint64_t>(limit, std::numeric_limits<std::uint32_t>::max());
  spdlog::debug("download limit: {} bytes", limit);
  return limit;
}

sindri::core::Result<FlashPlan> flash_image(FastbootCommands& fb, std::string_view partition, sindri::io::ByteSource& image,
                                            const FlashOptions& opt, const FlashProgress& progress,
                                            const PartCallback& on_part) noexcept {
  auto limit = query_download_limit(fb, opt);
  if (!limit) return sindri::core::forward(std::move(limit.error()));
  const auto max_size = static_cast<std::uint32_t>(*limit);

  std::array<std::byte, sindri::sparse::FILE_HEADER_SIZE> head{};
  bool sparse = false;
  if (image.size() >= head.size()) {
    SINDRI_TRY(image.seek(0));
    SINDRI_TRY(sindri::io::read_exact(image, head));
    sparse = sindri::sparse::has_magic(head);
  }

  FlashPlan plan;
  plan.sparse = sparse;

  std::vector<sindri::sparse::Split> splits;

  if (sparse) {
    auto reader = sindri::sparse::SparseReader::open(image);
    if (!reader) return sindri::core::forward(std::move(reader.error()));
    auto chunks = read_chunk_headers(*reader);
    if (!chunks) return sindri::core::forward(std::move(chunks.error()));

    auto s = sindri::sparse::split_image(reader->header(), *chunks, max_size);
    if (!s) return sindri::core::forward(std::move(s.error()));
    splits = std::move(*s);
    spdlog::info("{}: sparse image, {} chunks, flashing in {} part(s)", image.display_name(), chunks->size(), splits.size());
  } else if (image.size() <= max_size) {
    spdlog::info("{}: raw image, {} bytes", image.display_name(), image.size());
    SINDRI_TRY(image.seek(0));

    fb.set_progress_callback(progress ? ProgressCallback(progress) : ProgressCallback{});
    if (on_part) on_part(0, 1);
    auto st = fb.download(image, image.size());
    fb.set_progress_callback({});
    SINDRI_TRY(st);

    spdlog::info("Writing '{}'", partition);
    SINDRI_TRY(fb.flash(partition));

    plan.parts = 1;
    plan.bytes_total = image.size();
    return plan;
  } else {
    auto s = sindri::sparse::split_raw(image.size(), max_size);
    if (!s) return sindri::core::forward(std::move(s.error()));
    splits = std::move(*s);
    spdlog::info("{}: raw image of {} bytes exceeds {}, flashing in {} sparse part(s)", image.display_name(), image.size(),
                 max_size, splits.size());
  }

  SINDRI_TRY(send_splits(fb, partition, image, splits, progress, on_part));

  plan.parts = static_cast<std::uint32_t>(splits.size());
  for (const auto& s : splits) plan.bytes_total += s.sparse_size();
  return plan;
}

} // namespace sindri::fastboot
