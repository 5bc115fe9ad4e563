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

#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

namespace sindri::io {

sindri::core::Status MemorySink::write(std::span<const std::byte> data) noexcept {
  try {
    out_.insert(out_.end(), data.begin(), data.end());
  } catch (const std::bad_alloc&) {
    return sindri::core::fail(sindri::core::Errc::Io, "memory sink: out of memory");
  }
  return {};
}

sindri::core::Status MemorySink::skip(std::uint64_t n) noexcept {
  if (n > out_.max_size() - out_.size()) {
    return sindri::core::failf(sindri::core::Errc::Io, "memory sink: cannot grow by {} bytes", n);
  }
  try {
    out_.resize(out_.size() + static_cast<std::size_t>(n), std::byte{0});
  } catch (const std::bad_alloc&) {
    return sindri::core::fail(sindri::core::Errc::Io, "memory sink: out of memory");
  }
  return {};
}

FileSink::FileSink(std::filesystem::path p)
  : path_(std::move(p)), out_(path_, std::ios::binary | std::ios::trunc)
{}

FileSink::~FileSink() {
  if (!finished_ && out_.is_open()) spdlog::warn("{}: closed without finish(), output may be incomplete", path_.string());
}

sindri::core::Result<std::unique_ptr<FileSink>> FileSink::create(const std::filesystem::path& path) noexcept {
  std::unique_ptr<FileSink> s(new FileSink(path));
  if (!s->out_.is_open()) return sindri::core::failf(sindri::core::Errc::Io, "cannot create output file: {}", path.string());
  return s;
}

sindri::core::Status FileSink::write(std::span<const std::byte> data) noexcept {
  if (data.empty()) return {};
  out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!out_) return sindri::core::failf(sindri::core::Errc::Io, "write failed: {} at offset {}", path_.string(), pos_);
  pos_ += data.size();
  return {};
}

sindri::core::Status FileSink::skip(std::uint64_t n) noexcept {
  if (!n) return {};
  if (n > static_cast<std::uint64_t>(std::numeric_limits<std::streamoff>::max()) - pos_) {
    return sindri::core::failf(sindri::core::Errc::Io, "{}: skip of {} bytes overflows", path_.string(), n);
  }
  out_.seekp(static_cast<std::streamoff>(n), std::ios::cur);
  if (!out_) return sindri::core::failf(sindri::core::Errc::Io, "seek failed: {}", path_.string());
  pos_ += n;
  return {};
}

sindri::core::Status FileSink::finish() noexcept {
  if (finished_) return {};
  out_.flush();
  const bool ok = static_cast<bool>(out_);
  out_.close();
  if (!ok) return sindri::core::failf(sindri::core::Errc::Io, "flush failed: {}", path_.string());

  // A trailing skip leaves the file short; extend it to the logical size.
  std::error_code ec;
  const auto have = std::filesystem::file_size(path_, ec);
  if (ec) return sindri::core::failf(sindri::core::Errc::Io, "stat failed: {}: {}", path_.string(), ec.message());
  if (have != pos_) {
    std::filesystem::resize_file(path_, pos_, ec);
    if (ec) return sindri::core::failf(sindri::core::Errc::Io, "resize failed: {}: {}", path_.string(), ec.message());
  }

  finished_ = true;
  return {};
}

} // namespace sindri::io
