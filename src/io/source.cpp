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

#include <algorithm>
#include <cstring>
#include <fstream>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

namespace sindri::io {

std::size_t MemorySource::read(std::span<std::byte> out) {
  if (out.empty() || pos_ >= data_.size()) return 0;
  const std::size_t n = std::min(out.size(), data_.size() - pos_);
  std::memcpy(out.data(), data_.data() + pos_, n);
  pos_ += n;
  return n;
}

sindri::core::Status MemorySource::seek(std::uint64_t offset) noexcept {
  if (offset > data_.size()) {
    return sindri::core::failf(sindri::core::Errc::Io, "{}: seek to {} past end ({})", name_, offset, data_.size());
  }
  pos_ = static_cast<std::size_t>(offset);
  return {};
}

namespace {

class RawFileSource final : public ByteSource {
public:
  explicit RawFileSource(std::filesystem::path p, std::uint64_t size)
    : path_(std::move(p)), in_(path_, std::ios::binary), size_(size)
  {}

  bool opened() const noexcept { return in_.is_open(); }

  std::string display_name() const override { return path_.string(); }
  std::uint64_t size() const override { return size_; }

  std::size_t read(std::span<std::byte> out) override {
    if (out.empty() || pos_ >= size_) return 0;
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    const auto n = in_.gcount();
    if (in_.bad()) st_ = sindri::core::failf(sindri::core::Errc::Io, "read failed: {}", path_.string());
    if (in_.eof()) in_.clear();
    if (n <= 0) return 0;
    pos_ += static_cast<std::uint64_t>(n);
    return static_cast<std::size_t>(n);
  }

  sindri::core::Status seek(std::uint64_t offset) noexcept override {
    if (offset > size_) {
      return sindri::core::failf(sindri::core::Errc::Io, "{}: seek to {} past end ({})", path_.string(), offset, size_);
    }
    if (offset > static_cast<std::uint64_t>(std::numeric_limits<std::streamoff>::max())) {
      return sindri::core::failf(sindri::core::Errc::Io, "{}: offset {} out of range", path_.string(), offset);
    }
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!in_.good()) return sindri::core::failf(sindri::core::Errc::Io, "seek failed: {}", path_.string());
    pos_ = offset;
    return {};
  }

  std::uint64_t tell() const noexcept override { return pos_; }

  sindri::core::Status status() const noexcept override { return st_; }

private:
  std::filesystem::path path_;
  std::ifstream in_;
  std::uint64_t size_ = 0;
  std::uint64_t pos_ = 0;
  sindri::core::Status st_{};
};

} // namespace

sindri::core::Result<std::unique_ptr<ByteSource>> open_raw_file(const std::filesystem::path& path) noexcept {
  std::error_code ec;
  const auto sz = std::filesystem::file_size(path, ec);
  if (ec) return sindri::core::failf(sindri::core::Errc::NotFound, "open_raw_file: stat failed: {}: {}", path.string(), ec.message());

  auto ptr = std::make_unique<RawFileSource>(path, static_cast<std::uint64_t>(sz));
  if (!ptr->opened()) {
    return sindri::core::failf(sindri::core::Errc::Io, "open_raw_file: cannot open: {}", path.string());
  }

  spdlog::debug("Opened {} ({} bytes)", path.string(), sz);
  return std::unique_ptr<ByteSource>(std::move(ptr));
}

} // namespace sindri::io
