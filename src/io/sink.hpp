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

#include "core/status.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace sindri::io {

// Sequential output. skip() advances without writing payload; the bytes it
// covers read back as zero once finish() returns.
class ByteSink {
 public:
  virtual ~ByteSink() = default;

  virtual std::string display_name() const = 0;
  virtual sindri::core::Status write(std::span<const std::byte> data) noexcept = 0;
  virtual sindri::core::Status skip(std::uint64_t n) noexcept = 0;
  virtual sindri::core::Status finish() noexcept = 0;

  virtual std::uint64_t position() const noexcept = 0;
};

class MemorySink final : public ByteSink {
 public:
  explicit MemorySink(std::vector<std::byte>& out) : out_(out) {}

  std::string display_name() const override { return "<memory>"; }
  sindri::core::Status write(std::span<const std::byte> data) noexcept override;
  sindri::core::Status skip(std::uint64_t n) noexcept override;
  sindri::core::Status finish() noexcept override { return {}; }

  std::uint64_t position() const noexcept override { return out_.size(); }

 private:
  std::vector<std::byte>& out_;
};

// Skipped ranges become holes on filesystems that support them.
class FileSink final : public ByteSink {
 public:
  ~FileSink() override;

  static sindri::core::Result<std::unique_ptr<FileSink>> create(const std::filesystem::path& path) noexcept;

  std::string display_name() const override { return path_.string(); }
  sindri::core::Status write(std::span<const std::byte> data) noexcept override;
  sindri::core::Status skip(std::uint64_t n) noexcept override;
  sindri::core::Status finish() noexcept override;

  std::uint64_t position() const noexcept override { return pos_; }

 private:
  explicit FileSink(std::filesystem::path p);

  std::filesystem::path path_;
  std::ofstream out_;
  std::uint64_t pos_ = 0;
  bool finished_ = false;
};

} // namespace sindri::io
