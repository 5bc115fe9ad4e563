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
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace sindri::io {

// Sequential input with random repositioning. read() returning 0 means EOF
// or error; status() tells them apart.
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual std::string display_name() const = 0;
  virtual std::uint64_t size() const = 0;
  virtual std::size_t read(std::span<std::byte> out) = 0;

  virtual sindri::core::Status seek(std::uint64_t offset) noexcept = 0;
  virtual std::uint64_t tell() const noexcept = 0;

  virtual sindri::core::Status status() const noexcept { return {}; }

  std::uint64_t remaining() const noexcept {
    const auto pos = tell();
    return pos < size() ? size() - pos : 0;
  }
};

// Non-owning view over a caller buffer, or owning when built from a vector.
class MemorySource final : public ByteSource {
 public:
  explicit MemorySource(std::span<const std::byte> data, std::string name = "<memory>")
    : data_(data), name_(std::move(name)) {}
  explicit MemorySource(std::vector<std::byte> owned, std::string name = "<memory>")
    : owned_(std::move(owned)), data_(owned_), name_(std::move(name)) {}

  MemorySource(const MemorySource&) = delete;
  MemorySource& operator=(const MemorySource&) = delete;

  std::string display_name() const override { return name_; }
  std::uint64_t size() const override { return data_.size(); }
  std::size_t read(std::span<std::byte> out) override;

  sindri::core::Status seek(std::uint64_t offset) noexcept override;
  std::uint64_t tell() const noexcept override { return pos_; }

 private:
  std::vector<std::byte> owned_;
  std::span<const std::byte> data_;
  std::string name_;
  std::size_t pos_ = 0;
};

sindri::core::Result<std::unique_ptr<ByteSource>> open_raw_file(const std::filesystem::path& path) noexcept;

} // namespace sindri::io
