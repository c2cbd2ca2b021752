#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace ccjfix {

namespace fs = std::filesystem;

struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct malformed_command : error {
  malformed_command(const std::string& desc, size_t offset)
      : error{desc}, offset_{offset} {}
  [[nodiscard]] size_t offset() const { return offset_; }

 private:
  size_t offset_;
};

struct ambiguous_flag : error {
  ambiguous_flag(const std::string& desc, size_t token_index)
      : error{desc}, token_index_{token_index} {}
  [[nodiscard]] size_t token_index() const { return token_index_; }

 private:
  size_t token_index_;
};

struct invalid_pattern : error {
  using error::error;
};

struct io_failure : error {
  io_failure(const std::string& desc, fs::path p)
      : error{desc}, path{std::move(p)} {}
  fs::path path;
};

}  // namespace ccjfix
