#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ccjfix/edit.hpp"

namespace fs = std::filesystem;

namespace ccjfix {

struct file_options {
  std::optional<fs::path> compile_commands_path{};
  std::optional<fs::path> output_path{};
};

struct edit_options {
  std::vector<std::string> add_includes{};
  std::vector<std::string> delete_includes{};
  std::vector<std::string> delete_include_patterns{};
  std::vector<std::string> add_args{};
  std::vector<std::string> delete_args{};
  std::vector<std::string> include_flags{};
  bool dry_run{};
  bool best_effort{};
};

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, file_options& fopts,
    edit_options& eopts, bool& json_output);

std::vector<edit_operation> to_operations(const edit_options& eopts);

}  // namespace ccjfix
