#include "options.hpp"

#include <CLI/CLI.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace ccjfix {

namespace {

// "Wall" and "-Wall" both mean -Wall, so values needn't start with a dash
std::string dashed(const std::string& arg) {
  if (arg.starts_with('-')) return arg;
  return "-" + arg;
}

}  // namespace

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, file_options& fopts,
    edit_options& eopts, bool& json_output) {
  CLI::App app{"Add or remove include directories in compile_commands.json"};

  app.add_option(
      "-c,--compile-commands", fopts.compile_commands_path,
      "Input compilation database (default: ./compile_commands.json)");
  app.add_option(
      "-o,--output", fopts.output_path,
      "Where to write the modified database (default: the input)");
  app.add_option(
      "-i,--add-include", eopts.add_includes,
      "Add this include directory to every entry");
  app.add_option(
      "-d,--delete-include", eopts.delete_includes,
      "Remove this include directory from every entry");
  app.add_option(
      "--delete-include-regex", eopts.delete_include_patterns,
      "Remove include directories fully matching this RE2 pattern");
  app.add_option(
      "--add-arg", eopts.add_args,
      "Add this argument to every entry, e.g. --add-arg Wall");
  app.add_option(
      "--delete-arg", eopts.delete_args,
      "Remove this argument from every entry");
  app.add_option(
      "--include-flag", eopts.include_flags,
      "Include flag spelling to recognize, joined or split, given as "
      "--include-flag=-I (default: -I and -isystem)");
  app.add_flag(
      "--dry-run", eopts.dry_run,
      "Print the modified database instead of writing it")
    ->capture_default_str();
  app.add_flag(
      "--best-effort", eopts.best_effort,
      "Write the database even if some entries could not be edited")
    ->capture_default_str();
  app.add_option(
      "--debug",
      loglevel,
      "Debug log level (3=INFO)")
    ->capture_default_str();
  app.add_flag(
      "--json", json_output,
      "Output a JSON summary of the run")
    ->capture_default_str();

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  return std::nullopt;
}

std::vector<edit_operation> to_operations(const edit_options& eopts) {
  std::vector<edit_operation> ops;
  for (const auto& p : eopts.add_includes) ops.emplace_back(add_include{p});
  for (const auto& p : eopts.delete_includes)
    ops.emplace_back(remove_include{p});
  for (const auto& p : eopts.delete_include_patterns)
    ops.emplace_back(remove_include_matching{p});
  for (const auto& a : eopts.add_args)
    ops.emplace_back(add_argument{dashed(a)});
  for (const auto& a : eopts.delete_args)
    ops.emplace_back(remove_argument{dashed(a)});
  return ops;
}

}  // namespace ccjfix
