#include "run.hpp"

#include <fmt/std.h>

#include <boost/json.hpp>
#include <filesystem>
#include <iostream>
#include <span>

#include "../libccjfix/json_helpers.hpp"
#include "../libccjfix/logger.hpp"
#include "../libccjfix/utils.hpp"
#include "ccjfix/ccj.hpp"
#include "ccjfix/database.hpp"
#include "ccjfix/include_flags.hpp"

namespace ccjfix {

namespace fs = std::filesystem;
namespace json = boost::json;

fs::path resolve_input(const file_options& fopts) {
  if (fopts.compile_commands_path) {
    LOG_INFO("Using provided compile_commands.json: {}",
             *fopts.compile_commands_path);
    return *fopts.compile_commands_path;
  }
  auto ccj = find_ccj();
  if (!ccj) utils::throwf("Can't find compile_commands.json");
  LOG_INFO("Detected {}", *ccj);
  return *ccj;
}

int run(
    const file_options& fopts, const edit_options& eopts,
    std::span<edit_operation> ops, json::object* json_result) {
  validate(ops);
  for (const auto& op : ops) LOG_DEBUG("Requested: {}", describe(op));

  auto copts = eopts.include_flags.empty()
                   ? classifier_options{}
                   : classifier_options::from_prefixes(eopts.include_flags);

  fs::path input = resolve_input(fopts);
  fs::path output = fopts.output_path.value_or(input);

  auto entries = load_compile_commands(input);
  LOG_INFO("Loaded {} entries from {}", entries.size(), input);

  auto report = edit_database(entries, ops, copts);
  for (const auto& e : report.errors)
    LOG_ERROR("{} (entry {}): {}", e.file, e.index, e.message);

  bool write = report.ok() || eopts.best_effort;
  if (json_result) {
    (*json_result)["input"] = input.string();
    (*json_result)["output"] = output.string();
    (*json_result)["report"] = report_to_json(report);
    (*json_result)["written"] = false;
  }

  if (!write) {
    LOG_ERROR(
        "{} entries failed, leaving {} alone (--best-effort writes anyway)",
        report.errors.size(), output);
    return 1;
  }
  if (!report.ok())
    LOG_WARN("Writing {} despite {} failed entries", output,
             report.errors.size());

  if (eopts.dry_run) {
    if (json_result)
      (*json_result)["compile_commands"] = entries;
    else
      std::cout << to_pretty_string(entries);
    return 0;
  }

  save_compile_commands(output, entries);
  if (json_result) (*json_result)["written"] = true;
  return 0;
}

}  // namespace ccjfix
