#include "ccjfix/database.hpp"

#include <boost/json.hpp>
#include <string>

#include "ccjfix/command_line.hpp"
#include "ccjfix/errors.hpp"
#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace ccjfix {

namespace json = boost::json;

namespace {

std::string entry_file(const json::value& entry) {
  if (const auto* obj = entry.if_object())
    if (const auto* file = obj->if_contains("file"))
      if (const auto* s = file->if_string()) return std::string{as_view(*s)};
  return "<unknown>";
}

token_list arguments_to_tokens(const json::array& arguments) {
  token_list tokens;
  tokens.reserve(arguments.size());
  for (size_t i = 0; i < arguments.size(); ++i) {
    const auto* s = arguments[i].if_string();
    if (!s) utils::throwf<error>("\"arguments\" element {} is not a string", i);
    tokens.push_back({std::string{as_view(*s)}, false});
  }
  return tokens;
}

}  // namespace

bool edit_entry(
    json::object& entry, std::span<const edit_operation> ops,
    const classifier_options& options) {
  const auto* file = entry.if_contains("file");
  if (!file || !file->is_string())
    utils::throwf<error>("Entry has no \"file\" string");

  // "arguments" wins when both are there, like clang's own loader
  auto* arguments = entry.if_contains("arguments");
  auto* command = entry.if_contains("command");
  // Checked even when "arguments" wins, since it gets rewritten too
  if (command && !command->is_string())
    utils::throwf<error>("\"command\" is not a string");

  token_list tokens;
  if (arguments) {
    if (!arguments->is_array())
      utils::throwf<error>("\"arguments\" is not an array");
    tokens = arguments_to_tokens(arguments->get_array());
  } else if (command) {
    tokens = tokenize(as_view(command->get_string()));
  } else {
    utils::throwf<error>("Entry has neither \"command\" nor \"arguments\"");
  }

  auto edited = apply_edits(tokens, ops, options);
  if (edited == tokens) return false;

  if (arguments) *arguments = tokens_to_json(edited);
  // An entry carrying both keeps both, rewritten consistently
  if (command) *command = serialize(edited);

  LOG_DEBUG(
      "{}: {} -> {}", as_view(file->get_string()), serialize(tokens),
      serialize(edited));
  return true;
}

edit_report edit_database(
    json::array& entries, std::span<const edit_operation> ops,
    const classifier_options& options) {
  edit_report report;
  for (size_t i = 0; i < entries.size(); ++i) {
    auto& entry = entries[i];
    try {
      auto* obj = entry.if_object();
      if (!obj) utils::throwf<error>("Entry is not a JSON object");
      if (edit_entry(*obj, ops, options))
        ++report.changed;
      else
        ++report.unchanged;
    } catch (const error& e) {
      auto file = entry_file(entry);
      LOG_WARN("Skipping entry {} ({}): {}", i, file, e.what());
      report.errors.push_back({i, std::move(file), e.what()});
    }
  }

  LOG_INFO(
      "{} entries changed, {} unchanged, {} failed", report.changed,
      report.unchanged, report.errors.size());
  return report;
}

}  // namespace ccjfix
