#pragma once

#include <boost/json.hpp>
#include <string>
#include <string_view>

#include "ccjfix/command_line.hpp"
#include "ccjfix/database.hpp"

namespace ccjfix {

namespace json = boost::json;

inline std::string_view as_view(const json::string& s) {
  return {s.data(), s.size()};
}

inline json::array tokens_to_json(const token_list& tokens) {
  json::array res;
  res.reserve(tokens.size());
  for (const auto& t : tokens) res.emplace_back(t.value);
  return res;
}

inline json::object error_to_json(const entry_error& e) {
  json::object res;
  res["index"] = e.index;
  res["file"] = e.file;
  res["details"] = e.message;
  return res;
}

inline json::object report_to_json(const edit_report& report) {
  json::object res;
  res["changed"] = report.changed;
  res["unchanged"] = report.unchanged;
  json::array errors;
  for (const auto& e : report.errors) errors.push_back(error_to_json(e));
  res["errors"] = std::move(errors);
  return res;
}

}  // namespace ccjfix
