#include <fmt/std.h>

#include <boost/json.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <span>
#include <typeinfo>
#include <vector>

#include "../libccjfix/logger.hpp"
#include "../libccjfix/utils.hpp"
#include "ccjfix/edit.hpp"
#include "options.hpp"
#include "run.hpp"

namespace fs = std::filesystem;
namespace json = boost::json;

int main(int argc, char* argv[]) {
  ccjfix::file_options fopts{};
  ccjfix::edit_options eopts{};
  int loglevel{3};
  bool json_output{false};

  auto done = ccjfix::parse_options(
      std::span(argv, argc), loglevel, fopts, eopts, json_output);
  if (done) return done.value();

  ccjfix::logger::set_level(static_cast<ccjfix::logger::level>(loglevel));
  LOG_DEBUG("loglevel={}", loglevel);

  auto ops = ccjfix::to_operations(eopts);
  if (ops.empty()) {
    LOG_INFO("No modifications requested, exiting.");
    return 0;
  }

  if (!json_output) {
    try {
      return ccjfix::run(fopts, eopts, ops, nullptr);
    } catch (std::exception& e) {
      LOG_FATAL("{}", e.what());
      return 1;
    }
  }

  // from this point on, JSON stuff
  json::object json_result;
  int retval = 0;
  json_result["cwd"] = fs::current_path().string();
  try {
    retval = ccjfix::run(fopts, eopts, ops, &json_result);
  } catch (std::exception& e) {
    json_result["error"] = ccjfix::utils::demangle_symbol(typeid(e).name());
    json_result["details"] = e.what();
    retval = 1;
  }
  std::cout << json::serialize(json_result) << "\n";
  return retval;
}
