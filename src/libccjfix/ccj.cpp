#include "ccjfix/ccj.hpp"

#include <fmt/std.h>
#include <unistd.h>

#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>

#include "auto.hpp"
#include "ccjfix/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace ccjfix {

namespace fs = std::filesystem;
namespace json = boost::json;

namespace {

void pretty_print(std::string& out, const json::value& jv, std::string& indent);

void pretty_print(
    std::string& out, const json::array& arr, std::string& indent) {
  if (arr.empty()) {
    out += "[]";
    return;
  }
  out += "[\n";
  indent.append(2, ' ');
  for (auto it = arr.begin();;) {
    out += indent;
    pretty_print(out, *it, indent);
    if (++it == arr.end()) break;
    out += ",\n";
  }
  out += "\n";
  indent.resize(indent.size() - 2);
  out += indent;
  out += "]";
}

void pretty_print(
    std::string& out, const json::object& obj, std::string& indent) {
  if (obj.empty()) {
    out += "{}";
    return;
  }
  out += "{\n";
  indent.append(2, ' ');
  for (auto it = obj.begin();;) {
    out += indent;
    out += json::serialize(it->key());
    out += ": ";
    pretty_print(out, it->value(), indent);
    if (++it == obj.end()) break;
    out += ",\n";
  }
  out += "\n";
  indent.resize(indent.size() - 2);
  out += indent;
  out += "}";
}

void pretty_print(std::string& out, const json::value& jv, std::string& indent) {
  switch (jv.kind()) {
    case json::kind::array:
      pretty_print(out, jv.get_array(), indent);
      break;
    case json::kind::object:
      pretty_print(out, jv.get_object(), indent);
      break;
    default:
      out += json::serialize(jv);
  }
}

}  // namespace

std::optional<fs::path> find_ccj() {
  auto probe = fs::current_path() / "compile_commands.json";
  if (fs::exists(probe)) return probe;
  return std::nullopt;
}

json::array load_compile_commands(const fs::path& compile_commands_path) {
  std::ifstream blob(compile_commands_path);
  if (!blob) {
    utils::throwf_with<io_failure>(
        compile_commands_path, "Could not open {}", compile_commands_path);
  }

  std::string content(
      (std::istreambuf_iterator<char>(blob)), std::istreambuf_iterator<char>());
  if (blob.bad()) {
    utils::throwf_with<io_failure>(
        compile_commands_path, "Could not read {}", compile_commands_path);
  }

  json::error_code ec;
  json::value jv = json::parse(content, ec);
  if (ec) {
    utils::throwf_with<io_failure>(
        compile_commands_path, "Could not parse {} as JSON: {}",
        compile_commands_path, ec.message());
  }

  if (jv.is_array()) return std::move(jv.get_array());
  if (jv.is_object()) {
    LOG_DEBUG("{} holds a single entry", compile_commands_path);
    json::array res;
    res.push_back(std::move(jv));
    return res;
  }
  utils::throwf_with<io_failure>(
      compile_commands_path,
      "{} is not formatted correctly, the top level item must be an array or "
      "object",
      compile_commands_path);
}

std::string to_pretty_string(const json::value& jv) {
  std::string out;
  std::string indent;
  pretty_print(out, jv, indent);
  out += "\n";
  return out;
}

void save_compile_commands(
    const fs::path& compile_commands_path, const json::array& entries) {
  std::string text = to_pretty_string(entries);

  fs::path tmp = compile_commands_path;
  tmp += fmt::format(".ccjfix-{}.tmp", ::getpid());
  AUTO_NAMED(cleanup, std::error_code ec; fs::remove(tmp, ec));

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      utils::throwf_with<io_failure>(
          compile_commands_path, "Could not open {} for writing", tmp);
    }
    out << text;
    out.flush();
    if (!out) {
      utils::throwf_with<io_failure>(
          compile_commands_path, "Could not write {}", tmp);
    }
  }

  std::error_code ec;
  if (fs::exists(compile_commands_path, ec)) {
    // Keep the original file's mode across the rename
    auto perms = fs::status(compile_commands_path, ec).permissions();
    if (!ec) fs::permissions(tmp, perms, ec);
    if (ec) LOG_WARN("Could not carry permissions over to {}", tmp);
  }

  fs::rename(tmp, compile_commands_path, ec);
  if (ec) {
    utils::throwf_with<io_failure>(
        compile_commands_path, "Could not replace {}: {}",
        compile_commands_path, ec.message());
  }
  cleanup.release();

  LOG_INFO("Wrote {} entries to {}", entries.size(), compile_commands_path);
}

}  // namespace ccjfix
