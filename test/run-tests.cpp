#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "ccjfix/ccj.hpp"
#include "ccjfix/edit.hpp"
#include "ccjfix/errors.hpp"
#include "ccjfix/options.hpp"
#include "ccjfix/run.hpp"
#include "temp_dir.hpp"
#include "test_config.h"

namespace fs = std::filesystem;
namespace json = boost::json;

using ccjfix::test::slurp;
using ccjfix::test::TempDir;

namespace {

// A scratch copy of a fixture database, so runs can write to it
struct scratch_db {
  TempDir tmp;
  fs::path path;
  std::string original;

  explicit scratch_db(const std::string& fixture)
      : path{tmp.path / "compile_commands.json"} {
    fs::copy_file(fs::path{TEST_FIXTURE_DIR} / fixture, path);
    original = slurp(path);
  }

  [[nodiscard]] ccjfix::file_options fopts() const {
    ccjfix::file_options res;
    res.compile_commands_path = path;
    return res;
  }
};

std::vector<ccjfix::edit_operation> add_new_include() {
  return {ccjfix::add_include{"/new"}};
}

std::string command_of(const json::array& entries, size_t i) {
  const auto& s = entries[i].as_object().at("command").as_string();
  return {s.data(), s.size()};
}

}  // namespace

TEST_CASE("run-failed-entry-writes-nothing") {
  scratch_db db{"compile_commands.json"};
  auto ops = add_new_include();
  json::object result;

  CHECK(ccjfix::run(db.fopts(), {}, ops, &result) == 1);
  CHECK(slurp(db.path) == db.original);
  CHECK(db.tmp.count() == 1);

  CHECK(result.at("written").as_bool() == false);
  const auto& report = result.at("report").as_object();
  CHECK(report.at("changed").to_number<std::size_t>() == 2);
  CHECK(report.at("errors").as_array().size() == 1);
}

TEST_CASE("run-best-effort-writes-the-rest") {
  scratch_db db{"compile_commands.json"};
  auto ops = add_new_include();
  ccjfix::edit_options eopts;
  eopts.best_effort = true;
  json::object result;

  CHECK(ccjfix::run(db.fopts(), eopts, ops, &result) == 0);
  CHECK(result.at("written").as_bool() == true);

  auto entries = ccjfix::load_compile_commands(db.path);
  REQUIRE(entries.size() == 3);
  CHECK(
      command_of(entries, 0) ==
      "/usr/bin/c++ -I/home/user/project/include -I '/opt/bad path' "
      "-o CMakeFiles/app.dir/main.cpp.o -c /home/user/project/main.cpp "
      "-I /new");
  CHECK(
      entries[1].as_object().at("arguments").as_array().back().as_string() ==
      "/new");
  // The broken entry is left exactly as it was
  CHECK(command_of(entries, 2) == "/usr/bin/cc -c \"broken.c");
}

TEST_CASE("run-dry-run-leaves-the-file-alone") {
  scratch_db db{"compile_commands.json"};
  auto ops = add_new_include();
  ccjfix::edit_options eopts;
  eopts.best_effort = true;
  eopts.dry_run = true;
  json::object result;

  CHECK(ccjfix::run(db.fopts(), eopts, ops, &result) == 0);
  CHECK(slurp(db.path) == db.original);
  CHECK(db.tmp.count() == 1);

  CHECK(result.at("written").as_bool() == false);
  const auto& edited = result.at("compile_commands").as_array();
  REQUIRE(edited.size() == 3);
  CHECK(command_of(edited, 0).ends_with(" -I /new"));
}

TEST_CASE("run-writes-to-output-path") {
  scratch_db db{"single-entry.json"};
  auto fopts = db.fopts();
  fopts.output_path = db.tmp.path / "fixed.json";
  auto ops = add_new_include();
  json::object result;

  CHECK(ccjfix::run(fopts, {}, ops, &result) == 0);
  CHECK(slurp(db.path) == db.original);
  CHECK(result.at("written").as_bool() == true);

  auto entries = ccjfix::load_compile_commands(*fopts.output_path);
  REQUIRE(entries.size() == 1);
  CHECK(command_of(entries, 0) == "cc -c lonely.c -I /new");
}

TEST_CASE("run-rejects-bad-operations-up-front") {
  scratch_db db{"single-entry.json"};
  std::vector<ccjfix::edit_operation> ops{
    ccjfix::add_include{"/new"}, ccjfix::remove_include_matching{"(oops"}};

  CHECK_THROWS_AS(
      ccjfix::run(db.fopts(), {}, ops, nullptr), ccjfix::invalid_pattern);
  CHECK(slurp(db.path) == db.original);
}

TEST_CASE("run-missing-input") {
  TempDir tmp;
  ccjfix::file_options fopts;
  fopts.compile_commands_path = tmp.path / "nope.json";
  auto ops = add_new_include();
  CHECK_THROWS_AS(ccjfix::run(fopts, {}, ops, nullptr), ccjfix::io_failure);
}

TEST_CASE("resolve-input") {
  ccjfix::file_options fopts;
  fopts.compile_commands_path = "/some/where.json";
  CHECK(ccjfix::resolve_input(fopts) == fs::path{"/some/where.json"});

  auto original_dir = fs::current_path();
  fs::current_path(TEST_FIXTURE_DIR);
  auto found = ccjfix::resolve_input({});
  fs::current_path(original_dir);
  CHECK(found.filename() == "compile_commands.json");
}
