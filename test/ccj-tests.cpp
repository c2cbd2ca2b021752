#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>

#include "ccjfix/ccj.hpp"
#include "ccjfix/errors.hpp"
#include "temp_dir.hpp"
#include "test_config.h"

namespace fs = std::filesystem;
namespace json = boost::json;

using ccjfix::test::slurp;
using ccjfix::test::TempDir;

TEST_CASE("load-array") {
  fs::path fixture_dir{TEST_FIXTURE_DIR};
  auto entries =
      ccjfix::load_compile_commands(fixture_dir / "compile_commands.json");
  REQUIRE(entries.size() == 3);
  CHECK(entries[0].as_object().at("file").as_string() == "/home/user/project/main.cpp");
  CHECK(entries[1].as_object().at("file").as_string() == "util.c");
  CHECK(entries[2].as_object().at("file").as_string() == "broken.c");
}

TEST_CASE("load-single-object") {
  fs::path fixture_dir{TEST_FIXTURE_DIR};
  auto entries = ccjfix::load_compile_commands(fixture_dir / "single-entry.json");
  REQUIRE(entries.size() == 1);
  CHECK(entries[0].as_object().at("file").as_string() == "lonely.c");
}

TEST_CASE("load-failures") {
  fs::path fixture_dir{TEST_FIXTURE_DIR};
  for (const auto* name : {"does-not-exist.json", "not-json.json", "scalar.json"}) {
    CAPTURE(name);
    try {
      ccjfix::load_compile_commands(fixture_dir / name);
      FAIL("expected io_failure");
    } catch (const ccjfix::io_failure& e) {
      CHECK(e.path == fixture_dir / name);
    }
  }
}

TEST_CASE("pretty-string") {
  auto jv = json::parse(R"([{"b": [1, "x"], "a": {}, "c": []}])");
  CHECK(
      ccjfix::to_pretty_string(jv) ==
      "[\n"
      "  {\n"
      "    \"b\": [\n"
      "      1,\n"
      "      \"x\"\n"
      "    ],\n"
      "    \"a\": {},\n"
      "    \"c\": []\n"
      "  }\n"
      "]\n");
  CHECK(json::parse(ccjfix::to_pretty_string(jv)) == jv);
}

TEST_CASE("save-replaces-atomically") {
  TempDir tmp;
  auto target = tmp.path / "compile_commands.json";
  {
    std::ofstream out(target);
    out << "[]";
  }

  auto entries = json::parse(R"([
    {"directory": "/b", "file": "a.c", "command": "cc -c a.c"}
  ])").as_array();
  ccjfix::save_compile_commands(target, entries);

  CHECK(json::parse(slurp(target)).as_array() == entries);
  CHECK(slurp(target) == ccjfix::to_pretty_string(entries));
  // Nothing but the destination is left behind
  CHECK(tmp.count() == 1);
}

TEST_CASE("save-creates-new-file") {
  TempDir tmp;
  auto target = tmp.path / "out.json";
  json::array entries;
  ccjfix::save_compile_commands(target, entries);
  CHECK(slurp(target) == "[]\n");
}

TEST_CASE("save-failure-leaves-nothing") {
  TempDir tmp;
  auto target = tmp.path / "missing-dir" / "compile_commands.json";
  CHECK_THROWS_AS(
      ccjfix::save_compile_commands(target, json::array{}), ccjfix::io_failure);
  CHECK_FALSE(fs::exists(target));
  CHECK(tmp.count() == 0);
}

TEST_CASE("save-onto-directory-keeps-it") {
  // Renaming a file over a non-empty directory fails, and the directory and
  // its contents must survive
  TempDir tmp;
  auto target = tmp.path / "compile_commands.json";
  fs::create_directories(target / "keep");
  CHECK_THROWS_AS(
      ccjfix::save_compile_commands(target, json::array{}), ccjfix::io_failure);
  CHECK(fs::is_directory(target / "keep"));
  CHECK(tmp.count() == 1);
}

TEST_CASE("find-ccj") {
  auto original_dir = fs::current_path();
  fs::current_path(TEST_FIXTURE_DIR);
  auto found = ccjfix::find_ccj();
  fs::current_path(original_dir);

  REQUIRE(found.has_value());
  CHECK(found->filename() == "compile_commands.json");
}
