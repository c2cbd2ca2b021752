#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "ccjfix/command_line.hpp"

using ccjfix::quote;
using ccjfix::serialize;
using ccjfix::tokenize;

TEST_CASE("serialize-plain") {
  CHECK(
      serialize(ccjfix::to_tokens({"gcc", "-c", "foo.c", "-DX=1"})) ==
      "gcc -c foo.c -DX=1");
}

TEST_CASE("serialize-empty") { CHECK(serialize({}).empty()); }

TEST_CASE("quote-only-when-needed") {
  CHECK(quote("/usr/include") == "/usr/include");
  CHECK(quote("a,b:c@d%e+f") == "a,b:c@d%e+f");
  CHECK(quote("/opt/bad path") == "'/opt/bad path'");
  CHECK(quote("") == "''");
  CHECK(quote("$HOME") == "'$HOME'");
  CHECK(quote("~") == "'~'");
  CHECK(quote("it's") == R"('it'\''s')");
}

TEST_CASE("serialize-quotes-special-tokens") {
  CHECK(
      serialize(ccjfix::to_tokens({"gcc", R"(-DMSG="hi")", "-I/a b"})) ==
      R"(gcc '-DMSG="hi"' '-I/a b')");
}

TEST_CASE("serialize-round-trips") {
  const std::vector<std::vector<std::string>> samples{
    {"gcc", "-c", "foo.c"},
    {"cc", "", "a b", "\t", "x\ny"},
    {"cc", "it's", "'", "''", R"(\)", R"(\\)", R"(")"},
    {"cc", "$(rm -rf /)", "`id`", "a;b", "a|b", "a&b", "<in", ">out"},
    {"cc", "*.c", "?", "[ab]", "{a,b}", "#comment", "~user", "!x"},
    {"clang++", R"(-DSTR="a 'b' \"c\"")", "-I/opt/my dir/include"},
  };
  for (const auto& words : samples) {
    auto tokens = ccjfix::to_tokens(words);
    CAPTURE(serialize(tokens));
    CHECK(ccjfix::to_words(tokenize(serialize(tokens))) == words);
  }
}

TEST_CASE("serialize-round-trips-parsed-commands") {
  // Re-tokenizing what was serialized gives back the same words even when
  // the original quoting style differs
  const std::vector<std::string> commands{
    R"(gcc -I "/opt/bad path" -c foo.c)",
    R"(cc "-DMSG=\"hi there\"" a\ b 'it'\''s')",
    "cc \\\n -c 'x\ny'",
  };
  for (const auto& c : commands) {
    auto tokens = tokenize(c);
    CAPTURE(c);
    CHECK(tokenize(serialize(tokens)) == tokens);
  }
}
