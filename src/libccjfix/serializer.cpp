#include <re2/re2.h>

#include <string>
#include <string_view>
#include <vector>

#include "ccjfix/command_line.hpp"

namespace ccjfix {

namespace {
// clang-format off
const RE2 r_safe_word {R"([A-Za-z0-9_@%+=:,./-]+)"};
// clang-format on
}  // namespace

bool needs_quoting(std::string_view word) {
  return !RE2::FullMatch(
      re2::StringPiece(word.data(), word.size()), r_safe_word);
}

std::string quote(std::string_view word) {
  if (!needs_quoting(word)) return std::string{word};

  std::string res{"'"};
  for (char c : word) {
    if (c == '\'')
      res += R"('\'')";  // close, escaped quote, reopen
    else
      res += c;
  }
  res += '\'';
  return res;
}

std::string serialize(const token_list& tokens) {
  std::string res;
  for (const auto& t : tokens) {
    if (&t != &tokens.front()) res += ' ';
    res += quote(t.value);
  }
  return res;
}

std::vector<std::string> to_words(const token_list& tokens) {
  std::vector<std::string> words;
  words.reserve(tokens.size());
  for (const auto& t : tokens) words.push_back(t.value);
  return words;
}

}  // namespace ccjfix
