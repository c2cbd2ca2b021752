#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ccjfix/command_line.hpp"
#include "ccjfix/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace ccjfix {

namespace {

enum class state : uint8_t { blank, unquoted, single_quoted, double_quoted };

// Inside double quotes a backslash only escapes these (and newline)
bool dquote_escapable(char c) {
  return c == '"' || c == '\\' || c == '$' || c == '`';
}

}  // namespace

token_list tokenize(std::string_view command) {
  token_list tokens;
  state st{state::blank};
  std::string word;
  bool quoted{};
  bool escape{};
  size_t quote_start{};
  size_t escape_start{};

  auto finish = [&]() {
    tokens.push_back({std::move(word), quoted});
    word.clear();
    quoted = false;
    st = state::blank;
  };

  for (size_t i = 0; i < command.size(); ++i) {
    char c = command[i];

    if (escape) {
      escape = false;
      if (c == '\n') continue;  // line continuation
      if (st == state::double_quoted) {
        if (!dquote_escapable(c)) word += '\\';
      } else {
        st = state::unquoted;
      }
      word += c;
      quoted = true;
      continue;
    }

    switch (st) {
      case state::blank:
        if (utils::is_blank(c)) break;
        if (c == '\\') {
          escape = true;
          escape_start = i;
          break;
        }
        st = state::unquoted;
        [[fallthrough]];
      case state::unquoted:
        if (utils::is_blank(c)) {
          finish();
        } else if (c == '\\') {
          escape = true;
          escape_start = i;
        } else if (c == '\'') {
          st = state::single_quoted;
          quote_start = i;
          quoted = true;
        } else if (c == '"') {
          st = state::double_quoted;
          quote_start = i;
          quoted = true;
        } else {
          word += c;
        }
        break;
      case state::single_quoted:
        if (c == '\'')
          st = state::unquoted;
        else
          word += c;
        break;
      case state::double_quoted:
        if (c == '"') {
          st = state::unquoted;
        } else if (c == '\\') {
          escape = true;
          escape_start = i;
        } else {
          word += c;
        }
        break;
    }
  }

  if (escape)
    utils::throwf_with<malformed_command>(
        escape_start, "Dangling backslash at offset {}", escape_start);
  if (st == state::single_quoted)
    utils::throwf_with<malformed_command>(
        quote_start, "Unterminated single quote at offset {}", quote_start);
  if (st == state::double_quoted)
    utils::throwf_with<malformed_command>(
        quote_start, "Unterminated double quote at offset {}", quote_start);
  if (st == state::unquoted) finish();

  LOG_TRACE("Split '{}' into {} tokens", command, tokens.size());
  return tokens;
}

token_list to_tokens(const std::vector<std::string>& words) {
  token_list tokens;
  tokens.reserve(words.size());
  for (const auto& w : words) tokens.push_back({w, false});
  return tokens;
}

}  // namespace ccjfix
