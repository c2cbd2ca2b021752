#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ccjfix {

struct token {
  std::string value;
  bool quoted{};  // source used quotes or escapes; a serialization hint only

  friend bool operator==(const token& a, const token& b) {
    return a.value == b.value;
  }
};

using token_list = std::vector<token>;

/** @brief Split @p command into words the way a POSIX shell would.
 *
 * Handles blanks, single quotes, double quotes and backslash escapes.
 * Throws @c malformed_command on an unterminated quote or a trailing
 * backslash.  An empty or blank command yields no tokens.
 */
token_list tokenize(std::string_view command);

/// True if @p word must be quoted to survive a trip through the shell.
bool needs_quoting(std::string_view word);

/// Single-quote @p word if needed, escaping embedded single quotes.
std::string quote(std::string_view word);

/** @brief Join @p tokens into one command string.
 *
 * Inverse of tokenize(): `tokenize(serialize(t)) == t` always holds.
 */
std::string serialize(const token_list& tokens);

token_list to_tokens(const std::vector<std::string>& words);
std::vector<std::string> to_words(const token_list& tokens);

}  // namespace ccjfix
