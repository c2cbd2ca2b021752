#pragma once

#include <memory>
#include <span>
#include <string>
#include <variant>

#include "ccjfix/command_line.hpp"
#include "ccjfix/include_flags.hpp"

namespace re2 {
class RE2;
}

namespace ccjfix {

struct add_include {
  std::string path;
};

struct remove_include {
  std::string path;
};

/// Remove include flags whose path fully matches an RE2 pattern.
struct remove_include_matching {
  std::string pattern;
  std::shared_ptr<const re2::RE2> compiled{};  // set by validate()
};

struct add_argument {
  std::string arg;
};

struct remove_argument {
  std::string arg;
};

using edit_operation = std::variant<
    add_include, remove_include, remove_include_matching, add_argument,
    remove_argument>;

/** @brief Apply one edit to @p tokens and return the result.
 *
 * Additions are idempotent and append at the end; removals of something
 * absent leave the tokens unchanged.  Tokens outside the affected spans
 * keep their relative order.
 */
token_list apply_edit(
    token_list tokens, const edit_operation& op,
    const classifier_options& options = {});

/// Apply @p ops in order, each to the result of the previous one.
token_list apply_edits(
    token_list tokens, std::span<const edit_operation> ops,
    const classifier_options& options = {});

/** @brief Throw if an operation in @p ops can't be applied at all.
 *
 * Rejects an empty value or an include path that reads as a flag with
 * @c error, and a regex that won't compile with @c invalid_pattern.
 * Patterns are compiled here once and kept in their operation, so
 * applying it to many entries doesn't recompile them.
 */
void validate(std::span<edit_operation> ops);

std::string describe(const edit_operation& op);

}  // namespace ccjfix
