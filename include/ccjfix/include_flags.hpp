#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "ccjfix/command_line.hpp"

namespace ccjfix {

/** @brief One accepted spelling of an include-directory option.
 *
 * @c arity 1 is the joined form (@c -Ifoo), @c arity 2 the split form
 * (@c -I @c foo).  A prefix accepted in both forms appears twice.
 */
struct flag_form {
  std::string prefix;
  int arity{};
};

struct classifier_options {
  std::vector<flag_form> forms{
    {"-I", 1},
    {"-I", 2},
    {"-isystem", 1},
    {"-isystem", 2},
  };

  /// Options whose next token is their value and is never classified,
  /// e.g. the object file in @c -o @c -Ifoo.o.
  std::vector<std::string> value_options{
    "-o",       "-MF",      "-MT",       "-MQ",        "-x",
    "-D",       "-U",       "-include",  "-imacros",   "-iquote",
    "-idirafter", "-iprefix", "-isysroot", "--sysroot", "-target",
    "-arch",    "-Xlinker", "-Xassembler",
  };

  /** Options handing their value to another compiler stage.  An include
   * flag behind one (@c -Xclang @c -I/x) is classified together with it,
   * so removing it never leaves the option without a value.
   */
  std::vector<std::string> forwarding_options{
    "-Xclang",
    "-Xpreprocessor",
    "-Xcompiler",
  };

  /// Form used when a flag has to be added: the first split form, or the
  /// first form at all if the table has no split forms.
  [[nodiscard]] const flag_form& canonical_form() const;

  /// Table accepting each of @p prefixes in both forms, keeping the
  /// default value and forwarding options.
  static classifier_options from_prefixes(
      const std::vector<std::string>& prefixes);
};

struct include_flag {
  std::string prefix;
  std::string path;
  bool joined{};
  size_t begin{};  // first token of the span
  size_t end{};    // one past the last token
};

/** @brief Find every include-directory flag in @p tokens.
 *
 * Only matches at the start of a token, and never on the value of one of
 * the @c value_options.  Throws @c ambiguous_flag when a split-form flag
 * has no usable value after it, or when a forwarded split-form flag isn't
 * followed by its forwarded path.
 */
std::vector<include_flag> classify(
    const token_list& tokens, const classifier_options& options = {});

/// Strip trailing '/' separators, keeping a lone "/".
std::string normalize_path(std::string_view path);

}  // namespace ccjfix
