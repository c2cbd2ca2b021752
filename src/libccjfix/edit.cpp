#include "ccjfix/edit.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "ccjfix/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace ccjfix {

namespace {

template <typename Pred>
token_list drop_include_flags(
    token_list tokens, const classifier_options& options, Pred pred) {
  std::vector<bool> doomed(tokens.size());
  size_t n{};
  for (auto&& f : classify(tokens, options)) {
    if (!pred(f)) continue;
    LOG_DEBUG(
        "Dropping '{}' include of '{}' at tokens [{}, {})", f.prefix, f.path,
        f.begin, f.end);
    std::fill(
        doomed.begin() + static_cast<std::ptrdiff_t>(f.begin),
        doomed.begin() + static_cast<std::ptrdiff_t>(f.end), true);
    ++n;
  }
  if (!n) return tokens;

  token_list res;
  res.reserve(tokens.size());
  for (size_t i = 0; i < tokens.size(); ++i)
    if (!doomed[i]) res.push_back(std::move(tokens[i]));
  return res;
}

// RE2 is neither copyable nor movable, hence the pointer
std::unique_ptr<RE2> compile_pattern(const std::string& pattern) {
  auto re = std::make_unique<RE2>(pattern, RE2::Quiet);
  if (!re->ok())
    utils::throwf<invalid_pattern>(
        "Bad include pattern '{}': {}", pattern, re->error());
  return re;
}

}  // namespace

token_list apply_edit(
    token_list tokens, const edit_operation& op,
    const classifier_options& options) {
  return std::visit(
      [&](auto&& o) -> token_list {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, add_include>) {
          auto wanted = normalize_path(o.path);
          for (auto&& f : classify(tokens, options)) {
            if (normalize_path(f.path) == wanted) {
              LOG_DEBUG("'{}' already included as '{}'", o.path, f.path);
              return std::move(tokens);
            }
          }
          const auto& form = options.canonical_form();
          if (form.arity == 2) {
            tokens.push_back({form.prefix, false});
            tokens.push_back({o.path, needs_quoting(o.path)});
          } else {
            auto joined = form.prefix + o.path;
            tokens.push_back({joined, needs_quoting(joined)});
          }
          return std::move(tokens);
        } else if constexpr (std::is_same_v<T, remove_include>) {
          auto doomed = normalize_path(o.path);
          return drop_include_flags(
              std::move(tokens), options, [&](const include_flag& f) {
                return normalize_path(f.path) == doomed;
              });
        } else if constexpr (std::is_same_v<T, remove_include_matching>) {
          std::shared_ptr<const RE2> re = o.compiled;
          if (!re) re = compile_pattern(o.pattern);
          return drop_include_flags(
              std::move(tokens), options, [&](const include_flag& f) {
                return RE2::FullMatch(f.path, *re);
              });
        } else if constexpr (std::is_same_v<T, add_argument>) {
          if (std::ranges::find(tokens, o.arg, &token::value) == tokens.end())
            tokens.push_back({o.arg, needs_quoting(o.arg)});
          return std::move(tokens);
        } else {
          static_assert(std::is_same_v<T, remove_argument>);
          std::erase_if(tokens, [&](const token& t) { return t.value == o.arg; });
          return std::move(tokens);
        }
      },
      op);
}

token_list apply_edits(
    token_list tokens, std::span<const edit_operation> ops,
    const classifier_options& options) {
  for (const auto& op : ops) tokens = apply_edit(std::move(tokens), op, options);
  return tokens;
}

void validate(std::span<edit_operation> ops) {
  for (auto& op : ops) {
    std::visit(
        [&](auto&& o) {
          using T = std::decay_t<decltype(o)>;
          if constexpr (std::is_same_v<T, remove_include_matching>) {
            if (!o.compiled) o.compiled = compile_pattern(o.pattern);
          } else if constexpr (
              std::is_same_v<T, add_include> ||
              std::is_same_v<T, remove_include>) {
            if (o.path.empty()) utils::throwf<error>("Empty include path");
            if (o.path.starts_with('-'))
              utils::throwf<error>(
                  "Include path '{}' would be read as a flag", o.path);
          } else {
            if (o.arg.empty()) utils::throwf<error>("Empty argument");
          }
        },
        op);
  }
}

std::string describe(const edit_operation& op) {
  return std::visit(
      [](auto&& o) -> std::string {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, add_include>)
          return fmt::format("add include '{}'", o.path);
        else if constexpr (std::is_same_v<T, remove_include>)
          return fmt::format("remove include '{}'", o.path);
        else if constexpr (std::is_same_v<T, remove_include_matching>)
          return fmt::format("remove includes matching '{}'", o.pattern);
        else if constexpr (std::is_same_v<T, add_argument>)
          return fmt::format("add argument '{}'", o.arg);
        else
          return fmt::format("remove argument '{}'", o.arg);
      },
      op);
}

}  // namespace ccjfix
