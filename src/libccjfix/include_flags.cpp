#include "ccjfix/include_flags.hpp"

#include <algorithm>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "ccjfix/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace ccjfix {

const flag_form& classifier_options::canonical_form() const {
  if (forms.empty()) utils::throwf<error>("No include flag spelling configured");
  auto probe = std::ranges::find(forms, 2, &flag_form::arity);
  return probe != forms.end() ? *probe : forms.front();
}

classifier_options classifier_options::from_prefixes(
    const std::vector<std::string>& prefixes) {
  classifier_options res;
  res.forms.clear();
  for (const auto& p : prefixes) {
    if (p.empty()) utils::throwf<error>("Empty include flag prefix");
    res.forms.push_back({p, 1});
    res.forms.push_back({p, 2});
  }
  return res;
}

namespace {

using form_table = std::vector<const flag_form*>;

// Form spelled by token @p v, if any
const flag_form* match_form(const std::string& v, const form_table& forms) {
  for (const auto* f : forms) {
    if (f->prefix.empty() || !v.starts_with(f->prefix)) continue;
    if (f->arity == 2 && v.size() == f->prefix.size()) return f;
    if (f->arity == 1 && v.size() > f->prefix.size()) return f;
  }
  return nullptr;
}

// Check the path a split-form flag at @p flag_at finds at @p path_at
const std::string& split_path(
    const token_list& tokens, size_t flag_at, size_t path_at) {
  const std::string& v = tokens[flag_at].value;
  if (path_at >= tokens.size())
    utils::throwf_with<ambiguous_flag>(
        flag_at, "'{}' at token {} has no path after it", v, flag_at);
  const std::string& path = tokens[path_at].value;
  if (path.empty() || path.starts_with('-'))
    utils::throwf_with<ambiguous_flag>(
        path_at, "'{}' at token {} is followed by '{}', not a path", v,
        flag_at, path);
  return path;
}

bool listed(const std::vector<std::string>& options, const std::string& v) {
  return std::ranges::find(options, v) != options.end();
}

}  // namespace

std::vector<include_flag> classify(
    const token_list& tokens, const classifier_options& options) {
  // Longest prefix first so "-i" can never shadow "-isystem"
  form_table forms;
  forms.reserve(options.forms.size());
  for (const auto& f : options.forms) forms.push_back(&f);
  std::ranges::stable_sort(forms, std::greater{}, [](const flag_form* f) {
    return f->prefix.size();
  });

  std::vector<include_flag> flags;
  for (size_t i = 0; i < tokens.size(); ++i) {
    const std::string& v = tokens[i].value;

    if (const auto* f = match_form(v, forms)) {
      if (f->arity == 2) {
        flags.push_back({f->prefix, split_path(tokens, i, i + 1), false, i, i + 2});
        ++i;
      } else {
        flags.push_back({f->prefix, v.substr(f->prefix.size()), true, i, i + 1});
      }
      continue;
    }

    bool forwarding = listed(options.forwarding_options, v);
    if (!forwarding && !listed(options.value_options, v)) continue;
    if (i + 1 >= tokens.size()) break;

    const std::string& value = tokens[i + 1].value;
    const auto* f = forwarding ? match_form(value, forms) : nullptr;
    if (!f) {
      ++i;
      continue;
    }
    if (f->arity == 1) {
      flags.push_back(
          {f->prefix, value.substr(f->prefix.size()), true, i, i + 2});
      ++i;
      continue;
    }
    // "-Xclang -I -Xclang /x" forwards the path separately
    if (i + 2 >= tokens.size() || tokens[i + 2].value != v)
      utils::throwf_with<ambiguous_flag>(
          i + 1, "'{} {}' at token {} is not followed by '{}' and a path", v,
          value, i, v);
    flags.push_back(
        {f->prefix, split_path(tokens, i + 1, i + 3), false, i, i + 4});
    i += 3;
  }

  LOG_TRACE("Found {} include flags in {} tokens", flags.size(), tokens.size());
  return flags;
}

std::string normalize_path(std::string_view path) {
  while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
  return std::string{path};
}

}  // namespace ccjfix
