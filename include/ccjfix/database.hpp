#pragma once

#include <boost/json.hpp>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "ccjfix/edit.hpp"
#include "ccjfix/include_flags.hpp"

namespace ccjfix {

namespace json = boost::json;

struct entry_error {
  size_t index{};
  std::string file;  // "<unknown>" when the entry has no usable "file"
  std::string message;
};

struct edit_report {
  size_t changed{};
  size_t unchanged{};
  std::vector<entry_error> errors;

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

/** @brief Apply @p ops to one compilation database entry in place.
 *
 * The entry keeps its shape: an "arguments" entry stays an array, a
 * "command" entry stays a string.  When neither the tokens nor the shape
 * change, the entry is left byte-for-byte alone.  Returns whether the
 * entry was modified.  Throws on a malformed entry or command, leaving
 * @p entry untouched.
 */
bool edit_entry(
    json::object& entry, std::span<const edit_operation> ops,
    const classifier_options& options = {});

/** @brief Apply @p ops to every entry of @p entries.
 *
 * Errors are recorded per entry and never stop the run; entries that fail
 * are left untouched.  Entry order is preserved.
 */
edit_report edit_database(
    json::array& entries, std::span<const edit_operation> ops,
    const classifier_options& options = {});

}  // namespace ccjfix
