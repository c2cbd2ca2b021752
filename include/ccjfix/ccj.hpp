#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace ccjfix {

namespace fs = std::filesystem;
namespace json = boost::json;

std::optional<fs::path> find_ccj();

/** @brief Read a compilation database.
 *
 * A top-level object is taken as a database of one entry.  Throws
 * @c io_failure if the file can't be read or isn't an array or object.
 */
json::array load_compile_commands(const fs::path& compile_commands_path);

/// Two-space indented rendering, keys kept in their original order.
std::string to_pretty_string(const json::value& jv);

/** @brief Atomically replace @p compile_commands_path with @p entries.
 *
 * The content goes to a temporary file beside the destination which is
 * renamed over it only once fully written.  On failure the destination
 * is untouched and @c io_failure is thrown.
 */
void save_compile_commands(
    const fs::path& compile_commands_path, const json::array& entries);

}  // namespace ccjfix
