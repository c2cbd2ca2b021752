#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <span>

#include "ccjfix/edit.hpp"
#include "options.hpp"

namespace ccjfix {

/// The database named on the command line, or the one in the current
/// directory.
std::filesystem::path resolve_input(const file_options& fopts);

/** @brief Edit the database described by @p fopts and apply the write
 * policy.
 *
 * Without @c best_effort any failed entry means nothing is written and
 * the result is 1.  With @c dry_run the edited database goes to stdout,
 * or into @p json_result as @c compile_commands, instead of to disk.
 * When @p json_result is given it also receives the paths, the report
 * and whether anything was @c written.  Throws on invalid operations and
 * I/O failures.
 */
int run(
    const file_options& fopts, const edit_options& eopts,
    std::span<edit_operation> ops, boost::json::object* json_result);

}  // namespace ccjfix
