#pragma once

#include <tmd/core_types.hpp>
#include <tmd/result.hpp>

#include <string>

namespace tmd {

/**
 * Normalize a logical attachment path.
 *
 * Backslashes become '/', "." segments and repeated separators are
 * dropped. Fails with INVALID_PATH for an empty result, a leading
 * separator, any ".." segment, or an embedded NUL.
 *
 *     normalize_logical_path("a/./b")             -> "a/b"
 *     normalize_logical_path("images/../secret")  -> INVALID_PATH
 *     normalize_logical_path("/abs/path")         -> INVALID_PATH
 */
Result<LogicalPath> normalize_logical_path(const std::string& input);

// True if input is already in normalized form
bool is_normalized_logical_path(const std::string& input);

}  // namespace tmd
