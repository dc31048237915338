#pragma once

#include <tmd/result.hpp>

namespace tmd::cli {

// Standard exit codes for CLI commands
// Named with TMD_ prefix to avoid conflict with system macros
constexpr int TMD_EXIT_SUCCESS = 0;
constexpr int TMD_EXIT_USER_ERROR = 1;     // Invalid arguments, usage errors
constexpr int TMD_EXIT_NOT_FOUND = 2;      // File/attachment not found
constexpr int TMD_EXIT_IO_ERROR = 3;       // I/O, format, attachment or database errors
constexpr int TMD_EXIT_INTERNAL = 4;       // Internal/unexpected errors

inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::NOT_FOUND:
            return TMD_EXIT_NOT_FOUND;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::INVALID_PATH:
            return TMD_EXIT_USER_ERROR;
        case ErrorCode::INTERNAL_ERROR:
            return TMD_EXIT_INTERNAL;
        default:
            return TMD_EXIT_IO_ERROR;
    }
}

}  // namespace tmd::cli
