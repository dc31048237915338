#pragma once

#include <tmd/core_types.hpp>
#include <tmd/result.hpp>

#include <filesystem>

namespace tmd {

namespace fs = std::filesystem;

Result<Bytes> read_file(const fs::path& path);

/**
 * Write to a uniquely named sibling file, flush, then rename over path,
 * so readers never observe a partially written file.
 */
Result<void> write_file_atomic(const fs::path& path, const uint8_t* data, size_t size);

inline Result<void> write_file_atomic(const fs::path& path, const Bytes& data) {
    return write_file_atomic(path, data.data(), data.size());
}

}  // namespace tmd
