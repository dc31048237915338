#include <tmd/util/path.hpp>

#include <algorithm>
#include <vector>

namespace tmd {

Result<LogicalPath> normalize_logical_path(const std::string& input) {
    if (input.empty()) {
        return Error(ErrorCode::INVALID_PATH, "logical path must not be empty");
    }
    if (input.find('\0') != std::string::npos) {
        return Error(ErrorCode::INVALID_PATH, "logical path must not contain NUL");
    }

    std::string path = input;
    std::replace(path.begin(), path.end(), '\\', '/');

    if (path.front() == '/') {
        return Error(ErrorCode::INVALID_PATH,
                     "logical path '" + input + "' must not start with '/'");
    }

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string segment = path.substr(start, end - start);
        start = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            return Error(ErrorCode::INVALID_PATH,
                         "logical path '" + input + "' must not contain '..'");
        }
        segments.push_back(std::move(segment));
    }

    if (segments.empty()) {
        return Error(ErrorCode::INVALID_PATH,
                     "logical path '" + input + "' resolves to empty");
    }

    std::string out = segments.front();
    for (size_t i = 1; i < segments.size(); ++i) {
        out += '/';
        out += segments[i];
    }
    return out;
}

bool is_normalized_logical_path(const std::string& input) {
    auto normalized = normalize_logical_path(input);
    return normalized.ok() && normalized.value() == input;
}

}  // namespace tmd
