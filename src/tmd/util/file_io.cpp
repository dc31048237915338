#include <tmd/util/file_io.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <unistd.h>

namespace tmd {

Result<Bytes> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR,
                     "cannot open '" + path.string() + "': " + std::strerror(errno));
    }

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    if (size < 0) {
        return Error(ErrorCode::IO_ERROR, "cannot determine size of '" + path.string() + "'");
    }
    file.seekg(0, std::ios::beg);

    Bytes data(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        return Error(ErrorCode::IO_ERROR, "failed to read '" + path.string() + "'");
    }
    return data;
}

Result<void> write_file_atomic(const fs::path& path, const uint8_t* data, size_t size) {
    fs::path dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    std::string tmpl = (dir / ("." + path.filename().string() + ".tmp-XXXXXX")).string();

    int fd = mkstemp(&tmpl[0]);
    if (fd == -1) {
        return Error(ErrorCode::IO_ERROR,
                     "cannot create temporary file in '" + dir.string() + "': " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string msg = std::strerror(errno);
            ::close(fd);
            ::unlink(tmpl.c_str());
            return Error(ErrorCode::IO_ERROR, "failed to write '" + tmpl + "': " + msg);
        }
        written += static_cast<size_t>(n);
    }

    int sync_rc = ::fsync(fd);
    int sync_errno = errno;
    int close_rc = ::close(fd);
    if (sync_rc != 0 || close_rc != 0) {
        std::string msg = std::strerror(sync_rc != 0 ? sync_errno : errno);
        ::unlink(tmpl.c_str());
        return Error(ErrorCode::IO_ERROR, "failed to flush '" + tmpl + "': " + msg);
    }

    std::error_code ec;
    fs::rename(tmpl, path, ec);
    if (ec) {
        ::unlink(tmpl.c_str());
        return Error(ErrorCode::IO_ERROR,
                     "failed to move '" + tmpl + "' to '" + path.string() + "': " + ec.message());
    }
    return Ok();
}

}  // namespace tmd
