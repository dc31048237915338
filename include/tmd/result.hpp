#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace tmd {

// Error codes for container, attachment and database operations
enum class ErrorCode {
    OK = 0,
    IO_ERROR,
    INVALID_FORMAT,     // Structural problem in a .tmd/.tmdz byte source
    UNSUPPORTED,        // Well-formed but outside what the codec handles (zip64, deflate, ...)
    ALREADY_EXISTS,
    NOT_FOUND,
    INVALID_PATH,       // Logical path failed normalization
    LENGTH_MISMATCH,
    DIGEST_MISMATCH,
    DB_ERROR,
    VERSION_MISMATCH,   // Migration attempted from the wrong user_version
    INVALID_SCHEMA,
    INVALID_ARGUMENT,
    INTERNAL_ERROR
};

// Broad families used by callers that only care where a failure came from
enum class ErrorKind {
    NONE,
    IO,
    FORMAT,
    ATTACHMENT,
    DATABASE,
    OTHER
};

// Error with code and message
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    ErrorKind kind() const { return kind_of(code_); }

    /**
     * Copy of this error with "context: " prepended to the message.
     */
    Error with_context(const std::string& context) const {
        if (message_.empty()) {
            return Error(code_, context);
        }
        return Error(code_, context + ": " + message_);
    }

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::INVALID_FORMAT: return "INVALID_FORMAT";
            case ErrorCode::UNSUPPORTED: return "UNSUPPORTED";
            case ErrorCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::INVALID_PATH: return "INVALID_PATH";
            case ErrorCode::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
            case ErrorCode::DIGEST_MISMATCH: return "DIGEST_MISMATCH";
            case ErrorCode::DB_ERROR: return "DB_ERROR";
            case ErrorCode::VERSION_MISMATCH: return "VERSION_MISMATCH";
            case ErrorCode::INVALID_SCHEMA: return "INVALID_SCHEMA";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            default: return "UNKNOWN";
        }
    }

    static ErrorKind kind_of(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK:
                return ErrorKind::NONE;
            case ErrorCode::IO_ERROR:
                return ErrorKind::IO;
            case ErrorCode::INVALID_FORMAT:
            case ErrorCode::UNSUPPORTED:
                return ErrorKind::FORMAT;
            case ErrorCode::ALREADY_EXISTS:
            case ErrorCode::NOT_FOUND:
            case ErrorCode::INVALID_PATH:
            case ErrorCode::LENGTH_MISMATCH:
            case ErrorCode::DIGEST_MISMATCH:
                return ErrorKind::ATTACHMENT;
            case ErrorCode::DB_ERROR:
            case ErrorCode::VERSION_MISMATCH:
            case ErrorCode::INVALID_SCHEMA:
                return ErrorKind::DATABASE;
            default:
                return ErrorKind::OTHER;
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::move(value)) {}

    // Error constructors
    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    // Access error (throws if success)
    const Error& error() const {
        if (!ok()) {
            return std::get<Error>(data_);
        }
        throw std::logic_error("Result has no error");
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    // Pointer-like access
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

// Helper for creating successful void results
inline Result<void> Ok() { return Result<void>(); }

}  // namespace tmd
