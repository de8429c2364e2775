#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

// host-side paths and the error plumbing shared by the virtual filesystem
namespace vsh_filesystem {
namespace fs = std::filesystem;

enum class ErrorKind : std::uint8_t {
    NotFound,
    IsADirectory,
    NotADirectory,
    AlreadyExists,
    NotEmpty,
    InvalidArgument,
    IoError
};

const char* error_kind_name(ErrorKind kind);
const char* error_kind_description(ErrorKind kind);

// Error type for Result
struct Error {
    ErrorKind kind;
    std::string message;
    explicit Error(const std::string& msg) : kind(ErrorKind::IoError), message(msg) {
    }
    Error(ErrorKind k, const std::string& msg) : kind(k), message(msg) {
    }
};

// Result template for safe error handling
template <typename T>
class Result {
   public:
    explicit Result(T value) : value_(std::move(value)), has_value_(true) {
    }
    explicit Result(const Error& error)
        : error_(error.message), kind_(error.kind), has_value_(false) {
    }

    static Result<T> ok(T value) {
        return Result<T>(std::move(value));
    }
    static Result<T> error(const std::string& message) {
        return Result<T>(Error(message));
    }
    static Result<T> error(ErrorKind kind, const std::string& message) {
        return Result<T>(Error(kind, message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const T& value() const {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result: " + error_);
        return value_;
    }

    T& value() {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result: " + error_);
        return value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

    ErrorKind kind() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return kind_;
    }

   private:
    T value_{};
    std::string error_;
    ErrorKind kind_ = ErrorKind::IoError;
    bool has_value_;
};

// Specialization for void
template <>
class Result<void> {
   public:
    Result() : has_value_(true) {
    }
    explicit Result(const Error& error)
        : error_(error.message), kind_(error.kind), has_value_(false) {
    }

    static Result<void> ok() {
        return Result<void>();
    }
    static Result<void> error(const std::string& message) {
        return Result<void>(Error(message));
    }
    static Result<void> error(ErrorKind kind, const std::string& message) {
        return Result<void>(Error(kind, message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

    ErrorKind kind() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return kind_;
    }

   private:
    std::string error_;
    ErrorKind kind_ = ErrorKind::IoError;
    bool has_value_;
};

// Builds "<path>: <description>" errors the way every vfs operation reports them
template <typename T = void>
Result<T> fail(ErrorKind kind, const std::string& path) {
    return Result<T>::error(kind, path + ": " + error_kind_description(kind));
}

// Propagates an error from a Result of a different value type
template <typename T, typename U>
Result<T> forward_error(const Result<U>& other) {
    return Result<T>::error(other.kind(), other.error());
}

class FileOperations {
   public:
    static Result<int> safe_open(const std::string& path, int flags, mode_t mode = 0644);
    static void safe_close(int fd);

    static Result<std::string> read_file_content(const std::string& path);
    static Result<void> write_file_content(const std::string& path, const std::string& content);
    // writes to a sibling temp file and renames it over the target
    static Result<void> write_file_atomic(const std::string& path, const std::string& content);
};

// ALL STORED IN FULL PATHS
fs::path user_home_path();
fs::path vsh_config_path();  // ~/.config/vsh
fs::path vsh_data_path();    // ~/.local/share/vsh
fs::path vsh_cache_path();   // ~/.cache/vsh

fs::path default_config_file_path();
fs::path default_store_path();

bool initialize_vsh_directories();
}  // namespace vsh_filesystem
