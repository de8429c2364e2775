#include "utils/vsh_filesystem.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <system_error>

namespace vsh_filesystem {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::IsADirectory:
            return "IsADirectory";
        case ErrorKind::NotADirectory:
            return "NotADirectory";
        case ErrorKind::AlreadyExists:
            return "AlreadyExists";
        case ErrorKind::NotEmpty:
            return "NotEmpty";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
        case ErrorKind::IoError:
        default:
            return "IoError";
    }
}

const char* error_kind_description(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
            return "No such file or directory";
        case ErrorKind::IsADirectory:
            return "Is a directory";
        case ErrorKind::NotADirectory:
            return "Not a directory";
        case ErrorKind::AlreadyExists:
            return "File exists";
        case ErrorKind::NotEmpty:
            return "Directory not empty";
        case ErrorKind::InvalidArgument:
            return "Invalid argument";
        case ErrorKind::IoError:
        default:
            return "Input/output error";
    }
}

Result<int> FileOperations::safe_open(const std::string& path, int flags, mode_t mode) {
    int fd = ::open(path.c_str(), flags, mode);
    if (fd == -1) {
        return Result<int>::error("Failed to open file '" + path +
                                  "': " + std::string(strerror(errno)));
    }
    return Result<int>::ok(fd);
}

void FileOperations::safe_close(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

Result<void> FileOperations::write_file_content(const std::string& path,
                                                const std::string& content) {
    auto open_result = safe_open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (open_result.is_error()) {
        return Result<void>::error(open_result.error());
    }

    int fd = open_result.value();
    size_t total = 0;
    while (total < content.length()) {
        ssize_t written = ::write(fd, content.data() + total, content.length() - total);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = strerror(errno);
            safe_close(fd);
            return Result<void>::error("Failed to write to file '" + path + "': " + reason);
        }
        total += static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        std::string reason = strerror(errno);
        safe_close(fd);
        return Result<void>::error("Failed to flush file '" + path + "': " + reason);
    }

    safe_close(fd);
    return Result<void>::ok();
}

Result<void> FileOperations::write_file_atomic(const std::string& path,
                                               const std::string& content) {
    std::string temp_path = path + ".tmp." + std::to_string(::getpid());

    auto write_result = write_file_content(temp_path, content);
    if (write_result.is_error()) {
        ::unlink(temp_path.c_str());
        return write_result;
    }

    if (::rename(temp_path.c_str(), path.c_str()) != 0) {
        std::string reason = strerror(errno);
        ::unlink(temp_path.c_str());
        return Result<void>::error("Failed to replace '" + path + "': " + reason);
    }

    return Result<void>::ok();
}

Result<std::string> FileOperations::read_file_content(const std::string& path) {
    auto open_result = safe_open(path, O_RDONLY);
    if (open_result.is_error()) {
        return Result<std::string>::error(open_result.error());
    }

    int fd = open_result.value();
    std::string content;
    char buffer[4096];
    ssize_t bytes_read;

    while ((bytes_read = ::read(fd, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, bytes_read);
    }

    safe_close(fd);

    if (bytes_read < 0) {
        return Result<std::string>::error("Failed to read from file '" + path +
                                          "': " + std::string(strerror(errno)));
    }

    return Result<std::string>::ok(content);
}

fs::path user_home_path() {
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0') {
        return fs::path("/tmp");
    }
    return fs::path(home);
}

fs::path vsh_config_path() {
    return user_home_path() / ".config" / "vsh";
}

fs::path vsh_data_path() {
    return user_home_path() / ".local" / "share" / "vsh";
}

fs::path vsh_cache_path() {
    return user_home_path() / ".cache" / "vsh";
}

fs::path default_config_file_path() {
    return vsh_config_path() / "config.json";
}

fs::path default_store_path() {
    return vsh_data_path() / "vfs.json";
}

bool initialize_vsh_directories() {
    try {
        fs::create_directories(vsh_config_path());
        fs::create_directories(vsh_data_path());
        fs::create_directories(vsh_cache_path());
        return true;
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Error creating vsh directories: " << e.what() << std::endl;
        return false;
    }
}

}  // namespace vsh_filesystem
