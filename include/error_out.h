#pragma once

#include <functional>
#include <string>
#include <vector>

#include <cstdint>

#include "utils/vsh_filesystem.h"

enum class ErrorSeverity : std::uint8_t {
    INFO = 0,
    WARNING = 1,
    ERROR = 2,
    CRITICAL = 3
};

enum class ErrorType : std::uint8_t {
    COMMAND_NOT_FOUND,
    SYNTAX_ERROR,
    FILE_NOT_FOUND,
    FILE_EXISTS,
    IS_A_DIRECTORY,
    NOT_A_DIRECTORY,
    DIRECTORY_NOT_EMPTY,
    INVALID_ARGUMENT,
    RUNTIME_ERROR,
    UNKNOWN_ERROR
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string command_used;
    std::string message;
    std::vector<std::string> suggestions;

    ErrorInfo()
        : type(ErrorType::UNKNOWN_ERROR),
          severity(ErrorSeverity::ERROR),
          command_used(""),
          message(""),
          suggestions() {
    }

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd, const std::string& msg,
              const std::vector<std::string>& sugg)
        : type(t), severity(s), command_used(cmd), message(msg), suggestions(sugg) {
    }

    ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
              const std::vector<std::string>& sugg)
        : type(t),
          severity(get_default_severity(t)),
          command_used(cmd),
          message(msg),
          suggestions(sugg) {
    }

    static ErrorSeverity get_default_severity(ErrorType type);
};

using ErrorSink = std::function<void(const std::string&)>;

ErrorType error_type_for(vsh_filesystem::ErrorKind kind);

// "<command>: <message>" followed by one line per suggestion
std::string format_error(const ErrorInfo& error);

void print_error(const ErrorInfo& error, const ErrorSink& sink);
void print_error(const ErrorInfo& error);

template <typename T>
void print_error(const std::string& command, const vsh_filesystem::Result<T>& result,
                 const ErrorSink& sink) {
    print_error(ErrorInfo(error_type_for(result.kind()), command, result.error(), {}), sink);
}
