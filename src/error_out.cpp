#include "error_out.h"

#include <iostream>
#include <string>
#include <vector>

ErrorType error_type_for(vsh_filesystem::ErrorKind kind) {
    using vsh_filesystem::ErrorKind;
    switch (kind) {
        case ErrorKind::NotFound:
            return ErrorType::FILE_NOT_FOUND;
        case ErrorKind::AlreadyExists:
            return ErrorType::FILE_EXISTS;
        case ErrorKind::IsADirectory:
            return ErrorType::IS_A_DIRECTORY;
        case ErrorKind::NotADirectory:
            return ErrorType::NOT_A_DIRECTORY;
        case ErrorKind::NotEmpty:
            return ErrorType::DIRECTORY_NOT_EMPTY;
        case ErrorKind::InvalidArgument:
            return ErrorType::INVALID_ARGUMENT;
        case ErrorKind::IoError:
        default:
            return ErrorType::RUNTIME_ERROR;
    }
}

std::string format_error(const ErrorInfo& error) {
    std::string text;
    text += error.command_used.empty() ? std::string("vsh") : error.command_used;
    text += ": ";

    if (error.message.empty()) {
        switch (error.type) {
            case ErrorType::COMMAND_NOT_FOUND:
                text += "command not found";
                break;
            case ErrorType::SYNTAX_ERROR:
                text += "syntax error";
                break;
            case ErrorType::FILE_NOT_FOUND:
                text += "No such file or directory";
                break;
            case ErrorType::INVALID_ARGUMENT:
                text += "invalid argument";
                break;
            case ErrorType::RUNTIME_ERROR:
                text += "runtime error";
                break;
            default:
                text += "unknown error";
                break;
        }
    } else {
        text += error.message;
    }
    text += '\n';

    for (const auto& suggestion : error.suggestions) {
        text += suggestion;
        text += '\n';
    }
    return text;
}

void print_error(const ErrorInfo& error, const ErrorSink& sink) {
    if (sink) {
        sink(format_error(error));
    }
}

void print_error(const ErrorInfo& error) {
    std::cerr << format_error(error);
}

ErrorSeverity ErrorInfo::get_default_severity(ErrorType type) {
    switch (type) {
        case ErrorType::SYNTAX_ERROR:
            return ErrorSeverity::CRITICAL;
        case ErrorType::INVALID_ARGUMENT:
            return ErrorSeverity::WARNING;
        case ErrorType::COMMAND_NOT_FOUND:
        case ErrorType::FILE_NOT_FOUND:
        case ErrorType::RUNTIME_ERROR:
        case ErrorType::UNKNOWN_ERROR:
        default:
            return ErrorSeverity::ERROR;
    }
}
