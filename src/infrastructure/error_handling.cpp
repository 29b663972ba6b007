#include "infrastructure/error_handling.h"
#include <ctime>

namespace snipguard {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INTERPRETER_ERROR: return "Interpreter error";
        case ErrorCode::NAMESPACE_ERROR: return "Namespace error";
        case ErrorCode::CONVERSION_ERROR: return "Conversion error";
        case ErrorCode::INVALID_CONFIG: return "Invalid configuration";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::PARSE_ERROR: return "Parse error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string formatError(const Error& error) {
    std::string out = errorToString(error.code);
    if (!error.message.empty()) {
        out += ": " + error.message;
    }
    if (!error.context.empty()) {
        out += " [" + error.context + "]";
    }
    return out;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

}
