#pragma once

#include <string>
#include <utility>
#include <cstdint>

namespace snipguard {

enum class ErrorCode {
    OK = 0,
    INTERPRETER_ERROR,
    NAMESPACE_ERROR,
    CONVERSION_ERROR,
    INVALID_CONFIG,
    INVALID_ARGUMENT,
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INTERNAL_ERROR,
    UNKNOWN
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    std::string file;
    int line;
    uint64_t timestamp;
    
    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), line(0), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), line(0), timestamp(0) {}
    Error(ErrorCode c, ErrorSeverity s, const std::string& msg, const std::string& ctx,
          const std::string& f, int l, uint64_t ts)
        : code(c), severity(s), message(msg), context(ctx), file(f), line(l), timestamp(ts) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}
    
    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }
    
    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }
    
private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}
    
    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }
    
private:
    Error error_;
    bool hasValue_;
};

const char* errorToString(ErrorCode code);
const char* severityToString(ErrorSeverity severity);

// "<code>: <message> [<context>]", used when an Error ends up in a log line.
std::string formatError(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define SNIPGUARD_ERROR(code, msg) snipguard::Error{code, snipguard::ErrorSeverity::ERROR, msg, "", __FILE__, __LINE__, 0}
#define SNIPGUARD_CHECK(expr, code, msg) if (!(expr)) return snipguard::Result<void>(SNIPGUARD_ERROR(code, msg))

}
