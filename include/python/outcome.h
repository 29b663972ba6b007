#pragma once

#include "python/python_value.h"
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace snipguard {
namespace python {

enum class ErrorKind {
    EMPTY_CODE,
    SYNTAX_ERROR,
    NAME_ERROR,
    KEY_ERROR,
    ATTRIBUTE_ERROR,
    IMPORT_ERROR,
    VALUE_ERROR,
    TYPE_ERROR,
    INDEX_ERROR,
    TIMEOUT_ERROR,
    MEMORY_LIMIT_ERROR,
    POLICY_VIOLATION,
    RUNTIME_ERROR
};

// "EmptyCode", "SyntaxError", ...
const char* errorKindToString(ErrorKind kind);

// Canned advice per kind. RUNTIME_ERROR picks by keywords in the message.
std::string suggestionFor(ErrorKind kind, const std::string& message);

struct ExecutionSuccess {
    std::string output;
    // Value bound to `result`; NONE when the snippet never assigned it.
    PythonValue returnValue;
    bool hasReturnValue = false;
    double elapsedSeconds = 0.0;
    std::map<std::string, PythonValue> locals;
};

struct ExecutionFailure {
    ErrorKind kind = ErrorKind::RUNTIME_ERROR;
    std::string exceptionType;
    std::string message;
    double elapsedSeconds = 0.0;
    std::string output;
    std::string suggestion;
    std::string trace;
    // MEMORY_LIMIT_ERROR only.
    uint64_t memoryLimitBytes = 0;
    uint64_t memoryUsedBytes = 0;
};

class ExecutionOutcome {
public:
    ExecutionOutcome(ExecutionSuccess success) : data_(std::move(success)) {}
    ExecutionOutcome(ExecutionFailure failure) : data_(std::move(failure)) {}
    
    bool ok() const { return std::holds_alternative<ExecutionSuccess>(data_); }
    bool failed() const { return !ok(); }
    
    // Throw std::bad_variant_access when called on the other alternative.
    const ExecutionSuccess& success() const { return std::get<ExecutionSuccess>(data_); }
    const ExecutionFailure& failure() const { return std::get<ExecutionFailure>(data_); }
    
    double elapsedSeconds() const;
    const std::string& output() const;
    
private:
    std::variant<ExecutionSuccess, ExecutionFailure> data_;
};

}
}
