#include "python/outcome.h"
#include <algorithm>
#include <cctype>

namespace snipguard {
namespace python {

namespace {

bool mentions(const std::string& lowered, const char* word) {
    return lowered.find(word) != std::string::npos;
}

}

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EMPTY_CODE: return "EmptyCode";
        case ErrorKind::SYNTAX_ERROR: return "SyntaxError";
        case ErrorKind::NAME_ERROR: return "NameError";
        case ErrorKind::KEY_ERROR: return "KeyError";
        case ErrorKind::ATTRIBUTE_ERROR: return "AttributeError";
        case ErrorKind::IMPORT_ERROR: return "ImportError";
        case ErrorKind::VALUE_ERROR: return "ValueError";
        case ErrorKind::TYPE_ERROR: return "TypeError";
        case ErrorKind::INDEX_ERROR: return "IndexError";
        case ErrorKind::TIMEOUT_ERROR: return "TimeoutError";
        case ErrorKind::MEMORY_LIMIT_ERROR: return "MemoryLimitError";
        case ErrorKind::POLICY_VIOLATION: return "PolicyViolation";
        case ErrorKind::RUNTIME_ERROR: return "RuntimeError";
    }
    return "RuntimeError";
}

std::string suggestionFor(ErrorKind kind, const std::string& message) {
    switch (kind) {
        case ErrorKind::EMPTY_CODE:
            return "Provide non-empty code to execute.";
        case ErrorKind::SYNTAX_ERROR:
            return "Check the code syntax, especially string quotes and escape characters.";
        case ErrorKind::NAME_ERROR:
            return "Check variable names for typos and make sure every variable is defined before use.";
        case ErrorKind::KEY_ERROR:
            return "Check that the dictionary key or DataFrame column name exists.";
        case ErrorKind::ATTRIBUTE_ERROR:
            return "Check that the object actually has the attribute or method being used.";
        case ErrorKind::IMPORT_ERROR:
            return "Check that the module is installed and permitted in this sandbox profile.";
        case ErrorKind::VALUE_ERROR:
            return "Check data type conversions and numeric ranges, including division by zero.";
        case ErrorKind::TYPE_ERROR:
            return "Check the types and number of arguments passed to each function.";
        case ErrorKind::INDEX_ERROR:
            return "Check that list or array indices are within range.";
        case ErrorKind::TIMEOUT_ERROR:
            return "Execution timed out. Optimize the code or raise the time limit.";
        case ErrorKind::MEMORY_LIMIT_ERROR:
            return "Memory limit exceeded. Work on a smaller slice of the data or raise the memory limit.";
        case ErrorKind::POLICY_VIOLATION:
            return "Remove the constructs flagged by the static policy check, or run under the permissive profile.";
        case ErrorKind::RUNTIME_ERROR:
            break;
    }
    
    std::string lowered = message;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (mentions(lowered, "pandas")) return "pandas operation failed. Check DataFrame operations and column names.";
    if (mentions(lowered, "numpy")) return "numpy operation failed. Check array shapes and dtypes.";
    if (mentions(lowered, "permission")) return "Permission denied. Check file access permissions.";
    if (mentions(lowered, "memory")) return "Out of memory. Try working on a smaller dataset.";
    if (mentions(lowered, "timeout")) return "Operation timed out. Optimize the code or raise the time limit.";
    return "Code execution failed. Check the code logic and syntax.";
}

double ExecutionOutcome::elapsedSeconds() const {
    return ok() ? success().elapsedSeconds : failure().elapsedSeconds;
}

const std::string& ExecutionOutcome::output() const {
    return ok() ? success().output : failure().output;
}

}
}
