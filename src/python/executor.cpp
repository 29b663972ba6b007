#include "python/executor.h"
#include "python/guarded_region.h"
#include "python/interpreter.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>

namespace snipguard {
namespace python {

namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

// Largest megabyte count whose byte value fits in 64 bits.
constexpr uint64_t kMaxMemoryMb = UINT64_MAX >> 20;

bool isBlank(const std::string& code) {
    return std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

bool parseFlag(const std::string& text, bool& out) {
    std::string v = text;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") { out = true; return true; }
    if (v == "false" || v == "0" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

std::vector<std::string> concat(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<std::string> out(a);
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

ExecutionFailure makeFailure(ErrorKind kind, const std::string& exceptionType,
                             const std::string& message, Clock::time_point start) {
    ExecutionFailure f;
    f.kind = kind;
    f.exceptionType = exceptionType;
    f.message = message;
    f.suggestion = suggestionFor(kind, message);
    f.elapsedSeconds = secondsSince(start);
    return f;
}

ErrorKind classify(const PythonError& err) {
    if (err.matches(PyExc_SyntaxError)) return ErrorKind::SYNTAX_ERROR;
    if (err.matches(PyExc_NameError)) return ErrorKind::NAME_ERROR;
    if (err.matches(PyExc_KeyError)) return ErrorKind::KEY_ERROR;
    if (err.matches(PyExc_AttributeError)) return ErrorKind::ATTRIBUTE_ERROR;
    if (err.matches(PyExc_ImportError)) return ErrorKind::IMPORT_ERROR;
    if (err.matches(PyExc_ValueError)) return ErrorKind::VALUE_ERROR;
    if (err.matches(PyExc_ArithmeticError)) return ErrorKind::VALUE_ERROR;
    if (err.matches(PyExc_TypeError)) return ErrorKind::TYPE_ERROR;
    if (err.matches(PyExc_IndexError)) return ErrorKind::INDEX_ERROR;
    return ErrorKind::RUNTIME_ERROR;
}

struct Attempt {
    bool ok = false;
    bool setupFailed = false;
    Error setupError;
    SandboxNamespace ns;
};

// GIL held. On failure other than setup, the Python error stays pending.
void runText(const std::string& text, Attempt& attempt) {
    PyRef code;
    if (text.find('\0') != std::string::npos) {
        PyErr_SetString(PyExc_SyntaxError, "source code cannot contain null bytes");
    } else {
        code = PyRef::steal(Py_CompileStringExFlags(text.c_str(), "<snippet>", Py_file_input, nullptr, -1));
    }
    if (code) {
        PyRef value = PyRef::steal(PyEval_EvalCode(code.get(), attempt.ns.globals().get(), attempt.ns.locals().get()));
        attempt.ok = static_cast<bool>(value);
    }
}

}

const char* profileToString(SandboxProfile profile) {
    switch (profile) {
        case SandboxProfile::PERMISSIVE: return "permissive";
        case SandboxProfile::HARDENED: return "hardened";
    }
    return "unknown";
}

bool parseProfile(const std::string& name, SandboxProfile& out) {
    if (name == "permissive") { out = SandboxProfile::PERMISSIVE; return true; }
    if (name == "hardened") { out = SandboxProfile::HARDENED; return true; }
    return false;
}

ExecutorConfig ExecutorConfig::permissive() {
    ExecutorConfig cfg;
    cfg.profile = SandboxProfile::PERMISSIVE;
    cfg.enableStaticAnalysis = false;
    cfg.enforcePolicy = false;
    cfg.importMode = ImportMode::UNRESTRICTED;
    cfg.allowedModules = defaultPermissiveModules();
    cfg.allowedCallables = concat(coreBuiltins(), reflectiveBuiltins());
    cfg.policyRules = PolicyRules::permissive();
    return cfg;
}

ExecutorConfig ExecutorConfig::hardened() {
    ExecutorConfig cfg;
    cfg.profile = SandboxProfile::HARDENED;
    cfg.enableStaticAnalysis = true;
    cfg.enforcePolicy = true;
    cfg.importMode = ImportMode::ALLOW_LIST;
    cfg.allowedModules = defaultHardenedModules();
    cfg.allowedCallables = coreBuiltins();
    cfg.policyRules = PolicyRules::hardened();
    cfg.policyRules.allowedModules.insert(cfg.allowedModules.begin(), cfg.allowedModules.end());
    return cfg;
}

Result<ExecutorConfig> ExecutorConfig::fromConfig(const utils::Config& config) {
    utils::SandboxSettings sandbox = config.getSandboxSettings();
    utils::PolicySettings policy = config.getPolicySettings();
    
    SandboxProfile profile;
    if (!parseProfile(sandbox.profile, profile)) {
        return makeError(ErrorCode::INVALID_CONFIG, "unknown sandbox profile", "sandbox.profile=" + sandbox.profile);
    }
    ExecutorConfig out = profile == SandboxProfile::HARDENED ? hardened() : permissive();
    
    int64_t memoryMb = config.getInt64("sandbox.max_memory_mb", 2048);
    if (memoryMb <= 0 || static_cast<uint64_t>(memoryMb) > kMaxMemoryMb) {
        return makeError(ErrorCode::INVALID_CONFIG, "memory limit must be a positive number of megabytes",
                         "sandbox.max_memory_mb=" + std::to_string(memoryMb));
    }
    int64_t seconds = config.getInt64("sandbox.max_time_seconds", 120);
    if (seconds <= 0 || seconds > static_cast<int64_t>(UINT32_MAX)) {
        return makeError(ErrorCode::INVALID_CONFIG, "time limit must be a positive number of seconds",
                         "sandbox.max_time_seconds=" + std::to_string(seconds));
    }
    if (!(sandbox.memoryTolerance >= 1.0)) {
        return makeError(ErrorCode::INVALID_CONFIG, "memory tolerance must be at least 1.0",
                         "sandbox.memory_tolerance=" + std::to_string(sandbox.memoryTolerance));
    }
    out.limits.maxMemoryBytes = static_cast<uint64_t>(memoryMb) * 1024 * 1024;
    out.limits.maxTimeSeconds = static_cast<uint32_t>(seconds);
    out.memoryTolerance = sandbox.memoryTolerance;
    
    if (config.has("sandbox.enable_static_analysis")) out.enableStaticAnalysis = sandbox.enableStaticAnalysis;
    if (config.has("sandbox.enable_text_repair")) out.enableTextRepair = sandbox.enableTextRepair;
    if (!sandbox.enforcePolicy.empty() && !parseFlag(sandbox.enforcePolicy, out.enforcePolicy)) {
        return makeError(ErrorCode::INVALID_CONFIG, "enforce_policy must be a boolean",
                         "sandbox.enforce_policy=" + sandbox.enforcePolicy);
    }
    
    if (!sandbox.allowedModules.empty()) {
        out.allowedModules = sandbox.allowedModules;
        if (profile == SandboxProfile::HARDENED) {
            out.policyRules.allowedModules = std::set<std::string>(out.allowedModules.begin(), out.allowedModules.end());
        }
    }
    if (!sandbox.allowedBuiltins.empty()) out.allowedCallables = sandbox.allowedBuiltins;
    if (!policy.dangerousModules.empty()) {
        out.policyRules.dangerousModules = std::set<std::string>(policy.dangerousModules.begin(), policy.dangerousModules.end());
    }
    if (!policy.dangerousBuiltins.empty()) {
        out.policyRules.dangerousBuiltins = std::set<std::string>(policy.dangerousBuiltins.begin(), policy.dangerousBuiltins.end());
    }
    if (!policy.dangerousAttributes.empty()) {
        out.policyRules.dangerousAttributes = std::set<std::string>(policy.dangerousAttributes.begin(), policy.dangerousAttributes.end());
    }
    return out;
}

CodeExecutor::CodeExecutor() : CodeExecutor(ExecutorConfig::permissive()) {}

CodeExecutor::CodeExecutor(ExecutorConfig config)
    : config_(std::move(config)),
      analyzer_(config_.policyRules),
      guard_(config_.limits, config_.memoryTolerance),
      namespaces_(NamespaceSpec{config_.allowedModules, config_.allowedCallables, config_.importMode}),
      repairer_(config_.repairer ? config_.repairer : std::make_shared<PassthroughRepairer>()) {}

PolicyReport CodeExecutor::analyze(const std::string& code) const {
    return analyzer_.analyze(code);
}

std::string CodeExecutor::preprocess(const std::string& code) const {
    std::string text = code;
    if (config_.enableTextRepair) {
        try {
            ValidationReport validation = repairer_->validate(code);
            if (!validation.valid) {
                SG_WARN("sandbox", "string literal problems found: " + join(validation.errors, "; "));
                RepairReport repair = repairer_->repair(code);
                if (repair.success) {
                    text = repair.fixedText;
                    SG_INFO("sandbox", "text repair applied " + std::to_string(repair.changes.size()) + " change(s)");
                } else {
                    SG_WARN("sandbox", "text repair failed, keeping original: " + join(repair.warnings, "; "));
                }
            }
        } catch (const std::exception& e) {
            SG_WARN("sandbox", std::string("text repair raised, keeping original: ") + e.what());
            text = code;
        }
    }
    return normalizeColumnKeys(text);
}

ExecutionOutcome CodeExecutor::execute(const std::string& code, const ExecutionContext& context) const {
    auto start = Clock::now();
    SG_INFO("sandbox", "starting execution, code length " + std::to_string(code.size()));
    
    if (isBlank(code)) {
        SG_ERROR("sandbox", "EmptyCode: code is empty");
        return makeFailure(ErrorKind::EMPTY_CODE, "EmptyCode", "Code is empty", start);
    }
    
    try {
        if (config_.enableStaticAnalysis) {
            PolicyReport report = analyzer_.analyze(code);
            if (!report.safe) {
                std::vector<std::string> details;
                for (const auto& v : report.violations) details.push_back(v.detail);
                SG_WARN("sandbox", std::string("policy check flagged snippet, risk ") +
                        riskLevelToString(report.riskLevel) + ": " + join(details, "; "));
                if (config_.enforcePolicy) {
                    ExecutionFailure f = makeFailure(ErrorKind::POLICY_VIOLATION, "PolicyViolation",
                                                     "Policy violation: " + join(details, "; "), start);
                    if (!report.recommendations.empty()) f.suggestion = join(report.recommendations, " ");
                    SG_ERROR("sandbox", "PolicyViolation: " + f.message);
                    return f;
                }
            }
        }
        
        std::string processed = preprocess(code);
        
        auto init = Interpreter::ensureInitialized();
        if (init.failed()) {
            ExecutionFailure f = makeFailure(ErrorKind::RUNTIME_ERROR, "InterpreterError",
                                             formatError(init.error()), start);
            SG_ERROR("sandbox", "RuntimeError: " + f.message);
            return f;
        }
        
        GilLock gil;
        return runGuarded(code, processed, context, start);
    } catch (const std::exception& e) {
        ExecutionFailure f = makeFailure(ErrorKind::RUNTIME_ERROR, "InternalError", e.what(), start);
        SG_ERROR("sandbox", std::string("internal failure during execution: ") + e.what());
        return f;
    }
}

ExecutionOutcome CodeExecutor::runGuarded(const std::string& original, const std::string& processed,
                                          const ExecutionContext& context, Clock::time_point start) const {
    Attempt attempt;
    auto ns = namespaces_.build(context);
    if (ns.failed()) {
        ExecutionFailure f = makeFailure(ErrorKind::RUNTIME_ERROR, "SandboxSetupError", formatError(ns.error()), start);
        SG_ERROR("sandbox", "RuntimeError: " + f.message);
        return f;
    }
    attempt.ns = ns.value();
    
    PyObject* deadlineType = Interpreter::deadlineExceededType();
    PyObject* memoryType = Interpreter::memoryCeilingType();
    
    Interpreter::beginCapture();
    GuardedRegion region(guard_, start);
    
    runText(processed, attempt);
    
    if (!attempt.ok && processed != original && !region.aborted()) {
        SG_WARN("sandbox", "preprocessed code failed, retrying with the original text");
        PyErr_Clear();
        Interpreter::endCapture();
        
        attempt = Attempt();
        auto retryNs = namespaces_.build(context);
        if (retryNs.failed()) {
            attempt.setupFailed = true;
            attempt.setupError = retryNs.error();
        } else {
            attempt.ns = retryNs.value();
            Interpreter::beginCapture();
            runText(original, attempt);
        }
    }
    
    // Error text, result and locals go through the snippet's own __str__ and
    // __repr__, so they are collected before the watchdog stops.
    std::optional<PythonError> error;
    ExecutionSuccess s;
    if (!attempt.ok && !attempt.setupFailed) {
        error = fetchPythonError();
    } else if (attempt.ok && !region.aborted()) {
        auto result = attempt.ns.local(kResultName);
        if (result) {
            s.returnValue = *result;
            s.hasReturnValue = true;
        }
        s.locals = attempt.ns.publicLocals();
    }
    attempt.ns.clearLocals();
    
    region.finish();
    AbortReason reason = region.scope().abortReason();
    std::string output = Interpreter::endCapture();
    
    if (attempt.ok && reason == AbortReason::NONE) {
        s.output = output;
        s.elapsedSeconds = secondsSince(start);
        SG_INFO("sandbox", "execution succeeded in " + std::to_string(s.elapsedSeconds) + "s");
        return s;
    }
    
    ExecutionFailure f;
    if (reason == AbortReason::TIMEOUT || (error && error->matches(deadlineType))) {
        f = makeFailure(ErrorKind::TIMEOUT_ERROR, "TimeoutError",
                        "Execution timed out after " + std::to_string(config_.limits.maxTimeSeconds) + " seconds",
                        start);
    } else if (reason == AbortReason::MEMORY || (error && error->matches(memoryType))) {
        MemoryLimitExceeded exceeded(config_.limits.maxMemoryBytes, region.scope().observedMemoryBytes());
        f = makeFailure(ErrorKind::MEMORY_LIMIT_ERROR, "MemoryLimitError", exceeded.what(), start);
        f.memoryLimitBytes = exceeded.limitBytes();
        f.memoryUsedBytes = exceeded.usedBytes();
    } else if (attempt.setupFailed) {
        f = makeFailure(ErrorKind::RUNTIME_ERROR, "SandboxSetupError", formatError(attempt.setupError), start);
    } else {
        ErrorKind kind = classify(*error);
        f = makeFailure(kind, error->typeName, error->message, start);
    }
    if (error) f.trace = error->trace;
    f.output = output;
    SG_ERROR("sandbox", std::string(errorKindToString(f.kind)) + ": " + f.message);
    return f;
}

ExecutionOutcome CodeExecutor::executeFile(const std::string& path, const ExecutionContext& context) const {
    auto code = readSnippetFile(path);
    if (code.failed()) {
        ExecutionFailure f;
        f.kind = ErrorKind::RUNTIME_ERROR;
        f.exceptionType = errorToString(code.error().code);
        f.message = formatError(code.error());
        f.suggestion = suggestionFor(f.kind, f.message);
        SG_ERROR("sandbox", f.message);
        return f;
    }
    return execute(code.value(), context);
}

Result<std::string> readSnippetFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return makeError(ErrorCode::FILE_NOT_FOUND, "cannot open snippet file", path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) return makeError(ErrorCode::INTERNAL_ERROR, "cannot read snippet file", path);
    return buffer.str();
}

ExecutionOutcome executeSafeCode(const std::string& code, const ExecutionContext& context,
                                 uint64_t maxMemoryMb, uint32_t maxTimeSeconds) {
    if (maxMemoryMb == 0 || maxMemoryMb > kMaxMemoryMb || maxTimeSeconds == 0) {
        ExecutionFailure f;
        f.kind = ErrorKind::RUNTIME_ERROR;
        f.exceptionType = errorToString(ErrorCode::INVALID_ARGUMENT);
        f.message = "limits out of range: " + std::to_string(maxMemoryMb) + " MB, " +
                    std::to_string(maxTimeSeconds) + " s";
        f.suggestion = suggestionFor(f.kind, f.message);
        SG_ERROR("sandbox", f.message);
        return f;
    }
    ExecutorConfig config = ExecutorConfig::permissive();
    config.limits.maxMemoryBytes = maxMemoryMb << 20;
    config.limits.maxTimeSeconds = maxTimeSeconds;
    CodeExecutor executor(config);
    return executor.execute(code, context);
}

}
}
