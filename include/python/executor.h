#pragma once

#include "infrastructure/error_handling.h"
#include "python/outcome.h"
#include "python/policy_analyzer.h"
#include "python/python_value.h"
#include "python/resource_guard.h"
#include "python/sandbox_namespace.h"
#include "python/text_repair.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace snipguard {

namespace utils {
class Config;
}

namespace python {

enum class SandboxProfile {
    PERMISSIVE,
    HARDENED
};

const char* profileToString(SandboxProfile profile);
bool parseProfile(const std::string& name, SandboxProfile& out);

struct ExecutorConfig {
    SandboxProfile profile = SandboxProfile::PERMISSIVE;
    ResourceLimits limits;
    double memoryTolerance = ResourceGuard::kDefaultTolerance;
    bool enableStaticAnalysis = false;
    bool enableTextRepair = true;
    bool enforcePolicy = false;
    ImportMode importMode = ImportMode::UNRESTRICTED;
    std::vector<std::string> allowedModules;
    std::vector<std::string> allowedCallables;
    PolicyRules policyRules;
    // Null selects PassthroughRepairer.
    std::shared_ptr<const TextRepairer> repairer;
    
    // Broad builtins, unrestricted import, empty deny-lists, no enforcement.
    static ExecutorConfig permissive();
    // Reduced builtins, allow-listed import, populated deny-lists,
    // static analysis and enforcement on.
    static ExecutorConfig hardened();
    // Reads the sandbox.* and policy.* keys on top of the chosen profile.
    static Result<ExecutorConfig> fromConfig(const utils::Config& config);
};

// Runs snippets in a fresh namespace under a time and memory guard. The
// configuration is fixed at construction, so one executor may serve several
// threads at once.
class CodeExecutor {
public:
    CodeExecutor();
    explicit CodeExecutor(ExecutorConfig config);
    
    // Never throws; every failure is reported as an ExecutionFailure. The time
    // limit counts from the call, so namespace set-up is charged to it.
    ExecutionOutcome execute(const std::string& code, const ExecutionContext& context = {}) const;
    ExecutionOutcome executeFile(const std::string& path, const ExecutionContext& context = {}) const;
    
    PolicyReport analyze(const std::string& code) const;
    
    const ExecutorConfig& config() const { return config_; }
    
private:
    std::string preprocess(const std::string& code) const;
    ExecutionOutcome runGuarded(const std::string& original, const std::string& processed,
                                const ExecutionContext& context,
                                std::chrono::steady_clock::time_point start) const;
    
    ExecutorConfig config_;
    PolicyAnalyzer analyzer_;
    ResourceGuard guard_;
    SandboxNamespaceBuilder namespaces_;
    std::shared_ptr<const TextRepairer> repairer_;
};

Result<std::string> readSnippetFile(const std::string& path);

// Builds a permissive executor with the given limits for a single run.
ExecutionOutcome executeSafeCode(const std::string& code,
                                 const ExecutionContext& context = {},
                                 uint64_t maxMemoryMb = 2048,
                                 uint32_t maxTimeSeconds = 120);

}
}
