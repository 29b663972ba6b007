#pragma once

#include "infrastructure/error_handling.h"
#include "python/python_value.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace snipguard {
namespace python {

// Bumped whenever the builtin tables below change.
constexpr int kBuiltinTableVersion = 1;

// Names starting with this prefix are reserved for the engine.
constexpr const char* kReservedPrefix = "__sg_";
constexpr const char* kResultName = "result";
constexpr const char* kSandboxModuleName = "__sandbox__";

enum class ImportMode {
    UNRESTRICTED,
    ALLOW_LIST
};

// Builtins every profile gets.
const std::vector<std::string>& coreBuiltins();
// Reflection, dynamic evaluation and I/O builtins; permissive profile only.
const std::vector<std::string>& reflectiveBuiltins();

const std::vector<std::string>& defaultPermissiveModules();
const std::vector<std::string>& defaultHardenedModules();

struct NamespaceSpec {
    std::vector<std::string> allowedModules;
    std::vector<std::string> allowedCallables;
    ImportMode importMode = ImportMode::UNRESTRICTED;
};

bool isPrivateName(const std::string& name);

// One run's globals/locals pair.
class SandboxNamespace {
public:
    const ObjectHandle& globals() const { return globals_; }
    const ObjectHandle& locals() const { return locals_; }
    
    std::vector<std::string> globalNames() const;
    std::vector<std::string> builtinNames() const;
    std::vector<std::string> localNames() const;
    
    std::optional<PythonValue> local(const std::string& name) const;
    // Locals whose names do not start with '_'.
    std::map<std::string, PythonValue> publicLocals() const;
    // Drops every binding so objects the caller did not keep die while the
    // run is still guarded.
    void clearLocals() const;
    
private:
    friend class SandboxNamespaceBuilder;
    ObjectHandle globals_;
    ObjectHandle locals_;
};

class SandboxNamespaceBuilder {
public:
    explicit SandboxNamespaceBuilder(NamespaceSpec spec);
    
    // Fresh namespace per call. Modules that fail to import are skipped.
    Result<SandboxNamespace> build(const ExecutionContext& context) const;
    
    const NamespaceSpec& spec() const { return spec_; }
    
private:
    NamespaceSpec spec_;
};

}
}
