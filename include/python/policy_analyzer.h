#pragma once

#include <set>
#include <string>
#include <vector>

namespace snipguard {
namespace python {

enum class RiskLevel {
    NONE = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3
};

enum class ViolationSeverity {
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3
};

const char* riskLevelToString(RiskLevel level);
const char* violationSeverityToString(ViolationSeverity severity);

struct Violation {
    std::string kind;
    std::string detail;
    ViolationSeverity severity = ViolationSeverity::LOW;
    
    bool operator==(const Violation& other) const {
        return kind == other.kind && detail == other.detail && severity == other.severity;
    }
};

struct PolicyReport {
    bool safe = true;
    std::vector<Violation> violations;
    std::set<std::string> imports;
    std::set<std::string> calls;
    std::set<std::string> attributes;
    RiskLevel riskLevel = RiskLevel::NONE;
    std::vector<std::string> recommendations;
    // Parser message when the text could not be parsed; empty otherwise.
    std::string syntaxError;
    
    bool operator==(const PolicyReport& other) const;
    bool operator!=(const PolicyReport& other) const { return !(*this == other); }
};

struct PolicyRules {
    std::set<std::string> dangerousModules;
    // Empty means every non-dangerous module is acceptable.
    std::set<std::string> allowedModules;
    std::set<std::string> dangerousBuiltins;
    std::set<std::string> dangerousAttributes;
    
    bool empty() const;
    
    static PolicyRules permissive();
    static PolicyRules hardened();
};

// Static check of snippet text. Parses with the interpreter's ast module;
// nothing in the snippet is executed.
class PolicyAnalyzer {
public:
    PolicyAnalyzer();
    explicit PolicyAnalyzer(PolicyRules rules);
    
    PolicyReport analyze(const std::string& code) const;
    
    const PolicyRules& rules() const { return rules_; }
    
private:
    PolicyRules rules_;
};

}
}
