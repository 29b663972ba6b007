#pragma once

#include <string>
#include <vector>

namespace snipguard {
namespace python {

struct ValidationReport {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct RepairReport {
    bool success = true;
    std::string fixedText;
    std::vector<std::string> changes;
    std::vector<std::string> warnings;
};

// Fixes malformed string literals before a run. Implementations may throw;
// the executor treats a throw like a failed repair.
class TextRepairer {
public:
    virtual ~TextRepairer() = default;
    virtual ValidationReport validate(const std::string& text) const = 0;
    virtual RepairReport repair(const std::string& text) const = 0;
};

class PassthroughRepairer : public TextRepairer {
public:
    ValidationReport validate(const std::string& text) const override;
    RepairReport repair(const std::string& text) const override;
};

// Strips whitespace around literal keys in df['  col '] subscripts.
std::string normalizeColumnKeys(const std::string& code);

}
}
