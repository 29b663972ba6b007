#pragma once

#include "python/python_value.h"
#include "python/resource_guard.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace snipguard {
namespace python {

struct ValueSummary {
    // "DataFrame", "Series", "ndarray", a plain type name, or "unknown" when
    // rendering failed.
    std::string type;
    std::vector<int64_t> shape;
    std::vector<std::string> columns;
    std::string name;
    std::string dtype;
    std::map<std::string, std::string> dtypes;
    int64_t length = -1;
    PythonValue preview;
    std::string text;
};

class ResultRenderer {
public:
    static constexpr size_t kDefaultPreviewRows = 20;
    
    // Rendering calls into the value's own methods, so it runs under a guard
    // with the given limits.
    explicit ResultRenderer(size_t previewRows = kDefaultPreviewRows,
                            const ResourceLimits& limits = ResourceLimits());
    
    ValueSummary summarize(const PythonValue& value) const;
    
private:
    size_t previewRows_;
    ResourceGuard guard_;
};

}
}
