#pragma once

#include "python/outcome.h"
#include "python/policy_analyzer.h"
#include "python/python_value.h"
#include "python/result_renderer.h"
#include <nlohmann/json.hpp>

namespace snipguard {
namespace python {

// OBJECT values serialize as {"__object__": type, "repr": text}.
nlohmann::json toJson(const PythonValue& value);
// Integral numbers become INT, other numbers FLOAT; null becomes NONE.
PythonValue fromJson(const nlohmann::json& value);

nlohmann::json toJson(const PolicyReport& report);
nlohmann::json toJson(const ValueSummary& summary);
nlohmann::json toJson(const ExecutionOutcome& outcome);

// Top-level object of a context file; anything else is rejected.
bool contextFromJson(const nlohmann::json& doc, ExecutionContext& out);

}
}
