#include "python/serialization.h"
#include <cstdint>

namespace snipguard {
namespace python {

using json = nlohmann::json;

json toJson(const PythonValue& value) {
    switch (value.type) {
        case PythonValueType::NONE: return nullptr;
        case PythonValueType::BOOL: return value.boolVal;
        case PythonValueType::INT: return value.intVal;
        case PythonValueType::FLOAT: return value.floatVal;
        case PythonValueType::STRING: return value.stringVal;
        case PythonValueType::BYTES: {
            json out = json::array();
            for (uint8_t b : value.bytesVal) out.push_back(b);
            return out;
        }
        case PythonValueType::LIST: {
            json out = json::array();
            for (const auto& item : value.listVal) out.push_back(toJson(item));
            return out;
        }
        case PythonValueType::DICT: {
            json out = json::object();
            for (const auto& kv : value.dictVal) out[kv.first] = toJson(kv.second);
            return out;
        }
        case PythonValueType::OBJECT: {
            json out;
            out["__object__"] = value.typeName;
            out["repr"] = value.stringVal;
            return out;
        }
    }
    return nullptr;
}

PythonValue fromJson(const json& value) {
    if (value.is_null()) return PythonValue::none();
    if (value.is_boolean()) return PythonValue::fromBool(value.get<bool>());
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        if (v <= static_cast<uint64_t>(INT64_MAX)) return PythonValue::fromInt(static_cast<int64_t>(v));
        return PythonValue::fromFloat(static_cast<double>(v));
    }
    if (value.is_number_integer()) return PythonValue::fromInt(value.get<int64_t>());
    if (value.is_number()) return PythonValue::fromFloat(value.get<double>());
    if (value.is_string()) return PythonValue::fromString(value.get<std::string>());
    if (value.is_array()) {
        std::vector<PythonValue> items;
        for (const auto& item : value) items.push_back(fromJson(item));
        return PythonValue::fromList(items);
    }
    if (value.is_object()) {
        std::map<std::string, PythonValue> items;
        for (auto it = value.begin(); it != value.end(); ++it) items[it.key()] = fromJson(it.value());
        return PythonValue::fromDict(items);
    }
    return PythonValue::none();
}

bool contextFromJson(const json& doc, ExecutionContext& out) {
    if (!doc.is_object()) return false;
    for (auto it = doc.begin(); it != doc.end(); ++it) out[it.key()] = fromJson(it.value());
    return true;
}

json toJson(const PolicyReport& report) {
    json out;
    out["safe"] = report.safe;
    out["risk_level"] = riskLevelToString(report.riskLevel);
    json violations = json::array();
    for (const auto& v : report.violations) {
        json item;
        item["kind"] = v.kind;
        item["detail"] = v.detail;
        item["severity"] = violationSeverityToString(v.severity);
        violations.push_back(item);
    }
    out["violations"] = violations;
    out["imports"] = report.imports;
    out["calls"] = report.calls;
    out["attributes"] = report.attributes;
    out["recommendations"] = report.recommendations;
    if (!report.syntaxError.empty()) out["syntax_error"] = report.syntaxError;
    return out;
}

json toJson(const ValueSummary& summary) {
    json out;
    out["type"] = summary.type;
    if (!summary.shape.empty()) out["shape"] = summary.shape;
    if (!summary.columns.empty()) out["columns"] = summary.columns;
    if (!summary.name.empty()) out["name"] = summary.name;
    if (!summary.dtype.empty()) out["dtype"] = summary.dtype;
    if (!summary.dtypes.empty()) out["dtypes"] = summary.dtypes;
    if (summary.length >= 0) out["length"] = summary.length;
    if (!summary.preview.isNone()) out["preview"] = toJson(summary.preview);
    if (!summary.text.empty()) out["text"] = summary.text;
    return out;
}

json toJson(const ExecutionOutcome& outcome) {
    json out;
    out["success"] = outcome.ok();
    out["output"] = outcome.output();
    out["execution_time"] = outcome.elapsedSeconds();
    if (outcome.ok()) {
        const ExecutionSuccess& s = outcome.success();
        out["result"] = s.hasReturnValue ? toJson(s.returnValue) : json(nullptr);
        json locals = json::object();
        for (const auto& kv : s.locals) locals[kv.first] = toJson(kv.second);
        out["locals"] = locals;
    } else {
        const ExecutionFailure& f = outcome.failure();
        out["error"] = errorKindToString(f.kind);
        out["exception_type"] = f.exceptionType;
        out["message"] = f.message;
        out["suggestion"] = f.suggestion;
        out["traceback"] = f.trace;
        if (f.kind == ErrorKind::MEMORY_LIMIT_ERROR) {
            out["memory_limit_bytes"] = f.memoryLimitBytes;
            out["memory_used_bytes"] = f.memoryUsedBytes;
        }
    }
    return out;
}

}
}
