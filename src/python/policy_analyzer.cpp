#include "python/policy_analyzer.h"
#include "python/interpreter.h"
#include "utils/logger.h"
#include <algorithm>

namespace snipguard {
namespace python {

namespace {

const char* kDangerousImport = "dangerous_import";
const char* kUnlistedImport = "unlisted_import";
const char* kDangerousCall = "dangerous_call";
const char* kDangerousAttribute = "dangerous_attribute";

std::string recommendationFor(const std::string& kind) {
    if (kind == kDangerousImport) {
        return "Remove imports of system-level modules (os, subprocess, socket, ...) and work on the provided data instead.";
    }
    if (kind == kUnlistedImport) {
        return "Import only modules from the sandbox allow-list.";
    }
    if (kind == kDangerousCall) {
        return "Avoid dynamic code execution and file access builtins such as eval, exec and open.";
    }
    if (kind == kDangerousAttribute) {
        return "Do not reach into interpreter internals through dunder or frame attributes.";
    }
    return "Review the flagged construct.";
}

class ReportBuilder {
public:
    ReportBuilder(const PolicyRules& rules, PolicyReport& report) : rules_(rules), report_(report) {}
    
    void addImport(const std::string& name) {
        if (name.empty()) return;
        std::string top = name.substr(0, name.find('.'));
        if (!report_.imports.insert(top).second) return;
        if (rules_.dangerousModules.count(top)) {
            add(kDangerousImport, "import of module '" + top + "'", ViolationSeverity::HIGH);
        } else if (!rules_.allowedModules.empty() && !rules_.allowedModules.count(top)) {
            add(kUnlistedImport, "import of module '" + top + "' outside the allow-list", ViolationSeverity::LOW);
        }
    }
    
    void addCall(const std::string& name) {
        if (!report_.calls.insert(name).second) return;
        if (rules_.dangerousBuiltins.count(name)) {
            add(kDangerousCall, "call to builtin '" + name + "()'", ViolationSeverity::HIGH);
        }
    }
    
    void addAttribute(const std::string& name) {
        if (!report_.attributes.insert(name).second) return;
        if (rules_.dangerousAttributes.count(name)) {
            add(kDangerousAttribute, "access to attribute '." + name + "'", ViolationSeverity::MEDIUM);
        }
    }
    
    void finish() {
        report_.safe = report_.riskLevel <= RiskLevel::LOW;
    }
    
private:
    void add(const std::string& kind, const std::string& detail, ViolationSeverity severity) {
        report_.violations.push_back(Violation{kind, detail, severity});
        RiskLevel level = static_cast<RiskLevel>(static_cast<int>(severity));
        if (level > report_.riskLevel) report_.riskLevel = level;
        std::string advice = recommendationFor(kind);
        if (std::find(report_.recommendations.begin(), report_.recommendations.end(), advice) ==
            report_.recommendations.end()) {
            report_.recommendations.push_back(advice);
        }
    }
    
    const PolicyRules& rules_;
    PolicyReport& report_;
};

std::string stringAttr(PyObject* node, const char* attr) {
    PyRef value = PyRef::steal(PyObject_GetAttrString(node, attr));
    if (!value) {
        PyErr_Clear();
        return "";
    }
    if (!PyUnicode_Check(value.get())) return "";
    return toStdString(value.get());
}

struct AstTypes {
    PyRef import;
    PyRef importFrom;
    PyRef call;
    PyRef name;
    PyRef attribute;
    
    bool load(PyObject* ast) {
        import = PyRef::steal(PyObject_GetAttrString(ast, "Import"));
        importFrom = PyRef::steal(PyObject_GetAttrString(ast, "ImportFrom"));
        call = PyRef::steal(PyObject_GetAttrString(ast, "Call"));
        name = PyRef::steal(PyObject_GetAttrString(ast, "Name"));
        attribute = PyRef::steal(PyObject_GetAttrString(ast, "Attribute"));
        return import && importFrom && call && name && attribute;
    }
};

bool isA(PyObject* node, const PyRef& type) {
    int r = PyObject_IsInstance(node, type.get());
    if (r < 0) {
        PyErr_Clear();
        return false;
    }
    return r == 1;
}

// Returns false with a Python error pending when the walk itself fails.
bool walkTree(PyObject* ast, PyObject* tree, const AstTypes& types, ReportBuilder& builder) {
    PyRef walker = PyRef::steal(PyObject_CallMethod(ast, "walk", "O", tree));
    if (!walker) return false;
    PyRef iter = PyRef::steal(PyObject_GetIter(walker.get()));
    if (!iter) return false;
    
    while (true) {
        PyRef node = PyRef::steal(PyIter_Next(iter.get()));
        if (!node) break;
        PyObject* n = node.get();
        
        if (isA(n, types.import)) {
            PyRef names = PyRef::steal(PyObject_GetAttrString(n, "names"));
            if (!names) return false;
            PyRef seq = PyRef::steal(PySequence_Fast(names.get(), "import names"));
            if (!seq) return false;
            for (Py_ssize_t i = 0; i < PySequence_Fast_GET_SIZE(seq.get()); ++i) {
                builder.addImport(stringAttr(PySequence_Fast_GET_ITEM(seq.get(), i), "name"));
            }
        } else if (isA(n, types.importFrom)) {
            // "from . import x" has no module name.
            builder.addImport(stringAttr(n, "module"));
        } else if (isA(n, types.call)) {
            PyRef func = PyRef::steal(PyObject_GetAttrString(n, "func"));
            if (!func) return false;
            if (isA(func.get(), types.name)) builder.addCall(stringAttr(func.get(), "id"));
        } else if (isA(n, types.attribute)) {
            builder.addAttribute(stringAttr(n, "attr"));
        }
    }
    return !PyErr_Occurred();
}

}

const char* riskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::NONE: return "none";
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH: return "high";
    }
    return "unknown";
}

const char* violationSeverityToString(ViolationSeverity severity) {
    switch (severity) {
        case ViolationSeverity::LOW: return "low";
        case ViolationSeverity::MEDIUM: return "medium";
        case ViolationSeverity::HIGH: return "high";
    }
    return "unknown";
}

bool PolicyReport::operator==(const PolicyReport& other) const {
    return safe == other.safe && violations == other.violations && imports == other.imports &&
           calls == other.calls && attributes == other.attributes && riskLevel == other.riskLevel &&
           recommendations == other.recommendations && syntaxError == other.syntaxError;
}

bool PolicyRules::empty() const {
    return dangerousModules.empty() && allowedModules.empty() &&
           dangerousBuiltins.empty() && dangerousAttributes.empty();
}

PolicyRules PolicyRules::permissive() {
    return PolicyRules{};
}

PolicyRules PolicyRules::hardened() {
    PolicyRules rules;
    rules.dangerousModules = {"os", "sys", "subprocess", "socket", "shutil", "ctypes", "importlib",
                              "pickle", "marshal", "multiprocessing", "threading", "signal", "pty",
                              "builtins", "urllib", "http", "ftplib", "requests"};
    rules.dangerousBuiltins = {"eval", "exec", "compile", "open", "input", "__import__", "globals",
                               "locals", "vars", "breakpoint", "getattr", "setattr", "delattr"};
    rules.dangerousAttributes = {"__globals__", "__subclasses__", "__builtins__", "__code__",
                                 "__class__", "__bases__", "__mro__", "__dict__", "f_globals",
                                 "f_locals", "gi_frame", "system", "popen"};
    return rules;
}

PolicyAnalyzer::PolicyAnalyzer() : rules_(PolicyRules::permissive()) {}

PolicyAnalyzer::PolicyAnalyzer(PolicyRules rules) : rules_(std::move(rules)) {}

PolicyReport PolicyAnalyzer::analyze(const std::string& code) const {
    PolicyReport report;
    
    auto init = Interpreter::ensureInitialized();
    if (init.failed()) {
        report.syntaxError = "parser unavailable: " + init.error().message;
        SG_WARN("policy", report.syntaxError);
        return report;
    }
    
    GilLock gil;
    PyRef ast = PyRef::steal(PyImport_ImportModule("ast"));
    AstTypes types;
    if (!ast || !types.load(ast.get())) {
        report.syntaxError = "parser unavailable: " + fetchPythonError().message;
        SG_WARN("policy", report.syntaxError);
        return report;
    }
    
    PyRef source = PyRef::steal(PyUnicode_DecodeUTF8(code.data(), static_cast<Py_ssize_t>(code.size()), "replace"));
    PyRef tree;
    if (source) {
        tree = PyRef::steal(PyObject_CallMethod(ast.get(), "parse", "Os", source.get(), "<snippet>"));
    }
    if (!tree) {
        PythonError err = fetchPythonError();
        report.syntaxError = err.typeName + ": " + err.message;
        SG_DEBUG("policy", "snippet did not parse: " + report.syntaxError);
        return report;
    }
    
    ReportBuilder builder(rules_, report);
    if (!walkTree(ast.get(), tree.get(), types, builder)) {
        PythonError err = fetchPythonError();
        SG_WARN("policy", "syntax tree walk failed: " + err.typeName + ": " + err.message);
    }
    builder.finish();
    
    SG_DEBUG("policy", "analysis done: risk=" + std::string(riskLevelToString(report.riskLevel)) +
             ", violations=" + std::to_string(report.violations.size()));
    return report;
}

}
}
