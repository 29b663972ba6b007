#include "python/sandbox_namespace.h"
#include "python/interpreter.h"
#include "utils/logger.h"
#include <algorithm>

namespace snipguard {
namespace python {

namespace {

// self is a frozenset of permitted top-level module names.
PyObject* restrictedImport(PyObject* self, PyObject* args, PyObject* kwargs) {
    static const char* kwlist[] = {"name", "globals", "locals", "fromlist", "level", nullptr};
    PyObject* name = nullptr;
    PyObject* globals = nullptr;
    PyObject* locals = nullptr;
    PyObject* fromlist = nullptr;
    int level = 0;
    if (!PyArg_ParseTupleAndKeywords(args, kwargs, "U|OOOi:__import__", const_cast<char**>(kwlist),
                                     &name, &globals, &locals, &fromlist, &level)) {
        return nullptr;
    }
    
    Py_ssize_t size = 0;
    const char* raw = PyUnicode_AsUTF8AndSize(name, &size);
    if (!raw) return nullptr;
    std::string full(raw, static_cast<size_t>(size));
    std::string top = full.substr(0, full.find('.'));
    
    int allowed = 0;
    if (level == 0 && !top.empty()) {
        PyRef topName = PyRef::steal(PyUnicode_FromStringAndSize(top.data(), static_cast<Py_ssize_t>(top.size())));
        if (!topName) return nullptr;
        allowed = PySet_Contains(self, topName.get());
        if (allowed < 0) return nullptr;
    }
    if (!allowed) {
        PyRef message = PyRef::steal(level != 0
            ? PyUnicode_FromFormat("relative import of '%U' is not permitted in this sandbox", name)
            : PyUnicode_FromFormat("import of '%U' is not permitted in this sandbox", name));
        if (!message) return nullptr;
        PyErr_SetImportError(message.get(), name, nullptr);
        return nullptr;
    }
    return PyImport_ImportModuleLevelObject(name, globals, locals, fromlist, level);
}

PyMethodDef kRestrictedImportDef = {
    "__import__",
    reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(restrictedImport)),
    METH_VARARGS | METH_KEYWORDS,
    "Import limited to the sandbox module allow-list."
};

const char* aliasFor(const std::string& module) {
    if (module == "pandas") return "pd";
    if (module == "numpy") return "np";
    return nullptr;
}

std::vector<std::string> dictKeys(PyObject* dict) {
    std::vector<std::string> names;
    if (!dict || !PyDict_Check(dict)) return names;
    PyObject* key = nullptr;
    PyObject* value = nullptr;
    Py_ssize_t pos = 0;
    while (PyDict_Next(dict, &pos, &key, &value)) {
        if (PyUnicode_Check(key)) names.push_back(toStdString(key));
    }
    std::sort(names.begin(), names.end());
    return names;
}

Error pendingError(ErrorCode code, const std::string& what) {
    PythonError err = fetchPythonError();
    return makeError(code, what, err.typeName + ": " + err.message);
}

}

const std::vector<std::string>& coreBuiltins() {
    static const std::vector<std::string> table = {
        "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes", "callable", "chr",
        "classmethod", "complex", "dict", "divmod", "enumerate", "filter", "float", "format",
        "frozenset", "hasattr", "hash", "hex", "id", "int", "isinstance", "issubclass", "iter",
        "len", "list", "map", "max", "memoryview", "min", "next", "object", "oct", "ord", "pow",
        "print", "property", "range", "repr", "reversed", "round", "set", "slice", "sorted",
        "staticmethod", "str", "sum", "super", "tuple", "type", "zip",
        "__build_class__", "None", "True", "False", "NotImplemented", "Ellipsis",
        "BaseException", "Exception", "ArithmeticError", "AssertionError", "AttributeError",
        "BufferError", "EOFError", "FloatingPointError", "GeneratorExit", "ImportError",
        "ModuleNotFoundError", "IndexError", "KeyError", "KeyboardInterrupt", "LookupError",
        "MemoryError", "NameError", "NotImplementedError", "OSError", "OverflowError",
        "RecursionError", "ReferenceError", "RuntimeError", "StopIteration", "StopAsyncIteration",
        "SyntaxError", "IndentationError", "SystemError", "TypeError", "UnboundLocalError",
        "UnicodeError", "UnicodeDecodeError", "UnicodeEncodeError", "ValueError",
        "ZeroDivisionError", "TimeoutError", "PermissionError", "FileNotFoundError",
        "Warning", "UserWarning", "DeprecationWarning", "RuntimeWarning", "FutureWarning"
    };
    return table;
}

const std::vector<std::string>& reflectiveBuiltins() {
    static const std::vector<std::string> table = {
        "getattr", "setattr", "delattr", "compile", "eval", "exec", "open", "input",
        "globals", "locals", "vars", "dir", "help"
    };
    return table;
}

const std::vector<std::string>& defaultPermissiveModules() {
    static const std::vector<std::string> modules = {
        "pandas", "numpy", "scipy",
        "math", "cmath", "statistics", "random", "decimal", "fractions", "numbers",
        "datetime", "time", "calendar", "zoneinfo",
        "re", "string", "textwrap", "unicodedata", "difflib",
        "json", "csv", "io", "base64", "binascii", "hashlib", "hmac", "uuid", "secrets",
        "collections", "itertools", "functools", "operator", "heapq", "bisect", "array",
        "copy", "pprint", "enum", "dataclasses", "typing", "abc", "contextlib", "types",
        "warnings", "traceback", "inspect", "weakref", "struct", "codecs", "locale",
        "os", "sys", "pathlib", "glob", "fnmatch", "shutil", "tempfile", "platform",
        "subprocess", "threading", "queue", "logging", "argparse",
        "zlib", "gzip", "bz2", "lzma", "zipfile", "tarfile", "pickle", "shelve", "sqlite3",
        "urllib", "http", "email", "html", "xml",
        "gc", "sysconfig"
    };
    return modules;
}

const std::vector<std::string>& defaultHardenedModules() {
    static const std::vector<std::string> modules = {
        "math", "statistics", "string", "re", "json", "collections", "itertools", "functools",
        "operator", "random", "datetime", "decimal", "fractions", "hashlib", "base64", "heapq",
        "bisect", "copy", "textwrap", "numpy", "pandas"
    };
    return modules;
}

bool isPrivateName(const std::string& name) {
    return !name.empty() && name[0] == '_';
}

std::vector<std::string> SandboxNamespace::globalNames() const {
    GilLock gil;
    return dictKeys(globals_.get());
}

std::vector<std::string> SandboxNamespace::builtinNames() const {
    GilLock gil;
    if (!globals_) return {};
    PyObject* builtins = PyDict_GetItemString(globals_.get(), "__builtins__");
    return dictKeys(builtins);
}

std::vector<std::string> SandboxNamespace::localNames() const {
    GilLock gil;
    return dictKeys(locals_.get());
}

std::optional<PythonValue> SandboxNamespace::local(const std::string& name) const {
    GilLock gil;
    if (!locals_) return std::nullopt;
    PyRef value = PyRef::borrow(PyDict_GetItemString(locals_.get(), name.c_str()));
    if (!value) return std::nullopt;
    return fromPython(value.get());
}

std::map<std::string, PythonValue> SandboxNamespace::publicLocals() const {
    std::map<std::string, PythonValue> out;
    GilLock gil;
    if (!locals_) return out;
    PyRef items = PyRef::steal(PyDict_Items(locals_.get()));
    if (!items) {
        PythonError err = fetchPythonError();
        SG_WARN("namespace", "cannot list snippet locals: " + err.typeName);
        return out;
    }
    for (Py_ssize_t i = 0; i < PyList_GET_SIZE(items.get()); ++i) {
        PyObject* pair = PyList_GET_ITEM(items.get(), i);
        PyObject* key = PyTuple_GET_ITEM(pair, 0);
        if (!PyUnicode_Check(key)) continue;
        std::string name = toStdString(key);
        if (isPrivateName(name)) continue;
        out[name] = fromPython(PyTuple_GET_ITEM(pair, 1));
    }
    return out;
}

void SandboxNamespace::clearLocals() const {
    GilLock gil;
    if (locals_) PyDict_Clear(locals_.get());
}

SandboxNamespaceBuilder::SandboxNamespaceBuilder(NamespaceSpec spec) : spec_(std::move(spec)) {}

Result<SandboxNamespace> SandboxNamespaceBuilder::build(const ExecutionContext& context) const {
    auto init = Interpreter::ensureInitialized();
    if (init.failed()) return init.error();
    
    GilLock gil;
    
    PyRef builtinsModule = PyRef::steal(PyImport_ImportModule("builtins"));
    if (!builtinsModule) return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot load builtins");
    PyObject* source = PyModule_GetDict(builtinsModule.get());
    
    PyRef builtins = PyRef::steal(PyDict_New());
    if (!builtins) return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot allocate builtins table");
    for (const auto& name : spec_.allowedCallables) {
        if (name.compare(0, 5, kReservedPrefix) == 0 || name == "__import__") continue;
        PyObject* item = PyDict_GetItemString(source, name.c_str());
        if (!item) {
            SG_DEBUG("namespace", "builtin '" + name + "' not provided by this interpreter");
            continue;
        }
        if (PyDict_SetItemString(builtins.get(), name.c_str(), item) < 0) {
            return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot populate builtins table");
        }
    }
    
    PyRef importer;
    if (spec_.importMode == ImportMode::UNRESTRICTED) {
        importer = PyRef::borrow(PyDict_GetItemString(source, "__import__"));
    } else {
        PyRef names = PyRef::steal(PyFrozenSet_New(nullptr));
        if (!names) return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot allocate module allow-list");
        for (const auto& module : spec_.allowedModules) {
            PyRef n = PyRef::steal(PyUnicode_FromString(module.c_str()));
            if (!n || PySet_Add(names.get(), n.get()) < 0) {
                return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot build module allow-list");
            }
        }
        importer = PyRef::steal(PyCFunction_New(&kRestrictedImportDef, names.get()));
    }
    if (!importer || PyDict_SetItemString(builtins.get(), "__import__", importer.get()) < 0) {
        return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot install import hook");
    }
    
    PyRef globals = PyRef::steal(PyDict_New());
    PyRef moduleName = PyRef::steal(PyUnicode_FromString(kSandboxModuleName));
    if (!globals || !moduleName ||
        PyDict_SetItemString(globals.get(), "__builtins__", builtins.get()) < 0 ||
        PyDict_SetItemString(globals.get(), "__name__", moduleName.get()) < 0) {
        return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot allocate globals");
    }
    
    for (const auto& module : spec_.allowedModules) {
        if (module.empty() || module.find('.') != std::string::npos || isPrivateName(module)) continue;
        PyRef loaded = PyRef::steal(PyImport_ImportModule(module.c_str()));
        if (!loaded) {
            PythonError err = fetchPythonError();
            SG_DEBUG("namespace", "skipping module '" + module + "': " + err.typeName + ": " + err.message);
            continue;
        }
        if (PyDict_SetItemString(globals.get(), module.c_str(), loaded.get()) < 0) {
            return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot bind module '" + module + "'");
        }
        const char* alias = aliasFor(module);
        if (alias && PyDict_SetItemString(globals.get(), alias, loaded.get()) < 0) {
            return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot bind alias '" + std::string(alias) + "'");
        }
    }
    
    PyRef locals = PyRef::steal(PyDict_New());
    if (!locals) return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot allocate locals");
    for (const auto& kv : context) {
        if (kv.first.compare(0, 5, kReservedPrefix) == 0) {
            SG_WARN("namespace", "dropping reserved context key '" + kv.first + "'");
            continue;
        }
        PyRef value = toPython(kv.second);
        if (!value) return pendingError(ErrorCode::CONVERSION_ERROR, "cannot convert context value '" + kv.first + "'");
        if (PyDict_SetItemString(locals.get(), kv.first.c_str(), value.get()) < 0) {
            return pendingError(ErrorCode::NAMESPACE_ERROR, "cannot bind context value '" + kv.first + "'");
        }
    }
    
    SandboxNamespace ns;
    ns.globals_ = globals.share();
    ns.locals_ = locals.share();
    SG_DEBUG("namespace", "built namespace: " + std::to_string(PyDict_Size(globals.get())) + " globals, " +
             std::to_string(PyDict_Size(locals.get())) + " locals");
    return ns;
}

}
}
