#include "python/interpreter.h"
#include <sstream>
#include <iomanip>
#include <cmath>
#include <cstdlib>

namespace snipguard {
namespace python {

namespace {

constexpr int kMaxConversionDepth = 32;
constexpr size_t kMaxReprLength = 4096;

void releaseObject(PyObject* obj) {
    if (!obj || !Py_IsInitialized()) return;
    GilLock gil;
    Py_DECREF(obj);
}

// Quotes the way repr() does: single quotes unless the text holds a single
// quote and no double quote.
std::string reprQuoted(const std::string& text) {
    char q = (text.find('\'') != std::string::npos && text.find('"') == std::string::npos) ? '"' : '\'';
    std::string out(1, q);
    for (char c : text) {
        if (c == q) {
            out += '\\';
            out += c;
            continue;
        }
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    out += q;
    return out;
}

PythonValue objectValue(PyObject* obj) {
    std::string repr = reprOf(obj);
    if (repr.size() > kMaxReprLength) repr = repr.substr(0, kMaxReprLength) + "...";
    return PythonValue::fromObject(ObjectHandle::borrow(obj), typeNameOf(obj), repr);
}

PythonValue convert(PyObject* obj, int depth) {
    PythonValue out;
    if (!obj || obj == Py_None) {
        out.typeName = "NoneType";
        return out;
    }
    
    if (PyBool_Check(obj)) {
        out = PythonValue::fromBool(obj == Py_True);
    } else if (PyLong_Check(obj)) {
        int overflow = 0;
        long long v = PyLong_AsLongLongAndOverflow(obj, &overflow);
        if (overflow != 0 || (v == -1 && PyErr_Occurred())) {
            PyErr_Clear();
            return objectValue(obj);
        }
        out = PythonValue::fromInt(static_cast<int64_t>(v));
    } else if (PyFloat_Check(obj)) {
        out = PythonValue::fromFloat(PyFloat_AsDouble(obj));
    } else if (PyUnicode_Check(obj)) {
        Py_ssize_t size = 0;
        const char* data = PyUnicode_AsUTF8AndSize(obj, &size);
        if (!data) {
            PyErr_Clear();
            return objectValue(obj);
        }
        out = PythonValue::fromString(std::string(data, static_cast<size_t>(size)));
    } else if (PyBytes_Check(obj)) {
        const uint8_t* data = reinterpret_cast<const uint8_t*>(PyBytes_AS_STRING(obj));
        out = PythonValue::fromBytes(std::vector<uint8_t>(data, data + PyBytes_GET_SIZE(obj)));
    } else if ((PyList_Check(obj) || PyTuple_Check(obj)) && depth < kMaxConversionDepth) {
        // Items are converted from a snapshot; a __repr__ may mutate the list.
        PyRef items = PyRef::steal(PyList_Check(obj) ? PyList_AsTuple(obj) : PySequence_Tuple(obj));
        if (!items) {
            PyErr_Clear();
            return objectValue(obj);
        }
        Py_ssize_t n = PyTuple_GET_SIZE(items.get());
        out.type = PythonValueType::LIST;
        out.listVal.reserve(static_cast<size_t>(n));
        for (Py_ssize_t i = 0; i < n; ++i) {
            out.listVal.push_back(convert(PyTuple_GET_ITEM(items.get(), i), depth + 1));
        }
    } else if (PyDict_Check(obj) && depth < kMaxConversionDepth) {
        PyRef items = PyRef::steal(PyDict_Items(obj));
        if (!items) {
            PyErr_Clear();
            return objectValue(obj);
        }
        Py_ssize_t n = PyList_GET_SIZE(items.get());
        for (Py_ssize_t i = 0; i < n; ++i) {
            if (!PyUnicode_Check(PyTuple_GET_ITEM(PyList_GET_ITEM(items.get(), i), 0))) return objectValue(obj);
        }
        out.type = PythonValueType::DICT;
        for (Py_ssize_t i = 0; i < n; ++i) {
            PyObject* pair = PyList_GET_ITEM(items.get(), i);
            out.dictVal[toStdString(PyTuple_GET_ITEM(pair, 0))] = convert(PyTuple_GET_ITEM(pair, 1), depth + 1);
        }
    } else {
        return objectValue(obj);
    }
    out.typeName = typeNameOf(obj);
    return out;
}

}

ObjectHandle ObjectHandle::borrow(_object* obj) {
    Py_XINCREF(obj);
    return steal(obj);
}

ObjectHandle ObjectHandle::steal(_object* obj) {
    ObjectHandle handle;
    if (obj) handle.ref_ = std::shared_ptr<_object>(obj, releaseObject);
    return handle;
}

PythonValue PythonValue::fromObject(const ObjectHandle& handle, const std::string& typeName, const std::string& repr) {
    PythonValue p;
    p.type = PythonValueType::OBJECT;
    p.object = handle;
    p.typeName = typeName;
    p.stringVal = repr;
    return p;
}

std::string PythonValue::describe() const {
    switch (type) {
        case PythonValueType::NONE: return "None";
        case PythonValueType::BOOL: return boolVal ? "True" : "False";
        case PythonValueType::INT: return std::to_string(intVal);
        case PythonValueType::FLOAT: {
            if (std::isnan(floatVal)) return "nan";
            if (std::isinf(floatVal)) return floatVal > 0 ? "inf" : "-inf";
            // Shortest text that reads back to the same double.
            std::string s;
            for (int precision = 1; precision <= 17; ++precision) {
                std::ostringstream oss;
                oss << std::setprecision(precision) << floatVal;
                s = oss.str();
                if (std::strtod(s.c_str(), nullptr) == floatVal) break;
            }
            if (s.find_first_of(".e") == std::string::npos) s += ".0";
            return s;
        }
        case PythonValueType::STRING: return reprQuoted(stringVal);
        case PythonValueType::BYTES: {
            const std::string raw(bytesVal.begin(), bytesVal.end());
            return "b" + reprQuoted(raw);
        }
        case PythonValueType::LIST: {
            bool tuple = typeName == "tuple";
            std::string out = tuple ? "(" : "[";
            for (size_t i = 0; i < listVal.size(); ++i) {
                if (i > 0) out += ", ";
                out += listVal[i].describe();
            }
            if (tuple && listVal.size() == 1) out += ",";
            out += tuple ? ")" : "]";
            return out;
        }
        case PythonValueType::DICT: {
            std::string out = "{";
            bool first = true;
            for (const auto& kv : dictVal) {
                if (!first) out += ", ";
                first = false;
                out += reprQuoted(kv.first) + ": " + kv.second.describe();
            }
            return out + "}";
        }
        case PythonValueType::OBJECT: return stringVal;
    }
    return "";
}

bool PythonValue::operator==(const PythonValue& other) const {
    if (type != other.type) return false;
    switch (type) {
        case PythonValueType::NONE: return true;
        case PythonValueType::BOOL: return boolVal == other.boolVal;
        case PythonValueType::INT: return intVal == other.intVal;
        case PythonValueType::FLOAT: return floatVal == other.floatVal;
        case PythonValueType::STRING: return stringVal == other.stringVal;
        case PythonValueType::BYTES: return bytesVal == other.bytesVal;
        case PythonValueType::LIST: return listVal == other.listVal;
        case PythonValueType::DICT: return dictVal == other.dictVal;
        case PythonValueType::OBJECT: return object == other.object;
    }
    return false;
}

const char* valueTypeToString(PythonValueType type) {
    switch (type) {
        case PythonValueType::NONE: return "none";
        case PythonValueType::BOOL: return "bool";
        case PythonValueType::INT: return "int";
        case PythonValueType::FLOAT: return "float";
        case PythonValueType::STRING: return "str";
        case PythonValueType::BYTES: return "bytes";
        case PythonValueType::LIST: return "list";
        case PythonValueType::DICT: return "dict";
        case PythonValueType::OBJECT: return "object";
    }
    return "unknown";
}

PyRef toPython(const PythonValue& value) {
    switch (value.type) {
        case PythonValueType::NONE:
            return PyRef::borrow(Py_None);
        case PythonValueType::BOOL:
            return PyRef::steal(PyBool_FromLong(value.boolVal ? 1 : 0));
        case PythonValueType::INT:
            return PyRef::steal(PyLong_FromLongLong(value.intVal));
        case PythonValueType::FLOAT:
            return PyRef::steal(PyFloat_FromDouble(value.floatVal));
        case PythonValueType::STRING:
            return PyRef::steal(PyUnicode_DecodeUTF8(value.stringVal.data(),
                                                     static_cast<Py_ssize_t>(value.stringVal.size()), "replace"));
        case PythonValueType::BYTES:
            return PyRef::steal(PyBytes_FromStringAndSize(reinterpret_cast<const char*>(value.bytesVal.data()),
                                                          static_cast<Py_ssize_t>(value.bytesVal.size())));
        case PythonValueType::LIST: {
            PyRef list = PyRef::steal(PyList_New(static_cast<Py_ssize_t>(value.listVal.size())));
            if (!list) return list;
            for (size_t i = 0; i < value.listVal.size(); ++i) {
                PyRef item = toPython(value.listVal[i]);
                if (!item) return PyRef();
                PyList_SET_ITEM(list.get(), static_cast<Py_ssize_t>(i), item.release());
            }
            if (value.typeName == "tuple") return PyRef::steal(PyList_AsTuple(list.get()));
            return list;
        }
        case PythonValueType::DICT: {
            PyRef dict = PyRef::steal(PyDict_New());
            if (!dict) return dict;
            for (const auto& kv : value.dictVal) {
                PyRef item = toPython(kv.second);
                if (!item) return PyRef();
                if (PyDict_SetItemString(dict.get(), kv.first.c_str(), item.get()) < 0) return PyRef();
            }
            return dict;
        }
        case PythonValueType::OBJECT:
            return PyRef::borrow(value.object ? value.object.get() : Py_None);
    }
    PyErr_SetString(PyExc_TypeError, "unsupported value type");
    return PyRef();
}

PythonValue fromPython(PyObject* obj) {
    return convert(obj, 0);
}

}
}
