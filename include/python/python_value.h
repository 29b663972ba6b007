#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <cstdint>

// CPython's object struct; PyObject is a typedef of it.
struct _object;

namespace snipguard {
namespace python {

// Strong reference to a live interpreter object. Copies share the reference;
// the last copy releases it under the interpreter lock.
class ObjectHandle {
public:
    ObjectHandle() = default;
    
    static ObjectHandle borrow(_object* obj);
    static ObjectHandle steal(_object* obj);
    
    _object* get() const { return ref_.get(); }
    bool valid() const { return ref_ != nullptr; }
    explicit operator bool() const { return valid(); }
    bool operator==(const ObjectHandle& other) const { return ref_ == other.ref_; }
    bool operator!=(const ObjectHandle& other) const { return ref_ != other.ref_; }
    
private:
    std::shared_ptr<_object> ref_;
};

enum class PythonValueType {
    NONE,
    BOOL,
    INT,
    FLOAT,
    STRING,
    BYTES,
    LIST,
    DICT,
    OBJECT
};

struct PythonValue {
    PythonValueType type = PythonValueType::NONE;
    bool boolVal = false;
    int64_t intVal = 0;
    double floatVal = 0.0;
    std::string stringVal;
    std::vector<uint8_t> bytesVal;
    std::vector<PythonValue> listVal;
    std::map<std::string, PythonValue> dictVal;
    // OBJECT only: the live object; stringVal then holds its repr().
    ObjectHandle object;
    // Interpreter type name ("int", "tuple", "DataFrame", ...). Empty for
    // values built on the C++ side.
    std::string typeName;
    
    static PythonValue none() { return PythonValue{}; }
    static PythonValue fromBool(bool v) { PythonValue p; p.type = PythonValueType::BOOL; p.boolVal = v; return p; }
    static PythonValue fromInt(int64_t v) { PythonValue p; p.type = PythonValueType::INT; p.intVal = v; return p; }
    static PythonValue fromFloat(double v) { PythonValue p; p.type = PythonValueType::FLOAT; p.floatVal = v; return p; }
    static PythonValue fromString(const std::string& v) { PythonValue p; p.type = PythonValueType::STRING; p.stringVal = v; return p; }
    static PythonValue fromBytes(const std::vector<uint8_t>& v) { PythonValue p; p.type = PythonValueType::BYTES; p.bytesVal = v; return p; }
    static PythonValue fromList(const std::vector<PythonValue>& v) { PythonValue p; p.type = PythonValueType::LIST; p.listVal = v; return p; }
    static PythonValue fromDict(const std::map<std::string, PythonValue>& v) { PythonValue p; p.type = PythonValueType::DICT; p.dictVal = v; return p; }
    static PythonValue fromObject(const ObjectHandle& handle, const std::string& typeName, const std::string& repr);
    
    bool isNone() const { return type == PythonValueType::NONE; }
    bool isObject() const { return type == PythonValueType::OBJECT; }
    
    bool toBool() const { return type == PythonValueType::BOOL ? boolVal : (type == PythonValueType::INT ? intVal != 0 : false); }
    int64_t toInt() const { return type == PythonValueType::INT ? intVal : (type == PythonValueType::FLOAT ? static_cast<int64_t>(floatVal) : 0); }
    double toFloat() const { return type == PythonValueType::FLOAT ? floatVal : (type == PythonValueType::INT ? static_cast<double>(intVal) : 0.0); }
    std::string toString() const { return type == PythonValueType::STRING ? stringVal : ""; }
    std::vector<uint8_t> toBytes() const { return type == PythonValueType::BYTES ? bytesVal : std::vector<uint8_t>{}; }
    
    // Python-style rendering: 'text', [1, 2], {'a': 1}, repr() for objects.
    std::string describe() const;
    
    // Structural equality; OBJECT values compare by identity.
    bool operator==(const PythonValue& other) const;
    bool operator!=(const PythonValue& other) const { return !(*this == other); }
};

// Name -> value bindings injected into a run's local scope.
using ExecutionContext = std::map<std::string, PythonValue>;

const char* valueTypeToString(PythonValueType type);

}
}
