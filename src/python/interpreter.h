#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "infrastructure/error_handling.h"
#include "python/python_value.h"
#include <string>

namespace snipguard {
namespace python {

class GilLock {
public:
    GilLock() : state_(PyGILState_Ensure()) {}
    ~GilLock() { PyGILState_Release(state_); }
    GilLock(const GilLock&) = delete;
    GilLock& operator=(const GilLock&) = delete;
    
private:
    PyGILState_STATE state_;
};

// Releases the lock held by the current thread for the lifetime of the object.
class GilRelease {
public:
    GilRelease() : save_(PyEval_SaveThread()) {}
    ~GilRelease() { PyEval_RestoreThread(save_); }
    GilRelease(const GilRelease&) = delete;
    GilRelease& operator=(const GilRelease&) = delete;
    
private:
    PyThreadState* save_;
};

// Owns one strong reference. Must be destroyed with the GIL held.
class PyRef {
public:
    PyRef() = default;
    ~PyRef() { Py_XDECREF(obj_); }
    
    PyRef(PyRef&& other) noexcept : obj_(other.obj_) { other.obj_ = nullptr; }
    PyRef& operator=(PyRef&& other) noexcept {
        if (this != &other) {
            Py_XDECREF(obj_);
            obj_ = other.obj_;
            other.obj_ = nullptr;
        }
        return *this;
    }
    PyRef(const PyRef&) = delete;
    PyRef& operator=(const PyRef&) = delete;
    
    static PyRef steal(PyObject* obj) { PyRef r; r.obj_ = obj; return r; }
    static PyRef borrow(PyObject* obj) { Py_XINCREF(obj); return steal(obj); }
    
    PyObject* get() const { return obj_; }
    PyObject* release() { PyObject* o = obj_; obj_ = nullptr; return o; }
    explicit operator bool() const { return obj_ != nullptr; }
    
    ObjectHandle share() const { return ObjectHandle::borrow(obj_); }
    
private:
    PyObject* obj_ = nullptr;
};

struct PythonError {
    std::string typeName;
    std::string message;
    std::string trace;
    PyRef type;
    PyRef value;
    
    bool matches(PyObject* excType) const;
};

// Takes the pending exception off the current thread. GIL held.
PythonError fetchPythonError();

// str(obj) as UTF-8; never leaves an exception set.
std::string toStdString(PyObject* obj);
std::string reprOf(PyObject* obj);
// Unqualified type name ("ndarray" rather than "numpy.ndarray").
std::string typeNameOf(PyObject* obj);

// Returns a new reference, or null with an exception set.
PyRef toPython(const PythonValue& value);
PythonValue fromPython(PyObject* obj);

class Interpreter {
public:
    // Starts the interpreter once per process (or adopts one the host already
    // started) and installs the runtime helpers. Safe to call from any thread.
    static Result<void> ensureInitialized();
    
    // Abort exception types raised into a guarded run. Borrowed references,
    // valid after a successful ensureInitialized().
    static PyObject* deadlineExceededType();
    static PyObject* memoryCeilingType();
    
    // Per-thread stdout/stderr capture. GIL held, no exception pending.
    static void beginCapture();
    static std::string endCapture();
    
    static unsigned long currentThreadId();
    static void interruptThread(unsigned long threadId, PyObject* excType);
    static void clearInterrupt(unsigned long threadId);
};

}
}
