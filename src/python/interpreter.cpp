#include "python/interpreter.h"
#include "utils/logger.h"
#include <mutex>

namespace snipguard {
namespace python {

namespace {

const char* kRuntimeModule = "_snipguard_runtime";

const char* kRuntimeSource = R"PY(
import io
import sys
import threading


class DeadlineExceeded(BaseException):
    """Raised into a guarded run when its time budget is spent."""


class MemoryCeilingExceeded(BaseException):
    """Raised into a guarded run when the process passes its memory ceiling."""


_capture = threading.local()


class RoutedStream(io.TextIOBase):
    def __init__(self, fallback):
        self._fallback = fallback

    def _target(self):
        buf = getattr(_capture, "buffer", None)
        return buf if buf is not None else self._fallback

    def writable(self):
        return True

    def write(self, text):
        target = self._target()
        if target is None:
            return len(text)
        return target.write(text)

    def flush(self):
        target = self._target()
        if target is not None:
            target.flush()


def begin_capture():
    _capture.buffer = io.StringIO()


def end_capture():
    buf = getattr(_capture, "buffer", None)
    _capture.buffer = None
    return buf.getvalue() if buf is not None else ""


sys.stdout = RoutedStream(sys.stdout)
sys.stderr = RoutedStream(sys.stderr)
)PY";

struct RuntimeState {
    std::once_flag once;
    Result<void> status;
    PyObject* deadlineType = nullptr;
    PyObject* memoryType = nullptr;
    PyObject* beginCapture = nullptr;
    PyObject* endCapture = nullptr;
};

RuntimeState& runtime() {
    static RuntimeState state;
    return state;
}

std::string pendingErrorText() {
    if (!PyErr_Occurred()) return "unknown interpreter error";
    PythonError err = fetchPythonError();
    return err.typeName + ": " + err.message;
}

Result<void> installRuntime(RuntimeState& st) {
    PyRef module = PyRef::steal(PyModule_New(kRuntimeModule));
    if (!module) return makeError(ErrorCode::INTERPRETER_ERROR, "cannot create runtime module", pendingErrorText());
    
    PyObject* dict = PyModule_GetDict(module.get());
    PyRef builtins = PyRef::steal(PyImport_ImportModule("builtins"));
    if (!builtins || PyDict_SetItemString(dict, "__builtins__", builtins.get()) < 0) {
        return makeError(ErrorCode::INTERPRETER_ERROR, "cannot attach builtins to runtime module", pendingErrorText());
    }
    
    PyRef ran = PyRef::steal(PyRun_String(kRuntimeSource, Py_file_input, dict, dict));
    if (!ran) return makeError(ErrorCode::INTERPRETER_ERROR, "runtime bootstrap failed", pendingErrorText());
    
    if (PyDict_SetItemString(PyImport_GetModuleDict(), kRuntimeModule, module.get()) < 0) {
        return makeError(ErrorCode::INTERPRETER_ERROR, "cannot register runtime module", pendingErrorText());
    }
    
    // The module stays registered for the life of the process, so these
    // borrowed-then-owned references are never released.
    st.deadlineType = PyDict_GetItemString(dict, "DeadlineExceeded");
    st.memoryType = PyDict_GetItemString(dict, "MemoryCeilingExceeded");
    st.beginCapture = PyDict_GetItemString(dict, "begin_capture");
    st.endCapture = PyDict_GetItemString(dict, "end_capture");
    if (!st.deadlineType || !st.memoryType || !st.beginCapture || !st.endCapture) {
        return makeError(ErrorCode::INTERPRETER_ERROR, "runtime module is missing helpers");
    }
    Py_INCREF(st.deadlineType);
    Py_INCREF(st.memoryType);
    Py_INCREF(st.beginCapture);
    Py_INCREF(st.endCapture);
    return Result<void>();
}

void initialize(RuntimeState& st) {
    bool ownsInterpreter = false;
    if (!Py_IsInitialized()) {
        PyConfig config;
        PyConfig_InitPythonConfig(&config);
        config.install_signal_handlers = 0;
        config.parse_argv = 0;
        PyStatus status = Py_InitializeFromConfig(&config);
        PyConfig_Clear(&config);
        if (PyStatus_Exception(status)) {
            st.status = makeError(ErrorCode::INTERPRETER_ERROR, "interpreter start-up failed",
                                  status.err_msg ? status.err_msg : "");
            return;
        }
        ownsInterpreter = true;
        SG_INFO("interp", std::string("started embedded Python ") + Py_GetVersion());
    } else {
        SG_INFO("interp", "adopting interpreter started by the host");
    }
    
    {
        GilLock gil;
        st.status = installRuntime(st);
    }
    
    // Py_InitializeFromConfig leaves the GIL with this thread.
    if (ownsInterpreter) PyEval_SaveThread();
    
    if (st.status.failed()) {
        SG_ERROR("interp", formatError(st.status.error()));
    }
}

}

bool PythonError::matches(PyObject* excType) const {
    if (!type || !excType) return false;
    return PyErr_GivenExceptionMatches(type.get(), excType) != 0;
}

std::string toStdString(PyObject* obj) {
    if (!obj) return "";
    PyRef text = PyRef::steal(PyObject_Str(obj));
    if (!text) {
        PyErr_Clear();
        return "<unprintable " + typeNameOf(obj) + ">";
    }
    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(text.get(), &size);
    if (data) return std::string(data, static_cast<size_t>(size));
    
    // Lone surrogates have no UTF-8 form; escape them instead of losing the text.
    PyErr_Clear();
    PyRef encoded = PyRef::steal(PyUnicode_AsEncodedString(text.get(), "utf-8", "backslashreplace"));
    if (!encoded) {
        PyErr_Clear();
        return "<unprintable " + typeNameOf(obj) + ">";
    }
    return std::string(PyBytes_AS_STRING(encoded.get()), static_cast<size_t>(PyBytes_GET_SIZE(encoded.get())));
}

std::string reprOf(PyObject* obj) {
    if (!obj) return "";
    PyRef text = PyRef::steal(PyObject_Repr(obj));
    if (!text) {
        PyErr_Clear();
        return "<" + typeNameOf(obj) + ">";
    }
    return toStdString(text.get());
}

std::string typeNameOf(PyObject* obj) {
    if (!obj) return "";
    std::string name = Py_TYPE(obj)->tp_name;
    size_t dot = name.rfind('.');
    return dot == std::string::npos ? name : name.substr(dot + 1);
}

namespace {

std::string formatTrace(PyObject* type, PyObject* value, PyObject* tb) {
    PyRef traceback = PyRef::steal(PyImport_ImportModule("traceback"));
    if (!traceback) {
        PyErr_Clear();
        return "";
    }
    PyRef lines = PyRef::steal(PyObject_CallMethod(traceback.get(), "format_exception", "OOO",
                                                   type, value ? value : Py_None, tb ? tb : Py_None));
    if (!lines) {
        PyErr_Clear();
        return "";
    }
    PyRef empty = PyRef::steal(PyUnicode_FromString(""));
    if (!empty) {
        PyErr_Clear();
        return "";
    }
    PyRef joined = PyRef::steal(PyUnicode_Join(empty.get(), lines.get()));
    if (!joined) {
        PyErr_Clear();
        return "";
    }
    return toStdString(joined.get());
}

}

PythonError fetchPythonError() {
    PythonError err;
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* tb = nullptr;
    PyErr_Fetch(&type, &value, &tb);
    if (!type) {
        err.typeName = "UnknownError";
        return err;
    }
    PyErr_NormalizeException(&type, &value, &tb);
    if (value && tb) PyException_SetTraceback(value, tb);
    
    err.type = PyRef::steal(type);
    err.value = PyRef::steal(value);
    PyRef traceback = PyRef::steal(tb);
    
    std::string name = reinterpret_cast<PyTypeObject*>(type)->tp_name;
    size_t dot = name.rfind('.');
    err.typeName = dot == std::string::npos ? name : name.substr(dot + 1);
    err.message = value ? toStdString(value) : "";
    err.trace = formatTrace(type, value, traceback.get());
    if (err.trace.empty()) {
        err.trace = err.message.empty() ? err.typeName : err.typeName + ": " + err.message;
    }
    return err;
}

Result<void> Interpreter::ensureInitialized() {
    RuntimeState& st = runtime();
    std::call_once(st.once, [&st]() { initialize(st); });
    return st.status;
}

PyObject* Interpreter::deadlineExceededType() {
    return runtime().deadlineType;
}

PyObject* Interpreter::memoryCeilingType() {
    return runtime().memoryType;
}

void Interpreter::beginCapture() {
    PyRef r = PyRef::steal(PyObject_CallNoArgs(runtime().beginCapture));
    if (!r) {
        SG_WARN("interp", "output capture could not start: " + pendingErrorText());
    }
}

std::string Interpreter::endCapture() {
    PyRef text = PyRef::steal(PyObject_CallNoArgs(runtime().endCapture));
    if (!text) {
        SG_WARN("interp", "output capture could not be collected: " + pendingErrorText());
        return "";
    }
    return toStdString(text.get());
}

unsigned long Interpreter::currentThreadId() {
    return PyThread_get_thread_ident();
}

void Interpreter::interruptThread(unsigned long threadId, PyObject* excType) {
    if (PyThreadState_SetAsyncExc(threadId, excType) == 0) {
        SG_DEBUG("interp", "no interpreter thread with id " + std::to_string(threadId));
    }
}

void Interpreter::clearInterrupt(unsigned long threadId) {
    PyThreadState_SetAsyncExc(threadId, nullptr);
}

}
}
