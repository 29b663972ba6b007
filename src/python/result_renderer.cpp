#include "python/result_renderer.h"
#include "python/guarded_region.h"
#include "python/interpreter.h"
#include "utils/logger.h"
#include <stdexcept>

namespace snipguard {
namespace python {

namespace {

// Carries a Python failure out of the summarizers.
class RenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

PyRef check(PyObject* obj) {
    if (!obj) {
        PythonError err = fetchPythonError();
        throw RenderError(err.typeName + ": " + err.message);
    }
    return PyRef::steal(obj);
}

std::vector<int64_t> shapeOf(PyObject* obj) {
    PyRef shape = check(PyObject_GetAttrString(obj, "shape"));
    PythonValue v = fromPython(shape.get());
    std::vector<int64_t> dims;
    for (const auto& d : v.listVal) dims.push_back(d.toInt());
    return dims;
}

std::string strAttr(PyObject* obj, const char* attr) {
    PyRef value = check(PyObject_GetAttrString(obj, attr));
    return toStdString(value.get());
}

void summarizeDataFrame(PyObject* df, size_t rows, ValueSummary& out) {
    out.type = "DataFrame";
    out.shape = shapeOf(df);
    
    PyRef columns = check(PyObject_GetAttrString(df, "columns"));
    PyRef names = check(PyObject_CallMethod(columns.get(), "tolist", nullptr));
    for (const auto& c : fromPython(names.get()).listVal) {
        out.columns.push_back(c.type == PythonValueType::STRING ? c.stringVal : c.describe());
    }
    
    PyRef head = check(PyObject_CallMethod(df, "head", "n", static_cast<Py_ssize_t>(rows)));
    PyRef records = check(PyObject_CallMethod(head.get(), "to_dict", "s", "records"));
    out.preview = fromPython(records.get());
    
    PyRef dtypes = check(PyObject_GetAttrString(df, "dtypes"));
    PyRef asText = check(PyObject_CallMethod(dtypes.get(), "astype", "s", "str"));
    PyRef mapping = check(PyObject_CallMethod(asText.get(), "to_dict", nullptr));
    for (const auto& kv : fromPython(mapping.get()).dictVal) {
        out.dtypes[kv.first] = kv.second.toString();
    }
}

void summarizeSeries(PyObject* series, size_t rows, ValueSummary& out) {
    out.type = "Series";
    out.name = strAttr(series, "name");
    Py_ssize_t len = PyObject_Length(series);
    if (len < 0) check(nullptr);
    out.length = static_cast<int64_t>(len);
    PyRef head = check(PyObject_CallMethod(series, "head", "n", static_cast<Py_ssize_t>(rows)));
    PyRef values = check(PyObject_CallMethod(head.get(), "tolist", nullptr));
    out.preview = fromPython(values.get());
    out.dtype = strAttr(series, "dtype");
}

void summarizeArray(PyObject* array, size_t rows, ValueSummary& out) {
    out.type = "ndarray";
    out.shape = shapeOf(array);
    out.dtype = strAttr(array, "dtype");
    PyRef flat = check(PyObject_CallMethod(array, "flatten", nullptr));
    PyRef head = check(PySequence_GetSlice(flat.get(), 0, static_cast<Py_ssize_t>(rows)));
    PyRef values = check(PyObject_CallMethod(head.get(), "tolist", nullptr));
    out.preview = fromPython(values.get());
}

std::string moduleOf(PyObject* obj) {
    PyRef module = PyRef::steal(PyObject_GetAttrString(reinterpret_cast<PyObject*>(Py_TYPE(obj)), "__module__"));
    if (!module) {
        PyErr_Clear();
        return "";
    }
    return toStdString(module.get());
}

}

ResultRenderer::ResultRenderer(size_t previewRows, const ResourceLimits& limits)
    : previewRows_(previewRows), guard_(limits) {}

ValueSummary ResultRenderer::summarize(const PythonValue& value) const {
    ValueSummary out;
    
    if (!value.isObject()) {
        out.type = value.typeName.empty() ? valueTypeToString(value.type) : value.typeName;
        out.text = value.type == PythonValueType::STRING ? value.stringVal : value.describe();
        if (value.type == PythonValueType::LIST || value.type == PythonValueType::DICT) {
            out.length = static_cast<int64_t>(value.type == PythonValueType::LIST ? value.listVal.size()
                                                                                   : value.dictVal.size());
        }
        return out;
    }
    
    if (!value.object) {
        out.type = "unknown";
        out.text = "object handle is empty";
        return out;
    }
    
    GilLock gil;
    PyObject* obj = value.object.get();
    GuardedRegion region(guard_);
    try {
        std::string module = moduleOf(obj);
        std::string type = typeNameOf(obj);
        bool fromPandas = module.compare(0, 6, "pandas") == 0;
        if (fromPandas && type == "DataFrame") {
            summarizeDataFrame(obj, previewRows_, out);
        } else if (fromPandas && type == "Series") {
            summarizeSeries(obj, previewRows_, out);
        } else if (module == "numpy" && type == "ndarray") {
            summarizeArray(obj, previewRows_, out);
        } else {
            out.type = type;
            out.text = toStdString(obj);
        }
    } catch (const RenderError& e) {
        SG_WARN("sandbox", std::string("result rendering failed: ") + e.what());
        out = ValueSummary();
        out.type = "unknown";
        out.text = std::string("result rendering failed: ") + e.what();
    }
    region.finish();
    
    AbortReason reason = region.scope().abortReason();
    if (reason != AbortReason::NONE) {
        SG_WARN("sandbox", std::string("result rendering aborted: ") + abortReasonToString(reason));
        out = ValueSummary();
        out.type = "unknown";
        out.text = std::string("result rendering aborted: ") + abortReasonToString(reason);
    }
    return out;
}

}
}
