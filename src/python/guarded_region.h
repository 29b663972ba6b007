#pragma once

#include "python/interpreter.h"
#include "python/resource_guard.h"
#include "utils/logger.h"
#include <chrono>
#include <memory>

namespace snipguard {
namespace python {

// Arms a watchdog that raises the runtime's abort exceptions into the calling
// thread. Constructed and finished with the GIL held. finish() stops the
// watchdog with the GIL released, then drops any abort it posted after the
// guarded work had already returned.
class GuardedRegion {
public:
    explicit GuardedRegion(const ResourceGuard& guard)
        : GuardedRegion(guard, std::chrono::steady_clock::now()) {}
    
    GuardedRegion(const ResourceGuard& guard, std::chrono::steady_clock::time_point startedAt)
        : threadId_(Interpreter::currentThreadId()) {
        unsigned long threadId = threadId_;
        PyObject* deadlineType = Interpreter::deadlineExceededType();
        PyObject* memoryType = Interpreter::memoryCeilingType();
        scope_ = guard.arm([threadId, deadlineType, memoryType](AbortReason reason) {
            GilLock gil;
            Interpreter::interruptThread(threadId, reason == AbortReason::TIMEOUT ? deadlineType : memoryType);
        }, startedAt);
    }
    ~GuardedRegion() { finish(); }
    GuardedRegion(const GuardedRegion&) = delete;
    GuardedRegion& operator=(const GuardedRegion&) = delete;

    void finish() {
        if (finished_) return;
        finished_ = true;
        {
            GilRelease release;
            scope_->disarm();
        }
        Interpreter::clearInterrupt(threadId_);
        // An abort that landed inside conversion code may still be set.
        if (PyErr_Occurred()) {
            PythonError late = fetchPythonError();
            SG_DEBUG("sandbox", "discarding exception left after guarded work: " + late.typeName);
        }
    }

    bool aborted() const { return scope_->abortReason() != AbortReason::NONE; }
    const ResourceGuard::Scope& scope() const { return *scope_; }

private:
    std::unique_ptr<ResourceGuard::Scope> scope_;
    unsigned long threadId_;
    bool finished_ = false;
};

}
}
