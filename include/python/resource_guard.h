#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

namespace snipguard {
namespace python {

struct ResourceLimits {
    uint64_t maxMemoryBytes = 2048ULL * 1024 * 1024;
    uint32_t maxTimeSeconds = 120;
};

enum class AbortReason {
    NONE,
    TIMEOUT,
    MEMORY
};

const char* abortReasonToString(AbortReason reason);

class MemoryLimitExceeded : public std::runtime_error {
public:
    MemoryLimitExceeded(uint64_t limitBytes, uint64_t usedBytes);
    
    uint64_t limitBytes() const { return limitBytes_; }
    uint64_t usedBytes() const { return usedBytes_; }
    
private:
    uint64_t limitBytes_;
    uint64_t usedBytes_;
};

// Resident set size of this process from /proc/self/status, or nullopt when
// it cannot be read.
std::optional<uint64_t> currentResidentBytes();

// Bounds a protected region in time and memory. The guard itself is
// immutable; each arm() call gets its own watchdog thread.
class ResourceGuard {
public:
    using MemorySampler = std::function<std::optional<uint64_t>()>;
    using AbortHandler = std::function<void(AbortReason)>;
    
    static constexpr double kDefaultTolerance = 1.5;
    
    explicit ResourceGuard(const ResourceLimits& limits,
                           double tolerance = kDefaultTolerance,
                           MemorySampler sampler = currentResidentBytes);
    
    const ResourceLimits& limits() const { return limits_; }
    double tolerance() const { return tolerance_; }
    uint64_t hardCeilingBytes() const;
    
    // Throws MemoryLimitExceeded when current usage is above the hard ceiling.
    // Unknown usage never counts as a violation.
    void checkMemory() const;
    
    // Interval of the watchdog's deadline and memory checks, and of abort
    // re-assertion after the first abort.
    void setTickInterval(std::chrono::milliseconds tick) { tick_ = tick; }
    void setReassertInterval(std::chrono::milliseconds interval) { reassert_ = interval; }
    
    class Scope {
    public:
        ~Scope();
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        
        // Stops the watchdog and waits for it. Idempotent. onAbort is never
        // invoked after disarm() returns.
        void disarm();
        
        bool timeoutOccurred() const { return reason_.load() == AbortReason::TIMEOUT; }
        bool memoryExceeded() const { return reason_.load() == AbortReason::MEMORY; }
        AbortReason abortReason() const { return reason_.load(); }
        uint64_t observedMemoryBytes() const { return observed_.load(); }
        double elapsedSeconds() const;
        
    private:
        friend class ResourceGuard;
        Scope(const ResourceGuard& guard, AbortHandler onAbort, std::chrono::steady_clock::time_point startedAt);
        void watch();
        
        const ResourceGuard& guard_;
        AbortHandler onAbort_;
        std::chrono::steady_clock::time_point start_;
        std::chrono::steady_clock::time_point deadline_;
        std::mutex mtx_;
        std::condition_variable cv_;
        bool disarmed_ = false;
        std::atomic<AbortReason> reason_{AbortReason::NONE};
        std::atomic<uint64_t> observed_{0};
        std::thread watcher_;
    };
    
    // The guard must outlive the returned scope. The deadline counts from
    // startedAt, so work done before arming is charged to the time budget.
    std::unique_ptr<Scope> arm(AbortHandler onAbort) const;
    std::unique_ptr<Scope> arm(AbortHandler onAbort, std::chrono::steady_clock::time_point startedAt) const;
    
private:
    ResourceLimits limits_;
    double tolerance_;
    MemorySampler sampler_;
    std::chrono::milliseconds tick_{50};
    std::chrono::milliseconds reassert_{100};
};

}
}
