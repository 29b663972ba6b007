#include "python/resource_guard.h"
#include "utils/logger.h"
#include <fstream>
#include <sstream>
#include <string>

namespace snipguard {
namespace python {

namespace {

std::string megabytes(uint64_t bytes) {
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    return oss.str();
}

}

const char* abortReasonToString(AbortReason reason) {
    switch (reason) {
        case AbortReason::NONE: return "none";
        case AbortReason::TIMEOUT: return "timeout";
        case AbortReason::MEMORY: return "memory";
    }
    return "unknown";
}

MemoryLimitExceeded::MemoryLimitExceeded(uint64_t limitBytes, uint64_t usedBytes)
    : std::runtime_error("memory usage " + megabytes(usedBytes) + " exceeds limit of " + megabytes(limitBytes)),
      limitBytes_(limitBytes), usedBytes_(usedBytes) {}

std::optional<uint64_t> currentResidentBytes() {
    std::ifstream status("/proc/self/status");
    if (!status.is_open()) return std::nullopt;
    
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 6, "VmRSS:") == 0) {
            std::istringstream iss(line.substr(6));
            uint64_t kb = 0;
            if (!(iss >> kb)) return std::nullopt;
            return kb * 1024;
        }
    }
    return std::nullopt;
}

ResourceGuard::ResourceGuard(const ResourceLimits& limits, double tolerance, MemorySampler sampler)
    : limits_(limits), tolerance_(tolerance), sampler_(std::move(sampler)) {}

uint64_t ResourceGuard::hardCeilingBytes() const {
    return static_cast<uint64_t>(static_cast<double>(limits_.maxMemoryBytes) * tolerance_);
}

void ResourceGuard::checkMemory() const {
    std::optional<uint64_t> usage;
    if (sampler_) {
        try {
            usage = sampler_();
        } catch (const std::exception& e) {
            SG_DEBUG("guard", std::string("memory sampler failed: ") + e.what());
        }
    }
    if (!usage) {
        SG_DEBUG("guard", "memory usage unavailable, skipping check");
        return;
    }
    if (*usage > hardCeilingBytes()) {
        throw MemoryLimitExceeded(limits_.maxMemoryBytes, *usage);
    }
}

std::unique_ptr<ResourceGuard::Scope> ResourceGuard::arm(AbortHandler onAbort) const {
    return arm(std::move(onAbort), std::chrono::steady_clock::now());
}

std::unique_ptr<ResourceGuard::Scope> ResourceGuard::arm(AbortHandler onAbort,
                                                         std::chrono::steady_clock::time_point startedAt) const {
    return std::unique_ptr<Scope>(new Scope(*this, std::move(onAbort), startedAt));
}

ResourceGuard::Scope::Scope(const ResourceGuard& guard, AbortHandler onAbort,
                            std::chrono::steady_clock::time_point startedAt)
    : guard_(guard), onAbort_(std::move(onAbort)), start_(startedAt) {
    deadline_ = start_ + std::chrono::seconds(guard_.limits_.maxTimeSeconds);
    watcher_ = std::thread(&Scope::watch, this);
}

ResourceGuard::Scope::~Scope() {
    disarm();
}

void ResourceGuard::Scope::disarm() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        disarmed_ = true;
    }
    cv_.notify_all();
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id()) {
        watcher_.join();
    }
}

double ResourceGuard::Scope::elapsedSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

void ResourceGuard::Scope::watch() {
    std::unique_lock<std::mutex> lock(mtx_);
    std::chrono::steady_clock::time_point lastAbort;
    
    while (!disarmed_) {
        auto wake = std::chrono::steady_clock::now() + guard_.tick_;
        if (reason_.load() == AbortReason::NONE && deadline_ < wake) wake = deadline_;
        cv_.wait_until(lock, wake, [this]() { return disarmed_; });
        if (disarmed_) break;
        
        auto now = std::chrono::steady_clock::now();
        AbortReason fire = AbortReason::NONE;
        
        if (reason_.load() == AbortReason::NONE) {
            if (now >= deadline_) {
                reason_ = AbortReason::TIMEOUT;
                fire = AbortReason::TIMEOUT;
                SG_WARN("guard", "deadline of " + std::to_string(guard_.limits_.maxTimeSeconds) +
                        "s reached, aborting");
            } else {
                try {
                    guard_.checkMemory();
                } catch (const MemoryLimitExceeded& e) {
                    observed_ = e.usedBytes();
                    reason_ = AbortReason::MEMORY;
                    fire = AbortReason::MEMORY;
                    SG_WARN("guard", std::string(e.what()) + ", aborting");
                }
            }
        } else if (now - lastAbort >= guard_.reassert_) {
            fire = reason_.load();
            SG_DEBUG("guard", std::string("re-asserting ") + abortReasonToString(fire) + " abort");
        }
        
        if (fire != AbortReason::NONE) {
            lastAbort = now;
            // Released while the handler runs so disarm() can always proceed.
            lock.unlock();
            if (onAbort_) onAbort_(fire);
            lock.lock();
        }
    }
}

}
}
