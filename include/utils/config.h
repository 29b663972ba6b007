#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace snipguard {
namespace utils {

struct SandboxSettings {
    std::string profile = "permissive";
    uint64_t maxMemoryMb = 2048;
    uint32_t maxTimeSeconds = 120;
    double memoryTolerance = 1.5;
    bool enableStaticAnalysis = false;
    bool enableTextRepair = true;
    // Empty string means "whatever the profile says".
    std::string enforcePolicy;
    std::vector<std::string> allowedModules;
    std::vector<std::string> allowedBuiltins;
};

struct PolicySettings {
    std::vector<std::string> dangerousModules;
    std::vector<std::string> dangerousBuiltins;
    std::vector<std::string> dangerousAttributes;
};

struct LogSettings {
    std::string level = "info";
    std::string file;
};

// Flat key=value store. Lines starting with '#' are comments; list values
// are comma separated.
class Config {
public:
    Config();
    Config(const Config& other);
    Config& operator=(const Config& other);
    ~Config();
    
    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();
    
    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;
    
    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);
    void setList(const std::string& key, const std::vector<std::string>& values);
    
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;
    void clear();
    void merge(const Config& other);
    size_t size() const;
    bool empty() const;
    
    std::string getConfigPath() const;
    
    SandboxSettings getSandboxSettings() const;
    PolicySettings getPolicySettings() const;
    LogSettings getLogSettings() const;
    
    void onChange(std::function<void(const std::string&)> callback);
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
