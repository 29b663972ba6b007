#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <mutex>

namespace snipguard {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;
    
    void notifyChange(const std::string& key) {
        if (changeCallback) changeCallback(key);
    }
    
    void put(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx);
        data[key] = value;
        notifyChange(key);
    }
};

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config::Config(const Config& other) : impl_(std::make_unique<Impl>()) {
    std::lock_guard<std::mutex> lock(other.impl_->mtx);
    impl_->data = other.impl_->data;
    impl_->configPath = other.impl_->configPath;
}

Config& Config::operator=(const Config& other) {
    if (this == &other) return *this;
    std::scoped_lock lock(impl_->mtx, other.impl_->mtx);
    impl_->data = other.impl_->data;
    impl_->configPath = other.impl_->configPath;
    return *this;
}

Config::~Config() = default;

bool Config::loadDefaults() {
    set("sandbox.profile", "permissive");
    set("sandbox.max_memory_mb", 2048);
    set("sandbox.max_time_seconds", 120);
    set("sandbox.memory_tolerance", 1.5);
    set("sandbox.enable_text_repair", true);
    
    set("log.level", "info");
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;
    
    while (std::getline(file, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;
        
        auto pos = trimmed.find('=');
        if (pos == std::string::npos) continue;
        
        std::string key = trim(trimmed.substr(0, pos));
        std::string value = trim(trimmed.substr(pos + 1));
        if (key.empty()) continue;
        impl_->data[key] = value;
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;
    
    std::ofstream file(savePath);
    if (!file.is_open()) return false;
    
    file << "# snipguard configuration\n\n";
    
    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());
    
    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return true;
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stod(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    return def;
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;
    
    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->put(key, value);
}

void Config::set(const std::string& key, const char* value) {
    impl_->put(key, value ? std::string(value) : std::string());
}

void Config::set(const std::string& key, int value) {
    impl_->put(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    impl_->put(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    impl_->put(key, oss.str());
}

void Config::set(const std::string& key, bool value) {
    impl_->put(key, value ? "true" : "false");
}

void Config::setList(const std::string& key, const std::vector<std::string>& values) {
    std::string joined;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) joined += ",";
        joined += values[i];
    }
    impl_->put(key, joined);
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.erase(key);
    impl_->notifyChange(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.clear();
}

void Config::merge(const Config& other) {
    for (const auto& key : other.keys()) {
        set(key, other.getString(key));
    }
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

bool Config::empty() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.empty();
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

SandboxSettings Config::getSandboxSettings() const {
    SandboxSettings cfg;
    cfg.profile = getString("sandbox.profile", "permissive");
    cfg.maxMemoryMb = static_cast<uint64_t>(getInt64("sandbox.max_memory_mb", 2048));
    cfg.maxTimeSeconds = static_cast<uint32_t>(getInt64("sandbox.max_time_seconds", 120));
    cfg.memoryTolerance = getDouble("sandbox.memory_tolerance", 1.5);
    cfg.enableStaticAnalysis = getBool("sandbox.enable_static_analysis", false);
    cfg.enableTextRepair = getBool("sandbox.enable_text_repair", true);
    cfg.enforcePolicy = getString("sandbox.enforce_policy", "");
    cfg.allowedModules = getList("sandbox.allowed_modules");
    cfg.allowedBuiltins = getList("sandbox.allowed_builtins");
    return cfg;
}

PolicySettings Config::getPolicySettings() const {
    PolicySettings cfg;
    cfg.dangerousModules = getList("policy.dangerous_modules");
    cfg.dangerousBuiltins = getList("policy.dangerous_builtins");
    cfg.dangerousAttributes = getList("policy.dangerous_attributes");
    return cfg;
}

LogSettings Config::getLogSettings() const {
    LogSettings cfg;
    cfg.level = getString("log.level", "info");
    cfg.file = getString("log.file", "");
    return cfg;
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = std::move(callback);
}

}
}
