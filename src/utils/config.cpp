#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace pysandbox {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;
};

static std::string trimBlank(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    SandboxConfig sandbox;
    set("sandbox.python_path", "");
    set("sandbox.default_time_limit", static_cast<int64_t>(sandbox.defaultTimeLimit));
    set("sandbox.default_memory_limit", static_cast<int64_t>(sandbox.defaultMemoryLimit));
    set("sandbox.max_time_limit", static_cast<int64_t>(sandbox.maxTimeLimit));
    set("sandbox.min_memory_limit", static_cast<int64_t>(sandbox.minMemoryLimit));
    set("sandbox.max_memory_limit", static_cast<int64_t>(sandbox.maxMemoryLimit));
    set("sandbox.max_processes", static_cast<int64_t>(sandbox.maxProcesses));
    set("sandbox.max_file_size", static_cast<int64_t>(sandbox.maxFileSize));
    set("sandbox.max_open_files", static_cast<int64_t>(sandbox.maxOpenFiles));
    set("sandbox.max_output_size", static_cast<int64_t>(sandbox.maxOutputSize));
    set("sandbox.max_report_size", static_cast<int64_t>(sandbox.maxReportSize));
    set("sandbox.max_code_size", static_cast<int64_t>(sandbox.maxCodeSize));
    set("sandbox.recursion_limit", static_cast<int64_t>(sandbox.recursionLimit));

    LoggingConfig logging;
    set("log.level", logging.level);
    set("log.file", logging.file);
    set("log.console", logging.console);
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
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
        std::string trimmed = trimBlank(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto pos = trimmed.find('=');
        if (pos == std::string::npos) continue;

        std::string key = trimBlank(trimmed.substr(0, pos));
        std::string value = trimBlank(trimmed.substr(pos + 1));
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

    file << "# pysandbox configuration\n\n";

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

void Config::applyEnvironment() {
    if (const char* python = std::getenv("PYSANDBOX_PYTHON")) {
        if (*python) set("sandbox.python_path", std::string(python));
    }
    if (const char* level = std::getenv("PYSANDBOX_LOG_LEVEL")) {
        if (*level) set("log.level", std::string(level));
    }
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
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;

    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trimBlank(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    std::function<void(const std::string&)> callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data[key] = value;
        callback = impl_->changeCallback;
    }
    if (callback) callback(key);
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    set(key, oss.str());
}

void Config::set(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.erase(key);
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

SandboxConfig Config::getSandboxConfig() const {
    SandboxConfig cfg;
    cfg.pythonPath = getString("sandbox.python_path", "");
    cfg.defaultTimeLimit = static_cast<uint32_t>(getInt64("sandbox.default_time_limit", cfg.defaultTimeLimit));
    cfg.defaultMemoryLimit = static_cast<uint64_t>(getInt64("sandbox.default_memory_limit", static_cast<int64_t>(cfg.defaultMemoryLimit)));
    cfg.maxTimeLimit = static_cast<uint32_t>(getInt64("sandbox.max_time_limit", cfg.maxTimeLimit));
    cfg.minMemoryLimit = static_cast<uint64_t>(getInt64("sandbox.min_memory_limit", static_cast<int64_t>(cfg.minMemoryLimit)));
    cfg.maxMemoryLimit = static_cast<uint64_t>(getInt64("sandbox.max_memory_limit", static_cast<int64_t>(cfg.maxMemoryLimit)));
    cfg.maxProcesses = static_cast<uint32_t>(getInt64("sandbox.max_processes", cfg.maxProcesses));
    cfg.maxFileSize = static_cast<uint64_t>(getInt64("sandbox.max_file_size", static_cast<int64_t>(cfg.maxFileSize)));
    cfg.maxOpenFiles = static_cast<uint32_t>(getInt64("sandbox.max_open_files", cfg.maxOpenFiles));
    cfg.maxOutputSize = static_cast<uint64_t>(getInt64("sandbox.max_output_size", static_cast<int64_t>(cfg.maxOutputSize)));
    cfg.maxReportSize = static_cast<uint64_t>(getInt64("sandbox.max_report_size", static_cast<int64_t>(cfg.maxReportSize)));
    cfg.maxCodeSize = static_cast<uint64_t>(getInt64("sandbox.max_code_size", static_cast<int64_t>(cfg.maxCodeSize)));
    cfg.recursionLimit = static_cast<uint32_t>(getInt64("sandbox.recursion_limit", cfg.recursionLimit));
    return cfg;
}

LoggingConfig Config::getLoggingConfig() const {
    LoggingConfig cfg;
    cfg.level = getString("log.level", cfg.level);
    cfg.file = getString("log.file", cfg.file);
    cfg.console = getBool("log.console", cfg.console);
    return cfg;
}

void Config::setSandboxConfig(const SandboxConfig& config) {
    set("sandbox.python_path", config.pythonPath);
    set("sandbox.default_time_limit", static_cast<int64_t>(config.defaultTimeLimit));
    set("sandbox.default_memory_limit", static_cast<int64_t>(config.defaultMemoryLimit));
    set("sandbox.max_time_limit", static_cast<int64_t>(config.maxTimeLimit));
    set("sandbox.min_memory_limit", static_cast<int64_t>(config.minMemoryLimit));
    set("sandbox.max_memory_limit", static_cast<int64_t>(config.maxMemoryLimit));
    set("sandbox.max_processes", static_cast<int64_t>(config.maxProcesses));
    set("sandbox.max_file_size", static_cast<int64_t>(config.maxFileSize));
    set("sandbox.max_open_files", static_cast<int64_t>(config.maxOpenFiles));
    set("sandbox.max_output_size", static_cast<int64_t>(config.maxOutputSize));
    set("sandbox.max_report_size", static_cast<int64_t>(config.maxReportSize));
    set("sandbox.max_code_size", static_cast<int64_t>(config.maxCodeSize));
    set("sandbox.recursion_limit", static_cast<int64_t>(config.recursionLimit));
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

}
}
