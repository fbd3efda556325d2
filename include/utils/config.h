#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace pysandbox {
namespace utils {

struct SandboxConfig {
    std::string pythonPath;
    uint32_t defaultTimeLimit = 30;
    uint64_t defaultMemoryLimit = 128ULL * 1024 * 1024;
    uint32_t maxTimeLimit = 300;
    uint64_t minMemoryLimit = 16ULL * 1024 * 1024;
    uint64_t maxMemoryLimit = 2ULL * 1024 * 1024 * 1024;
    uint32_t maxProcesses = 10;
    uint64_t maxFileSize = 1024 * 1024;
    uint32_t maxOpenFiles = 64;
    uint64_t maxOutputSize = 1024 * 1024;
    uint64_t maxReportSize = 16ULL * 1024 * 1024;
    uint64_t maxCodeSize = 1024 * 1024;
    uint32_t recursionLimit = 500;
};

struct LoggingConfig {
    std::string level = "warn";
    std::string file;
    bool console = true;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();
    void applyEnvironment();

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

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    SandboxConfig getSandboxConfig() const;
    LoggingConfig getLoggingConfig() const;
    void setSandboxConfig(const SandboxConfig& config);

    void onChange(std::function<void(const std::string&)> callback);

    std::string getConfigPath() const;
    size_t size() const;

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
