#pragma once

#include "sandbox/types.h"
#include "sandbox/static_validator.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace pysandbox {
namespace sandbox {

enum class Stage {
    PENDING,
    VALIDATING,
    REJECTED,
    LIMITING,
    EXECUTING,
    TIMED_OUT,
    FAULTED,
    EXECUTED,
    TESTING_CASES,
    DONE
};

const char* stageToString(Stage stage);

// Forward-only stage machine of one invocation.
class StageTracker {
public:
    StageTracker();

    bool advance(Stage next);
    Stage current() const { return trace_.back(); }
    bool isTerminal() const;
    const std::vector<Stage>& trace() const { return trace_; }

    static bool canTransition(Stage from, Stage to);

private:
    std::vector<Stage> trace_;
};

struct SandboxStats {
    uint64_t totalExecutions;
    uint64_t successfulExecutions;
    uint64_t failedExecutions;
    uint64_t timeouts;
    uint64_t securityViolations;
    uint64_t totalExecutionTimeMs;
    uint64_t avgExecutionTimeMs;
    uint64_t peakMemoryUsage;
};

class Sandbox {
public:
    Sandbox();
    explicit Sandbox(const utils::SandboxConfig& config);
    ~Sandbox();

    // Never throws; every failure comes back as a result.
    ExecutionResult execute(const ExecutionRequest& request);

    CodeAnalysis analyzeCode(const std::string& code) const;
    bool isCodeSafe(const std::string& code) const;

    void setConfig(const utils::SandboxConfig& config);
    utils::SandboxConfig getConfig() const;

    void onViolation(std::function<void(const std::string&)> callback);
    void onTimeout(std::function<void(const std::string&)> callback);

    std::vector<Stage> lastStages() const;

    SandboxStats getStats() const;
    void resetStats();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
