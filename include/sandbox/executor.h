#pragma once

#include "sandbox/types.h"
#include "sandbox/environment.h"
#include "sandbox/process_runner.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace pysandbox {
namespace sandbox {

// Runs one submission in a fresh interpreter process under a wall-clock deadline.
class TimedExecutor {
public:
    explicit TimedExecutor(const utils::SandboxConfig& config);
    ~TimedExecutor();

    TimedExecutor(const TimedExecutor&) = delete;
    TimedExecutor& operator=(const TimedExecutor&) = delete;

    Result<std::string> locateInterpreter() const;

    Result<ProcessOutcome> run(const std::string& code, const std::vector<TestCase>& testCases,
                               const RestrictedEnvironment& env, const ResourceLimits& limits,
                               std::chrono::milliseconds timeout);

    // The complete program passed to the interpreter with -c.
    static std::string renderHarness(const RestrictedEnvironment& env);
    static std::vector<std::string> childEnvironment();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
