#pragma once

#include "sandbox/types.h"
#include "sandbox/process_runner.h"
#include "infrastructure/error_handling.h"
#include <exception>
#include <string>
#include <vector>

namespace pysandbox {
namespace sandbox {

class ResultAssembler {
public:
    static ExecutionResult assemble(const ProcessOutcome& outcome, const ResourceLimits& limits,
                                    const std::vector<TestCase>& testCases);

    static ExecutionResult securityViolation(const std::string& detail);
    static ExecutionResult timeout(const std::string& message, bool started, double elapsedSeconds);
    static ExecutionResult executionFailure(const std::string& detail, const std::string& traceback,
                                            bool started, double elapsedSeconds);
    static ExecutionResult systemFailure(const std::string& detail, bool started = false,
                                         double elapsedSeconds = 0.0);

    // Logs the exception text and returns a fixed message; internals never reach the result.
    static ExecutionResult internalFailure(const std::exception& e);

    // Shapes a supervisor-side error (spawn, I/O, missing interpreter) into a result.
    static ExecutionResult fromError(const Error& error);

    static bool cpuLimitHit(const ProcessOutcome& outcome, const ResourceLimits& limits);
    static std::string signalName(int sig);
};

}
}
