#pragma once

#include "sandbox/types.h"
#include "sandbox/test_runner.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pysandbox {
namespace sandbox {

// Decoded fd 3 report of one harness run.
struct HarnessReport {
    std::string status;  // ok | security | execution | system
    std::string stdoutText;
    std::string stderrText;
    double executionTimeSeconds = 0.0;
    bool outputTruncated = false;
    std::string error;
    std::string traceback;
    std::vector<CaseReport> cases;
};

class Codec {
public:
    static Result<ExecutionRequest> parseRequest(const std::string& text, const utils::SandboxConfig& config);
    static Result<ExecutionRequest> parseRequest(const nlohmann::json& j, const utils::SandboxConfig& config);
    static Result<std::vector<TestCase>> parseTestCases(const nlohmann::json& j);

    // "134217728", "128m", "128M", "1g"
    static Result<uint64_t> parseMemoryLimit(const std::string& text);
    static Result<void> checkLimits(uint32_t timeLimitSeconds, uint64_t memoryLimitBytes,
                                    const utils::SandboxConfig& config);

    static std::string encodeHarnessRequest(const std::string& code, const std::vector<TestCase>& testCases);
    static Result<HarnessReport> parseHarnessReport(const std::string& data);

    static nlohmann::json toJson(const ExecutionResult& result);
    static nlohmann::json toJson(const TestResult& result);
};

}
}
