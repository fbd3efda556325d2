#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace pysandbox {
namespace sandbox {

constexpr uint32_t DEFAULT_TIME_LIMIT_SECONDS = 30;
constexpr uint64_t DEFAULT_MEMORY_LIMIT_BYTES = 128ULL * 1024 * 1024;

struct TestCase {
    bool hasName = false;
    std::string name;
    std::string testCode;
    std::string expectedOutput;
};

struct ExecutionRequest {
    std::string code;
    std::vector<TestCase> testCases;
    uint32_t timeLimitSeconds = DEFAULT_TIME_LIMIT_SECONDS;
    uint64_t memoryLimitBytes = DEFAULT_MEMORY_LIMIT_BYTES;
};

struct ResourceLimits {
    uint64_t cpuSeconds = DEFAULT_TIME_LIMIT_SECONDS;
    uint64_t addressSpaceBytes = DEFAULT_MEMORY_LIMIT_BYTES;
    uint64_t maxProcesses = 10;
    uint64_t maxFileSizeBytes = 1024 * 1024;
    uint64_t maxOpenFiles = 64;
    uint64_t coreDumpBytes = 0;
};

struct TestResult {
    uint32_t testNumber = 0;
    std::string testName;
    bool passed = false;
    std::string expectedOutput;
    std::string actualOutput;
    std::string error;
    double executionTimeSeconds = 0.0;

    bool hasError() const { return !error.empty(); }
};

enum class ResultKind {
    SUCCESS,
    SECURITY_VIOLATION,
    TIMEOUT,
    RUNTIME_FAILURE
};

enum class ErrorType {
    NONE,
    SECURITY,
    TIMEOUT,
    EXECUTION,
    SYSTEM
};

struct ExecutionResult {
    ResultKind kind = ResultKind::RUNTIME_FAILURE;
    ErrorType errorType = ErrorType::SYSTEM;

    std::string stdoutText;
    std::string stderrText;
    double executionTimeSeconds = 0.0;
    bool executionStarted = false;
    uint64_t memoryUsedBytes = 0;
    std::vector<TestResult> testResults;

    std::string message;
    std::string traceback;

    bool success() const { return kind == ResultKind::SUCCESS; }
};

const char* resultKindToString(ResultKind kind);
const char* errorTypeToString(ErrorType type);

}
}
