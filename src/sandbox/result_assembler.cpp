#include "sandbox/result_assembler.h"
#include "sandbox/codec.h"
#include "sandbox/resource_limiter.h"
#include "sandbox/test_runner.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <csignal>
#include <cstring>

namespace pysandbox {
namespace sandbox {

namespace {

const char* kCategory = "result";

}

const char* resultKindToString(ResultKind kind) {
    switch (kind) {
        case ResultKind::SUCCESS: return "success";
        case ResultKind::SECURITY_VIOLATION: return "security_violation";
        case ResultKind::TIMEOUT: return "timeout";
        case ResultKind::RUNTIME_FAILURE: return "runtime_failure";
        default: return "unknown";
    }
}

const char* errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::NONE: return "none";
        case ErrorType::SECURITY: return "security";
        case ErrorType::TIMEOUT: return "timeout";
        case ErrorType::EXECUTION: return "execution";
        case ErrorType::SYSTEM: return "system";
        default: return "system";
    }
}

ExecutionResult ResultAssembler::securityViolation(const std::string& detail) {
    ExecutionResult result;
    result.kind = ResultKind::SECURITY_VIOLATION;
    result.errorType = ErrorType::SECURITY;
    result.message = "Security Error: " + detail;
    return result;
}

ExecutionResult ResultAssembler::timeout(const std::string& message, bool started, double elapsedSeconds) {
    ExecutionResult result;
    result.kind = ResultKind::TIMEOUT;
    result.errorType = ErrorType::TIMEOUT;
    result.message = message;
    result.executionStarted = started;
    result.executionTimeSeconds = elapsedSeconds;
    return result;
}

ExecutionResult ResultAssembler::executionFailure(const std::string& detail, const std::string& traceback,
                                                  bool started, double elapsedSeconds) {
    ExecutionResult result;
    result.kind = ResultKind::RUNTIME_FAILURE;
    result.errorType = ErrorType::EXECUTION;
    result.message = "Execution Error: " + detail;
    result.traceback = traceback;
    result.executionStarted = started;
    result.executionTimeSeconds = elapsedSeconds;
    return result;
}

ExecutionResult ResultAssembler::systemFailure(const std::string& detail, bool started, double elapsedSeconds) {
    ExecutionResult result;
    result.kind = ResultKind::RUNTIME_FAILURE;
    result.errorType = ErrorType::SYSTEM;
    result.message = "System Error: " + detail;
    result.executionStarted = started;
    result.executionTimeSeconds = elapsedSeconds;
    return result;
}

ExecutionResult ResultAssembler::internalFailure(const std::exception& e) {
    LOG_ERROR(kCategory, std::string("internal failure: ") + e.what());
    return systemFailure("internal sandbox error");
}

ExecutionResult ResultAssembler::fromError(const Error& error) {
    if (error.code == ErrorCode::SECURITY_VIOLATION) {
        return securityViolation(error.message);
    }
    return systemFailure(describeError(error));
}

bool ResultAssembler::cpuLimitHit(const ProcessOutcome& outcome, const ResourceLimits& limits) {
    if (outcome.termSignal == SIGXCPU) return true;
    // Past the soft limit the kernel escalates to SIGKILL at the hard one.
    return outcome.termSignal == SIGKILL && limits.cpuSeconds > 0 &&
           outcome.cpuSeconds >= static_cast<double>(limits.cpuSeconds);
}

std::string ResultAssembler::signalName(int sig) {
    const char* name = strsignal(sig);
    return "signal " + std::to_string(sig) + (name ? std::string(" (") + name + ")" : std::string());
}

ExecutionResult ResultAssembler::assemble(const ProcessOutcome& outcome, const ResourceLimits& limits,
                                          const std::vector<TestCase>& testCases) {
    const double elapsed = outcome.wallSeconds;

    if (outcome.timedOut) {
        return timeout("Code execution timed out", true, elapsed);
    }
    if (cpuLimitHit(outcome, limits)) {
        return timeout("CPU time limit exceeded", true, elapsed);
    }

    if (outcome.exited && outcome.exitCode == CHILD_EXIT_LIMITS_FAILED) {
        LimitStatus status;
        if (ResourceLimiter::parseFailure(outcome.reportData, status)) {
            std::string detail = ResourceLimiter::describe(status);
            LOG_ERROR(kCategory, detail);
            return systemFailure("failed to apply resource limits: " + detail, true, elapsed);
        }
        if (outcome.reportData.empty()) {
            LOG_ERROR(kCategory, "child exited before exec while applying resource limits");
            return systemFailure("failed to apply resource limits", true, elapsed);
        }
    }

    if (outcome.reportData.empty()) {
        if (outcome.exited && outcome.exitCode == CHILD_EXIT_EXEC_FAILED) {
            return systemFailure("failed to start interpreter", true, elapsed);
        }
        if (outcome.outputLimitExceeded) {
            return executionFailure("output limit exceeded", "", true, elapsed);
        }
        if (outcome.termSignal != 0) {
            return executionFailure("process terminated by " + signalName(outcome.termSignal),
                                    utils::Formatter::truncate(outcome.stderrData, 65536), true, elapsed);
        }
        if (outcome.exited && outcome.exitCode != 0) {
            return executionFailure("interpreter exited with status " + std::to_string(outcome.exitCode),
                                    utils::Formatter::truncate(outcome.stderrData, 65536), true, elapsed);
        }
        return systemFailure("interpreter produced no report", true, elapsed);
    }

    if (outcome.outputLimitExceeded) {
        return executionFailure("output limit exceeded", "", true, elapsed);
    }

    auto parsed = Codec::parseHarnessReport(outcome.reportData);
    if (parsed.failed()) {
        LOG_ERROR(kCategory, parsed.error().message);
        return systemFailure(parsed.error().message, true, elapsed);
    }
    const HarnessReport& report = parsed.value();

    if (report.status == "security") {
        return securityViolation(report.error);
    }
    if (report.status == "execution") {
        return executionFailure(report.error, report.traceback, true, elapsed);
    }
    if (report.status == "system") {
        return systemFailure(report.error, true, elapsed);
    }

    if (outcome.termSignal != 0 || (outcome.exited && outcome.exitCode != 0)) {
        LOG_WARN(kCategory, "interpreter ended abnormally after reporting: exit=" +
                 std::to_string(outcome.exitCode) + " signal=" + std::to_string(outcome.termSignal));
    }
    if (report.outputTruncated) {
        LOG_WARN(kCategory, "submission output truncated");
    }

    ExecutionResult result;
    result.kind = ResultKind::SUCCESS;
    result.errorType = ErrorType::NONE;
    result.executionStarted = true;
    result.stdoutText = report.stdoutText;
    result.stderrText = report.stderrText;
    result.executionTimeSeconds = report.executionTimeSeconds;
    result.memoryUsedBytes = outcome.maxRssBytes;
    result.testResults = TestCaseRunner::score(testCases, report.cases);
    return result;
}

}
}
