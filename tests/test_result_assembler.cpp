#include <gtest/gtest.h>
#include "sandbox/result_assembler.h"
#include "sandbox/resource_limiter.h"
#include "utils/logger.h"
#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <sys/resource.h>

using namespace pysandbox;
using namespace pysandbox::sandbox;
using utils::Logger;

class ResultAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::enableConsole(false);
        Logger::setLevel(utils::LogLevel::INFO);
        Logger::clearLogs();
    }

    void TearDown() override {
        Logger::enableConsole(true);
    }

    static ProcessOutcome exitedWith(int code, const std::string& report = "") {
        ProcessOutcome outcome;
        outcome.started = true;
        outcome.exited = true;
        outcome.exitCode = code;
        outcome.reportData = report;
        outcome.wallSeconds = 0.05;
        return outcome;
    }

    static bool logged(const std::string& text) {
        for (const auto& entry : Logger::getRecentLogs(50)) {
            if (entry.message.find(text) != std::string::npos) return true;
        }
        return false;
    }

    ResourceLimits limits;
    std::vector<TestCase> noCases;
};

TEST_F(ResultAssemblerTest, ExecFailureMeansInterpreterDidNotStart) {
    ExecutionResult result = ResultAssembler::assemble(exitedWith(CHILD_EXIT_EXEC_FAILED), limits, noCases);
    EXPECT_EQ(result.errorType, ErrorType::SYSTEM);
    EXPECT_EQ(result.message, "System Error: failed to start interpreter");
    EXPECT_TRUE(result.executionStarted);
}

TEST_F(ResultAssemblerTest, LimitFailureNamesResourceAndErrno) {
    LimitStatus failed;
    failed.ok = false;
    failed.resource = RLIMIT_NPROC;
    failed.errorNumber = EPERM;
    char note[64];
    size_t len = ResourceLimiter::formatFailure(failed, note, sizeof(note));
    ASSERT_GT(len, 0u);

    ExecutionResult result = ResultAssembler::assemble(
        exitedWith(CHILD_EXIT_LIMITS_FAILED, std::string(note, len)), limits, noCases);
    EXPECT_EQ(result.errorType, ErrorType::SYSTEM);
    EXPECT_NE(result.message.find("failed to apply resource limits"), std::string::npos);
    EXPECT_NE(result.message.find("RLIMIT_NPROC"), std::string::npos);
    EXPECT_TRUE(logged("setrlimit(RLIMIT_NPROC) failed"));
}

TEST_F(ResultAssemblerTest, LimitFailureWithoutDetailIsStillReported) {
    ExecutionResult result = ResultAssembler::assemble(exitedWith(CHILD_EXIT_LIMITS_FAILED), limits, noCases);
    EXPECT_EQ(result.errorType, ErrorType::SYSTEM);
    EXPECT_EQ(result.message, "System Error: failed to apply resource limits");
}

TEST_F(ResultAssemblerTest, HarnessReportWinsOverMatchingExitStatus) {
    // A submission can end the interpreter with the same status after reporting.
    ExecutionResult result = ResultAssembler::assemble(
        exitedWith(CHILD_EXIT_LIMITS_FAILED, R"({"status": "ok", "stdout": "done\n"})"), limits, noCases);
    ASSERT_EQ(result.kind, ResultKind::SUCCESS) << result.message;
    EXPECT_EQ(result.stdoutText, "done\n");
}

TEST_F(ResultAssemblerTest, DeadlineAndCpuCeilingAreTimeouts) {
    ProcessOutcome wall = exitedWith(0);
    wall.exited = false;
    wall.timedOut = true;
    wall.termSignal = SIGKILL;
    EXPECT_EQ(ResultAssembler::assemble(wall, limits, noCases).message, "Code execution timed out");

    limits.cpuSeconds = 2;
    ProcessOutcome cpu = exitedWith(0);
    cpu.exited = false;
    cpu.termSignal = SIGKILL;
    cpu.cpuSeconds = 3.0;
    ExecutionResult result = ResultAssembler::assemble(cpu, limits, noCases);
    EXPECT_EQ(result.kind, ResultKind::TIMEOUT);
    EXPECT_EQ(result.message, "CPU time limit exceeded");
}

TEST_F(ResultAssemblerTest, InternalFailureKeepsDetailInLogOnly) {
    std::runtime_error error("bad_alloc in /srv/pysandbox/secret-path");
    ExecutionResult result = ResultAssembler::internalFailure(error);

    EXPECT_EQ(result.errorType, ErrorType::SYSTEM);
    EXPECT_EQ(result.message, "System Error: internal sandbox error");
    EXPECT_EQ(result.message.find("secret-path"), std::string::npos);
    EXPECT_TRUE(logged("secret-path"));
}

TEST_F(ResultAssemblerTest, SupervisorErrorsMapToSecurityOrSystem) {
    ExecutionResult rejected = ResultAssembler::fromError(makeError(ErrorCode::SECURITY_VIOLATION, "import os"));
    EXPECT_EQ(rejected.kind, ResultKind::SECURITY_VIOLATION);
    EXPECT_EQ(rejected.message, "Security Error: import os");

    ExecutionResult spawn = ResultAssembler::fromError(makeError(ErrorCode::SPAWN_FAILED, "fork failed", "EAGAIN"));
    EXPECT_EQ(spawn.errorType, ErrorType::SYSTEM);
    EXPECT_EQ(spawn.message, "System Error: fork failed [EAGAIN]");
    EXPECT_FALSE(spawn.executionStarted);
}

TEST_F(ResultAssemblerTest, CheckMacroCarriesSourceLocation) {
    auto check = [](int value) -> Result<void> {
        PYSANDBOX_CHECK(value > 0, ErrorCode::INVALID_REQUEST, "value must be positive");
        return Result<void>();
    };
    EXPECT_TRUE(check(1).ok());
    Result<void> failed = check(0);
    ASSERT_TRUE(failed.failed());
    EXPECT_EQ(failed.error().code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(failed.error().message, "value must be positive");
    EXPECT_NE(failed.error().file.find("test_result_assembler"), std::string::npos);
    EXPECT_GT(failed.error().line, 0);
}
