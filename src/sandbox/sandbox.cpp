#include "sandbox/sandbox.h"
#include "sandbox/codec.h"
#include "sandbox/environment.h"
#include "sandbox/executor.h"
#include "sandbox/resource_limiter.h"
#include "sandbox/result_assembler.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <atomic>
#include <chrono>
#include <mutex>

namespace pysandbox {
namespace sandbox {

namespace {

const char* kCategory = "sandbox";

}

const char* stageToString(Stage stage) {
    switch (stage) {
        case Stage::PENDING: return "pending";
        case Stage::VALIDATING: return "validating";
        case Stage::REJECTED: return "rejected";
        case Stage::LIMITING: return "limiting";
        case Stage::EXECUTING: return "executing";
        case Stage::TIMED_OUT: return "timed_out";
        case Stage::FAULTED: return "faulted";
        case Stage::EXECUTED: return "executed";
        case Stage::TESTING_CASES: return "testing_cases";
        case Stage::DONE: return "done";
        default: return "unknown";
    }
}

StageTracker::StageTracker() : trace_{Stage::PENDING} {}

bool StageTracker::canTransition(Stage from, Stage to) {
    switch (from) {
        case Stage::PENDING: return to == Stage::VALIDATING;
        case Stage::VALIDATING: return to == Stage::REJECTED || to == Stage::LIMITING;
        // Limits outside the configured range fault before anything is spawned.
        case Stage::LIMITING: return to == Stage::EXECUTING || to == Stage::FAULTED;
        case Stage::EXECUTING:
            return to == Stage::TIMED_OUT || to == Stage::FAULTED || to == Stage::EXECUTED;
        case Stage::EXECUTED: return to == Stage::TESTING_CASES;
        case Stage::TESTING_CASES: return to == Stage::DONE;
        default: return false;
    }
}

bool StageTracker::advance(Stage next) {
    if (!canTransition(current(), next)) {
        LOG_ERROR(kCategory, std::string("refused stage transition ") + stageToString(current()) + " -> " +
                  stageToString(next));
        return false;
    }
    trace_.push_back(next);
    return true;
}

bool StageTracker::isTerminal() const {
    Stage s = current();
    return s == Stage::REJECTED || s == Stage::TIMED_OUT || s == Stage::FAULTED || s == Stage::DONE;
}

struct Sandbox::Impl {
    utils::SandboxConfig config;
    StaticValidator validator;

    std::vector<Stage> lastStages;
    mutable std::mutex mtx;

    std::function<void(const std::string&)> violationCallback;
    std::function<void(const std::string&)> timeoutCallback;

    std::atomic<uint64_t> executionCount{0};
    std::atomic<uint64_t> successfulExecutions{0};
    std::atomic<uint64_t> failedExecutions{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> violationCount{0};
    std::atomic<uint64_t> totalExecutionTimeMs{0};
    std::atomic<uint64_t> peakMemoryUsage{0};

    ExecutionResult run(const ExecutionRequest& request, StageTracker& stages);
    void record(const ExecutionResult& result);
};

ExecutionResult Sandbox::Impl::run(const ExecutionRequest& request, StageTracker& stages) {
    stages.advance(Stage::VALIDATING);
    auto validation = validator.validate(request.code);
    if (validation.failed()) {
        stages.advance(Stage::REJECTED);
        return ResultAssembler::securityViolation(validation.error().message);
    }

    stages.advance(Stage::LIMITING);
    auto range = Codec::checkLimits(request.timeLimitSeconds, request.memoryLimitBytes, config);
    if (range.failed()) {
        stages.advance(Stage::FAULTED);
        return ResultAssembler::fromError(range.error());
    }
    ResourceLimits limits = ResourceLimiter::limitsFor(request.timeLimitSeconds, request.memoryLimitBytes, config);
    RestrictedEnvironment env = EnvironmentBuilder::build(config);

    stages.advance(Stage::EXECUTING);
    TimedExecutor executor(config);
    auto outcome = executor.run(request.code, request.testCases, env, limits,
                                std::chrono::seconds(request.timeLimitSeconds));
    if (outcome.failed()) {
        stages.advance(Stage::FAULTED);
        return ResultAssembler::fromError(outcome.error());
    }

    ExecutionResult result = ResultAssembler::assemble(outcome.value(), limits, request.testCases);
    if (result.kind == ResultKind::TIMEOUT) {
        stages.advance(Stage::TIMED_OUT);
    } else if (!result.success()) {
        stages.advance(Stage::FAULTED);
    } else {
        stages.advance(Stage::EXECUTED);
        stages.advance(Stage::TESTING_CASES);
        stages.advance(Stage::DONE);
    }
    return result;
}

void Sandbox::Impl::record(const ExecutionResult& result) {
    executionCount++;
    switch (result.kind) {
        case ResultKind::SUCCESS:
            successfulExecutions++;
            break;
        case ResultKind::SECURITY_VIOLATION:
            violationCount++;
            failedExecutions++;
            if (violationCallback) violationCallback(result.message);
            break;
        case ResultKind::TIMEOUT:
            timeouts++;
            failedExecutions++;
            if (timeoutCallback) timeoutCallback(result.message);
            break;
        default:
            failedExecutions++;
            break;
    }
    if (result.executionStarted) {
        totalExecutionTimeMs += static_cast<uint64_t>(result.executionTimeSeconds * 1000.0);
    }
    uint64_t peak = peakMemoryUsage.load();
    while (result.memoryUsedBytes > peak && !peakMemoryUsage.compare_exchange_weak(peak, result.memoryUsedBytes)) {
    }
}

Sandbox::Sandbox() : impl_(std::make_unique<Impl>()) {}

Sandbox::Sandbox(const utils::SandboxConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

Sandbox::~Sandbox() = default;

ExecutionResult Sandbox::execute(const ExecutionRequest& request) {
    StageTracker stages;
    ExecutionResult result;
    try {
        result = impl_->run(request, stages);
    } catch (const std::exception& e) {
        stages.advance(Stage::FAULTED);
        result = ResultAssembler::internalFailure(e);
    }

    LOG_INFO(kCategory, std::string("execution finished: ") + resultKindToString(result.kind) +
             " in " + utils::Formatter::formatSeconds(result.executionTimeSeconds) +
             " (" + stageToString(stages.current()) + ")");

    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->lastStages = stages.trace();
    }
    try {
        impl_->record(result);
    } catch (const std::exception& e) {
        LOG_ERROR(kCategory, std::string("callback failed: ") + e.what());
    }
    return result;
}

CodeAnalysis Sandbox::analyzeCode(const std::string& code) const {
    return impl_->validator.analyze(code);
}

bool Sandbox::isCodeSafe(const std::string& code) const {
    return impl_->validator.validate(code).ok();
}

void Sandbox::setConfig(const utils::SandboxConfig& config) {
    impl_->config = config;
}

utils::SandboxConfig Sandbox::getConfig() const {
    return impl_->config;
}

void Sandbox::onViolation(std::function<void(const std::string&)> callback) {
    impl_->violationCallback = callback;
}

void Sandbox::onTimeout(std::function<void(const std::string&)> callback) {
    impl_->timeoutCallback = callback;
}

std::vector<Stage> Sandbox::lastStages() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastStages;
}

SandboxStats Sandbox::getStats() const {
    SandboxStats stats{};
    stats.totalExecutions = impl_->executionCount;
    stats.successfulExecutions = impl_->successfulExecutions;
    stats.failedExecutions = impl_->failedExecutions;
    stats.timeouts = impl_->timeouts;
    stats.securityViolations = impl_->violationCount;
    stats.totalExecutionTimeMs = impl_->totalExecutionTimeMs;
    stats.avgExecutionTimeMs = stats.totalExecutions > 0 ? stats.totalExecutionTimeMs / stats.totalExecutions : 0;
    stats.peakMemoryUsage = impl_->peakMemoryUsage;
    return stats;
}

void Sandbox::resetStats() {
    impl_->executionCount = 0;
    impl_->successfulExecutions = 0;
    impl_->failedExecutions = 0;
    impl_->timeouts = 0;
    impl_->violationCount = 0;
    impl_->totalExecutionTimeMs = 0;
    impl_->peakMemoryUsage = 0;
}

}
}
