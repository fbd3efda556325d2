#include "sandbox/codec.h"
#include "utils/utils.h"
#include <cctype>
#include <limits>

namespace pysandbox {
namespace sandbox {

namespace {

Result<uint64_t> readUnsigned(const nlohmann::json& value, const std::string& field) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        int64_t v = value.get<int64_t>();
        if (v < 0) return makeError(ErrorCode::INVALID_REQUEST, "'" + field + "' must not be negative");
        return static_cast<uint64_t>(v);
    }
    return makeError(ErrorCode::INVALID_REQUEST, "'" + field + "' must be an integer");
}

}

Result<ExecutionRequest> Codec::parseRequest(const std::string& text, const utils::SandboxConfig& config) {
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return makeError(ErrorCode::INVALID_REQUEST, "request is not valid JSON");
    }
    return parseRequest(parsed, config);
}

Result<ExecutionRequest> Codec::parseRequest(const nlohmann::json& j, const utils::SandboxConfig& config) {
    if (!j.is_object()) {
        return makeError(ErrorCode::INVALID_REQUEST, "request must be a JSON object");
    }

    ExecutionRequest request;
    auto codeIt = j.find("code");
    if (codeIt == j.end() || !codeIt->is_string()) {
        return makeError(ErrorCode::INVALID_REQUEST, "missing string field 'code'");
    }
    request.code = codeIt->get<std::string>();
    if (request.code.size() > config.maxCodeSize) {
        return makeError(ErrorCode::INVALID_REQUEST,
                         "code exceeds " + utils::Formatter::formatBytes(config.maxCodeSize));
    }

    auto casesIt = j.find("test_cases");
    if (casesIt != j.end() && !casesIt->is_null()) {
        auto cases = parseTestCases(*casesIt);
        if (cases.failed()) return cases.error();
        request.testCases = std::move(cases.value());
    }

    request.timeLimitSeconds = config.defaultTimeLimit;
    auto timeIt = j.find("time_limit_seconds");
    if (timeIt != j.end() && !timeIt->is_null()) {
        auto t = readUnsigned(*timeIt, "time_limit_seconds");
        if (t.failed()) return t.error();
        if (t.value() > std::numeric_limits<uint32_t>::max()) {
            return makeError(ErrorCode::INVALID_REQUEST, "'time_limit_seconds' is out of range");
        }
        request.timeLimitSeconds = static_cast<uint32_t>(t.value());
    }

    request.memoryLimitBytes = config.defaultMemoryLimit;
    auto memIt = j.find("memory_limit_bytes");
    if (memIt != j.end() && !memIt->is_null()) {
        Result<uint64_t> m = memIt->is_string() ? parseMemoryLimit(memIt->get<std::string>())
                                                : readUnsigned(*memIt, "memory_limit_bytes");
        if (m.failed()) return m.error();
        request.memoryLimitBytes = m.value();
    }

    auto limits = checkLimits(request.timeLimitSeconds, request.memoryLimitBytes, config);
    if (limits.failed()) return limits.error();
    return request;
}

Result<std::vector<TestCase>> Codec::parseTestCases(const nlohmann::json& j) {
    if (!j.is_array()) {
        return makeError(ErrorCode::INVALID_REQUEST, "'test_cases' must be an array");
    }
    std::vector<TestCase> cases;
    cases.reserve(j.size());
    for (size_t i = 0; i < j.size(); i++) {
        const auto& item = j[i];
        std::string where = "test case " + std::to_string(i + 1);
        if (!item.is_object()) {
            return makeError(ErrorCode::INVALID_REQUEST, where + " must be an object");
        }
        TestCase tc;
        auto nameIt = item.find("name");
        if (nameIt != item.end() && !nameIt->is_null()) {
            if (!nameIt->is_string()) return makeError(ErrorCode::INVALID_REQUEST, where + ": 'name' must be a string");
            tc.hasName = true;
            tc.name = nameIt->get<std::string>();
        }
        auto codeIt = item.find("test_code");
        if (codeIt != item.end() && !codeIt->is_null()) {
            if (!codeIt->is_string()) return makeError(ErrorCode::INVALID_REQUEST, where + ": 'test_code' must be a string");
            tc.testCode = codeIt->get<std::string>();
        }
        auto expectedIt = item.find("expected_output");
        if (expectedIt != item.end() && !expectedIt->is_null()) {
            if (!expectedIt->is_string()) {
                return makeError(ErrorCode::INVALID_REQUEST, where + ": 'expected_output' must be a string");
            }
            tc.expectedOutput = expectedIt->get<std::string>();
        }
        cases.push_back(std::move(tc));
    }
    return cases;
}

Result<uint64_t> Codec::parseMemoryLimit(const std::string& text) {
    std::string value = utils::Formatter::trim(text);
    if (value.empty()) {
        return makeError(ErrorCode::INVALID_REQUEST, "empty memory limit");
    }
    uint64_t multiplier = 1;
    char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(value.back())));
    if (suffix == 'k') multiplier = 1024ULL;
    else if (suffix == 'm') multiplier = 1024ULL * 1024;
    else if (suffix == 'g') multiplier = 1024ULL * 1024 * 1024;
    if (multiplier != 1) value.pop_back();

    if (value.empty() || value.size() > 19) {
        return makeError(ErrorCode::INVALID_REQUEST, "invalid memory limit '" + text + "'");
    }
    uint64_t number = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return makeError(ErrorCode::INVALID_REQUEST, "invalid memory limit '" + text + "'");
        }
        number = number * 10 + static_cast<uint64_t>(c - '0');
    }
    if (number > std::numeric_limits<uint64_t>::max() / multiplier) {
        return makeError(ErrorCode::INVALID_REQUEST, "memory limit '" + text + "' is out of range");
    }
    return number * multiplier;
}

Result<void> Codec::checkLimits(uint32_t timeLimitSeconds, uint64_t memoryLimitBytes,
                                const utils::SandboxConfig& config) {
    PYSANDBOX_CHECK(timeLimitSeconds >= 1 && timeLimitSeconds <= config.maxTimeLimit, ErrorCode::INVALID_REQUEST,
                    "time limit must be between 1 and " + std::to_string(config.maxTimeLimit) + " seconds");
    PYSANDBOX_CHECK(memoryLimitBytes >= config.minMemoryLimit && memoryLimitBytes <= config.maxMemoryLimit,
                    ErrorCode::INVALID_REQUEST,
                    "memory limit must be between " + utils::Formatter::formatBytes(config.minMemoryLimit) +
                    " and " + utils::Formatter::formatBytes(config.maxMemoryLimit));
    return Result<void>();
}

std::string Codec::encodeHarnessRequest(const std::string& code, const std::vector<TestCase>& testCases) {
    nlohmann::json request;
    request["code"] = code;
    request["test_cases"] = nlohmann::json::array();
    for (const auto& tc : testCases) {
        request["test_cases"].push_back({{"test_code", tc.testCode}});
    }
    return request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<HarnessReport> Codec::parseHarnessReport(const std::string& data) {
    nlohmann::json parsed = nlohmann::json::parse(data, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "harness report is not a JSON object");
    }
    auto statusIt = parsed.find("status");
    if (statusIt == parsed.end() || !statusIt->is_string()) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "harness report has no status");
    }

    HarnessReport report;
    report.status = statusIt->get<std::string>();
    if (report.status != "ok" && report.status != "security" && report.status != "execution" &&
        report.status != "system") {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "unknown harness status '" + report.status + "'");
    }

    try {
        report.stdoutText = parsed.value("stdout", "");
        report.stderrText = parsed.value("stderr", "");
        report.executionTimeSeconds = parsed.value("execution_time", 0.0);
        report.outputTruncated = parsed.value("output_truncated", false);
        report.error = parsed.value("error", "");
        report.traceback = parsed.value("traceback", "");

        auto resultsIt = parsed.find("test_results");
        if (resultsIt != parsed.end() && resultsIt->is_array()) {
            for (const auto& item : *resultsIt) {
                if (!item.is_object()) continue;
                CaseReport cr;
                cr.testNumber = item.value("test_number", 0u);
                auto outIt = item.find("actual_output");
                if (outIt != item.end() && outIt->is_string()) {
                    cr.hasOutput = true;
                    cr.actualOutput = outIt->get<std::string>();
                }
                auto errIt = item.find("error");
                if (errIt != item.end() && errIt->is_string()) {
                    cr.hasError = true;
                    cr.error = errIt->get<std::string>();
                }
                cr.executionTimeSeconds = item.value("execution_time", 0.0);
                report.cases.push_back(std::move(cr));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, std::string("malformed harness report: ") + e.what());
    }
    return report;
}

nlohmann::json Codec::toJson(const TestResult& result) {
    nlohmann::json j;
    j["test_number"] = result.testNumber;
    j["passed"] = result.passed;
    if (result.hasError()) {
        j["error"] = result.error;
    } else {
        j["expected_output"] = result.expectedOutput;
        j["actual_output"] = result.actualOutput;
    }
    j["test_name"] = result.testName;
    return j;
}

nlohmann::json Codec::toJson(const ExecutionResult& result) {
    nlohmann::json j;
    j["success"] = result.success();
    if (result.success()) {
        j["stdout"] = result.stdoutText;
        j["stderr"] = result.stderrText;
        j["execution_time"] = result.executionTimeSeconds;
        j["memory_used"] = result.memoryUsedBytes;
        j["test_results"] = nlohmann::json::array();
        for (const auto& tr : result.testResults) {
            j["test_results"].push_back(toJson(tr));
        }
        return j;
    }

    j["error"] = result.message;
    j["error_type"] = errorTypeToString(result.errorType);
    if (!result.traceback.empty()) {
        j["traceback"] = result.traceback;
    }
    if (result.executionStarted) {
        j["execution_time"] = result.executionTimeSeconds;
    }
    return j;
}

}
}
