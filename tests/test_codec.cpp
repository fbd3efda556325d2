#include <gtest/gtest.h>
#include "sandbox/codec.h"

using namespace pysandbox;
using namespace pysandbox::sandbox;
using json = nlohmann::json;

class CodecTest : public ::testing::Test {
protected:
    utils::SandboxConfig config;
};

TEST_F(CodecTest, ParsesMinimalRequestWithDefaults) {
    auto request = Codec::parseRequest(std::string(R"json({"code": "print(1)"})json"), config);
    ASSERT_TRUE(request.ok()) << request.error().message;
    EXPECT_EQ(request.value().code, "print(1)");
    EXPECT_TRUE(request.value().testCases.empty());
    EXPECT_EQ(request.value().timeLimitSeconds, 30u);
    EXPECT_EQ(request.value().memoryLimitBytes, 134217728u);
}

TEST_F(CodecTest, ParsesTestCasesAndLimits) {
    json j = {
        {"code", "def add(a, b):\n    return a + b"},
        {"test_cases", {
            {{"name", "small"}, {"test_code", "print(add(2, 3))"}, {"expected_output", "5"}},
            {{"test_code", "print(add(1, 1))"}},
        }},
        {"time_limit_seconds", 5},
        {"memory_limit_bytes", 64 * 1024 * 1024},
    };
    auto request = Codec::parseRequest(j, config);
    ASSERT_TRUE(request.ok()) << request.error().message;

    const auto& cases = request.value().testCases;
    ASSERT_EQ(cases.size(), 2u);
    EXPECT_TRUE(cases[0].hasName);
    EXPECT_EQ(cases[0].name, "small");
    EXPECT_EQ(cases[0].expectedOutput, "5");
    EXPECT_FALSE(cases[1].hasName);
    EXPECT_EQ(cases[1].expectedOutput, "");
    EXPECT_EQ(request.value().timeLimitSeconds, 5u);
    EXPECT_EQ(request.value().memoryLimitBytes, 64u * 1024 * 1024);
}

TEST_F(CodecTest, AcceptsMemoryLimitWithSuffix) {
    auto request = Codec::parseRequest(json{{"code", ""}, {"memory_limit_bytes", "256m"}}, config);
    ASSERT_TRUE(request.ok()) << request.error().message;
    EXPECT_EQ(request.value().memoryLimitBytes, 256u * 1024 * 1024);

    EXPECT_EQ(Codec::parseMemoryLimit("1g").value(), 1024ull * 1024 * 1024);
    EXPECT_EQ(Codec::parseMemoryLimit("128M").value(), 128ull * 1024 * 1024);
    EXPECT_EQ(Codec::parseMemoryLimit("1073741824").value(), 1073741824ull);
    EXPECT_TRUE(Codec::parseMemoryLimit("lots").failed());
    EXPECT_TRUE(Codec::parseMemoryLimit("m").failed());
    EXPECT_TRUE(Codec::parseMemoryLimit("-5m").failed());
}

TEST_F(CodecTest, RejectsInvalidRequests) {
    auto expectInvalid = [&](const std::string& text) {
        auto request = Codec::parseRequest(text, config);
        ASSERT_TRUE(request.failed()) << text;
        EXPECT_EQ(request.error().code, ErrorCode::INVALID_REQUEST) << text;
    };
    expectInvalid("not json");
    expectInvalid("[1, 2]");
    expectInvalid(R"({"test_cases": []})");
    expectInvalid(R"({"code": 42})");
    expectInvalid(R"({"code": "x", "test_cases": {}})");
    expectInvalid(R"json({"code": "x", "test_cases": ["print(1)"]})json");
    expectInvalid(R"({"code": "x", "test_cases": [{"test_code": 1}]})");
    expectInvalid(R"({"code": "x", "time_limit_seconds": 0})");
    expectInvalid(R"({"code": "x", "time_limit_seconds": 301})");
    expectInvalid(R"({"code": "x", "time_limit_seconds": -1})");
    expectInvalid(R"({"code": "x", "time_limit_seconds": 1.5})");
    expectInvalid(R"({"code": "x", "memory_limit_bytes": 1024})");
    expectInvalid(R"({"code": "x", "memory_limit_bytes": "99g"})");
}

TEST_F(CodecTest, RejectsOversizedCodeBeforeValidation) {
    config.maxCodeSize = 1000;
    auto fits = Codec::parseRequest(json{{"code", std::string(1000, 'a')}}, config);
    EXPECT_TRUE(fits.ok());

    auto oversized = Codec::parseRequest(json{{"code", "x = " + std::string(1000, '1')}}, config);
    ASSERT_TRUE(oversized.failed());
    EXPECT_EQ(oversized.error().code, ErrorCode::INVALID_REQUEST);
    EXPECT_NE(oversized.error().message.find("code exceeds"), std::string::npos);
}

TEST_F(CodecTest, HarnessRequestCarriesOnlyCodeAndSnippets) {
    TestCase tc;
    tc.hasName = true;
    tc.name = "first";
    tc.testCode = "print(1)";
    tc.expectedOutput = "1";

    json encoded = json::parse(Codec::encodeHarnessRequest("x = 1", {tc}));
    EXPECT_EQ(encoded["code"], "x = 1");
    ASSERT_EQ(encoded["test_cases"].size(), 1u);
    EXPECT_EQ(encoded["test_cases"][0]["test_code"], "print(1)");
    EXPECT_FALSE(encoded["test_cases"][0].contains("expected_output"));
}

TEST_F(CodecTest, ParsesHarnessReport) {
    std::string data = R"({"status": "ok", "stdout": "5\n", "stderr": "", "execution_time": 0.25,
        "output_truncated": false,
        "test_results": [{"test_number": 1, "actual_output": "5\n", "execution_time": 0.1},
                         {"test_number": 2, "error": "division by zero", "execution_time": 0.0}]})";
    auto report = Codec::parseHarnessReport(data);
    ASSERT_TRUE(report.ok()) << report.error().message;
    EXPECT_EQ(report.value().status, "ok");
    EXPECT_EQ(report.value().stdoutText, "5\n");
    EXPECT_DOUBLE_EQ(report.value().executionTimeSeconds, 0.25);
    ASSERT_EQ(report.value().cases.size(), 2u);
    EXPECT_TRUE(report.value().cases[0].hasOutput);
    EXPECT_TRUE(report.value().cases[1].hasError);
    EXPECT_EQ(report.value().cases[1].error, "division by zero");
}

TEST_F(CodecTest, RejectsMalformedHarnessReport) {
    EXPECT_TRUE(Codec::parseHarnessReport("").failed());
    EXPECT_TRUE(Codec::parseHarnessReport("{\"status\": \"ok\"").failed());
    EXPECT_TRUE(Codec::parseHarnessReport(R"({"stdout": ""})").failed());
    EXPECT_TRUE(Codec::parseHarnessReport(R"({"status": "maybe"})").failed());
    EXPECT_TRUE(Codec::parseHarnessReport(R"({"status": "ok", "stdout": 5})").failed());
}

TEST_F(CodecTest, SuccessResultJsonShape) {
    ExecutionResult result;
    result.kind = ResultKind::SUCCESS;
    result.errorType = ErrorType::NONE;
    result.stdoutText = "5\n";
    result.executionTimeSeconds = 0.5;
    result.memoryUsedBytes = 4096;

    TestResult passed;
    passed.testNumber = 1;
    passed.testName = "Test 1";
    passed.passed = true;
    passed.expectedOutput = "5";
    passed.actualOutput = "5";
    TestResult failed;
    failed.testNumber = 2;
    failed.testName = "Test 2";
    failed.error = "boom";
    result.testResults = {passed, failed};

    json j = Codec::toJson(result);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["stdout"], "5\n");
    EXPECT_EQ(j["stderr"], "");
    EXPECT_EQ(j["memory_used"], 4096);
    EXPECT_DOUBLE_EQ(j["execution_time"].get<double>(), 0.5);
    ASSERT_EQ(j["test_results"].size(), 2u);
    EXPECT_EQ(j["test_results"][0]["actual_output"], "5");
    EXPECT_EQ(j["test_results"][0]["test_name"], "Test 1");
    EXPECT_EQ(j["test_results"][1]["passed"], false);
    EXPECT_EQ(j["test_results"][1]["error"], "boom");
    EXPECT_FALSE(j["test_results"][1].contains("actual_output"));
    EXPECT_FALSE(j.contains("error_type"));
}

TEST_F(CodecTest, FailureResultJsonShape) {
    ExecutionResult security;
    security.kind = ResultKind::SECURITY_VIOLATION;
    security.errorType = ErrorType::SECURITY;
    security.message = "Security Error: Restricted pattern detected: import os (line 1)";

    json j = Codec::toJson(security);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error_type"], "security");
    EXPECT_EQ(j["error"], security.message);
    EXPECT_FALSE(j.contains("traceback"));
    EXPECT_FALSE(j.contains("execution_time"));
    EXPECT_FALSE(j.contains("stdout"));

    ExecutionResult failure;
    failure.kind = ResultKind::RUNTIME_FAILURE;
    failure.errorType = ErrorType::EXECUTION;
    failure.message = "Execution Error: invalid syntax";
    failure.traceback = "SyntaxError: invalid syntax\n";
    failure.executionStarted = true;
    failure.executionTimeSeconds = 0.1;

    j = Codec::toJson(failure);
    EXPECT_EQ(j["error_type"], "execution");
    EXPECT_EQ(j["traceback"], failure.traceback);
    EXPECT_TRUE(j.contains("execution_time"));
}
