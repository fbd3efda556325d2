#include <gtest/gtest.h>
#include "sandbox/test_runner.h"

using namespace pysandbox::sandbox;

namespace {

TestCase makeCase(const std::string& code, const std::string& expected, const std::string& name = "") {
    TestCase tc;
    tc.testCode = code;
    tc.expectedOutput = expected;
    if (!name.empty()) {
        tc.hasName = true;
        tc.name = name;
    }
    return tc;
}

CaseReport outputReport(uint32_t number, const std::string& output) {
    CaseReport r;
    r.testNumber = number;
    r.hasOutput = true;
    r.actualOutput = output;
    r.executionTimeSeconds = 0.01;
    return r;
}

CaseReport errorReport(uint32_t number, const std::string& error) {
    CaseReport r;
    r.testNumber = number;
    r.hasError = true;
    r.error = error;
    return r;
}

}

TEST(TestCaseRunnerTest, ComparesTrimmedOutputExactly) {
    EXPECT_TRUE(TestCaseRunner::outputsMatch("5", "5\n"));
    EXPECT_TRUE(TestCaseRunner::outputsMatch("  hello\t", "hello"));
    EXPECT_TRUE(TestCaseRunner::outputsMatch("", "\n\n"));
    EXPECT_FALSE(TestCaseRunner::outputsMatch("05", "5 "));
    EXPECT_FALSE(TestCaseRunner::outputsMatch("a b", "a  b"));
    EXPECT_FALSE(TestCaseRunner::outputsMatch("Hello", "hello"));
    EXPECT_FALSE(TestCaseRunner::outputsMatch("1\n2", "1\r\n2"));
}

TEST(TestCaseRunnerTest, ScoresInInputOrderWithDefaultNames) {
    std::vector<TestCase> cases = {
        makeCase("print(add(2, 3))", "5"),
        makeCase("print(add(10, 20))", "30", "large numbers"),
        makeCase("print(add(1, 1))", "3"),
    };
    std::vector<CaseReport> reports = {
        outputReport(1, "5\n"),
        outputReport(2, "30\n"),
        outputReport(3, "2\n"),
    };

    auto results = TestCaseRunner::score(cases, reports);
    ASSERT_EQ(results.size(), 3u);

    EXPECT_EQ(results[0].testNumber, 1u);
    EXPECT_EQ(results[0].testName, "Test 1");
    EXPECT_TRUE(results[0].passed);
    EXPECT_EQ(results[0].actualOutput, "5");
    EXPECT_EQ(results[0].expectedOutput, "5");

    EXPECT_EQ(results[1].testName, "large numbers");
    EXPECT_TRUE(results[1].passed);

    EXPECT_EQ(results[2].testName, "Test 3");
    EXPECT_FALSE(results[2].passed);
    EXPECT_FALSE(results[2].hasError());
    EXPECT_EQ(results[2].actualOutput, "2");
}

TEST(TestCaseRunnerTest, ErrorInOneCaseDoesNotAffectOthers) {
    std::vector<TestCase> cases = {
        makeCase("print(1 / 0)", "0"),
        makeCase("print(2)", "2"),
    };
    std::vector<CaseReport> reports = {
        errorReport(1, "division by zero"),
        outputReport(2, "2\n"),
    };

    auto results = TestCaseRunner::score(cases, reports);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].passed);
    EXPECT_TRUE(results[0].hasError());
    EXPECT_EQ(results[0].error, "division by zero");
    EXPECT_TRUE(results[1].passed);
}

TEST(TestCaseRunnerTest, MissingReportBecomesError) {
    std::vector<TestCase> cases = {
        makeCase("print(1)", "1"),
        makeCase("print(2)", "2"),
    };
    std::vector<CaseReport> reports = {outputReport(1, "1")};

    auto results = TestCaseRunner::score(cases, reports);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].passed);
    EXPECT_FALSE(results[1].passed);
    EXPECT_TRUE(results[1].hasError());
}

TEST(TestCaseRunnerTest, MatchesReportsByNumberWhenOutOfOrder) {
    std::vector<TestCase> cases = {
        makeCase("print(1)", "1"),
        makeCase("print(2)", "2"),
    };
    std::vector<CaseReport> reports = {outputReport(2, "2"), outputReport(1, "1")};

    auto results = TestCaseRunner::score(cases, reports);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].passed);
    EXPECT_TRUE(results[1].passed);
}

TEST(TestCaseRunnerTest, NoCasesNoResults) {
    EXPECT_TRUE(TestCaseRunner::score({}, {}).empty());
}

TEST(TestCaseRunnerTest, RenderedRunnerDefinesCaseFunction) {
    std::string source = TestCaseRunner::renderCaseRunner();
    EXPECT_NE(source.find("def _run_case(number, case, program, limit):"), std::string::npos);
    EXPECT_NE(source.find("_build_namespace(violations)"), std::string::npos);
    EXPECT_NE(source.find("except BaseException"), std::string::npos);
    EXPECT_NE(source.find("class _LimitedBuffer"), std::string::npos);
    EXPECT_EQ(TestCaseRunner::defaultName(7), "Test 7");
}
