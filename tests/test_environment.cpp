#include <gtest/gtest.h>
#include "sandbox/environment.h"
#include <algorithm>

using namespace pysandbox::sandbox;
using namespace pysandbox::utils;

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

}

TEST(EnvironmentBuilderTest, SafeBuiltinsAreAnAllowlist) {
    RestrictedEnvironment env = EnvironmentBuilder::build(SandboxConfig{});

    EXPECT_TRUE(contains(env.safeBuiltins, "print"));
    EXPECT_TRUE(contains(env.safeBuiltins, "sorted"));
    EXPECT_TRUE(contains(env.safeBuiltins, "__build_class__"));
    EXPECT_TRUE(contains(env.safeBuiltins, "ValueError"));

    EXPECT_FALSE(contains(env.safeBuiltins, "open"));
    EXPECT_FALSE(contains(env.safeBuiltins, "eval"));
    EXPECT_FALSE(contains(env.safeBuiltins, "exec"));
    EXPECT_FALSE(contains(env.safeBuiltins, "getattr"));
    EXPECT_FALSE(contains(env.safeBuiltins, "__import__"));
    EXPECT_FALSE(contains(env.safeBuiltins, "BaseException"));

}

TEST(EnvironmentBuilderTest, PreloadsTheAllowedModules) {
    RestrictedEnvironment env = EnvironmentBuilder::build(SandboxConfig{});
    ASSERT_EQ(env.preloadedModules.size(), 10u);
    for (const auto& module : {"math", "random", "datetime", "collections", "itertools",
                               "functools", "operator", "string", "re", "json"}) {
        EXPECT_TRUE(contains(env.preloadedModules, module)) << module;
    }
    ASSERT_TRUE(env.hiddenAttributes.count("operator"));
    EXPECT_TRUE(contains(env.hiddenAttributes["operator"], "attrgetter"));
    EXPECT_TRUE(contains(env.hiddenAttributes["operator"], "methodcaller"));
    EXPECT_TRUE(contains(env.hiddenAttributes["string"], "Formatter"));
}

TEST(EnvironmentBuilderTest, TakesLimitsFromConfig) {
    SandboxConfig config;
    config.recursionLimit = 250;
    config.maxOutputSize = 4096;
    RestrictedEnvironment env = EnvironmentBuilder::build(config);
    EXPECT_EQ(env.recursionLimit, 250u);
    EXPECT_EQ(env.maxOutputBytes, 4096u);
}

TEST(EnvironmentBuilderTest, PreludeDefinesNamespaceFactoryAndHook) {
    RestrictedEnvironment env = EnvironmentBuilder::build(SandboxConfig{});
    std::string prelude = EnvironmentBuilder::renderPrelude(env);

    EXPECT_NE(prelude.find("class SandboxSecurityError(Exception):"), std::string::npos);
    EXPECT_NE(prelude.find("def _build_namespace(violations):"), std::string::npos);
    EXPECT_NE(prelude.find("def _restricted_import("), std::string::npos);
    EXPECT_NE(prelude.find("violations.append("), std::string::npos);
    EXPECT_NE(prelude.find("'operator': frozenset(('attrgetter', 'methodcaller'))"), std::string::npos);
    EXPECT_NE(prelude.find("'__import__'"), std::string::npos);
}

TEST(EnvironmentBuilderTest, PythonLiteralsAreEscaped) {
    EXPECT_EQ(EnvironmentBuilder::pythonStringLiteral("math"), "'math'");
    EXPECT_EQ(EnvironmentBuilder::pythonStringLiteral("it's"), "'it\\'s'");
    EXPECT_EQ(EnvironmentBuilder::pythonStringLiteral("a\\b\n"), "'a\\\\b\\n'");
    EXPECT_EQ(EnvironmentBuilder::pythonStringLiteral(std::string("\x01", 1)), "'\\x01'");

    EXPECT_EQ(EnvironmentBuilder::pythonTuple({}), "()");
    EXPECT_EQ(EnvironmentBuilder::pythonTuple({"a"}), "('a',)");
    EXPECT_EQ(EnvironmentBuilder::pythonTuple({"a", "b"}), "('a', 'b')");
}
