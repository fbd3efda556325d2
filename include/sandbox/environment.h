#pragma once

#include "utils/config.h"
#include <map>
#include <string>
#include <vector>
#include <cstdint>

namespace pysandbox {
namespace sandbox {

// Everything submitted code can reach. Rendered into the interpreter as a
// namespace factory; the factory is called once per run and once per test case.
struct RestrictedEnvironment {
    std::vector<std::string> safeBuiltins;
    std::vector<std::string> preloadedModules;
    std::vector<std::string> importAllowlist;
    std::map<std::string, std::vector<std::string>> hiddenAttributes;
    uint32_t recursionLimit = 500;
    uint64_t maxOutputBytes = 1024 * 1024;
};

class EnvironmentBuilder {
public:
    static RestrictedEnvironment build(const utils::SandboxConfig& config);

    // Python source defining _build_namespace(violations) and the import hook.
    static std::string renderPrelude(const RestrictedEnvironment& env);

    static std::string pythonStringLiteral(const std::string& value);
    static std::string pythonTuple(const std::vector<std::string>& values);
};

}
}
