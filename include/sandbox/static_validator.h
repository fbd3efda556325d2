#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <cstddef>

namespace pysandbox {
namespace sandbox {

enum class ViolationCategory {
    FORBIDDEN_MODULE,
    REFLECTION,
    RAW_IO,
    INFINITE_LOOP
};

struct Violation {
    ViolationCategory category;
    std::string pattern;
    size_t line;
};

struct CodeAnalysis {
    bool safe = true;
    std::vector<Violation> violations;
};

// First, cheap layer: a lexical scan of the raw source. It over-rejects
// (patterns inside strings and comments count) and under-rejects anything
// that is not spelled out literally; the later layers do not rely on it.
class StaticValidator {
public:
    StaticValidator();

    Result<void> validate(const std::string& code) const;
    CodeAnalysis analyze(const std::string& code) const;

    static bool hasProbableInfiniteLoop(const std::string& code);

    const std::vector<std::string>& forbiddenModules() const { return forbiddenModules_; }
    const std::vector<std::string>& forbiddenCalls() const { return forbiddenCalls_; }
    const std::vector<std::string>& forbiddenAttributes() const { return forbiddenAttributes_; }

    static std::string describe(const Violation& violation);
    static const char* categoryToString(ViolationCategory category);

private:
    void scanModules(const std::string& lowered, CodeAnalysis& analysis) const;
    void scanCalls(const std::string& lowered, CodeAnalysis& analysis) const;
    void scanAttributes(const std::string& lowered, CodeAnalysis& analysis) const;

    std::vector<std::string> forbiddenModules_;
    std::vector<std::string> forbiddenCalls_;
    std::vector<std::string> forbiddenAttributes_;
};

}
}
