#include "sandbox/static_validator.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <string>

namespace pysandbox {
namespace sandbox {

namespace {

const char* kCategory = "validator";

size_t lineAt(const std::string& text, size_t pos) {
    return static_cast<size_t>(std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(std::min(pos, text.size())), '\n')) + 1;
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isDottedChar(char c) {
    return isIdentChar(c) || c == '.';
}

bool isBlank(char c) {
    return c == ' ' || c == '\t';
}

size_t skipBlanks(const std::string& text, size_t pos) {
    while (pos < text.size() && isBlank(text[pos])) pos++;
    return pos;
}

size_t skipIdent(const std::string& text, size_t pos) {
    while (pos < text.size() && isIdentChar(text[pos])) pos++;
    return pos;
}

bool startsAt(const std::string& text, size_t pos, const std::string& word) {
    return text.compare(pos, word.size(), word) == 0;
}

// A keyword or module name must not continue an identifier or dotted path.
bool leftBoundary(const std::string& text, size_t pos) {
    return pos == 0 || !isDottedChar(text[pos - 1]);
}

bool wordAt(const std::string& text, size_t pos, const std::string& word) {
    if (!startsAt(text, pos, word)) return false;
    size_t end = pos + word.size();
    return end >= text.size() || !isIdentChar(text[end]);
}

// Every match is a linear walk: submissions have no size bound here.
size_t findImportOf(const std::string& text, const std::string& module) {
    const std::string keyword = "import";
    size_t pos = 0;
    while ((pos = text.find(keyword, pos)) != std::string::npos) {
        size_t start = pos;
        pos += keyword.size();
        if (!leftBoundary(text, start) || pos >= text.size() || !isBlank(text[pos])) continue;

        // "import x", "import a, x", "import a as b, x"
        size_t item = skipBlanks(text, pos);
        while (item < text.size()) {
            if (wordAt(text, item, module)) return start;
            size_t nameEnd = item;
            while (nameEnd < text.size() && isDottedChar(text[nameEnd])) nameEnd++;
            if (nameEnd == item) break;

            size_t next = skipBlanks(text, nameEnd);
            if (next > nameEnd && startsAt(text, next, "as") && next + 2 < text.size() && isBlank(text[next + 2])) {
                size_t alias = skipBlanks(text, next + 2);
                size_t aliasEnd = skipIdent(text, alias);
                if (aliasEnd == alias) break;
                next = skipBlanks(text, aliasEnd);
            }
            if (next >= text.size() || text[next] != ',') break;
            item = skipBlanks(text, next + 1);
        }
    }
    return std::string::npos;
}

size_t findFromOf(const std::string& text, const std::string& module) {
    const std::string keyword = "from";
    size_t pos = 0;
    while ((pos = text.find(keyword, pos)) != std::string::npos) {
        size_t start = pos;
        pos += keyword.size();
        if (!leftBoundary(text, start) || pos >= text.size() || !isBlank(text[pos])) continue;
        if (wordAt(text, skipBlanks(text, pos), module)) return start;
    }
    return std::string::npos;
}

size_t findReferenceOf(const std::string& text, const std::string& module) {
    size_t pos = 0;
    while ((pos = text.find(module, pos)) != std::string::npos) {
        size_t start = pos;
        pos += module.size();
        if (!leftBoundary(text, start)) continue;
        size_t after = skipBlanks(text, pos);
        if (after < text.size() && text[after] == '.') return start;
    }
    return std::string::npos;
}

// "while True:", "while 1:", "while (not False):" and friends, as a line's
// first statement. Returns the 1-based line, 0 if there is none.
size_t findAlwaysTrueLoop(const std::string& lowered) {
    static const char* const conditions[] = {"true", "1"};
    size_t lineStart = 0;
    size_t line = 1;
    while (lineStart <= lowered.size()) {
        size_t lineEnd = lowered.find('\n', lineStart);
        if (lineEnd == std::string::npos) lineEnd = lowered.size();
        std::string text = lowered.substr(lineStart, lineEnd - lineStart);

        size_t pos = skipBlanks(text, 0);
        if (startsAt(text, pos, "while")) {
            pos = skipBlanks(text, pos + 5);
            if (pos < text.size() && text[pos] == '(') pos = skipBlanks(text, pos + 1);

            size_t condEnd = std::string::npos;
            for (const char* cond : conditions) {
                if (startsAt(text, pos, cond)) {
                    condEnd = pos + std::char_traits<char>::length(cond);
                    break;
                }
            }
            if (condEnd == std::string::npos && startsAt(text, pos, "not") && pos + 3 < text.size() && isBlank(text[pos + 3])) {
                size_t operand = skipBlanks(text, pos + 3);
                if (startsAt(text, operand, "false")) condEnd = operand + 5;
                else if (startsAt(text, operand, "0")) condEnd = operand + 1;
            }
            if (condEnd != std::string::npos) {
                size_t tail = skipBlanks(text, condEnd);
                if (tail < text.size() && text[tail] == ')') tail = skipBlanks(text, tail + 1);
                if (tail < text.size() && text[tail] == ':') return line;
            }
        }
        if (lineEnd == lowered.size()) break;
        lineStart = lineEnd + 1;
        line++;
    }
    return 0;
}

bool containsWord(const std::string& text, const std::string& word) {
    size_t pos = 0;
    while ((pos = text.find(word, pos)) != std::string::npos) {
        if ((pos == 0 || !isIdentChar(text[pos - 1])) && wordAt(text, pos, word)) return true;
        pos += word.size();
    }
    return false;
}

}

StaticValidator::StaticValidator() {
    forbiddenModules_ = {
        "os", "sys", "subprocess", "socket", "urllib", "requests",
        "ctypes", "platform", "shutil", "pickle", "marshal", "shelve",
        "dbm", "multiprocessing", "threading", "importlib", "tempfile",
        "builtins", "_thread"
    };
    forbiddenCalls_ = {
        "exec", "eval", "compile", "globals", "locals", "vars", "dir",
        "getattr", "setattr", "delattr", "hasattr", "reload", "execfile",
        "breakpoint", "open", "file", "raw_input", "input"
    };
    forbiddenAttributes_ = {
        "__import__", "__subclasses__", "__globals__", "__builtins__",
        "__base__", "__bases__", "__mro__", "__class__", "__dict__", "__self__",
        "__code__", "__closure__", "__getattribute__", "__reduce__",
        "__reduce_ex__", "__traceback__", "__loader__", "__spec__",
        "tb_frame", "f_globals", "f_locals", "f_back", "f_builtins",
        "gi_frame", "cr_frame"
    };
}

Result<void> StaticValidator::validate(const std::string& code) const {
    CodeAnalysis analysis = analyze(code);
    if (analysis.safe) {
        return Result<void>();
    }
    const Violation& first = analysis.violations.front();
    LOG_INFO(kCategory, "rejected submission: " + describe(first) +
             " (" + std::to_string(analysis.violations.size()) + " finding(s))");
    return Result<void>(makeError(ErrorCode::SECURITY_VIOLATION, describe(first)));
}

CodeAnalysis StaticValidator::analyze(const std::string& code) const {
    CodeAnalysis analysis;
    std::string lowered = utils::Formatter::toLower(code);

    scanModules(lowered, analysis);
    scanCalls(lowered, analysis);
    scanAttributes(lowered, analysis);

    size_t loopLine = findAlwaysTrueLoop(lowered);
    if (loopLine != 0 && !containsWord(code, "break")) {
        analysis.violations.push_back({ViolationCategory::INFINITE_LOOP, "while True:", loopLine});
    }

    std::stable_sort(analysis.violations.begin(), analysis.violations.end(),
                     [](const Violation& a, const Violation& b) { return a.line < b.line; });
    analysis.safe = analysis.violations.empty();
    return analysis;
}

void StaticValidator::scanModules(const std::string& lowered, CodeAnalysis& analysis) const {
    for (const auto& module : forbiddenModules_) {
        size_t pos;
        if ((pos = findImportOf(lowered, module)) != std::string::npos) {
            analysis.violations.push_back({ViolationCategory::FORBIDDEN_MODULE, "import " + module, lineAt(lowered, pos)});
        } else if ((pos = findFromOf(lowered, module)) != std::string::npos) {
            analysis.violations.push_back({ViolationCategory::FORBIDDEN_MODULE, "from " + module, lineAt(lowered, pos)});
        } else if ((pos = findReferenceOf(lowered, module)) != std::string::npos) {
            analysis.violations.push_back({ViolationCategory::FORBIDDEN_MODULE, module + ".", lineAt(lowered, pos)});
        }
    }
}

void StaticValidator::scanCalls(const std::string& lowered, CodeAnalysis& analysis) const {
    for (const auto& name : forbiddenCalls_) {
        size_t pos = 0;
        while ((pos = lowered.find(name, pos)) != std::string::npos) {
            size_t after = skipBlanks(lowered, pos + name.size());
            bool isCall = after < lowered.size() && lowered[after] == '(';
            // Substring semantics on the left: "myexec(" and "re.compile(" both count.
            // The right edge must be the call itself, not a longer identifier.
            if (isCall) {
                ViolationCategory category = (name == "open" || name == "file" || name == "input" || name == "raw_input")
                    ? ViolationCategory::RAW_IO
                    : ViolationCategory::REFLECTION;
                analysis.violations.push_back({category, name + "(", lineAt(lowered, pos)});
                break;
            }
            pos += name.size();
        }
    }
}

void StaticValidator::scanAttributes(const std::string& lowered, CodeAnalysis& analysis) const {
    for (const auto& name : forbiddenAttributes_) {
        size_t pos = 0;
        while ((pos = lowered.find(name, pos)) != std::string::npos) {
            bool dunder = name.compare(0, 2, "__") == 0;
            bool leftOk = dunder || pos == 0 || !isIdentChar(lowered[pos - 1]);
            size_t end = pos + name.size();
            bool rightOk = dunder || end >= lowered.size() || !isIdentChar(lowered[end]);
            if (leftOk && rightOk) {
                analysis.violations.push_back({ViolationCategory::REFLECTION, name, lineAt(lowered, pos)});
                break;
            }
            pos = end;
        }
    }
}

bool StaticValidator::hasProbableInfiniteLoop(const std::string& code) {
    return findAlwaysTrueLoop(utils::Formatter::toLower(code)) != 0 && !containsWord(code, "break");
}

std::string StaticValidator::describe(const Violation& violation) {
    if (violation.category == ViolationCategory::INFINITE_LOOP) {
        return "Potential infinite loop detected (line " + std::to_string(violation.line) + ")";
    }
    return "Restricted pattern detected: " + violation.pattern + " (line " + std::to_string(violation.line) + ")";
}

const char* StaticValidator::categoryToString(ViolationCategory category) {
    switch (category) {
        case ViolationCategory::FORBIDDEN_MODULE: return "forbidden_module";
        case ViolationCategory::REFLECTION: return "reflection";
        case ViolationCategory::RAW_IO: return "raw_io";
        case ViolationCategory::INFINITE_LOOP: return "infinite_loop";
        default: return "unknown";
    }
}

}
}
