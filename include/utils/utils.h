#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace pysandbox {
namespace utils {

class Formatter {
public:
    static std::string formatBytes(uint64_t bytes);
    static std::string formatSeconds(double seconds);
    static std::string truncate(const std::string& str, size_t maxLen, const std::string& suffix = "...");
    static std::string toLower(const std::string& str);
    // Strips leading and trailing whitespace only; interior content is untouched.
    static std::string trim(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
};

}
}
