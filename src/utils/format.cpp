#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace pysandbox {
namespace utils {

std::string Formatter::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024 && unit < 4) { size /= 1024; unit++; }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << size << " " << units[unit];
    return ss.str();
}

std::string Formatter::formatSeconds(double seconds) {
    std::stringstream ss;
    if (seconds < 1.0) {
        ss << std::fixed << std::setprecision(1) << seconds * 1000.0 << "ms";
    } else {
        ss << std::fixed << std::setprecision(3) << seconds << "s";
    }
    return ss.str();
}

std::string Formatter::truncate(const std::string& str, size_t maxLen, const std::string& suffix) {
    if (str.length() <= maxLen) return str;
    if (maxLen <= suffix.length()) return str.substr(0, maxLen);
    return str.substr(0, maxLen - suffix.length()) + suffix;
}

std::string Formatter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string Formatter::trim(const std::string& str) {
    static const char* kWhitespace = " \t\n\r\f\v";
    size_t start = str.find_first_not_of(kWhitespace);
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(kWhitespace);
    return str.substr(start, end - start + 1);
}

std::vector<std::string> Formatter::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) result.push_back(item);
    return result;
}

std::string Formatter::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

}
}
