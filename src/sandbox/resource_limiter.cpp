#include "sandbox/resource_limiter.h"
#include <cerrno>
#include <cstring>
#include <sys/resource.h>

namespace pysandbox {
namespace sandbox {

namespace {

// Never asks for more than the current hard ceiling: an outer container may
// already be stricter, and raising a hard limit needs privileges.
int setLimit(int resource, rlim_t soft, rlim_t hard) noexcept {
    struct rlimit current;
    if (getrlimit(resource, &current) == 0 && current.rlim_max != RLIM_INFINITY) {
        if (hard > current.rlim_max) hard = current.rlim_max;
        if (soft > hard) soft = hard;
    }
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    if (setrlimit(resource, &rl) != 0) {
        return errno;
    }
    return 0;
}

const char kFailurePrefix[] = "rlimit:";

size_t appendNumber(char* out, size_t pos, size_t size, long value) noexcept {
    char digits[24];
    size_t n = 0;
    bool negative = value < 0;
    unsigned long v = negative ? 0UL - static_cast<unsigned long>(value) : static_cast<unsigned long>(value);
    do {
        digits[n++] = static_cast<char>('0' + v % 10);
        v /= 10;
    } while (v != 0);
    if (negative) digits[n++] = '-';
    if (pos + n > size) return 0;
    while (n > 0) out[pos++] = digits[--n];
    return pos;
}

bool readNumber(const std::string& text, size_t& pos, int& value) {
    bool negative = pos < text.size() && text[pos] == '-';
    if (negative) pos++;
    size_t start = pos;
    long v = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        v = v * 10 + (text[pos] - '0');
        if (v > 1000000000L) return false;
        pos++;
    }
    if (pos == start) return false;
    value = static_cast<int>(negative ? -v : v);
    return true;
}

}

ResourceLimits ResourceLimiter::limitsFor(uint32_t timeLimitSeconds, uint64_t memoryLimitBytes,
                                          const utils::SandboxConfig& config) {
    ResourceLimits limits;
    limits.cpuSeconds = timeLimitSeconds;
    limits.addressSpaceBytes = memoryLimitBytes;
    limits.maxProcesses = config.maxProcesses;
    limits.maxFileSizeBytes = config.maxFileSize;
    limits.maxOpenFiles = config.maxOpenFiles;
    limits.coreDumpBytes = 0;
    return limits;
}

LimitStatus ResourceLimiter::apply(const ResourceLimits& limits) noexcept {
    struct Entry {
        int resource;
        rlim_t soft;
        rlim_t hard;
    };
    // CPU soft limit raises SIGXCPU, the hard limit one second later is a SIGKILL backstop.
    const Entry entries[] = {
        {RLIMIT_AS, static_cast<rlim_t>(limits.addressSpaceBytes), static_cast<rlim_t>(limits.addressSpaceBytes)},
        {RLIMIT_CPU, static_cast<rlim_t>(limits.cpuSeconds), static_cast<rlim_t>(limits.cpuSeconds + 1)},
        {RLIMIT_NPROC, static_cast<rlim_t>(limits.maxProcesses), static_cast<rlim_t>(limits.maxProcesses)},
        {RLIMIT_FSIZE, static_cast<rlim_t>(limits.maxFileSizeBytes), static_cast<rlim_t>(limits.maxFileSizeBytes)},
        {RLIMIT_NOFILE, static_cast<rlim_t>(limits.maxOpenFiles), static_cast<rlim_t>(limits.maxOpenFiles)},
        {RLIMIT_CORE, static_cast<rlim_t>(limits.coreDumpBytes), static_cast<rlim_t>(limits.coreDumpBytes)},
    };

    LimitStatus status;
    for (const auto& entry : entries) {
        int err = setLimit(entry.resource, entry.soft, entry.hard);
        if (err != 0) {
            status.ok = false;
            status.resource = entry.resource;
            status.errorNumber = err;
            return status;
        }
    }
    return status;
}

const char* ResourceLimiter::resourceName(int resource) noexcept {
    switch (resource) {
        case RLIMIT_AS: return "RLIMIT_AS";
        case RLIMIT_CPU: return "RLIMIT_CPU";
        case RLIMIT_NPROC: return "RLIMIT_NPROC";
        case RLIMIT_FSIZE: return "RLIMIT_FSIZE";
        case RLIMIT_NOFILE: return "RLIMIT_NOFILE";
        case RLIMIT_CORE: return "RLIMIT_CORE";
        default: return "RLIMIT_UNKNOWN";
    }
}

std::string ResourceLimiter::describe(const LimitStatus& status) {
    if (status.ok) return "resource limits applied";
    return std::string("setrlimit(") + resourceName(status.resource) + ") failed: " +
           std::strerror(status.errorNumber);
}

size_t ResourceLimiter::formatFailure(const LimitStatus& status, char* buf, size_t size) noexcept {
    size_t pos = 0;
    for (const char* p = kFailurePrefix; *p; p++) {
        if (pos >= size) return 0;
        buf[pos++] = *p;
    }
    pos = appendNumber(buf, pos, size, status.resource);
    if (pos == 0 || pos >= size) return 0;
    buf[pos++] = ':';
    pos = appendNumber(buf, pos, size, status.errorNumber);
    return pos;
}

bool ResourceLimiter::parseFailure(const std::string& text, LimitStatus& status) {
    const size_t prefixLen = sizeof(kFailurePrefix) - 1;
    if (text.compare(0, prefixLen, kFailurePrefix) != 0) return false;
    size_t pos = prefixLen;
    int resource = 0;
    int errorNumber = 0;
    if (!readNumber(text, pos, resource)) return false;
    if (pos >= text.size() || text[pos] != ':') return false;
    pos++;
    if (!readNumber(text, pos, errorNumber) || pos != text.size()) return false;
    status.ok = false;
    status.resource = resource;
    status.errorNumber = errorNumber;
    return true;
}

}
}
