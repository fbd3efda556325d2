#pragma once

#include "sandbox/types.h"
#include "utils/config.h"
#include <string>

namespace pysandbox {
namespace sandbox {

struct LimitStatus {
    bool ok = true;
    int resource = -1;
    int errorNumber = 0;
};

class ResourceLimiter {
public:
    static ResourceLimits limitsFor(uint32_t timeLimitSeconds, uint64_t memoryLimitBytes,
                                    const utils::SandboxConfig& config);

    // Runs in the forked child before exec: no allocation, no locks, no logging.
    // Re-applying the same limits is harmless.
    static LimitStatus apply(const ResourceLimits& limits) noexcept;

    static const char* resourceName(int resource) noexcept;
    static std::string describe(const LimitStatus& status);

    // Encodes a failed status as "rlimit:<resource>:<errno>" into buf for the
    // parent to read back. Async-signal-safe. Returns the encoded length, 0 if
    // buf is too small.
    static size_t formatFailure(const LimitStatus& status, char* buf, size_t size) noexcept;
    static bool parseFailure(const std::string& text, LimitStatus& status);
};

}
}
