#include <cassert>
#include <cerrno>
#include <iostream>
#include <string>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/resource_limiter.h"

namespace pysandbox {
namespace tests {

using sandbox::LimitStatus;
using sandbox::ResourceLimiter;
using sandbox::ResourceLimits;

class ResourceLimiterTests {
public:
    static void runAll() {
        std::cout << "Running Resource Limiter Tests...\n";

        testLimitsFromRequest();
        testLimitsApplyInChild();
        testCpuHardLimitIsBackstop();
        testReapplyIsHarmless();
        testDescribe();
        testFailureEncoding();

        std::cout << "All Resource Limiter Tests Passed!\n";
    }

private:
    // Runs fn in a forked child and returns its exit code.
    template <typename Fn>
    static int inChild(Fn fn) {
        pid_t pid = fork();
        assert(pid >= 0);
        if (pid == 0) {
            _exit(fn() ? 0 : 1);
        }
        int status = 0;
        pid_t reaped = waitpid(pid, &status, 0);
        assert(reaped == pid);
        assert(WIFEXITED(status));
        return WEXITSTATUS(status);
    }

    static bool limitIs(int resource, rlim_t soft, rlim_t hard) {
        struct rlimit rl;
        if (getrlimit(resource, &rl) != 0) return false;
        return rl.rlim_cur == soft && rl.rlim_max == hard;
    }

    static void testLimitsFromRequest() {
        std::cout << "  Testing limits derived from request... ";

        utils::SandboxConfig config;
        config.maxProcesses = 7;
        config.maxFileSize = 4096;
        config.maxOpenFiles = 48;
        ResourceLimits limits = ResourceLimiter::limitsFor(12, 256ULL * 1024 * 1024, config);

        assert(limits.cpuSeconds == 12);
        assert(limits.addressSpaceBytes == 256ULL * 1024 * 1024);
        assert(limits.maxProcesses == 7);
        assert(limits.maxFileSizeBytes == 4096);
        assert(limits.maxOpenFiles == 48);
        assert(limits.coreDumpBytes == 0);

        std::cout << "PASSED\n";
    }

    static void testLimitsApplyInChild() {
        std::cout << "  Testing limits applied in child... ";

        ResourceLimits limits;
        limits.cpuSeconds = 3;
        limits.addressSpaceBytes = 512ULL * 1024 * 1024;
        limits.maxProcesses = 10;
        limits.maxFileSizeBytes = 1024 * 1024;
        limits.maxOpenFiles = 32;

        int rc = inChild([&limits]() {
            LimitStatus status = ResourceLimiter::apply(limits);
            if (!status.ok) return false;
            return limitIs(RLIMIT_AS, 512ULL * 1024 * 1024, 512ULL * 1024 * 1024) &&
                   limitIs(RLIMIT_NPROC, 10, 10) &&
                   limitIs(RLIMIT_FSIZE, 1024 * 1024, 1024 * 1024) &&
                   limitIs(RLIMIT_NOFILE, 32, 32) &&
                   limitIs(RLIMIT_CORE, 0, 0);
        });
        assert(rc == 0);

        // The parent keeps its own limits.
        struct rlimit rl;
        int rcParent = getrlimit(RLIMIT_NOFILE, &rl);
        assert(rcParent == 0);
        assert(rl.rlim_cur != 32 || rl.rlim_max != 32);

        std::cout << "PASSED\n";
    }

    static void testCpuHardLimitIsBackstop() {
        std::cout << "  Testing CPU hard limit one second above soft... ";

        ResourceLimits limits;
        limits.cpuSeconds = 2;
        limits.addressSpaceBytes = 512ULL * 1024 * 1024;

        int rc = inChild([&limits]() {
            if (!ResourceLimiter::apply(limits).ok) return false;
            return limitIs(RLIMIT_CPU, 2, 3);
        });
        assert(rc == 0);

        std::cout << "PASSED\n";
    }

    static void testReapplyIsHarmless() {
        std::cout << "  Testing repeated application... ";

        ResourceLimits limits;
        limits.cpuSeconds = 4;
        limits.addressSpaceBytes = 512ULL * 1024 * 1024;

        int rc = inChild([&limits]() {
            if (!ResourceLimiter::apply(limits).ok) return false;
            if (!ResourceLimiter::apply(limits).ok) return false;
            return limitIs(RLIMIT_CPU, 4, 5);
        });
        assert(rc == 0);

        std::cout << "PASSED\n";
    }

    static void testDescribe() {
        std::cout << "  Testing status descriptions... ";

        LimitStatus ok;
        assert(ResourceLimiter::describe(ok) == "resource limits applied");

        LimitStatus failed;
        failed.ok = false;
        failed.resource = RLIMIT_AS;
        failed.errorNumber = EPERM;
        std::string text = ResourceLimiter::describe(failed);
        assert(text.find("RLIMIT_AS") != std::string::npos);
        assert(text.find("failed") != std::string::npos);

        assert(std::string(ResourceLimiter::resourceName(RLIMIT_NOFILE)) == "RLIMIT_NOFILE");
        assert(std::string(ResourceLimiter::resourceName(-42)) == "RLIMIT_UNKNOWN");

        std::cout << "PASSED\n";
    }

    static void testFailureEncoding() {
        std::cout << "  Testing failure encoding for the parent... ";

        LimitStatus failed;
        failed.ok = false;
        failed.resource = RLIMIT_NOFILE;
        failed.errorNumber = EINVAL;
        char buf[64];
        size_t len = ResourceLimiter::formatFailure(failed, buf, sizeof(buf));
        assert(len > 0);
        std::string encoded(buf, len);
        assert(encoded == "rlimit:" + std::to_string(RLIMIT_NOFILE) + ":" + std::to_string(EINVAL));

        LimitStatus decoded;
        bool parsed = ResourceLimiter::parseFailure(encoded, decoded);
        assert(parsed);
        assert(!decoded.ok);
        assert(decoded.resource == RLIMIT_NOFILE);
        assert(decoded.errorNumber == EINVAL);

        char tiny[8];
        assert(ResourceLimiter::formatFailure(failed, tiny, sizeof(tiny)) == 0);

        LimitStatus untouched;
        assert(!ResourceLimiter::parseFailure("", untouched));
        assert(!ResourceLimiter::parseFailure("{\"status\": \"ok\"}", untouched));
        assert(!ResourceLimiter::parseFailure("rlimit:7", untouched));
        assert(!ResourceLimiter::parseFailure("rlimit:7:1x", untouched));
        assert(untouched.ok);

        std::cout << "PASSED\n";
    }
};

}
}

int main() {
    pysandbox::tests::ResourceLimiterTests::runAll();
    return 0;
}
