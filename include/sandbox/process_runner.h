#pragma once

#include "sandbox/types.h"
#include "infrastructure/error_handling.h"
#include <chrono>
#include <string>
#include <vector>
#include <cstdint>
#include <sys/types.h>

namespace pysandbox {
namespace sandbox {

constexpr int CHILD_EXIT_LIMITS_FAILED = 125;
constexpr int CHILD_EXIT_EXEC_FAILED = 127;
constexpr int REPORT_FD = 3;

struct ProcessSpec {
    std::vector<std::string> argv;  // argv[0] is the executable path
    std::vector<std::string> env;
    std::string stdinData;
    ResourceLimits limits;
    bool applyLimits = true;
    std::chrono::milliseconds timeout{30000};
    size_t maxCaptureBytes = 1024 * 1024;
    size_t maxReportBytes = 16 * 1024 * 1024;
};

struct ProcessOutcome {
    bool started = false;
    bool exited = false;
    int exitCode = -1;
    int termSignal = 0;
    bool timedOut = false;
    bool outputLimitExceeded = false;

    std::string stdoutData;
    std::string stderrData;
    std::string reportData;

    double wallSeconds = 0.0;
    double cpuSeconds = 0.0;
    uint64_t maxRssBytes = 0;
};

// Owns one file descriptor and closes it on destruction.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

// Owns a spawned child and its process group. Whatever path leaves the
// runner, the group is killed and the leader reaped exactly once.
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard();

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    pid_t pid() const { return pid_; }
    bool hasExited() const;
    bool reap(int& status, double& cpuSeconds, uint64_t& maxRssBytes);

private:
    pid_t pid_;
};

class ProcessRunner {
public:
    static Result<ProcessOutcome> run(const ProcessSpec& spec);
};

}
}
