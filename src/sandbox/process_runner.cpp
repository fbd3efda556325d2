#include "sandbox/process_runner.h"
#include "sandbox/resource_limiter.h"
#include "utils/logger.h"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pysandbox {
namespace sandbox {

namespace {

const char* kCategory = "process";
constexpr size_t READ_CHUNK = 65536;
constexpr int POLL_SLICE_MS = 50;
constexpr int CHILD_FD_FLOOR = 10;

// SIGPIPE is ignored while the runner feeds stdin; a child that exits early
// turns the write into EPIPE instead of killing the supervisor.
class ScopedSigpipeIgnore {
public:
    ScopedSigpipeIgnore() {
        struct sigaction ignore;
        std::memset(&ignore, 0, sizeof(ignore));
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        installed_ = sigaction(SIGPIPE, &ignore, &previous_) == 0;
    }
    ~ScopedSigpipeIgnore() {
        if (installed_) sigaction(SIGPIPE, &previous_, nullptr);
    }

private:
    struct sigaction previous_;
    bool installed_ = false;
};

struct Pipe {
    FileDescriptor read;
    FileDescriptor write;
};

Result<Pipe> makePipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return makeError(ErrorCode::SPAWN_FAILED, std::string("pipe2 failed: ") + std::strerror(errno));
    }
    Pipe p;
    p.read.reset(fds[0]);
    p.write.reset(fds[1]);
    return Result<Pipe>(std::move(p));
}

bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Everything below runs in the forked child: only async-signal-safe calls.
[[noreturn]] void childMain(const ProcessSpec& spec, int stdinFd, int stdoutFd, int stderrFd, int reportFd,
                            int maxFd, char* const* argv, char* const* envp) {
    setpgid(0, 0);

    struct sigaction dfl;
    std::memset(&dfl, 0, sizeof(dfl));
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    sigaction(SIGPIPE, &dfl, nullptr);
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    // Lift every end above the target range first so no dup2 clobbers a
    // source that happens to sit on 0..3.
    int sources[4] = {stdinFd, stdoutFd, stderrFd, reportFd};
    for (int& fd : sources) {
        fd = fcntl(fd, F_DUPFD_CLOEXEC, CHILD_FD_FLOOR);
        if (fd < 0) _exit(CHILD_EXIT_EXEC_FAILED);
    }
    for (int target = 0; target < 4; target++) {
        if (dup2(sources[target], target) < 0) _exit(CHILD_EXIT_EXEC_FAILED);
    }
    for (int fd = 4; fd < maxFd; fd++) {
        close(fd);
    }

    if (spec.applyLimits) {
        LimitStatus status = ResourceLimiter::apply(spec.limits);
        if (!status.ok) {
            char note[64];
            size_t len = ResourceLimiter::formatFailure(status, note, sizeof(note));
            // The exit status alone still marks the failure if this write is lost.
            if (len > 0) {
                ssize_t written = write(REPORT_FD, note, len);
                (void)written;
            }
            _exit(CHILD_EXIT_LIMITS_FAILED);
        }
    }

    execve(argv[0], argv, envp);
    _exit(CHILD_EXIT_EXEC_FAILED);
}

int highestFdBound() {
    struct rlimit rl;
    if (getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        return static_cast<int>(std::min<rlim_t>(rl.rlim_cur, 65536));
    }
    return 1024;
}

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}

FileDescriptor::~FileDescriptor() {
    reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(other.fd_);
        other.fd_ = -1;
    }
    return *this;
}

int FileDescriptor::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void FileDescriptor::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

ChildGuard::~ChildGuard() {
    if (pid_ > 0) {
        int status = 0;
        double cpu = 0.0;
        uint64_t rss = 0;
        reap(status, cpu, rss);
    }
}

bool ChildGuard::hasExited() const {
    if (pid_ <= 0) return true;
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid_;
}

bool ChildGuard::reap(int& status, double& cpuSeconds, uint64_t& maxRssBytes) {
    if (pid_ <= 0) return false;
    // The leader is at worst a zombie here, so the group id is still ours.
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);

    struct rusage usage;
    std::memset(&usage, 0, sizeof(usage));
    pid_t r;
    do {
        r = wait4(pid_, &status, 0, &usage);
    } while (r < 0 && errno == EINTR);
    pid_ = -1;
    if (r < 0) {
        LOG_ERROR(kCategory, std::string("wait4 failed: ") + std::strerror(errno));
        return false;
    }
    cpuSeconds = static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
                 static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
    maxRssBytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024;
    return true;
}

Result<ProcessOutcome> ProcessRunner::run(const ProcessSpec& spec) {
    if (spec.argv.empty() || spec.argv[0].empty()) {
        return makeError(ErrorCode::INVALID_REQUEST, "empty command line");
    }

    auto inPipe = makePipe();
    if (inPipe.failed()) return inPipe.error();
    auto outPipe = makePipe();
    if (outPipe.failed()) return outPipe.error();
    auto errPipe = makePipe();
    if (errPipe.failed()) return errPipe.error();
    auto reportPipe = makePipe();
    if (reportPipe.failed()) return reportPipe.error();

    std::vector<char*> argv;
    for (const auto& arg : spec.argv) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (const auto& var : spec.env) envp.push_back(const_cast<char*>(var.c_str()));
    envp.push_back(nullptr);
    int maxFd = highestFdBound();

    ScopedSigpipeIgnore sigpipe;
    ProcessOutcome outcome;
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + spec.timeout;

    pid_t pid = fork();
    if (pid < 0) {
        return makeError(ErrorCode::SPAWN_FAILED, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        childMain(spec, inPipe.value().read.get(), outPipe.value().write.get(), errPipe.value().write.get(),
                  reportPipe.value().write.get(), maxFd, argv.data(), envp.data());
    }

    ChildGuard child(pid);
    outcome.started = true;
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        LOG_DEBUG(kCategory, std::string("setpgid: ") + std::strerror(errno));
    }
    LOG_DEBUG(kCategory, "spawned pid " + std::to_string(pid) + " (" + spec.argv[0] + ")");

    inPipe.value().read.reset();
    outPipe.value().write.reset();
    errPipe.value().write.reset();
    reportPipe.value().write.reset();

    FileDescriptor stdinFd = std::move(inPipe.value().write);
    struct Sink {
        FileDescriptor fd;
        std::string* data;
        size_t cap;
    };
    Sink sinks[3] = {
        {std::move(outPipe.value().read), &outcome.stdoutData, spec.maxCaptureBytes},
        {std::move(errPipe.value().read), &outcome.stderrData, spec.maxCaptureBytes},
        {std::move(reportPipe.value().read), &outcome.reportData, spec.maxReportBytes},
    };

    if (!setNonBlocking(stdinFd.get())) stdinFd.reset();
    for (auto& sink : sinks) {
        if (!setNonBlocking(sink.fd.get())) {
            return makeError(ErrorCode::IO_ERROR, std::string("fcntl failed: ") + std::strerror(errno));
        }
    }
    if (spec.stdinData.empty()) stdinFd.reset();

    size_t stdinOffset = 0;
    char buffer[READ_CHUNK];
    bool childGone = false;

    // Returns false once the sink hit EOF or its cap.
    auto drain = [&](Sink& sink) -> bool {
        for (;;) {
            ssize_t n = ::read(sink.fd.get(), buffer, sizeof(buffer));
            if (n > 0) {
                size_t room = sink.cap > sink.data->size() ? sink.cap - sink.data->size() : 0;
                sink.data->append(buffer, std::min(room, static_cast<size_t>(n)));
                if (static_cast<size_t>(n) > room) {
                    outcome.outputLimitExceeded = true;
                    sink.fd.reset();
                    return false;
                }
                continue;
            }
            if (n == 0) {
                sink.fd.reset();
                return false;
            }
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            sink.fd.reset();
            return false;
        }
    };

    while (!outcome.outputLimitExceeded) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            outcome.timedOut = true;
            break;
        }
        int remainingMs = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()) + 1;

        if (childGone) {
            // Whatever is left in the pipes was written before exit.
            for (auto& sink : sinks) {
                if (sink.fd.valid()) drain(sink);
            }
            break;
        }

        std::vector<pollfd> fds;
        std::vector<Sink*> owners;
        if (stdinFd.valid()) {
            fds.push_back({stdinFd.get(), POLLOUT, 0});
            owners.push_back(nullptr);
        }
        for (auto& sink : sinks) {
            if (sink.fd.valid()) {
                fds.push_back({sink.fd.get(), POLLIN, 0});
                owners.push_back(&sink);
            }
        }

        int sliceMs = std::min(remainingMs, POLL_SLICE_MS);
        if (fds.empty()) {
            if (child.hasExited()) break;
            poll(nullptr, 0, sliceMs);
            continue;
        }

        int ready = poll(fds.data(), fds.size(), sliceMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return makeError(ErrorCode::IO_ERROR, std::string("poll failed: ") + std::strerror(errno));
        }

        for (size_t i = 0; i < fds.size(); i++) {
            if (fds[i].revents == 0) continue;
            if (owners[i] == nullptr) {
                if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
                    stdinFd.reset();
                    continue;
                }
                ssize_t n = ::write(stdinFd.get(), spec.stdinData.data() + stdinOffset,
                                    spec.stdinData.size() - stdinOffset);
                if (n > 0) {
                    stdinOffset += static_cast<size_t>(n);
                    if (stdinOffset >= spec.stdinData.size()) stdinFd.reset();
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_DEBUG(kCategory, std::string("stdin closed early: ") + std::strerror(errno));
                    stdinFd.reset();
                }
            } else {
                drain(*owners[i]);
            }
        }

        childGone = child.hasExited();
    }

    int status = 0;
    if (!child.reap(status, outcome.cpuSeconds, outcome.maxRssBytes)) {
        return makeError(ErrorCode::INTERNAL_ERROR, "failed to reap child process");
    }
    outcome.wallSeconds = secondsSince(started);

    if (WIFEXITED(status)) {
        outcome.exited = true;
        outcome.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.termSignal = WTERMSIG(status);
    }

    if (outcome.timedOut) {
        outcome.stdoutData.clear();
        outcome.stderrData.clear();
        outcome.reportData.clear();
    }

    LOG_DEBUG(kCategory, "pid " + std::to_string(pid) + " finished: exit=" + std::to_string(outcome.exitCode) +
              " signal=" + std::to_string(outcome.termSignal) + " wall=" + std::to_string(outcome.wallSeconds) +
              "s cpu=" + std::to_string(outcome.cpuSeconds) + "s" + (outcome.timedOut ? " (timed out)" : ""));
    return outcome;
}

}
}
