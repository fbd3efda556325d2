#include "sandbox/executor.h"
#include "sandbox/codec.h"
#include "sandbox/test_runner.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <cstdlib>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace pysandbox {
namespace sandbox {

namespace {

const char* kCategory = "executor";

bool isExecutableFile(const std::string& path) {
    if (path.empty()) return false;
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
    return access(path.c_str(), X_OK) == 0;
}

std::string renderMainSection(const RestrictedEnvironment& env) {
    std::ostringstream py;

    py << "_RECURSION_LIMIT = " << env.recursionLimit << "\n";
    py << "_MAX_OUTPUT = " << env.maxOutputBytes << "\n";
    py << "\n";
    py << "\n";
    py << "def _clean(text):\n";
    py << "    return text.encode('utf-8', 'replace').decode('utf-8')\n";
    py << "\n";
    py << "\n";
    py << "def _emit(report):\n";
    py << "    data = _json.dumps(report, ensure_ascii=True).encode('ascii')\n";
    py << "    view = memoryview(data)\n";
    py << "    while view:\n";
    py << "        view = view[_os.write(3, view):]\n";
    py << "\n";
    py << "\n";
    // Harness frames come from '<string>'; keep what starts at user code.
    py << "def _user_traceback(exc):\n";
    py << "    frames = list(_traceback.extract_tb(exc.__traceback__))\n";
    py << "    while frames and not (frames[0].filename == '<submission>' or frames[0].filename.startswith('<test ')):\n";
    py << "        frames.pop(0)\n";
    py << "    lines = ['Traceback (most recent call last):\\n']\n";
    py << "    lines.extend(_traceback.format_list(frames))\n";
    py << "    lines.extend(_traceback.format_exception_only(type(exc), exc))\n";
    py << "    return ''.join(lines)\n";
    py << "\n";
    py << "\n";
    py << "def _security_report(violations):\n";
    py << "    return {'status': 'security', 'error': \"Import of module '%s' is not allowed\" % violations[0]}\n";
    py << "\n";
    py << "\n";
    py << "def _main():\n";
    py << "    try:\n";
    py << "        request = _json.loads(_sys.stdin.buffer.read().decode('utf-8'))\n";
    py << "        source = request['code']\n";
    py << "        cases = request.get('test_cases', [])\n";
    py << "    except Exception as exc:\n";
    py << "        _emit({'status': 'system', 'error': 'invalid harness request: %s' % exc})\n";
    py << "        return\n";
    py << "    try:\n";
    py << "        program = compile(source, '<submission>', 'exec')\n";
    py << "    except (SyntaxError, ValueError) as exc:\n";
    py << "        _emit({'status': 'execution', 'error': str(exc) or type(exc).__name__,\n";
    py << "               'traceback': ''.join(_traceback.format_exception_only(type(exc), exc))})\n";
    py << "        return\n";
    py << "\n";
    py << "    _sys.setrecursionlimit(_RECURSION_LIMIT)\n";
    py << "    violations = []\n";
    py << "    out = _LimitedBuffer(_MAX_OUTPUT)\n";
    py << "    err = _LimitedBuffer(_MAX_OUTPUT)\n";
    py << "    started = _time.perf_counter()\n";
    py << "    namespace = _build_namespace(violations)\n";
    py << "    with _contextlib.redirect_stdout(out), _contextlib.redirect_stderr(err):\n";
    py << "        try:\n";
    py << "            exec(program, namespace)\n";
    py << "        except BaseException as exc:\n";
    py << "            err.write('Error: %s\\n' % (str(exc) or type(exc).__name__))\n";
    py << "            err.write(_user_traceback(exc))\n";
    py << "    if violations:\n";
    py << "        _emit(_security_report(violations))\n";
    py << "        return\n";
    py << "\n";
    py << "    results = []\n";
    py << "    for number, case in enumerate(cases, 1):\n";
    py << "        result = _run_case(number, case, program, _MAX_OUTPUT)\n";
    py << "        for key in ('actual_output', 'error'):\n";
    py << "            if key in result:\n";
    py << "                result[key] = _clean(result[key])\n";
    py << "        results.append(result)\n";
    py << "\n";
    py << "    _emit({'status': 'ok', 'stdout': _clean(out.getvalue()), 'stderr': _clean(err.getvalue()),\n";
    py << "           'execution_time': _time.perf_counter() - started,\n";
    py << "           'output_truncated': out.truncated or err.truncated,\n";
    py << "           'test_results': results})\n";
    py << "\n";
    py << "\n";
    py << "try:\n";
    py << "    _main()\n";
    py << "except BaseException as exc:\n";
    py << "    _emit({'status': 'execution', 'error': 'harness failure: %s' % (str(exc) or type(exc).__name__)})\n";

    return py.str();
}

}

struct TimedExecutor::Impl {
    utils::SandboxConfig config;
};

TimedExecutor::TimedExecutor(const utils::SandboxConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

TimedExecutor::~TimedExecutor() = default;

Result<std::string> TimedExecutor::locateInterpreter() const {
    std::vector<std::string> candidates;
    if (!impl_->config.pythonPath.empty()) candidates.push_back(impl_->config.pythonPath);
    const char* fromEnv = std::getenv("PYSANDBOX_PYTHON");
    if (fromEnv && *fromEnv) candidates.push_back(fromEnv);
    candidates.push_back("/usr/bin/python3");
    candidates.push_back("/usr/local/bin/python3");
    const char* path = std::getenv("PATH");
    if (path) {
        for (const auto& dir : utils::Formatter::split(path, ':')) {
            if (!dir.empty()) candidates.push_back(dir + "/python3");
        }
    }

    for (const auto& candidate : candidates) {
        if (isExecutableFile(candidate)) {
            LOG_DEBUG(kCategory, "using interpreter " + candidate);
            return candidate;
        }
    }
    return makeError(ErrorCode::INTERPRETER_NOT_FOUND, "Python interpreter not found");
}

std::string TimedExecutor::renderHarness(const RestrictedEnvironment& env) {
    std::ostringstream py;
    py << "import contextlib as _contextlib\n";
    py << "import io as _io\n";
    py << "import json as _json\n";
    py << "import os as _os\n";
    py << "import sys as _sys\n";
    py << "import time as _time\n";
    py << "import traceback as _traceback\n";
    py << EnvironmentBuilder::renderPrelude(env);
    py << "\n\n";
    py << TestCaseRunner::renderCaseRunner();
    py << "\n\n";
    py << renderMainSection(env);
    return py.str();
}

std::vector<std::string> TimedExecutor::childEnvironment() {
    return {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "LANG=C.UTF-8",
        "LC_ALL=C.UTF-8",
    };
}

Result<ProcessOutcome> TimedExecutor::run(const std::string& code, const std::vector<TestCase>& testCases,
                                          const RestrictedEnvironment& env, const ResourceLimits& limits,
                                          std::chrono::milliseconds timeout) {
    auto interpreter = locateInterpreter();
    if (interpreter.failed()) {
        LOG_ERROR(kCategory, interpreter.error().message);
        return interpreter.error();
    }

    ProcessSpec spec;
    spec.argv = {interpreter.value(), "-I", "-S", "-B", "-c", renderHarness(env)};
    spec.env = childEnvironment();
    spec.stdinData = Codec::encodeHarnessRequest(code, testCases);
    spec.limits = limits;
    spec.timeout = timeout;
    // Harness buffers are capped in characters; leave room for UTF-8 and the traceback.
    spec.maxCaptureBytes = static_cast<size_t>(env.maxOutputBytes) * 4 + 65536;
    spec.maxReportBytes = static_cast<size_t>(impl_->config.maxReportSize);

    LOG_INFO(kCategory, "executing " + utils::Logger::redactCode(code) + " with " +
             std::to_string(testCases.size()) + " test case(s), cpu " + std::to_string(limits.cpuSeconds) +
             "s, memory " + utils::Formatter::formatBytes(limits.addressSpaceBytes));
    return ProcessRunner::run(spec);
}

}
}
