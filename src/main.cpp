#include <iostream>
#include <string>
#include <cstdlib>
#include <cctype>
#include <fstream>
#include <sstream>
#include <iterator>
#include <stdexcept>
#include <getopt.h>

#include "sandbox/sandbox.h"
#include "sandbox/codec.h"
#include "sandbox/result_assembler.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include "infrastructure/error_handling.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace pysandbox {

static const char* kCategory = "main";

struct CliConfig {
    std::string configPath;
    std::string timeLimit;
    std::string memoryLimit;
    std::string codeFile;
    std::string testsFile;
    std::string logLevel;
    std::string logFile;
    bool pretty = false;
    bool showHelp = false;
    bool showVersion = false;
};

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n";
    std::cout << "Runs untrusted Python code and prints a JSON result on stdout.\n";
    std::cout << "The request is read as JSON from stdin, from the CODE/TEST_CASES/TIME_LIMIT/\n";
    std::cout << "MEMORY_LIMIT environment variables when CODE is set, or from --file.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -c, --config PATH       Configuration file (key=value)\n";
    std::cout << "  -t, --time-limit SEC    Time limit in seconds\n";
    std::cout << "  -m, --memory-limit N    Memory limit in bytes, or with k/m/g suffix\n";
    std::cout << "  -f, --file PATH         Read the submission from a file\n";
    std::cout << "  -T, --tests PATH        JSON array of test cases (with --file)\n";
    std::cout << "  -l, --loglevel LEVEL    Log level (trace/debug/info/warn/error/off)\n";
    std::cout << "  -L, --logfile PATH      Also write logs to a file\n";
    std::cout << "  -p, --pretty            Indent the JSON result\n";
}

void printVersion() {
    std::cout << "pysandbox v1.0.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
    std::cout << "JSON: nlohmann/json " << NLOHMANN_JSON_VERSION_MAJOR << "."
              << NLOHMANN_JSON_VERSION_MINOR << "." << NLOHMANN_JSON_VERSION_PATCH << "\n";
}

bool parseArgs(int argc, char* argv[], CliConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"time-limit", required_argument, nullptr, 't'},
        {"memory-limit", required_argument, nullptr, 'm'},
        {"file", required_argument, nullptr, 'f'},
        {"tests", required_argument, nullptr, 'T'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"logfile", required_argument, nullptr, 'L'},
        {"pretty", no_argument, nullptr, 'p'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "hvc:t:m:f:T:l:L:p", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                break;
            case 'v':
                config.showVersion = true;
                break;
            case 'c':
                config.configPath = optarg;
                break;
            case 't':
                config.timeLimit = optarg;
                break;
            case 'm':
                config.memoryLimit = optarg;
                break;
            case 'f':
                config.codeFile = optarg;
                break;
            case 'T':
                config.testsFile = optarg;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            case 'L':
                config.logFile = optarg;
                break;
            case 'p':
                config.pretty = true;
                break;
            default:
                return false;
        }
    }

    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    if (!config.testsFile.empty() && config.codeFile.empty()) {
        std::cerr << "--tests requires --file\n";
        return false;
    }
    return true;
}

Result<std::string> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return makeError(ErrorCode::IO_ERROR, "cannot open " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

Result<json> parseInteger(const std::string& text, const std::string& what) {
    std::string value = utils::Formatter::trim(text);
    if (value.empty() || value.size() > 18) {
        return makeError(ErrorCode::INVALID_REQUEST, "invalid " + what + " '" + text + "'");
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return makeError(ErrorCode::INVALID_REQUEST, "invalid " + what + " '" + text + "'");
        }
    }
    return json(std::stoull(value));
}

Result<json> parseJsonText(const std::string& text, const std::string& what) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return makeError(ErrorCode::INVALID_REQUEST, what + " is not valid JSON");
    }
    return parsed;
}

// Builds the request object from whichever source is in use; -t/-m win.
Result<json> gatherRequest(const CliConfig& cli) {
    json request = json::object();

    if (!cli.codeFile.empty()) {
        auto code = readFile(cli.codeFile);
        if (code.failed()) return code.error();
        request["code"] = code.value();
        if (!cli.testsFile.empty()) {
            auto tests = readFile(cli.testsFile);
            if (tests.failed()) return tests.error();
            auto parsed = parseJsonText(tests.value(), "test case file");
            if (parsed.failed()) return parsed.error();
            request["test_cases"] = parsed.value();
        }
    } else if (const char* code = std::getenv("CODE"); code && *code) {
        request["code"] = code;
        const char* tests = std::getenv("TEST_CASES");
        if (tests && *tests) {
            auto parsed = parseJsonText(tests, "TEST_CASES");
            if (parsed.failed()) return parsed.error();
            request["test_cases"] = parsed.value();
        }
        if (const char* t = std::getenv("TIME_LIMIT"); t && *t) {
            auto value = parseInteger(t, "TIME_LIMIT");
            if (value.failed()) return value.error();
            request["time_limit_seconds"] = value.value();
        }
        if (const char* m = std::getenv("MEMORY_LIMIT"); m && *m) {
            request["memory_limit_bytes"] = std::string(m);
        }
    } else {
        std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        auto parsed = parseJsonText(input, "request");
        if (parsed.failed()) return parsed.error();
        if (!parsed.value().is_object()) {
            return makeError(ErrorCode::INVALID_REQUEST, "request must be a JSON object");
        }
        request = parsed.value();
    }

    if (!cli.timeLimit.empty()) {
        auto value = parseInteger(cli.timeLimit, "time limit");
        if (value.failed()) return value.error();
        request["time_limit_seconds"] = value.value();
    }
    if (!cli.memoryLimit.empty()) {
        request["memory_limit_bytes"] = cli.memoryLimit;
    }
    return request;
}

bool setupConfig(const CliConfig& cli) {
    auto& config = utils::Config::instance();
    config.loadDefaults();

    std::string path = cli.configPath;
    if (path.empty()) {
        const char* fromEnv = std::getenv("PYSANDBOX_CONFIG");
        if (fromEnv) path = fromEnv;
    }
    if (!path.empty() && !config.load(path)) {
        std::cerr << "Failed to load config: " << path << "\n";
        return false;
    }
    config.applyEnvironment();
    return true;
}

void setupLogging(const CliConfig& cli) {
    utils::LoggingConfig logging = utils::Config::instance().getLoggingConfig();
    std::string file = cli.logFile.empty() ? logging.file : cli.logFile;
    std::string level = cli.logLevel.empty() ? logging.level : cli.logLevel;

    utils::Logger::init(file);
    utils::Logger::enableConsole(logging.console);
    if (!utils::Logger::setLevel(level)) {
        utils::Logger::setLevel(utils::LogLevel::WARN);
        LOG_WARN(kCategory, "unknown log level '" + level + "', using warn");
    }
}

int emit(const sandbox::ExecutionResult& result, bool pretty) {
    json out = sandbox::Codec::toJson(result);
    std::cout << out.dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace) << "\n";
    std::cout.flush();
    return result.errorType == sandbox::ErrorType::SYSTEM ? 1 : 0;
}

int run(const CliConfig& cli) {
    if (!setupConfig(cli)) {
        return 1;
    }
    setupLogging(cli);

    utils::SandboxConfig sandboxConfig = utils::Config::instance().getSandboxConfig();

    auto request = gatherRequest(cli);
    if (request.failed()) {
        LOG_ERROR(kCategory, describeError(request.error()));
        return emit(sandbox::ResultAssembler::fromError(request.error()), cli.pretty);
    }
    auto parsed = sandbox::Codec::parseRequest(request.value(), sandboxConfig);
    if (parsed.failed()) {
        LOG_ERROR(kCategory, describeError(parsed.error()));
        return emit(sandbox::ResultAssembler::fromError(parsed.error()), cli.pretty);
    }

    sandbox::Sandbox box(sandboxConfig);
    sandbox::ExecutionResult result = box.execute(parsed.value());
    int rc = emit(result, cli.pretty);
    utils::Logger::shutdown();
    return rc;
}

}

int main(int argc, char* argv[]) {
    pysandbox::CliConfig cli;

    if (!pysandbox::parseArgs(argc, argv, cli)) {
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    }

    if (cli.showHelp) {
        pysandbox::printHelp(argv[0]);
        return 0;
    }

    if (cli.showVersion) {
        pysandbox::printVersion();
        return 0;
    }

    try {
        return pysandbox::run(cli);
    } catch (const std::exception& e) {
        return pysandbox::emit(pysandbox::sandbox::ResultAssembler::internalFailure(e), cli.pretty);
    }
}
