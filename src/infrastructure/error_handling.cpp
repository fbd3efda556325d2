#include "error_handling.h"
#include <ctime>

namespace pysandbox {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_REQUEST: return "Invalid request";
        case ErrorCode::SECURITY_VIOLATION: return "Security violation";
        case ErrorCode::INTERPRETER_NOT_FOUND: return "Interpreter not found";
        case ErrorCode::SPAWN_FAILED: return "Process spawn failed";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::SERIALIZATION_ERROR: return "Serialization error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

std::string describeError(const Error& error) {
    std::string msg = error.message.empty() ? errorToString(error.code) : error.message;
    if (!error.context.empty()) {
        msg += " [" + error.context + "]";
    }
    return msg;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

}
