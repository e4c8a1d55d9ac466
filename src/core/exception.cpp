#include "bayerflow/core/exception.h"
#include <sstream>

namespace bayerflow {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_GENERIC:
            return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_NOT_INITIALIZED:
            return "ERROR_NOT_INITIALIZED";
        case ResultCode::ERROR_INVARIANT_VIOLATION:
            return "ERROR_INVARIANT_VIOLATION";
        case ResultCode::ERROR_PROTOCOL_VIOLATION:
            return "ERROR_PROTOCOL_VIOLATION";
        case ResultCode::ERROR_FILE_NOT_FOUND:
            return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        case ResultCode::ERROR_TIMEOUT:
            return "ERROR_TIMEOUT";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace bayerflow
