#pragma once

#include "bayerflow/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception hierarchy for the bayerflow library
 */

namespace bayerflow {
namespace core {

/**
 * @brief Base exception class for all bayerflow exceptions
 *
 * Carries a result code, the bare message and the throw site.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information (usually file:line)
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Rejected core or frame configuration
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_PARAMETER, message, context) {}
};

/**
 * @brief Broken streaming invariant (pool underflow, misuse of the tick API)
 */
class StreamException : public Exception {
public:
    StreamException(ResultCode code,
                    const std::string& message,
                    const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief File I/O related exceptions
 */
class FileException : public Exception {
public:
    FileException(ResultCode code,
                  const std::string& message,
                  const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

#define BAYERFLOW_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define BAYERFLOW_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace bayerflow
