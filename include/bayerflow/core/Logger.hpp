#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <fstream>

namespace bayerflow {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Simple thread-safe logger
 *
 * Console sink (stdout below ERROR, stderr from ERROR up) plus an optional
 * append-mode file sink.
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_ = level; }

    LogLevel getLevel() const { return minLevel_; }

    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    /**
     * Open (append) a log file, closing any previous one
     */
    bool setLogFile(const std::string& filename);

    void closeLogFile();

    /**
     * Initialize logger in one call; an empty filename disables the file sink
     */
    bool initialize(LogLevel level, bool consoleOutput, const std::string& filename = "");

    /**
     * Path of the open log file, empty when file logging is off
     */
    std::string getCurrentLogFile() const;

    void flush();

    /**
     * Log message
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    // Convenience methods
    void trace(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::TRACE, msg, file, line);
    }

    void debug(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::DEBUG, msg, file, line);
    }

    void info(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::INFO, msg, file, line);
    }

    void warning(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::WARNING, msg, file, line);
    }

    void error(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::ERROR, msg, file, line);
    }

    void critical(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::CRITICAL, msg, file, line);
    }

    static std::string levelToString(LogLevel level);

    /**
     * Parse a level name (case-insensitive). Returns false on unknown names.
     */
    static bool levelFromString(const std::string& name, LogLevel& level);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Convenience macros
#define LOG_TRACE(msg) bayerflow::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) bayerflow::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) bayerflow::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) bayerflow::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) bayerflow::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) bayerflow::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging support
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        if (component_.empty()) {
            Logger::getInstance().log(level_, stream_.str());
        } else {
            Logger::getInstance().log(level_, "[" + component_ + "] " + stream_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define BAYERFLOW_LOG_DEBUG(component) \
    bayerflow::core::LogStream(bayerflow::core::LogLevel::DEBUG, component)

#define BAYERFLOW_LOG_INFO(component) \
    bayerflow::core::LogStream(bayerflow::core::LogLevel::INFO, component)

#define BAYERFLOW_LOG_WARNING(component) \
    bayerflow::core::LogStream(bayerflow::core::LogLevel::WARNING, component)

#define BAYERFLOW_LOG_ERROR(component) \
    bayerflow::core::LogStream(bayerflow::core::LogLevel::ERROR, component)

} // namespace core
} // namespace bayerflow
