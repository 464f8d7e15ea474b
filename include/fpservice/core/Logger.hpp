#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace fpservice {
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
 * Parse a level name ("debug", "WARNING", ...). Unknown names map to INFO.
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * Simple thread-safe logger
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_.store(level); }

    LogLevel getLevel() const { return minLevel_.load(); }

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable);

    /**
     * Open (append mode) a log file, replacing any previous one
     */
    bool setLogFile(const std::string& filename);

    void closeLogFile();

    /**
     * Initialize logger with configuration
     * @param level Minimum level to emit
     * @param consoleOutput Mirror messages to stdout/stderr
     * @param filename Log file path, empty for console only
     * @return false if the log file could not be opened
     */
    bool initialize(LogLevel level, bool consoleOutput, const std::string& filename = "");

    /**
     * Get current log file path, empty when not logging to file
     */
    std::string getCurrentLogFile() const;

    /**
     * Flush all pending log messages
     */
    void flush();

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

private:
    Logger();
    ~Logger();

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;
    bool openLogFileLocked(const std::string& filename);

    std::atomic<LogLevel> minLevel_{LogLevel::INFO};
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Convenience macros
#define LOG_TRACE(msg) fpservice::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) fpservice::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) fpservice::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) fpservice::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) fpservice::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) fpservice::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging, message is prefixed with "[component] "
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level) {
        if (!component.empty()) {
            stream_ << "[" << component << "] ";
        }
    }

    ~LogStream() {
        Logger::getInstance().log(level_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
};

#define FPSERVICE_LOG_DEBUG(component) \
    fpservice::core::LogStream(fpservice::core::LogLevel::DEBUG, component)

#define FPSERVICE_LOG_INFO(component) \
    fpservice::core::LogStream(fpservice::core::LogLevel::INFO, component)

#define FPSERVICE_LOG_WARNING(component) \
    fpservice::core::LogStream(fpservice::core::LogLevel::WARNING, component)

#define FPSERVICE_LOG_ERROR(component) \
    fpservice::core::LogStream(fpservice::core::LogLevel::ERROR, component)

#define FPSERVICE_LOG_CRITICAL(component) \
    fpservice::core::LogStream(fpservice::core::LogLevel::CRITICAL, component)

} // namespace core
} // namespace fpservice
