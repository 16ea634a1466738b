#ifndef NETTRANS_LOGGER_HPP
#define NETTRANS_LOGGER_HPP

#include <fstream>
#include <mutex>
#include <string>

namespace nettrans {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * @brief Process-wide, thread-safe logger.
 *
 * Messages are tagged with the emitting component ("source") and written to
 * stderr as "[time] [LEVEL] [source] message". An optional log file receives
 * a copy of every message that passes the level filter.
 */
class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    /**
     * @brief Mirror log output to a file (appending). An empty path closes the file.
     * @return false if the file could not be opened.
     */
    bool setLogFile(const std::string& path);

    void debug(const std::string& source, const std::string& message);
    void info(const std::string& source, const std::string& message);
    void warning(const std::string& source, const std::string& message);
    void error(const std::string& source, const std::string& message);

    void log(LogLevel level, const std::string& source, const std::string& message);

    static std::string levelToString(LogLevel level);
    static LogLevel levelFromString(const std::string& name);

private:
    Logger() = default;

    LogLevel level_ = LogLevel::INFO;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

} // namespace nettrans

#endif // NETTRANS_LOGGER_HPP
