#ifndef POSTSCHED_LOGGER_HPP
#define POSTSCHED_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>

namespace postsched {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

bool parseLogLevel(const std::string& text, LogLevel& out);

class Logger {
public:
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Returns false when the file cannot be opened; console logging continues.
    bool setLogFile(const std::string& filename);
    void setMinLevel(LogLevel level);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mutex_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;
    LogLevel min_level_ = LogLevel::INFO;

    std::string levelToString(LogLevel level);
    std::string getCurrentTime();
};

} // namespace postsched

#endif // POSTSCHED_LOGGER_HPP
