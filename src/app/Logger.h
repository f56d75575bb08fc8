#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level();
    void log(LogLevel level, const std::string& msg);

    bool isEnabled(LogLevel level);

    // Redirects output, mainly so tests can capture it. Defaults to std::clog.
    void setSink(std::ostream* sink);

    // Accepts DEBUG/TRACE, INFO, WARN/WARNING and ERROR in any case.
    // Unknown names fall back to INFO.
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    LogLevel currentLevel_ = LogLevel::INFO;
    std::ostream* sink_ = &std::clog;
    std::mutex mutex_;
};


#define LOG_DEBUG(msg) \
  if (Logger::instance().isEnabled(LogLevel::DEBUG)) { \
    std::ostringstream oss; \
    oss << msg; \
    Logger::instance().log(LogLevel::DEBUG, oss.str()); \
  }

#define LOG_INFO(msg) \
  if (Logger::instance().isEnabled(LogLevel::INFO)) { \
    std::ostringstream oss; \
    oss << msg; \
    Logger::instance().log(LogLevel::INFO, oss.str()); \
  }

#define LOG_WARN(msg) \
  if (Logger::instance().isEnabled(LogLevel::WARN)) { \
    std::ostringstream oss; \
    oss << msg; \
    Logger::instance().log(LogLevel::WARN, oss.str()); \
  }

#define LOG_ERROR(msg) \
  if (Logger::instance().isEnabled(LogLevel::ERROR)) { \
    std::ostringstream oss; \
    oss << msg; \
    Logger::instance().log(LogLevel::ERROR, oss.str()); \
  }
