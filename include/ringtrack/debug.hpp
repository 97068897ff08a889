#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace ringtrack {

// Define log levels
enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

class Logger {
 private:
  static LogLevel& threshold() {
    static LogLevel level = LogLevel::INFO;
    return level;
  }

 public:
  static void set_level(LogLevel level) { threshold() = level; }
  static LogLevel get_level() { return threshold(); }

  // Templated log function to allow various input types
  template <typename T>
  static void log(const T& message, LogLevel level) {
    if (level < threshold()) {
      return;
    }
    std::ostream& os = (level == LogLevel::ERROR) ? std::cerr : std::cout;
    switch (level) {
      case LogLevel::INFO:
        os << "[INFO]: " << message << std::endl;
        break;
      case LogLevel::WARN:
        os << "[WARN]: " << message << std::endl;
        break;
      case LogLevel::ERROR:
        os << "[ERROR]: " << message << std::endl;
        break;
      case LogLevel::DEBUG:
        os << "[DEBUG]: " << message << std::endl;
        break;
    }
  }
};

}  // namespace ringtrack

// Macros for easy logging. Arguments are streamed, e.g.
// RINGTRACK_LOG_INFO("camera " << cam << " done");
#define RINGTRACK_LOG(level, msg)                                     \
  do {                                                                \
    if ((level) >= ::ringtrack::Logger::get_level()) {                \
      std::ostringstream ringtrack_log_stream_;                       \
      ringtrack_log_stream_ << msg;                                   \
      ::ringtrack::Logger::log(ringtrack_log_stream_.str(), (level)); \
    }                                                                 \
  } while (0)

#define RINGTRACK_LOG_INFO(msg) RINGTRACK_LOG(::ringtrack::LogLevel::INFO, msg)
#define RINGTRACK_LOG_WARN(msg) RINGTRACK_LOG(::ringtrack::LogLevel::WARN, msg)
#define RINGTRACK_LOG_ERROR(msg) RINGTRACK_LOG(::ringtrack::LogLevel::ERROR, msg)
#define RINGTRACK_LOG_DEBUG(msg) RINGTRACK_LOG(::ringtrack::LogLevel::DEBUG, msg)
