#include "Logger.hpp"

#include <ctime>
#include <iostream>

#include "constants.hpp"

Logger::Logger(LogLevel level, const char* file, int line)
    : msgLevel_(level), file_(file), line_(line) {}

Logger::~Logger() {
  std::ostringstream output;
  output << "(" << file_ << ":" << line_ << ") " << stream_.str();
  Logger::log(msgLevel_, output.str());
}

std::ostringstream& Logger::stream() {
  return stream_;
}

// LOG_LEVEL comes from constants.hpp or -DLOG_LEVEL=N; anything out of
// range falls back to INFO.
Logger::LogLevel Logger::level_ =
    (LOG_LEVEL >= Logger::DEBUG && LOG_LEVEL <= Logger::ERROR)
        ? static_cast<Logger::LogLevel>(LOG_LEVEL)
        : Logger::INFO;

void Logger::setLevel(LogLevel level) {
  level_ = level;
}

std::string Logger::getCurrentTime() {
  static const size_t kTimeBufferSize = 32;
  time_t now = time(0);
  struct tm timeinfo;
  localtime_r(&now, &timeinfo);
  char buffer[kTimeBufferSize];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
  return std::string(buffer);
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
    case DEBUG:
      return "DEBUG";
    case INFO:
      return "INFO";
    case ERROR:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

// The response body may go to stdout (rangecat), so log lines go to stderr.
void Logger::log(LogLevel level, const std::string& message) {
  if (level < level_) {
    return;
  }

  std::cerr << "[" << getCurrentTime() << "] [" << levelToString(level) << "] "
            << message << std::endl;
}

