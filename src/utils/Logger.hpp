#pragma once

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

class Logger {
 public:
  enum LogLevel { DEBUG, INFO, ERROR };

  // Logger can also be used as a temporary RAII stream object. This allows
  // usage like: LOG(INFO) << "message"; A temporary Logger is constructed
  // with the message location and level, its stream() is used to build the
  // message, and the destructor forwards the composed message to the static
  // logging backend.
  Logger(LogLevel level, const char* file, int line);
  ~Logger();

  std::ostringstream& stream();

 private:
  // Temporary RAII object, never copied
  Logger(const Logger&);
  Logger& operator=(const Logger&);

  LogLevel msgLevel_;
  const char* file_;
  int line_;
  std::ostringstream stream_;

  static LogLevel level_;

  static std::string getCurrentTime();
  static std::string levelToString(LogLevel level);

 public:
  static void setLevel(LogLevel level);
  static void log(LogLevel level, const std::string& message);
};

#define LOG(level) Logger(Logger::level, __FILE__, __LINE__).stream()

// Log an errno-related error with strerror(errno) appended.
#define LOG_PERROR(level, msg) \
  LOG(level) << msg << ": " << std::strerror(errno)
