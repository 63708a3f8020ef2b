#include "utils.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "Logger.hpp"

// Trim whitespace from both ends of a string and return the trimmed copy.
std::string trim_copy(const std::string& str) {
  std::string res = str;
  // left trim
  std::string::size_type idx = 0;
  while (idx < res.size() &&
         (std::isspace(static_cast<unsigned char>(res[idx])) != 0)) {
    ++idx;
  }
  res.erase(0, idx);
  // right trim
  std::string::size_type jdx = res.size();
  while (jdx > 0 &&
         (std::isspace(static_cast<unsigned char>(res[jdx - 1])) != 0)) {
    --jdx;
  }
  res.erase(jdx);
  return res;
}

bool ci_equal(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::string::size_type i = 0; i < a.size(); ++i) {
    char ca = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
    char cb = static_cast<char>(std::tolower(static_cast<unsigned char>(b[i])));
    if (ca != cb) {
      return false;
    }
  }
  return true;
}

int parseLogLevelFlag(const std::string& arg) {
  // Guard 1: Wrong length
  if (arg.length() != 4) {
    return -1;
  }

  // Guard 2: Wrong prefix
  if (arg.compare(0, 3, "-l:") != 0) {
    return -1;
  }

  // Guard 3: Invalid value
  char level = arg[3];
  if (level < '0' || level > '2') {
    return -1;
  }

  return level - '0';
}

bool safeStrtoll(const std::string& s, long long& out) {
  if (s.empty()) {
    return false;
  }
  errno = 0;
  char* endptr = NULL;
  long long num = std::strtoll(s.c_str(), &endptr, 10);
  // Check for conversion errors: range error, no conversion, or trailing chars
  if (errno == ERANGE || endptr == s.c_str() ||
      (endptr != NULL && *endptr != '\0')) {
    return false;
  }
  out = num;
  return true;
}

bool parseByteOffset(const std::string& s, off_t& out) {
  if (s.empty()) {
    return false;
  }
  for (std::string::size_type i = 0; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  long long value;
  if (!safeStrtoll(s, value) ||
      value > static_cast<long long>(std::numeric_limits<off_t>::max())) {
    // only digits, so the failure is an overflow
    out = std::numeric_limits<off_t>::max();
    return true;
  }
  out = static_cast<off_t>(value);
  return true;
}

std::string formatHttpDate(time_t t) {
  static const size_t kDateBufferSize = 64;
  struct tm gmt;
  gmtime_r(&t, &gmt);
  char buffer[kDateBufferSize];
  strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &gmt);
  return std::string(buffer);
}

std::string baseName(const std::string& path) {
  std::string::size_type end = path.find_last_not_of('/');
  if (end == std::string::npos) {
    return path.empty() ? path : "/";
  }
  std::string::size_type slash = path.rfind('/', end);
  if (slash == std::string::npos) {
    return path.substr(0, end + 1);
  }
  return path.substr(slash + 1, end - slash);
}

std::string offToString(off_t value) {
  std::ostringstream oss;
  oss << static_cast<long long>(value);
  return oss.str();
}

CliArgs::CliArgs()
    : path(),
      log_level(-1),
      head_only(false),
      has_range(false),
      range(),
      has_if_range(false),
      if_range(),
      media_type(),
      has_download_name(false),
      download_name() {}

// Fetch the value following an option such as "-r".
static std::string optionValue(int argc, char** argv, int& i) {
  std::string opt = argv[i];
  if (i + 1 >= argc) {
    throw std::runtime_error("Error: option " + opt + " requires a value");
  }
  ++i;
  return argv[i];
}

void processArgs(int argc, char** argv, CliArgs& out) {
  out = CliArgs();

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    int level = parseLogLevelFlag(arg);

    if (level >= 0) {
      if (out.log_level >= 0) {
        throw std::runtime_error("Error: multiple log level flags provided");
      }
      out.log_level = level;
    } else if (arg == "-H") {
      out.head_only = true;
    } else if (arg == "-r") {
      out.range = optionValue(argc, argv, i);
      out.has_range = true;
    } else if (arg == "-i") {
      out.if_range = optionValue(argc, argv, i);
      out.has_if_range = true;
    } else if (arg == "-t") {
      out.media_type = optionValue(argc, argv, i);
    } else if (arg == "-n") {
      out.download_name = optionValue(argc, argv, i);
      out.has_download_name = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::runtime_error("Error: unknown option " + arg);
    } else if (out.path.empty()) {
      out.path = arg;
    } else {
      throw std::runtime_error("Error: multiple file paths provided");
    }
  }
  if (out.log_level < 0) {
    out.log_level = Logger::INFO;  // Default: INFO
  }
  if (out.path.empty()) {
    throw std::runtime_error("Error: no file path provided");
  }
}
