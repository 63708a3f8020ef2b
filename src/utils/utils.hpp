#pragma once

#include <sys/types.h>

#include <ctime>
#include <string>

// Trim whitespace (space, tab, CR, LF) from both ends of a string.
// Returns a copy with the trimmed content.
std::string trim_copy(const std::string& str);

// ASCII case-insensitive comparison, used for header names and tokens.
bool ci_equal(const std::string& a, const std::string& b);

// Parse log level flag (e.g., "-l:0" for DEBUG, "-l:1" for INFO, "-l:2" for
// ERROR)
int parseLogLevelFlag(const std::string& arg);

// Safely parse a string to a long long integer using strtoll with error
// checking. Returns true on success with value stored in `out`, false on
// failure (empty string, invalid characters, or out of range).
bool safeStrtoll(const std::string& s, long long& out);

// Parse a non-empty run of ASCII digits as a byte offset. Values too large
// for off_t saturate to the largest off_t. Returns false on any non-digit.
bool parseByteOffset(const std::string& s, off_t& out);

// Format a timestamp as an IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string formatHttpDate(time_t t);

// Last path component of a '/'-separated path ("a/b/c.txt" -> "c.txt").
std::string baseName(const std::string& path);

// Decimal rendering of an off_t
std::string offToString(off_t value);

// Command-line options for the rangecat tool.
struct CliArgs {
  CliArgs();

  std::string path;
  int log_level;
  bool head_only;
  bool has_range;
  std::string range;
  bool has_if_range;
  std::string if_range;
  std::string media_type;
  bool has_download_name;
  std::string download_name;
};

// Parse program arguments into `out`. Throws std::runtime_error on misuse.
void processArgs(int argc, char** argv, CliArgs& out);
