#include "StatusLine.hpp"

#include <sstream>

#include "constants.hpp"

StatusLine::StatusLine()
    : version(HTTP_VERSION),
      status_code(http::S_200_OK),
      reason(http::reasonPhrase(http::S_200_OK)) {}

StatusLine::StatusLine(const StatusLine& other)
    : version(other.version),
      status_code(other.status_code),
      reason(other.reason) {}

StatusLine& StatusLine::operator=(const StatusLine& other) {
  if (this != &other) {
    version = other.version;
    status_code = other.status_code;
    reason = other.reason;
  }
  return *this;
}

StatusLine::~StatusLine() {}

std::string StatusLine::toString() const {
  std::ostringstream o;
  o << version << " " << static_cast<int>(status_code) << " " << reason;
  return o.str();
}
