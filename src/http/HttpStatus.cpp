#include "HttpStatus.hpp"

#include <sstream>

namespace http {

std::string reasonPhrase(Status status) {
  switch (status) {
    case S_200_OK:
      return "OK";
    case S_206_PARTIAL_CONTENT:
      return "Partial Content";
    case S_404_NOT_FOUND:
      return "Not Found";
    case S_416_RANGE_NOT_SATISFIABLE:
      return "Range Not Satisfiable";
    case S_500_INTERNAL_SERVER_ERROR:
      return "Internal Server Error";
    default:
      return "";
  }
}

std::string statusWithReason(Status s) {
  std::ostringstream oss;
  oss << static_cast<int>(s);
  std::string reason = reasonPhrase(s);
  if (!reason.empty()) {
    oss << " " << reason;
  }
  return oss.str();
}

bool isSuccess(Status s) {
  return s >= 200 && s <= 299;
}

}  // namespace http
