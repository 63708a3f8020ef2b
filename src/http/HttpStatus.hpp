#pragma once

#include <string>

namespace http {

// Statuses a range response can carry.
enum Status {
  S_0_UNKNOWN = 0,
  // 2xx Success
  S_200_OK = 200,
  S_206_PARTIAL_CONTENT = 206,
  // 4xx Client Errors
  S_404_NOT_FOUND = 404,
  S_416_RANGE_NOT_SATISFIABLE = 416,
  // 5xx Server Errors
  S_500_INTERNAL_SERVER_ERROR = 500
};

std::string reasonPhrase(Status s);

// Return a single string containing the numeric status and reason phrase,
// e.g. "404 Not Found". Accept only the enum to avoid casts.
std::string statusWithReason(Status s);

// 2xx
bool isSuccess(Status status);

}  // namespace http
