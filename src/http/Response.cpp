#include "Response.hpp"

#include <sstream>

#include "HttpStatus.hpp"
#include "constants.hpp"
#include "utils.hpp"

Response::Response() : Message(), status_line() {}

Response::Response(const Response& other)
    : Message(other), status_line(other.status_line) {}

Response& Response::operator=(const Response& other) {
  if (this != &other) {
    Message::operator=(other);
    status_line = other.status_line;
  }

  return *this;
}

Response::~Response() {}

std::string Response::startLine() const {
  return status_line.toString();
}

std::string Response::serializeHead() const {
  std::ostringstream o;
  o << startLine() << CRLF;
  o << serializeHeaders();
  o << CRLF;
  return o.str();
}

void Response::setStatus(http::Status status, const std::string& version) {
  status_line.version = version;
  status_line.status_code = status;
  status_line.reason = http::reasonPhrase(status);
}

void Response::setBodyWithContentType(const std::string& data,
                                      const std::string& contentType) {
  body.data = data;
  setHeader("Content-Type", contentType);
  setHeader("Content-Length", offToString(static_cast<off_t>(body.size())));
}
