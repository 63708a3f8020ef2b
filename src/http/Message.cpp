#include "Message.hpp"

#include <sstream>

#include "constants.hpp"
#include "utils.hpp"

/* Message */
Message::Message() : headers(), body() {}

Message::Message(const Message& other)
    : headers(other.headers), body(other.body) {}

Message& Message::operator=(const Message& other) {
  if (this != &other) {
    headers = other.headers;
    body = other.body;
  }
  return *this;
}

Message::~Message() {}

void Message::addHeader(const std::string& name, const std::string& value) {
  headers.push_back(Header(name, value));
}

void Message::setHeader(const std::string& name, const std::string& value) {
  std::vector<Header>::iterator it = headers.begin();
  while (it != headers.end()) {
    if (ci_equal(it->name, name)) {
      it = headers.erase(it);
    } else {
      ++it;
    }
  }
  addHeader(name, value);
}

bool Message::getHeader(const std::string& name, std::string& out) const {
  for (std::vector<Header>::const_iterator it = headers.begin();
       it != headers.end(); ++it) {
    if (ci_equal(it->name, name)) {
      out = it->value;
      return true;
    }
  }
  return false;
}

std::string Message::serializeHeaders() const {
  std::ostringstream o;
  for (std::vector<Header>::const_iterator it = headers.begin();
       it != headers.end(); ++it) {
    o << it->toString() << CRLF;
  }
  return o.str();
}

bool Message::parseHeaderLine(const std::string& line, Header& out) {
  std::string::size_type pos = line.find(':');
  if (pos == std::string::npos) {
    return false;
  }
  out.name = trim_copy(line.substr(0, pos));
  out.value = trim_copy(line.substr(pos + 1));
  return !out.name.empty();
}
