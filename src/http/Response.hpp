#pragma once

#include <string>

#include "Message.hpp"
#include "StatusLine.hpp"

class Response : public Message {
 public:
  Response();
  Response(const Response& other);
  Response& operator=(const Response& other);
  virtual ~Response();

  StatusLine status_line;

  virtual std::string startLine() const;

  // Status line, headers and the blank line that ends them
  std::string serializeHead() const;

  // Helper methods to reduce boilerplate when constructing responses
  void setStatus(http::Status status, const std::string& version);
  void setBodyWithContentType(const std::string& data,
                              const std::string& contentType);
};
