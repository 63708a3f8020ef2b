#pragma once

#include <string>
#include <vector>

#include "Body.hpp"
#include "Header.hpp"

class Message {
 public:
  Message();
  Message(const Message& other);
  Message& operator=(const Message& other);
  virtual ~Message();

  void addHeader(const std::string& name, const std::string& value);
  // Replace every header called `name` with a single one
  void setHeader(const std::string& name, const std::string& value);
  bool getHeader(const std::string& name, std::string& out) const;

  std::string serializeHeaders() const;
  static bool parseHeaderLine(const std::string& line, Header& out);

  virtual std::string startLine() const = 0;

 protected:
  std::vector<Header> headers;
  Body body;
};
