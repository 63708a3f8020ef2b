#pragma once

#include <string>

// One "Name: value" header field.
class Header {
 public:
  Header();
  Header(const std::string& n, const std::string& v);
  Header(const Header& other);
  Header& operator=(const Header& other);
  ~Header();

  // Render as "Name: value" without the trailing CRLF
  std::string toString() const;

  std::string name;
  std::string value;
};
