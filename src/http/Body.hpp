#pragma once

#include <string>

// In-memory body used by responses that never stream (404, 416, 500).
struct Body {
  Body();
  explicit Body(const std::string& data_str);
  Body(const Body& other);
  Body& operator=(const Body& other);
  ~Body();

  bool empty() const;
  std::size_t size() const;

  std::string data;
};
