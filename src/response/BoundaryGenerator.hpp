#pragma once

#include <cstddef>
#include <string>

// Source of multipart/byteranges boundary tokens.
class IBoundaryGenerator {
 public:
  virtual ~IBoundaryGenerator() {}
  // May throw std::runtime_error
  virtual std::string next() = 0;
};

// Random [a-z0-9] tokens read from /dev/urandom. next() throws
// std::runtime_error if the device cannot be read.
class RandomBoundaryGenerator : public IBoundaryGenerator {
 public:
  explicit RandomBoundaryGenerator(std::size_t length);
  virtual ~RandomBoundaryGenerator();

  virtual std::string next();

 private:
  std::size_t length_;
};
