#include "BoundaryGenerator.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <vector>

#include "Logger.hpp"

namespace {

const char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
const std::size_t kAlphabetSize = sizeof(kAlphabet) - 1;

// Fill `out` from the kernel CSPRNG. Returns false if it cannot be read.
bool readUrandom(std::vector<unsigned char>& out) {
  int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    LOG_PERROR(ERROR, "boundary: open /dev/urandom");
    return false;
  }
  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t n = read(fd, &out[total], out.size() - total);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      LOG_PERROR(ERROR, "boundary: read /dev/urandom");
      close(fd);
      return false;
    }
    total += static_cast<std::size_t>(n);
  }
  close(fd);
  return true;
}

}  // anonymous namespace

RandomBoundaryGenerator::RandomBoundaryGenerator(std::size_t length)
    : length_(length) {}

RandomBoundaryGenerator::~RandomBoundaryGenerator() {}

std::string RandomBoundaryGenerator::next() {
  std::vector<unsigned char> bytes(length_);
  if (!readUrandom(bytes)) {
    throw std::runtime_error("boundary: no random source");
  }

  std::string token;
  token.reserve(length_);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    token += kAlphabet[bytes[i] % kAlphabetSize];
  }
  return token;
}
