#include "ByteRange.hpp"

#include <sstream>

ByteRange::ByteRange() : start(0), end(0) {}

ByteRange::ByteRange(off_t s, off_t e) : start(s), end(e) {}

off_t ByteRange::length() const {
  return end - start + 1;
}

std::string ByteRange::contentRange(off_t total) const {
  std::ostringstream cr;
  cr << "bytes " << static_cast<long long>(start) << "-"
     << static_cast<long long>(end) << "/" << static_cast<long long>(total);
  return cr.str();
}

bool ByteRange::operator==(const ByteRange& other) const {
  return start == other.start && end == other.end;
}

RawRange::RawRange() : start(0), end(0), open_end(false) {}

RawRange::RawRange(off_t s, off_t e, bool open)
    : start(s), end(e), open_end(open) {}
