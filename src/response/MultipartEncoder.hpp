#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

#include "ByteRange.hpp"

// A piece of a response body: literal text (multipart framing) or a slice
// of the resource read from the backend while streaming.
struct BodySegment {
  enum Type { SEG_LITERAL, SEG_SLICE };

  BodySegment();
  static BodySegment literal(const std::string& text);
  static BodySegment slice(off_t offset, off_t length);

  off_t size() const;

  Type type;
  std::string text;
  off_t offset;
  off_t length;
};

// Exact number of body bytes the segments produce.
off_t totalLength(const std::vector<BodySegment>& segments);

namespace multipart {

// "multipart/byteranges; boundary=<boundary>"
std::string contentType(const std::string& boundary);

// Lay out a multipart/byteranges body:
//
//   --B CRLF
//   Content-Type: <media_type> CRLF
//   Content-Range: bytes s-e/total CRLF
//   CRLF
//   <bytes s..e> CRLF
//   ... one block per range, in order ...
//   --B-- CRLF
std::vector<BodySegment> encode(const std::vector<ByteRange>& ranges,
                                off_t total, const std::string& media_type,
                                const std::string& boundary);

}  // namespace multipart
