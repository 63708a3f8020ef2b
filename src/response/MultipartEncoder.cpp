#include "MultipartEncoder.hpp"

#include "constants.hpp"

BodySegment::BodySegment()
    : type(SEG_LITERAL), text(), offset(0), length(0) {}

BodySegment BodySegment::literal(const std::string& text) {
  BodySegment s;
  s.type = SEG_LITERAL;
  s.text = text;
  return s;
}

BodySegment BodySegment::slice(off_t offset, off_t length) {
  BodySegment s;
  s.type = SEG_SLICE;
  s.offset = offset;
  s.length = length;
  return s;
}

off_t BodySegment::size() const {
  return type == SEG_LITERAL ? static_cast<off_t>(text.size()) : length;
}

off_t totalLength(const std::vector<BodySegment>& segments) {
  off_t total = 0;
  for (std::vector<BodySegment>::const_iterator it = segments.begin();
       it != segments.end(); ++it) {
    total += it->size();
  }
  return total;
}

namespace multipart {

namespace {

// Append text, merging with a preceding literal segment.
void appendLiteral(std::vector<BodySegment>& segments,
                   const std::string& text) {
  if (!segments.empty() &&
      segments.back().type == BodySegment::SEG_LITERAL) {
    segments.back().text += text;
  } else {
    segments.push_back(BodySegment::literal(text));
  }
}

}  // anonymous namespace

std::string contentType(const std::string& boundary) {
  return "multipart/byteranges; boundary=" + boundary;
}

std::vector<BodySegment> encode(const std::vector<ByteRange>& ranges,
                                off_t total, const std::string& media_type,
                                const std::string& boundary) {
  std::vector<BodySegment> segments;
  for (std::vector<ByteRange>::const_iterator it = ranges.begin();
       it != ranges.end(); ++it) {
    std::string head = "--" + boundary + CRLF;
    head += "Content-Type: " + media_type + CRLF;
    head += "Content-Range: " + it->contentRange(total) + CRLF;
    head += CRLF;
    appendLiteral(segments, head);
    segments.push_back(BodySegment::slice(it->start, it->length()));
    appendLiteral(segments, CRLF);
  }
  appendLiteral(segments, "--" + boundary + "--" + CRLF);
  return segments;
}

}  // namespace multipart
