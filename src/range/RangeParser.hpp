#pragma once

#include <sys/types.h>

#include <cstddef>
#include <string>
#include <vector>

#include "ByteRange.hpp"

// Result of reading a Range header. Immutable once produced.
class ParsedRangeRequest {
 public:
  enum Kind { NO_RANGE_HEADER, UNSATISFIABLE, RANGES };

  static ParsedRangeRequest noRangeHeader();
  static ParsedRangeRequest unsatisfiable();
  static ParsedRangeRequest ranges(const std::vector<RawRange>& raw);

  Kind kind() const;
  const std::vector<RawRange>& rawRanges() const;

 private:
  ParsedRangeRequest(Kind kind, const std::vector<RawRange>& raw);

  Kind kind_;
  std::vector<RawRange> raw_;
};

namespace range {

// Parse a Range header value ("bytes=0-9,20-,-5").
//
// `header` is NULL when the request carried no Range header. Anything that
// does not follow the bytes-range grammar is ignored and reported as
// NO_RANGE_HEADER, so the caller falls back to a full response. The same
// happens when more than `max_ranges` specs are listed (0 = no limit).
//
// Intervals are returned unclamped; only suffix lengths are turned into a
// start offset, which needs `resource_size`. UNSATISFIABLE is returned when
// no interval starts inside the resource.
ParsedRangeRequest parseRangeHeader(const std::string* header,
                                    off_t resource_size,
                                    std::size_t max_ranges);

}  // namespace range
