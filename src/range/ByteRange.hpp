#pragma once

#include <sys/types.h>

#include <string>

// Inclusive byte interval [start, end] inside a resource.
struct ByteRange {
  ByteRange();
  ByteRange(off_t s, off_t e);

  off_t length() const;
  // "bytes <start>-<end>/<total>"
  std::string contentRange(off_t total) const;

  bool operator==(const ByteRange& other) const;

  off_t start;
  off_t end;
};

// A range as written by the client, before clamping to the resource size.
// Suffix ranges ("-N") are already converted to a start offset.
struct RawRange {
  RawRange();
  RawRange(off_t s, off_t e, bool open);

  off_t start;
  off_t end;      // meaningless when open_end is set
  bool open_end;  // "N-" or "-N": runs to the last byte
};
