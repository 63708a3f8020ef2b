#pragma once

#include <sys/types.h>

#include <ctime>
#include <string>

// Snapshot of a resource taken once per request. Headers and the body are
// both derived from it, so the resource is never re-stat'ed mid-stream.
struct ResourceDescriptor {
  ResourceDescriptor();

  static ResourceDescriptor fromStat(off_t size, time_t mtime);

  // IMF-fixdate rendering of last_modified
  std::string lastModifiedHttpDate() const;

  off_t size;
  time_t last_modified;
  std::string etag;
};
