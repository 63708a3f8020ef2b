#include "ResourceDescriptor.hpp"

#include "file_utils.hpp"
#include "utils.hpp"

ResourceDescriptor::ResourceDescriptor()
    : size(0), last_modified(0), etag() {}

ResourceDescriptor ResourceDescriptor::fromStat(off_t size, time_t mtime) {
  ResourceDescriptor d;
  d.size = size;
  d.last_modified = mtime;
  d.etag = file_utils::makeETag(mtime, size);
  return d;
}

std::string ResourceDescriptor::lastModifiedHttpDate() const {
  return formatHttpDate(last_modified);
}
