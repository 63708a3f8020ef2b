#pragma once

#include <sys/types.h>

#include <cstddef>
#include <string>
#include <vector>

#include "IStorageBackend.hpp"
#include "MultipartEncoder.hpp"
#include "RangeResolver.hpp"
#include "StorageHandle.hpp"

enum StreamResult {
  SR_CHUNK,        // `chunk` holds the next piece of the body
  SR_WOULD_BLOCK,  // backend not ready, wait on getMonitorFd() and retry
  SR_END,          // body complete
  SR_ERROR         // body truncated (backend failure, short read, cancel)
};

// Lazy, single-pass producer of a response body.
//
// The streamer owns the backend. It is released exactly once, as soon as
// the stream ends, fails or is cancelled, or at the latest on destruction.
class BodyStreamer {
 public:
  BodyStreamer(IStorageBackend* backend,
               const std::vector<BodySegment>& segments,
               std::size_t chunk_size);
  ~BodyStreamer();

  off_t contentLength() const;
  off_t bytesProduced() const;
  bool isFinished() const;
  int getMonitorFd() const;

  StreamResult next(std::string& chunk);

  // Stop early (client went away). Releases the backend.
  void cancel();

 private:
  BodyStreamer(const BodyStreamer&);
  BodyStreamer& operator=(const BodyStreamer&);

  void skipConsumedSegments();
  StreamResult finish(StreamResult result);

  StorageHandle handle_;
  std::vector<BodySegment> segments_;
  std::size_t chunk_size_;
  std::size_t segment_index_;
  off_t segment_offset_;
  off_t produced_;
  off_t length_;
  bool finished_;
  StreamResult final_result_;
};

// Body layout for a plan: the whole resource, one slice, or a
// multipart/byteranges body using `boundary`.
std::vector<BodySegment> planSegments(const ResolvedPlan& plan,
                                      const ResourceDescriptor& descriptor,
                                      const std::string& media_type,
                                      const std::string& boundary);
