#pragma once

#include <string>

#include "BodyStreamer.hpp"
#include "Response.hpp"

// Response whose body is either produced lazily by a BodyStreamer (200 and
// 206) or held in memory (errors, HEAD).
//
// Send serializeHead() first, then call nextChunk() until SR_END. If the
// client goes away, call cancel(); destroying the response does the same.
class RangeResponse : public Response {
 public:
  RangeResponse();
  virtual ~RangeResponse();

  // Takes ownership of `streamer`
  void attachBody(BodyStreamer* streamer);
  bool isStreaming() const;

  StreamResult nextChunk(std::string& out);
  void cancel();
  int getMonitorFd() const;

 private:
  RangeResponse(const RangeResponse&);
  RangeResponse& operator=(const RangeResponse&);

  BodyStreamer* streamer_;
  bool body_sent_;
};
