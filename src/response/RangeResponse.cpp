#include "RangeResponse.hpp"

RangeResponse::RangeResponse()
    : Response(), streamer_(NULL), body_sent_(false) {}

RangeResponse::~RangeResponse() {
  delete streamer_;
}

void RangeResponse::attachBody(BodyStreamer* streamer) {
  delete streamer_;
  streamer_ = streamer;
}

bool RangeResponse::isStreaming() const {
  return streamer_ != NULL;
}

StreamResult RangeResponse::nextChunk(std::string& out) {
  if (streamer_ != NULL) {
    return streamer_->next(out);
  }
  out.clear();
  if (body_sent_ || body.empty()) {
    body_sent_ = true;
    return SR_END;
  }
  body_sent_ = true;
  out = body.data;
  return SR_CHUNK;
}

void RangeResponse::cancel() {
  if (streamer_ != NULL) {
    streamer_->cancel();
  }
  body_sent_ = true;
}

int RangeResponse::getMonitorFd() const {
  return streamer_ != NULL ? streamer_->getMonitorFd() : -1;
}
