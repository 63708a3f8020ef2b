#include "BodyStreamer.hpp"

#include "BackendError.hpp"
#include "Logger.hpp"

BodyStreamer::BodyStreamer(IStorageBackend* backend,
                           const std::vector<BodySegment>& segments,
                           std::size_t chunk_size)
    : handle_(backend),
      segments_(segments),
      chunk_size_(chunk_size > 0 ? chunk_size : 1),
      segment_index_(0),
      segment_offset_(0),
      produced_(0),
      length_(totalLength(segments)),
      finished_(false),
      final_result_(SR_END) {}

BodyStreamer::~BodyStreamer() {
  if (!finished_) {
    LOG(DEBUG) << "stream: destroyed after " << produced_ << " of " << length_
               << " bytes";
  }
}

off_t BodyStreamer::contentLength() const {
  return length_;
}

off_t BodyStreamer::bytesProduced() const {
  return produced_;
}

bool BodyStreamer::isFinished() const {
  return finished_;
}

int BodyStreamer::getMonitorFd() const {
  return handle_.isOpen() ? handle_->getMonitorFd() : -1;
}

void BodyStreamer::skipConsumedSegments() {
  while (segment_index_ < segments_.size() &&
         segment_offset_ >= segments_[segment_index_].size()) {
    ++segment_index_;
    segment_offset_ = 0;
  }
}

StreamResult BodyStreamer::finish(StreamResult result) {
  finished_ = true;
  final_result_ = result;
  handle_.release();
  return result;
}

StreamResult BodyStreamer::next(std::string& chunk) {
  chunk.clear();
  if (finished_) {
    return final_result_;
  }

  skipConsumedSegments();
  if (segment_index_ >= segments_.size()) {
    return finish(SR_END);
  }

  const BodySegment& seg = segments_[segment_index_];
  if (seg.type == BodySegment::SEG_LITERAL) {
    chunk.assign(seg.text, static_cast<std::size_t>(segment_offset_),
                 std::string::npos);
  } else {
    off_t remaining = seg.length - segment_offset_;
    std::size_t want = remaining < static_cast<off_t>(chunk_size_)
                           ? static_cast<std::size_t>(remaining)
                           : chunk_size_;
    try {
      if (handle_->readAt(seg.offset + segment_offset_, want, chunk) ==
          IO_WOULD_BLOCK) {
        chunk.clear();
        return SR_WOULD_BLOCK;
      }
    } catch (const BackendError& e) {
      LOG(ERROR) << "stream: '" << handle_->path() << "' failed after "
                 << produced_ << " of " << length_ << " bytes ("
                 << BackendError::kindName(e.kind()) << "): " << e.what();
      chunk.clear();
      return finish(SR_ERROR);
    }
    if (chunk.size() < want) {
      LOG(ERROR) << "stream: short read on '" << handle_->path() << "' at "
                 << seg.offset + segment_offset_ << ": got " << chunk.size()
                 << " of " << want << " bytes, resource changed?";
      chunk.clear();
      return finish(SR_ERROR);
    }
  }

  segment_offset_ += static_cast<off_t>(chunk.size());
  produced_ += static_cast<off_t>(chunk.size());

  // release the backend with the last byte instead of on the next call
  skipConsumedSegments();
  if (segment_index_ >= segments_.size()) {
    finished_ = true;
    final_result_ = SR_END;
    handle_.release();
  }
  return SR_CHUNK;
}

void BodyStreamer::cancel() {
  if (finished_) {
    return;
  }
  LOG(DEBUG) << "stream: cancelled after " << produced_ << " of " << length_
             << " bytes";
  finish(SR_ERROR);
}

std::vector<BodySegment> planSegments(const ResolvedPlan& plan,
                                      const ResourceDescriptor& descriptor,
                                      const std::string& media_type,
                                      const std::string& boundary) {
  std::vector<BodySegment> segments;
  switch (plan.mode()) {
    case ResolvedPlan::PLAN_FULL:
      segments.push_back(BodySegment::slice(0, descriptor.size));
      break;
    case ResolvedPlan::PLAN_SINGLE:
      segments.push_back(BodySegment::slice(plan.ranges()[0].start,
                                            plan.ranges()[0].length()));
      break;
    case ResolvedPlan::PLAN_MULTI:
      segments = multipart::encode(plan.ranges(), descriptor.size, media_type,
                                   boundary);
      break;
    default:
      break;
  }
  return segments;
}
