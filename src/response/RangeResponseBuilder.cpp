#include "RangeResponseBuilder.hpp"

#include <poll.h>

#include <cerrno>
#include <stdexcept>

#include "BackendError.hpp"
#include "Logger.hpp"
#include "RangeParser.hpp"
#include "constants.hpp"
#include "file_utils.hpp"
#include "utils.hpp"

RangeRequest::RangeRequest()
    : range(NULL),
      if_range(NULL),
      head_only(false),
      media_type(),
      download_name(NULL) {}

ResponseOptions::ResponseOptions()
    : chunk_size(DEFAULT_CHUNK_SIZE),
      max_ranges(MAX_RANGE_SPECS),
      http_version(HTTP_VERSION),
      boundary_generator(NULL) {}

RangeResponseBuilder::RangeResponseBuilder(IStorageBackend* backend,
                                           const RangeRequest& request,
                                           const ResponseOptions& options)
    : handle_(backend),
      has_range_(request.range != NULL),
      range_(request.range != NULL ? *request.range : ""),
      has_if_range_(request.if_range != NULL),
      if_range_(request.if_range != NULL ? trim_copy(*request.if_range) : ""),
      head_only_(request.head_only),
      media_type_(request.media_type),
      has_download_name_(request.download_name != NULL),
      download_name_(request.download_name != NULL ? *request.download_name
                                                    : ""),
      options_(options),
      response_(NULL),
      done_(false) {}

RangeResponseBuilder::~RangeResponseBuilder() {
  delete response_;
}

HandlerResult RangeResponseBuilder::start() {
  if (done_) {
    return HR_DONE;
  }
  return describe();
}

HandlerResult RangeResponseBuilder::resume() {
  return start();
}

int RangeResponseBuilder::getMonitorFd() const {
  return handle_.isOpen() ? handle_->getMonitorFd() : -1;
}

RangeResponse* RangeResponseBuilder::release() {
  RangeResponse* response = response_;
  response_ = NULL;
  return response;
}

HandlerResult RangeResponseBuilder::describe() {
  ResourceDescriptor descriptor;
  try {
    if (handle_->stat(descriptor) == IO_WOULD_BLOCK) {
      return HR_WOULD_BLOCK;
    }
  } catch (const BackendError& e) {
    http::Status status = e.kind() == BackendError::BE_NOT_FOUND
                              ? http::S_404_NOT_FOUND
                              : http::S_500_INTERNAL_SERVER_ERROR;
    LOG(ERROR) << "range: cannot stat '" << handle_->path() << "' ("
               << BackendError::kindName(e.kind()) << "): " << e.what()
               << " -> " << http::statusWithReason(status);
    respondWithError(status);
    return HR_DONE;
  }

  const std::string* range = has_range_ ? &range_ : NULL;
  if (range != NULL && has_if_range_ && !ifRangeMatches(descriptor)) {
    LOG(DEBUG) << "range: If-Range '" << if_range_
               << "' does not match, sending full body";
    range = NULL;
  }

  ParsedRangeRequest parsed =
      range::parseRangeHeader(range, descriptor.size, options_.max_ranges);
  ResolvedPlan plan = range::resolve(parsed, descriptor);
  if (plan.mode() == ResolvedPlan::PLAN_UNSATISFIABLE) {
    respondUnsatisfiable(descriptor);
  } else {
    respond(descriptor, plan);
  }
  return HR_DONE;
}

void RangeResponseBuilder::respondWithError(http::Status status) {
  response_ = new RangeResponse();
  response_->setStatus(status, options_.http_version);
  response_->setBodyWithContentType(http::statusWithReason(status),
                                    "text/plain; charset=utf-8");
  handle_.release();
  done_ = true;
}

void RangeResponseBuilder::respondUnsatisfiable(
    const ResourceDescriptor& descriptor) {
  LOG(DEBUG) << "range: '" << range_ << "' not satisfiable for size "
             << descriptor.size;
  response_ = new RangeResponse();
  response_->setStatus(http::S_416_RANGE_NOT_SATISFIABLE,
                       options_.http_version);
  response_->addHeader("Content-Range",
                       "bytes */" + offToString(descriptor.size));
  response_->addHeader("Content-Length", "0");
  response_->addHeader("Accept-Ranges", "bytes");
  handle_.release();
  done_ = true;
}

bool RangeResponseBuilder::ifRangeMatches(
    const ResourceDescriptor& descriptor) const {
  // weak validators never match
  if (if_range_.compare(0, 2, "W/") == 0) {
    return false;
  }
  if (!if_range_.empty() && if_range_[0] == '"') {
    return if_range_ == descriptor.etag;
  }
  return if_range_ == descriptor.lastModifiedHttpDate();
}

std::string RangeResponseBuilder::downloadName() const {
  if (has_download_name_) {
    return download_name_;
  }
  return baseName(handle_->path());
}

std::string RangeResponseBuilder::nextBoundary() {
  if (options_.boundary_generator != NULL) {
    return options_.boundary_generator->next();
  }
  RandomBoundaryGenerator generator(BOUNDARY_LENGTH);
  return generator.next();
}

void RangeResponseBuilder::respond(const ResourceDescriptor& descriptor,
                                   const ResolvedPlan& plan) {
  std::string media_type = media_type_;
  if (media_type.empty()) {
    media_type = file_utils::guessMime(downloadName());
  }

  std::string boundary;
  if (plan.mode() == ResolvedPlan::PLAN_MULTI) {
    try {
      boundary = nextBoundary();
    } catch (const std::runtime_error& e) {
      LOG(ERROR) << "range: '" << handle_->path() << "': " << e.what();
      respondWithError(http::S_500_INTERNAL_SERVER_ERROR);
      return;
    }
  }
  std::vector<BodySegment> segments =
      planSegments(plan, descriptor, media_type, boundary);

  response_ = new RangeResponse();
  if (plan.isPartial()) {
    response_->setStatus(http::S_206_PARTIAL_CONTENT, options_.http_version);
  } else {
    response_->setStatus(http::S_200_OK, options_.http_version);
  }

  if (plan.mode() == ResolvedPlan::PLAN_MULTI) {
    response_->addHeader("Content-Type", multipart::contentType(boundary));
  } else {
    response_->addHeader("Content-Type", media_type);
  }
  response_->addHeader("Content-Length", offToString(totalLength(segments)));
  if (plan.mode() == ResolvedPlan::PLAN_SINGLE) {
    response_->addHeader("Content-Range",
                         plan.ranges()[0].contentRange(descriptor.size));
  }
  response_->addHeader("Accept-Ranges", "bytes");
  response_->addHeader("ETag", descriptor.etag);
  response_->addHeader("Last-Modified", descriptor.lastModifiedHttpDate());
  if (has_download_name_ || media_type == DEFAULT_MEDIA_TYPE) {
    response_->addHeader("Content-Disposition",
                         file_utils::attachmentDisposition(downloadName()));
  }

  LOG(DEBUG) << "range: '" << handle_->path() << "' -> "
             << response_->status_line.toString() << " ("
             << plan.ranges().size() << " range(s), "
             << totalLength(segments) << " body bytes)";

  if (head_only_) {
    handle_.release();
  } else {
    response_->attachBody(
        new BodyStreamer(handle_.detach(), segments, options_.chunk_size));
  }
  done_ = true;
}

bool waitReadable(int fd) {
  if (fd < 0) {
    return true;
  }
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  for (;;) {
    int r = poll(&pfd, 1, -1);
    if (r >= 0) {
      return true;
    }
    if (errno != EINTR) {
      LOG_PERROR(ERROR, "poll");
      return false;
    }
  }
}

RangeResponse* buildRangeResponse(IStorageBackend* backend,
                                  const RangeRequest& request,
                                  const ResponseOptions& options) {
  RangeResponseBuilder builder(backend, request, options);
  HandlerResult r = builder.start();
  while (r == HR_WOULD_BLOCK) {
    if (!waitReadable(builder.getMonitorFd())) {
      throw std::runtime_error("poll");
    }
    r = builder.resume();
  }
  return builder.release();
}
