#pragma once

#include <cstddef>
#include <string>

#include "BoundaryGenerator.hpp"
#include "HttpStatus.hpp"
#include "IStorageBackend.hpp"
#include "RangeResolver.hpp"
#include "RangeResponse.hpp"
#include "StorageHandle.hpp"

enum HandlerResult { HR_DONE = 0, HR_WOULD_BLOCK = 1 };

// What the surrounding server extracted from the request. Pointers are NULL
// when the header or value is absent; they are copied by the builder.
struct RangeRequest {
  RangeRequest();

  const std::string* range;
  const std::string* if_range;
  bool head_only;
  // Empty: guess from the download name or the resource path
  std::string media_type;
  const std::string* download_name;
};

struct ResponseOptions {
  ResponseOptions();

  std::size_t chunk_size;
  // More Range specs than this and the header is ignored (0 = no limit)
  std::size_t max_ranges;
  std::string http_version;
  // Not owned. NULL selects a random generator.
  IBoundaryGenerator* boundary_generator;
};

// Builds the response for one request against one backend.
//
// The builder owns the backend from construction on. Drive it like a
// handler: start(), then resume() each time getMonitorFd() becomes readable
// while HR_WOULD_BLOCK is returned. Once HR_DONE, release() hands out the
// response, which then owns the backend if it streams a body. Backends that
// are not needed for a body (404, 416, 500, HEAD) are closed before
// start()/resume() returns HR_DONE.
class RangeResponseBuilder {
 public:
  RangeResponseBuilder(IStorageBackend* backend, const RangeRequest& request,
                       const ResponseOptions& options);
  ~RangeResponseBuilder();

  HandlerResult start();
  HandlerResult resume();
  int getMonitorFd() const;

  // Caller owns the result; NULL before HR_DONE
  RangeResponse* release();

 private:
  RangeResponseBuilder(const RangeResponseBuilder&);
  RangeResponseBuilder& operator=(const RangeResponseBuilder&);

  HandlerResult describe();
  void respondWithError(http::Status status);
  void respondUnsatisfiable(const ResourceDescriptor& descriptor);
  void respond(const ResourceDescriptor& descriptor, const ResolvedPlan& plan);
  bool ifRangeMatches(const ResourceDescriptor& descriptor) const;
  std::string downloadName() const;
  std::string nextBoundary();

  StorageHandle handle_;
  bool has_range_;
  std::string range_;
  bool has_if_range_;
  std::string if_range_;
  bool head_only_;
  std::string media_type_;
  bool has_download_name_;
  std::string download_name_;
  ResponseOptions options_;
  RangeResponse* response_;
  bool done_;
};

// Run a builder to completion, waiting with poll() whenever the backend
// would block. Convenience for callers without an event loop. Throws
// std::runtime_error if poll() fails.
RangeResponse* buildRangeResponse(IStorageBackend* backend,
                                  const RangeRequest& request,
                                  const ResponseOptions& options);

// Block with poll() until `fd` is readable. Returns false on poll failure.
bool waitReadable(int fd);
