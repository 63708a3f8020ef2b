#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string>

#include "HttpStatus.hpp"
#include "LocalBackend.hpp"
#include "Logger.hpp"
#include "RangeResponseBuilder.hpp"
#include "utils.hpp"

// Write all of `data` to `fd`. Returns false if the reader went away.
static bool writeAll(int fd, const std::string& data) {
  std::size_t off = 0;
  while (off < data.size()) {
    ssize_t n = write(fd, data.data() + off, data.size() - off);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG_PERROR(ERROR, "write");
      return false;
    }
    off += static_cast<std::size_t>(n);
  }
  return true;
}

// Send head and body of `response` to `fd`. Returns EXIT_SUCCESS only if
// the whole body went out.
static int sendResponse(RangeResponse& response, int fd) {
  if (!writeAll(fd, response.serializeHead())) {
    response.cancel();
    return EXIT_FAILURE;
  }

  std::string chunk;
  for (;;) {
    StreamResult r = response.nextChunk(chunk);
    if (r == SR_END) {
      return EXIT_SUCCESS;
    }
    if (r == SR_ERROR) {
      LOG(ERROR) << "rangecat: body truncated";
      return EXIT_FAILURE;
    }
    if (r == SR_WOULD_BLOCK) {
      if (!waitReadable(response.getMonitorFd())) {
        response.cancel();
        return EXIT_FAILURE;
      }
      continue;
    }
    if (!writeAll(fd, chunk)) {
      response.cancel();
      return EXIT_FAILURE;
    }
  }
}

int main(int argc, char** argv) {
  // rangecat [-l:N] [-H] [-r RANGE] [-i IF_RANGE] [-t TYPE] [-n NAME] PATH
  // 0 = DEBUG, 1 = INFO, 2 = ERROR

  CliArgs args;
  try {
    processArgs(argc, argv, args);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error processing command-line arguments: " << e.what();
    return EXIT_FAILURE;
  }

  Logger::setLevel(static_cast<Logger::LogLevel>(args.log_level));

  // a closed stdout shows up as EPIPE from write() instead of a signal
  std::signal(SIGPIPE, SIG_IGN);

  RangeRequest request;
  request.range = args.has_range ? &args.range : NULL;
  request.if_range = args.has_if_range ? &args.if_range : NULL;
  request.head_only = args.head_only;
  request.media_type = args.media_type;
  request.download_name =
      args.has_download_name ? &args.download_name : NULL;

  try {
    RangeResponse* response = buildRangeResponse(
        new LocalBackend(args.path), request, ResponseOptions());
    LOG(INFO) << "rangecat: " << args.path << " -> "
              << response->status_line.toString();
    int status = sendResponse(*response, STDOUT_FILENO);
    // like curl -f: 404, 416 and 500 are failures for a shell pipeline
    if (!http::isSuccess(response->status_line.status_code)) {
      status = EXIT_FAILURE;
    }
    delete response;
    return status;
  } catch (const std::exception& e) {
    LOG(ERROR) << "rangecat: " << e.what();
    return EXIT_FAILURE;
  }
}
