#pragma once

#include <sys/types.h>

#include <ctime>
#include <string>

namespace file_utils {

// Guess a MIME type from the file extension of `path`; unknown extensions
// map to application/octet-stream.
std::string guessMime(const std::string& path);

// Strong entity tag derived from modification time and size:
// "<hex mtime>-<hex size>" including the double quotes.
std::string makeETag(time_t mtime, off_t size);

// Content-Disposition value offering `filename` as a download. Carries an
// ASCII fallback in filename= and the exact name in RFC 5987 filename*=.
std::string attachmentDisposition(const std::string& filename);

}  // namespace file_utils
