#include "file_utils.hpp"

#include <map>
#include <sstream>

#include "constants.hpp"

namespace file_utils {

// Static MIME type mappings
namespace {

typedef std::map<std::string, std::string> MimeMap;

// Extension to MIME type mapping
MimeMap createExtToMimeMap() {
  MimeMap m;
  // Text types
  m["html"] = "text/html; charset=utf-8";
  m["htm"] = "text/html; charset=utf-8";
  m["txt"] = "text/plain; charset=utf-8";
  m["css"] = "text/css";
  m["csv"] = "text/csv";
  // Application types
  m["js"] = "application/javascript";
  m["json"] = "application/json";
  m["xml"] = "application/xml";
  m["pdf"] = "application/pdf";
  m["zip"] = "application/zip";
  m["gz"] = "application/gzip";
  m["tar"] = "application/x-tar";
  // Image types
  m["jpg"] = "image/jpeg";
  m["jpeg"] = "image/jpeg";
  m["png"] = "image/png";
  m["gif"] = "image/gif";
  m["ico"] = "image/x-icon";
  m["svg"] = "image/svg+xml";
  m["webp"] = "image/webp";
  // Media types, the usual targets of range requests
  m["mp3"] = "audio/mpeg";
  m["ogg"] = "audio/ogg";
  m["wav"] = "audio/wav";
  m["mp4"] = "video/mp4";
  m["webm"] = "video/webm";
  m["mkv"] = "video/x-matroska";
  return m;
}

const MimeMap& extToMime() {
  static MimeMap instance = createExtToMimeMap();
  return instance;
}

bool isUnreserved(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' ||
         c == '~';
}

}  // anonymous namespace

std::string guessMime(const std::string& path) {
  static const std::string kDefaultMime = DEFAULT_MEDIA_TYPE;

  std::size_t slash = path.rfind('/');
  std::size_t pos = path.rfind('.');
  if (pos == std::string::npos ||
      (slash != std::string::npos && pos < slash)) {
    return kDefaultMime;
  }

  std::string ext = path.substr(pos + 1);
  for (std::string::size_type i = 0; i < ext.size(); ++i) {
    if (ext[i] >= 'A' && ext[i] <= 'Z') {
      ext[i] = static_cast<char>(ext[i] - 'A' + 'a');
    }
  }
  const MimeMap& m = extToMime();
  MimeMap::const_iterator it = m.find(ext);
  if (it != m.end()) {
    return it->second;
  }
  return kDefaultMime;
}

std::string makeETag(time_t mtime, off_t size) {
  std::ostringstream oss;
  oss << '"' << std::hex << static_cast<unsigned long long>(mtime) << '-'
      << static_cast<unsigned long long>(size) << '"';
  return oss.str();
}

std::string attachmentDisposition(const std::string& filename) {
  static const char kHex[] = "0123456789ABCDEF";

  std::string fallback;
  std::string encoded;
  for (std::string::size_type i = 0; i < filename.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(filename[i]);
    if (c < 0x20 || c >= 0x7f || c == '"' || c == '\\') {
      fallback += '_';
    } else {
      fallback += static_cast<char>(c);
    }
    if (isUnreserved(c)) {
      encoded += static_cast<char>(c);
    } else {
      encoded += '%';
      encoded += kHex[c >> 4];
      encoded += kHex[c & 0x0f];
    }
  }
  return "attachment; filename=\"" + fallback + "\"; filename*=utf-8''" +
         encoded;
}

}  // namespace file_utils
