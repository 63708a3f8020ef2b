#include "RangeParser.hpp"

#include "Logger.hpp"
#include "utils.hpp"

ParsedRangeRequest::ParsedRangeRequest(Kind kind,
                                       const std::vector<RawRange>& raw)
    : kind_(kind), raw_(raw) {}

ParsedRangeRequest ParsedRangeRequest::noRangeHeader() {
  return ParsedRangeRequest(NO_RANGE_HEADER, std::vector<RawRange>());
}

ParsedRangeRequest ParsedRangeRequest::unsatisfiable() {
  return ParsedRangeRequest(UNSATISFIABLE, std::vector<RawRange>());
}

ParsedRangeRequest ParsedRangeRequest::ranges(
    const std::vector<RawRange>& raw) {
  return ParsedRangeRequest(RANGES, raw);
}

ParsedRangeRequest::Kind ParsedRangeRequest::kind() const {
  return kind_;
}

const std::vector<RawRange>& ParsedRangeRequest::rawRanges() const {
  return raw_;
}

namespace range {

namespace {

// One byte-range-spec: "a-b", "a-" or "-n".
bool parseSpec(const std::string& spec, off_t size, RawRange& out) {
  std::string::size_type dash = spec.find('-');
  if (dash == std::string::npos) {
    return false;
  }
  std::string first = spec.substr(0, dash);
  std::string second = spec.substr(dash + 1);

  if (first.empty()) {
    off_t suffix = 0;
    if (!parseByteOffset(second, suffix)) {
      return false;
    }
    // "-0" asks for nothing: place it past the end so it never survives
    if (suffix == 0) {
      out = RawRange(size, size, true);
    } else {
      out = RawRange(suffix >= size ? 0 : size - suffix, size, true);
    }
    return true;
  }

  off_t start = 0;
  if (!parseByteOffset(first, start)) {
    return false;
  }
  if (second.empty()) {
    out = RawRange(start, start, true);
    return true;
  }
  off_t end = 0;
  if (!parseByteOffset(second, end)) {
    return false;
  }
  out = RawRange(start, end, false);
  return true;
}

ParsedRangeRequest ignoreHeader(const std::string& header,
                                const char* reason) {
  LOG(DEBUG) << "range: ignoring Range header '" << header << "': " << reason;
  return ParsedRangeRequest::noRangeHeader();
}

}  // anonymous namespace

ParsedRangeRequest parseRangeHeader(const std::string* header,
                                    off_t resource_size,
                                    std::size_t max_ranges) {
  if (header == NULL) {
    return ParsedRangeRequest::noRangeHeader();
  }

  std::string value = trim_copy(*header);
  std::string::size_type eq = value.find('=');
  if (eq == std::string::npos) {
    return ignoreHeader(*header, "missing '='");
  }
  if (!ci_equal(trim_copy(value.substr(0, eq)), "bytes")) {
    return ignoreHeader(*header, "unsupported range unit");
  }

  std::vector<RawRange> raw;
  std::string list = value.substr(eq + 1);
  std::string::size_type pos = 0;
  while (pos <= list.size()) {
    std::string::size_type comma = list.find(',', pos);
    if (comma == std::string::npos) {
      comma = list.size();
    }
    std::string spec = trim_copy(list.substr(pos, comma - pos));
    pos = comma + 1;

    // empty list elements are allowed by the grammar
    if (spec.empty()) {
      continue;
    }
    if (max_ranges > 0 && raw.size() >= max_ranges) {
      return ignoreHeader(*header, "too many ranges");
    }
    RawRange r;
    if (!parseSpec(spec, resource_size, r)) {
      return ignoreHeader(*header, "malformed byte-range-spec");
    }
    raw.push_back(r);
  }

  if (raw.empty()) {
    return ignoreHeader(*header, "no byte-range-spec");
  }
  if (resource_size == 0) {
    return ParsedRangeRequest::unsatisfiable();
  }
  for (std::vector<RawRange>::const_iterator it = raw.begin(); it != raw.end();
       ++it) {
    if (it->start < resource_size) {
      return ParsedRangeRequest::ranges(raw);
    }
  }
  return ParsedRangeRequest::unsatisfiable();
}

}  // namespace range
