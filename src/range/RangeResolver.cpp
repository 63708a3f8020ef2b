#include "RangeResolver.hpp"

#include "Logger.hpp"

ResolvedPlan::ResolvedPlan(Mode mode, const std::vector<ByteRange>& ranges)
    : mode_(mode), ranges_(ranges) {}

ResolvedPlan ResolvedPlan::full() {
  return ResolvedPlan(PLAN_FULL, std::vector<ByteRange>());
}

ResolvedPlan ResolvedPlan::unsatisfiable() {
  return ResolvedPlan(PLAN_UNSATISFIABLE, std::vector<ByteRange>());
}

ResolvedPlan ResolvedPlan::partial(const std::vector<ByteRange>& ranges) {
  if (ranges.empty()) {
    return unsatisfiable();
  }
  return ResolvedPlan(ranges.size() == 1 ? PLAN_SINGLE : PLAN_MULTI, ranges);
}

ResolvedPlan::Mode ResolvedPlan::mode() const {
  return mode_;
}

const std::vector<ByteRange>& ResolvedPlan::ranges() const {
  return ranges_;
}

bool ResolvedPlan::isPartial() const {
  return mode_ == PLAN_SINGLE || mode_ == PLAN_MULTI;
}

namespace range {

ResolvedPlan resolve(const ParsedRangeRequest& parsed,
                     const ResourceDescriptor& descriptor) {
  if (parsed.kind() == ParsedRangeRequest::NO_RANGE_HEADER) {
    return ResolvedPlan::full();
  }
  if (parsed.kind() == ParsedRangeRequest::UNSATISFIABLE ||
      descriptor.size <= 0) {
    return ResolvedPlan::unsatisfiable();
  }

  const off_t last = descriptor.size - 1;
  std::vector<ByteRange> ranges;
  const std::vector<RawRange>& raw = parsed.rawRanges();
  for (std::vector<RawRange>::const_iterator it = raw.begin(); it != raw.end();
       ++it) {
    off_t end = (it->open_end || it->end > last) ? last : it->end;
    if (it->start > end) {
      LOG(DEBUG) << "range: dropping interval starting at " << it->start
                 << " for size " << descriptor.size;
      continue;
    }
    ranges.push_back(ByteRange(it->start, end));
  }
  return ResolvedPlan::partial(ranges);
}

}  // namespace range
