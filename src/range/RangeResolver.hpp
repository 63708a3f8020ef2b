#pragma once

#include <vector>

#include "ByteRange.hpp"
#include "RangeParser.hpp"
#include "ResourceDescriptor.hpp"

// How a request will be answered. Every ByteRange satisfies
// start <= end < descriptor.size.
class ResolvedPlan {
 public:
  enum Mode { PLAN_FULL, PLAN_SINGLE, PLAN_MULTI, PLAN_UNSATISFIABLE };

  static ResolvedPlan full();
  static ResolvedPlan unsatisfiable();
  // One range gives PLAN_SINGLE, more give PLAN_MULTI
  static ResolvedPlan partial(const std::vector<ByteRange>& ranges);

  Mode mode() const;
  const std::vector<ByteRange>& ranges() const;
  bool isPartial() const;

 private:
  ResolvedPlan(Mode mode, const std::vector<ByteRange>& ranges);

  Mode mode_;
  std::vector<ByteRange> ranges_;
};

namespace range {

// Clamp the parsed intervals to the resource and pick the response mode.
// Ranges keep the client's order; overlapping ranges are not merged.
ResolvedPlan resolve(const ParsedRangeRequest& parsed,
                     const ResourceDescriptor& descriptor);

}  // namespace range
