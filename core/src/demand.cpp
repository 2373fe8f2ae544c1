#include "core/demand.h"

#include <algorithm>

namespace runq::core {

bool is_superset(const TagSet &offered, const TagSet &required) {
  // Both sets are ordered, so std::includes is a single linear pass.
  return std::includes(offered.begin(), offered.end(), required.begin(),
                       required.end());
}

bool intersects(const TagSet &a, const TagSet &b) {
  auto ia = a.begin();
  auto ib = b.begin();
  while (ia != a.end() && ib != b.end()) {
    if (*ia < *ib) {
      ++ia;
    } else if (*ib < *ia) {
      ++ib;
    } else {
      return true;
    }
  }
  return false;
}

bool runner_satisfies(const std::optional<DemandSpec> &demand,
                      const RunnerCapabilities &runner) {
  if (runner.strict_tags && !runner.tags.empty()) {
    if (!demand.has_value() || !intersects(demand->tags, runner.tags)) {
      return false;
    }
  }

  if (!demand.has_value()) {
    return true;
  }

  if (demand->profile.has_value() && runner.profile != demand->profile) {
    return false;
  }

  return is_superset(runner.tags, demand->tags);
}

} // namespace runq::core
