#pragma once

#include <optional>
#include <set>
#include <string>

namespace runq::core {

using TagSet = std::set<std::string>;

/// Constraints a run places on eligible runners. AND-only: every field that
/// is set must hold; there is no OR or negation.
struct DemandSpec {
  std::optional<std::string> profile; // exact match
  TagSet tags;                        // runner tags must be a superset

  [[nodiscard]] bool empty() const noexcept {
    return !profile.has_value() && tags.empty();
  }
};

/// What a runner advertises at registration.
struct RunnerCapabilities {
  TagSet tags;
  std::optional<std::string> profile;
  /// Opt out of generic work: when set (and tags is non-empty) the runner
  /// only takes runs that demand at least one of its tags.
  bool strict_tags = false;
};

/// True if every tag in `required` is in `offered`.
bool is_superset(const TagSet &offered, const TagSet &required);

/// True if the two sets share at least one tag.
bool intersects(const TagSet &a, const TagSet &b);

/// Pure matching predicate used by RunQueue::claim.
/// 1. strict runner with tags: demand must share a tag with the runner
///    (a run without demand shares none)
/// 2. demand.profile set: runner profile must equal it
/// 3. demand.tags set: runner tags must be a superset
bool runner_satisfies(const std::optional<DemandSpec> &demand,
                      const RunnerCapabilities &runner);

} // namespace runq::core
