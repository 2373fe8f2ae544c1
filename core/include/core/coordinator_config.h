#pragma once

#include <chrono>

namespace runq::core {

/// Runner liveness. A runner whose last heartbeat is older than `timeout`
/// is stale.
struct HeartbeatPolicy {
  std::chrono::milliseconds timeout{120000};
  std::chrono::milliseconds interval_hint{60000}; // advertised to runners at registration
};

/// Internal reconciliation of work nobody is making progress on.
struct RecoveryPolicy {
  std::chrono::milliseconds claim_grace{300000};      // orphan sweep: minimum claim age
  std::chrono::milliseconds no_match_timeout{300000}; // demanded pending runs
  std::chrono::milliseconds sweep_interval{30000};
};

/// Long-poll shape.
struct PollPolicy {
  std::chrono::milliseconds default_wait{30000};
  std::chrono::milliseconds max_wait{120000};
  std::chrono::milliseconds slice{500}; // upper bound of one wait on the wake signal
};

/// Coordinator runtime configuration. Values <= 0 fall back to the
/// defaults above in normalize().
struct CoordinatorConfig {
  HeartbeatPolicy heartbeat{};
  RecoveryPolicy recovery{};
  PollPolicy poll{};
  /// Route RESUME runs without a demand to the profile that last served the
  /// session (on top of the session's own demanded tags).
  bool session_affinity = true;

  static CoordinatorConfig normalize(CoordinatorConfig config);
};

} // namespace runq::core
