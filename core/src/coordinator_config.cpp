#include "core/coordinator_config.h"

#include <algorithm>

namespace runq::core {
namespace {

void default_if_unset(std::chrono::milliseconds &value,
                      std::chrono::milliseconds fallback) {
  if (value.count() <= 0) {
    value = fallback;
  }
}

} // namespace

CoordinatorConfig CoordinatorConfig::normalize(CoordinatorConfig config) {
  const CoordinatorConfig defaults{};

  default_if_unset(config.heartbeat.timeout, defaults.heartbeat.timeout);
  default_if_unset(config.heartbeat.interval_hint,
                   defaults.heartbeat.interval_hint);

  default_if_unset(config.recovery.claim_grace, defaults.recovery.claim_grace);
  default_if_unset(config.recovery.no_match_timeout,
                   defaults.recovery.no_match_timeout);
  default_if_unset(config.recovery.sweep_interval,
                   defaults.recovery.sweep_interval);

  default_if_unset(config.poll.default_wait, defaults.poll.default_wait);
  default_if_unset(config.poll.max_wait, defaults.poll.max_wait);
  default_if_unset(config.poll.slice, defaults.poll.slice);
  config.poll.max_wait = std::max(config.poll.max_wait, config.poll.default_wait);

  return config;
}

} // namespace runq::core
