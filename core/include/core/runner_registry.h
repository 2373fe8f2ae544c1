#pragma once

#include "core/coordinator_config.h"
#include "core/demand.h"
#include "core/dispatch_error.h"
#include "core/result.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace runq::core {

class ILogger;

enum class RunnerStatus {
  Online,       // heartbeat within timeout
  Stale,        // heartbeat older than timeout
  Deregistering, // marked, signal not yet delivered
  Deregistered  // signal delivered; record kept for diagnostics
};

const char *to_string(RunnerStatus status);

struct RunnerRegistration {
  RunnerCapabilities capabilities;
  std::optional<std::string> hostname;
};

/// Snapshot of a registered runner.
struct RunnerInfo {
  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;

  std::string runner_id;
  RunnerCapabilities capabilities;
  std::optional<std::string> hostname;
  TimePoint registered_at{};
  TimePoint last_heartbeat{};
  bool deregistering = false;
  bool deregistered = false;
};

/// Tracks connected runners. Records are never hard-deleted: staleness is
/// inferred from last_heartbeat so that in-flight runs stay attributable to
/// a dead runner.
class RunnerRegistry {
public:
  RunnerRegistry(HeartbeatPolicy policy, std::shared_ptr<ILogger> logger);

  /// Issue a new runner_id.
  std::string register_runner(RunnerRegistration registration);

  /// NotFound if unknown, Conflict once deregistered.
  Result<void, DispatchError> heartbeat(const std::string &runner_id);

  /// Recency check only.
  [[nodiscard]] bool is_alive(const std::string &runner_id) const;

  /// Mark for graceful shutdown; the next poll delivers the signal.
  Result<void, DispatchError> deregister(const std::string &runner_id);

  [[nodiscard]] bool is_deregistering(const std::string &runner_id) const;

  /// Called once the deregistration signal has been handed to the runner.
  /// Returns false if the runner was not deregistering.
  bool finalize_deregistration(const std::string &runner_id);

  [[nodiscard]] std::optional<RunnerInfo> find(const std::string &runner_id) const;

  [[nodiscard]] std::vector<RunnerInfo> list() const;

  [[nodiscard]] RunnerStatus status_of(const RunnerInfo &info) const;

  [[nodiscard]] const HeartbeatPolicy &policy() const noexcept { return policy_; }

private:
  [[nodiscard]] bool is_fresh_locked(const RunnerInfo &info,
                                     RunnerInfo::TimePoint now) const;

  HeartbeatPolicy policy_;
  std::shared_ptr<ILogger> logger_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, RunnerInfo> runners_;
};

} // namespace runq::core
