#pragma once

#include "core/coordinator_config.h"
#include "core/dispatch_error.h"
#include "core/result.h"
#include "core/run.h"
#include "core/runner_registry.h"

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace runq::core {

class ILogger;

/// Error recorded on runs failed by the orphan sweep.
inline constexpr const char *kOrphanedError = "orphaned: runner unresponsive";

/// Caller-supplied part of a run.
struct SubmitRequest {
  RunKind kind = RunKind::Start;
  std::string session_name;
  std::optional<std::string> parent_session_name;
  std::string payload;
  std::optional<DemandSpec> demand;
};

enum class SessionStatus {
  Idle, // no non-terminal run
  Busy  // at least one pending/claimed/running/stopping run
};

const char *to_string(SessionStatus status);

/// Session bookkeeping derived from the runs submitted for it.
struct SessionInfo {
  std::string session_name;
  std::optional<std::string> parent_session_name;
  std::size_t active_runs = 0;
  std::optional<std::string> last_profile;
  /// Tags of the last demand submitted for the session. A RESUME without a
  /// demand inherits them.
  TagSet demand_tags;
  RunRecord::TimePoint created_at{};

  [[nodiscard]] SessionStatus status() const noexcept {
    return active_runs > 0 ? SessionStatus::Busy : SessionStatus::Idle;
  }
};

/// Thread-safe in-memory run queue. Exclusively owns run records, session
/// bookkeeping and every status transition.
///
/// Listeners are invoked after the queue lock is released, so they may call
/// back into the queue (the callback processor submits resume runs from a
/// finished-run listener).
class RunQueue {
public:
  using RunListener = std::function<void(const RunRecord &run)>;

  RunQueue(CoordinatorConfig config, std::shared_ptr<ILogger> logger);

  RunQueue(const RunQueue &) = delete;
  RunQueue &operator=(const RunQueue &) = delete;

  /// Validate and enqueue. Returns the new run_id.
  Result<std::string, DispatchError> submit(SubmitRequest request);

  /// Atomically claim the oldest pending run the runner is eligible for.
  std::optional<RunRecord> claim(const RunnerInfo &runner);

  Result<RunRecord, DispatchError> report_started(const std::string &run_id,
                                                  const std::string &runner_id);
  Result<RunRecord, DispatchError>
  report_completed(const std::string &run_id, const std::string &runner_id,
                   std::optional<std::string> result = std::nullopt);
  Result<RunRecord, DispatchError> report_failed(const std::string &run_id,
                                                 const std::string &runner_id,
                                                 const std::string &error);
  Result<RunRecord, DispatchError> report_stopped(const std::string &run_id,
                                                  const std::string &runner_id);

  /// claimed|running -> stopping. The returned record names the runner to
  /// signal.
  Result<RunRecord, DispatchError> request_stop(const std::string &run_id);

  [[nodiscard]] Result<RunRecord, DispatchError>
  get(const std::string &run_id) const;

  /// All runs in creation order, optionally filtered by status.
  [[nodiscard]] std::vector<RunRecord>
  list(std::optional<RunStatus> status = std::nullopt) const;

  [[nodiscard]] std::optional<SessionInfo>
  session(const std::string &session_name) const;

  /// Forget an idle session. Its runs stay queryable.
  Result<void, DispatchError> delete_session(const std::string &session_name);

  /// Fail claimed/running runs (stop stopping ones) whose claim is older than
  /// the grace period and whose runner has gone stale.
  std::vector<RunRecord> recover_orphans(const RunnerRegistry &registry);

  /// Fail demanded pending runs nobody claimed within no_match_timeout.
  /// Runs whose demand was inherited from their session are left waiting.
  std::vector<RunRecord> fail_unmatched();

  void on_run_submitted(RunListener listener);
  void on_run_finished(RunListener listener);

  [[nodiscard]] std::size_t pending_count() const;

private:
  struct Report {
    RunStatus target;
    const char *event;
    std::optional<std::string> error;
    std::optional<std::string> result;
  };

  Result<RunRecord, DispatchError> apply_report(const std::string &run_id,
                                                const std::string &runner_id,
                                                const Report &report);

  /// Bookkeeping after a run entered a terminal state. Caller holds mutex_.
  void on_terminal_locked(const RunRecord &run);

  void erase_pending_locked(const std::string &run_id);

  void notify(const std::vector<RunListener> &listeners,
              const std::vector<RunRecord> &runs) const;

  CoordinatorConfig config_;
  std::shared_ptr<ILogger> logger_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, RunRecord> runs_;
  std::vector<std::string> creation_order_;
  std::deque<std::string> pending_; // FIFO of pending run ids
  std::unordered_map<std::string, SessionInfo> sessions_;

  std::vector<RunListener> submitted_listeners_;
  std::vector<RunListener> finished_listeners_;
};

} // namespace runq::core
