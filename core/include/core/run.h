#pragma once

#include "core/demand.h"
#include "core/dispatch_error.h"
#include "core/result.h"

#include <chrono>
#include <optional>
#include <string>

namespace runq::core {

// ---- Run Status Enum ----

enum class RunStatus {
  Pending,   // Waiting for a matching runner
  Claimed,   // Assigned to a runner, not yet started
  Running,   // Runner reported started
  Stopping,  // Stop requested, waiting for the runner to confirm
  Completed, // Finished successfully (terminal)
  Failed,    // Runner error, orphaned claim or no-match timeout (terminal)
  Stopped    // Runner confirmed the stop (terminal)
};

/// Lowercase wire name ("pending", "claimed", ...).
const char *to_string(RunStatus status);

/// Parse a wire name. Returns nullopt for anything unknown.
std::optional<RunStatus> parse_run_status(const std::string &text);

bool is_terminal(RunStatus status);

/// claimed, running or stopping: the run holds a runner.
bool holds_runner(RunStatus status);

// ---- Run Kind Enum ----

enum class RunKind {
  Start, // First run of a session
  Resume // Continue an existing session
};

const char *to_string(RunKind kind);
std::optional<RunKind> parse_run_kind(const std::string &text);

// ---- Run Record ----

/// A unit of dispatchable work. Owned by RunQueue; everything else sees
/// copies.
struct RunRecord {
  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;

  std::string run_id;
  RunKind kind = RunKind::Start;
  std::string session_name;
  std::optional<std::string> parent_session_name;
  std::string payload;
  std::optional<DemandSpec> demand;
  bool inherited_demand = false; // demand derived from the session on RESUME

  RunStatus status = RunStatus::Pending;
  std::optional<std::string> runner_id;
  std::optional<std::string> last_runner_id; // survives terminal states
  std::optional<std::string> error;
  std::optional<std::string> result; // summary text from a completed run

  TimePoint created_at = Clock::now();
  std::optional<TimePoint> claimed_at;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;

  // ---- State Machine ----

  /// Attempt a state transition. Returns a Conflict error and leaves the
  /// record untouched if the transition is illegal.
  /// Legal transitions:
  ///   Pending  -> Claimed, Failed
  ///   Claimed  -> Running, Stopping, Failed
  ///   Running  -> Completed, Failed, Stopping
  ///   Stopping -> Stopped
  /// Terminal states accept nothing.
  Result<void, DispatchError> transition_to(RunStatus new_status);

  /// Pending -> Claimed, recording the runner.
  Result<void, DispatchError> claim_for(const std::string &runner);
};

/// ISO-8601 UTC with milliseconds, e.g. 2026-10-17T09:30:00.123Z.
std::string format_timestamp(RunRecord::TimePoint tp);

} // namespace runq::core
