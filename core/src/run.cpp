#include "core/run.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace runq::core {

const char *to_string(RunStatus status) {
  switch (status) {
  case RunStatus::Pending:
    return "pending";
  case RunStatus::Claimed:
    return "claimed";
  case RunStatus::Running:
    return "running";
  case RunStatus::Stopping:
    return "stopping";
  case RunStatus::Completed:
    return "completed";
  case RunStatus::Failed:
    return "failed";
  case RunStatus::Stopped:
    return "stopped";
  }
  return "unknown";
}

std::optional<RunStatus> parse_run_status(const std::string &text) {
  for (auto status : {RunStatus::Pending, RunStatus::Claimed,
                      RunStatus::Running, RunStatus::Stopping,
                      RunStatus::Completed, RunStatus::Failed,
                      RunStatus::Stopped}) {
    if (text == to_string(status)) {
      return status;
    }
  }
  return std::nullopt;
}

bool is_terminal(RunStatus status) {
  switch (status) {
  case RunStatus::Completed:
  case RunStatus::Failed:
  case RunStatus::Stopped:
    return true;
  default:
    return false;
  }
}

bool holds_runner(RunStatus status) {
  return status == RunStatus::Claimed || status == RunStatus::Running ||
         status == RunStatus::Stopping;
}

const char *to_string(RunKind kind) {
  switch (kind) {
  case RunKind::Start:
    return "START";
  case RunKind::Resume:
    return "RESUME";
  }
  return "UNKNOWN";
}

std::optional<RunKind> parse_run_kind(const std::string &text) {
  // Accept the wire names of the older HTTP API as well.
  if (text == "START" || text == "start" || text == "start_session") {
    return RunKind::Start;
  }
  if (text == "RESUME" || text == "resume" || text == "resume_session") {
    return RunKind::Resume;
  }
  return std::nullopt;
}

Result<void, DispatchError> RunRecord::transition_to(RunStatus new_status) {
  bool legal = false;

  switch (status) {
  case RunStatus::Pending:
    legal = (new_status == RunStatus::Claimed ||
             new_status == RunStatus::Failed);
    break;
  case RunStatus::Claimed:
    legal = (new_status == RunStatus::Running ||
             new_status == RunStatus::Stopping ||
             new_status == RunStatus::Failed);
    break;
  case RunStatus::Running:
    legal = (new_status == RunStatus::Completed ||
             new_status == RunStatus::Failed ||
             new_status == RunStatus::Stopping);
    break;
  case RunStatus::Stopping:
    legal = (new_status == RunStatus::Stopped);
    break;
  case RunStatus::Completed:
  case RunStatus::Failed:
  case RunStatus::Stopped:
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, DispatchError>::Err(DispatchError(
        ErrorCategory::Conflict, 2001,
        std::string("Illegal run transition: ") + to_string(status) + " -> " +
            to_string(new_status) + " (run_id=" + run_id + ")",
        {{"run_id", run_id}, {"status", to_string(status)}}));
  }

  // Claimed needs a runner; claim_for() is the only way in.
  if (new_status == RunStatus::Claimed && !runner_id.has_value()) {
    return Result<void, DispatchError>::Err(DispatchError::Internal(
        "Claim without runner_id (run_id=" + run_id + ")"));
  }

  status = new_status;
  const auto now = Clock::now();

  if (new_status == RunStatus::Claimed) {
    claimed_at = now;
  }
  if (new_status == RunStatus::Running && !started_at.has_value()) {
    started_at = now;
  }
  if (is_terminal(new_status)) {
    completed_at = now;
    if (runner_id.has_value()) {
      last_runner_id = runner_id;
    }
    runner_id.reset();
  }

  return Result<void, DispatchError>::Ok();
}

Result<void, DispatchError> RunRecord::claim_for(const std::string &runner) {
  if (status != RunStatus::Pending) {
    return Result<void, DispatchError>::Err(DispatchError::Conflict(
        "Run is not pending: " + run_id + " (" + to_string(status) + ")"));
  }
  runner_id = runner;
  auto claimed = transition_to(RunStatus::Claimed);
  if (claimed.is_err()) {
    runner_id.reset();
    return claimed;
  }
  last_runner_id = runner;
  return claimed;
}

std::string format_timestamp(RunRecord::TimePoint tp) {
  const auto time = RunRecord::Clock::to_time_t(tp);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()) %
                  1000;
  std::tm tm{};
  gmtime_r(&time, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

} // namespace runq::core
