#pragma once

#include "core/run.h"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace runq::core {

class ILogger;
class RunQueue;

/// One finished child waiting to be reported to its parent.
struct ChildNotice {
  std::string child_session_name;
  std::string run_id;
  RunStatus outcome = RunStatus::Completed; // completed, failed or stopped
  std::optional<std::string> error;
  std::optional<std::string> result;
};

/// Build the RESUME payload for a batch of notices (completion order).
std::string format_callback_message(const std::vector<ChildNotice> &notices);

/// Turns child completions into RESUME runs for the parent session.
///
/// Notices for a busy parent accumulate and are delivered together, in one
/// run, when the parent's active run ends. Work is serialized per session
/// name; the processor only talks to the queue through its public API.
class CallbackProcessor {
public:
  CallbackProcessor(RunQueue &queue, std::shared_ptr<ILogger> logger);

  CallbackProcessor(const CallbackProcessor &) = delete;
  CallbackProcessor &operator=(const CallbackProcessor &) = delete;

  /// Finished-run listener. Never fails; delivery problems are logged.
  void on_run_finished(const RunRecord &run);

  [[nodiscard]] std::size_t pending_count(const std::string &parent) const;

  [[nodiscard]] std::vector<std::string>
  pending_children(const std::string &parent) const;

  /// parent -> number of queued notices, for every parent with any.
  [[nodiscard]] std::map<std::string, std::size_t> pending_summary() const;

  /// Drop queued notices (session deleted). Returns how many were dropped.
  std::size_t clear_pending(const std::string &parent);

private:
  void deliver_to_parent(const std::string &parent, ChildNotice notice);
  void flush_own(const std::string &session_name);

  /// Submit one RESUME run carrying `notices`. Returns false on failure, in
  /// which case the notices are put back.
  bool submit_resume(const std::string &parent,
                     std::vector<ChildNotice> notices);

  std::vector<ChildNotice> take_pending(const std::string &parent);
  void append_pending(const std::string &parent, ChildNotice notice);
  void restore_pending(const std::string &parent,
                       std::vector<ChildNotice> notices);

  std::shared_ptr<std::mutex> session_lock(const std::string &session_name);

  RunQueue &queue_;
  std::shared_ptr<ILogger> logger_;

  mutable std::mutex mutex_; // guards pending_ and session_locks_
  std::unordered_map<std::string, std::vector<ChildNotice>> pending_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_locks_;
};

} // namespace runq::core
