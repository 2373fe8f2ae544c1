#include "core/callback_processor.h"

#include "core/logger.h"
#include "core/run_queue.h"

#include <iterator>
#include <sstream>
#include <utility>

namespace runq::core {
namespace {

constexpr const char *kComponent = "callback_processor";
constexpr const char *kNoResult = "(No result available)";
constexpr const char *kUnknownError = "Unknown error";
constexpr const char *kManualStop = "Session was manually stopped";

bool is_failure(const ChildNotice &notice) {
  return notice.outcome != RunStatus::Completed;
}

std::string failure_text(const ChildNotice &notice) {
  if (notice.error.has_value() && !notice.error->empty()) {
    return *notice.error;
  }
  return notice.outcome == RunStatus::Stopped ? kManualStop : kUnknownError;
}

std::string result_text(const ChildNotice &notice) {
  if (notice.result.has_value() && !notice.result->empty()) {
    return *notice.result;
  }
  return kNoResult;
}

std::string join_children(const std::vector<ChildNotice> &notices) {
  std::string out;
  for (const auto &notice : notices) {
    if (!out.empty()) {
      out += ',';
    }
    out += notice.child_session_name;
  }
  return out;
}

} // namespace

std::string format_callback_message(const std::vector<ChildNotice> &notices) {
  std::ostringstream oss;

  if (notices.size() == 1) {
    const auto &notice = notices.front();
    if (is_failure(notice)) {
      oss << "The child agent session \"" << notice.child_session_name
          << "\" has failed.\n\n## Error\n\n"
          << failure_text(notice)
          << "\n\nPlease handle this failure and continue with the "
             "orchestration.";
    } else {
      oss << "The child agent session \"" << notice.child_session_name
          << "\" has completed.\n\n## Child Result\n\n"
          << result_text(notice)
          << "\n\nPlease continue with the orchestration based on this "
             "result.";
    }
    return oss.str();
  }

  oss << "Multiple child agent sessions have completed.\n\n";
  for (std::size_t i = 0; i < notices.size(); ++i) {
    const auto &notice = notices[i];
    if (i > 0) {
      oss << "\n\n---\n\n";
    }
    const bool failed = is_failure(notice);
    oss << "### Child: " << notice.child_session_name << " ("
        << (failed ? "FAILED" : "completed") << ")\n\n"
        << (failed ? failure_text(notice) : result_text(notice));
  }
  oss << "\n\nPlease continue with the orchestration based on these results.";
  return oss.str();
}

CallbackProcessor::CallbackProcessor(RunQueue &queue,
                                     std::shared_ptr<ILogger> logger)
    : queue_(queue), logger_(std::move(logger)) {}

void CallbackProcessor::on_run_finished(const RunRecord &run) {
  if (!is_terminal(run.status)) {
    return;
  }

  if (run.parent_session_name.has_value()) {
    if (*run.parent_session_name == run.session_name) {
      if (logger_) {
        logger_->warn(run.session_name, kComponent, "callback_self_loop",
                      "session is its own parent, callback skipped");
      }
    } else {
      ChildNotice notice;
      notice.child_session_name = run.session_name;
      notice.run_id = run.run_id;
      notice.outcome = run.status;
      notice.error = run.error;
      notice.result = run.result;
      deliver_to_parent(*run.parent_session_name, std::move(notice));
    }
  }

  flush_own(run.session_name);
}

void CallbackProcessor::deliver_to_parent(const std::string &parent,
                                          ChildNotice notice) {
  auto guard = session_lock(parent);
  std::lock_guard<std::mutex> lock(*guard);

  auto info = queue_.session(parent);
  if (!info.has_value()) {
    if (logger_) {
      logger_->warn(parent, kComponent, "callback_parent_missing",
                    "dropping notice from child " + notice.child_session_name);
    }
    return;
  }

  if (info->status() == SessionStatus::Busy) {
    const std::string child = notice.child_session_name;
    append_pending(parent, std::move(notice));
    if (logger_) {
      logger_->info(parent, kComponent, "callback_queued",
                    "child=" + child +
                        " pending=" + std::to_string(pending_count(parent)));
    }
    return;
  }

  auto notices = take_pending(parent);
  notices.push_back(std::move(notice));
  submit_resume(parent, std::move(notices));
}

void CallbackProcessor::flush_own(const std::string &session_name) {
  auto guard = session_lock(session_name);
  std::lock_guard<std::mutex> lock(*guard);

  if (pending_count(session_name) == 0) {
    return;
  }

  auto info = queue_.session(session_name);
  if (!info.has_value()) {
    const auto dropped = take_pending(session_name);
    if (logger_) {
      logger_->warn(session_name, kComponent, "callback_dropped",
                    "session gone, dropped " + std::to_string(dropped.size()) +
                        " notice(s) from " + join_children(dropped));
    }
    return;
  }

  if (info->status() == SessionStatus::Busy) {
    // Another run is already active; it will flush when it ends.
    if (logger_) {
      logger_->info(session_name, kComponent, "callback_deferred",
                    "session busy, pending=" +
                        std::to_string(pending_count(session_name)));
    }
    return;
  }

  submit_resume(session_name, take_pending(session_name));
}

bool CallbackProcessor::submit_resume(const std::string &parent,
                                      std::vector<ChildNotice> notices) {
  if (notices.empty()) {
    return true;
  }

  SubmitRequest request;
  request.kind = RunKind::Resume;
  request.session_name = parent;
  request.payload = format_callback_message(notices);

  auto submitted = queue_.submit(std::move(request));
  if (submitted.is_ok()) {
    if (logger_) {
      logger_->info(parent, kComponent, "callback_delivered",
                    "run=" + submitted.value() + " children=" +
                        join_children(notices));
    }
    return true;
  }

  const auto &err = submitted.error();
  if (err.category == ErrorCategory::NotFound) {
    if (logger_) {
      logger_->warn(parent, kComponent, "callback_dropped",
                    err.message + ", children=" + join_children(notices));
    }
    return false;
  }

  if (logger_) {
    logger_->error(parent, kComponent, "callback_submit_failed",
                   err.message + ", re-queued " +
                       std::to_string(notices.size()) + " notice(s)");
  }
  restore_pending(parent, std::move(notices));
  return false;
}

std::size_t CallbackProcessor::pending_count(const std::string &parent) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(parent);
  return it == pending_.end() ? 0 : it->second.size();
}

std::vector<std::string>
CallbackProcessor::pending_children(const std::string &parent) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  auto it = pending_.find(parent);
  if (it != pending_.end()) {
    for (const auto &notice : it->second) {
      out.push_back(notice.child_session_name);
    }
  }
  return out;
}

std::map<std::string, std::size_t> CallbackProcessor::pending_summary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::size_t> out;
  for (const auto &[parent, notices] : pending_) {
    if (!notices.empty()) {
      out.emplace(parent, notices.size());
    }
  }
  return out;
}

std::size_t CallbackProcessor::clear_pending(const std::string &parent) {
  auto guard = session_lock(parent);
  std::lock_guard<std::mutex> lock(*guard);

  const auto dropped = take_pending(parent).size();
  if (dropped > 0 && logger_) {
    logger_->info(parent, kComponent, "callback_cleared",
                  "dropped " + std::to_string(dropped) + " notice(s)");
  }
  return dropped;
}

std::vector<ChildNotice>
CallbackProcessor::take_pending(const std::string &parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(parent);
  if (it == pending_.end()) {
    return {};
  }
  auto notices = std::move(it->second);
  pending_.erase(it);
  return notices;
}

void CallbackProcessor::append_pending(const std::string &parent,
                                       ChildNotice notice) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_[parent].push_back(std::move(notice));
}

void CallbackProcessor::restore_pending(const std::string &parent,
                                        std::vector<ChildNotice> notices) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &queued = pending_[parent];
  queued.insert(queued.begin(), std::make_move_iterator(notices.begin()),
                std::make_move_iterator(notices.end()));
}

std::shared_ptr<std::mutex>
CallbackProcessor::session_lock(const std::string &session_name) {
  // Entries are never erased so every caller for a name shares one mutex.
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = session_locks_[session_name];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

} // namespace runq::core
