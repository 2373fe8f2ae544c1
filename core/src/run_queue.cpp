#include "core/run_queue.h"

#include "core/id.h"
#include "core/logger.h"

#include <algorithm>
#include <utility>

namespace runq::core {
namespace {

using Clock = RunRecord::Clock;

std::string seconds_text(std::chrono::milliseconds ms) {
  return std::to_string(ms.count() / 1000) + "s";
}

} // namespace

const char *to_string(SessionStatus status) {
  switch (status) {
  case SessionStatus::Idle:
    return "idle";
  case SessionStatus::Busy:
    return "busy";
  }
  return "unknown";
}

RunQueue::RunQueue(CoordinatorConfig config, std::shared_ptr<ILogger> logger)
    : config_(CoordinatorConfig::normalize(std::move(config))),
      logger_(std::move(logger)) {}

Result<std::string, DispatchError> RunQueue::submit(SubmitRequest request) {
  using R = Result<std::string, DispatchError>;

  if (request.session_name.empty()) {
    return R::Err(DispatchError::Validation("session_name is required"));
  }
  if (request.payload.empty()) {
    return R::Err(DispatchError::Validation("payload is required"));
  }
  if (request.parent_session_name.has_value() &&
      request.parent_session_name->empty()) {
    request.parent_session_name.reset();
  }
  if (request.parent_session_name == request.session_name) {
    return R::Err(DispatchError::Validation(
        "Session cannot be its own parent: " + request.session_name));
  }
  if (request.demand.has_value() && request.demand->empty()) {
    request.demand.reset();
  }

  RunRecord run;
  std::vector<RunListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    if (request.parent_session_name.has_value() &&
        sessions_.find(*request.parent_session_name) == sessions_.end()) {
      return R::Err(DispatchError::NotFound("Parent session not found: " +
                                            *request.parent_session_name));
    }

    auto session_it = sessions_.find(request.session_name);
    if (request.kind == RunKind::Resume) {
      if (session_it == sessions_.end()) {
        return R::Err(DispatchError::NotFound("Session not found: " +
                                              request.session_name));
      }
    } else if (session_it != sessions_.end() &&
               session_it->second.status() == SessionStatus::Busy) {
      return R::Err(DispatchError(
          ErrorCategory::Conflict, 2002,
          "Session already has an active run: " + request.session_name,
          {{"session_name", request.session_name}}));
    }

    if (session_it == sessions_.end()) {
      SessionInfo info;
      info.session_name = request.session_name;
      info.created_at = Clock::now();
      session_it = sessions_.emplace(request.session_name, std::move(info)).first;
    }
    SessionInfo &session = session_it->second;
    // The first run that names a parent fixes it for the session.
    if (!session.parent_session_name.has_value()) {
      session.parent_session_name = request.parent_session_name;
    }

    do {
      run.run_id = make_id("run_");
    } while (runs_.count(run.run_id) > 0);
    run.kind = request.kind;
    run.session_name = std::move(request.session_name);
    run.parent_session_name = session.parent_session_name;
    run.payload = std::move(request.payload);
    run.demand = std::move(request.demand);

    if (run.demand.has_value()) {
      session.demand_tags = run.demand->tags;
    } else if (run.kind == RunKind::Resume) {
      DemandSpec inherited;
      inherited.tags = session.demand_tags;
      if (config_.session_affinity) {
        inherited.profile = session.last_profile;
      }
      if (!inherited.empty()) {
        run.demand = std::move(inherited);
        run.inherited_demand = true;
      }
    }

    if (!runs_.emplace(run.run_id, run).second) {
      return R::Err(DispatchError::Internal("Duplicate run id: " + run.run_id));
    }
    session.active_runs++;
    pending_.push_back(run.run_id);
    creation_order_.push_back(run.run_id);
    listeners = submitted_listeners_;
  }

  if (logger_) {
    logger_->info(run.run_id, "run_queue", "run_submitted",
                  std::string("kind=") + to_string(run.kind) +
                      " session=" + run.session_name + " parent=" +
                      run.parent_session_name.value_or("-") +
                      " demand=" + (run.demand.has_value() ? "yes" : "no"));
  }
  notify(listeners, {run});
  return R::Ok(run.run_id);
}

std::optional<RunRecord> RunQueue::claim(const RunnerInfo &runner) {
  std::optional<RunRecord> claimed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
      auto run_it = runs_.find(*it);
      if (run_it == runs_.end()) {
        continue;
      }
      RunRecord &run = run_it->second;
      if (run.status != RunStatus::Pending ||
          !runner_satisfies(run.demand, runner.capabilities)) {
        continue;
      }

      auto result = run.claim_for(runner.runner_id);
      if (result.is_err()) {
        continue;
      }
      pending_.erase(it);

      auto session_it = sessions_.find(run.session_name);
      if (session_it != sessions_.end() &&
          runner.capabilities.profile.has_value()) {
        session_it->second.last_profile = runner.capabilities.profile;
      }
      claimed = run;
      break;
    }
  }

  if (claimed.has_value() && logger_) {
    logger_->info(claimed->run_id, "run_queue", "run_claimed",
                  "runner=" + runner.runner_id +
                      " session=" + claimed->session_name);
  }
  return claimed;
}

Result<RunRecord, DispatchError>
RunQueue::report_started(const std::string &run_id,
                         const std::string &runner_id) {
  return apply_report(run_id, runner_id,
                      {RunStatus::Running, "run_started", std::nullopt,
                       std::nullopt});
}

Result<RunRecord, DispatchError>
RunQueue::report_completed(const std::string &run_id,
                           const std::string &runner_id,
                           std::optional<std::string> result) {
  return apply_report(run_id, runner_id,
                      {RunStatus::Completed, "run_completed", std::nullopt,
                       std::move(result)});
}

Result<RunRecord, DispatchError>
RunQueue::report_failed(const std::string &run_id,
                        const std::string &runner_id,
                        const std::string &error) {
  return apply_report(
      run_id, runner_id,
      {RunStatus::Failed, "run_failed",
       error.empty() ? std::string("Unknown error") : error, std::nullopt});
}

Result<RunRecord, DispatchError>
RunQueue::report_stopped(const std::string &run_id,
                         const std::string &runner_id) {
  return apply_report(run_id, runner_id,
                      {RunStatus::Stopped, "run_stopped", std::nullopt,
                       std::nullopt});
}

Result<RunRecord, DispatchError>
RunQueue::apply_report(const std::string &run_id, const std::string &runner_id,
                       const Report &report) {
  using R = Result<RunRecord, DispatchError>;

  RunRecord snapshot;
  std::vector<RunListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
      return R::Err(DispatchError::NotFound("Run not found: " + run_id));
    }
    RunRecord &run = it->second;

    if (is_terminal(run.status)) {
      return R::Err(DispatchError(
          ErrorCategory::Conflict, 2003,
          "Run already " + std::string(to_string(run.status)) + ": " + run_id,
          {{"run_id", run_id}, {"status", to_string(run.status)}}));
    }
    if (run.runner_id != runner_id) {
      return R::Err(DispatchError(
          ErrorCategory::Conflict, 2004,
          "Run " + run_id + " is not assigned to runner " + runner_id,
          {{"run_id", run_id},
           {"assigned_runner", run.runner_id.value_or("")},
           {"reporting_runner", runner_id}}));
    }

    auto moved = run.transition_to(report.target);
    if (moved.is_err()) {
      return R::Err(moved.error());
    }
    if (report.error.has_value()) {
      run.error = report.error;
    }
    if (report.result.has_value()) {
      run.result = report.result;
    }

    snapshot = run;
    if (is_terminal(run.status)) {
      on_terminal_locked(run);
      listeners = finished_listeners_;
    }
  }

  if (logger_) {
    std::string msg = "runner=" + runner_id + " session=" + snapshot.session_name;
    if (snapshot.error.has_value()) {
      msg += " error=" + *snapshot.error;
    }
    logger_->info(run_id, "run_queue", report.event, msg);
  }
  notify(listeners, {snapshot});
  return R::Ok(snapshot);
}

Result<RunRecord, DispatchError>
RunQueue::request_stop(const std::string &run_id) {
  using R = Result<RunRecord, DispatchError>;

  RunRecord snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
      return R::Err(DispatchError::NotFound("Run not found: " + run_id));
    }
    RunRecord &run = it->second;
    if (run.status != RunStatus::Claimed && run.status != RunStatus::Running) {
      return R::Err(DispatchError(
          ErrorCategory::Conflict, 2005,
          "Run cannot be stopped (status: " + std::string(to_string(run.status)) +
              ")",
          {{"run_id", run_id}, {"status", to_string(run.status)}}));
    }
    auto moved = run.transition_to(RunStatus::Stopping);
    if (moved.is_err()) {
      return R::Err(moved.error());
    }
    snapshot = run;
  }

  if (logger_) {
    logger_->info(run_id, "run_queue", "run_stopping",
                  "runner=" + snapshot.runner_id.value_or("-"));
  }
  return R::Ok(snapshot);
}

Result<RunRecord, DispatchError>
RunQueue::get(const std::string &run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    return Result<RunRecord, DispatchError>::Err(
        DispatchError::NotFound("Run not found: " + run_id));
  }
  return Result<RunRecord, DispatchError>::Ok(it->second);
}

std::vector<RunRecord> RunQueue::list(std::optional<RunStatus> status) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RunRecord> out;
  for (const auto &run_id : creation_order_) {
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
      continue;
    }
    if (!status.has_value() || it->second.status == *status) {
      out.push_back(it->second);
    }
  }
  return out;
}

std::optional<SessionInfo>
RunQueue::session(const std::string &session_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_name);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result<void, DispatchError>
RunQueue::delete_session(const std::string &session_name) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_name);
    if (it == sessions_.end()) {
      return Result<void, DispatchError>::Err(
          DispatchError::NotFound("Session not found: " + session_name));
    }
    if (it->second.status() == SessionStatus::Busy) {
      return Result<void, DispatchError>::Err(DispatchError(
          ErrorCategory::Conflict, 2006,
          "Session has active runs: " + session_name,
          {{"session_name", session_name},
           {"active_runs", std::to_string(it->second.active_runs)}}));
    }
    sessions_.erase(it);
  }

  if (logger_) {
    logger_->info(session_name, "run_queue", "session_deleted", "");
  }
  return Result<void, DispatchError>::Ok();
}

std::vector<RunRecord>
RunQueue::recover_orphans(const RunnerRegistry &registry) {
  struct Candidate {
    std::string run_id;
    std::string runner_id;
  };

  // Collect under our lock, check liveness under the registry's lock, then
  // re-validate. The two locks are never held together.
  std::vector<Candidate> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    for (const auto &[run_id, run] : runs_) {
      if (!holds_runner(run.status) || !run.runner_id.has_value() ||
          !run.claimed_at.has_value()) {
        continue;
      }
      if (now - *run.claimed_at > config_.recovery.claim_grace) {
        candidates.push_back({run_id, *run.runner_id});
      }
    }
  }

  std::vector<Candidate> orphaned;
  for (auto &candidate : candidates) {
    if (!registry.is_alive(candidate.runner_id)) {
      orphaned.push_back(std::move(candidate));
    }
  }
  if (orphaned.empty()) {
    return {};
  }

  std::vector<RunRecord> recovered;
  std::vector<RunListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &candidate : orphaned) {
      auto it = runs_.find(candidate.run_id);
      if (it == runs_.end()) {
        continue;
      }
      RunRecord &run = it->second;
      if (!holds_runner(run.status) || run.runner_id != candidate.runner_id) {
        continue; // reported or re-assigned meanwhile
      }
      const RunStatus target = run.status == RunStatus::Stopping
                                   ? RunStatus::Stopped
                                   : RunStatus::Failed;
      if (run.transition_to(target).is_err()) {
        continue;
      }
      run.error = kOrphanedError;
      on_terminal_locked(run);
      recovered.push_back(run);
    }
    listeners = finished_listeners_;
  }

  if (logger_) {
    for (const auto &run : recovered) {
      logger_->warn(run.run_id, "run_queue", "run_orphaned",
                    "runner=" + run.last_runner_id.value_or("-") +
                        " status=" + to_string(run.status));
    }
  }
  notify(listeners, recovered);
  return recovered;
}

std::vector<RunRecord> RunQueue::fail_unmatched() {
  std::vector<RunRecord> failed;
  std::vector<RunListener> listeners;
  const auto timeout = config_.recovery.no_match_timeout;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    std::vector<std::string> expired;
    for (const auto &run_id : pending_) {
      auto it = runs_.find(run_id);
      if (it == runs_.end()) {
        continue;
      }
      const RunRecord &run = it->second;
      if (run.status == RunStatus::Pending && run.demand.has_value() &&
          !run.inherited_demand && now - run.created_at > timeout) {
        expired.push_back(run_id);
      }
    }

    for (const auto &run_id : expired) {
      RunRecord &run = runs_.at(run_id);
      if (run.transition_to(RunStatus::Failed).is_err()) {
        continue;
      }
      run.error = "no matching runner within " + seconds_text(timeout);
      erase_pending_locked(run_id);
      on_terminal_locked(run);
      failed.push_back(run);
    }
    listeners = finished_listeners_;
  }

  if (logger_) {
    for (const auto &run : failed) {
      logger_->warn(run.run_id, "run_queue", "run_no_match",
                    "session=" + run.session_name + " " + run.error.value_or(""));
    }
  }
  notify(listeners, failed);
  return failed;
}

void RunQueue::on_run_submitted(RunListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  submitted_listeners_.push_back(std::move(listener));
}

void RunQueue::on_run_finished(RunListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  finished_listeners_.push_back(std::move(listener));
}

std::size_t RunQueue::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

void RunQueue::on_terminal_locked(const RunRecord &run) {
  auto it = sessions_.find(run.session_name);
  if (it != sessions_.end() && it->second.active_runs > 0) {
    it->second.active_runs--;
  }
}

void RunQueue::erase_pending_locked(const std::string &run_id) {
  auto it = std::find(pending_.begin(), pending_.end(), run_id);
  if (it != pending_.end()) {
    pending_.erase(it);
  }
}

void RunQueue::notify(const std::vector<RunListener> &listeners,
                      const std::vector<RunRecord> &runs) const {
  for (const auto &run : runs) {
    for (const auto &listener : listeners) {
      if (listener) {
        listener(run);
      }
    }
  }
}

} // namespace runq::core
