#include "core/coordinator.h"

#include "core/logger.h"

#include <utility>

namespace runq::core {

Coordinator::Coordinator(CoordinatorConfig config,
                         std::shared_ptr<ILogger> logger)
    : config_(CoordinatorConfig::normalize(std::move(config))),
      logger_(std::move(logger)), registry_(config_.heartbeat, logger_),
      queue_(config_, logger_), stops_(),
      dispatcher_(queue_, registry_, stops_, config_.poll, logger_),
      callbacks_(queue_, logger_) {
  // Any runner may match a new run, so every poll re-checks.
  queue_.on_run_submitted([this](const RunRecord &) { stops_.wake_all(); });
  queue_.on_run_finished(
      [this](const RunRecord &run) { callbacks_.on_run_finished(run); });
}

Coordinator::~Coordinator() { shutdown(); }

void Coordinator::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_ || stopping_) {
    return;
  }
  running_ = true;
  maintenance_ = std::thread([this]() { maintenance_loop(); });
  if (logger_) {
    logger_->info("coordinator", "coordinator", "started",
                  "sweep_interval_ms=" +
                      std::to_string(config_.recovery.sweep_interval.count()));
  }
}

void Coordinator::shutdown() {
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  lifecycle_cv_.notify_all();
  stops_.close();
  if (maintenance_.joinable()) {
    maintenance_.join();
  }
  if (logger_) {
    logger_->info("coordinator", "coordinator", "stopped", "");
  }
}

void Coordinator::maintenance_loop() {
  std::unique_lock<std::mutex> lock(lifecycle_mutex_);
  while (!stopping_) {
    lifecycle_cv_.wait_for(lock, config_.recovery.sweep_interval,
                           [this]() { return stopping_; });
    if (stopping_) {
      break;
    }
    lock.unlock();
    run_maintenance();
    lock.lock();
  }
}

std::size_t Coordinator::run_maintenance() {
  const auto orphaned = queue_.recover_orphans(registry_);
  const auto unmatched = queue_.fail_unmatched();
  const auto total = orphaned.size() + unmatched.size();
  if (total > 0 && logger_) {
    logger_->info("coordinator", "coordinator", "maintenance_sweep",
                  "orphaned=" + std::to_string(orphaned.size()) +
                      " unmatched=" + std::to_string(unmatched.size()));
  }
  return total;
}

// ---- Caller side ----

Result<std::string, DispatchError> Coordinator::submit(SubmitRequest request) {
  return queue_.submit(std::move(request));
}

Result<RunRecord, DispatchError>
Coordinator::get_run(const std::string &run_id) const {
  return queue_.get(run_id);
}

std::vector<RunRecord>
Coordinator::list_runs(std::optional<RunStatus> status) const {
  return queue_.list(status);
}

Result<StopOutcome, DispatchError>
Coordinator::stop_run(const std::string &run_id) {
  auto stopping = queue_.request_stop(run_id);
  if (stopping.is_err()) {
    return Result<StopOutcome, DispatchError>::Err(stopping.error());
  }

  StopOutcome outcome;
  outcome.run = std::move(stopping).value();
  if (outcome.run.runner_id.has_value()) {
    outcome.delivered = stops_.request_stop(*outcome.run.runner_id, run_id);
  }
  if (logger_) {
    logger_->info(run_id, "coordinator", "stop_requested",
                  "runner=" + outcome.run.runner_id.value_or("-") +
                      " delivered=" + (outcome.delivered ? "true" : "false"));
  }
  return Result<StopOutcome, DispatchError>::Ok(std::move(outcome));
}

Result<SessionView, DispatchError>
Coordinator::session(const std::string &name) const {
  auto info = queue_.session(name);
  if (!info.has_value()) {
    return Result<SessionView, DispatchError>::Err(
        DispatchError::NotFound("Session not found: " + name));
  }
  SessionView view;
  view.info = std::move(*info);
  view.pending_children = callbacks_.pending_children(name);
  return Result<SessionView, DispatchError>::Ok(std::move(view));
}

Result<std::size_t, DispatchError>
Coordinator::delete_session(const std::string &name) {
  auto deleted = queue_.delete_session(name);
  if (deleted.is_err()) {
    return Result<std::size_t, DispatchError>::Err(deleted.error());
  }
  return Result<std::size_t, DispatchError>::Ok(callbacks_.clear_pending(name));
}

// ---- Runner side ----

std::string Coordinator::register_runner(RunnerRegistration registration) {
  auto runner_id = registry_.register_runner(std::move(registration));
  stops_.register_runner(runner_id);
  // A (re)starting runner is a good moment to reclaim work a dead one held.
  queue_.recover_orphans(registry_);
  return runner_id;
}

Result<void, DispatchError>
Coordinator::heartbeat(const std::string &runner_id) {
  return registry_.heartbeat(runner_id);
}

Result<PollResponse, DispatchError>
Coordinator::poll(const std::string &runner_id,
                  std::optional<std::chrono::milliseconds> max_wait) {
  return dispatcher_.poll(runner_id, max_wait);
}

Result<void, DispatchError>
Coordinator::deregister(const std::string &runner_id) {
  auto marked = registry_.deregister(runner_id);
  if (marked.is_ok()) {
    stops_.wake(runner_id);
  }
  return marked;
}

std::vector<RunnerView> Coordinator::list_runners() const {
  std::vector<RunnerView> out;
  for (auto &info : registry_.list()) {
    RunnerView view;
    view.status = registry_.status_of(info);
    view.info = std::move(info);
    out.push_back(std::move(view));
  }
  return out;
}

Result<RunRecord, DispatchError>
Coordinator::report_started(const std::string &run_id,
                            const std::string &runner_id) {
  return queue_.report_started(run_id, runner_id);
}

Result<RunRecord, DispatchError>
Coordinator::report_completed(const std::string &run_id,
                              const std::string &runner_id,
                              std::optional<std::string> result) {
  return queue_.report_completed(run_id, runner_id, std::move(result));
}

Result<RunRecord, DispatchError>
Coordinator::report_failed(const std::string &run_id,
                           const std::string &runner_id,
                           const std::string &error) {
  return queue_.report_failed(run_id, runner_id, error);
}

Result<RunRecord, DispatchError>
Coordinator::report_stopped(const std::string &run_id,
                            const std::string &runner_id) {
  return queue_.report_stopped(run_id, runner_id);
}

} // namespace runq::core
