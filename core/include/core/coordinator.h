#pragma once

#include "core/callback_processor.h"
#include "core/coordinator_config.h"
#include "core/dispatch_error.h"
#include "core/dispatcher.h"
#include "core/result.h"
#include "core/run.h"
#include "core/run_queue.h"
#include "core/runner_registry.h"
#include "core/stop_channel.h"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace runq::core {

class ILogger;

/// Result of a stop request.
struct StopOutcome {
  RunRecord run;      // now in `stopping`
  bool delivered = false; // queued on the runner's stop channel
};

/// Runner plus its derived status.
struct RunnerView {
  RunnerInfo info;
  RunnerStatus status = RunnerStatus::Online;
};

/// Session plus the notices waiting for it.
struct SessionView {
  SessionInfo info;
  std::vector<std::string> pending_children;
};

/// Owns and wires the services behind runqd.
///
/// Responsibilities:
///   1. Route submissions, reports and polls to the owning service
///   2. Wake polls on new work (queue submit listener -> stop channel)
///   3. Feed terminal runs to the callback processor
///   4. Run the maintenance sweep (orphans, no-match timeout) on a thread
///
/// Does NOT speak HTTP; infra::CoordinatorApi does.
class Coordinator {
public:
  Coordinator(CoordinatorConfig config, std::shared_ptr<ILogger> logger);
  ~Coordinator();

  Coordinator(const Coordinator &) = delete;
  Coordinator &operator=(const Coordinator &) = delete;

  /// Start the maintenance thread. Idempotent.
  void start();

  /// Stop maintenance and release every blocked poll. Idempotent.
  void shutdown();

  // ---- Caller side ----

  Result<std::string, DispatchError> submit(SubmitRequest request);
  Result<RunRecord, DispatchError> get_run(const std::string &run_id) const;
  std::vector<RunRecord> list_runs(std::optional<RunStatus> status) const;
  Result<StopOutcome, DispatchError> stop_run(const std::string &run_id);
  Result<SessionView, DispatchError> session(const std::string &name) const;

  /// Forget an idle session and drop its queued notices. Returns the number
  /// of notices dropped.
  Result<std::size_t, DispatchError> delete_session(const std::string &name);

  // ---- Runner side ----

  std::string register_runner(RunnerRegistration registration);
  Result<void, DispatchError> heartbeat(const std::string &runner_id);
  Result<PollResponse, DispatchError>
  poll(const std::string &runner_id,
       std::optional<std::chrono::milliseconds> max_wait = std::nullopt);
  Result<void, DispatchError> deregister(const std::string &runner_id);
  std::vector<RunnerView> list_runners() const;

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

  // ---- Maintenance ----

  /// One sweep: orphan recovery then no-match timeout. Returns the number of
  /// runs it finished.
  std::size_t run_maintenance();

  [[nodiscard]] const CoordinatorConfig &config() const noexcept {
    return config_;
  }

  RunQueue &queue() noexcept { return queue_; }
  RunnerRegistry &registry() noexcept { return registry_; }
  StopChannel &stop_channel() noexcept { return stops_; }
  CallbackProcessor &callbacks() noexcept { return callbacks_; }

private:
  void maintenance_loop();

  CoordinatorConfig config_;
  std::shared_ptr<ILogger> logger_;

  RunnerRegistry registry_;
  RunQueue queue_;
  StopChannel stops_;
  Dispatcher dispatcher_;
  CallbackProcessor callbacks_;

  std::mutex lifecycle_mutex_;
  std::condition_variable lifecycle_cv_;
  bool running_ = false;
  bool stopping_ = false;
  std::thread maintenance_;
};

} // namespace runq::core
