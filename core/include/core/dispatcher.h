#pragma once

#include "core/coordinator_config.h"
#include "core/dispatch_error.h"
#include "core/result.h"
#include "core/run.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace runq::core {

class ILogger;
class RunQueue;
class RunnerRegistry;
class StopChannel;

/// What a single poll hands back to a runner.
struct PollResponse {
  enum class Kind {
    Empty,        // max_wait elapsed (or shutdown)
    Run,          // a run was claimed for the runner
    StopRuns,     // stop requests for runs the runner holds
    Deregistered  // the runner must exit
  };

  Kind kind = Kind::Empty;
  std::optional<RunRecord> run;
  std::vector<std::string> stop_runs;

  static PollResponse empty() { return {}; }
  static PollResponse of_run(RunRecord run);
  static PollResponse of_stops(std::vector<std::string> run_ids);
  static PollResponse deregistered();
};

const char *to_string(PollResponse::Kind kind);

/// Long-poll entry point for runners.
///
/// Each cycle checks, in order: deregistration, pending stops, a claimable
/// run. If none applies it blocks on the runner's wake signal for at most one
/// poll slice and tries again until max_wait has elapsed.
class Dispatcher {
public:
  Dispatcher(RunQueue &queue, RunnerRegistry &registry, StopChannel &stops,
             PollPolicy policy, std::shared_ptr<ILogger> logger);

  /// NotFound if the runner is unknown. max_wait defaults to the policy's
  /// default_wait and is clamped to max_wait.
  Result<PollResponse, DispatchError>
  poll(const std::string &runner_id,
       std::optional<std::chrono::milliseconds> max_wait = std::nullopt);

  [[nodiscard]] std::chrono::milliseconds
  effective_wait(std::optional<std::chrono::milliseconds> requested) const;

private:
  RunQueue &queue_;
  RunnerRegistry &registry_;
  StopChannel &stops_;
  PollPolicy policy_;
  std::shared_ptr<ILogger> logger_;
};

} // namespace runq::core
