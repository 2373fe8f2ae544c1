#include "core/dispatcher.h"

#include "core/logger.h"
#include "core/run_queue.h"
#include "core/runner_registry.h"
#include "core/stop_channel.h"

#include <algorithm>
#include <utility>

namespace runq::core {
namespace {

using SteadyClock = std::chrono::steady_clock;

std::string join_ids(const std::vector<std::string> &ids) {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty()) {
      out += ',';
    }
    out += id;
  }
  return out;
}

} // namespace

PollResponse PollResponse::of_run(RunRecord run) {
  PollResponse r;
  r.kind = Kind::Run;
  r.run = std::move(run);
  return r;
}

PollResponse PollResponse::of_stops(std::vector<std::string> run_ids) {
  PollResponse r;
  r.kind = Kind::StopRuns;
  r.stop_runs = std::move(run_ids);
  return r;
}

PollResponse PollResponse::deregistered() {
  PollResponse r;
  r.kind = Kind::Deregistered;
  return r;
}

const char *to_string(PollResponse::Kind kind) {
  switch (kind) {
  case PollResponse::Kind::Empty:
    return "empty";
  case PollResponse::Kind::Run:
    return "run";
  case PollResponse::Kind::StopRuns:
    return "stop_runs";
  case PollResponse::Kind::Deregistered:
    return "deregistered";
  }
  return "unknown";
}

Dispatcher::Dispatcher(RunQueue &queue, RunnerRegistry &registry,
                       StopChannel &stops, PollPolicy policy,
                       std::shared_ptr<ILogger> logger)
    : queue_(queue), registry_(registry), stops_(stops), policy_(policy),
      logger_(std::move(logger)) {}

std::chrono::milliseconds Dispatcher::effective_wait(
    std::optional<std::chrono::milliseconds> requested) const {
  auto wait = requested.value_or(policy_.default_wait);
  return std::clamp(wait, std::chrono::milliseconds(0), policy_.max_wait);
}

Result<PollResponse, DispatchError>
Dispatcher::poll(const std::string &runner_id,
                 std::optional<std::chrono::milliseconds> max_wait) {
  using R = Result<PollResponse, DispatchError>;

  auto known = registry_.find(runner_id);
  if (!known.has_value()) {
    return R::Err(DispatchError::NotFound("Runner not registered: " + runner_id));
  }
  if (known->deregistered) {
    return R::Ok(PollResponse::deregistered());
  }
  stops_.register_runner(runner_id);

  const auto deadline = SteadyClock::now() + effective_wait(max_wait);

  while (true) {
    // Read the generation before looking for work so that a wake landing
    // between the checks and the wait is not lost.
    const auto seen = stops_.generation(runner_id);

    // A polling runner is alive.
    auto beat = registry_.heartbeat(runner_id);
    if (beat.is_err()) {
      if (beat.error().category == ErrorCategory::Conflict) {
        return R::Ok(PollResponse::deregistered());
      }
      return R::Err(beat.error());
    }

    if (registry_.is_deregistering(runner_id)) {
      registry_.finalize_deregistration(runner_id);
      stops_.unregister_runner(runner_id);
      if (logger_) {
        logger_->info(runner_id, "dispatcher", "poll_deregistered",
                      "deregistration signal delivered");
      }
      return R::Ok(PollResponse::deregistered());
    }

    auto stop_ids = stops_.drain(runner_id);
    if (!stop_ids.empty()) {
      if (logger_) {
        logger_->info(runner_id, "dispatcher", "poll_stop_runs",
                      "runs=" + join_ids(stop_ids));
      }
      return R::Ok(PollResponse::of_stops(std::move(stop_ids)));
    }

    auto runner = registry_.find(runner_id);
    if (!runner.has_value()) {
      return R::Err(
          DispatchError::NotFound("Runner not registered: " + runner_id));
    }
    auto claimed = queue_.claim(*runner);
    if (claimed.has_value()) {
      if (logger_) {
        logger_->info(runner_id, "dispatcher", "poll_run",
                      "run=" + claimed->run_id +
                          " session=" + claimed->session_name);
      }
      return R::Ok(PollResponse::of_run(std::move(*claimed)));
    }

    if (stops_.closed()) {
      return R::Ok(PollResponse::empty());
    }

    const auto now = SteadyClock::now();
    if (now >= deadline) {
      return R::Ok(PollResponse::empty());
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    stops_.wait(runner_id, seen, std::min(policy_.slice, remaining));
  }
}

} // namespace runq::core
