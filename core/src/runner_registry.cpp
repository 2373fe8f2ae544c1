#include "core/runner_registry.h"

#include "core/id.h"
#include "core/logger.h"

#include <sstream>

namespace runq::core {
namespace {

std::string join_tags(const TagSet &tags) {
  std::ostringstream oss;
  bool first = true;
  for (const auto &tag : tags) {
    if (!first) {
      oss << ',';
    }
    oss << tag;
    first = false;
  }
  return oss.str();
}

} // namespace

const char *to_string(RunnerStatus status) {
  switch (status) {
  case RunnerStatus::Online:
    return "online";
  case RunnerStatus::Stale:
    return "stale";
  case RunnerStatus::Deregistering:
    return "deregistering";
  case RunnerStatus::Deregistered:
    return "deregistered";
  }
  return "unknown";
}

RunnerRegistry::RunnerRegistry(HeartbeatPolicy policy,
                               std::shared_ptr<ILogger> logger)
    : policy_(policy), logger_(std::move(logger)) {}

std::string RunnerRegistry::register_runner(RunnerRegistration registration) {
  RunnerInfo info;
  info.runner_id = make_id("rnr_");
  info.capabilities = std::move(registration.capabilities);
  info.hostname = std::move(registration.hostname);
  info.registered_at = RunnerInfo::Clock::now();
  info.last_heartbeat = info.registered_at;

  const std::string runner_id = info.runner_id;
  const std::string summary =
      "tags=[" + join_tags(info.capabilities.tags) + "] profile=" +
      info.capabilities.profile.value_or("-") +
      " strict_tags=" + (info.capabilities.strict_tags ? "true" : "false") +
      " hostname=" + info.hostname.value_or("-");
  {
    std::lock_guard<std::mutex> lock(mutex_);
    runners_.emplace(runner_id, std::move(info));
  }

  if (logger_) {
    logger_->info(runner_id, "runner_registry", "runner_registered", summary);
  }
  return runner_id;
}

Result<void, DispatchError>
RunnerRegistry::heartbeat(const std::string &runner_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runners_.find(runner_id);
  if (it == runners_.end()) {
    return Result<void, DispatchError>::Err(
        DispatchError::NotFound("Runner not registered: " + runner_id));
  }
  if (it->second.deregistered) {
    return Result<void, DispatchError>::Err(
        DispatchError::Conflict("Runner was deregistered: " + runner_id));
  }
  it->second.last_heartbeat = RunnerInfo::Clock::now();
  return Result<void, DispatchError>::Ok();
}

bool RunnerRegistry::is_alive(const std::string &runner_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runners_.find(runner_id);
  if (it == runners_.end()) {
    return false;
  }
  return is_fresh_locked(it->second, RunnerInfo::Clock::now());
}

Result<void, DispatchError>
RunnerRegistry::deregister(const std::string &runner_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runners_.find(runner_id);
    if (it == runners_.end()) {
      return Result<void, DispatchError>::Err(
          DispatchError::NotFound("Runner not registered: " + runner_id));
    }
    if (it->second.deregistered) {
      return Result<void, DispatchError>::Ok();
    }
    it->second.deregistering = true;
  }

  if (logger_) {
    logger_->info(runner_id, "runner_registry", "runner_deregistering",
                  "signal will be delivered on next poll");
  }
  return Result<void, DispatchError>::Ok();
}

bool RunnerRegistry::is_deregistering(const std::string &runner_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runners_.find(runner_id);
  return it != runners_.end() &&
         (it->second.deregistering || it->second.deregistered);
}

bool RunnerRegistry::finalize_deregistration(const std::string &runner_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runners_.find(runner_id);
    if (it == runners_.end() || !it->second.deregistering) {
      return false;
    }
    it->second.deregistering = false;
    it->second.deregistered = true;
  }

  if (logger_) {
    logger_->info(runner_id, "runner_registry", "runner_deregistered",
                  "deregistration signal delivered");
  }
  return true;
}

std::optional<RunnerInfo>
RunnerRegistry::find(const std::string &runner_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runners_.find(runner_id);
  if (it == runners_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<RunnerInfo> RunnerRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RunnerInfo> out;
  out.reserve(runners_.size());
  for (const auto &[_, info] : runners_) {
    out.push_back(info);
  }
  return out;
}

RunnerStatus RunnerRegistry::status_of(const RunnerInfo &info) const {
  if (info.deregistered) {
    return RunnerStatus::Deregistered;
  }
  if (info.deregistering) {
    return RunnerStatus::Deregistering;
  }
  return is_fresh_locked(info, RunnerInfo::Clock::now()) ? RunnerStatus::Online
                                                         : RunnerStatus::Stale;
}

bool RunnerRegistry::is_fresh_locked(const RunnerInfo &info,
                                     RunnerInfo::TimePoint now) const {
  return now - info.last_heartbeat <= policy_.timeout;
}

} // namespace runq::core
