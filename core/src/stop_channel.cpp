#include "core/stop_channel.h"

namespace runq::core {

void StopChannel::register_runner(const std::string &runner_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  mailboxes_.try_emplace(runner_id);
}

void StopChannel::unregister_runner(const std::string &runner_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    mailboxes_.erase(runner_id);
  }
  cv_.notify_all();
}

bool StopChannel::request_stop(const std::string &runner_id,
                               const std::string &run_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mailboxes_.find(runner_id);
    if (it == mailboxes_.end()) {
      return false;
    }
    it->second.stops.insert(run_id);
    it->second.generation++;
  }
  cv_.notify_all();
  return true;
}

std::vector<std::string> StopChannel::drain(const std::string &runner_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mailboxes_.find(runner_id);
  if (it == mailboxes_.end() || it->second.stops.empty()) {
    return {};
  }
  std::vector<std::string> out(it->second.stops.begin(),
                               it->second.stops.end());
  it->second.stops.clear();
  return out;
}

bool StopChannel::has_pending(const std::string &runner_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mailboxes_.find(runner_id);
  return it != mailboxes_.end() && !it->second.stops.empty();
}

void StopChannel::wake(const std::string &runner_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mailboxes_.find(runner_id);
    if (it == mailboxes_.end()) {
      return;
    }
    it->second.generation++;
  }
  cv_.notify_all();
}

void StopChannel::wake_all() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    broadcast_++;
  }
  cv_.notify_all();
}

std::uint64_t StopChannel::generation(const std::string &runner_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mailboxes_.find(runner_id);
  const std::uint64_t own = it == mailboxes_.end() ? 0 : it->second.generation;
  return own + broadcast_;
}

bool StopChannel::wait(const std::string &runner_id, std::uint64_t seen,
                       std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto current = [&]() {
    auto it = mailboxes_.find(runner_id);
    const std::uint64_t own =
        it == mailboxes_.end() ? 0 : it->second.generation;
    return own + broadcast_;
  };
  return cv_.wait_for(lock, timeout,
                      [&]() { return closed_ || current() != seen; });
}

void StopChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool StopChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace runq::core
