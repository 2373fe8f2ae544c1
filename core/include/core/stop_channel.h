#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace runq::core {

/// Per-runner stop mailbox plus the wake signal long polls block on.
///
/// Waiters read generation() before checking for work and then wait() until
/// it changes, so a wake between the check and the wait is never lost.
class StopChannel {
public:
  StopChannel() = default;

  StopChannel(const StopChannel &) = delete;
  StopChannel &operator=(const StopChannel &) = delete;

  void register_runner(const std::string &runner_id);
  void unregister_runner(const std::string &runner_id);

  /// Queue a stop for run_id and wake the runner. Queuing the same run twice
  /// delivers it once. Returns false if the runner is unknown.
  bool request_stop(const std::string &runner_id, const std::string &run_id);

  /// Take every queued stop for the runner, in run_id order.
  std::vector<std::string> drain(const std::string &runner_id);

  [[nodiscard]] bool has_pending(const std::string &runner_id) const;

  /// Wake one runner's poll.
  void wake(const std::string &runner_id);

  /// Wake every poll (new work may match anyone).
  void wake_all();

  [[nodiscard]] std::uint64_t generation(const std::string &runner_id) const;

  /// Block until the runner's generation differs from `seen`, the channel
  /// closes, or `timeout` elapses. Returns true if woken.
  bool wait(const std::string &runner_id, std::uint64_t seen,
            std::chrono::milliseconds timeout);

  /// Release every waiter for good (shutdown).
  void close();

  [[nodiscard]] bool closed() const;

private:
  struct Mailbox {
    std::set<std::string> stops;
    std::uint64_t generation = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Mailbox> mailboxes_;
  std::uint64_t broadcast_ = 0; // bumped by wake_all()
  bool closed_ = false;
};

} // namespace runq::core
