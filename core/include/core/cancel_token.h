#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace runq::core {

/// Thread-safe cancellation token.
///
/// Single writer (whoever calls request_cancel()), many readers. Used to
/// abort in-flight HTTP calls and the runner-side poll loop.
class CancelToken {
public:
  CancelToken() = default;

  /// Request cancellation. Thread-safe, idempotent. Callbacks run once, on
  /// the calling thread.
  void request_cancel();

  [[nodiscard]] bool is_canceled() const noexcept;

  /// Register a callback for cancellation. Runs immediately if the token is
  /// already canceled.
  using Callback = std::function<void()>;
  void on_cancel(Callback cb);

  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> canceled_{false};
  std::mutex cb_mutex_;
  std::vector<Callback> callbacks_;
};

} // namespace runq::core
