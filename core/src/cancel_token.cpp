#include "core/cancel_token.h"

namespace runq::core {

void CancelToken::request_cancel() {
  std::vector<Callback> callbacks;
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    bool expected = false;
    if (!canceled_.compare_exchange_strong(expected, true,
                                           std::memory_order_release,
                                           std::memory_order_relaxed)) {
      return;
    }
    callbacks.swap(callbacks_);
  }
  for (auto &cb : callbacks) {
    if (cb) {
      cb();
    }
  }
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

void CancelToken::on_cancel(Callback cb) {
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    if (!is_canceled()) {
      callbacks_.push_back(std::move(cb));
      return;
    }
  }
  if (cb) {
    cb();
  }
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace runq::core
