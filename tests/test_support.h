#pragma once

#include "core/logger.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace runq::test {

/// Captures log events so tests can assert on them.
class RecordingLogger : public core::ILogger {
public:
  struct Entry {
    std::string level;
    std::string trace_id;
    std::string component;
    std::string event;
    std::string msg;
  };

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    record("info", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    record("warn", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    record("error", trace_id, component, event, msg);
  }

  bool has_event(const std::string &event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &e : entries_) {
      if (e.event == event) {
        return true;
      }
    }
    return false;
  }

  std::vector<Entry> entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

private:
  void record(const char *level, const std::string &trace_id,
              const std::string &component, const std::string &event,
              const std::string &msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({level, trace_id, component, event, msg});
  }

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

/// Poll `predicate` until true or `timeout` elapses.
inline bool wait_until(const std::function<bool()> &predicate,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

} // namespace runq::test
