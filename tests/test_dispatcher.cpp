#include <gtest/gtest.h>

#include "core/dispatcher.h"
#include "core/run_queue.h"
#include "core/runner_registry.h"
#include "core/stop_channel.h"

#include <future>
#include <set>
#include <thread>

using namespace runq::core;
using namespace std::chrono_literals;

namespace {

/// Queue, registry and stop channel wired the way the coordinator wires them.
struct DispatchFixture {
  explicit DispatchFixture(PollPolicy policy = make_policy())
      : registry(HeartbeatPolicy{}, nullptr), queue(CoordinatorConfig{}, nullptr),
        dispatcher(queue, registry, stops, policy, nullptr) {
    queue.on_run_submitted([this](const RunRecord &) { stops.wake_all(); });
  }

  static PollPolicy make_policy() {
    PollPolicy policy;
    policy.default_wait = 200ms;
    policy.max_wait = 5000ms;
    policy.slice = 1000ms;
    return policy;
  }

  std::string add_runner(TagSet tags = {}) {
    RunnerRegistration reg;
    reg.capabilities.tags = std::move(tags);
    auto id = registry.register_runner(reg);
    stops.register_runner(id);
    return id;
  }

  std::string submit(const std::string &session) {
    SubmitRequest req;
    req.session_name = session;
    req.payload = "work";
    auto result = queue.submit(req);
    EXPECT_TRUE(result.is_ok());
    return result.is_ok() ? result.value() : std::string();
  }

  RunnerRegistry registry;
  RunQueue queue;
  StopChannel stops;
  Dispatcher dispatcher;
};

} // namespace

TEST(DispatcherTest, UnknownRunnerIsNotFound) {
  DispatchFixture f;
  auto result = f.dispatcher.poll("rnr_000000000000", 0ms);
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().category, ErrorCategory::NotFound);
}

TEST(DispatcherTest, ReturnsQueuedRunImmediately) {
  DispatchFixture f;
  const auto runner = f.add_runner();
  const auto run_id = f.submit("alpha");

  auto result = f.dispatcher.poll(runner, 5000ms);
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().kind, PollResponse::Kind::Run);
  ASSERT_TRUE(result.value().run.has_value());
  EXPECT_EQ(result.value().run->run_id, run_id);
  EXPECT_EQ(result.value().run->status, RunStatus::Claimed);
}

TEST(DispatcherTest, EmptyAfterMaxWait) {
  DispatchFixture f;
  const auto runner = f.add_runner();

  const auto start = std::chrono::steady_clock::now();
  auto result = f.dispatcher.poll(runner, 100ms);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().kind, PollResponse::Kind::Empty);
  EXPECT_GE(elapsed, 90ms);
  EXPECT_LT(elapsed, 2000ms);
}

TEST(DispatcherTest, ZeroWaitReturnsAtOnce) {
  DispatchFixture f;
  const auto runner = f.add_runner();
  auto result = f.dispatcher.poll(runner, 0ms);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().kind, PollResponse::Kind::Empty);
}

TEST(DispatcherTest, WaitIsClampedToPolicy) {
  DispatchFixture f;
  EXPECT_EQ(f.dispatcher.effective_wait(std::nullopt), 200ms);
  EXPECT_EQ(f.dispatcher.effective_wait(60000ms), 5000ms);
  EXPECT_EQ(f.dispatcher.effective_wait(-5ms), 0ms);
}

TEST(DispatcherTest, SubmitWakesBlockedPoll) {
  DispatchFixture f;
  const auto runner = f.add_runner();

  auto pending = std::async(std::launch::async,
                            [&]() { return f.dispatcher.poll(runner, 5000ms); });
  std::this_thread::sleep_for(50ms);

  const auto start = std::chrono::steady_clock::now();
  const auto run_id = f.submit("alpha");
  auto result = pending.get();

  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().kind, PollResponse::Kind::Run);
  EXPECT_EQ(result.value().run->run_id, run_id);
  // Woken by the submit, well before the 1s slice.
  EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
}

TEST(DispatcherTest, StopWakesBlockedPoll) {
  DispatchFixture f;
  const auto runner = f.add_runner();

  auto pending = std::async(std::launch::async,
                            [&]() { return f.dispatcher.poll(runner, 5000ms); });
  std::this_thread::sleep_for(50ms);
  ASSERT_TRUE(f.stops.request_stop(runner, "run_abc"));

  auto result = pending.get();
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(result.value().kind, PollResponse::Kind::StopRuns);
  ASSERT_EQ(result.value().stop_runs.size(), 1u);
  EXPECT_EQ(result.value().stop_runs[0], "run_abc");
}

TEST(DispatcherTest, StopsComeBeforeNewWork) {
  DispatchFixture f;
  const auto runner = f.add_runner();
  f.submit("alpha");
  f.stops.request_stop(runner, "run_old");

  auto first = f.dispatcher.poll(runner, 0ms);
  ASSERT_TRUE(first.is_ok());
  EXPECT_EQ(first.value().kind, PollResponse::Kind::StopRuns);

  auto second = f.dispatcher.poll(runner, 0ms);
  ASSERT_TRUE(second.is_ok());
  EXPECT_EQ(second.value().kind, PollResponse::Kind::Run);
}

TEST(DispatcherTest, OnlyMatchingRunnerIsServed) {
  DispatchFixture f;
  const auto cpu = f.add_runner({"cpu"});
  const auto gpu = f.add_runner({"gpu"});

  SubmitRequest req;
  req.session_name = "train";
  req.payload = "fit";
  req.demand = DemandSpec{std::nullopt, {"gpu"}};
  ASSERT_TRUE(f.queue.submit(req).is_ok());

  auto cpu_poll = f.dispatcher.poll(cpu, 50ms);
  ASSERT_TRUE(cpu_poll.is_ok());
  EXPECT_EQ(cpu_poll.value().kind, PollResponse::Kind::Empty);

  auto gpu_poll = f.dispatcher.poll(gpu, 50ms);
  ASSERT_TRUE(gpu_poll.is_ok());
  EXPECT_EQ(gpu_poll.value().kind, PollResponse::Kind::Run);
}

TEST(DispatcherTest, DeregistrationIsDeliveredOnce) {
  DispatchFixture f;
  const auto runner = f.add_runner();

  auto pending = std::async(std::launch::async,
                            [&]() { return f.dispatcher.poll(runner, 5000ms); });
  std::this_thread::sleep_for(50ms);
  ASSERT_TRUE(f.registry.deregister(runner).is_ok());
  f.stops.wake(runner);

  auto result = pending.get();
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().kind, PollResponse::Kind::Deregistered);

  auto info = f.registry.find(runner);
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->deregistered);

  // Later polls keep answering deregistered without claiming work.
  f.submit("alpha");
  auto again = f.dispatcher.poll(runner, 0ms);
  ASSERT_TRUE(again.is_ok());
  EXPECT_EQ(again.value().kind, PollResponse::Kind::Deregistered);
  EXPECT_EQ(f.queue.pending_count(), 1u);
}

TEST(DispatcherTest, PollRefreshesHeartbeat) {
  DispatchFixture f;
  const auto runner = f.add_runner();
  const auto before = f.registry.find(runner)->last_heartbeat;
  std::this_thread::sleep_for(10ms);
  ASSERT_TRUE(f.dispatcher.poll(runner, 0ms).is_ok());
  EXPECT_GT(f.registry.find(runner)->last_heartbeat, before);
}

TEST(DispatcherTest, CloseEndsBlockedPoll) {
  DispatchFixture f;
  const auto runner = f.add_runner();

  auto pending = std::async(std::launch::async,
                            [&]() { return f.dispatcher.poll(runner, 5000ms); });
  std::this_thread::sleep_for(50ms);
  f.stops.close();

  auto status = pending.wait_for(2s);
  ASSERT_EQ(status, std::future_status::ready);
  auto result = pending.get();
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().kind, PollResponse::Kind::Empty);
}

TEST(DispatcherTest, ConcurrentPollsSplitTheWork) {
  DispatchFixture f;
  constexpr int kRunners = 4;
  std::vector<std::string> runners;
  for (int i = 0; i < kRunners; ++i) {
    runners.push_back(f.add_runner());
  }

  std::vector<std::future<Result<PollResponse, DispatchError>>> polls;
  for (const auto &runner : runners) {
    polls.push_back(std::async(std::launch::async, [&f, runner]() {
      return f.dispatcher.poll(runner, 3000ms);
    }));
  }
  std::this_thread::sleep_for(50ms);
  for (int i = 0; i < kRunners; ++i) {
    f.submit("s" + std::to_string(i));
  }

  std::set<std::string> claimed;
  for (auto &poll : polls) {
    auto result = poll.get();
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().kind, PollResponse::Kind::Run);
    claimed.insert(result.value().run->run_id);
  }
  EXPECT_EQ(claimed.size(), static_cast<size_t>(kRunners));
}
