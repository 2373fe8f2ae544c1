#include <gtest/gtest.h>

#include "core/coordinator.h"
#include "infra/coordinator_api.h"
#include "infra/coordinator_client.h"
#include "infra/curl_http_client.h"
#include "infra/http_server.h"
#include "infra/json_codec.h"

#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace runq::infra;
using namespace runq::core;
using namespace std::chrono_literals;

namespace {

CoordinatorConfig api_config() {
  CoordinatorConfig config;
  config.poll.default_wait = 1000ms;
  config.poll.max_wait = 10000ms;
  config.poll.slice = 1000ms;
  return config;
}

ServerRequest request(const std::string &method, const std::string &path,
                      const std::string &body = "") {
  ServerRequest req;
  req.method = method;
  req.path = path;
  req.body = body;
  return req;
}

json body_of(const ServerResponse &response) {
  return json::parse(response.body, nullptr, false);
}

} // namespace

// ============================================================
// Routing (handler called directly)
// ============================================================

TEST(CoordinatorApiTest, HealthAndUnknownRoutes) {
  Coordinator coordinator(api_config(), nullptr);
  CoordinatorApi api(coordinator, nullptr);

  auto health = api.handle(request("GET", "/health"));
  EXPECT_EQ(health.status, 200);
  EXPECT_EQ(body_of(health)["status"], "ok");

  auto missing = api.handle(request("GET", "/nope"));
  EXPECT_EQ(missing.status, 404);
  EXPECT_EQ(body_of(missing)["error"], "not_found");

  auto wrong_method = api.handle(request("DELETE", "/runs"));
  EXPECT_EQ(wrong_method.status, 405);
  EXPECT_EQ(body_of(wrong_method)["error"], "method_not_allowed");

  auto bad_action = api.handle(request("POST", "/runner/runs/run_x/paused", "{}"));
  EXPECT_EQ(bad_action.status, 404);
}

TEST(CoordinatorApiTest, SubmitValidation) {
  Coordinator coordinator(api_config(), nullptr);
  CoordinatorApi api(coordinator, nullptr);

  auto malformed = api.handle(request("POST", "/runs", "{not json"));
  EXPECT_EQ(malformed.status, 400);
  EXPECT_EQ(body_of(malformed)["error"], "validation_error");

  auto missing_payload =
      api.handle(request("POST", "/runs", R"({"session_name":"alpha"})"));
  EXPECT_EQ(missing_payload.status, 400);

  auto bad_kind = api.handle(request(
      "POST", "/runs", R"({"session_name":"a","payload":"p","kind":"RESTART"})"));
  EXPECT_EQ(bad_kind.status, 400);

  auto bad_tags = api.handle(request(
      "POST", "/runs",
      R"({"session_name":"a","payload":"p","demand":{"tags":"gpu"}})"));
  EXPECT_EQ(bad_tags.status, 400);

  EXPECT_TRUE(coordinator.list_runs(std::nullopt).empty());
}

TEST(CoordinatorApiTest, SubmitAndGetRun) {
  Coordinator coordinator(api_config(), nullptr);
  CoordinatorApi api(coordinator, nullptr);

  auto created = api.handle(request(
      "POST", "/runs",
      R"({"session_name":"alpha","kind":"START","payload":"hello",)"
      R"("demand":{"profile":"coder","tags":["gpu"]}})"));
  ASSERT_EQ(created.status, 201);
  const auto reply = body_of(created);
  EXPECT_EQ(reply["status"], "pending");
  const auto run_id = reply["run_id"].get<std::string>();

  auto fetched = api.handle(request("GET", "/runs/" + run_id));
  ASSERT_EQ(fetched.status, 200);
  const auto run = body_of(fetched);
  EXPECT_EQ(run["session_name"], "alpha");
  EXPECT_EQ(run["kind"], "START");
  EXPECT_EQ(run["demand"]["profile"], "coder");
  EXPECT_EQ(run["demand"]["tags"][0], "gpu");
  EXPECT_TRUE(run["runner_id"].is_null());

  auto listed = api.handle(request("GET", "/runs"));
  ASSERT_EQ(listed.status, 200);
  EXPECT_EQ(body_of(listed)["runs"].size(), 1u);

  auto unknown = api.handle(request("GET", "/runs/run_000000000000"));
  EXPECT_EQ(unknown.status, 404);
}

TEST(CoordinatorApiTest, ListRejectsUnknownStatus) {
  Coordinator coordinator(api_config(), nullptr);
  CoordinatorApi api(coordinator, nullptr);

  auto req = request("GET", "/runs");
  req.query["status"] = "finished";
  EXPECT_EQ(api.handle(req).status, 400);

  req.query["status"] = "pending";
  EXPECT_EQ(api.handle(req).status, 200);
}

TEST(CoordinatorApiTest, ConflictsMapTo409) {
  Coordinator coordinator(api_config(), nullptr);
  CoordinatorApi api(coordinator, nullptr);

  auto created = api.handle(
      request("POST", "/runs", R"({"session_name":"alpha","payload":"p"})"));
  ASSERT_EQ(created.status, 201);
  const auto run_id = body_of(created)["run_id"].get<std::string>();

  auto stop = api.handle(request("POST", "/runs/" + run_id + "/stop"));
  EXPECT_EQ(stop.status, 409);
  EXPECT_EQ(body_of(stop)["error"], "conflict");

  auto again = api.handle(
      request("POST", "/runs", R"({"session_name":"alpha","payload":"p"})"));
  EXPECT_EQ(again.status, 409);
}

TEST(CoordinatorApiTest, PollReturns204WhenEmpty) {
  Coordinator coordinator(api_config(), nullptr);
  CoordinatorApi api(coordinator, nullptr);

  auto registered = api.handle(request("POST", "/runner/register", "{}"));
  ASSERT_EQ(registered.status, 200);
  const auto reply = body_of(registered);
  EXPECT_EQ(reply["poll_timeout_seconds"], 1);
  EXPECT_EQ(reply["heartbeat_interval_seconds"], 60);
  const auto runner_id = reply["runner_id"].get<std::string>();

  auto poll = request("GET", "/runner/runs");
  poll.query["runner_id"] = runner_id;
  poll.query["max_wait"] = "0";
  auto empty = api.handle(poll);
  EXPECT_EQ(empty.status, 204);
  EXPECT_TRUE(empty.body.empty());

  poll.query["max_wait"] = "soon";
  EXPECT_EQ(api.handle(poll).status, 400);

  poll.query.erase("runner_id");
  EXPECT_EQ(api.handle(poll).status, 400);
}

TEST(CoordinatorApiTest, HugeMaxWaitIsClampedToLimit) {
  CoordinatorConfig config = api_config();
  config.poll.default_wait = 100ms;
  config.poll.max_wait = 300ms;
  Coordinator coordinator(config, nullptr);
  CoordinatorApi api(coordinator, nullptr);

  auto registered = api.handle(request("POST", "/runner/register", "{}"));
  ASSERT_EQ(registered.status, 200);
  auto poll = request("GET", "/runner/runs");
  poll.query["runner_id"] = body_of(registered)["runner_id"].get<std::string>();
  poll.query["max_wait"] = "9223372036854775807";

  const auto started = std::chrono::steady_clock::now();
  auto empty = api.handle(poll);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_EQ(empty.status, 204);
  EXPECT_GE(elapsed, 250ms);
  EXPECT_LT(elapsed, 3s);

  poll.query["max_wait"] = "99999999999999999999999";
  EXPECT_EQ(api.handle(poll).status, 400);
}

TEST(CoordinatorApiTest, ReportRequiresRunnerId) {
  Coordinator coordinator(api_config(), nullptr);
  CoordinatorApi api(coordinator, nullptr);

  auto missing = api.handle(request("POST", "/runner/runs/run_1/started", "{}"));
  EXPECT_EQ(missing.status, 400);

  auto unknown = api.handle(request("POST", "/runner/runs/run_1/started",
                                    R"({"runner_id":"rnr_1"})"));
  EXPECT_EQ(unknown.status, 404);

  auto heartbeat = api.handle(
      request("POST", "/runner/heartbeat", R"({"runner_id":"rnr_unknown"})"));
  EXPECT_EQ(heartbeat.status, 404);
}

TEST(CoordinatorApiTest, StatusMapping) {
  EXPECT_EQ(http_status_for(ErrorCategory::Validation), 400);
  EXPECT_EQ(http_status_for(ErrorCategory::NotFound), 404);
  EXPECT_EQ(http_status_for(ErrorCategory::Conflict), 409);
  EXPECT_EQ(http_status_for(ErrorCategory::Internal), 500);
  EXPECT_EQ(http_status_for(ErrorCategory::Unknown), 500);
}

// ============================================================
// Over the wire: HttpServer + HttpCoordinatorClient + curl
// ============================================================

class CoordinatorHttpTest : public ::testing::Test {
protected:
  std::unique_ptr<Coordinator> coordinator_;
  std::unique_ptr<CoordinatorApi> api_;
  std::unique_ptr<HttpServer> server_;
  std::unique_ptr<HttpCoordinatorClient> client_;

  void SetUp() override {
    coordinator_ = std::make_unique<Coordinator>(api_config(), nullptr);
    api_ = std::make_unique<CoordinatorApi>(*coordinator_, nullptr);
    server_ = std::make_unique<HttpServer>("127.0.0.1", 0, api_->handler());
    auto started = server_->start();
    if (started.is_err()) {
      GTEST_SKIP() << "Loopback server unavailable: " << started.error().message;
    }
    client_ = std::make_unique<HttpCoordinatorClient>(
        std::make_shared<CurlHttpClient>(), server_->base_url() + "/", 5000ms);
  }

  void TearDown() override {
    if (coordinator_) {
      coordinator_->shutdown();
    }
    if (server_) {
      server_->stop();
    }
  }

  SubmitRequest start(const std::string &session,
                      std::optional<std::string> parent = std::nullopt) {
    SubmitRequest req;
    req.session_name = session;
    req.parent_session_name = std::move(parent);
    req.payload = "work on " + session;
    return req;
  }

  RunnerLease register_runner(TagSet tags = {}) {
    RunnerRegistration reg;
    reg.capabilities.tags = std::move(tags);
    reg.hostname = "test-host";
    auto lease = client_->register_runner(reg);
    EXPECT_TRUE(lease.is_ok());
    return lease.is_ok() ? lease.value() : RunnerLease{};
  }
};

TEST_F(CoordinatorHttpTest, Health) {
  EXPECT_TRUE(client_->health().is_ok());
}

TEST_F(CoordinatorHttpTest, RunLifecycleWithCallback) {
  const auto lease = register_runner();
  EXPECT_EQ(lease.poll_timeout, 1s);

  auto orch = client_->submit(start("orch"));
  ASSERT_TRUE(orch.is_ok()) << orch.error().message;

  auto polled = client_->poll(lease.runner_id, 1s);
  ASSERT_TRUE(polled.is_ok()) << polled.error().message;
  ASSERT_EQ(polled.value().kind, PollResponse::Kind::Run);
  EXPECT_EQ(polled.value().run->run_id, orch.value());
  EXPECT_EQ(polled.value().run->status, RunStatus::Claimed);
  ASSERT_TRUE(client_->report_started(orch.value(), lease.runner_id).is_ok());
  ASSERT_TRUE(client_->report_completed(orch.value(), lease.runner_id,
                                        std::string("planned"))
                  .is_ok());

  auto child = client_->submit(start("child-A", "orch"));
  ASSERT_TRUE(child.is_ok());
  auto child_poll = client_->poll(lease.runner_id, 1s);
  ASSERT_TRUE(child_poll.is_ok());
  ASSERT_EQ(child_poll.value().kind, PollResponse::Kind::Run);
  ASSERT_TRUE(client_->report_started(child.value(), lease.runner_id).is_ok());
  ASSERT_TRUE(client_->report_completed(child.value(), lease.runner_id,
                                        std::string("three findings"))
                  .is_ok());

  auto fetched = client_->get_run(child.value());
  ASSERT_TRUE(fetched.is_ok());
  EXPECT_EQ(fetched.value().status, RunStatus::Completed);
  EXPECT_EQ(fetched.value().result, std::optional<std::string>("three findings"));
  EXPECT_TRUE(fetched.value().completed_at.has_value());
  EXPECT_EQ(fetched.value().parent_session_name, std::optional<std::string>("orch"));

  auto pending = client_->list_runs(RunStatus::Pending);
  ASSERT_TRUE(pending.is_ok());
  ASSERT_EQ(pending.value().size(), 1u);
  EXPECT_EQ(pending.value()[0].session_name, "orch");
  EXPECT_EQ(pending.value()[0].kind, RunKind::Resume);
  EXPECT_NE(pending.value()[0].payload.find("three findings"), std::string::npos);
}

TEST_F(CoordinatorHttpTest, ErrorsCarryServerCode) {
  auto missing = client_->get_run("run_000000000000");
  ASSERT_TRUE(missing.is_err());
  EXPECT_EQ(missing.error().http_status, 404);
  EXPECT_EQ(missing.error().code, "not_found");
  EXPECT_FALSE(missing.error().retryable);

  SubmitRequest invalid;
  invalid.session_name = "alpha";
  auto rejected = client_->submit(invalid);
  ASSERT_TRUE(rejected.is_err());
  EXPECT_EQ(rejected.error().http_status, 400);
  EXPECT_EQ(rejected.error().code, "validation_error");
}

TEST_F(CoordinatorHttpTest, ReportFromWrongRunnerIsConflict) {
  const auto owner = register_runner();
  const auto other = register_runner();
  auto run_id = client_->submit(start("job"));
  ASSERT_TRUE(run_id.is_ok());
  ASSERT_EQ(client_->poll(owner.runner_id, 1s).value().kind,
            PollResponse::Kind::Run);

  auto stolen = client_->report_started(run_id.value(), other.runner_id);
  ASSERT_TRUE(stolen.is_err());
  EXPECT_EQ(stolen.error().http_status, 409);
  EXPECT_EQ(stolen.error().code, "conflict");
}

TEST_F(CoordinatorHttpTest, LongPollWakesOnSubmit) {
  const auto lease = register_runner();

  auto pending = std::async(std::launch::async, [&]() {
    return client_->poll(lease.runner_id, 8s);
  });
  std::this_thread::sleep_for(200ms);

  const auto start_time = std::chrono::steady_clock::now();
  auto run_id = client_->submit(start("late"));
  ASSERT_TRUE(run_id.is_ok());

  auto polled = pending.get();
  ASSERT_TRUE(polled.is_ok()) << polled.error().message;
  ASSERT_EQ(polled.value().kind, PollResponse::Kind::Run);
  EXPECT_EQ(polled.value().run->run_id, run_id.value());
  EXPECT_LT(std::chrono::steady_clock::now() - start_time, 2s);
}

TEST_F(CoordinatorHttpTest, StopIsDeliveredToPollingRunner) {
  const auto lease = register_runner();
  auto run_id = client_->submit(start("job"));
  ASSERT_TRUE(run_id.is_ok());
  ASSERT_EQ(client_->poll(lease.runner_id, 1s).value().kind,
            PollResponse::Kind::Run);
  ASSERT_TRUE(client_->report_started(run_id.value(), lease.runner_id).is_ok());

  auto pending = std::async(std::launch::async, [&]() {
    return client_->poll(lease.runner_id, 8s);
  });
  std::this_thread::sleep_for(200ms);

  auto ack = client_->stop_run(run_id.value());
  ASSERT_TRUE(ack.is_ok());
  EXPECT_EQ(ack.value().status, "stopping");
  EXPECT_TRUE(ack.value().delivered);

  auto polled = pending.get();
  ASSERT_TRUE(polled.is_ok());
  ASSERT_EQ(polled.value().kind, PollResponse::Kind::StopRuns);
  ASSERT_EQ(polled.value().stop_runs.size(), 1u);
  EXPECT_EQ(polled.value().stop_runs[0], run_id.value());

  ASSERT_TRUE(client_->report_stopped(run_id.value(), lease.runner_id).is_ok());
  EXPECT_EQ(client_->get_run(run_id.value()).value().status, RunStatus::Stopped);
}

TEST_F(CoordinatorHttpTest, EmptyPollAndDeregistration) {
  const auto lease = register_runner();

  auto empty = client_->poll(lease.runner_id, 0s);
  ASSERT_TRUE(empty.is_ok());
  EXPECT_EQ(empty.value().kind, PollResponse::Kind::Empty);

  ASSERT_TRUE(client_->heartbeat(lease.runner_id).is_ok());
  ASSERT_TRUE(client_->deregister(lease.runner_id).is_ok());

  auto bye = client_->poll(lease.runner_id, 1s);
  ASSERT_TRUE(bye.is_ok());
  EXPECT_EQ(bye.value().kind, PollResponse::Kind::Deregistered);

  auto beat = client_->heartbeat(lease.runner_id);
  ASSERT_TRUE(beat.is_err());
  EXPECT_EQ(beat.error().http_status, 409);
}

TEST_F(CoordinatorHttpTest, SessionStatusAndDelete) {
  const auto lease = register_runner();
  auto run_id = client_->submit(start("sess"));
  ASSERT_TRUE(run_id.is_ok());

  auto busy = client_->get_session("sess");
  ASSERT_TRUE(busy.is_ok());
  EXPECT_EQ(busy.value().status, "busy");
  EXPECT_FALSE(busy.value().parent_session_name.has_value());

  auto refused = client_->delete_session("sess");
  ASSERT_TRUE(refused.is_err());
  EXPECT_EQ(refused.error().http_status, 409);

  ASSERT_EQ(client_->poll(lease.runner_id, 1s).value().kind,
            PollResponse::Kind::Run);
  ASSERT_TRUE(client_->report_started(run_id.value(), lease.runner_id).is_ok());
  ASSERT_TRUE(client_->report_failed(run_id.value(), lease.runner_id, "boom").is_ok());
  EXPECT_EQ(client_->get_run(run_id.value()).value().error,
            std::optional<std::string>("boom"));

  auto cleared = client_->delete_session("sess");
  ASSERT_TRUE(cleared.is_ok());
  EXPECT_EQ(cleared.value(), 0u);

  auto gone = client_->get_session("sess");
  ASSERT_TRUE(gone.is_err());
  EXPECT_EQ(gone.error().http_status, 404);
}

TEST_F(CoordinatorHttpTest, UnreachableServerIsNetworkError) {
  HttpCoordinatorClient client(std::make_shared<CurlHttpClient>(),
                               "http://127.0.0.1:1", 1000ms);
  auto result = client.health();
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().http_status, 0);
  EXPECT_EQ(result.error().code, "network");
  EXPECT_TRUE(result.error().retryable);
}

TEST(CoordinatorClientTest, NullTransportIsReported) {
  HttpCoordinatorClient client(nullptr, "http://127.0.0.1:8765");
  auto result = client.health();
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().code, "client_not_ready");
}
