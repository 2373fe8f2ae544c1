#pragma once

#include "core/cancel_token.h"
#include "core/dispatcher.h"
#include "core/result.h"
#include "core/run.h"
#include "core/run_queue.h"
#include "core/runner_registry.h"
#include "infra/http_client.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace runq::infra {

struct ApiError {
  int http_status = 0;  // 0 when the request never got a response
  std::string code;     // "not_found", "conflict", "network", ...
  bool retryable = false;
  std::string message;
  std::string trace_id;
};

/// Reply to a runner registration.
struct RunnerLease {
  std::string runner_id;
  std::chrono::seconds poll_timeout{30};
  std::chrono::seconds heartbeat_interval{60};
};

struct StopAck {
  std::string run_id;
  std::string status;
  bool delivered = false;
};

struct SessionReply {
  std::string session_name;
  std::string status; // "idle" | "busy"
  std::optional<std::string> parent_session_name;
  std::size_t pending_notifications = 0;
};

/// Caller and runner side of the coordinator HTTP API.
class ICoordinatorClient {
public:
  virtual ~ICoordinatorClient() = default;

  // ---- Callers ----
  virtual core::Result<std::string, ApiError>
  submit(const core::SubmitRequest &request) = 0;
  virtual core::Result<core::RunRecord, ApiError>
  get_run(const std::string &run_id) = 0;
  virtual core::Result<std::vector<core::RunRecord>, ApiError>
  list_runs(std::optional<core::RunStatus> status) = 0;
  virtual core::Result<StopAck, ApiError>
  stop_run(const std::string &run_id) = 0;
  virtual core::Result<SessionReply, ApiError>
  get_session(const std::string &name) = 0;
  virtual core::Result<std::size_t, ApiError>
  delete_session(const std::string &name) = 0;

  // ---- Runners ----
  virtual core::Result<RunnerLease, ApiError>
  register_runner(const core::RunnerRegistration &registration) = 0;
  virtual core::Result<void, ApiError>
  heartbeat(const std::string &runner_id) = 0;
  virtual core::Result<core::PollResponse, ApiError>
  poll(const std::string &runner_id, std::chrono::seconds max_wait,
       std::shared_ptr<core::CancelToken> cancel_token = nullptr) = 0;
  virtual core::Result<void, ApiError>
  report_started(const std::string &run_id, const std::string &runner_id) = 0;
  virtual core::Result<void, ApiError>
  report_completed(const std::string &run_id, const std::string &runner_id,
                   const std::optional<std::string> &result) = 0;
  virtual core::Result<void, ApiError>
  report_failed(const std::string &run_id, const std::string &runner_id,
                const std::string &error) = 0;
  virtual core::Result<void, ApiError>
  report_stopped(const std::string &run_id, const std::string &runner_id) = 0;
  virtual core::Result<void, ApiError>
  deregister(const std::string &runner_id) = 0;

  virtual core::Result<void, ApiError> health() = 0;
};

/// HTTP implementation over any IHttpClient (CurlHttpClient, optionally
/// wrapped in RetryableHttpClient).
class HttpCoordinatorClient final : public ICoordinatorClient {
public:
  HttpCoordinatorClient(std::shared_ptr<IHttpClient> http_client,
                        std::string base_url,
                        std::chrono::milliseconds request_timeout =
                            std::chrono::milliseconds(10000));

  core::Result<std::string, ApiError>
  submit(const core::SubmitRequest &request) override;
  core::Result<core::RunRecord, ApiError>
  get_run(const std::string &run_id) override;
  core::Result<std::vector<core::RunRecord>, ApiError>
  list_runs(std::optional<core::RunStatus> status) override;
  core::Result<StopAck, ApiError> stop_run(const std::string &run_id) override;
  core::Result<SessionReply, ApiError>
  get_session(const std::string &name) override;
  core::Result<std::size_t, ApiError>
  delete_session(const std::string &name) override;

  core::Result<RunnerLease, ApiError>
  register_runner(const core::RunnerRegistration &registration) override;
  core::Result<void, ApiError> heartbeat(const std::string &runner_id) override;
  core::Result<core::PollResponse, ApiError>
  poll(const std::string &runner_id, std::chrono::seconds max_wait,
       std::shared_ptr<core::CancelToken> cancel_token = nullptr) override;
  core::Result<void, ApiError>
  report_started(const std::string &run_id,
                 const std::string &runner_id) override;
  core::Result<void, ApiError>
  report_completed(const std::string &run_id, const std::string &runner_id,
                   const std::optional<std::string> &result) override;
  core::Result<void, ApiError> report_failed(const std::string &run_id,
                                             const std::string &runner_id,
                                             const std::string &error) override;
  core::Result<void, ApiError>
  report_stopped(const std::string &run_id,
                 const std::string &runner_id) override;
  core::Result<void, ApiError> deregister(const std::string &runner_id) override;

  core::Result<void, ApiError> health() override;

private:
  std::shared_ptr<IHttpClient> http_client_;
  std::string base_url_;
  std::chrono::milliseconds request_timeout_;

  core::Result<void, ApiError> ensure_http_client() const;
  std::string join_url(const std::string &path) const;

  /// Send and hand back the raw response; transport and 4xx/5xx failures
  /// come back as ApiError.
  core::Result<HttpResponse, ApiError>
  send(HttpMethod method, const std::string &path, const std::string &body,
       const std::string &trace_id,
       std::chrono::milliseconds timeout,
       std::shared_ptr<core::CancelToken> cancel_token = nullptr);

  core::Result<void, ApiError> post_ack(const std::string &path,
                                        const std::string &body,
                                        const std::string &trace_id);
};

/// Map a transport error to ApiError, reading the server's
/// {"error","message"} body when there is one.
ApiError to_api_error(const core::DispatchError &error,
                      const std::string &trace_id);

} // namespace runq::infra
