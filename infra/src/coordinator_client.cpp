#include "infra/coordinator_client.h"

#include "infra/http_server.h"
#include "infra/json_codec.h"

#include <cstdlib>
#include <utility>

namespace runq::infra {

namespace {

ApiError parse_error(const std::string &message, const std::string &trace_id) {
  return ApiError{0, "parse_error", false, message, trace_id};
}

/// Parse a 200 body as a JSON object.
core::Result<json, ApiError> parse_body(const HttpResponse &response,
                                        const std::string &trace_id) {
  json parsed = json::parse(response.body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return core::Result<json, ApiError>::Err(
        parse_error("Response is not a JSON object", trace_id));
  }
  return core::Result<json, ApiError>::Ok(std::move(parsed));
}

} // namespace

ApiError to_api_error(const core::DispatchError &error,
                      const std::string &trace_id) {
  ApiError api;
  api.code = core::to_string(error.category);
  api.retryable = error.retryable;
  api.message = error.message;
  api.trace_id = trace_id;

  const auto status_it = error.details.find("http_status");
  if (status_it != error.details.end()) {
    api.http_status = std::atoi(status_it->second.c_str());
  }

  const auto body_it = error.details.find("response_body");
  if (body_it != error.details.end()) {
    json body = json::parse(body_it->second, nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
      if (body.contains("error") && body["error"].is_string()) {
        api.code = body["error"].get<std::string>();
      }
      if (body.contains("message") && body["message"].is_string()) {
        api.message = body["message"].get<std::string>();
      }
    }
  }
  return api;
}

HttpCoordinatorClient::HttpCoordinatorClient(
    std::shared_ptr<IHttpClient> http_client, std::string base_url,
    std::chrono::milliseconds request_timeout)
    : http_client_(std::move(http_client)), base_url_(std::move(base_url)),
      request_timeout_(request_timeout) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

core::Result<void, ApiError> HttpCoordinatorClient::ensure_http_client() const {
  if (!http_client_) {
    return core::Result<void, ApiError>::Err(
        ApiError{0, "client_not_ready", false, "HTTP client is null", ""});
  }
  return core::Result<void, ApiError>::Ok();
}

std::string HttpCoordinatorClient::join_url(const std::string &path) const {
  if (base_url_.empty()) {
    return path;
  }
  if (!path.empty() && path.front() == '/') {
    return base_url_ + path;
  }
  return base_url_ + "/" + path;
}

core::Result<HttpResponse, ApiError> HttpCoordinatorClient::send(
    HttpMethod method, const std::string &path, const std::string &body,
    const std::string &trace_id, std::chrono::milliseconds timeout,
    std::shared_ptr<core::CancelToken> cancel_token) {
  using R = core::Result<HttpResponse, ApiError>;
  auto ready = ensure_http_client();
  if (ready.is_err()) {
    return R::Err(ready.error());
  }

  HttpRequest request;
  request.method = method;
  request.url = join_url(path);
  request.body = body;
  request.trace_id = trace_id;
  request.timeout = timeout;
  request.headers["Accept"] = "application/json";
  if (!body.empty()) {
    request.headers["Content-Type"] = "application/json";
  }

  auto response = http_client_->execute(request, std::move(cancel_token));
  if (response.is_err()) {
    return R::Err(to_api_error(response.error(), trace_id));
  }
  return R::Ok(std::move(response).value());
}

core::Result<void, ApiError>
HttpCoordinatorClient::post_ack(const std::string &path,
                                const std::string &body,
                                const std::string &trace_id) {
  auto response =
      send(HttpMethod::POST, path, body, trace_id, request_timeout_);
  if (response.is_err()) {
    return core::Result<void, ApiError>::Err(response.error());
  }
  return core::Result<void, ApiError>::Ok();
}

// ---- Callers ----

core::Result<std::string, ApiError>
HttpCoordinatorClient::submit(const core::SubmitRequest &request) {
  using R = core::Result<std::string, ApiError>;
  json body;
  body["session_name"] = request.session_name;
  body["kind"] = core::to_string(request.kind);
  body["payload"] = request.payload;
  if (request.parent_session_name.has_value()) {
    body["parent_session_name"] = *request.parent_session_name;
  }
  if (request.demand.has_value()) {
    body["demand"] = demand_to_json(request.demand);
  }

  auto response = send(HttpMethod::POST, "/runs", body.dump(),
                       request.session_name, request_timeout_);
  if (response.is_err()) {
    return R::Err(response.error());
  }
  auto parsed = parse_body(response.value(), request.session_name);
  if (parsed.is_err()) {
    return R::Err(parsed.error());
  }
  const auto &reply = parsed.value();
  if (!reply.contains("run_id") || !reply["run_id"].is_string()) {
    return R::Err(parse_error("Missing run_id", request.session_name));
  }
  return R::Ok(reply["run_id"].get<std::string>());
}

core::Result<core::RunRecord, ApiError>
HttpCoordinatorClient::get_run(const std::string &run_id) {
  using R = core::Result<core::RunRecord, ApiError>;
  auto response = send(HttpMethod::GET, "/runs/" + url_encode(run_id), "",
                       run_id, request_timeout_);
  if (response.is_err()) {
    return R::Err(response.error());
  }
  auto parsed = parse_body(response.value(), run_id);
  if (parsed.is_err()) {
    return R::Err(parsed.error());
  }
  auto run = run_from_json(parsed.value());
  if (run.is_err()) {
    return R::Err(parse_error(run.error().message, run_id));
  }
  return R::Ok(std::move(run).value());
}

core::Result<std::vector<core::RunRecord>, ApiError>
HttpCoordinatorClient::list_runs(std::optional<core::RunStatus> status) {
  using R = core::Result<std::vector<core::RunRecord>, ApiError>;
  std::string path = "/runs";
  if (status.has_value()) {
    path += std::string("?status=") + core::to_string(*status);
  }
  auto response = send(HttpMethod::GET, path, "", "runs", request_timeout_);
  if (response.is_err()) {
    return R::Err(response.error());
  }
  auto parsed = parse_body(response.value(), "runs");
  if (parsed.is_err()) {
    return R::Err(parsed.error());
  }
  const auto &reply = parsed.value();
  if (!reply.contains("runs") || !reply["runs"].is_array()) {
    return R::Err(parse_error("Missing runs array", "runs"));
  }
  std::vector<core::RunRecord> runs;
  for (const auto &item : reply["runs"]) {
    auto run = run_from_json(item);
    if (run.is_err()) {
      return R::Err(parse_error(run.error().message, "runs"));
    }
    runs.push_back(std::move(run).value());
  }
  return R::Ok(std::move(runs));
}

core::Result<StopAck, ApiError>
HttpCoordinatorClient::stop_run(const std::string &run_id) {
  using R = core::Result<StopAck, ApiError>;
  auto response = send(HttpMethod::POST, "/runs/" + url_encode(run_id) + "/stop",
                       "", run_id, request_timeout_);
  if (response.is_err()) {
    return R::Err(response.error());
  }
  auto parsed = parse_body(response.value(), run_id);
  if (parsed.is_err()) {
    return R::Err(parsed.error());
  }
  const auto &reply = parsed.value();
  StopAck ack;
  ack.run_id = reply.value("run_id", run_id);
  ack.status = reply.value("status", "");
  ack.delivered = reply.value("delivered", false);
  return R::Ok(std::move(ack));
}

core::Result<SessionReply, ApiError>
HttpCoordinatorClient::get_session(const std::string &name) {
  using R = core::Result<SessionReply, ApiError>;
  auto response = send(HttpMethod::GET, "/sessions/" + url_encode(name), "",
                       name, request_timeout_);
  if (response.is_err()) {
    return R::Err(response.error());
  }
  auto parsed = parse_body(response.value(), name);
  if (parsed.is_err()) {
    return R::Err(parsed.error());
  }
  const auto &reply = parsed.value();
  SessionReply session;
  session.session_name = reply.value("session_name", name);
  session.status = reply.value("status", "");
  if (reply.contains("parent_session_name") &&
      reply["parent_session_name"].is_string()) {
    session.parent_session_name =
        reply["parent_session_name"].get<std::string>();
  }
  session.pending_notifications =
      reply.value("pending_notifications", static_cast<std::size_t>(0));
  return R::Ok(std::move(session));
}

core::Result<std::size_t, ApiError>
HttpCoordinatorClient::delete_session(const std::string &name) {
  using R = core::Result<std::size_t, ApiError>;
  auto response = send(HttpMethod::DELETE, "/sessions/" + url_encode(name), "",
                       name, request_timeout_);
  if (response.is_err()) {
    return R::Err(response.error());
  }
  auto parsed = parse_body(response.value(), name);
  if (parsed.is_err()) {
    return R::Err(parsed.error());
  }
  return R::Ok(
      parsed.value().value("cleared_notifications", static_cast<std::size_t>(0)));
}

// ---- Runners ----

core::Result<RunnerLease, ApiError> HttpCoordinatorClient::register_runner(
    const core::RunnerRegistration &registration) {
  using R = core::Result<RunnerLease, ApiError>;
  const auto &caps = registration.capabilities;
  json body;
  body["tags"] = caps.tags;
  body["strict_tags"] = caps.strict_tags;
  if (caps.profile.has_value()) {
    body["profile"] = *caps.profile;
  }
  if (registration.hostname.has_value()) {
    body["hostname"] = *registration.hostname;
  }

  auto response = send(HttpMethod::POST, "/runner/register", body.dump(),
                       registration.hostname.value_or("runner"),
                       request_timeout_);
  if (response.is_err()) {
    return R::Err(response.error());
  }
  auto parsed = parse_body(response.value(), "runner");
  if (parsed.is_err()) {
    return R::Err(parsed.error());
  }
  const auto &reply = parsed.value();
  if (!reply.contains("runner_id") || !reply["runner_id"].is_string()) {
    return R::Err(parse_error("Missing runner_id", "runner"));
  }
  RunnerLease lease;
  lease.runner_id = reply["runner_id"].get<std::string>();
  lease.poll_timeout =
      std::chrono::seconds(reply.value("poll_timeout_seconds", 30));
  lease.heartbeat_interval =
      std::chrono::seconds(reply.value("heartbeat_interval_seconds", 60));
  return R::Ok(std::move(lease));
}

core::Result<void, ApiError>
HttpCoordinatorClient::heartbeat(const std::string &runner_id) {
  return post_ack("/runner/heartbeat", json{{"runner_id", runner_id}}.dump(),
                  runner_id);
}

core::Result<core::PollResponse, ApiError>
HttpCoordinatorClient::poll(const std::string &runner_id,
                            std::chrono::seconds max_wait,
                            std::shared_ptr<core::CancelToken> cancel_token) {
  using R = core::Result<core::PollResponse, ApiError>;
  const std::string path = "/runner/runs?runner_id=" + url_encode(runner_id) +
                           "&max_wait=" + std::to_string(max_wait.count());
  // The server holds the request up to max_wait; leave room on top.
  const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
                           max_wait) +
                       request_timeout_;

  auto response = send(HttpMethod::GET, path, "", runner_id, timeout,
                       std::move(cancel_token));
  if (response.is_err()) {
    return R::Err(response.error());
  }
  if (response.value().status_code == 204) {
    return R::Ok(core::PollResponse::empty());
  }

  auto parsed = parse_body(response.value(), runner_id);
  if (parsed.is_err()) {
    return R::Err(parsed.error());
  }
  const auto &reply = parsed.value();
  if (reply.value("deregistered", false)) {
    return R::Ok(core::PollResponse::deregistered());
  }
  if (reply.contains("stop_runs") && reply["stop_runs"].is_array()) {
    std::vector<std::string> run_ids;
    for (const auto &id : reply["stop_runs"]) {
      if (id.is_string()) {
        run_ids.push_back(id.get<std::string>());
      }
    }
    return R::Ok(core::PollResponse::of_stops(std::move(run_ids)));
  }
  if (reply.contains("run")) {
    auto run = run_from_json(reply["run"]);
    if (run.is_err()) {
      return R::Err(parse_error(run.error().message, runner_id));
    }
    return R::Ok(core::PollResponse::of_run(std::move(run).value()));
  }
  return R::Err(parse_error("Unrecognized poll reply", runner_id));
}

core::Result<void, ApiError>
HttpCoordinatorClient::report_started(const std::string &run_id,
                                      const std::string &runner_id) {
  return post_ack("/runner/runs/" + url_encode(run_id) + "/started",
                  json{{"runner_id", runner_id}}.dump(), run_id);
}

core::Result<void, ApiError> HttpCoordinatorClient::report_completed(
    const std::string &run_id, const std::string &runner_id,
    const std::optional<std::string> &result) {
  json body{{"runner_id", runner_id}};
  if (result.has_value()) {
    body["result"] = *result;
  }
  return post_ack("/runner/runs/" + url_encode(run_id) + "/completed",
                  body.dump(), run_id);
}

core::Result<void, ApiError>
HttpCoordinatorClient::report_failed(const std::string &run_id,
                                     const std::string &runner_id,
                                     const std::string &error) {
  return post_ack("/runner/runs/" + url_encode(run_id) + "/failed",
                  json{{"runner_id", runner_id}, {"error", error}}.dump(),
                  run_id);
}

core::Result<void, ApiError>
HttpCoordinatorClient::report_stopped(const std::string &run_id,
                                      const std::string &runner_id) {
  return post_ack("/runner/runs/" + url_encode(run_id) + "/stopped",
                  json{{"runner_id", runner_id}}.dump(), run_id);
}

core::Result<void, ApiError>
HttpCoordinatorClient::deregister(const std::string &runner_id) {
  return post_ack("/runner/deregister", json{{"runner_id", runner_id}}.dump(),
                  runner_id);
}

core::Result<void, ApiError> HttpCoordinatorClient::health() {
  auto response =
      send(HttpMethod::GET, "/health", "", "health", request_timeout_);
  if (response.is_err()) {
    return core::Result<void, ApiError>::Err(response.error());
  }
  return core::Result<void, ApiError>::Ok();
}

} // namespace runq::infra
