#include "infra/coordinator_api.h"

#include "infra/json_codec.h"

#include <charconv>
#include <chrono>
#include <utility>

namespace runq::infra {

namespace {

using core::DispatchError;

constexpr const char* kComponent = "coordinator_api";

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos < path.size()) {
        const auto slash = path.find('/', pos);
        const auto end = slash == std::string::npos ? path.size() : slash;
        if (end > pos) {
            out.push_back(path.substr(pos, end - pos));
        }
        pos = end + 1;
    }
    return out;
}

ServerResponse json_reply(int status, const json& body) {
    ServerResponse response;
    response.status = status;
    response.body = body.dump();
    return response;
}

ServerResponse no_content() {
    ServerResponse response;
    response.status = 204;
    return response;
}

ServerResponse ok_reply() { return json_reply(200, json{{"ok", true}}); }

ServerResponse method_not_allowed(const ServerRequest& request) {
    return json_reply(405, json{{"error", "method_not_allowed"},
                                {"message", request.method + " not allowed on " + request.path}});
}

ServerResponse route_not_found(const ServerRequest& request) {
    return json_reply(404, json{{"error", "not_found"}, {"message", "No route for " + request.path}});
}

} // namespace

int http_status_for(core::ErrorCategory category) {
    switch (category) {
        case core::ErrorCategory::Validation:
            return 400;
        case core::ErrorCategory::NotFound:
            return 404;
        case core::ErrorCategory::Conflict:
            return 409;
        default:
            return 500;
    }
}

CoordinatorApi::CoordinatorApi(core::Coordinator& coordinator,
                               std::shared_ptr<core::ILogger> logger)
    : coordinator_(coordinator), logger_(std::move(logger)) {}

HttpServer::Handler CoordinatorApi::handler() {
    return [this](const ServerRequest& request) { return handle(request); };
}

ServerResponse CoordinatorApi::error_response(const DispatchError& error) {
    return json_reply(http_status_for(error.category), error_to_json(error));
}

ServerResponse CoordinatorApi::handle(const ServerRequest& request) {
    ServerResponse response = route(request, split_path(request.path));
    if (response.status >= 500 && logger_) {
        logger_->error("http", kComponent, "request_failed",
                       request.method + " " + request.path + " -> " +
                           std::to_string(response.status) + " " + response.body);
    } else if (response.status >= 400 && logger_) {
        logger_->warn("http", kComponent, "request_rejected",
                      request.method + " " + request.path + " -> " +
                          std::to_string(response.status) + " " + response.body);
    }
    return response;
}

ServerResponse CoordinatorApi::route(const ServerRequest& request, const Segments& path) {
    const std::string& method = request.method;
    const std::size_t n = path.size();

    if (n == 1 && path[0] == "health") {
        if (method != "GET") return method_not_allowed(request);
        return json_reply(200, json{{"status", "ok"}});
    }

    if (n >= 1 && path[0] == "runs") {
        if (n == 1) {
            if (method == "POST") return submit_run(request);
            if (method == "GET") return list_runs(request);
            return method_not_allowed(request);
        }
        if (n == 2) {
            if (method != "GET") return method_not_allowed(request);
            return get_run(path[1]);
        }
        if (n == 3 && path[2] == "stop") {
            if (method != "POST") return method_not_allowed(request);
            return stop_run(path[1]);
        }
        return route_not_found(request);
    }

    if (n >= 2 && path[0] == "runner") {
        if (n == 2 && path[1] == "register") {
            if (method != "POST") return method_not_allowed(request);
            return register_runner(request);
        }
        if (n == 2 && path[1] == "heartbeat") {
            if (method != "POST") return method_not_allowed(request);
            return heartbeat(request);
        }
        if (n == 2 && path[1] == "deregister") {
            if (method != "POST") return method_not_allowed(request);
            return deregister(request);
        }
        if (n == 2 && path[1] == "runs") {
            if (method != "GET") return method_not_allowed(request);
            return poll(request);
        }
        if (n == 4 && path[1] == "runs") {
            const std::string& action = path[3];
            if (action != "started" && action != "completed" && action != "failed" &&
                action != "stopped") {
                return route_not_found(request);
            }
            if (method != "POST") return method_not_allowed(request);
            return report(request, path[2], action);
        }
        return route_not_found(request);
    }

    if (n == 1 && path[0] == "runners") {
        if (method != "GET") return method_not_allowed(request);
        return list_runners();
    }

    if (n == 2 && path[0] == "sessions") {
        if (method == "GET") return get_session(path[1]);
        if (method == "DELETE") return delete_session(path[1]);
        return method_not_allowed(request);
    }

    return route_not_found(request);
}

// ---- Runs ----

ServerResponse CoordinatorApi::submit_run(const ServerRequest& request) {
    auto body = parse_object(request.body);
    if (body.is_err()) {
        return error_response(body.error());
    }
    auto submit = submit_request_from_json(body.value());
    if (submit.is_err()) {
        return error_response(submit.error());
    }
    auto run_id = coordinator_.submit(std::move(submit).value());
    if (run_id.is_err()) {
        return error_response(run_id.error());
    }
    return json_reply(201, json{{"run_id", run_id.value()}, {"status", "pending"}});
}

ServerResponse CoordinatorApi::list_runs(const ServerRequest& request) {
    std::optional<core::RunStatus> filter;
    const auto it = request.query.find("status");
    if (it != request.query.end() && !it->second.empty()) {
        filter = core::parse_run_status(it->second);
        if (!filter.has_value()) {
            return error_response(DispatchError::Validation("Unknown status: " + it->second));
        }
    }

    json runs = json::array();
    for (const auto& run : coordinator_.list_runs(filter)) {
        runs.push_back(run_to_json(run));
    }
    return json_reply(200, json{{"runs", std::move(runs)}});
}

ServerResponse CoordinatorApi::get_run(const std::string& run_id) {
    auto run = coordinator_.get_run(run_id);
    if (run.is_err()) {
        return error_response(run.error());
    }
    return json_reply(200, run_to_json(run.value()));
}

ServerResponse CoordinatorApi::stop_run(const std::string& run_id) {
    auto outcome = coordinator_.stop_run(run_id);
    if (outcome.is_err()) {
        return error_response(outcome.error());
    }
    const auto& stopped = outcome.value();
    return json_reply(200, json{{"run_id", stopped.run.run_id},
                                {"status", core::to_string(stopped.run.status)},
                                {"delivered", stopped.delivered}});
}

// ---- Runners ----

ServerResponse CoordinatorApi::register_runner(const ServerRequest& request) {
    auto body = parse_object(request.body);
    if (body.is_err()) {
        return error_response(body.error());
    }
    auto registration = registration_from_json(body.value());
    if (registration.is_err()) {
        return error_response(registration.error());
    }

    const auto runner_id = coordinator_.register_runner(std::move(registration).value());
    const auto& config = coordinator_.config();
    const auto poll_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(config.poll.default_wait).count();
    const auto heartbeat_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(config.heartbeat.interval_hint).count();
    return json_reply(200, json{{"runner_id", runner_id},
                                {"poll_timeout_seconds", poll_seconds},
                                {"heartbeat_interval_seconds", heartbeat_seconds}});
}

ServerResponse CoordinatorApi::heartbeat(const ServerRequest& request) {
    auto body = parse_object(request.body);
    if (body.is_err()) {
        return error_response(body.error());
    }
    auto runner_id = required_string(body.value(), "runner_id");
    if (runner_id.is_err()) {
        return error_response(runner_id.error());
    }
    auto beat = coordinator_.heartbeat(runner_id.value());
    if (beat.is_err()) {
        return error_response(beat.error());
    }
    return ok_reply();
}

ServerResponse CoordinatorApi::poll(const ServerRequest& request) {
    const auto runner_it = request.query.find("runner_id");
    if (runner_it == request.query.end() || runner_it->second.empty()) {
        return error_response(DispatchError::Validation("runner_id is required"));
    }

    std::optional<std::chrono::milliseconds> max_wait;
    const auto wait_it = request.query.find("max_wait");
    if (wait_it != request.query.end() && !wait_it->second.empty()) {
        const std::string& text = wait_it->second;
        long seconds = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
        if (ec != std::errc() || ptr != text.data() + text.size() || seconds < 0) {
            return error_response(
                DispatchError::Validation("max_wait must be a non-negative number of seconds"));
        }
        // Clamp before converting; huge values would overflow milliseconds.
        const auto limit = coordinator_.config().poll.max_wait;
        if (seconds > std::chrono::duration_cast<std::chrono::seconds>(limit).count()) {
            max_wait = limit;
        } else {
            max_wait = std::chrono::seconds(seconds);
        }
    }

    auto polled = coordinator_.poll(runner_it->second, max_wait);
    if (polled.is_err()) {
        return error_response(polled.error());
    }

    const auto& response = polled.value();
    switch (response.kind) {
        case core::PollResponse::Kind::Run:
            return json_reply(200, json{{"run", run_to_json(*response.run)}});
        case core::PollResponse::Kind::StopRuns:
            return json_reply(200, json{{"stop_runs", response.stop_runs}});
        case core::PollResponse::Kind::Deregistered:
            return json_reply(200, json{{"deregistered", true}});
        case core::PollResponse::Kind::Empty:
            break;
    }
    return no_content();
}

ServerResponse CoordinatorApi::report(const ServerRequest& request, const std::string& run_id,
                                      const std::string& action) {
    auto body = parse_object(request.body);
    if (body.is_err()) {
        return error_response(body.error());
    }
    auto runner_id = required_string(body.value(), "runner_id");
    if (runner_id.is_err()) {
        return error_response(runner_id.error());
    }

    using Reported = core::Result<core::RunRecord, DispatchError>;
    auto reported = [&]() -> Reported {
        if (action == "started") {
            return coordinator_.report_started(run_id, runner_id.value());
        }
        if (action == "completed") {
            auto result = optional_string(body.value(), "result");
            if (result.is_err()) {
                return Reported::Err(result.error());
            }
            return coordinator_.report_completed(run_id, runner_id.value(), result.value());
        }
        if (action == "failed") {
            auto error = optional_string(body.value(), "error");
            if (error.is_err()) {
                return Reported::Err(error.error());
            }
            return coordinator_.report_failed(run_id, runner_id.value(),
                                              error.value().value_or(""));
        }
        return coordinator_.report_stopped(run_id, runner_id.value());
    }();

    if (reported.is_err()) {
        return error_response(reported.error());
    }
    return ok_reply();
}

ServerResponse CoordinatorApi::deregister(const ServerRequest& request) {
    auto body = parse_object(request.body);
    if (body.is_err()) {
        return error_response(body.error());
    }
    auto runner_id = required_string(body.value(), "runner_id");
    if (runner_id.is_err()) {
        return error_response(runner_id.error());
    }
    auto marked = coordinator_.deregister(runner_id.value());
    if (marked.is_err()) {
        return error_response(marked.error());
    }
    return ok_reply();
}

ServerResponse CoordinatorApi::list_runners() {
    json runners = json::array();
    for (const auto& runner : coordinator_.list_runners()) {
        runners.push_back(runner_to_json(runner));
    }
    return json_reply(200, json{{"runners", std::move(runners)}});
}

// ---- Sessions ----

ServerResponse CoordinatorApi::get_session(const std::string& name) {
    auto session = coordinator_.session(name);
    if (session.is_err()) {
        return error_response(session.error());
    }
    return json_reply(200, session_to_json(session.value()));
}

ServerResponse CoordinatorApi::delete_session(const std::string& name) {
    auto cleared = coordinator_.delete_session(name);
    if (cleared.is_err()) {
        return error_response(cleared.error());
    }
    return json_reply(200, json{{"ok", true}, {"cleared_notifications", cleared.value()}});
}

} // namespace runq::infra
