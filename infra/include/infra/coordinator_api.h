#pragma once

#include "core/coordinator.h"
#include "core/dispatch_error.h"
#include "core/logger.h"
#include "infra/http_server.h"

#include <memory>
#include <string>
#include <vector>

namespace runq::infra {

/// HTTP status for an error category: 400, 404, 409 or 500.
int http_status_for(core::ErrorCategory category);

/// Routes HTTP requests onto a Coordinator and renders JSON replies.
///
///   POST   /runs                         submit
///   GET    /runs[?status=]               list
///   GET    /runs/{id}                    get
///   POST   /runs/{id}/stop               stop
///   POST   /runner/register              register
///   POST   /runner/heartbeat             heartbeat
///   GET    /runner/runs?runner_id=&max_wait=   long poll (204 when empty)
///   POST   /runner/runs/{id}/{started|completed|failed|stopped}
///   POST   /runner/deregister            deregister
///   GET    /runners                      list runners
///   GET    /sessions/{name}              session status
///   DELETE /sessions/{name}              delete session
///   GET    /health
class CoordinatorApi {
public:
    CoordinatorApi(core::Coordinator& coordinator, std::shared_ptr<core::ILogger> logger);

    ServerResponse handle(const ServerRequest& request);

    /// Adapter for HttpServer.
    HttpServer::Handler handler();

private:
    using Segments = std::vector<std::string>;

    ServerResponse route(const ServerRequest& request, const Segments& path);

    ServerResponse submit_run(const ServerRequest& request);
    ServerResponse list_runs(const ServerRequest& request);
    ServerResponse get_run(const std::string& run_id);
    ServerResponse stop_run(const std::string& run_id);

    ServerResponse register_runner(const ServerRequest& request);
    ServerResponse heartbeat(const ServerRequest& request);
    ServerResponse poll(const ServerRequest& request);
    ServerResponse report(const ServerRequest& request, const std::string& run_id,
                          const std::string& action);
    ServerResponse deregister(const ServerRequest& request);
    ServerResponse list_runners();

    ServerResponse get_session(const std::string& name);
    ServerResponse delete_session(const std::string& name);

    static ServerResponse error_response(const core::DispatchError& error);

    core::Coordinator& coordinator_;
    std::shared_ptr<core::ILogger> logger_;
};

} // namespace runq::infra
