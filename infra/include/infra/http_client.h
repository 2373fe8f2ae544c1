#pragma once
#include "core/cancel_token.h"
#include "core/dispatch_error.h"
#include "core/logger.h"
#include "core/result.h"
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace runq::infra {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE
};

const char* to_string(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string trace_id;    // run/runner id the call concerns, for logs
    std::string request_id;  // key for cancel(); optional
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;  // lowercase names
    std::string body;
    std::string request_id;  // X-Request-Id echoed by the server, if any
    std::chrono::milliseconds elapsed_ms{0};
};

/// Transport failure classes. Carried in DispatchError::details
/// ["http_error_code"]; 4xx/5xx responses also carry "http_status" and
/// "response_body".
enum class HttpErrorCode {
    NETWORK_ERROR = 1001,  // unreachable, DNS, connection refused
    TIMEOUT = 1002,
    CANCELED = 1003,
    SERVER_ERROR = 1004,   // 5xx
    CLIENT_ERROR = 1005,   // 4xx other than 429
    RATE_LIMIT = 1006,     // 429
    PARSE_ERROR = 1007,    // body not what we expected
    UNKNOWN = 1999
};

core::DispatchError make_http_error(
    HttpErrorCode code,
    const std::string& user_message,
    const std::string& internal_message,
    bool retryable = false
);

/// Read details["http_error_code"] back; UNKNOWN if absent or garbled.
HttpErrorCode http_error_code_of(const core::DispatchError& error);

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual core::Result<HttpResponse, core::DispatchError> get(
        const HttpRequest& request,
        std::shared_ptr<core::CancelToken> cancel_token = nullptr
    ) {
        HttpRequest req = request;
        req.method = HttpMethod::GET;
        return execute(req, std::move(cancel_token));
    }

    virtual core::Result<HttpResponse, core::DispatchError> post(
        const HttpRequest& request,
        std::shared_ptr<core::CancelToken> cancel_token = nullptr
    ) {
        HttpRequest req = request;
        req.method = HttpMethod::POST;
        return execute(req, std::move(cancel_token));
    }

    virtual core::Result<HttpResponse, core::DispatchError> del(
        const HttpRequest& request,
        std::shared_ptr<core::CancelToken> cancel_token = nullptr
    ) {
        HttpRequest req = request;
        req.method = HttpMethod::DELETE;
        return execute(req, std::move(cancel_token));
    }

    /// Abort the in-flight request registered under request_id.
    /// Returns false if nothing matched.
    virtual bool cancel(const std::string& request_id) = 0;

    virtual core::Result<HttpResponse, core::DispatchError> execute(
        const HttpRequest& request,
        std::shared_ptr<core::CancelToken> cancel_token = nullptr
    ) = 0;
};

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds initial_backoff{1000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{30000};
    std::chrono::milliseconds sleep_slice{50};  // cancel check granularity

    bool should_retry(HttpErrorCode code) const {
        return code == HttpErrorCode::NETWORK_ERROR ||
               code == HttpErrorCode::TIMEOUT ||
               code == HttpErrorCode::SERVER_ERROR ||
               code == HttpErrorCode::RATE_LIMIT;
    }
};

/// Decorator retrying transient failures with exponential backoff.
class RetryableHttpClient : public IHttpClient {
public:
    RetryableHttpClient(
        std::shared_ptr<IHttpClient> inner,
        RetryPolicy policy = {},
        std::shared_ptr<core::ILogger> logger = nullptr
    );

    core::Result<HttpResponse, core::DispatchError> execute(
        const HttpRequest& request,
        std::shared_ptr<core::CancelToken> cancel_token = nullptr
    ) override;

    bool cancel(const std::string& request_id) override;

private:
    std::shared_ptr<IHttpClient> inner_;
    RetryPolicy policy_;
    std::shared_ptr<core::ILogger> logger_;
};

} // namespace runq::infra
