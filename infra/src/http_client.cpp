#include "infra/http_client.h"

#include <algorithm>
#include <charconv>
#include <thread>

namespace runq::infra {

const char *to_string(HttpMethod method) {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  case HttpMethod::PUT:
    return "PUT";
  case HttpMethod::DELETE:
    return "DELETE";
  }
  return "GET";
}

HttpErrorCode http_error_code_of(const core::DispatchError &error) {
  const auto it = error.details.find("http_error_code");
  if (it == error.details.end()) {
    return HttpErrorCode::UNKNOWN;
  }

  int parsed = 0;
  const std::string &value = it->second;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return HttpErrorCode::UNKNOWN;
  }
  return static_cast<HttpErrorCode>(parsed);
}

core::DispatchError make_http_error(HttpErrorCode code,
                                    const std::string &user_message,
                                    const std::string &internal_message,
                                    bool retryable) {
  core::ErrorCategory category = core::ErrorCategory::Unknown;
  switch (code) {
  case HttpErrorCode::NETWORK_ERROR:
  case HttpErrorCode::SERVER_ERROR:
  case HttpErrorCode::RATE_LIMIT:
    category = core::ErrorCategory::Network;
    break;
  case HttpErrorCode::TIMEOUT:
    category = core::ErrorCategory::Timeout;
    break;
  case HttpErrorCode::CANCELED:
    category = core::ErrorCategory::Canceled;
    break;
  case HttpErrorCode::CLIENT_ERROR:
    category = core::ErrorCategory::Validation;
    break;
  case HttpErrorCode::PARSE_ERROR:
    category = core::ErrorCategory::Internal;
    break;
  case HttpErrorCode::UNKNOWN:
    category = core::ErrorCategory::Unknown;
    break;
  }

  core::DispatchError err(
      category, static_cast<int>(code), user_message,
      {{"http_error_code", std::to_string(static_cast<int>(code))},
       {"internal_message", internal_message}});
  err.retryable = retryable;
  return err;
}

RetryableHttpClient::RetryableHttpClient(std::shared_ptr<IHttpClient> inner,
                                         RetryPolicy policy,
                                         std::shared_ptr<core::ILogger> logger)
    : inner_(std::move(inner)), policy_(std::move(policy)),
      logger_(std::move(logger)) {}

core::Result<HttpResponse, core::DispatchError>
RetryableHttpClient::execute(const HttpRequest &request,
                             std::shared_ptr<core::CancelToken> cancel_token) {
  using R = core::Result<HttpResponse, core::DispatchError>;
  int retry_count = 0;
  auto backoff = policy_.initial_backoff;

  auto canceled_error = [&](const std::string &internal) {
    auto err = make_http_error(HttpErrorCode::CANCELED, "Request canceled.",
                               internal, false);
    err.details["retry_count"] = std::to_string(retry_count);
    err.details["request_id"] = request.request_id;
    return R::Err(std::move(err));
  };

  while (true) {
    if (cancel_token && cancel_token->is_canceled()) {
      return canceled_error("Cancellation requested before HTTP call");
    }

    if (!inner_) {
      auto err = make_http_error(HttpErrorCode::UNKNOWN, "Request failed.",
                                 "RetryableHttpClient has null inner client",
                                 false);
      err.details["retry_count"] = std::to_string(retry_count);
      return R::Err(std::move(err));
    }

    auto result = inner_->execute(request, cancel_token);
    if (result.is_ok()) {
      return result;
    }

    auto error = result.error();
    const HttpErrorCode http_code = http_error_code_of(error);
    const bool should_retry = policy_.should_retry(http_code);
    const bool has_attempts_left = retry_count < policy_.max_retries;

    error.details["retry_count"] = std::to_string(retry_count);
    if (!request.request_id.empty()) {
      error.details["request_id"] = request.request_id;
    }
    if (!should_retry || !has_attempts_left) {
      return R::Err(std::move(error));
    }

    if (logger_) {
      logger_->warn(request.trace_id, "http_client", "retry_scheduled",
                    std::string(to_string(request.method)) + " " +
                        request.url +
                        " retry_count=" + std::to_string(retry_count + 1) +
                        " max_retries=" + std::to_string(policy_.max_retries) +
                        " backoff_ms=" + std::to_string(backoff.count()));
    }

    const auto sleep_until = std::chrono::steady_clock::now() + backoff;
    while (std::chrono::steady_clock::now() < sleep_until) {
      if (cancel_token && cancel_token->is_canceled()) {
        return canceled_error("Cancellation requested during retry backoff");
      }
      std::this_thread::sleep_for(policy_.sleep_slice);
    }

    auto next_backoff = std::chrono::duration_cast<std::chrono::milliseconds>(
        backoff * policy_.backoff_multiplier);
    backoff = std::min(next_backoff, policy_.max_backoff);
    retry_count++;
  }
}

bool RetryableHttpClient::cancel(const std::string &request_id) {
  return inner_ ? inner_->cancel(request_id) : false;
}

} // namespace runq::infra
