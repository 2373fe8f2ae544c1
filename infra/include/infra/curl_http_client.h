#pragma once

#include "infra/http_client.h"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace runq::infra {

/// libcurl-backed IHttpClient.
/// One easy handle per call, so concurrent calls (a long poll plus status
/// reports) do not serialize. Supports timeouts, cancellation through
/// CancelToken or cancel(request_id), and error classification.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    core::Result<HttpResponse, core::DispatchError> execute(
        const HttpRequest& request,
        std::shared_ptr<core::CancelToken> cancel_token = nullptr
    ) override;

    bool cancel(const std::string& request_id) override;

private:
    std::mutex in_flight_mutex_;
    std::unordered_map<std::string, std::weak_ptr<core::CancelToken>> in_flight_requests_;

    HttpErrorCode classify_curl_error(int curl_code) const;

    static std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);
    static std::size_t header_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata);
};

} // namespace runq::infra
