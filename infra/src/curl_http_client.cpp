#include "infra/curl_http_client.h"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <chrono>

namespace runq::infra {

namespace {
    // One-time libcurl global init.
    struct CurlGlobalInit {
        CurlGlobalInit() { curl_global_init(CURL_GLOBAL_ALL); }
        ~CurlGlobalInit() { curl_global_cleanup(); }
    };
    CurlGlobalInit g_curl_init;

    struct EasyDeleter {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };
    struct SlistDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    std::string trim(const std::string& text) {
        const auto begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return {};
        }
        const auto end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    std::string lowercase(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    core::DispatchError status_error(HttpErrorCode code, const std::string& user_message,
                                     long http_code, const std::string& body, bool retryable) {
        auto err = make_http_error(code, user_message,
                                   "HTTP " + std::to_string(http_code) + " response", retryable);
        err.details["http_status"] = std::to_string(http_code);
        err.details["response_body"] = body;
        return err;
    }

    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                          curl_off_t ultotal, curl_off_t ulnow) {
        (void)dltotal; (void)dlnow; (void)ultotal; (void)ulnow;

        auto* cancel_token = static_cast<core::CancelToken*>(clientp);
        if (cancel_token && cancel_token->is_canceled()) {
            return 1;
        }
        return 0;
    }
}

CurlHttpClient::CurlHttpClient() = default;

CurlHttpClient::~CurlHttpClient() = default;

std::size_t CurlHttpClient::write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    const std::size_t total_size = size * nmemb;
    buffer->append(ptr, total_size);
    return total_size;
}

std::size_t CurlHttpClient::header_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    const std::size_t total_size = size * nitems;
    const std::string line(ptr, total_size);
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        (*headers)[lowercase(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return total_size;
}

HttpErrorCode CurlHttpClient::classify_curl_error(int curl_code) const {
    switch (curl_code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return HttpErrorCode::NETWORK_ERROR;

        case CURLE_OPERATION_TIMEDOUT:
            return HttpErrorCode::TIMEOUT;

        case CURLE_ABORTED_BY_CALLBACK:
            return HttpErrorCode::CANCELED;

        default:
            return HttpErrorCode::UNKNOWN;
    }
}

core::Result<HttpResponse, core::DispatchError> CurlHttpClient::execute(
    const HttpRequest& request,
    std::shared_ptr<core::CancelToken> cancel_token
) {
    using Result = core::Result<HttpResponse, core::DispatchError>;

    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl) {
        return Result::Err(make_http_error(HttpErrorCode::UNKNOWN, "Request failed.",
                                           "curl_easy_init returned null", false));
    }

    // cancel(request_id) needs a token to flip.
    if (!cancel_token && !request.request_id.empty()) {
        cancel_token = core::CancelToken::create();
    }
    if (!request.request_id.empty()) {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_requests_[request.request_id] = cancel_token;
    }
    struct InFlightGuard {
        CurlHttpClient* self;
        const std::string& request_id;
        ~InFlightGuard() {
            if (!request_id.empty()) {
                std::lock_guard<std::mutex> lock(self->in_flight_mutex_);
                self->in_flight_requests_.erase(request_id);
            }
        }
    } in_flight_guard{this, request.request_id};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const long timeout_ms = static_cast<long>(request.timeout.count());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_ms, 10000L));

    switch (request.method) {
        case HttpMethod::POST:
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            break;
        case HttpMethod::PUT:
        case HttpMethod::DELETE:
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, to_string(request.method));
            if (!request.body.empty()) {
                curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            }
            break;
        case HttpMethod::GET:
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
            break;
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        const std::string header = key + ": " + value;
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    std::string response_buffer;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &CurlHttpClient::write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);

    std::map<std::string, std::string> response_headers;
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &CurlHttpClient::header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);

    if (cancel_token) {
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progress_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, cancel_token.get());
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    }

    const auto start_time = std::chrono::steady_clock::now();
    const CURLcode res = curl_easy_perform(curl.get());
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (res != CURLE_OK) {
        const HttpErrorCode error_code = classify_curl_error(res);

        std::string user_message;
        switch (error_code) {
            case HttpErrorCode::NETWORK_ERROR:
                user_message = "Coordinator unreachable.";
                break;
            case HttpErrorCode::TIMEOUT:
                user_message = "Request timed out.";
                break;
            case HttpErrorCode::CANCELED:
                user_message = "Request was canceled.";
                break;
            default:
                user_message = "Unknown transport error.";
                break;
        }

        const std::string internal_message = std::string("CURL error: ") + curl_easy_strerror(res) +
                                             " (code: " + std::to_string(res) + ")";
        auto err = make_http_error(error_code, user_message, internal_message,
                                   error_code != HttpErrorCode::CANCELED);
        err.details["elapsed_ms"] = std::to_string(elapsed_ms.count());
        return Result::Err(std::move(err));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code >= 500) {
        return Result::Err(status_error(HttpErrorCode::SERVER_ERROR, "Coordinator error.",
                                        http_code, response_buffer, true));
    } else if (http_code == 429) {
        return Result::Err(status_error(HttpErrorCode::RATE_LIMIT, "Too many requests.",
                                        http_code, response_buffer, true));
    } else if (http_code >= 400) {
        return Result::Err(status_error(HttpErrorCode::CLIENT_ERROR, "Request rejected.",
                                        http_code, response_buffer, false));
    }

    HttpResponse response;
    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_buffer);
    response.headers = std::move(response_headers);
    const auto request_id_it = response.headers.find("x-request-id");
    response.request_id = request_id_it != response.headers.end() ? request_id_it->second
                                                                   : request.request_id;
    response.elapsed_ms = elapsed_ms;
    return Result::Ok(std::move(response));
}

bool CurlHttpClient::cancel(const std::string& request_id) {
    std::shared_ptr<core::CancelToken> token;
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        auto it = in_flight_requests_.find(request_id);
        if (it == in_flight_requests_.end()) {
            return false;
        }
        token = it->second.lock();
    }
    if (!token) {
        return false;
    }
    token->request_cancel();
    return true;
}

} // namespace runq::infra
