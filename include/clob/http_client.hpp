#pragma once

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace clob {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct RequestTimings {
    double connect_ms = 0.0;
    double app_connect_ms = 0.0;
    double start_transfer_ms = 0.0;
    double total_ms = 0.0;
};

struct HttpResponse {
    long status_code;
    std::string body;
    RequestTimings timings;
};

class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message, long status_code = 0, std::string body = {})
        : std::runtime_error(message), status_code_(status_code), body_(std::move(body)) {}

    [[nodiscard]] long status_code() const noexcept { return status_code_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }

private:
    long status_code_;
    std::string body_;
};

struct HttpOptions {
    long timeout_ms = 10000;
    long connect_timeout_ms = 3000;
};

// Blocking transport. One easy handle per request, so a single instance may be
// shared by the worker threads.
class HttpClient {
public:
    explicit HttpClient(HttpOptions options = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept = delete;
    HttpClient& operator=(HttpClient&&) noexcept = delete;

    HttpResponse request(
        const std::string& method,
        const std::string& url,
        const HttpHeaders& headers = {},
        const std::string& body = ""
    ) const;

private:
    RequestTimings collect_timings(CURL* handle) const;

    HttpOptions options_;
    bool global_initialized_;
};

} // namespace clob
