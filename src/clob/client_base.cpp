#include "clob/client_base.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace clob {
namespace {

long long current_timestamp_s() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string hmac_sha256_raw(const std::string& key, const std::string& message) {
    unsigned int len = 0;
    unsigned char buffer[EVP_MAX_MD_SIZE];

    const unsigned char* digest = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        buffer,
        &len);

    if (digest == nullptr) {
        throw std::runtime_error("Failed to create HMAC signature");
    }

    return std::string(reinterpret_cast<const char*>(buffer), len);
}

} // namespace

std::string build_l2_signature(const std::string& api_secret,
                               long long timestamp_s,
                               const std::string& method,
                               const std::string& request_path,
                               const std::string& body) {
    const auto key = base64_decode(api_secret);
    const auto message = std::to_string(timestamp_s) + to_upper_copy(method) + request_path + body;
    return to_base64url(base64_encode(hmac_sha256_raw(key, message)));
}

ClientBase::ClientBase(Credentials credentials, std::string base_url, HttpOptions http_options)
    : credentials_(std::move(credentials)),
      base_url_(std::move(base_url)),
      http_client_(http_options),
      last_timings_{} {}

RequestTimings ClientBase::last_request_timings() const {
    std::lock_guard<std::mutex> lock(request_mutex_);
    return last_timings_;
}

void ClientBase::remember_timings(const HttpResponse& response) const {
    std::lock_guard<std::mutex> lock(request_mutex_);
    last_timings_ = response.timings;
}

HttpResponse ClientBase::public_request(
    const std::string& method,
    const std::string& path,
    const QueryParams& params) const {

    std::string url = base_url_ + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }

    const HttpHeaders headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_client_.request(method, url, headers);
    remember_timings(response);
    return response;
}

HttpResponse ClientBase::signed_request(
    const std::string& method,
    const std::string& path,
    const QueryParams& params,
    const std::string& body) const {

    std::string url = base_url_ + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }

    // The signed path excludes the query string.
    auto response = http_client_.request(method, url, l2_headers(method, path, body), body);
    remember_timings(response);
    return response;
}

HttpResponse ClientBase::signed_request_to(
    const std::string& host,
    const std::string& method,
    const std::string& path,
    const std::string& body) const {

    auto response = http_client_.request(method, host + path, l2_headers(method, path, body), body);
    remember_timings(response);
    return response;
}

HttpHeaders ClientBase::l2_headers(const std::string& method,
                                   const std::string& request_path,
                                   const std::string& body) const {
    if (!credentials_.complete()) {
        throw std::invalid_argument("Address, API key, secret and passphrase are required for signed requests");
    }

    const auto timestamp = current_timestamp_s();
    return {
        {"Content-Type", "application/json"},
        {"POLY_ADDRESS", credentials_.address},
        {"POLY_SIGNATURE", build_l2_signature(credentials_.api_secret, timestamp, method, request_path, body)},
        {"POLY_TIMESTAMP", std::to_string(timestamp)},
        {"POLY_API_KEY", credentials_.api_key},
        {"POLY_PASSPHRASE", credentials_.passphrase}
    };
}

} // namespace clob
