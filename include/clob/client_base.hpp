#pragma once

#include "clob/http_client.hpp"
#include "clob/util.hpp"

#include <openssl/hmac.h>

#include <mutex>
#include <string>

namespace clob {

// Level-2 API credentials issued by the venue for a funded wallet.
struct Credentials {
    std::string address;
    std::string api_key;
    std::string api_secret;   // base64
    std::string passphrase;

    [[nodiscard]] bool complete() const {
        return !address.empty() && !api_key.empty() && !api_secret.empty() && !passphrase.empty();
    }
};

// HMAC-SHA256 over timestamp + method + path + body keyed by the decoded secret,
// rendered as url-safe base64.
std::string build_l2_signature(const std::string& api_secret,
                               long long timestamp_s,
                               const std::string& method,
                               const std::string& request_path,
                               const std::string& body);

class ClientBase {
public:
    explicit ClientBase(Credentials credentials,
                        std::string base_url = "https://clob.polymarket.com",
                        HttpOptions http_options = {});

    [[nodiscard]] RequestTimings last_request_timings() const;
    [[nodiscard]] const std::string& base_url() const { return base_url_; }

protected:
    HttpResponse public_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {}) const;

    HttpResponse signed_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {},
        const std::string& body = "") const;

    // Same authentication, different host (order signing relay).
    HttpResponse signed_request_to(
        const std::string& host,
        const std::string& method,
        const std::string& path,
        const std::string& body) const;

private:
    HttpHeaders l2_headers(const std::string& method,
                           const std::string& request_path,
                           const std::string& body) const;
    void remember_timings(const HttpResponse& response) const;

    Credentials credentials_;
    std::string base_url_;
    HttpClient http_client_;
    mutable RequestTimings last_timings_;
    mutable std::mutex request_mutex_;
};

} // namespace clob
