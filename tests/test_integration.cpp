#include "clob/clob_client.hpp"
#include "mm/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

void load_test_env() {
    static bool loaded = false;
    if (loaded) {
        return;
    }
    const std::filesystem::path source_root = std::filesystem::path(__FILE__).parent_path().parent_path();
    const std::filesystem::path candidates[] = {
        std::filesystem::current_path() / ".env",
        source_root / ".env"
    };
    for (const auto& candidate : candidates) {
        if (std::filesystem::exists(candidate)) {
            mm::load_env_file(candidate.string());
            break;
        }
    }
    loaded = true;
}

clob::ClobClientOptions load_options() {
    load_test_env();
    clob::ClobClientOptions options;
    options.base_url = env_or_empty("CLOB_BASE_URL");
    options.order_gateway_url = env_or_empty("CLOB_ORDER_GATEWAY_URL");
    options.max_attempts = 2;
    return options;
}

clob::Credentials load_credentials() {
    load_test_env();
    return clob::Credentials{env_or_empty("CLOB_ADDRESS"), env_or_empty("CLOB_API_KEY"),
                             env_or_empty("CLOB_API_SECRET"), env_or_empty("CLOB_PASSPHRASE")};
}

void log_timings(const std::string& label, const clob::RequestTimings& timings) {
    std::cout << "[Clob] " << label
              << " total=" << timings.total_ms << " ms"
              << ", connect=" << timings.connect_ms << " ms"
              << ", tls=" << timings.app_connect_ms << " ms"
              << ", start_transfer=" << timings.start_transfer_ms << " ms"
              << std::endl;
}

} // namespace

TEST_CASE("ClobClient server_time answers", "[integration][clob]") {
    const auto options = load_options();
    if (options.base_url.empty()) {
        WARN("CLOB_BASE_URL not set; skipping server_time integration test");
        return;
    }

    clob::ClobClient client{clob::Credentials{}, options};

    try {
        const auto response = client.server_time();
        log_timings("server time", client.last_request_timings());
        CHECK_FALSE(response.empty());
    } catch (const clob::HttpError& ex) {
        FAIL_CHECK("HTTP error while fetching server time: " << ex.what());
    } catch (const std::exception& ex) {
        FAIL_CHECK("Unexpected error while fetching server time: " << ex.what());
    }
}

TEST_CASE("ClobClient retrieves a live order book summary", "[integration][clob]") {
    const auto options = load_options();
    const auto token_id = env_or_empty("CLOB_TEST_TOKEN_ID");
    if (options.base_url.empty() || token_id.empty()) {
        WARN("CLOB_BASE_URL or CLOB_TEST_TOKEN_ID not set; skipping order book integration test");
        return;
    }

    clob::ClobClient client{clob::Credentials{}, options};

    try {
        const auto response = client.order_book(token_id);
        log_timings("order book", client.last_request_timings());
        REQUIRE_FALSE(response.empty());
        CHECK(response.find("\"bids\"") != std::string::npos);
        CHECK(response.find("\"asks\"") != std::string::npos);

        const auto summary = client.get_book_summary(token_id);
        REQUIRE(summary.has_value());
        if (summary->mid) {
            CHECK(*summary->mid > 0.0);
            CHECK(*summary->mid < 1.0);
        }
        CHECK(summary->min_order_size > 0.0);
    } catch (const clob::HttpError& ex) {
        FAIL_CHECK("HTTP error while fetching order book: " << ex.what());
    } catch (const std::exception& ex) {
        FAIL_CHECK("Unexpected error while fetching order book: " << ex.what());
    }
}

TEST_CASE("ClobClient open_orders and balance with API credentials", "[integration][clob]") {
    const auto options = load_options();
    const auto credentials = load_credentials();
    if (options.base_url.empty() || !credentials.complete()) {
        WARN("CLOB credentials not provided; skipping authenticated integration test");
        return;
    }

    clob::ClobClient client{credentials, options};

    try {
        const auto orders = client.open_orders();
        log_timings("open orders", client.last_request_timings());
        CHECK_FALSE(orders.empty());

        const auto balance = client.get_collateral_balance();
        log_timings("balance allowance", client.last_request_timings());
        REQUIRE(balance.has_value());
        CHECK(*balance >= 0.0);
    } catch (const clob::HttpError& ex) {
        FAIL_CHECK("HTTP error while querying account state: " << ex.what());
    } catch (const std::exception& ex) {
        FAIL_CHECK("Unexpected error while querying account state: " << ex.what());
    }
}
