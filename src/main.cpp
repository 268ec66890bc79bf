#include "clob/clob_client.hpp"
#include "mm/advisory.hpp"
#include "mm/config.hpp"
#include "mm/market_making_loop.hpp"
#include "mm/risk_manager.hpp"
#include "mm/store.hpp"

#include <pthread.h>

#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

namespace {

clob::Credentials credentials_from(const mm::VenueSettings& venue) {
    return clob::Credentials{venue.address, venue.api_key, venue.api_secret, venue.passphrase};
}

} // namespace

int main() {
    mm::load_env_file(".env");

    mm::AppConfig config;
    try {
        config = mm::load_app_config();
    } catch (const mm::ConfigError& ex) {
        std::cerr << "[Config] " << ex.what() << std::endl;
        return 1;
    }

    // Signals are taken by a dedicated thread; every other thread inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    const auto credentials = credentials_from(config.venue);
    if (!credentials.complete()) {
        std::cerr << "[Config] CLOB credentials incomplete; trading endpoints will be refused" << std::endl;
    }

    clob::ClobClientOptions options;
    options.base_url = config.venue.base_url;
    options.order_gateway_url = config.venue.order_gateway_url;
    clob::ClobClient client{credentials, options};

    try {
        const auto server_time = client.server_time();
        const auto timings = client.last_request_timings();
        std::cout << "CLOB connectivity check -> server time: " << server_time << std::endl;
        std::cout << "REST latency: total=" << timings.total_ms << " ms"
                  << ", connect=" << timings.connect_ms << " ms"
                  << ", tls=" << timings.app_connect_ms << " ms" << std::endl;
    } catch (const clob::HttpError& ex) {
        std::cerr << "[Clob] Connectivity check failed: " << ex.what() << " (status " << ex.status_code() << ")"
                  << std::endl;
    }

    mm::JsonlStoreConfig store_config;
    store_config.data_dir = config.data_dir;
    mm::JsonlStore store{store_config};
    try {
        store.load();
    } catch (const std::runtime_error& ex) {
        std::cerr << "[Store] " << ex.what() << std::endl;
        return 1;
    }

    mm::RiskManager risk{config.mm.risk(), &store};
    mm::JsonFileMarketSource markets{config.markets_file};
    mm::NullEventRiskGuard guard;
    mm::PassThroughScorer scorer;

    mm::MarketMakingLoop loop{config.mm, client, store, risk, markets, guard, scorer};

    std::thread signal_thread([&loop, signals]() {
        int received = 0;
        sigwait(&signals, &received);
        std::cout << "[Loop] Signal " << received << " received, stopping" << std::endl;
        loop.stop();
    });

    try {
        loop.recover_open_orders();
    } catch (const std::exception& ex) {
        std::cerr << "[Loop] Open-order recovery failed: " << ex.what() << std::endl;
    }

    loop.run();

    // run() only returns after the signal thread called stop().
    signal_thread.join();
    return 0;
}
