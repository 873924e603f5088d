#include "config.hpp"
#include "chain_rpc_client.hpp"
#include "http_api.hpp"
#include "pool_cache.hpp"
#include "pool_resolver.hpp"
#include "snapshot_store.hpp"
#include "stop_signal.hpp"
#include "subgraph_client.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <chrono>
#include <memory>
#include <thread>

namespace {

volatile std::sig_atomic_t shutdown_requested = 0;

void signal_handler(int) {
    shutdown_requested = 1;
}

void setup_logging(const std::string& level) {
    auto logger = spdlog::stdout_color_mt("pool_resolver");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
}

std::unique_ptr<SnapshotStore> open_snapshot_store(const Config& config) {
    if (!config.enable_persistence) {
        return nullptr;
    }

    try {
        return make_snapshot_store(config);
    } catch (const std::exception& e) {
        spdlog::warn("Snapshot store unavailable, cache will not persist: {}", e.what());
        return nullptr;
    }
}

} // namespace

int main() {
    try {
        // 1. Load configuration
        Config config = Config::from_env();

        // 2. Setup logging
        setup_logging(config.log_level);
        config.validate();
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {}...", config.service_name);

        // 3. Register signal handlers for graceful shutdown
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // 4. Wire the engine
        auto stop = std::make_shared<StopSignal>();
        auto cache = std::make_shared<PoolCache>(PoolCacheOptions::from_config(config),
                                                 open_snapshot_store(config), stop);
        auto indexed = std::make_shared<SubgraphClient>(config);
        auto chain = std::make_shared<ChainRpcClient>(config);

        PoolResolver resolver(cache, indexed, chain, ResolverOptions::from_config(config), stop);
        cache->start();

        HttpApi api(config, resolver);
        api.start();

        spdlog::info("Serving {} subgraph endpoints, {} RPC endpoints",
                     config.subgraph_urls.size(), config.rpc_urls.size());

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // 5. Shutdown: stop accepting requests, cancel waits, flush the cache
        spdlog::info("Shutdown requested, stopping...");
        api.stop();
        resolver.shutdown();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Pool resolver has shut down gracefully.");
    return 0;
}
