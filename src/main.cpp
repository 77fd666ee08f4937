#include <spdlog/spdlog.h>
#include <boost/asio.hpp>
#include "ProxyServer/ProxyServer.hpp"
#include "Config/Config.hpp"
#include "QueryCoalescer/QueryCoalescer.hpp"
#include "Upstream/UpstreamClient.hpp"
#include <algorithm>
#include <cctype>
#include <thread>
#include <vector>
#include <csignal>
#include <memory>

static void apply_log_level(std::string level_str) {
    std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                  [](unsigned char c) { return std::tolower(c); });

    if (level_str == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level_str == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level_str == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level_str == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level_str == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::warn("Unknown log level '{}', using info", level_str);
        spdlog::set_level(spdlog::level::info);
    }
}

int main(int argc, char* argv[]) {
    try {
        auto& config = Config::getInstance();
        std::string config_path = "config.yaml";

        if (argc > 1) {
            config_path = argv[1];
        }

        if (!config.loadFromFile(config_path)) {
            spdlog::error("Failed to load configuration: {}", config.getError());
            return 1;
        }

        spdlog::set_pattern(config.getLogPattern());
        apply_log_level(config.getLogLevel());

        // Constructed before the coalescer so that completions still being
        // delivered while the coalescer drains can post into it.
        boost::asio::io_context io_context;

        UpstreamClient upstream(config.getUpstreamHost(),
                                config.getUpstreamPort(),
                                config.getUpstreamTimeout());

        QueryCoalescer coalescer(
            [&upstream](const CancellationToken& token, const std::string& query) {
                return upstream.request(token, query);
            },
            config.getWorkerThreads());

        spdlog::info("[SINGLEFLIGHT] Starting on {}:{}",
                     config.getListenAddress(), config.getListenPort());
        spdlog::info("[SINGLEFLIGHT] Coalescing lookups to: {}:{}",
                     config.getUpstreamHost(), config.getUpstreamPort());
        spdlog::info("[SINGLEFLIGHT] Using {} I/O threads",
                     config.getNumThreads());

        ProxyServer server(io_context,
                           config.getListenAddress(),
                           config.getListenPort(),
                           coalescer);

        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard(
            boost::asio::make_work_guard(io_context));

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        server.shutdownOnSignal(signals, [&work_guard, &io_context](int) {
            work_guard.reset();
            io_context.stop();
        });

        std::vector<std::thread> worker_threads;
        unsigned int num_threads = config.getNumThreads();

        for (unsigned int i = 0; i < num_threads; i++) {
            worker_threads.emplace_back([&io_context, i] {
                try {
                    spdlog::debug("[SINGLEFLIGHT] I/O thread {} started", i);
                    io_context.run();
                    spdlog::debug("[SINGLEFLIGHT] I/O thread {} finished", i);
                } catch (const std::exception& e) {
                    spdlog::error("[SINGLEFLIGHT] I/O thread {} error: {}", i, e.what());
                }
            });
        }

        spdlog::info("[SINGLEFLIGHT] All {} I/O threads started. Server running...", num_threads);

        for (auto& thread : worker_threads) {
            thread.join();
        }

        server.shutdown();

        auto stats = coalescer.getStats();
        spdlog::info("[SINGLEFLIGHT] {} executions, {} joins, {} forgotten",
                     stats.executions, stats.joins, stats.forgotten);
        spdlog::info("[SINGLEFLIGHT] All threads joined. Shutting down.");

    } catch (std::exception& e) {
        spdlog::error("[SINGLEFLIGHT] Unexpected error: {}", e.what());
        return 1;
    }
    return 0;
}
