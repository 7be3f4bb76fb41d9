/**
 * @file main.cpp
 * @brief ftrd: file-transfer relay daemon
 *
 * Usage: ftrd [-c config.json] [-p port]
 */

#include "ftr/core/config.hpp"
#include "ftr/dpu/connection_cache.hpp"
#include "ftr/dpu/kv_store.hpp"
#include "ftr/dpu/resolver.hpp"
#include "ftr/events/components.hpp"
#include "ftr/events/event_bus.hpp"
#include "ftr/events/events.hpp"
#include "ftr/fetch/http_fetcher.hpp"
#include "ftr/file/path_validator.hpp"
#include "ftr/rpc/server.hpp"
#include "ftr/service/access.hpp"
#include "ftr/service/file_service.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace ftr;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE     JSON configuration file\n";
    std::cout << "  -p, --port PORT       Port to listen on (overrides config, default: 50052)\n";
    std::cout << "  -h, --help            Show this help message\n";
}

std::optional<uint16_t> parse_port(const std::string& text) {
    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::shared_ptr<const dpu::KeyValueStore> open_store(const std::string& path, const char* name) {
    if (path.empty()) {
        spdlog::warn("No {} configured; DPU routing will find no entries", name);
        return std::make_shared<dpu::MemoryKeyValueStore>();
    }
    spdlog::info("Using {} at {}", name, path);
    return std::make_shared<dpu::JsonFileKeyValueStore>(path);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path;
    std::optional<uint16_t> port_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
            } else {
                spdlog::error("{} requires a value", arg);
                return 1;
            }
        } else if (arg == "-p" || arg == "--port") {
            if (i + 1 < argc) {
                port_override = parse_port(argv[++i]);
                if (!port_override) {
                    spdlog::error("Invalid port: {}", argv[i]);
                    return 1;
                }
            } else {
                spdlog::error("{} requires a value", arg);
                return 1;
            }
        } else {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    // ────────────────────────────────────────────────────────
    // Configuration
    // ────────────────────────────────────────────────────────

    ServerConfig config;
    if (!config_path.empty()) {
        auto loaded = ServerConfig::load(config_path);
        if (loaded.is_error()) {
            spdlog::error("Failed to load config: {}", loaded.error().message);
            return 1;
        }
        config = std::move(loaded.value());
    }
    if (port_override) {
        config.port = *port_override;
    }

    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::warn("Unknown log_level '{}', keeping info", config.log_level);
    } else {
        spdlog::set_level(level);
    }

    // ────────────────────────────────────────────────────────
    // Components
    // ────────────────────────────────────────────────────────

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    file::PathValidator::Policy policy;
    policy.allowed_prefixes = config.allowed_prefixes;
    policy.host_mount = config.host_mount;
    file::PathValidator validator(policy);

    auto state_store = open_store(config.state_db, "state_db");
    auto config_store = open_store(config.config_db, "config_db");
    auto resolver = std::make_shared<dpu::DpuResolver>(state_store, config_store);

    auto cache = std::make_shared<dpu::ConnectionCache>(
        resolver,
        std::make_shared<dpu::TcpDialer>(std::chrono::seconds(config.dial_timeout_seconds)),
        &bus);
    dpu::install_default_cache(cache);

    fetch::HttpFetcher fetcher;

    std::unique_ptr<service::AccessChecker> access;
    if (config.access) {
        spdlog::info("Role-based access enabled for {} clients", config.access->size());
        access = std::make_unique<service::RoleAccessChecker>(*config.access);
    } else {
        access = std::make_unique<service::AllowAllAccess>();
    }

    file::TransferLimits limits;
    limits.timeout = std::chrono::seconds(config.transfer_timeout_seconds);
    limits.max_bytes = config.max_file_size;
    limits.chunk_size = config.chunk_size;
    limits.digest = config.digest;

    service::FileService file_service(validator, fetcher, *cache, *access, limits, &bus);

    // ────────────────────────────────────────────────────────
    // Event loop
    // ────────────────────────────────────────────────────────

    boost::asio::io_context io_context;

    auto server = rpc::RpcServer::create(io_context, config.listen_address, config.port,
                                         file_service, config.worker_threads);
    if (server.is_error()) {
        spdlog::error("Failed to start server: {}", server.error().message);
        return 1;
    }

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        bus.emit(events::ServerShuttingDownEvent(
            signal_number == SIGINT ? "SIGINT" : "SIGTERM"));
        server.value()->stop();
        io_context.stop();
    });

    bus.emit(events::ServerStartedEvent(server.value()->port()));

    std::vector<std::thread> threads;
    for (std::size_t i = 1; i < config.io_threads; ++i) {
        threads.emplace_back([&io_context]() { io_context.run(); });
    }
    io_context.run();

    for (auto& thread : threads) {
        thread.join();
    }

    dpu::install_default_cache(nullptr);
    cache->close_all();
    metrics.print_stats();

    spdlog::info("Server shut down cleanly");
    return 0;
}
