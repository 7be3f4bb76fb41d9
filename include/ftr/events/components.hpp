/**
 * @file components.hpp
 * @brief Event-driven observers for the relay
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "ftr/events/event_bus.hpp"
#include "ftr/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace ftr::events {

/**
 * @brief Logs every lifecycle event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });

        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_transfer_started(e);
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_transfer_failed(e);
        });

        bus_.subscribe<PutCompletedEvent>([this](const PutCompletedEvent& e) {
            on_put_completed(e);
        });

        bus_.subscribe<PutFailedEvent>([this](const PutFailedEvent& e) {
            on_put_failed(e);
        });

        bus_.subscribe<FileRemovedEvent>([this](const FileRemovedEvent& e) {
            spdlog::info("[FileRemoved] path={}", e.file_path);
        });

        bus_.subscribe<DpuConnectionDialedEvent>([this](const DpuConnectionDialedEvent& e) {
            spdlog::info("[DpuDialed] dpu={} address={}", e.dpu_id, e.address);
        });
    }

private:
    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("File transfer relay listening on port {}", e.port);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Server shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_transfer_started(const TransferStartedEvent& e) {
        spdlog::info("[TransferStarted] dest={} url={} route={}", e.destination, e.url, e.route);
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        spdlog::info("[TransferCompleted] dest={} route={} bytes={} hash={} duration={}ms",
                     e.destination, e.route, e.total_bytes, e.hash, e.duration.count());
    }

    void on_transfer_failed(const TransferFailedEvent& e) {
        spdlog::warn("[TransferFailed] dest={} route={} code={} error={}",
                     e.destination, e.route, status_code_name(e.code), e.error_message);
    }

    void on_put_completed(const PutCompletedEvent& e) {
        spdlog::info("[PutCompleted] path={} bytes={} hash={}", e.file_path, e.total_bytes, e.hash);
    }

    void on_put_failed(const PutFailedEvent& e) {
        spdlog::warn("[PutFailed] path={} code={} error={}",
                     e.file_path, status_code_name(e.code), e.error_message);
    }

    EventBus& bus_;
};

/**
 * @brief Counts transfers, relayed bytes and failures
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().transfers_completed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> transfers_started{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_failed{0};
        std::atomic<uint64_t> dpu_transfers{0};
        std::atomic<uint64_t> bytes_transferred{0};
        std::atomic<uint64_t> puts_completed{0};
        std::atomic<uint64_t> puts_failed{0};
        std::atomic<uint64_t> puts_corrupted{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> files_removed{0};
        std::atomic<uint64_t> dpu_dials{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
            stats_.transfers_started++;
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.transfers_failed++;
        });

        bus_.subscribe<PutCompletedEvent>([this](const PutCompletedEvent& e) {
            stats_.puts_completed++;
            stats_.bytes_received += e.total_bytes;
        });

        bus_.subscribe<PutFailedEvent>([this](const PutFailedEvent& e) {
            on_put_failed(e);
        });

        bus_.subscribe<FileRemovedEvent>([this](const FileRemovedEvent&) {
            stats_.files_removed++;
        });

        bus_.subscribe<DpuConnectionDialedEvent>([this](const DpuConnectionDialedEvent&) {
            stats_.dpu_dials++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Relay Statistics:");
        spdlog::info("  Transfers started:   {}", stats_.transfers_started.load());
        spdlog::info("  Transfers completed: {}", stats_.transfers_completed.load());
        spdlog::info("  Transfers failed:    {}", stats_.transfers_failed.load());
        spdlog::info("  Via DPU:             {}", stats_.dpu_transfers.load());
        spdlog::info("  Bytes transferred:   {}", stats_.bytes_transferred.load());
        spdlog::info("  Puts completed:      {}", stats_.puts_completed.load());
        spdlog::info("  Puts failed:         {}", stats_.puts_failed.load());
        spdlog::info("  Puts corrupted:      {}", stats_.puts_corrupted.load());
        spdlog::info("  Bytes received:      {}", stats_.bytes_received.load());
        spdlog::info("  Files removed:       {}", stats_.files_removed.load());
        spdlog::info("  DPU dials:           {}", stats_.dpu_dials.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_transfer_completed(const TransferCompletedEvent& e) {
        stats_.transfers_completed++;
        stats_.bytes_transferred += e.total_bytes;
        if (e.route != "local") {
            stats_.dpu_transfers++;
        }
    }

    void on_put_failed(const PutFailedEvent& e) {
        stats_.puts_failed++;
        if (e.code == StatusCode::DataLoss) {
            stats_.puts_corrupted++;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace ftr::events
