#pragma once

#include "ftr/core/deadline.hpp"
#include "ftr/core/result.hpp"
#include "ftr/dpu/resolver.hpp"
#include "ftr/rpc/channel.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ftr::events {
class EventBus;
}

namespace ftr::dpu {

/**
 * @brief Source of ready-to-use channels, keyed by DPU id
 *
 * Returned channels stay owned by the provider; callers must not shut
 * them down.
 */
class ConnectionProvider {
public:
    virtual ~ConnectionProvider() = default;

    virtual Result<std::shared_ptr<rpc::Channel>> get_connection(const std::string& dpu_id,
                                                                 Deadline deadline) = 0;
};

/**
 * @brief Opens a channel to a resolved endpoint
 */
class Dialer {
public:
    virtual ~Dialer() = default;

    virtual Result<std::shared_ptr<rpc::Channel>> dial(const DpuEndpoint& endpoint,
                                                       Deadline deadline) = 0;
};

/**
 * @brief Dials rpc::TcpChannel and checks the peer accepts connections
 */
class TcpDialer : public Dialer {
public:
    explicit TcpDialer(std::chrono::milliseconds connect_timeout = std::chrono::seconds(5));

    Result<std::shared_ptr<rpc::Channel>> dial(const DpuEndpoint& endpoint,
                                               Deadline deadline) override;

private:
    std::chrono::milliseconds connect_timeout_;
};

/**
 * @brief One lazily dialed channel per DPU id
 *
 * The resolver runs on every call so a DPU that lost access is refused
 * even while its channel is cached; a changed address replaces the
 * channel.
 *
 * Thread safety: the map mutex only guards finding or creating an id's
 * slot. The slot's own mutex is held across reuse-or-dial, so concurrent
 * callers for one id dial once and callers for different ids never wait
 * on each other.
 */
class ConnectionCache : public ConnectionProvider {
public:
    ConnectionCache(std::shared_ptr<const EndpointResolver> resolver,
                    std::shared_ptr<Dialer> dialer,
                    events::EventBus* bus = nullptr);
    ~ConnectionCache() override;

    ConnectionCache(const ConnectionCache&) = delete;
    ConnectionCache& operator=(const ConnectionCache&) = delete;

    Result<std::shared_ptr<rpc::Channel>> get_connection(const std::string& dpu_id,
                                                         Deadline deadline) override;

    /// Drops the cached channel for dpu_id; the next call dials again
    void invalidate(const std::string& dpu_id);

    /// Number of ids holding a live channel
    std::size_t size() const;

    /// Shuts down every cached channel
    void close_all();

private:
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<rpc::Channel> channel;
        std::string address;
    };

    std::shared_ptr<Slot> slot_for(const std::string& dpu_id);

    std::shared_ptr<const EndpointResolver> resolver_;
    std::shared_ptr<Dialer> dialer_;
    events::EventBus* bus_;

    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

// Process-wide accessor for code paths that cannot take the cache by
// injection. Handlers receive a ConnectionProvider& instead.
void install_default_cache(std::shared_ptr<ConnectionCache> cache);
std::shared_ptr<ConnectionCache> default_cache();

/// Internal "connection cache not initialized" until install_default_cache()
Result<std::shared_ptr<rpc::Channel>> get_dpu_connection(const std::string& dpu_id,
                                                         Deadline deadline);

} // namespace ftr::dpu
