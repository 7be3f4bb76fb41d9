#include "ftr/dpu/connection_cache.hpp"
#include "ftr/events/event_bus.hpp"
#include "ftr/events/events.hpp"
#include "ftr/rpc/tcp_channel.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace ftr::dpu {

// ──────────────────────────────────────────────────────────
// TcpDialer
// ──────────────────────────────────────────────────────────

TcpDialer::TcpDialer(std::chrono::milliseconds connect_timeout)
    : connect_timeout_(connect_timeout) {
}

Result<std::shared_ptr<rpc::Channel>> TcpDialer::dial(const DpuEndpoint& endpoint,
                                                      Deadline deadline) {
    rpc::TcpChannel::Options options;
    options.connect_timeout = connect_timeout_;

    auto channel = std::make_shared<rpc::TcpChannel>(endpoint.host, endpoint.port, options);
    auto warmed = channel->warm_up(deadline);
    if (warmed.is_error()) {
        return Err<std::shared_ptr<rpc::Channel>>(warmed.error());
    }
    return Ok(std::shared_ptr<rpc::Channel>(std::move(channel)));
}

// ──────────────────────────────────────────────────────────
// ConnectionCache
// ──────────────────────────────────────────────────────────

ConnectionCache::ConnectionCache(std::shared_ptr<const EndpointResolver> resolver,
                                 std::shared_ptr<Dialer> dialer,
                                 events::EventBus* bus)
    : resolver_(std::move(resolver))
    , dialer_(std::move(dialer))
    , bus_(bus) {
}

ConnectionCache::~ConnectionCache() {
    close_all();
}

std::shared_ptr<ConnectionCache::Slot> ConnectionCache::slot_for(const std::string& dpu_id) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& slot = slots_[dpu_id];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

Result<std::shared_ptr<rpc::Channel>> ConnectionCache::get_connection(const std::string& dpu_id,
                                                                      Deadline deadline) {
    using ChannelPtr = std::shared_ptr<rpc::Channel>;

    if (!resolver_) {
        return Fail<ChannelPtr>(StatusCode::Internal, "resolver not available");
    }

    auto endpoint = resolver_->resolve(dpu_id);
    if (endpoint.is_error()) {
        const Error& error = endpoint.error();
        if (error.code == StatusCode::Unavailable) {
            return Err<ChannelPtr>(error);
        }
        return Fail<ChannelPtr>(StatusCode::Internal,
            "failed to resolve DPU " + dpu_id + ": " + error.message);
    }

    const std::string address = endpoint.value().address();
    auto slot = slot_for(dpu_id);

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->channel) {
        if (slot->address == address) {
            return Ok(slot->channel);
        }
        spdlog::info("DPU {} moved from {} to {}, redialing", dpu_id, slot->address, address);
        slot->channel->shutdown();
        slot->channel.reset();
    }

    if (!dialer_) {
        return Fail<ChannelPtr>(StatusCode::Internal, "no dialer configured");
    }

    auto channel = dialer_->dial(endpoint.value(), deadline);
    if (channel.is_error()) {
        spdlog::warn("Dial to DPU {} at {} failed: {}", dpu_id, address, channel.error().message);
        return Fail<ChannelPtr>(StatusCode::Unavailable,
            "failed to connect to DPU " + dpu_id + " at " + address + ": " + channel.error().message);
    }

    slot->channel = channel.value();
    slot->address = address;
    spdlog::info("Connected to DPU {} at {}", dpu_id, address);

    if (bus_) {
        bus_->emit(events::DpuConnectionDialedEvent{dpu_id, address});
    }
    return Ok(slot->channel);
}

void ConnectionCache::invalidate(const std::string& dpu_id) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto it = slots_.find(dpu_id);
        if (it == slots_.end()) {
            return;
        }
        slot = it->second;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->channel) {
        spdlog::debug("Dropping cached channel for DPU {}", dpu_id);
        slot->channel->shutdown();
        slot->channel.reset();
        slot->address.clear();
    }
}

std::size_t ConnectionCache::size() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        for (const auto& [id, slot] : slots_) {
            slots.push_back(slot);
        }
    }

    std::size_t live = 0;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->channel) {
            ++live;
        }
    }
    return live;
}

void ConnectionCache::close_all() {
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        slots.swap(slots_);
    }

    for (auto& [id, slot] : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->channel) {
            slot->channel->shutdown();
            slot->channel.reset();
        }
    }
}

// ──────────────────────────────────────────────────────────
// Default cache accessor
// ──────────────────────────────────────────────────────────

namespace {

std::mutex& default_cache_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<ConnectionCache>& default_cache_slot() {
    static std::shared_ptr<ConnectionCache> cache;
    return cache;
}

} // namespace

void install_default_cache(std::shared_ptr<ConnectionCache> cache) {
    std::lock_guard<std::mutex> lock(default_cache_mutex());
    default_cache_slot() = std::move(cache);
}

std::shared_ptr<ConnectionCache> default_cache() {
    std::lock_guard<std::mutex> lock(default_cache_mutex());
    return default_cache_slot();
}

Result<std::shared_ptr<rpc::Channel>> get_dpu_connection(const std::string& dpu_id,
                                                         Deadline deadline) {
    auto cache = default_cache();
    if (!cache) {
        return Fail<std::shared_ptr<rpc::Channel>>(StatusCode::Internal,
            "connection cache not initialized");
    }
    return cache->get_connection(dpu_id, deadline);
}

} // namespace ftr::dpu
