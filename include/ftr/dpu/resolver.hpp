#pragma once

#include "ftr/core/result.hpp"
#include "ftr/dpu/kv_store.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace ftr::dpu {

/**
 * @brief Where a DPU can be reached, derived fresh on every lookup
 */
struct DpuEndpoint {
    std::string id;
    std::string host;
    std::uint16_t port = 0;
    bool reachable = false;

    /// host:port
    std::string address() const { return host + ":" + std::to_string(port); }
};

class EndpointResolver {
public:
    virtual ~EndpointResolver() = default;

    virtual Result<DpuEndpoint> resolve(const std::string& dpu_id) const = 0;
};

/**
 * @brief Maps a DPU id to its endpoint through the state and config tables
 *
 * State:  CHASSIS_MIDPLANE_TABLE|DPU<id>  { ip_address, access }
 * Config: DPU|dpu<id>                     { gnmi_port }
 *
 * Both tables are queried on every call; nothing is cached here.
 * Failures: NotFound (no state entry), Unavailable (access is false,
 * checked before the config lookup), Internal (incomplete or malformed
 * entries, missing config).
 */
class DpuResolver : public EndpointResolver {
public:
    DpuResolver(std::shared_ptr<const KeyValueStore> state_store,
                std::shared_ptr<const KeyValueStore> config_store);

    Result<DpuEndpoint> resolve(const std::string& dpu_id) const override;

    static std::string state_key(const std::string& dpu_id);
    static std::string config_key(const std::string& dpu_id);

private:
    std::shared_ptr<const KeyValueStore> state_store_;
    std::shared_ptr<const KeyValueStore> config_store_;
};

} // namespace ftr::dpu
