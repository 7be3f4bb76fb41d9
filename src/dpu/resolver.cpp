#include "ftr/dpu/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ftr::dpu {

namespace {

constexpr const char* kIpAddressField = "ip_address";
constexpr const char* kAccessField = "access";
constexpr const char* kPortField = "gnmi_port";

bool equals_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

DpuResolver::DpuResolver(std::shared_ptr<const KeyValueStore> state_store,
                         std::shared_ptr<const KeyValueStore> config_store)
    : state_store_(std::move(state_store))
    , config_store_(std::move(config_store)) {
}

std::string DpuResolver::state_key(const std::string& dpu_id) {
    return "CHASSIS_MIDPLANE_TABLE|DPU" + dpu_id;
}

std::string DpuResolver::config_key(const std::string& dpu_id) {
    return "DPU|dpu" + dpu_id;
}

Result<DpuEndpoint> DpuResolver::resolve(const std::string& dpu_id) const {
    if (!state_store_ || !config_store_) {
        return Fail<DpuEndpoint>(StatusCode::Internal, "DPU resolver has no backing stores");
    }

    auto state = state_store_->get_all(state_key(dpu_id));
    if (state.is_error()) {
        return Err<DpuEndpoint>(state.error().wrap("state lookup for DPU " + dpu_id));
    }
    if (!state.value()) {
        return Fail<DpuEndpoint>(StatusCode::NotFound, "DPU " + dpu_id + " not found");
    }

    const FieldMap& fields = *state.value();
    auto ip = fields.find(kIpAddressField);
    auto access = fields.find(kAccessField);
    if (ip == fields.end() || ip->second.empty() || access == fields.end()) {
        return Fail<DpuEndpoint>(StatusCode::Internal,
            "DPU " + dpu_id + " state entry is missing ip_address or access");
    }

    DpuEndpoint endpoint;
    endpoint.id = dpu_id;
    endpoint.host = ip->second;
    endpoint.reachable = equals_ignore_case(access->second, "true");

    if (!endpoint.reachable) {
        return Fail<DpuEndpoint>(StatusCode::Unavailable,
            "DPU " + dpu_id + " is not reachable (access=" + access->second + ")");
    }

    auto config = config_store_->get_all(config_key(dpu_id));
    if (config.is_error()) {
        return Err<DpuEndpoint>(config.error().wrap("config lookup for DPU " + dpu_id));
    }
    if (!config.value()) {
        return Fail<DpuEndpoint>(StatusCode::Internal,
            "DPU " + dpu_id + " has no configuration entry");
    }

    auto port = config.value()->find(kPortField);
    if (port == config.value()->end()) {
        return Fail<DpuEndpoint>(StatusCode::Internal,
            "DPU " + dpu_id + " configuration has no gnmi_port");
    }

    unsigned int value = 0;
    const char* begin = port->second.data();
    const char* end = begin + port->second.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value == 0 || value > 65535) {
        return Fail<DpuEndpoint>(StatusCode::Internal,
            "DPU " + dpu_id + " has malformed gnmi_port '" + port->second + "'");
    }
    endpoint.port = static_cast<std::uint16_t>(value);

    spdlog::debug("Resolved DPU {} to {}", dpu_id, endpoint.address());
    return Ok(std::move(endpoint));
}

} // namespace ftr::dpu
