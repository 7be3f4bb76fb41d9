#include "ftr/service/access.hpp"
#include "ftr/file/types.hpp"

#include <spdlog/spdlog.h>

namespace ftr::service {

RoleAccessChecker::RoleAccessChecker(RoleTable roles, std::string service)
    : roles_(std::move(roles))
    , service_(std::move(service)) {
}

Result<void> RoleAccessChecker::check(const CallContext& context, bool write_access) const {
    const std::string* client = context.find(file::kClientIdKey);
    if (!client || client->empty()) {
        spdlog::debug("Rejecting call from {}: no client identity", context.peer);
        return Fail<void>(StatusCode::Unauthenticated, "no client identity");
    }

    auto it = roles_.find(*client);
    if (it == roles_.end() || it->second.empty()) {
        spdlog::debug("Rejecting call from {}: no roles for client {}", context.peer, *client);
        return Fail<void>(StatusCode::Unauthenticated, "unauthorized client");
    }

    if (has_access(it->second, service_, write_access)) {
        return Ok();
    }

    spdlog::info("Access denied to client {} for {} (write={})", *client, service_, write_access);
    return Fail<void>(StatusCode::PermissionDenied, "insufficient permissions");
}

bool RoleAccessChecker::has_access(const std::vector<std::string>& roles,
                                   const std::string& service,
                                   bool write_access) {
    const std::string prefix = service + "_";
    for (const auto& role : roles) {
        if (role.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const std::string level = role.substr(prefix.size());
        if (level == "readwrite") {
            return true;
        }
        if (level == "readonly" && !write_access) {
            return true;
        }
        if (level == "noaccess") {
            return false;
        }
    }
    return false;
}

} // namespace ftr::service
