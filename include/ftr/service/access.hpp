#pragma once

#include "ftr/core/result.hpp"
#include "ftr/rpc/call_context.hpp"

#include <map>
#include <string>
#include <vector>

namespace ftr::service {

using rpc::CallContext;

/**
 * @brief Gate consulted before every file service call
 */
class AccessChecker {
public:
    virtual ~AccessChecker() = default;

    /// Unauthenticated for an unknown caller, PermissionDenied for a denial
    virtual Result<void> check(const CallContext& context, bool write_access) const = 0;
};

class AllowAllAccess : public AccessChecker {
public:
    Result<void> check(const CallContext&, bool) const override { return Ok(); }
};

/**
 * @brief Role table keyed by the caller's x-client-id
 *
 * Roles are "<service>_readwrite", "<service>_readonly" and
 * "<service>_noaccess". The first role naming the service decides, with
 * readonly passing over to later roles on a write.
 */
class RoleAccessChecker : public AccessChecker {
public:
    using RoleTable = std::map<std::string, std::vector<std::string>>;

    explicit RoleAccessChecker(RoleTable roles, std::string service = "file");

    Result<void> check(const CallContext& context, bool write_access) const override;

    static bool has_access(const std::vector<std::string>& roles,
                           const std::string& service,
                           bool write_access);

private:
    RoleTable roles_;
    std::string service_;
};

} // namespace ftr::service
