#pragma once

#include "ftr/core/result.hpp"

#include <string>
#include <vector>

namespace ftr::file {

/**
 * @brief Gatekeeper for every filesystem path a client may write or delete
 *
 * Rules, applied in order:
 * 1. path must be absolute
 * 2. normalize ("." and ".." resolved lexically)
 * 3. no ".." segment may survive normalization
 * 4. normalized path must start with one of the allowed prefixes
 *
 * translate() maps a validated path onto the host filesystem when the
 * process runs in a container that mounts the host root at host_mount.
 */
class PathValidator {
public:
    struct Policy {
        std::vector<std::string> allowed_prefixes{"/tmp/", "/var/tmp/"};
        std::string host_mount{"/mnt/host"};
    };

    PathValidator() = default;
    explicit PathValidator(Policy policy);

    /// Returns the normalized path, or InvalidArgument
    Result<std::string> validate(const std::string& raw) const;

    /// Prepends host_mount when that directory exists
    std::string translate(const std::string& normalized) const;

    /// validate() followed by translate()
    Result<std::string> resolve(const std::string& raw) const;

    const Policy& policy() const noexcept { return policy_; }

    static std::string normalize(const std::string& path);

private:
    Policy policy_;
};

} // namespace ftr::file
