#pragma once

#include "ftr/core/deadline.hpp"
#include "ftr/file/types.hpp"

#include <string>

namespace ftr::rpc {

/// Metadata key carrying the caller's remaining time budget in milliseconds
inline constexpr const char* kTimeoutMetadataKey = "x-timeout-ms";

/**
 * @brief Per-call information the transport hands to the service
 */
struct CallContext {
    file::CallMetadata metadata;
    Deadline deadline;   ///< From the caller's x-timeout-ms, never() when absent
    std::string peer;    ///< Remote endpoint, for logs

    const std::string* find(const std::string& key) const {
        auto it = metadata.find(key);
        return it == metadata.end() ? nullptr : &it->second;
    }
};

} // namespace ftr::rpc
