#pragma once

#include "ftr/core/result.hpp"
#include "ftr/file/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ftr::file {

/**
 * @brief Bounds applied to every TransferToRemote, local or proxied
 */
struct TransferLimits {
    std::chrono::seconds timeout{300};
    std::uint64_t max_bytes = 4ULL * 1024 * 1024 * 1024;
    std::size_t chunk_size = 64 * 1024;
    DigestMethod digest = DigestMethod::Md5;
};

/**
 * @brief Shape and protocol checks shared by both transfer paths
 *
 * InvalidArgument for a missing source, destination or URL; Unimplemented
 * for anything but HTTP. Returns the source URL.
 */
Result<std::string> check_transfer_request(const TransferRequest& request);

} // namespace ftr::file
