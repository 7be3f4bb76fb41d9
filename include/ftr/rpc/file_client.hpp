#pragma once

#include "ftr/core/deadline.hpp"
#include "ftr/core/result.hpp"
#include "ftr/file/types.hpp"
#include "ftr/rpc/channel.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace ftr::rpc {

/**
 * @brief Typed calls against a file service peer
 *
 * Thin layer over a Channel: it builds requests and, for put_file(),
 * streams a local file with its digest computed on the way out.
 */
class FileClient {
public:
    explicit FileClient(std::shared_ptr<Channel> channel);

    Result<file::TransferResult> transfer_to_remote(const std::string& local_path,
                                                    const std::string& url,
                                                    const file::CallMetadata& metadata = {},
                                                    Deadline deadline = Deadline::never());

    Result<void> remove(const std::string& remote_file,
                        const file::CallMetadata& metadata = {},
                        Deadline deadline = Deadline::never());

    struct PutOptions {
        std::uint32_t permissions = file::kDefaultPermissions;
        file::DigestMethod digest = file::DigestMethod::Md5;
        std::size_t chunk_size = 64 * 1024;
    };

    /// Uploads source_path to remote_file; returns the bytes sent
    Result<std::uint64_t> put_file(const std::string& source_path,
                                   const std::string& remote_file,
                                   const PutOptions& options,
                                   const file::CallMetadata& metadata = {},
                                   Deadline deadline = Deadline::never());

    Channel& channel() { return *channel_; }

private:
    std::shared_ptr<Channel> channel_;
};

} // namespace ftr::rpc
