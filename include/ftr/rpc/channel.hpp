#pragma once

#include "ftr/core/deadline.hpp"
#include "ftr/core/result.hpp"
#include "ftr/file/types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace ftr::rpc {

/**
 * @brief Client half of one Put call
 *
 * Messages must follow the stream contract: one Open, any number of
 * Content, one Hash, then close_and_receive().
 */
class PutCall {
public:
    virtual ~PutCall() = default;

    virtual Result<void> send(const file::PutMessage& message) = 0;

    /// Content message straight from a caller buffer
    virtual Result<void> send_content(const std::uint8_t* data, std::size_t size) {
        return send(file::PutContent{std::vector<std::uint8_t>(data, data + size)});
    }

    /// Half-closes the stream and waits for the peer's verdict
    virtual Result<void> close_and_receive() = 0;
};

/**
 * @brief Reusable connection to a peer exposing the file service
 *
 * Channels handed out by the connection cache are owned by the cache;
 * callers use them but never call shutdown().
 */
class Channel {
public:
    virtual ~Channel() = default;

    virtual Result<std::unique_ptr<PutCall>> open_put(const file::CallMetadata& metadata,
                                                      Deadline deadline) = 0;

    virtual Result<file::TransferResult> transfer_to_remote(const file::CallMetadata& metadata,
                                                            const file::TransferRequest& request,
                                                            Deadline deadline) = 0;

    virtual Result<void> remove(const file::CallMetadata& metadata,
                                const std::string& remote_file,
                                Deadline deadline) = 0;

    /// host:port of the peer, for logs
    virtual std::string target() const = 0;

    /// Drops pooled connections; only the owner calls this
    virtual void shutdown() = 0;
};

} // namespace ftr::rpc
