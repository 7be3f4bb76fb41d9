#pragma once

#include "ftr/dpu/connection_cache.hpp"
#include "ftr/file/path_validator.hpp"
#include "ftr/file/put_receiver.hpp"
#include "ftr/rpc/channel.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ftr::test {

/**
 * @brief In-process Channel whose Put calls drive a real PutReceiver
 *
 * Mimics the peer side of the wire: messages go straight into a receiver
 * built on the given validator, and close_and_receive() returns its
 * verdict. Knobs let tests corrupt content or fail a step.
 */
class LoopbackChannel : public rpc::Channel {
public:
    explicit LoopbackChannel(const file::PathValidator& validator);

    Result<std::unique_ptr<rpc::PutCall>> open_put(const file::CallMetadata& metadata,
                                                   Deadline deadline) override;

    Result<file::TransferResult> transfer_to_remote(const file::CallMetadata& metadata,
                                                    const file::TransferRequest& request,
                                                    Deadline deadline) override;

    Result<void> remove(const file::CallMetadata& metadata,
                        const std::string& remote_file,
                        Deadline deadline) override;

    std::string target() const override { return "loopback"; }
    void shutdown() override { shut_down = true; }

    /// Flip one byte of the Nth content message (0-based)
    std::optional<int> corrupt_content_index;
    /// Fail send() of the Nth content message
    std::optional<int> fail_content_index;
    std::optional<Error> open_error;

    std::atomic<int> puts_opened{0};
    std::atomic<int> content_messages{0};
    std::atomic<bool> shut_down{false};
    file::CallMetadata last_metadata;

private:
    const file::PathValidator& validator_;
};

/**
 * @brief ConnectionProvider handing out one fixed channel, or an error
 */
class StaticConnectionProvider : public dpu::ConnectionProvider {
public:
    explicit StaticConnectionProvider(std::shared_ptr<rpc::Channel> channel)
        : channel_(std::move(channel)) {}

    Result<std::shared_ptr<rpc::Channel>> get_connection(const std::string& dpu_id,
                                                         Deadline) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requested.push_back(dpu_id);
        if (error) {
            return Err<std::shared_ptr<rpc::Channel>>(*error);
        }
        return Ok(channel_);
    }

    std::optional<Error> error;
    std::vector<std::string> requested;

private:
    std::mutex mutex_;
    std::shared_ptr<rpc::Channel> channel_;
};

} // namespace ftr::test
