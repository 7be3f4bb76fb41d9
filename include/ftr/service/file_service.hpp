#pragma once

#include "ftr/dpu/connection_cache.hpp"
#include "ftr/fetch/byte_stream.hpp"
#include "ftr/file/local_transfer.hpp"
#include "ftr/file/path_validator.hpp"
#include "ftr/file/streaming_proxy.hpp"
#include "ftr/rpc/server.hpp"
#include "ftr/service/access.hpp"

#include <memory>
#include <string>

namespace ftr::events {
class EventBus;
}

namespace ftr::service {

/**
 * @brief RPC-facing facade of the relay
 *
 * Every call passes the access gate first. TransferToRemote carrying
 * x-target-type=dpu and a non-empty x-target-index is streamed to that
 * DPU; everything else is served from local storage. Put routing
 * metadata is only logged.
 */
class FileService : public rpc::ServiceHandler {
public:
    FileService(const file::PathValidator& validator,
                fetch::UrlFetcher& fetcher,
                dpu::ConnectionProvider& connections,
                const AccessChecker& access,
                file::TransferLimits limits,
                events::EventBus* bus = nullptr);

    Result<file::TransferResult> transfer_to_remote(const CallContext& context,
                                                    const file::TransferRequest& request) override;

    Result<std::unique_ptr<file::PutReceiver>> open_put(const CallContext& context) override;

    /**
     * @brief Delete one file under the allow-list
     *
     * A path outside the allow-list is PermissionDenied; a missing file is
     * NotFound; EACCES/EPERM is PermissionDenied; anything else Internal.
     */
    Result<void> remove(const CallContext& context, const std::string& remote_file) override;

private:
    const file::PathValidator& validator_;
    const AccessChecker& access_;
    events::EventBus* bus_;

    file::LocalTransferHandler local_;
    file::StreamingTransferProxy proxy_;
};

} // namespace ftr::service
