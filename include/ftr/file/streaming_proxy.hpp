#pragma once

#include "ftr/core/deadline.hpp"
#include "ftr/core/result.hpp"
#include "ftr/dpu/connection_cache.hpp"
#include "ftr/fetch/byte_stream.hpp"
#include "ftr/file/path_validator.hpp"
#include "ftr/file/transfer_request.hpp"
#include "ftr/file/types.hpp"

#include <string>

namespace ftr::file {

/**
 * @brief TransferToRemote re-routed to a DPU without touching local disk
 *
 * Bytes are pulled from the HTTP source one chunk at a time, folded into
 * the digest in the same read, and pushed as Put content on the DPU's
 * channel. The DPU verifies the digest before committing, so a corrupted
 * relay surfaces as DataLoss.
 *
 * Error classes:
 * - request shape / path:      InvalidArgument, Unimplemented
 * - source unavailable:        Internal "failed to create HTTP stream"
 * - DPU lookup:                the provider's Unavailable or Internal
 * - stream setup / send / read: Internal, one message per step
 * - deadline:                  DeadlineExceeded
 * - peer verdict:              DataLoss passed through, otherwise Internal
 */
class StreamingTransferProxy {
public:
    StreamingTransferProxy(const PathValidator& validator,
                           fetch::UrlFetcher& fetcher,
                           dpu::ConnectionProvider& connections,
                           TransferLimits limits);

    Result<TransferResult> handle(const TransferRequest& request,
                                  const std::string& dpu_index,
                                  const CallMetadata& metadata,
                                  Deadline caller_deadline = Deadline::never()) const;

private:
    const PathValidator& validator_;
    fetch::UrlFetcher& fetcher_;
    dpu::ConnectionProvider& connections_;
    TransferLimits limits_;
};

} // namespace ftr::file
