#pragma once

#include "ftr/core/deadline.hpp"
#include "ftr/core/result.hpp"
#include "ftr/fetch/byte_stream.hpp"
#include "ftr/file/path_validator.hpp"
#include "ftr/file/transfer_request.hpp"
#include "ftr/file/types.hpp"

namespace ftr::file {

/**
 * @brief TransferToRemote with local storage as the destination
 *
 * Downloads straight into the validated destination, then digests the
 * stored file. Any failure after the file was created removes it.
 */
class LocalTransferHandler {
public:
    LocalTransferHandler(const PathValidator& validator,
                         fetch::UrlFetcher& fetcher,
                         TransferLimits limits);

    /// caller_deadline is tightened to limits.timeout from now
    Result<TransferResult> handle(const TransferRequest& request,
                                  Deadline caller_deadline = Deadline::never()) const;

    const TransferLimits& limits() const noexcept { return limits_; }

private:
    Result<std::uint64_t> download(fetch::ByteStream& stream,
                                   const std::string& destination,
                                   Deadline deadline) const;

    const PathValidator& validator_;
    fetch::UrlFetcher& fetcher_;
    TransferLimits limits_;
};

} // namespace ftr::file
