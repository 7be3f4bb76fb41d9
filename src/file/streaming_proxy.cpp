#include "ftr/file/streaming_proxy.hpp"
#include "ftr/file/digest.hpp"
#include "ftr/file/digesting_stream.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace ftr::file {

StreamingTransferProxy::StreamingTransferProxy(const PathValidator& validator,
                                               fetch::UrlFetcher& fetcher,
                                               dpu::ConnectionProvider& connections,
                                               TransferLimits limits)
    : validator_(validator)
    , fetcher_(fetcher)
    , connections_(connections)
    , limits_(limits) {
}

Result<TransferResult> StreamingTransferProxy::handle(const TransferRequest& request,
                                                      const std::string& dpu_index,
                                                      const CallMetadata& metadata,
                                                      Deadline caller_deadline) const {
    if (dpu_index.empty()) {
        return Fail<TransferResult>(StatusCode::InvalidArgument, "dpu index cannot be empty");
    }

    auto url = check_transfer_request(request);
    if (url.is_error()) {
        return Err<TransferResult>(url.error());
    }

    // The DPU translates for its own host; only the allow-list applies here
    auto remote_path = validator_.validate(request.local_path);
    if (remote_path.is_error()) {
        return Err<TransferResult>(remote_path.error().wrap("invalid local_path"));
    }

    auto digest = DigestAccumulator::create(limits_.digest);
    if (digest.is_error()) {
        return Err<TransferResult>(digest.error());
    }

    const Deadline deadline = caller_deadline.capped(limits_.timeout);

    auto source = fetcher_.open(url.value(), limits_.max_bytes, deadline);
    if (source.is_error()) {
        return Fail<TransferResult>(StatusCode::Internal,
            "failed to create HTTP stream: " + source.error().message);
    }

    auto channel = connections_.get_connection(dpu_index, deadline);
    if (channel.is_error()) {
        return Err<TransferResult>(channel.error());
    }

    auto call = channel.value()->open_put(metadata, deadline);
    if (call.is_error()) {
        return Fail<TransferResult>(StatusCode::Internal,
            "failed to create Put call: " + call.error().message);
    }
    auto& put = *call.value();

    auto opened = put.send(PutOpen{remote_path.value(), kDefaultPermissions, limits_.digest});
    if (opened.is_error()) {
        return Fail<TransferResult>(StatusCode::Internal,
            "failed to send open request: " + opened.error().message);
    }

    DigestingStream tee(*source.value().stream, digest.value());
    std::vector<std::uint8_t> buffer(limits_.chunk_size);
    std::uint64_t total = 0;

    while (true) {
        if (deadline.expired()) {
            return Fail<TransferResult>(StatusCode::DeadlineExceeded, "streaming operation timed out");
        }

        auto n = tee.read(buffer.data(), buffer.size());
        if (n.is_error()) {
            if (n.error().code == StatusCode::DeadlineExceeded) {
                return Fail<TransferResult>(StatusCode::DeadlineExceeded, "streaming operation timed out");
            }
            return Fail<TransferResult>(StatusCode::Internal,
                "failed to read from HTTP stream: " + n.error().message);
        }
        if (n.value() == 0) {
            break;
        }

        auto sent = put.send_content(buffer.data(), n.value());
        if (sent.is_error()) {
            return Fail<TransferResult>(StatusCode::Internal,
                "failed to send content chunk: " + sent.error().message);
        }
        total += n.value();
    }

    auto hash = digest.value().finish();
    if (hash.is_error()) {
        return Err<TransferResult>(hash.error());
    }

    auto hash_sent = put.send(PutHash{hash.value()});
    if (hash_sent.is_error()) {
        return Fail<TransferResult>(StatusCode::Internal,
            "failed to send hash: " + hash_sent.error().message);
    }

    auto ack = put.close_and_receive();
    if (ack.is_error()) {
        if (ack.error().code == StatusCode::DataLoss) {
            return Err<TransferResult>(ack.error());
        }
        return Fail<TransferResult>(StatusCode::Internal,
            "failed to complete Put: " + ack.error().message);
    }

    spdlog::info("Relayed {} -> DPU {}:{} ({} bytes, {} {})",
                 url.value(), dpu_index, remote_path.value(), total,
                 digest_method_name(hash.value().method), to_hex(hash.value().bytes));

    TransferResult result;
    result.hash = std::move(hash.value());
    result.bytes = total;
    return Ok(std::move(result));
}

} // namespace ftr::file
