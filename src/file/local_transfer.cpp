#include "ftr/file/local_transfer.hpp"
#include "ftr/file/digest.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <vector>

namespace ftr::file {

namespace fs = std::filesystem;

namespace {

void remove_partial(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove partial file {}: {}", path, ec.message());
    }
}

} // namespace

LocalTransferHandler::LocalTransferHandler(const PathValidator& validator,
                                           fetch::UrlFetcher& fetcher,
                                           TransferLimits limits)
    : validator_(validator)
    , fetcher_(fetcher)
    , limits_(limits) {
}

Result<TransferResult> LocalTransferHandler::handle(const TransferRequest& request,
                                                    Deadline caller_deadline) const {
    auto url = check_transfer_request(request);
    if (url.is_error()) {
        return Err<TransferResult>(url.error());
    }

    auto destination = validator_.resolve(request.local_path);
    if (destination.is_error()) {
        return Err<TransferResult>(destination.error().wrap("invalid local_path"));
    }

    const Deadline deadline = caller_deadline.capped(limits_.timeout);

    auto fetched = fetcher_.open(url.value(), limits_.max_bytes, deadline);
    if (fetched.is_error()) {
        return Err<TransferResult>(fetched.error().wrap("download failed"));
    }

    auto written = download(*fetched.value().stream, destination.value(), deadline);
    if (written.is_error()) {
        return Err<TransferResult>(written.error().wrap("download failed"));
    }

    auto hash = digest_file(limits_.digest, destination.value());
    if (hash.is_error()) {
        remove_partial(destination.value());
        return Fail<TransferResult>(StatusCode::Internal,
            "hash calculation failed: " + hash.error().message);
    }

    spdlog::info("Downloaded {} -> {} ({} bytes, {} {})",
                 url.value(), destination.value(), written.value(),
                 digest_method_name(hash.value().method), to_hex(hash.value().bytes));

    TransferResult result;
    result.hash = std::move(hash.value());
    result.bytes = written.value();
    return Ok(std::move(result));
}

Result<std::uint64_t> LocalTransferHandler::download(fetch::ByteStream& stream,
                                                     const std::string& destination,
                                                     Deadline deadline) const {
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Fail<std::uint64_t>(StatusCode::Internal, "cannot create " + destination);
    }

    std::vector<std::uint8_t> buffer(limits_.chunk_size);
    std::uint64_t total = 0;

    while (true) {
        if (deadline.expired()) {
            out.close();
            remove_partial(destination);
            return Fail<std::uint64_t>(StatusCode::DeadlineExceeded, "download timed out");
        }

        auto n = stream.read(buffer.data(), buffer.size());
        if (n.is_error()) {
            out.close();
            remove_partial(destination);
            return Err<std::uint64_t>(n.error());
        }
        if (n.value() == 0) {
            break;
        }

        out.write(reinterpret_cast<const char*>(buffer.data()),
                  static_cast<std::streamsize>(n.value()));
        if (!out) {
            out.close();
            remove_partial(destination);
            return Fail<std::uint64_t>(StatusCode::Internal, "failed to write " + destination);
        }
        total += n.value();
    }

    out.close();
    if (!out) {
        remove_partial(destination);
        return Fail<std::uint64_t>(StatusCode::Internal, "failed to close " + destination);
    }
    return Ok(total);
}

} // namespace ftr::file
