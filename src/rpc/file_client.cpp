#include "ftr/rpc/file_client.hpp"
#include "ftr/file/digest.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <vector>

namespace ftr::rpc {

FileClient::FileClient(std::shared_ptr<Channel> channel)
    : channel_(std::move(channel)) {
}

Result<file::TransferResult> FileClient::transfer_to_remote(const std::string& local_path,
                                                            const std::string& url,
                                                            const file::CallMetadata& metadata,
                                                            Deadline deadline) {
    file::TransferRequest request;
    request.local_path = local_path;
    request.source = file::RemoteSource{file::TransferProtocol::Http, url};
    return channel_->transfer_to_remote(metadata, request, deadline);
}

Result<void> FileClient::remove(const std::string& remote_file,
                                const file::CallMetadata& metadata,
                                Deadline deadline) {
    return channel_->remove(metadata, remote_file, deadline);
}

Result<std::uint64_t> FileClient::put_file(const std::string& source_path,
                                           const std::string& remote_file,
                                           const PutOptions& options,
                                           const file::CallMetadata& metadata,
                                           Deadline deadline) {
    std::ifstream in(source_path, std::ios::binary);
    if (!in) {
        return Fail<std::uint64_t>(StatusCode::NotFound, "cannot open " + source_path);
    }

    auto digest = file::DigestAccumulator::create(options.digest);
    if (digest.is_error()) {
        return Err<std::uint64_t>(digest.error());
    }

    auto call = channel_->open_put(metadata, deadline);
    if (call.is_error()) {
        return Err<std::uint64_t>(call.error());
    }
    auto& put = *call.value();

    auto opened = put.send(file::PutOpen{remote_file, options.permissions, options.digest});
    if (opened.is_error()) {
        return Err<std::uint64_t>(opened.error());
    }

    std::vector<std::uint8_t> chunk(options.chunk_size > 0 ? options.chunk_size : 64 * 1024);
    std::uint64_t total = 0;
    while (in) {
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        auto n = static_cast<std::size_t>(in.gcount());
        if (n == 0) {
            break;
        }
        if (auto res = digest.value().update(chunk.data(), n); res.is_error()) {
            return Err<std::uint64_t>(res.error());
        }
        if (auto res = put.send_content(chunk.data(), n); res.is_error()) {
            return Err<std::uint64_t>(res.error());
        }
        total += n;
    }
    if (in.bad()) {
        return Fail<std::uint64_t>(StatusCode::Internal, "read error on " + source_path);
    }

    auto hash = digest.value().finish();
    if (hash.is_error()) {
        return Err<std::uint64_t>(hash.error());
    }
    if (auto res = put.send(file::PutHash{hash.value()}); res.is_error()) {
        return Err<std::uint64_t>(res.error());
    }

    auto status = put.close_and_receive();
    if (status.is_error()) {
        return Err<std::uint64_t>(status.error());
    }

    spdlog::debug("Put {} -> {} ({} bytes, {} {})", source_path, remote_file, total,
                  file::digest_method_name(hash.value().method), file::to_hex(hash.value().bytes));
    return Ok(total);
}

} // namespace ftr::rpc
