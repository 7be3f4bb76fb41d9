#include "ftr/file/transfer_request.hpp"

namespace ftr::file {

Result<std::string> check_transfer_request(const TransferRequest& request) {
    if (!request.source) {
        return Fail<std::string>(StatusCode::InvalidArgument, "remote source cannot be empty");
    }
    if (request.local_path.empty()) {
        return Fail<std::string>(StatusCode::InvalidArgument, "local_path cannot be empty");
    }
    if (request.source->url.empty()) {
        return Fail<std::string>(StatusCode::InvalidArgument,
            "remote download path (URL) cannot be empty");
    }
    if (request.source->protocol != TransferProtocol::Http) {
        return Fail<std::string>(StatusCode::Unimplemented,
            std::string("only HTTP protocol is supported, got protocol ") +
            protocol_name(request.source->protocol));
    }
    return Ok(request.source->url);
}

} // namespace ftr::file
