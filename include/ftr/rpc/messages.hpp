#pragma once

#include "ftr/core/result.hpp"
#include "ftr/file/types.hpp"
#include "ftr/rpc/frame.hpp"

#include <cstdint>
#include <string>

namespace ftr::rpc {

enum class Method : std::uint8_t {
    TransferToRemote = 1,
    Put = 2,
    Remove = 3
};

const char* method_name(Method method);

struct CallStart {
    Method method = Method::TransferToRemote;
    file::CallMetadata metadata;
};

Frame encode_call_start(const CallStart& call);
Result<CallStart> decode_call_start(const Frame& frame);

Frame encode_transfer_request(const file::TransferRequest& request);
Result<file::TransferRequest> decode_transfer_request(const Frame& frame);

Frame encode_transfer_response(const file::TransferResult& result);
Result<file::TransferResult> decode_transfer_response(const Frame& frame);

Frame encode_put_message(const file::PutMessage& message);

/// Maps PutOpen/PutContent/PutHash frames onto the message variant
Result<file::PutMessage> decode_put_message(const Frame& frame);

/// Content frame straight from a caller-owned buffer, without an extra copy into a PutContent
Frame encode_put_content(const std::uint8_t* data, std::size_t size);

Frame encode_end_of_stream();

Frame encode_remove_request(const std::string& remote_file);
Result<std::string> decode_remove_request(const Frame& frame);

Frame encode_status(StatusCode code, const std::string& message);
inline Frame encode_status(const Result<void>& result) {
    return result.is_ok() ? encode_status(StatusCode::Ok, "")
                          : encode_status(result.error().code, result.error().message);
}

/// Ok for a Status frame carrying OK; the carried error otherwise
Result<void> decode_status(const Frame& frame);

} // namespace ftr::rpc
