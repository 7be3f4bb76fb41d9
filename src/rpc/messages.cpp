#include "ftr/rpc/messages.hpp"

namespace ftr::rpc {

namespace {

template<typename T>
Result<T> wrong_frame(const Frame& frame, FrameType expected) {
    return Fail<T>(StatusCode::InvalidArgument,
        std::string("expected ") + frame_type_name(expected) + " frame, got " +
        frame_type_name(frame.type));
}

Result<void> expect_end(const ByteReader& reader, FrameType type) {
    if (!reader.at_end()) {
        return Fail<void>(StatusCode::InvalidArgument,
            std::string("trailing bytes in ") + frame_type_name(type) + " frame");
    }
    return Ok();
}

Result<file::DigestMethod> read_digest_method(ByteReader& reader) {
    auto raw = reader.u8();
    if (raw.is_error()) {
        return Err<file::DigestMethod>(raw.error());
    }
    if (raw.value() > static_cast<std::uint8_t>(file::DigestMethod::Sha512)) {
        return Fail<file::DigestMethod>(StatusCode::InvalidArgument,
            "unknown digest method " + std::to_string(raw.value()));
    }
    return Ok(static_cast<file::DigestMethod>(raw.value()));
}

} // namespace

const char* method_name(Method method) {
    switch (method) {
        case Method::TransferToRemote: return "TransferToRemote";
        case Method::Put: return "Put";
        case Method::Remove: return "Remove";
    }
    return "Unknown";
}

Frame encode_call_start(const CallStart& call) {
    ByteWriter writer;
    writer.u8(static_cast<std::uint8_t>(call.method));
    writer.u16(static_cast<std::uint16_t>(call.metadata.size()));
    for (const auto& [key, value] : call.metadata) {
        writer.str(key);
        writer.str(value);
    }
    return Frame{FrameType::CallStart, writer.take()};
}

Result<CallStart> decode_call_start(const Frame& frame) {
    if (frame.type != FrameType::CallStart) {
        return wrong_frame<CallStart>(frame, FrameType::CallStart);
    }
    ByteReader reader(frame.payload);
    auto method = reader.u8();
    if (method.is_error()) {
        return Err<CallStart>(method.error());
    }
    if (method.value() < static_cast<std::uint8_t>(Method::TransferToRemote) ||
        method.value() > static_cast<std::uint8_t>(Method::Remove)) {
        return Fail<CallStart>(StatusCode::Unimplemented,
            "unknown method " + std::to_string(method.value()));
    }

    CallStart call;
    call.method = static_cast<Method>(method.value());

    auto count = reader.u16();
    if (count.is_error()) {
        return Err<CallStart>(count.error());
    }
    for (std::uint16_t i = 0; i < count.value(); ++i) {
        auto key = reader.str();
        if (key.is_error()) {
            return Err<CallStart>(key.error());
        }
        auto value = reader.str();
        if (value.is_error()) {
            return Err<CallStart>(value.error());
        }
        call.metadata[key.value()] = value.value();
    }
    if (auto res = expect_end(reader, frame.type); res.is_error()) {
        return Err<CallStart>(res.error());
    }
    return Ok(std::move(call));
}

Frame encode_transfer_request(const file::TransferRequest& request) {
    ByteWriter writer;
    writer.str(request.local_path);
    writer.u8(request.source ? 1 : 0);
    if (request.source) {
        writer.u8(static_cast<std::uint8_t>(request.source->protocol));
        writer.str(request.source->url);
    }
    return Frame{FrameType::TransferRequest, writer.take()};
}

Result<file::TransferRequest> decode_transfer_request(const Frame& frame) {
    if (frame.type != FrameType::TransferRequest) {
        return wrong_frame<file::TransferRequest>(frame, FrameType::TransferRequest);
    }
    ByteReader reader(frame.payload);
    file::TransferRequest request;

    auto path = reader.str();
    if (path.is_error()) {
        return Err<file::TransferRequest>(path.error());
    }
    request.local_path = path.value();

    auto has_source = reader.u8();
    if (has_source.is_error()) {
        return Err<file::TransferRequest>(has_source.error());
    }
    if (has_source.value() != 0) {
        auto protocol = reader.u8();
        if (protocol.is_error()) {
            return Err<file::TransferRequest>(protocol.error());
        }
        auto url = reader.str();
        if (url.is_error()) {
            return Err<file::TransferRequest>(url.error());
        }
        // Unknown protocol values survive decoding; the handler rejects them as Unimplemented
        request.source = file::RemoteSource{static_cast<file::TransferProtocol>(protocol.value()), url.value()};
    }
    if (auto res = expect_end(reader, frame.type); res.is_error()) {
        return Err<file::TransferRequest>(res.error());
    }
    return Ok(std::move(request));
}

Frame encode_transfer_response(const file::TransferResult& result) {
    ByteWriter writer;
    writer.u8(static_cast<std::uint8_t>(result.hash.method));
    writer.bytes(result.hash.bytes);
    writer.u32(static_cast<std::uint32_t>(result.bytes >> 32));
    writer.u32(static_cast<std::uint32_t>(result.bytes & 0xFFFFFFFFu));
    return Frame{FrameType::TransferResponse, writer.take()};
}

Result<file::TransferResult> decode_transfer_response(const Frame& frame) {
    if (frame.type != FrameType::TransferResponse) {
        return wrong_frame<file::TransferResult>(frame, FrameType::TransferResponse);
    }
    ByteReader reader(frame.payload);
    file::TransferResult result;

    auto method = read_digest_method(reader);
    if (method.is_error()) {
        return Err<file::TransferResult>(method.error());
    }
    auto hash = reader.bytes();
    if (hash.is_error()) {
        return Err<file::TransferResult>(hash.error());
    }
    auto high = reader.u32();
    if (high.is_error()) {
        return Err<file::TransferResult>(high.error());
    }
    auto low = reader.u32();
    if (low.is_error()) {
        return Err<file::TransferResult>(low.error());
    }
    result.hash.method = method.value();
    result.hash.bytes = std::move(hash.value());
    result.bytes = (static_cast<std::uint64_t>(high.value()) << 32) | low.value();
    return Ok(std::move(result));
}

Frame encode_put_message(const file::PutMessage& message) {
    if (const auto* open = std::get_if<file::PutOpen>(&message)) {
        ByteWriter writer;
        writer.str(open->remote_file);
        writer.u32(open->permissions);
        writer.u8(static_cast<std::uint8_t>(open->digest));
        return Frame{FrameType::PutOpen, writer.take()};
    }
    if (const auto* content = std::get_if<file::PutContent>(&message)) {
        return Frame{FrameType::PutContent, content->data};
    }
    const auto& hash = std::get<file::PutHash>(message);
    ByteWriter writer;
    writer.u8(static_cast<std::uint8_t>(hash.hash.method));
    writer.bytes(hash.hash.bytes);
    return Frame{FrameType::PutHash, writer.take()};
}

Frame encode_put_content(const std::uint8_t* data, std::size_t size) {
    return Frame{FrameType::PutContent, std::vector<std::uint8_t>(data, data + size)};
}

Result<file::PutMessage> decode_put_message(const Frame& frame) {
    switch (frame.type) {
        case FrameType::PutOpen: {
            ByteReader reader(frame.payload);
            auto path = reader.str();
            if (path.is_error()) {
                return Err<file::PutMessage>(path.error());
            }
            auto permissions = reader.u32();
            if (permissions.is_error()) {
                return Err<file::PutMessage>(permissions.error());
            }
            auto method = read_digest_method(reader);
            if (method.is_error()) {
                return Err<file::PutMessage>(method.error());
            }
            if (auto res = expect_end(reader, frame.type); res.is_error()) {
                return Err<file::PutMessage>(res.error());
            }
            return Ok<file::PutMessage>(file::PutOpen{path.value(), permissions.value(), method.value()});
        }
        case FrameType::PutContent:
            return Ok<file::PutMessage>(file::PutContent{frame.payload});
        case FrameType::PutHash: {
            ByteReader reader(frame.payload);
            auto method = read_digest_method(reader);
            if (method.is_error()) {
                return Err<file::PutMessage>(method.error());
            }
            auto bytes = reader.bytes();
            if (bytes.is_error()) {
                return Err<file::PutMessage>(bytes.error());
            }
            if (auto res = expect_end(reader, frame.type); res.is_error()) {
                return Err<file::PutMessage>(res.error());
            }
            return Ok<file::PutMessage>(file::PutHash{file::HashValue{method.value(), std::move(bytes.value())}});
        }
        default:
            return Fail<file::PutMessage>(StatusCode::InvalidArgument,
                std::string("message must contain open, contents or hash, got ") +
                frame_type_name(frame.type));
    }
}

Frame encode_end_of_stream() {
    return Frame{FrameType::EndOfStream, {}};
}

Frame encode_remove_request(const std::string& remote_file) {
    ByteWriter writer;
    writer.str(remote_file);
    return Frame{FrameType::RemoveRequest, writer.take()};
}

Result<std::string> decode_remove_request(const Frame& frame) {
    if (frame.type != FrameType::RemoveRequest) {
        return wrong_frame<std::string>(frame, FrameType::RemoveRequest);
    }
    ByteReader reader(frame.payload);
    auto path = reader.str();
    if (path.is_error()) {
        return path;
    }
    if (auto res = expect_end(reader, frame.type); res.is_error()) {
        return Err<std::string>(res.error());
    }
    return path;
}

Frame encode_status(StatusCode code, const std::string& message) {
    ByteWriter writer;
    writer.u8(static_cast<std::uint8_t>(code));
    writer.str(message);
    return Frame{FrameType::Status, writer.take()};
}

Result<void> decode_status(const Frame& frame) {
    if (frame.type != FrameType::Status) {
        return wrong_frame<void>(frame, FrameType::Status);
    }
    ByteReader reader(frame.payload);
    auto code = reader.u8();
    if (code.is_error()) {
        return Err<void>(code.error());
    }
    auto message = reader.str();
    if (message.is_error()) {
        return Err<void>(message.error());
    }
    if (!is_known_status_code(code.value())) {
        return Fail<void>(StatusCode::Internal,
            "peer sent unknown status code " + std::to_string(code.value()) + ": " + message.value());
    }
    const auto status = static_cast<StatusCode>(code.value());
    if (status == StatusCode::Ok) {
        return Ok();
    }
    return Fail<void>(status, message.value());
}

} // namespace ftr::rpc
