#include "ftr/rpc/frame_parser.hpp"

#include <algorithm>

namespace ftr::rpc {

Result<std::size_t> FrameParser::parse(const std::uint8_t* data, std::size_t len) {
    std::size_t pos = 0;
    while (pos < len) {
        switch (state_) {
            case FrameParseState::HEADER: {
                const std::size_t take = std::min(kFrameHeaderSize - header_filled_, len - pos);
                std::copy_n(data + pos, take, header_.begin() + static_cast<std::ptrdiff_t>(header_filled_));
                header_filled_ += take;
                pos += take;
                if (header_filled_ == kFrameHeaderSize) {
                    if (auto res = finish_header(); res.is_error()) {
                        state_ = FrameParseState::PARSE_ERROR;
                        return Err<std::size_t>(res.error());
                    }
                }
                break;
            }

            case FrameParseState::PAYLOAD: {
                const std::size_t missing = payload_expected_ - current_.payload.size();
                const std::size_t take = std::min(missing, len - pos);
                current_.payload.insert(current_.payload.end(), data + pos, data + pos + take);
                pos += take;
                if (current_.payload.size() == payload_expected_) {
                    ready_.push_back(std::move(current_));
                    current_ = Frame{};
                    header_filled_ = 0;
                    state_ = FrameParseState::HEADER;
                }
                break;
            }

            case FrameParseState::PARSE_ERROR:
                return Fail<std::size_t>(StatusCode::InvalidArgument, "frame parser in error state");
        }
    }
    return Ok(ready_.size());
}

Result<void> FrameParser::finish_header() {
    const std::uint32_t length = (static_cast<std::uint32_t>(header_[0]) << 24) |
                                 (static_cast<std::uint32_t>(header_[1]) << 16) |
                                 (static_cast<std::uint32_t>(header_[2]) << 8) |
                                 static_cast<std::uint32_t>(header_[3]);
    const std::uint8_t type = header_[4];

    if (!is_known_frame_type(type)) {
        return Fail<void>(StatusCode::InvalidArgument, "unknown frame type " + std::to_string(type));
    }
    if (length > max_payload_) {
        return Fail<void>(StatusCode::InvalidArgument,
            "frame payload of " + std::to_string(length) + " bytes exceeds limit of " +
            std::to_string(max_payload_));
    }

    current_ = Frame{};
    current_.type = static_cast<FrameType>(type);
    payload_expected_ = length;

    if (length == 0) {
        ready_.push_back(std::move(current_));
        current_ = Frame{};
        header_filled_ = 0;
        state_ = FrameParseState::HEADER;
        return Ok();
    }

    current_.payload.reserve(length);
    state_ = FrameParseState::PAYLOAD;
    return Ok();
}

std::optional<Frame> FrameParser::next() {
    if (ready_.empty()) {
        return std::nullopt;
    }
    Frame frame = std::move(ready_.front());
    ready_.pop_front();
    return frame;
}

void FrameParser::reset() {
    state_ = FrameParseState::HEADER;
    header_filled_ = 0;
    payload_expected_ = 0;
    current_ = Frame{};
    ready_.clear();
}

} // namespace ftr::rpc
