#pragma once

#include "ftr/core/result.hpp"
#include "ftr/rpc/frame.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace ftr::rpc {

enum class FrameParseState {
    HEADER,        // Collecting the 5 header bytes
    PAYLOAD,       // Collecting payload bytes
    PARSE_ERROR    // Oversized or unknown frame; parser unusable
};

/**
 * @brief Incremental frame parser
 *
 * Socket reads arrive with arbitrary boundaries: a read may hold half a
 * header, or several frames at once. Feed every read to parse(); complete
 * frames queue up and are taken with next().
 *
 * Usage:
 * ```cpp
 * FrameParser parser;
 * auto result = parser.parse(buffer.data(), bytes_read);
 * if (result.is_error()) { ... }
 * while (auto frame = parser.next()) { handle(*frame); }
 * ```
 */
class FrameParser {
public:
    explicit FrameParser(std::uint32_t max_payload = kMaxFramePayload)
        : max_payload_(max_payload) {
        reset();
    }

    /// Returns the number of complete frames now waiting
    Result<std::size_t> parse(const std::uint8_t* data, std::size_t len);

    std::optional<Frame> next();

    bool has_frame() const { return !ready_.empty(); }

    /// True when no partial frame is buffered
    bool idle() const { return state_ == FrameParseState::HEADER && header_filled_ == 0; }

    void reset();

private:
    Result<void> finish_header();

    FrameParseState state_;
    std::uint32_t max_payload_;
    std::array<std::uint8_t, kFrameHeaderSize> header_{};
    std::size_t header_filled_ = 0;
    std::uint32_t payload_expected_ = 0;
    Frame current_;
    std::deque<Frame> ready_;
};

} // namespace ftr::rpc
