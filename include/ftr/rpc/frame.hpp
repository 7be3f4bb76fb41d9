#pragma once

#include "ftr/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ftr::rpc {

/**
 * Wire layout of every frame:
 *
 *   +----------------+--------+-----------------+
 *   | length (u32 BE)| type u8| payload[length] |
 *   +----------------+--------+-----------------+
 */
inline constexpr std::size_t kFrameHeaderSize = 5;
inline constexpr std::uint32_t kMaxFramePayload = 4 * 1024 * 1024;

enum class FrameType : std::uint8_t {
    CallStart = 1,
    TransferRequest = 2,
    TransferResponse = 3,
    PutOpen = 4,
    PutContent = 5,
    PutHash = 6,
    EndOfStream = 7,
    RemoveRequest = 8,
    Status = 9
};

const char* frame_type_name(FrameType type);
bool is_known_frame_type(std::uint8_t raw);

struct Frame {
    FrameType type = FrameType::Status;
    std::vector<std::uint8_t> payload;
};

/// Header + payload, ready for the socket
std::vector<std::uint8_t> serialize_frame(const Frame& frame);

/**
 * @brief Appends big-endian integers and length-prefixed fields
 */
class ByteWriter {
public:
    void u8(std::uint8_t v) { out_.push_back(v); }
    void u16(std::uint16_t v);
    void u32(std::uint32_t v);
    void str(const std::string& s);                    ///< u32 length + bytes
    void bytes(const std::vector<std::uint8_t>& b);    ///< u32 length + bytes
    void raw(const std::uint8_t* data, std::size_t size);

    std::vector<std::uint8_t> take() { return std::move(out_); }

private:
    std::vector<std::uint8_t> out_;
};

/**
 * @brief Bounds-checked reader over one frame payload
 *
 * Every accessor fails with InvalidArgument on truncation.
 */
class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<std::uint8_t>& buffer)
        : ByteReader(buffer.data(), buffer.size()) {}

    Result<std::uint8_t> u8();
    Result<std::uint16_t> u16();
    Result<std::uint32_t> u32();
    Result<std::string> str();
    Result<std::vector<std::uint8_t>> bytes();

    std::size_t remaining() const noexcept { return size_ - pos_; }
    bool at_end() const noexcept { return pos_ == size_; }

private:
    Result<void> need(std::size_t n) const;

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
};

} // namespace ftr::rpc
