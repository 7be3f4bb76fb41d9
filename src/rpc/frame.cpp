#include "ftr/rpc/frame.hpp"

namespace ftr::rpc {

const char* frame_type_name(FrameType type) {
    switch (type) {
        case FrameType::CallStart: return "CallStart";
        case FrameType::TransferRequest: return "TransferRequest";
        case FrameType::TransferResponse: return "TransferResponse";
        case FrameType::PutOpen: return "PutOpen";
        case FrameType::PutContent: return "PutContent";
        case FrameType::PutHash: return "PutHash";
        case FrameType::EndOfStream: return "EndOfStream";
        case FrameType::RemoveRequest: return "RemoveRequest";
        case FrameType::Status: return "Status";
    }
    return "Unknown";
}

bool is_known_frame_type(std::uint8_t raw) {
    return raw >= static_cast<std::uint8_t>(FrameType::CallStart) &&
           raw <= static_cast<std::uint8_t>(FrameType::Status);
}

std::vector<std::uint8_t> serialize_frame(const Frame& frame) {
    ByteWriter writer;
    writer.u32(static_cast<std::uint32_t>(frame.payload.size()));
    writer.u8(static_cast<std::uint8_t>(frame.type));
    writer.raw(frame.payload.data(), frame.payload.size());
    return writer.take();
}

void ByteWriter::u16(std::uint16_t v) {
    out_.push_back(static_cast<std::uint8_t>(v >> 8));
    out_.push_back(static_cast<std::uint8_t>(v));
}

void ByteWriter::u32(std::uint32_t v) {
    out_.push_back(static_cast<std::uint8_t>(v >> 24));
    out_.push_back(static_cast<std::uint8_t>(v >> 16));
    out_.push_back(static_cast<std::uint8_t>(v >> 8));
    out_.push_back(static_cast<std::uint8_t>(v));
}

void ByteWriter::str(const std::string& s) {
    u32(static_cast<std::uint32_t>(s.size()));
    raw(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

void ByteWriter::bytes(const std::vector<std::uint8_t>& b) {
    u32(static_cast<std::uint32_t>(b.size()));
    raw(b.data(), b.size());
}

void ByteWriter::raw(const std::uint8_t* data, std::size_t size) {
    out_.insert(out_.end(), data, data + size);
}

Result<void> ByteReader::need(std::size_t n) const {
    if (size_ - pos_ < n) {
        return Fail<void>(StatusCode::InvalidArgument,
            "truncated frame payload: need " + std::to_string(n) + " bytes, have " +
            std::to_string(size_ - pos_));
    }
    return Ok();
}

Result<std::uint8_t> ByteReader::u8() {
    if (auto res = need(1); res.is_error()) {
        return Err<std::uint8_t>(res.error());
    }
    return Ok<std::uint8_t>(data_[pos_++]);
}

Result<std::uint16_t> ByteReader::u16() {
    if (auto res = need(2); res.is_error()) {
        return Err<std::uint16_t>(res.error());
    }
    const auto v = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return Ok<std::uint16_t>(v);
}

Result<std::uint32_t> ByteReader::u32() {
    if (auto res = need(4); res.is_error()) {
        return Err<std::uint32_t>(res.error());
    }
    const auto v = (static_cast<std::uint32_t>(data_[pos_]) << 24) |
                   (static_cast<std::uint32_t>(data_[pos_ + 1]) << 16) |
                   (static_cast<std::uint32_t>(data_[pos_ + 2]) << 8) |
                   static_cast<std::uint32_t>(data_[pos_ + 3]);
    pos_ += 4;
    return Ok<std::uint32_t>(v);
}

Result<std::string> ByteReader::str() {
    auto len = u32();
    if (len.is_error()) {
        return Err<std::string>(len.error());
    }
    if (auto res = need(len.value()); res.is_error()) {
        return Err<std::string>(res.error());
    }
    std::string s(reinterpret_cast<const char*>(data_ + pos_), len.value());
    pos_ += len.value();
    return Ok(std::move(s));
}

Result<std::vector<std::uint8_t>> ByteReader::bytes() {
    auto len = u32();
    if (len.is_error()) {
        return Err<std::vector<std::uint8_t>>(len.error());
    }
    if (auto res = need(len.value()); res.is_error()) {
        return Err<std::vector<std::uint8_t>>(res.error());
    }
    std::vector<std::uint8_t> b(data_ + pos_, data_ + pos_ + len.value());
    pos_ += len.value();
    return Ok(std::move(b));
}

} // namespace ftr::rpc
