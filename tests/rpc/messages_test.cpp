#include "ftr/rpc/messages.hpp"

#include <gtest/gtest.h>

using namespace ftr;
using namespace ftr::rpc;
using ftr::file::DigestMethod;

TEST(MessagesTest, CallStartCarriesMethodAndMetadata) {
    CallStart call;
    call.method = Method::Put;
    call.metadata = {{"x-target-type", "dpu"}, {"x-target-index", "3"}};

    auto decoded = decode_call_start(encode_call_start(call));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().method, Method::Put);
    EXPECT_EQ(decoded.value().metadata, call.metadata);
}

TEST(MessagesTest, UnknownMethodIsUnimplemented) {
    Frame frame{FrameType::CallStart, {9, 0, 0}};
    auto decoded = decode_call_start(frame);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, StatusCode::Unimplemented);
}

TEST(MessagesTest, TransferRequestWithoutSourceSurvivesDecoding) {
    file::TransferRequest request;
    request.local_path = "/tmp/x";

    auto decoded = decode_transfer_request(encode_transfer_request(request));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().local_path, "/tmp/x");
    EXPECT_FALSE(decoded.value().source.has_value());
}

TEST(MessagesTest, TransferRequestKeepsUnknownProtocol) {
    file::TransferRequest request;
    request.local_path = "/tmp/x";
    request.source = file::RemoteSource{static_cast<file::TransferProtocol>(77), "gopher://h/x"};

    auto decoded = decode_transfer_request(encode_transfer_request(request));
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_TRUE(decoded.value().source.has_value());
    EXPECT_EQ(static_cast<int>(decoded.value().source->protocol), 77);
    EXPECT_EQ(decoded.value().source->url, "gopher://h/x");
}

TEST(MessagesTest, TransferResponseKeepsLargeByteCounts) {
    file::TransferResult result;
    result.hash = file::HashValue{DigestMethod::Sha256, std::vector<std::uint8_t>(32, 0xAB)};
    result.bytes = (5ull << 32) + 17;

    auto decoded = decode_transfer_response(encode_transfer_response(result));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().bytes, result.bytes);
    EXPECT_EQ(decoded.value().hash.method, DigestMethod::Sha256);
    EXPECT_EQ(decoded.value().hash.bytes, result.hash.bytes);
}

TEST(MessagesTest, PutMessagesDecodeToMatchingAlternative) {
    auto open = decode_put_message(encode_put_message(file::PutOpen{"/tmp/f", 0600, DigestMethod::Sha512}));
    ASSERT_TRUE(open.is_ok());
    const auto* o = std::get_if<file::PutOpen>(&open.value());
    ASSERT_NE(o, nullptr);
    EXPECT_EQ(o->remote_file, "/tmp/f");
    EXPECT_EQ(o->permissions, 0600u);
    EXPECT_EQ(o->digest, DigestMethod::Sha512);

    auto hash = decode_put_message(encode_put_message(
        file::PutHash{file::HashValue{DigestMethod::Md5, {1, 2, 3}}}));
    ASSERT_TRUE(hash.is_ok());
    const auto* h = std::get_if<file::PutHash>(&hash.value());
    ASSERT_NE(h, nullptr);
    EXPECT_EQ(h->hash.bytes, (std::vector<std::uint8_t>{1, 2, 3}));
}

TEST(MessagesTest, NonPutFrameIsRejectedAsPutMessage) {
    auto decoded = decode_put_message(encode_remove_request("/tmp/a"));
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, StatusCode::InvalidArgument);
}

TEST(MessagesTest, TruncatedPayloadIsInvalidArgument) {
    auto frame = encode_remove_request("/tmp/long/path");
    frame.payload.resize(frame.payload.size() - 3);

    auto decoded = decode_remove_request(frame);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, StatusCode::InvalidArgument);
}

TEST(MessagesTest, TrailingBytesAreRejected) {
    auto frame = encode_remove_request("/tmp/a");
    frame.payload.push_back(0);
    EXPECT_TRUE(decode_remove_request(frame).is_error());
}

TEST(MessagesTest, StatusFrameRoundTripsErrors) {
    EXPECT_TRUE(decode_status(encode_status(StatusCode::Ok, "")).is_ok());

    auto err = decode_status(encode_status(StatusCode::DataLoss, "hash mismatch"));
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error().code, StatusCode::DataLoss);
    EXPECT_EQ(err.error().message, "hash mismatch");

    Frame unknown{FrameType::Status, {200, 0, 0, 0, 0}};
    auto decoded = decode_status(unknown);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, StatusCode::Internal);
}
