#include "ftr/file/digest.hpp"
#include "ftr/file/streaming_proxy.hpp"
#include "support/loopback_channel.hpp"
#include "support/test_util.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace ftr;
using namespace ftr::file;

namespace fs = std::filesystem;

namespace {

TransferRequest http_request(const std::string& destination, const std::string& url) {
    TransferRequest request;
    request.local_path = destination;
    request.source = RemoteSource{TransferProtocol::Http, url};
    return request;
}

/**
 * The relay and the DPU share one allow-list directory; the loopback
 * channel plays the DPU, so every byte on disk got there through Put.
 */
class StreamingProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test::create_temp_dir("ftr_proxy");
        validator_ = test::validator_for(dir_);
        channel_ = std::make_shared<test::LoopbackChannel>(validator_);
        provider_ = std::make_unique<test::StaticConnectionProvider>(channel_);
        limits_.chunk_size = 4096;
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    Result<TransferResult> run(test::StringFetcher& fetcher, const TransferRequest& request,
                               const std::string& dpu = "0",
                               Deadline deadline = Deadline::never()) {
        StreamingTransferProxy proxy(validator_, fetcher, *provider_, limits_);
        return proxy.handle(request, dpu, {{kTargetTypeKey, "dpu"}, {kTargetIndexKey, dpu}}, deadline);
    }

    fs::path dir_;
    PathValidator validator_;
    TransferLimits limits_;
    std::shared_ptr<test::LoopbackChannel> channel_;
    std::unique_ptr<test::StaticConnectionProvider> provider_;
};

} // namespace

TEST_F(StreamingProxyTest, RelaysSourceToDpuInChunks) {
    const std::string payload = test::make_payload(50 * 1024 + 7);
    test::StringFetcher fetcher(payload);

    auto result = run(fetcher, http_request(path("relayed.bin"), "http://h/relayed.bin"));
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    auto expected = digest_bytes(DigestMethod::Md5, payload.data(), payload.size());
    EXPECT_EQ(result.value().hash.bytes, expected.value().bytes);
    EXPECT_EQ(result.value().bytes, payload.size());

    EXPECT_EQ(test::read_file(path("relayed.bin")), payload);
    EXPECT_EQ(channel_->puts_opened.load(), 1);
    EXPECT_EQ(channel_->content_messages.load(), 13);
    ASSERT_EQ(provider_->requested.size(), 1u);
    EXPECT_EQ(provider_->requested[0], "0");
    EXPECT_EQ(channel_->last_metadata.at(kTargetIndexKey), "0");
    EXPECT_FALSE(channel_->shut_down.load());
}

TEST_F(StreamingProxyTest, EmptySourceProducesEmptyFile) {
    test::StringFetcher fetcher("");

    auto result = run(fetcher, http_request(path("empty.bin"), "http://h/empty"));
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(to_hex(result.value().hash.bytes), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_TRUE(fs::exists(path("empty.bin")));
    EXPECT_EQ(channel_->content_messages.load(), 0);
}

TEST_F(StreamingProxyTest, CorruptedRelayIsDataLoss) {
    test::StringFetcher fetcher(test::make_payload(20000));
    channel_->corrupt_content_index = 2;

    auto result = run(fetcher, http_request(path("corrupt.bin"), "http://h/c"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::DataLoss);
    EXPECT_FALSE(fs::exists(path("corrupt.bin")));
}

TEST_F(StreamingProxyTest, EmptyDpuIndexIsInvalidArgument) {
    test::StringFetcher fetcher("x");
    auto result = run(fetcher, http_request(path("a"), "http://h/a"), "");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::InvalidArgument);
    EXPECT_EQ(fetcher.opens, 0);
}

// Forbidden destination fails before any network access, even with routing
TEST_F(StreamingProxyTest, ForbiddenDestinationFailsBeforeIo) {
    test::StringFetcher fetcher("x");
    auto result = run(fetcher, http_request("/etc/passwd", "http://h/passwd"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::InvalidArgument);
    EXPECT_EQ(fetcher.opens, 0);
    EXPECT_TRUE(provider_->requested.empty());
    EXPECT_EQ(channel_->puts_opened.load(), 0);
}

TEST_F(StreamingProxyTest, UnsupportedProtocolIsUnimplemented) {
    test::StringFetcher fetcher("x");
    TransferRequest request;
    request.local_path = path("a");
    request.source = RemoteSource{TransferProtocol::Scp, "scp://h/a"};

    auto result = run(fetcher, request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::Unimplemented);
}

TEST_F(StreamingProxyTest, SourceOpenFailureIsInternal) {
    test::StringFetcher fetcher("x");
    fetcher.open_error = Error{StatusCode::NotFound, "remote file not found"};

    auto result = run(fetcher, http_request(path("a"), "http://h/a"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::Internal);
    EXPECT_EQ(result.error().message, "failed to create HTTP stream: remote file not found");
    EXPECT_TRUE(provider_->requested.empty());
}

TEST_F(StreamingProxyTest, ProviderErrorPassesThrough) {
    test::StringFetcher fetcher("x");
    provider_->error = Error{StatusCode::Unavailable, "DPU 0 is not reachable"};

    auto result = run(fetcher, http_request(path("a"), "http://h/a"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::Unavailable);
    EXPECT_EQ(result.error().message, "DPU 0 is not reachable");
}

TEST_F(StreamingProxyTest, PutSetupFailureIsInternal) {
    test::StringFetcher fetcher("x");
    channel_->open_error = Error{StatusCode::Unavailable, "connection reset"};

    auto result = run(fetcher, http_request(path("a"), "http://h/a"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::Internal);
    EXPECT_EQ(result.error().message, "failed to create Put call: connection reset");
}

TEST_F(StreamingProxyTest, SourceReadFailureAbortsRelay) {
    test::StringFetcher fetcher(test::make_payload(20000));
    fetcher.fail_after = 8192;

    auto result = run(fetcher, http_request(path("broken.bin"), "http://h/b"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::Internal);
    EXPECT_EQ(result.error().message, "failed to read from HTTP stream: connection reset by peer");
    EXPECT_FALSE(fs::exists(path("broken.bin")));
    EXPECT_FALSE(fs::exists(path("broken.bin") + PutReceiver::kTempSuffix));
}

TEST_F(StreamingProxyTest, ContentSendFailureAbortsRelay) {
    test::StringFetcher fetcher(test::make_payload(20000));
    channel_->fail_content_index = 1;

    auto result = run(fetcher, http_request(path("send.bin"), "http://h/s"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::Internal);
    EXPECT_EQ(result.error().message.rfind("failed to send content chunk: ", 0), 0u);
    EXPECT_FALSE(fs::exists(path("send.bin")));
}

TEST_F(StreamingProxyTest, ExpiredDeadlineIsDeadlineExceeded) {
    test::StringFetcher fetcher(test::make_payload(20000));

    auto result = run(fetcher, http_request(path("late.bin"), "http://h/l"), "0",
                      Deadline(Deadline::clock::now() - std::chrono::seconds(1)));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::DeadlineExceeded);
    EXPECT_EQ(result.error().message, "streaming operation timed out");
    EXPECT_FALSE(fs::exists(path("late.bin")));
}
