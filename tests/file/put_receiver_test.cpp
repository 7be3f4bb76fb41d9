#include "ftr/events/event_bus.hpp"
#include "ftr/events/events.hpp"
#include "ftr/file/digest.hpp"
#include "ftr/file/put_receiver.hpp"
#include "support/test_util.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

using namespace ftr;
using namespace ftr::file;

namespace fs = std::filesystem;

namespace {

class PutReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test::create_temp_dir("ftr_put");
        validator_ = test::validator_for(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    static HashValue md5_of(const std::string& data) {
        return digest_bytes(DigestMethod::Md5, data.data(), data.size()).value();
    }

    static PutContent content(const std::string& data) {
        return PutContent{test::bytes_of(data)};
    }

    fs::path dir_;
    PathValidator validator_;
};

} // namespace

TEST_F(PutReceiverTest, CommitsVerifiedFileAtomically) {
    const std::string payload = test::make_payload(150 * 1024);
    PutReceiver receiver(validator_);

    ASSERT_TRUE(receiver.on_message(PutOpen{path("image.bin"), 0, DigestMethod::Md5}).is_ok());
    EXPECT_EQ(receiver.state(), PutState::Receiving);
    EXPECT_TRUE(fs::exists(path("image.bin") + PutReceiver::kTempSuffix));
    EXPECT_FALSE(fs::exists(path("image.bin")));

    for (std::size_t off = 0; off < payload.size(); off += 64 * 1024) {
        ASSERT_TRUE(receiver.on_message(content(payload.substr(off, 64 * 1024))).is_ok());
    }
    ASSERT_TRUE(receiver.on_message(PutHash{md5_of(payload)}).is_ok());

    EXPECT_EQ(receiver.state(), PutState::Done);
    EXPECT_EQ(receiver.bytes_received(), payload.size());
    EXPECT_EQ(test::read_file(path("image.bin")), payload);
    EXPECT_FALSE(fs::exists(path("image.bin") + PutReceiver::kTempSuffix));
    EXPECT_TRUE(receiver.on_end_of_stream().is_ok());
}

TEST_F(PutReceiverTest, DefaultsPermissionsTo0644) {
    PutReceiver receiver(validator_);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("mode.bin"), 0, DigestMethod::Unspecified}).is_ok());
    ASSERT_TRUE(receiver.on_message(content("data")).is_ok());
    ASSERT_TRUE(receiver.on_message(PutHash{md5_of("data")}).is_ok());

    const auto perms = fs::status(path("mode.bin")).permissions();
    EXPECT_EQ(perms & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_write |
              fs::perms::group_read | fs::perms::others_read);
}

TEST_F(PutReceiverTest, AppliesRequestedPermissions) {
    PutReceiver receiver(validator_);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("exec.sh"), 0750, DigestMethod::Md5}).is_ok());
    ASSERT_TRUE(receiver.on_message(content("#!/bin/sh\n")).is_ok());
    ASSERT_TRUE(receiver.on_message(PutHash{md5_of("#!/bin/sh\n")}).is_ok());

    const auto perms = fs::status(path("exec.sh")).permissions();
    EXPECT_EQ(perms & fs::perms::all,
              fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
}

// Open, Content summing to D, Hash carrying D' != D
TEST_F(PutReceiverTest, HashMismatchIsDataLossAndLeavesNoFile) {
    events::EventBus bus;
    int failures = 0;
    StatusCode failure_code = StatusCode::Ok;
    bus.subscribe<events::PutFailedEvent>([&](const events::PutFailedEvent& e) {
        ++failures;
        failure_code = e.code;
    });

    PutReceiver receiver(validator_, &bus);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("corrupt.bin"), 0644, DigestMethod::Md5}).is_ok());
    ASSERT_TRUE(receiver.on_message(content("hello ")).is_ok());
    ASSERT_TRUE(receiver.on_message(content("world")).is_ok());

    auto result = receiver.on_message(PutHash{md5_of("hello world!")});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::DataLoss);
    EXPECT_EQ(receiver.state(), PutState::Failed);

    EXPECT_FALSE(fs::exists(path("corrupt.bin")));
    EXPECT_FALSE(fs::exists(path("corrupt.bin") + PutReceiver::kTempSuffix));
    EXPECT_EQ(failures, 1);
    EXPECT_EQ(failure_code, StatusCode::DataLoss);
}

TEST_F(PutReceiverTest, MismatchKeepsPreviousDestinationIntact) {
    test::write_file(path("existing.bin"), "old contents");

    PutReceiver receiver(validator_);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("existing.bin"), 0, DigestMethod::Md5}).is_ok());
    ASSERT_TRUE(receiver.on_message(content("new contents")).is_ok());
    ASSERT_TRUE(receiver.on_message(PutHash{md5_of("other")}).is_error());

    EXPECT_EQ(test::read_file(path("existing.bin")), "old contents");
}

TEST_F(PutReceiverTest, FirstMessageMustBeOpen) {
    PutReceiver content_first(validator_);
    auto result = content_first.on_message(content("x"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::InvalidArgument);
    EXPECT_EQ(result.error().message, "first message must be Open");

    PutReceiver hash_first(validator_);
    EXPECT_TRUE(hash_first.on_message(PutHash{md5_of("")}).is_error());
}

TEST_F(PutReceiverTest, DuplicateOpenFailsAndRemovesTemp) {
    PutReceiver receiver(validator_);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("dup.bin"), 0, DigestMethod::Md5}).is_ok());

    auto result = receiver.on_message(PutOpen{path("dup.bin"), 0, DigestMethod::Md5});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::InvalidArgument);
    EXPECT_FALSE(fs::exists(path("dup.bin") + PutReceiver::kTempSuffix));
}

TEST_F(PutReceiverTest, RejectsPathOutsideAllowList) {
    PutReceiver receiver(validator_);

    auto result = receiver.on_message(PutOpen{"/etc/passwd", 0, DigestMethod::Md5});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::InvalidArgument);
    EXPECT_FALSE(fs::exists("/etc/passwd.tmp"));

    PutReceiver empty(validator_);
    EXPECT_TRUE(empty.on_message(PutOpen{"", 0, DigestMethod::Md5}).is_error());
}

TEST_F(PutReceiverTest, EndOfStreamBeforeHashIsInvalidArgument) {
    PutReceiver receiver(validator_);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("short.bin"), 0, DigestMethod::Md5}).is_ok());
    ASSERT_TRUE(receiver.on_message(content("partial")).is_ok());

    auto result = receiver.on_end_of_stream();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::InvalidArgument);
    EXPECT_EQ(result.error().message, "unexpected end of stream before hash");
    EXPECT_FALSE(fs::exists(path("short.bin")));
    EXPECT_FALSE(fs::exists(path("short.bin") + PutReceiver::kTempSuffix));
}

TEST_F(PutReceiverTest, HashMethodMustMatchOpen) {
    PutReceiver receiver(validator_);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("m.bin"), 0, DigestMethod::Sha256}).is_ok());
    ASSERT_TRUE(receiver.on_message(content("abc")).is_ok());

    auto result = receiver.on_message(PutHash{md5_of("abc")});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::InvalidArgument);
    EXPECT_FALSE(fs::exists(path("m.bin")));
}

TEST_F(PutReceiverTest, Sha256RoundTrip) {
    const std::string payload = test::make_payload(4096, 3);
    PutReceiver receiver(validator_);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("s.bin"), 0, DigestMethod::Sha256}).is_ok());
    ASSERT_TRUE(receiver.on_message(content(payload)).is_ok());
    auto hash = digest_bytes(DigestMethod::Sha256, payload.data(), payload.size());
    ASSERT_TRUE(receiver.on_message(PutHash{hash.value()}).is_ok());
    EXPECT_EQ(test::read_file(path("s.bin")), payload);
}

TEST_F(PutReceiverTest, MessageAfterDoneIsRejectedWithoutSideEffects) {
    PutReceiver receiver(validator_);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("done.bin"), 0, DigestMethod::Md5}).is_ok());
    ASSERT_TRUE(receiver.on_message(content("abc")).is_ok());
    ASSERT_TRUE(receiver.on_message(PutHash{md5_of("abc")}).is_ok());

    auto result = receiver.on_message(content("more"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::InvalidArgument);
    EXPECT_EQ(receiver.state(), PutState::Done);
    EXPECT_EQ(test::read_file(path("done.bin")), "abc");
}

TEST_F(PutReceiverTest, AbandonedReceiverDiscardsTempFile) {
    {
        PutReceiver receiver(validator_);
        ASSERT_TRUE(receiver.on_message(PutOpen{path("gone.bin"), 0, DigestMethod::Md5}).is_ok());
        ASSERT_TRUE(receiver.on_message(content("partial")).is_ok());
        EXPECT_TRUE(fs::exists(path("gone.bin") + PutReceiver::kTempSuffix));
    }
    EXPECT_FALSE(fs::exists(path("gone.bin") + PutReceiver::kTempSuffix));
    EXPECT_FALSE(fs::exists(path("gone.bin")));
}

TEST_F(PutReceiverTest, AbortDiscardsTempFile) {
    PutReceiver receiver(validator_);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("abort.bin"), 0, DigestMethod::Md5}).is_ok());
    receiver.abort(Error{StatusCode::Cancelled, "client went away"});

    EXPECT_EQ(receiver.state(), PutState::Failed);
    EXPECT_FALSE(fs::exists(path("abort.bin") + PutReceiver::kTempSuffix));
}

TEST_F(PutReceiverTest, ConcurrentUploadToSameDestinationIsRefused) {
    PutReceiver first(validator_);
    PutReceiver second(validator_);
    ASSERT_TRUE(first.on_message(PutOpen{path("same.bin"), 0, DigestMethod::Md5}).is_ok());

    auto result = second.on_message(PutOpen{path("same.bin"), 0, DigestMethod::Md5});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, StatusCode::Unavailable);

    // The refused receiver must not have touched the first one's temp file
    ASSERT_TRUE(first.on_message(content("abc")).is_ok());
    ASSERT_TRUE(first.on_message(PutHash{md5_of("abc")}).is_ok());
    EXPECT_EQ(test::read_file(path("same.bin")), "abc");
}

TEST_F(PutReceiverTest, EmitsCompletionEvent) {
    events::EventBus bus;
    std::string completed_path;
    uint64_t completed_bytes = 0;
    bus.subscribe<events::PutCompletedEvent>([&](const events::PutCompletedEvent& e) {
        completed_path = e.file_path;
        completed_bytes = e.total_bytes;
    });

    PutReceiver receiver(validator_, &bus);
    ASSERT_TRUE(receiver.on_message(PutOpen{path("ev.bin"), 0, DigestMethod::Md5}).is_ok());
    ASSERT_TRUE(receiver.on_message(content("12345")).is_ok());
    ASSERT_TRUE(receiver.on_message(PutHash{md5_of("12345")}).is_ok());

    EXPECT_EQ(completed_path, path("ev.bin"));
    EXPECT_EQ(completed_bytes, 5u);
}
