#pragma once

#include "ftr/core/result.hpp"
#include "ftr/file/digest.hpp"
#include "ftr/file/path_validator.hpp"
#include "ftr/file/types.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

namespace ftr::events {
class EventBus;
}

namespace ftr::file {

enum class PutState {
    AwaitOpen,
    Receiving,
    Verifying,
    Done,
    Failed
};

const char* put_state_name(PutState state);

/**
 * @brief Receive side of the chunked upload protocol
 *
 * Driven one message at a time by the transport:
 *
 *   AwaitOpen --Open--> Receiving --Content*--> Receiving --Hash--> Verifying
 *   Verifying --match--> Done (temp file renamed onto destination)
 *   any non-terminal state --error--> Failed (temp file removed)
 *
 * The destination path is only ever written by rename(), so readers see
 * either no file or a complete, verified one.
 */
class PutReceiver {
public:
    static constexpr const char* kTempSuffix = ".tmp";

    explicit PutReceiver(const PathValidator& validator, events::EventBus* bus = nullptr);
    ~PutReceiver();

    PutReceiver(const PutReceiver&) = delete;
    PutReceiver& operator=(const PutReceiver&) = delete;

    /**
     * @brief Feed the next inbound message
     *
     * Returns an error once the receiver has entered Failed; the caller
     * must surface it and stop feeding.
     */
    Result<void> on_message(PutMessage message);

    /// Input ended; an error unless the transfer already completed
    Result<void> on_end_of_stream();

    /// Transport gave up (deadline, disconnect); discards partial state
    void abort(const Error& reason);

    PutState state() const noexcept { return state_; }
    bool finished() const noexcept { return state_ == PutState::Done || state_ == PutState::Failed; }

    const std::string& destination() const noexcept { return destination_; }
    std::uint64_t bytes_received() const noexcept { return bytes_; }

private:
    Result<void> handle_open(PutOpen& open);
    Result<void> handle_content(const PutContent& content);
    Result<void> handle_hash(const PutHash& hash);
    Result<void> commit();

    Result<void> fail(Error error);
    void discard_temp();

    const PathValidator& validator_;
    events::EventBus* bus_;

    PutState state_ = PutState::AwaitOpen;
    std::string requested_path_;
    std::string destination_;
    std::string temp_path_;
    std::uint32_t permissions_ = kDefaultPermissions;
    std::ofstream out_;
    std::optional<DigestAccumulator> digest_;
    std::uint64_t bytes_ = 0;
};

} // namespace ftr::file
