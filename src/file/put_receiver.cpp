#include "ftr/file/put_receiver.hpp"
#include "ftr/events/event_bus.hpp"
#include "ftr/events/events.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <mutex>
#include <system_error>
#include <type_traits>
#include <unordered_set>

namespace ftr::file {
namespace fs = std::filesystem;

namespace {

template<class>
inline constexpr bool always_false_v = false;

/**
 * @brief Temp paths currently being written by a receiver in this process
 *
 * Two uploads to the same destination would otherwise share one temp file.
 */
class TempPathRegistry {
public:
    static TempPathRegistry& instance() {
        static TempPathRegistry registry;
        return registry;
    }

    bool claim(const std::string& path) {
        std::lock_guard lock(mutex_);
        return active_.insert(path).second;
    }

    void release(const std::string& path) {
        std::lock_guard lock(mutex_);
        active_.erase(path);
    }

private:
    std::mutex mutex_;
    std::unordered_set<std::string> active_;
};

} // namespace

const char* put_state_name(PutState state) {
    switch (state) {
        case PutState::AwaitOpen: return "AwaitOpen";
        case PutState::Receiving: return "Receiving";
        case PutState::Verifying: return "Verifying";
        case PutState::Done: return "Done";
        case PutState::Failed: return "Failed";
    }
    return "Unknown";
}

PutReceiver::PutReceiver(const PathValidator& validator, events::EventBus* bus)
    : validator_(validator), bus_(bus) {}

PutReceiver::~PutReceiver() {
    if (!finished()) {
        discard_temp();
    }
}

Result<void> PutReceiver::on_message(PutMessage message) {
    if (state_ == PutState::Failed) {
        return Fail<void>(StatusCode::Internal, "put stream already failed");
    }
    if (state_ == PutState::Done) {
        return Fail<void>(StatusCode::InvalidArgument, "unexpected message after hash");
    }

    return std::visit([this](auto& msg) -> Result<void> {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, PutOpen>) {
            if (state_ != PutState::AwaitOpen) {
                return fail(Error{StatusCode::InvalidArgument, "duplicate Open message"});
            }
            return handle_open(msg);
        } else if constexpr (std::is_same_v<T, PutContent>) {
            if (state_ != PutState::Receiving) {
                return fail(Error{StatusCode::InvalidArgument, "first message must be Open"});
            }
            return handle_content(msg);
        } else if constexpr (std::is_same_v<T, PutHash>) {
            if (state_ != PutState::Receiving) {
                return fail(Error{StatusCode::InvalidArgument, "first message must be Open"});
            }
            return handle_hash(msg);
        } else {
            static_assert(always_false_v<T>, "unhandled put message");
        }
    }, message);
}

Result<void> PutReceiver::on_end_of_stream() {
    switch (state_) {
        case PutState::Done:
            return Ok();
        case PutState::Failed:
            return Fail<void>(StatusCode::Internal, "put stream already failed");
        case PutState::AwaitOpen:
            return fail(Error{StatusCode::InvalidArgument, "stream ended before Open message"});
        case PutState::Receiving:
        case PutState::Verifying:
            break;
    }
    return fail(Error{StatusCode::InvalidArgument, "unexpected end of stream before hash"});
}

void PutReceiver::abort(const Error& reason) {
    if (finished()) {
        return;
    }
    spdlog::warn("[Put] aborting upload to {}: {}", requested_path_, reason.to_string());
    (void)fail(reason);
}

Result<void> PutReceiver::handle_open(PutOpen& open) {
    if (open.remote_file.empty()) {
        return fail(Error{StatusCode::InvalidArgument, "remote_file cannot be empty"});
    }
    requested_path_ = open.remote_file;

    auto resolved = validator_.resolve(open.remote_file);
    if (resolved.is_error()) {
        return fail(resolved.error().wrap("invalid remote_file"));
    }
    destination_ = resolved.value();
    permissions_ = open.permissions == 0 ? kDefaultPermissions : open.permissions;

    auto digest = DigestAccumulator::create(open.digest);
    if (digest.is_error()) {
        return fail(digest.error());
    }
    digest_.emplace(std::move(digest.value()));

    const std::string temp_path = destination_ + kTempSuffix;
    if (!TempPathRegistry::instance().claim(temp_path)) {
        return fail(Error{StatusCode::Unavailable,
            "another upload to " + open.remote_file + " is in progress"});
    }
    temp_path_ = temp_path;

    out_.open(temp_path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        return fail(Error{StatusCode::Internal, "failed to create temp file: " + temp_path_});
    }

    spdlog::debug("[Put] receiving {} -> {} (mode {:o}, digest {})",
                  open.remote_file, destination_, permissions_,
                  digest_method_name(digest_->method()));
    state_ = PutState::Receiving;
    return Ok();
}

Result<void> PutReceiver::handle_content(const PutContent& content) {
    if (content.data.empty()) {
        return Ok();
    }
    out_.write(reinterpret_cast<const char*>(content.data.data()),
               static_cast<std::streamsize>(content.data.size()));
    if (!out_) {
        return fail(Error{StatusCode::Internal, "failed to write chunk to " + temp_path_});
    }
    if (auto res = digest_->update(content.data.data(), content.data.size()); res.is_error()) {
        return fail(res.error());
    }
    bytes_ += content.data.size();
    return Ok();
}

Result<void> PutReceiver::handle_hash(const PutHash& hash) {
    state_ = PutState::Verifying;

    if (hash.hash.method != DigestMethod::Unspecified &&
        effective_method(hash.hash.method) != digest_->method()) {
        return fail(Error{StatusCode::InvalidArgument,
            std::string("hash method ") + digest_method_name(hash.hash.method) +
            " does not match announced method " + digest_method_name(digest_->method())});
    }

    auto computed = digest_->finish();
    if (computed.is_error()) {
        return fail(computed.error());
    }
    if (computed.value().bytes != hash.hash.bytes) {
        return fail(Error{StatusCode::DataLoss, "hash mismatch: file corrupted during transfer"});
    }

    auto committed = commit();
    if (committed.is_error()) {
        return committed;
    }

    if (bus_ != nullptr) {
        bus_->emit(events::PutCompletedEvent{requested_path_, bytes_, to_hex(computed.value().bytes)});
    }
    return Ok();
}

Result<void> PutReceiver::commit() {
    out_.close();
    if (out_.fail()) {
        return fail(Error{StatusCode::Internal, "failed to close temp file: " + temp_path_});
    }

    std::error_code ec;
    fs::permissions(temp_path_, static_cast<fs::perms>(permissions_ & 07777),
                    fs::perm_options::replace, ec);
    if (ec) {
        return fail(Error{StatusCode::Internal, "failed to set permissions: " + ec.message()});
    }

    fs::rename(temp_path_, destination_, ec);
    if (ec) {
        return fail(Error{StatusCode::Internal, "failed to rename file: " + ec.message()});
    }

    TempPathRegistry::instance().release(temp_path_);
    temp_path_.clear();
    state_ = PutState::Done;
    spdlog::info("[Put] committed {} ({} bytes)", destination_, bytes_);
    return Ok();
}

Result<void> PutReceiver::fail(Error error) {
    state_ = PutState::Failed;
    discard_temp();
    if (bus_ != nullptr) {
        bus_->emit(events::PutFailedEvent{requested_path_, error.code, error.message});
    }
    return Err<void>(std::move(error));
}

void PutReceiver::discard_temp() {
    if (out_.is_open()) {
        out_.close();
    }
    if (temp_path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(temp_path_, ec);
    if (ec) {
        spdlog::error("Failed to cleanup temp file {}: {}", temp_path_, ec.message());
    }
    TempPathRegistry::instance().release(temp_path_);
    temp_path_.clear();
}

} // namespace ftr::file
