#include "ftr/service/file_service.hpp"
#include "ftr/events/event_bus.hpp"
#include "ftr/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <system_error>

namespace ftr::service {

namespace fs = std::filesystem;

namespace {

std::string join_prefixes(const std::vector<std::string>& prefixes) {
    std::string out;
    for (std::size_t i = 0; i < prefixes.size(); ++i) {
        if (i > 0) {
            out += i + 1 == prefixes.size() ? " or " : ", ";
        }
        out += prefixes[i];
    }
    return out;
}

} // namespace

FileService::FileService(const file::PathValidator& validator,
                         fetch::UrlFetcher& fetcher,
                         dpu::ConnectionProvider& connections,
                         const AccessChecker& access,
                         file::TransferLimits limits,
                         events::EventBus* bus)
    : validator_(validator)
    , access_(access)
    , bus_(bus)
    , local_(validator, fetcher, limits)
    , proxy_(validator, fetcher, connections, limits) {
}

Result<file::TransferResult> FileService::transfer_to_remote(const CallContext& context,
                                                             const file::TransferRequest& request) {
    auto allowed = access_.check(context, true);
    if (allowed.is_error()) {
        return Err<file::TransferResult>(allowed.error());
    }

    const auto routing = file::routing_from_metadata(context.metadata);
    const bool to_dpu = routing && routing->is_dpu();
    const std::string route = to_dpu ? "dpu:" + routing->index : "local";
    const std::string url = request.source ? request.source->url : "";

    if (routing && !to_dpu) {
        spdlog::debug("Ignoring routing metadata type='{}' index='{}'", routing->type, routing->index);
    }

    if (bus_) {
        bus_->emit(events::TransferStartedEvent{request.local_path, url, route});
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = to_dpu
        ? proxy_.handle(request, routing->index, context.metadata, context.deadline)
        : local_.handle(request, context.deadline);

    if (result.is_error()) {
        spdlog::warn("TransferToRemote {} -> {} via {} failed: {}",
                     url, request.local_path, route, result.error().to_string());
        if (bus_) {
            bus_->emit(events::TransferFailedEvent{request.local_path, route,
                                                   result.error().code, result.error().message});
        }
        return result;
    }

    if (bus_) {
        events::TransferCompletedEvent done;
        done.destination = request.local_path;
        done.route = route;
        done.total_bytes = result.value().bytes;
        done.hash = file::to_hex(result.value().hash.bytes);
        done.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        bus_->emit(done);
    }
    return result;
}

Result<std::unique_ptr<file::PutReceiver>> FileService::open_put(const CallContext& context) {
    using ReceiverPtr = std::unique_ptr<file::PutReceiver>;

    auto allowed = access_.check(context, true);
    if (allowed.is_error()) {
        return Err<ReceiverPtr>(allowed.error());
    }

    if (auto routing = file::routing_from_metadata(context.metadata)) {
        spdlog::info("Put from {} carries routing type='{}' index='{}', receiving locally",
                     context.peer, routing->type, routing->index);
    }

    return Ok(std::make_unique<file::PutReceiver>(validator_, bus_));
}

Result<void> FileService::remove(const CallContext& context, const std::string& remote_file) {
    auto allowed = access_.check(context, true);
    if (allowed.is_error()) {
        return allowed;
    }

    if (remote_file.empty()) {
        spdlog::error("Invalid request: remote_file field is empty");
        return Fail<void>(StatusCode::InvalidArgument, "remote_file field is empty");
    }

    auto normalized = validator_.validate(remote_file);
    if (normalized.is_error()) {
        spdlog::error("Denied remove of {}: {}", remote_file, normalized.error().message);
        return Fail<void>(StatusCode::PermissionDenied,
            "only files in " + join_prefixes(validator_.policy().allowed_prefixes) +
            " can be removed");
    }

    const std::string target = validator_.translate(normalized.value());

    std::error_code ec;
    const bool removed = fs::remove(target, ec);
    if (ec) {
        spdlog::error("Remove of {} failed: {}", target, ec.message());
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
            return Fail<void>(StatusCode::PermissionDenied, "remove " + target + ": " + ec.message());
        }
        if (ec == std::errc::no_such_file_or_directory) {
            return Fail<void>(StatusCode::NotFound, "remove " + target + ": " + ec.message());
        }
        return Fail<void>(StatusCode::Internal, "remove " + target + ": " + ec.message());
    }
    if (!removed) {
        return Fail<void>(StatusCode::NotFound, "remove " + target + ": no such file or directory");
    }

    spdlog::info("Removed {}", target);
    if (bus_) {
        bus_->emit(events::FileRemovedEvent{target});
    }
    return Ok();
}

} // namespace ftr::service
