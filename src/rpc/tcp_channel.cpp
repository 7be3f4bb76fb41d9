#include "ftr/rpc/tcp_channel.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace ftr::rpc {

// ──────────────────────────────────────────────────────────
// ClientConnection
// ──────────────────────────────────────────────────────────

ClientConnection::ClientConnection()
    : socket_(io_) {
}

Result<void> ClientConnection::run(Deadline deadline, const char* what) {
    io_.restart();
    if (deadline.is_infinite()) {
        io_.run();
    } else {
        io_.run_until(deadline.time_point());
    }

    if (!io_.stopped()) {
        // Operation still pending: cancel it and let its handler run
        boost::system::error_code ignored;
        socket_.close(ignored);
        io_.restart();
        io_.run();
        broken_ = true;
        return Fail<void>(StatusCode::DeadlineExceeded, std::string(what) + " timed out");
    }
    return Ok();
}

Result<void> ClientConnection::connect(const std::string& host, std::uint16_t port,
                                       Deadline deadline) {
    tcp::resolver resolver(io_);
    boost::system::error_code ec;
    tcp::resolver::results_type endpoints;

    resolver.async_resolve(host, std::to_string(port),
        [&](boost::system::error_code e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
        });
    auto resolved = run(deadline, "resolve");
    if (resolved.is_error()) {
        return Fail<void>(StatusCode::Unavailable, "resolve " + host + ": timed out");
    }
    if (ec) {
        broken_ = true;
        return Fail<void>(StatusCode::Unavailable, "resolve " + host + ": " + ec.message());
    }

    asio::async_connect(socket_, endpoints,
        [&](boost::system::error_code e, const tcp::endpoint&) { ec = e; });
    auto connected = run(deadline, "connect");
    if (connected.is_error()) {
        return Fail<void>(StatusCode::Unavailable,
            "connect to " + host + ":" + std::to_string(port) + " timed out");
    }
    if (ec) {
        broken_ = true;
        return Fail<void>(StatusCode::Unavailable,
            "connect to " + host + ":" + std::to_string(port) + ": " + ec.message());
    }

    boost::system::error_code ignored;
    socket_.set_option(tcp::no_delay(true), ignored);
    return Ok();
}

Result<void> ClientConnection::write_frame(const Frame& frame, Deadline deadline) {
    if (broken_) {
        return Fail<void>(StatusCode::Unavailable, "connection is closed");
    }

    auto data = serialize_frame(frame);
    boost::system::error_code ec;
    asio::async_write(socket_, asio::buffer(data),
        [&](boost::system::error_code e, std::size_t) { ec = e; });

    auto ran = run(deadline, "write");
    if (ran.is_error()) {
        return ran;
    }
    if (ec) {
        broken_ = true;
        return Fail<void>(StatusCode::Unavailable, "write failed: " + ec.message());
    }
    return Ok();
}

Result<Frame> ClientConnection::read_frame(Deadline deadline) {
    while (true) {
        if (auto frame = parser_.next()) {
            return Ok(std::move(*frame));
        }
        if (broken_) {
            return Fail<Frame>(StatusCode::Unavailable, "connection is closed");
        }

        boost::system::error_code ec;
        std::size_t bytes_read = 0;
        socket_.async_read_some(asio::buffer(buffer_),
            [&](boost::system::error_code e, std::size_t n) {
                ec = e;
                bytes_read = n;
            });

        auto ran = run(deadline, "read");
        if (ran.is_error()) {
            return Err<Frame>(ran.error());
        }
        if (ec) {
            broken_ = true;
            if (ec == asio::error::eof) {
                return Fail<Frame>(StatusCode::Unavailable, "connection closed by peer");
            }
            return Fail<Frame>(StatusCode::Unavailable, "read failed: " + ec.message());
        }

        auto parsed = parser_.parse(buffer_.data(), bytes_read);
        if (parsed.is_error()) {
            broken_ = true;
            return Err<Frame>(parsed.error().wrap("malformed frame from peer"));
        }
    }
}

Result<std::optional<Frame>> ClientConnection::poll_frame() {
    if (!parser_.has_frame() && !broken_) {
        boost::system::error_code ec;
        std::size_t available = socket_.available(ec);
        while (!ec && available > 0) {
            std::size_t n = socket_.read_some(
                asio::buffer(buffer_.data(), std::min(available, buffer_.size())), ec);
            if (ec) {
                break;
            }
            auto parsed = parser_.parse(buffer_.data(), n);
            if (parsed.is_error()) {
                broken_ = true;
                return Err<std::optional<Frame>>(parsed.error().wrap("malformed frame from peer"));
            }
            available -= std::min(available, n);
        }
        if (ec) {
            broken_ = true;
            return Fail<std::optional<Frame>>(StatusCode::Unavailable,
                "read failed: " + ec.message());
        }
    }
    return Ok(parser_.next());
}

void ClientConnection::close() {
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    broken_ = true;
}

// ──────────────────────────────────────────────────────────
// TcpPutCall
// ──────────────────────────────────────────────────────────

namespace {

/**
 * The server answers a Put with one Status frame, possibly before the
 * client has finished sending (a rejected Open, a failed write). Every
 * send polls for it so a failed stream stops early.
 */
class TcpPutCall : public PutCall {
public:
    TcpPutCall(std::shared_ptr<TcpChannel> channel,
               std::unique_ptr<ClientConnection> connection,
               Deadline deadline)
        : channel_(std::move(channel))
        , connection_(std::move(connection))
        , deadline_(deadline) {
    }

    ~TcpPutCall() override {
        // Abandoned mid-stream: the peer discards its partial file when the socket drops
        if (connection_) {
            connection_->close();
        }
    }

    Result<void> send(const file::PutMessage& message) override {
        return send_frame(encode_put_message(message));
    }

    Result<void> send_content(const std::uint8_t* data, std::size_t size) override {
        return send_frame(encode_put_content(data, size));
    }

    Result<void> close_and_receive() override {
        if (!connection_) {
            return Fail<void>(StatusCode::Internal, "put stream already closed");
        }

        auto sent = connection_->write_frame(encode_end_of_stream(), deadline_);
        if (sent.is_error()) {
            connection_->close();
            connection_.reset();
            return early_status_ ? *early_status_ : sent;
        }

        Result<void> outcome = Ok();
        if (early_status_) {
            outcome = *early_status_;
        } else {
            auto frame = connection_->read_frame(deadline_);
            if (frame.is_error()) {
                connection_->close();
                connection_.reset();
                return Err<void>(frame.error());
            }
            if (frame.value().type != FrameType::Status) {
                connection_->close();
                connection_.reset();
                return Fail<void>(StatusCode::Internal,
                    std::string("unexpected ") + frame_type_name(frame.value().type) +
                    " frame in Put response");
            }
            outcome = decode_status(frame.value());
        }

        channel_->release(std::move(connection_));
        return outcome;
    }

private:
    Result<void> send_frame(const Frame& frame) {
        if (!connection_) {
            return Fail<void>(StatusCode::Internal, "put stream already closed");
        }
        if (early_status_ && early_status_->is_error()) {
            return *early_status_;
        }

        auto sent = connection_->write_frame(frame, deadline_);
        if (sent.is_error()) {
            return sent;
        }
        // The verdict on the Hash is collected by close_and_receive()
        if (frame.type == FrameType::PutHash) {
            return Ok();
        }

        auto polled = connection_->poll_frame();
        if (polled.is_error()) {
            return Err<void>(polled.error());
        }
        if (polled.value()) {
            const Frame& reply = *polled.value();
            if (reply.type != FrameType::Status) {
                connection_->close();
                return Fail<void>(StatusCode::Internal,
                    std::string("unexpected ") + frame_type_name(reply.type) +
                    " frame in Put response");
            }
            early_status_ = decode_status(reply);
            if (early_status_->is_error()) {
                return *early_status_;
            }
        }
        return Ok();
    }

    std::shared_ptr<TcpChannel> channel_;
    std::unique_ptr<ClientConnection> connection_;
    Deadline deadline_;
    std::optional<Result<void>> early_status_;
};

file::CallMetadata with_timeout(const file::CallMetadata& metadata, Deadline deadline) {
    file::CallMetadata out = metadata;
    if (!deadline.is_infinite()) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline.remaining());
        out[kTimeoutMetadataKey] = std::to_string(std::max<std::int64_t>(ms.count(), 1));
    }
    return out;
}

} // namespace

// ──────────────────────────────────────────────────────────
// TcpChannel
// ──────────────────────────────────────────────────────────

TcpChannel::TcpChannel(std::string host, std::uint16_t port)
    : TcpChannel(std::move(host), port, Options{}) {
}

TcpChannel::TcpChannel(std::string host, std::uint16_t port, Options options)
    : host_(std::move(host))
    , port_(port)
    , options_(options) {
}

std::string TcpChannel::target() const {
    return host_ + ":" + std::to_string(port_);
}

std::size_t TcpChannel::idle_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void TcpChannel::shutdown() {
    std::vector<std::unique_ptr<ClientConnection>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        closing.swap(idle_);
    }
    for (auto& connection : closing) {
        connection->close();
    }
}

std::unique_ptr<ClientConnection> TcpChannel::take_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.empty()) {
        return nullptr;
    }
    auto connection = std::move(idle_.back());
    idle_.pop_back();
    return connection;
}

Result<std::unique_ptr<ClientConnection>> TcpChannel::dial(Deadline deadline) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return Fail<std::unique_ptr<ClientConnection>>(StatusCode::Unavailable,
                "channel to " + target() + " is shut down");
        }
    }

    auto connection = std::make_unique<ClientConnection>();
    auto connected = connection->connect(host_, port_,
                                         deadline.capped(options_.connect_timeout));
    if (connected.is_error()) {
        return Err<std::unique_ptr<ClientConnection>>(connected.error());
    }
    spdlog::debug("Connected to {}", target());
    return Ok(std::move(connection));
}

Result<std::unique_ptr<ClientConnection>> TcpChannel::acquire(Deadline deadline) {
    if (auto connection = take_idle()) {
        return Ok(std::move(connection));
    }
    return dial(deadline);
}

void TcpChannel::release(std::unique_ptr<ClientConnection> connection) {
    if (!connection) {
        return;
    }
    if (!connection->broken()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!shut_down_ && idle_.size() < options_.max_idle) {
            idle_.push_back(std::move(connection));
            return;
        }
    }
    connection->close();
}

Result<void> TcpChannel::warm_up(Deadline deadline) {
    auto connection = dial(deadline);
    if (connection.is_error()) {
        return Err<void>(connection.error());
    }
    release(std::move(connection.value()));
    return Ok();
}

Result<std::unique_ptr<ClientConnection>> TcpChannel::start_call(Method method,
                                                                 const file::CallMetadata& metadata,
                                                                 Deadline deadline) {
    const Frame start = encode_call_start(CallStart{method, with_timeout(metadata, deadline)});

    // A pooled connection may have been dropped by the peer while idle;
    // in that case retry once on a fresh one.
    if (auto pooled = take_idle()) {
        auto sent = pooled->write_frame(start, deadline);
        if (sent.is_ok()) {
            return Ok(std::move(pooled));
        }
        spdlog::debug("Pooled connection to {} is stale: {}", target(), sent.error().message);
    }

    auto fresh = dial(deadline);
    if (fresh.is_error()) {
        return fresh;
    }
    auto sent = fresh.value()->write_frame(start, deadline);
    if (sent.is_error()) {
        return Err<std::unique_ptr<ClientConnection>>(sent.error());
    }
    return fresh;
}

Result<std::unique_ptr<PutCall>> TcpChannel::open_put(const file::CallMetadata& metadata,
                                                      Deadline deadline) {
    auto connection = start_call(Method::Put, metadata, deadline);
    if (connection.is_error()) {
        return Err<std::unique_ptr<PutCall>>(connection.error());
    }
    std::unique_ptr<PutCall> call = std::make_unique<TcpPutCall>(
        shared_from_this(), std::move(connection.value()), deadline);
    return Ok(std::move(call));
}

Result<file::TransferResult> TcpChannel::transfer_to_remote(const file::CallMetadata& metadata,
                                                            const file::TransferRequest& request,
                                                            Deadline deadline) {
    auto started = start_call(Method::TransferToRemote, metadata, deadline);
    if (started.is_error()) {
        return Err<file::TransferResult>(started.error());
    }
    auto connection = std::move(started.value());

    auto sent = connection->write_frame(encode_transfer_request(request), deadline);
    if (sent.is_error()) {
        return Err<file::TransferResult>(sent.error());
    }

    auto frame = connection->read_frame(deadline);
    if (frame.is_error()) {
        return Err<file::TransferResult>(frame.error());
    }

    switch (frame.value().type) {
        case FrameType::TransferResponse: {
            auto result = decode_transfer_response(frame.value());
            if (result.is_ok()) {
                release(std::move(connection));
            }
            return result;
        }
        case FrameType::Status: {
            auto status = decode_status(frame.value());
            release(std::move(connection));
            if (status.is_ok()) {
                return Fail<file::TransferResult>(StatusCode::Internal,
                    "peer returned OK without a transfer response");
            }
            return Err<file::TransferResult>(status.error());
        }
        default:
            return Fail<file::TransferResult>(StatusCode::Internal,
                std::string("unexpected ") + frame_type_name(frame.value().type) +
                " frame in TransferToRemote response");
    }
}

Result<void> TcpChannel::remove(const file::CallMetadata& metadata,
                                const std::string& remote_file,
                                Deadline deadline) {
    auto started = start_call(Method::Remove, metadata, deadline);
    if (started.is_error()) {
        return Err<void>(started.error());
    }
    auto connection = std::move(started.value());

    auto sent = connection->write_frame(encode_remove_request(remote_file), deadline);
    if (sent.is_error()) {
        return sent;
    }

    auto frame = connection->read_frame(deadline);
    if (frame.is_error()) {
        return Err<void>(frame.error());
    }
    if (frame.value().type != FrameType::Status) {
        return Fail<void>(StatusCode::Internal,
            std::string("unexpected ") + frame_type_name(frame.value().type) +
            " frame in Remove response");
    }

    auto status = decode_status(frame.value());
    release(std::move(connection));
    return status;
}

} // namespace ftr::rpc
