#include "ftr/rpc/server.hpp"
#include "ftr/rpc/messages.hpp"

#include <spdlog/spdlog.h>

#include <charconv>

namespace ftr::rpc {

Deadline deadline_from_metadata(const file::CallMetadata& metadata) {
    auto it = metadata.find(kTimeoutMetadataKey);
    if (it == metadata.end()) {
        return Deadline::never();
    }

    long long ms = 0;
    const char* begin = it->second.data();
    const char* end = begin + it->second.size();
    auto [ptr, ec] = std::from_chars(begin, end, ms);
    if (ec != std::errc() || ptr != end || ms <= 0) {
        spdlog::debug("Ignoring malformed {} value '{}'", kTimeoutMetadataKey, it->second);
        return Deadline::never();
    }
    return Deadline::after(std::chrono::milliseconds(ms));
}

// ──────────────────────────────────────────────────────────
// RpcConnection Implementation
// ──────────────────────────────────────────────────────────

RpcConnection::RpcConnection(tcp::socket socket, ServiceHandler& handler, asio::thread_pool& workers)
    : socket_(std::move(socket))
    , handler_(handler)
    , workers_(workers)
    , put_timer_(socket_.get_executor())
    , parser_() {
    boost::system::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("unknown") : remote.address().to_string() + ":" + std::to_string(remote.port());
}

void RpcConnection::start() {
    spdlog::debug("Accepted connection from {}", peer_);
    do_read();
}

void RpcConnection::do_read() {
    if (reading_) {
        return;
    }
    reading_ = true;
    auto self = shared_from_this();  // Keep connection alive during async operation

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, std::size_t bytes_transferred) {
            reading_ = false;
            if (ec) {
                if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
                    spdlog::debug("Read error from {}: {}", peer_, ec.message());
                }
                if (receiver_) {
                    receiver_->abort(Error{StatusCode::Cancelled, "client disconnected mid-stream"});
                    receiver_.reset();
                }
                put_timer_.cancel();
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                protocol_error(parse_result.error());
                return;
            }
            process_frames();
        });
}

void RpcConnection::process_frames() {
    while (state_ != CallState::WORKING && state_ != CallState::CLOSING) {
        auto frame = parser_.next();
        if (!frame) {
            break;
        }
        handle_frame(std::move(*frame));
    }

    if (state_ != CallState::WORKING && state_ != CallState::CLOSING) {
        do_read();
    }
}

void RpcConnection::handle_frame(Frame frame) {
    switch (state_) {
        case CallState::IDLE:
            if (frame.type != FrameType::CallStart) {
                protocol_error(Error{StatusCode::InvalidArgument,
                    std::string("expected CallStart, got ") + frame_type_name(frame.type)});
                return;
            }
            begin_call(frame);
            return;

        case CallState::AWAIT_TRANSFER_REQUEST: {
            auto request = decode_transfer_request(frame);
            if (request.is_error()) {
                queue_write(encode_status(request.error().code, request.error().message));
                state_ = CallState::IDLE;
                return;
            }
            ServiceHandler& handler = handler_;
            run_on_worker([&handler, context = call_, request = std::move(request.value())]() {
                auto result = handler.transfer_to_remote(context, request);
                if (result.is_error()) {
                    return encode_status(result.error().code, result.error().message);
                }
                return encode_transfer_response(result.value());
            });
            return;
        }

        case CallState::AWAIT_REMOVE_REQUEST: {
            auto path = decode_remove_request(frame);
            if (path.is_error()) {
                queue_write(encode_status(path.error().code, path.error().message));
                state_ = CallState::IDLE;
                return;
            }
            ServiceHandler& handler = handler_;
            run_on_worker([&handler, context = call_, path = std::move(path.value())]() {
                return encode_status(handler.remove(context, path));
            });
            return;
        }

        case CallState::PUT_STREAMING:
            handle_put_frame(std::move(frame));
            return;

        case CallState::DRAINING:
            if (frame.type == FrameType::EndOfStream) {
                state_ = CallState::IDLE;
            }
            return;

        case CallState::WORKING:
        case CallState::CLOSING:
            return;
    }
}

void RpcConnection::begin_call(const Frame& frame) {
    auto start = decode_call_start(frame);
    if (start.is_error()) {
        protocol_error(start.error());
        return;
    }

    call_.deadline = deadline_from_metadata(start.value().metadata);
    call_.metadata = std::move(start.value().metadata);
    call_.peer = peer_;

    spdlog::debug("{} call from {}", method_name(start.value().method), peer_);

    switch (start.value().method) {
        case Method::TransferToRemote:
            state_ = CallState::AWAIT_TRANSFER_REQUEST;
            return;

        case Method::Remove:
            state_ = CallState::AWAIT_REMOVE_REQUEST;
            return;

        case Method::Put: {
            auto receiver = handler_.open_put(call_);
            if (receiver.is_error()) {
                queue_write(encode_status(receiver.error().code, receiver.error().message));
                state_ = CallState::DRAINING;
                return;
            }
            receiver_ = std::move(receiver.value());
            state_ = CallState::PUT_STREAMING;

            if (!call_.deadline.is_infinite()) {
                auto self = shared_from_this();
                put_timer_.expires_at(call_.deadline.time_point());
                put_timer_.async_wait([this, self](const boost::system::error_code& ec) {
                    on_put_deadline(ec);
                });
            }
            return;
        }
    }
}

void RpcConnection::handle_put_frame(Frame frame) {
    if (frame.type == FrameType::EndOfStream) {
        auto outcome = receiver_->on_end_of_stream();
        finish_put(outcome, CallState::IDLE);
        return;
    }

    auto message = decode_put_message(frame);
    if (message.is_error()) {
        receiver_->abort(message.error());
        finish_put(Err<void>(message.error()), CallState::DRAINING);
        return;
    }

    auto outcome = receiver_->on_message(std::move(message.value()));
    if (outcome.is_error()) {
        finish_put(outcome, CallState::DRAINING);
        return;
    }
    if (receiver_->finished()) {
        finish_put(Ok(), CallState::DRAINING);
    }
}

void RpcConnection::finish_put(const Result<void>& outcome, CallState next) {
    put_timer_.cancel();
    receiver_.reset();
    queue_write(encode_status(outcome));
    state_ = next;
}

void RpcConnection::on_put_deadline(const boost::system::error_code& ec) {
    if (ec || state_ != CallState::PUT_STREAMING || !receiver_) {
        return;
    }
    Error reason{StatusCode::Cancelled, "put canceled: deadline exceeded"};
    spdlog::warn("Put from {} to {} exceeded its deadline", peer_, receiver_->destination());
    receiver_->abort(reason);
    finish_put(Err<void>(reason), CallState::DRAINING);
}

template<typename Work>
void RpcConnection::run_on_worker(Work work) {
    state_ = CallState::WORKING;
    auto self = shared_from_this();

    asio::post(workers_, [this, self, work = std::move(work)]() mutable {
        Frame reply;
        try {
            reply = work();
        } catch (const std::exception& e) {
            spdlog::error("Handler threw exception: {}", e.what());
            reply = encode_status(StatusCode::Internal, "internal server error");
        }

        // Back onto the connection's strand
        asio::post(socket_.get_executor(), [this, self, reply = std::move(reply)]() {
            state_ = CallState::IDLE;
            queue_write(reply);
            process_frames();
        });
    });
}

void RpcConnection::queue_write(const Frame& frame) {
    write_queue_.push_back(serialize_frame(frame));
    if (write_queue_.size() == 1) {
        do_write();
    }
}

void RpcConnection::do_write() {
    auto self = shared_from_this();  // Keep connection alive during async write

    asio::async_write(
        socket_,
        asio::buffer(write_queue_.front()),
        [this, self](boost::system::error_code ec, std::size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error to {}: {}", peer_, ec.message());
                }
                write_queue_.clear();
                close();
                return;
            }

            spdlog::trace("Sent {} bytes to {}", bytes_transferred, peer_);
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                do_write();
            } else if (state_ == CallState::CLOSING) {
                close();
            }
        });
}

void RpcConnection::protocol_error(const Error& error) {
    spdlog::warn("Protocol error from {}: {}", peer_, error.message);

    if (receiver_) {
        receiver_->abort(error);
        receiver_.reset();
    }
    put_timer_.cancel();

    queue_write(encode_status(error.code, error.message));
    state_ = CallState::CLOSING;
}

void RpcConnection::close() {
    put_timer_.cancel();
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

// ──────────────────────────────────────────────────────────
// RpcServer Implementation
// ──────────────────────────────────────────────────────────

Result<std::unique_ptr<RpcServer>> RpcServer::create(asio::io_context& io_context,
                                                     const std::string& address,
                                                     uint16_t port,
                                                     ServiceHandler& handler,
                                                     std::size_t worker_threads) {
    using ServerPtr = std::unique_ptr<RpcServer>;

    boost::system::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        return Fail<ServerPtr>(StatusCode::InvalidArgument,
            "invalid listen address '" + address + "': " + ec.message());
    }

    tcp::endpoint endpoint(ip, port);
    tcp::acceptor acceptor(io_context);

    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        return Fail<ServerPtr>(StatusCode::Unavailable,
            "cannot listen on " + address + ":" + std::to_string(port) + ": " + ec.message());
    }

    return Ok(ServerPtr(new RpcServer(io_context, std::move(acceptor), handler, worker_threads)));
}

RpcServer::RpcServer(asio::io_context& io_context,
                     tcp::acceptor acceptor,
                     ServiceHandler& handler,
                     std::size_t worker_threads)
    : io_context_(io_context)
    , acceptor_(std::move(acceptor))
    , handler_(handler)
    , workers_(worker_threads > 0 ? worker_threads : 1)
    , port_(0) {

    boost::system::error_code ec;
    port_ = acceptor_.local_endpoint(ec).port();

    spdlog::info("RPC server listening on port {} ({} worker threads)",
                 port_, worker_threads > 0 ? worker_threads : 1);

    do_accept();
}

RpcServer::~RpcServer() {
    stop();
}

void RpcServer::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    boost::system::error_code ignored;
    acceptor_.close(ignored);
    workers_.join();
}

void RpcServer::do_accept() {
    // Each connection gets its own strand so io_context may run on several threads
    acceptor_.async_accept(
        asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || stopped_) {
                return;
            }
            if (!ec) {
                std::make_shared<RpcConnection>(
                    std::move(socket),
                    handler_,
                    workers_
                )->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        });
}

} // namespace ftr::rpc
