#pragma once

#include "ftr/core/result.hpp"
#include "ftr/file/put_receiver.hpp"
#include "ftr/rpc/call_context.hpp"
#include "ftr/rpc/frame_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace ftr::rpc {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief What the server dispatches decoded calls to
 *
 * transfer_to_remote() and remove() may block; the server runs them on its
 * worker pool. open_put() must return quickly.
 */
class ServiceHandler {
public:
    virtual ~ServiceHandler() = default;

    virtual Result<file::TransferResult> transfer_to_remote(const CallContext& context,
                                                            const file::TransferRequest& request) = 0;

    /// A receiver for a new Put stream, or the reason the call is refused
    virtual Result<std::unique_ptr<file::PutReceiver>> open_put(const CallContext& context) = 0;

    virtual Result<void> remove(const CallContext& context, const std::string& remote_file) = 0;
};

/**
 * @brief One client socket, serving calls one after another
 *
 * All handlers run on the socket's strand. Reads are paused while a
 * blocking call runs on the worker pool, so frames of the next call stay
 * buffered in the kernel until the response is queued.
 *
 * Lifecycle:
 * 1. Created when the connection is accepted
 * 2. start() begins the read loop
 * 3. Destroyed when the peer disconnects or a protocol error is answered
 *    (an unfinished Put is discarded with it)
 */
class RpcConnection : public std::enable_shared_from_this<RpcConnection> {
public:
    RpcConnection(tcp::socket socket, ServiceHandler& handler, asio::thread_pool& workers);

    void start();

private:
    enum class CallState {
        IDLE,                    // Waiting for CallStart
        AWAIT_TRANSFER_REQUEST,
        AWAIT_REMOVE_REQUEST,
        PUT_STREAMING,           // Feeding the receiver
        DRAINING,                // Put answered; discarding until EndOfStream
        WORKING,                 // Blocking call on the worker pool
        CLOSING                  // Final status queued; close after write
    };

    void do_read();
    void process_frames();
    void handle_frame(Frame frame);

    void begin_call(const Frame& frame);
    void handle_put_frame(Frame frame);
    void finish_put(const Result<void>& outcome, CallState next);
    void on_put_deadline(const boost::system::error_code& ec);

    template<typename Work>
    void run_on_worker(Work work);

    void queue_write(const Frame& frame);
    void do_write();
    void protocol_error(const Error& error);
    void close();

    tcp::socket socket_;
    ServiceHandler& handler_;
    asio::thread_pool& workers_;
    asio::steady_timer put_timer_;
    FrameParser parser_;
    std::array<std::uint8_t, 64 * 1024> buffer_;
    std::string peer_;

    CallState state_ = CallState::IDLE;
    CallContext call_;
    std::unique_ptr<file::PutReceiver> receiver_;

    std::deque<std::vector<std::uint8_t>> write_queue_;
    bool reading_ = false;
};

/**
 * @brief Framed RPC server for the file service
 *
 * Owns the acceptor and the worker pool; the io_context is the caller's,
 * and may be run from several threads (each connection has its own strand).
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * auto server = RpcServer::create(io_context, "0.0.0.0", 50052, service, 4);
 * io_context.run();
 * ```
 */
class RpcServer {
public:
    /**
     * @brief Bind, listen and start accepting
     *
     * @param port 0 picks an ephemeral port, see port()
     * @return Unavailable when the address cannot be bound
     */
    static Result<std::unique_ptr<RpcServer>> create(asio::io_context& io_context,
                                                     const std::string& address,
                                                     uint16_t port,
                                                     ServiceHandler& handler,
                                                     std::size_t worker_threads);
    ~RpcServer();

    RpcServer(const RpcServer&) = delete;
    RpcServer& operator=(const RpcServer&) = delete;

    uint16_t port() const { return port_; }

    /// Stop accepting and wait for in-flight worker calls
    void stop();

private:
    RpcServer(asio::io_context& io_context,
              tcp::acceptor acceptor,
              ServiceHandler& handler,
              std::size_t worker_threads);

    void do_accept();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    ServiceHandler& handler_;
    asio::thread_pool workers_;
    uint16_t port_;
    bool stopped_ = false;
};

/// Parses the x-timeout-ms metadata entry into an absolute deadline
Deadline deadline_from_metadata(const file::CallMetadata& metadata);

} // namespace ftr::rpc
