#pragma once

#include "ftr/rpc/call_context.hpp"
#include "ftr/rpc/channel.hpp"
#include "ftr/rpc/frame.hpp"
#include "ftr/rpc/frame_parser.hpp"
#include "ftr/rpc/messages.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ftr::rpc {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief One blocking TCP connection with per-operation deadlines
 *
 * Each operation is started asynchronously and the private io_context is
 * run until the deadline; a timed-out operation closes the socket and the
 * connection is marked broken.
 */
class ClientConnection {
public:
    ClientConnection();

    ClientConnection(const ClientConnection&) = delete;
    ClientConnection& operator=(const ClientConnection&) = delete;

    Result<void> connect(const std::string& host, std::uint16_t port, Deadline deadline);
    Result<void> write_frame(const Frame& frame, Deadline deadline);
    Result<Frame> read_frame(Deadline deadline);

    /// A frame the peer already sent, without blocking
    Result<std::optional<Frame>> poll_frame();

    bool broken() const noexcept { return broken_; }
    void close();

private:
    Result<void> run(Deadline deadline, const char* what);

    asio::io_context io_;
    tcp::socket socket_;
    FrameParser parser_;
    std::array<std::uint8_t, 64 * 1024> buffer_{};
    bool broken_ = false;
};

/**
 * @brief Channel over plain TCP with a small pool of idle connections
 *
 * A call checks out a connection (or dials a new one), and returns it to
 * the pool only if the call ran to a clean end. Concurrent calls use
 * separate connections.
 */
class TcpChannel : public Channel, public std::enable_shared_from_this<TcpChannel> {
public:
    struct Options {
        std::chrono::milliseconds connect_timeout{5000};
        std::size_t max_idle = 4;
    };

    TcpChannel(std::string host, std::uint16_t port);
    TcpChannel(std::string host, std::uint16_t port, Options options);

    /// Dial once so unreachable peers fail fast; the connection is pooled
    Result<void> warm_up(Deadline deadline);

    Result<std::unique_ptr<PutCall>> open_put(const file::CallMetadata& metadata,
                                              Deadline deadline) override;

    Result<file::TransferResult> transfer_to_remote(const file::CallMetadata& metadata,
                                                    const file::TransferRequest& request,
                                                    Deadline deadline) override;

    Result<void> remove(const file::CallMetadata& metadata,
                        const std::string& remote_file,
                        Deadline deadline) override;

    std::string target() const override;
    void shutdown() override;

    std::size_t idle_connections() const;

    /// An idle pooled connection, or a freshly dialed one
    Result<std::unique_ptr<ClientConnection>> acquire(Deadline deadline);

    /// Back to the pool; broken connections and overflow are closed
    void release(std::unique_ptr<ClientConnection> connection);

private:
    std::unique_ptr<ClientConnection> take_idle();
    Result<std::unique_ptr<ClientConnection>> dial(Deadline deadline);
    Result<std::unique_ptr<ClientConnection>> start_call(Method method,
                                                         const file::CallMetadata& metadata,
                                                         Deadline deadline);

    std::string host_;
    std::uint16_t port_;
    Options options_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<ClientConnection>> idle_;
    bool shut_down_ = false;
};

} // namespace ftr::rpc
