#include "ftr/fetch/http_fetcher.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace ftr::fetch {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

/// Runs one async operation to completion on a private io_context
template<typename Initiate>
boost::system::error_code run_op(asio::io_context& io, Initiate&& initiate) {
    boost::system::error_code result = asio::error::would_block;
    initiate([&result](boost::system::error_code ec, auto&&...) { result = ec; });
    io.restart();
    io.run();
    return result;
}

StatusCode classify(const boost::system::error_code& ec) {
    if (ec == beast::error::timeout) {
        return StatusCode::DeadlineExceeded;
    }
    return StatusCode::Internal;
}

void arm(beast::tcp_stream& stream, const Deadline& deadline) {
    if (deadline.is_infinite()) {
        stream.expires_never();
    } else {
        stream.expires_at(deadline.time_point());
    }
}

/// Resolves on the session's io_context, giving up at the deadline
Result<tcp::resolver::results_type> resolve(asio::io_context& io, const ParsedUrl& parsed,
                                            const Deadline& deadline) {
    using Endpoints = tcp::resolver::results_type;

    if (deadline.expired()) {
        return Fail<Endpoints>(StatusCode::DeadlineExceeded, "timed out resolving " + parsed.host);
    }

    tcp::resolver resolver(io);
    boost::system::error_code ec = asio::error::would_block;
    Endpoints endpoints;
    resolver.async_resolve(parsed.host, parsed.port,
        [&](boost::system::error_code e, Endpoints results) {
            ec = e;
            endpoints = std::move(results);
        });

    io.restart();
    if (deadline.is_infinite()) {
        io.run();
    } else {
        io.run_until(deadline.time_point());
    }

    if (!io.stopped()) {
        // The handler still refers to this frame, so drain it before returning
        resolver.cancel();
        io.restart();
        io.run();
        return Fail<Endpoints>(StatusCode::DeadlineExceeded, "timed out resolving " + parsed.host);
    }
    if (ec) {
        return Fail<Endpoints>(StatusCode::Internal,
            "failed to resolve " + parsed.host + ": " + ec.message());
    }
    return Ok(std::move(endpoints));
}

bool is_redirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

/**
 * @brief One HTTP exchange: connection, read buffer and incremental parser
 *
 * Pinned in memory because Beast keeps references into it.
 */
struct Session {
    asio::io_context io;
    beast::tcp_stream stream{io};
    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
};

class HttpBodyStream : public ByteStream {
public:
    HttpBodyStream(std::unique_ptr<Session> session, Deadline deadline)
        : session_(std::move(session)), deadline_(deadline) {}

    ~HttpBodyStream() override {
        boost::system::error_code ec;
        session_->stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    Result<std::size_t> read(void* buffer, std::size_t capacity) override {
        if (capacity == 0 || session_->parser.is_done()) {
            return Ok<std::size_t>(0);
        }
        if (deadline_.expired()) {
            return Fail<std::size_t>(StatusCode::DeadlineExceeded, "HTTP body read deadline exceeded");
        }

        auto& body = session_->parser.get().body();
        body.data = buffer;
        body.size = capacity;

        arm(session_->stream, deadline_);
        auto ec = run_op(session_->io, [&](auto handler) {
            http::async_read(session_->stream, session_->buffer, session_->parser, std::move(handler));
        });
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec == http::error::body_limit) {
            return Fail<std::size_t>(StatusCode::Internal, "response body exceeds maximum allowed size");
        }
        if (ec) {
            return Fail<std::size_t>(classify(ec), "failed to read HTTP body: " + ec.message());
        }

        return Ok<std::size_t>(capacity - body.size);
    }

private:
    std::unique_ptr<Session> session_;
    Deadline deadline_;
};

} // namespace

Result<ParsedUrl> parse_http_url(const std::string& url) {
    const std::string scheme = "http://";
    if (url.size() <= scheme.size()) {
        return Fail<ParsedUrl>(StatusCode::InvalidArgument, "invalid URL: " + url);
    }
    std::string lower_scheme = url.substr(0, scheme.size());
    std::transform(lower_scheme.begin(), lower_scheme.end(), lower_scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower_scheme != scheme) {
        return Fail<ParsedUrl>(StatusCode::InvalidArgument, "only http:// URLs are supported, got: " + url);
    }

    const std::string rest = url.substr(scheme.size());
    const auto slash = rest.find_first_of("/?");
    std::string authority = rest.substr(0, slash);
    std::string target = slash == std::string::npos ? "/" : rest.substr(slash);
    if (!target.empty() && target.front() == '?') {
        target = "/" + target;
    }

    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    ParsedUrl parsed;
    parsed.target = target;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Fail<ParsedUrl>(StatusCode::InvalidArgument, "invalid IPv6 host in URL: " + url);
        }
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            parsed.port = authority.substr(close + 2);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    } else {
        parsed.host = authority;
    }

    if (parsed.port.empty()) {
        parsed.port = "80";
    }
    if (parsed.host.empty()) {
        return Fail<ParsedUrl>(StatusCode::InvalidArgument, "URL has no host: " + url);
    }
    if (!std::all_of(parsed.port.begin(), parsed.port.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return Fail<ParsedUrl>(StatusCode::InvalidArgument, "invalid port in URL: " + url);
    }
    return Ok(std::move(parsed));
}

Result<FetchedStream> HttpFetcher::open(const std::string& url,
                                        std::uint64_t max_bytes,
                                        Deadline deadline) {
    std::string current = url;

    for (int hop = 0; hop <= options_.max_redirects; ++hop) {
        auto parsed_result = parse_http_url(current);
        if (parsed_result.is_error()) {
            return Err<FetchedStream>(parsed_result.error());
        }
        const auto& parsed = parsed_result.value();

        auto session = std::make_unique<Session>();

        const Deadline connect_deadline = deadline.capped(options_.connect_timeout);
        auto endpoints = resolve(session->io, parsed, connect_deadline);
        if (endpoints.is_error()) {
            return Err<FetchedStream>(endpoints.error());
        }

        arm(session->stream, connect_deadline);
        auto ec = run_op(session->io, [&](auto handler) {
            session->stream.async_connect(endpoints.value(), std::move(handler));
        });
        if (ec) {
            return Fail<FetchedStream>(classify(ec),
                "failed to connect to " + parsed.host + ":" + parsed.port + ": " + ec.message());
        }

        http::request<http::empty_body> request{http::verb::get, parsed.target, 11};
        request.set(http::field::host, parsed.host);
        request.set(http::field::user_agent, options_.user_agent);

        arm(session->stream, deadline);
        ec = run_op(session->io, [&](auto handler) {
            http::async_write(session->stream, request, std::move(handler));
        });
        if (ec) {
            return Fail<FetchedStream>(classify(ec), "failed to send HTTP request: " + ec.message());
        }

        session->parser.body_limit(max_bytes);
        ec = run_op(session->io, [&](auto handler) {
            http::async_read_header(session->stream, session->buffer, session->parser, std::move(handler));
        });
        if (ec) {
            return Fail<FetchedStream>(classify(ec), "failed to read HTTP response header: " + ec.message());
        }

        const auto& header = session->parser.get();
        const unsigned status = header.result_int();

        if (is_redirect(status)) {
            const auto location = header[http::field::location];
            if (location.empty()) {
                return Fail<FetchedStream>(StatusCode::Internal,
                    "HTTP " + std::to_string(status) + " without Location header");
            }
            std::string next(location.data(), location.size());
            if (!next.empty() && next.front() == '/') {
                next = "http://" + parsed.host + ":" + parsed.port + next;
            }
            spdlog::debug("Following HTTP {} redirect to {}", status, next);
            current = std::move(next);
            continue;
        }

        if (status == 404) {
            return Fail<FetchedStream>(StatusCode::NotFound, "remote file not found: " + current);
        }
        if (status < 200 || status >= 300) {
            return Fail<FetchedStream>(StatusCode::Internal,
                "HTTP request failed with status " + std::to_string(status));
        }

        FetchedStream fetched;
        if (const auto length = session->parser.content_length()) {
            if (*length > max_bytes) {
                return Fail<FetchedStream>(StatusCode::Internal,
                    "file size " + std::to_string(*length) + " exceeds maximum allowed size " +
                    std::to_string(max_bytes));
            }
            fetched.size_hint = *length;
        }
        fetched.stream = std::make_unique<HttpBodyStream>(std::move(session), deadline);
        return Ok(std::move(fetched));
    }

    return Fail<FetchedStream>(StatusCode::Internal,
        "too many redirects (limit " + std::to_string(options_.max_redirects) + ")");
}

} // namespace ftr::fetch
