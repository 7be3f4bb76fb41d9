#include "support/http_test_server.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace ftr::test {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

HttpTestServer::HttpTestServer()
    : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    do_accept();
    thread_ = std::thread([this]() { io_.run(); });
}

HttpTestServer::~HttpTestServer() {
    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void HttpTestServer::serve(const std::string& target, Response response) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[target] = std::move(response);
}

void HttpTestServer::serve(const std::string& target, const std::string& body) {
    Response response;
    response.body = body;
    serve(target, std::move(response));
}

std::string HttpTestServer::url(const std::string& target) const {
    return "http://127.0.0.1:" + std::to_string(port_) + target;
}

void HttpTestServer::do_accept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
            return;
        }
        handle(std::move(socket));
        do_accept();
    });
}

void HttpTestServer::handle(tcp::socket socket) {
    beast::flat_buffer buffer;
    http::request<http::string_body> request;
    boost::system::error_code ec;

    http::read(socket, buffer, request, ec);
    if (ec) {
        return;
    }
    ++requests_;

    Response canned;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(std::string(request.target()));
        if (it != routes_.end()) {
            canned = it->second;
            found = true;
        }
    }
    if (!found) {
        canned.status = 404;
        canned.body = "not found";
    }
    if (canned.delay.count() > 0) {
        std::this_thread::sleep_for(canned.delay);
    }

    http::response<http::string_body> response{static_cast<http::status>(canned.status),
                                               request.version()};
    response.set(http::field::server, "ftr-test");
    response.set(http::field::content_type, "application/octet-stream");
    if (!canned.location.empty()) {
        response.set(http::field::location, canned.location);
    }
    response.body() = canned.body;
    response.keep_alive(false);
    response.prepare_payload();

    http::write(socket, response, ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace ftr::test
