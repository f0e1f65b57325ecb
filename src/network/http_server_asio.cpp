#include "chunkyard/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace chunkyard {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_size)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_size) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error(parse_result.error());
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.get_request();

            spdlog::info("{} {} HTTP/{} ({} byte body)",
                HttpMethodUtils::to_string(request.method),
                request.path(),
                request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0",
                request.body.size());

            HttpResponse response;
            if (!handler_) {
                response = create_error_response(HttpStatus::SERVICE_UNAVAILABLE,
                                                 "No request handler installed");
            } else {
                try {
                    response = handler_(request);
                } catch (const std::exception& e) {
                    spdlog::error("Handler threw exception: {}", e.what());
                    response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR,
                                                     "Internal server error");
                }
            }

            do_write(response);
        });
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    // Owned by the completion handler until the write finishes
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);

                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
        });
}

void HttpConnection::handle_error(const Error& error) {
    const HttpStatus status = parser_.body_too_large() ? HttpStatus::PAYLOAD_TOO_LARGE
                                                       : HttpStatus::BAD_REQUEST;
    spdlog::warn("Rejecting request ({}): {}", static_cast<int>(status), error.message);

    do_write(create_error_response(status, error.message));
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain");
    response.set_header("Connection", "close");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, uint16_t port, size_t max_body_size)
    : acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , max_body_size_(max_body_size)
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server listening on port {}", port_);

    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Closing acceptor failed: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }

            if (!ec) {
                spdlog::debug("Accepted connection from {}",
                              socket.remote_endpoint(ec).address().to_string());
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_size_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        });
}

} // namespace network
} // namespace chunkyard
