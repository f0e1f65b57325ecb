#pragma once

#include "chunkyard/network/http_parser.hpp"
#include "chunkyard/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>

namespace chunkyard {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted connection: read a request, answer it, close
 *
 * Lives in a shared_ptr held by its pending async operations, so it is
 * destroyed once the response is written or the socket fails.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_size);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);

    /**
     * @brief Answer a request the parser rejected (400, or 413 for oversized bodies)
     */
    void handle_error(const Error& error);

    HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP server on a Boost.Asio io_context
 *
 * Slow clients cost a buffer, not a thread. The handler runs on whichever
 * thread calls io_context.run().
 *
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 8080);
 * server.set_handler([&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * io_context.run();
 * ```
 *
 * Binding happens in the constructor; a port already in use throws
 * boost::system::system_error.
 */
class HttpServerAsio {
public:
    /**
     * @param io_context Event loop (must outlive this server)
     * @param port Port to listen on; 0 picks an ephemeral port
     * @param max_body_size Largest request body accepted, in bytes
     */
    HttpServerAsio(asio::io_context& io_context, uint16_t port,
                   size_t max_body_size = HttpParser::kDefaultMaxBodySize);

    /**
     * @brief Set the request handler; call before io_context.run()
     */
    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Stop accepting connections; in-flight requests finish
     */
    void stop();

    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    size_t max_body_size_;
    uint16_t port_;
};

} // namespace network
} // namespace chunkyard
