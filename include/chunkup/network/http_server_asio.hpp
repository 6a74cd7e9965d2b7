#pragma once

#include "chunkup/network/http_parser.hpp"
#include "chunkup/network/http_types.hpp"

#include <boost/asio.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <string>

namespace chunkup::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted connection: read a request, run the handler, reply, close
 *
 * Kept alive by the shared_ptr captured in each pending async operation.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_bytes);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_parse_error(const Error& error);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
};

/**
 * @brief Event-driven HTTP/1.1 server on Boost.Asio
 *
 * The server only registers async operations on the io_context; callers
 * choose how many threads run it. The handler may therefore be invoked
 * concurrently and must be thread-safe.
 *
 * Each connection serves exactly one request (Connection: close).
 *
 * ```cpp
 * asio::io_context io;
 * HttpServerAsio server(io, 8080);
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * io.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param port Port to bind; 0 picks an ephemeral port (see get_port())
     * @param address Local address to bind
     * @param max_body_bytes Requests declaring a larger body get 413
     * @throws boost::system::system_error if the port cannot be bound
     */
    HttpServerAsio(asio::io_context& io_context,
                   std::uint16_t port,
                   const std::string& address = "0.0.0.0",
                   std::size_t max_body_bytes = std::numeric_limits<std::size_t>::max());

    /// Must be called before the io_context starts running
    void set_handler(HttpRequestHandler handler);

    /// Port actually bound
    std::uint16_t get_port() const { return port_; }

    /// Stop accepting new connections; in-flight requests complete
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t max_body_bytes_;
    std::uint16_t port_ = 0;
};

} // namespace chunkup::network
