#include "chunkup/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t max_body_bytes)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_bytes) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, std::size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_parse_error(parse_result.error());
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.take_request();
            spdlog::debug("{} {} ({} body bytes)",
                          HttpMethodUtils::to_string(request.method), request.url, request.body.size());

            HttpResponse response;
            try {
                response = handler_ ? handler_(request)
                                    : create_error_response(HttpStatus::SERVICE_UNAVAILABLE, "No handler");
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
            }

            do_write(response);
        });
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    auto data = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data),
        [this, self, data](boost::system::error_code ec, std::size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }
            spdlog::trace("Sent {} bytes", bytes_transferred);

            boost::system::error_code shutdown_ec;
            socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            if (shutdown_ec) {
                spdlog::debug("Socket shutdown: {}", shutdown_ec.message());
            }
        });
}

void HttpConnection::handle_parse_error(const Error& error) {
    spdlog::warn("Rejecting malformed request: {}", error.message);

    const HttpStatus status = parser_.payload_too_large()
        ? HttpStatus::PAYLOAD_TOO_LARGE
        : HttpStatus::BAD_REQUEST;
    do_write(create_error_response(status, error.message));
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_header("Content-Type", "text/plain");
    response.set_header("Connection", "close");
    response.set_body(message);
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               std::uint16_t port,
                               const std::string& address,
                               std::size_t max_body_bytes)
    : acceptor_(io_context)
    , max_body_bytes_(max_body_bytes) {

    const tcp::endpoint endpoint(asio::ip::make_address(address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    port_ = acceptor_.local_endpoint().port();
    spdlog::info("HTTP server listening on {}:{}", address, port_);

    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("Closing acceptor: {}", ec.message());
        }
    });
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (ec) {
                spdlog::error("Accept error: {}", ec.message());
            } else {
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_bytes_)->start();
            }
            do_accept();
        });
}

} // namespace chunkup::network
