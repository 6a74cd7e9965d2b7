/**
 * @file http_client.hpp
 * @brief Minimal blocking HTTP/1.1 client for talking to storage nodes
 */

#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace chunkup::network {

/**
 * @brief host/port/base path of an "http://host[:port][/base]" URL
 */
struct HttpEndpoint {
    std::string host;
    std::uint16_t port = 80;
    std::string base_path;   // No trailing slash; empty for the root

    static Result<HttpEndpoint> parse(const std::string& url);

    std::string to_string() const;
};

/**
 * @brief Blocking HTTP/1.1 client over Boost.Asio
 *
 * One connection per request (Connection: close). Every request is bounded
 * by the configured timeout covering resolve, connect, write and read.
 *
 * Transport failures (resolve, connect, timeout, malformed reply) are
 * reported as ErrorCode::RemoteUnavailable. Any well-formed reply,
 * including non-2xx, is returned as a value for the caller to interpret.
 *
 * Thread-safe: each call uses its own io_context and socket.
 */
class HttpClient {
public:
    HttpClient(HttpEndpoint endpoint, std::chrono::milliseconds timeout);

    Result<HttpResponse> request(HttpMethod method,
                                 const std::string& path,
                                 const std::unordered_map<std::string, std::string>& headers,
                                 const std::string& body) const;

    Result<HttpResponse> post(const std::string& path,
                              const std::unordered_map<std::string, std::string>& headers,
                              const std::string& body) const {
        return request(HttpMethod::POST, path, headers, body);
    }

    const HttpEndpoint& endpoint() const { return endpoint_; }

    /// Parse a raw "HTTP/1.x NNN ...\r\n..." reply (Content-Length, chunked or read-to-EOF body)
    static Result<HttpResponse> parse_response(const std::string& raw);

private:
    HttpEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
};

} // namespace chunkup::network
