#include "chunkup/network/http_client.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace chunkup::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

bool parse_port(const std::string& text, std::uint16_t& port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    const int value = std::stoi(text);
    if (value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<std::uint16_t>(value);
    return true;
}

Result<HttpResponse> malformed(const std::string& why) {
    return Err<HttpResponse>(Error::remote_unavailable("Malformed HTTP reply: " + why));
}

// Decode a Transfer-Encoding: chunked body
bool decode_chunked(const std::string& data, std::vector<uint8_t>& out) {
    std::size_t pos = 0;
    while (true) {
        const auto line_end = data.find("\r\n", pos);
        if (line_end == std::string::npos) {
            return false;
        }
        std::string size_text = data.substr(pos, line_end - pos);
        const auto ext = size_text.find(';');
        if (ext != std::string::npos) {
            size_text.resize(ext);
        }
        // More than 15 hex digits cannot be a real chunk and risks overflow
        if (size_text.empty() || size_text.size() > 15) {
            return false;
        }
        std::size_t chunk_size = 0;
        for (char c : size_text) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            chunk_size = chunk_size * 16 +
                static_cast<std::size_t>(std::isdigit(static_cast<unsigned char>(c))
                    ? c - '0'
                    : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
        }
        pos = line_end + 2;
        if (chunk_size == 0) {
            return true;
        }
        if (chunk_size > data.size() - pos) {
            return false;
        }
        out.insert(out.end(), data.begin() + static_cast<std::ptrdiff_t>(pos),
                   data.begin() + static_cast<std::ptrdiff_t>(pos + chunk_size));
        pos += chunk_size + 2;
    }
}

} // namespace

// ──────────────────────────────────────────────────────────
// HttpEndpoint
// ──────────────────────────────────────────────────────────

Result<HttpEndpoint> HttpEndpoint::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return Err<HttpEndpoint>(Error::validation("Endpoint must start with http://: " + url));
    }

    const std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);

    HttpEndpoint endpoint;
    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = authority;
    } else {
        endpoint.host = authority.substr(0, colon);
        if (!parse_port(authority.substr(colon + 1), endpoint.port)) {
            return Err<HttpEndpoint>(Error::validation("Invalid port in endpoint: " + url));
        }
    }
    if (endpoint.host.empty()) {
        return Err<HttpEndpoint>(Error::validation("Missing host in endpoint: " + url));
    }

    if (slash != std::string::npos) {
        endpoint.base_path = rest.substr(slash);
        while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
            endpoint.base_path.pop_back();
        }
    }
    return Ok(std::move(endpoint));
}

std::string HttpEndpoint::to_string() const {
    return "http://" + host + ":" + std::to_string(port) + base_path;
}

// ──────────────────────────────────────────────────────────
// HttpClient
// ──────────────────────────────────────────────────────────

HttpClient::HttpClient(HttpEndpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint))
    , timeout_(timeout) {
}

Result<HttpResponse> HttpClient::request(HttpMethod method,
                                         const std::string& path,
                                         const std::unordered_map<std::string, std::string>& headers,
                                         const std::string& body) const {
    std::ostringstream wire_stream;
    wire_stream << HttpMethodUtils::to_string(method) << " " << endpoint_.base_path << path << " HTTP/1.1\r\n"
                << "Host: " << endpoint_.host << ":" << endpoint_.port << "\r\n"
                << "Connection: close\r\n"
                << "Content-Length: " << body.size() << "\r\n";
    for (const auto& [name, value] : headers) {
        wire_stream << name << ": " << value << "\r\n";
    }
    wire_stream << "\r\n" << body;
    const std::string wire = wire_stream.str();

    asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);
    std::string raw;
    boost::system::error_code failure;
    const char* stage = "resolve";
    bool finished = false;

    resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
        [&](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (ec) {
                failure = ec;
                finished = true;
                return;
            }
            stage = "connect";
            asio::async_connect(socket, results,
                [&](const boost::system::error_code& ec, const tcp::endpoint&) {
                    if (ec) {
                        failure = ec;
                        finished = true;
                        return;
                    }
                    stage = "write";
                    asio::async_write(socket, asio::buffer(wire),
                        [&](const boost::system::error_code& ec, std::size_t) {
                            if (ec) {
                                failure = ec;
                                finished = true;
                                return;
                            }
                            stage = "read";
                            asio::async_read(socket, asio::dynamic_buffer(raw),
                                [&](const boost::system::error_code& ec, std::size_t) {
                                    if (ec && ec != asio::error::eof) {
                                        failure = ec;
                                    }
                                    finished = true;
                                });
                        });
                });
        });

    io.run_for(timeout_);

    if (!finished) {
        resolver.cancel();
        boost::system::error_code close_ec;
        socket.close(close_ec);
        if (close_ec) {
            spdlog::debug("Closing timed out socket: {}", close_ec.message());
        }
        // Let the cancelled handlers run before the captured locals go away
        io.restart();
        io.run();
        return Err<HttpResponse>(Error::remote_unavailable(
            "Timed out during " + std::string(stage) + " to " + endpoint_.to_string() + path));
    }

    if (failure) {
        return Err<HttpResponse>(Error::remote_unavailable(
            std::string(stage) + " to " + endpoint_.to_string() + path + " failed: " + failure.message()));
    }

    return parse_response(raw);
}

Result<HttpResponse> HttpClient::parse_response(const std::string& raw) {
    const auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return malformed(raw.empty() ? "empty reply" : "no end of headers");
    }

    std::istringstream head(raw.substr(0, header_end));
    std::string status_line;
    std::getline(head, status_line);
    if (!status_line.empty() && status_line.back() == '\r') {
        status_line.pop_back();
    }

    HttpResponse response;
    if (status_line.compare(0, 7, "HTTP/1.") != 0 || status_line.size() < 12) {
        return malformed("bad status line '" + status_line + "'");
    }
    response.version = status_line[7] == '0' ? HttpVersion::HTTP_1_0 : HttpVersion::HTTP_1_1;

    const std::string code = status_line.substr(9, 3);
    for (char c : code) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return malformed("bad status code '" + code + "'");
        }
    }
    response.status_code = std::stoi(code);
    response.reason_phrase = status_line.size() > 13 ? status_line.substr(13) : "";

    std::string line;
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string value = line.substr(colon + 1);
        while (!value.empty() && value.front() == ' ') {
            value.erase(value.begin());
        }
        response.headers[line.substr(0, colon)] = value;
    }

    const std::string payload = raw.substr(header_end + 4);
    if (iequals(response.get_header("Transfer-Encoding"), "chunked")) {
        if (!decode_chunked(payload, response.body)) {
            return malformed("truncated chunked body");
        }
        return Ok(std::move(response));
    }

    const std::string length_text = response.get_header("Content-Length");
    if (!length_text.empty()) {
        std::size_t length = 0;
        for (char c : length_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return malformed("bad Content-Length '" + length_text + "'");
            }
            length = length * 10 + static_cast<std::size_t>(c - '0');
        }
        if (payload.size() < length) {
            return malformed("body shorter than Content-Length");
        }
        response.body.assign(payload.begin(), payload.begin() + static_cast<std::ptrdiff_t>(length));
        return Ok(std::move(response));
    }

    response.body.assign(payload.begin(), payload.end());
    return Ok(std::move(response));
}

} // namespace chunkup::network
