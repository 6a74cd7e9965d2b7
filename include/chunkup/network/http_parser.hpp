#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <limits>
#include <string>

namespace chunkup::network {

/**
 * @brief States of the request parser
 *
 * METHOD SP URL SP VERSION CRLF    <- request line
 * Header-Name: Header-Value CRLF   <- headers
 * CRLF
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Data may be fed in arbitrary pieces as it arrives from the socket.
 * Request line and headers are consumed byte by byte; the body is copied
 * in bulk since chunk uploads carry megabytes.
 *
 * ```cpp
 * HttpParser parser(max_body);
 * auto result = parser.parse(buf, n);
 * if (result.is_error()) { ... }
 * if (result.value()) { HttpRequest req = parser.get_request(); }
 * ```
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpParser(std::size_t max_body_bytes = std::numeric_limits<std::size_t>::max())
        : max_body_bytes_(max_body_bytes) {
        reset();
    }

    /**
     * @return true once a complete request is available, false if more data is needed
     */
    Result<bool> parse(const char* data, std::size_t len) {
        for (std::size_t i = 0; i < len; ++i) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return fail("Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                const std::size_t take = std::min(len - i, body_length_ - request_.body.size());
                request_.body.insert(request_.body.end(), data + i, data + i + take);
                i += take - 1;
                if (request_.body.size() >= body_length_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i];
            if (++header_bytes_ > kMaxHeaderBytes) {
                return fail("Request header section too large");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                default: break;
            }

            if (!ok) {
                return fail(error_message_.empty()
                    ? "Malformed request at line " + std::to_string(line_)
                    : error_message_);
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const {
        return request_;
    }

    HttpRequest take_request() {
        return std::move(request_);
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    /// Set when the request failed because Content-Length exceeded the limit
    bool payload_too_large() const {
        return payload_too_large_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_message_.clear();
        body_length_ = 0;
        header_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        payload_too_large_ = false;
    }

private:
    Result<bool> fail(const std::string& message) {
        state_ = ParseState::PARSE_ERROR;
        return Err<bool>(Error::validation(message));
    }

    bool parse_method(char c) {
        if (c == ' ') {
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                error_message_ = "Unsupported HTTP method '" + buffer_ + "'";
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.set_target(buffer_);
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                error_message_ = "Unsupported HTTP version '" + buffer_ + "'";
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    // Blank line seen: decide whether a body follows
    bool finish_headers() {
        if (!request_.get_header("Transfer-Encoding").empty()) {
            error_message_ = "Transfer-Encoding request bodies are not supported";
            return false;
        }

        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        for (char d : content_length) {
            if (!std::isdigit(static_cast<unsigned char>(d))) {
                error_message_ = "Invalid Content-Length '" + content_length + "'";
                return false;
            }
        }
        if (content_length.size() > 18) {
            payload_too_large_ = true;
            error_message_ = "Request body too large";
            return false;
        }

        body_length_ = static_cast<std::size_t>(std::stoull(content_length));
        if (body_length_ > max_body_bytes_) {
            payload_too_large_ = true;
            error_message_ = "Request body of " + std::to_string(body_length_) +
                             " bytes exceeds limit of " + std::to_string(max_body_bytes_);
            return false;
        }

        if (body_length_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        request_.body.reserve(body_length_);
        state_ = ParseState::BODY;
        return true;
    }

    std::size_t max_body_bytes_;
    ParseState state_ = ParseState::METHOD;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_message_;
    std::size_t body_length_ = 0;
    std::size_t header_bytes_ = 0;
    std::size_t line_ = 1;
    bool last_char_was_cr_ = false;
    bool payload_too_large_ = false;
};

} // namespace chunkup::network
