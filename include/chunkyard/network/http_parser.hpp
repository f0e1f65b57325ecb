#pragma once

#include "chunkyard/core/result.hpp"
#include "chunkyard/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace chunkyard {
namespace network {

/**
 * @brief State machine states for HTTP request parsing
 *
 * Request format:
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
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
    PARSE_ERROR  // Renamed to avoid the Windows ERROR macro
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Feed it bytes as they arrive from the socket; parse() returns true once a
 * whole request (headers plus Content-Length body) has been seen. Bodies
 * larger than the configured limit are rejected before they are buffered,
 * since chunk uploads arrive as multipart bodies that are held in memory.
 *
 * ```cpp
 * HttpParser parser;
 * auto result = parser.parse(data, len);
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 */
class HttpParser {
public:
    static constexpr size_t kDefaultMaxBodySize = 64 * 1024 * 1024;

    explicit HttpParser(size_t max_body_size = kDefaultMaxBodySize)
        : max_body_size_(max_body_size) {
        reset();
    }

    /**
     * @return true when the request is complete, false if more data is needed,
     *         or ErrorCode::MalformedRequest
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            if (state_ == ParseState::BODY) {
                // Bulk-copy the body instead of walking it byte by byte
                const size_t wanted = expected_body_length_ - request_.body.size();
                const size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(), data + i, data + i + take);
                i += take - 1;
                if (request_.body.size() >= expected_body_length_) {
                    state_ = ParseState::COMPLETE;
                    return Ok(true);
                }
                continue;
            }

            char c = data[i];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD:
                    ok = parse_method(c);
                    break;
                case ParseState::URL:
                    ok = parse_url(c);
                    break;
                case ParseState::VERSION:
                    ok = parse_version(c);
                    break;
                case ParseState::HEADER_NAME:
                    ok = parse_header_name(c);
                    break;
                case ParseState::HEADER_VALUE:
                    ok = parse_header_value(c);
                    break;
                case ParseState::BODY:
                    break;
                case ParseState::COMPLETE:
                    return Ok(true);
                case ParseState::PARSE_ERROR:
                    return fail("Parser in error state");
            }

            if (!ok) {
                const std::string what = error_.empty() ? "Malformed request" : error_;
                state_ = ParseState::PARSE_ERROR;
                return fail(what + " at line " + std::to_string(line_));
            }

            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief The parsed request; only meaningful after parse() returned true
     */
    HttpRequest get_request() const {
        return request_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    /**
     * @brief True when the last failure was an oversized body
     */
    bool body_too_large() const {
        return body_too_large_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        expected_body_length_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;                // Current token
    std::string current_header_name_;
    std::string error_;
    size_t max_body_size_;
    size_t expected_body_length_;
    size_t line_;                       // For error reporting
    bool last_char_was_cr_;
    bool body_too_large_;

    static Result<bool> fail(const std::string& message) {
        return Err<bool>(ErrorCode::MalformedRequest, message);
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                error_ = "Empty HTTP method";
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                error_ = "Unknown HTTP method";
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            error_ = "Failed to parse HTTP method";
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                error_ = "Empty URL";
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            error_ = "Failed to parse URL";
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
                error_ = "Unknown HTTP version";
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
                error_ = "Empty header name";
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            error_ = "Failed to parse header name";
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
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

    bool finish_headers() {
        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        if (content_length.size() > 19) {
            error_ = "Invalid Content-Length";
            return false;
        }
        uint64_t body_length = 0;
        for (char c : content_length) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                error_ = "Invalid Content-Length";
                return false;
            }
            body_length = body_length * 10 + static_cast<uint64_t>(c - '0');
        }
        if (body_length > max_body_size_) {
            body_too_large_ = true;
            error_ = "Request body exceeds " + std::to_string(max_body_size_) + " bytes";
            return false;
        }

        if (body_length == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        expected_body_length_ = static_cast<size_t>(body_length);
        request_.body.reserve(body_length);
        state_ = ParseState::BODY;
        return true;
    }
};

} // namespace network
} // namespace chunkyard
