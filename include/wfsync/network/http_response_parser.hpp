#pragma once

#include "wfsync/core/result.hpp"
#include "wfsync/network/http_types.hpp"

#include <strings.h>

#include <cctype>
#include <stdexcept>
#include <string>

namespace wfsync {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * Response format:
 * VERSION SP STATUS SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF     <- Headers (multiple)
 * CRLF                               <- Empty line
 * [Body]                             <- Content-Length, chunked, or until EOF
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,            // Content-Length delimited
    CHUNK_SIZE,
    CHUNK_EXTENSION,
    CHUNK_DATA,
    CHUNK_DATA_END,  // CRLF after chunk data
    TRAILER,
    BODY_UNTIL_EOF,  // No length information, connection close ends the body
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.1 response parser
 *
 * Feed bytes as they arrive from the socket. When the peer closes the
 * connection call finish(): a response without Content-Length or chunked
 * encoding is only complete at EOF.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser;
 * while (read some bytes) {
 *     auto done = parser.parse(buf, n);
 *     if (done.is_error()) { ... }
 *     if (done.value()) break;
 * }
 * if (!parser.is_complete()) parser.finish();
 * HttpResponse response = parser.take_response();
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /**
     * @return true once the response is complete, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ResponseParseState::PARSE_ERROR) {
                return Err<bool>(ErrorCode::InvalidData, "Parser in error state");
            }

            if (!step(data[i])) {
                state_ = ResponseParseState::PARSE_ERROR;
                return Err<bool>(ErrorCode::InvalidData, error_ + " at line " + std::to_string(line_));
            }
        }
        return Ok(state_ == ResponseParseState::COMPLETE);
    }

    /**
     * @brief Signal end of stream
     *
     * Completes a read-until-close body; any other unfinished state means
     * the response was truncated.
     */
    Result<bool> finish() {
        if (state_ == ResponseParseState::BODY_UNTIL_EOF) {
            state_ = ResponseParseState::COMPLETE;
        }
        if (state_ == ResponseParseState::COMPLETE) {
            return Ok(true);
        }
        return Err<bool>(ErrorCode::Transport, "Connection closed before the response was complete");
    }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }

    ResponseParseState state() const { return state_; }

    const HttpResponse& response() const { return response_; }

    HttpResponse take_response() { return std::move(response_); }

    void reset() {
        state_ = ResponseParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    bool step(char c) {
        if (c == '\n') {
            line_++;
        }

        switch (state_) {
            case ResponseParseState::VERSION: return parse_version(c);
            case ResponseParseState::STATUS_CODE: return parse_status_code(c);
            case ResponseParseState::REASON: return parse_reason(c);
            case ResponseParseState::HEADER_NAME: return parse_header_name(c);
            case ResponseParseState::HEADER_VALUE: return parse_header_value(c);
            case ResponseParseState::BODY: return parse_body(c);
            case ResponseParseState::CHUNK_SIZE: return parse_chunk_size(c);
            case ResponseParseState::CHUNK_EXTENSION: return parse_chunk_extension(c);
            case ResponseParseState::CHUNK_DATA: return parse_chunk_data(c);
            case ResponseParseState::CHUNK_DATA_END: return parse_chunk_data_end(c);
            case ResponseParseState::TRAILER: return parse_trailer(c);
            case ResponseParseState::BODY_UNTIL_EOF:
                response_.body += c;
                return true;
            default:
                return fail("Unexpected parser state");
        }
    }

    bool fail(std::string message) {
        error_ = std::move(message);
        return false;
    }

    /**
     * "HTTP/1.1 200 OK"
     *  ^-- until the first space
     */
    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ != "HTTP/1.1" && buffer_ != "HTTP/1.0") {
                return fail("Unsupported HTTP version '" + buffer_ + "'");
            }
            buffer_.clear();
            state_ = ResponseParseState::STATUS_CODE;
            return true;
        }
        if (buffer_.size() >= 8) {
            return fail("Malformed status line");
        }
        buffer_ += c;
        return true;
    }

    /**
     * "HTTP/1.1 200 OK"
     *           ^-- three digits
     */
    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return fail("Malformed status code '" + buffer_ + "'");
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = ResponseParseState::REASON;
            last_char_was_cr_ = (c == '\r');
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail("Non-digit in status code");
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ResponseParseState::HEADER_NAME;
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
            if (!buffer_.empty()) {
                return fail("Header line without colon");
            }
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return fail("Invalid character in header name");
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
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    /**
     * Empty line seen: decide how the body is delimited
     */
    bool begin_body() {
        const int status = response_.status_code;
        if ((status >= 100 && status < 200) || status == 204 || status == 304) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }

        const std::string encoding = response_.get_header("Transfer-Encoding");
        if (!encoding.empty() && strcasecmp(encoding.c_str(), "chunked") == 0) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            try {
                remaining_ = std::stoull(content_length);
            } catch (const std::exception&) {
                return fail("Invalid Content-Length '" + content_length + "'");
            }
            if (remaining_ == 0) {
                state_ = ResponseParseState::COMPLETE;
                return true;
            }
            response_.body.reserve(remaining_);
            state_ = ResponseParseState::BODY;
            return true;
        }

        state_ = ResponseParseState::BODY_UNTIL_EOF;
        return true;
    }

    bool parse_body(char c) {
        response_.body += c;
        if (--remaining_ == 0) {
            state_ = ResponseParseState::COMPLETE;
        }
        return true;
    }

    /**
     * "1a3;ext=1\r\n" - hex size, optional extension ignored
     */
    bool parse_chunk_size(char c) {
        if (c == ';') {
            state_ = ResponseParseState::CHUNK_EXTENSION;
            return true;
        }
        if (c == ' ' || c == '\t') {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return end_chunk_size_line();
        }
        if (!std::isxdigit(static_cast<unsigned char>(c)) || buffer_.size() >= 16) {
            return fail("Invalid chunk size");
        }
        buffer_ += c;
        return true;
    }

    bool parse_chunk_extension(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return end_chunk_size_line();
        }
        last_char_was_cr_ = false;
        return true;
    }

    bool end_chunk_size_line() {
        if (buffer_.empty()) {
            return fail("Missing chunk size");
        }
        remaining_ = std::stoull(buffer_, nullptr, 16);
        buffer_.clear();
        state_ = remaining_ == 0 ? ResponseParseState::TRAILER : ResponseParseState::CHUNK_DATA;
        return true;
    }

    bool parse_chunk_data(char c) {
        response_.body += c;
        if (--remaining_ == 0) {
            state_ = ResponseParseState::CHUNK_DATA_END;
        }
        return true;
    }

    bool parse_chunk_data_end(char c) {
        if (c == '\r' && !last_char_was_cr_) {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }
        return fail("Missing CRLF after chunk data");
    }

    /**
     * Trailer headers are skipped; an empty line ends the message.
     */
    bool parse_trailer(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            if (buffer_.empty()) {
                state_ = ResponseParseState::COMPLETE;
            }
            buffer_.clear();
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;               // Current token
    std::string current_header_name_;
    std::string error_;
    unsigned long long remaining_;     // Bytes left in body or current chunk
    size_t line_;                      // For error reporting
    bool last_char_was_cr_;
};

} // namespace network
} // namespace wfsync
