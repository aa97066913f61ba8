#pragma once

#include <accord/http/http_common.hpp>
#include <accord/http/http_message.hpp>

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace accord::http {

/// HTTP parser result
enum class parse_result {
    need_more,      ///< Need more data
    complete,       ///< Parsing complete
    error           ///< Parse error
};

/// How a message body is delimited on the wire
enum class body_framing {
    none,
    content_length,
    chunked,
    until_close
};

/// Incremental decoder for chunked transfer coding
class chunked_decoder {
public:
    /// @param max_chunk Largest declared chunk size accepted (0 = unlimited)
    explicit chunked_decoder(size_t max_chunk = 0) : max_chunk_(max_chunk) {}

    /// Consume bytes from @p input, appending decoded payload to @p out
    parse_result feed(std::string& input, std::string& out) {
        for (;;) {
            switch (state_) {
                case state::size_line: {
                    auto line_end = input.find("\r\n");
                    if (line_end == std::string::npos) {
                        return parse_result::need_more;
                    }
                    std::string_view line(input.data(), line_end);
                    if (auto semi = line.find(';'); semi != std::string_view::npos) {
                        line = line.substr(0, semi);
                    }
                    size_t size = 0;
                    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), size, 16);
                    if (ec != std::errc{} || line.empty() || ptr != line.data() + line.size()) {
                        return parse_result::error;
                    }
                    if (size > SIZE_MAX - 2 || (max_chunk_ > 0 && size > max_chunk_)) {
                        oversized_ = true;
                        return parse_result::error;
                    }
                    input.erase(0, line_end + 2);
                    remaining_ = size;
                    state_ = size == 0 ? state::trailer : state::data;
                    break;
                }
                case state::data: {
                    if (input.size() < remaining_ + 2) {
                        // Hand out what we have so streaming readers see it early
                        size_t take = std::min(remaining_, input.size());
                        out.append(input, 0, take);
                        input.erase(0, take);
                        remaining_ -= take;
                        if (remaining_ > 0 || input.size() < 2) {
                            return parse_result::need_more;
                        }
                    }
                    out.append(input, 0, remaining_);
                    if (input.compare(remaining_, 2, "\r\n") != 0) {
                        return parse_result::error;
                    }
                    input.erase(0, remaining_ + 2);
                    remaining_ = 0;
                    state_ = state::size_line;
                    break;
                }
                case state::trailer: {
                    auto line_end = input.find("\r\n");
                    if (line_end == std::string::npos) {
                        return parse_result::need_more;
                    }
                    input.erase(0, line_end + 2);
                    if (line_end == 0) {
                        state_ = state::done;
                        return parse_result::complete;
                    }
                    break;
                }
                case state::done:
                    return parse_result::complete;
            }
        }
    }

    /// The last error was a chunk larger than the configured limit
    bool oversized() const noexcept { return oversized_; }

    void reset() noexcept {
        state_ = state::size_line;
        remaining_ = 0;
        oversized_ = false;
    }

private:
    enum class state { size_line, data, trailer, done };

    size_t max_chunk_;
    state state_ = state::size_line;
    size_t remaining_ = 0;
    bool oversized_ = false;
};

namespace detail {

/// Parse "Name: value" lines up to the blank line; returns need_more/complete/error
inline parse_result parse_header_block(std::string& buffer, headers& out, std::string& error) {
    for (;;) {
        auto line_end = buffer.find("\r\n");
        if (line_end == std::string::npos) {
            return parse_result::need_more;
        }
        if (line_end == 0) {
            buffer.erase(0, 2);
            return parse_result::complete;
        }

        std::string_view line(buffer.data(), line_end);
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            error = "Invalid header line";
            return parse_result::error;
        }

        auto name = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
            value.remove_suffix(1);
        }

        out.add(name, value);
        buffer.erase(0, line_end + 2);
    }
}

} // namespace detail

/// HTTP/1.1 request parser (server side)
///
/// Bytes past the end of a complete request stay buffered; for an upgraded
/// connection they are the first frames and can be taken with take_remaining().
class request_parser {
public:
    /// @param max_size Upper bound on head + body size (0 = unlimited)
    explicit request_parser(size_t max_size = 0) : max_size_(max_size), chunks_(max_size) {}

    parse_result parse(std::string_view data) {
        buffer_ += data;
        if (state_ == state::complete) {
            return parse_result::complete;
        }
        if (state_ == state::error) {
            return parse_result::error;
        }
        if (max_size_ > 0 && received_ + data.size() > max_size_) {
            return fail("Request exceeds maximum size");
        }
        received_ += data.size();

        if (state_ == state::request_line) {
            auto line_end = buffer_.find("\r\n");
            if (line_end == std::string::npos) {
                return parse_result::need_more;
            }
            if (!parse_request_line(std::string_view(buffer_.data(), line_end))) {
                return parse_result::error;
            }
            buffer_.erase(0, line_end + 2);
            state_ = state::headers;
        }

        if (state_ == state::headers) {
            auto rc = detail::parse_header_block(buffer_, request_.get_headers(), error_);
            if (rc == parse_result::error) {
                state_ = state::error;
                return rc;
            }
            if (rc == parse_result::need_more) {
                return rc;
            }
            const auto& hdrs = request_.get_headers();
            if (hdrs.is_chunked()) {
                state_ = state::chunked_body;
            } else if (auto len = hdrs.content_length()) {
                if (max_size_ > 0 && *len > max_size_) {
                    return fail("Request exceeds maximum size");
                }
                content_length_ = *len;
                state_ = state::body;
            } else if (hdrs.contains("Content-Length")) {
                return fail("Invalid Content-Length");
            } else {
                state_ = state::complete;
            }
        }

        if (state_ == state::body) {
            size_t take = std::min(content_length_ - body_.size(), buffer_.size());
            body_.append(buffer_, 0, take);
            buffer_.erase(0, take);
            if (body_.size() < content_length_) {
                return parse_result::need_more;
            }
            state_ = state::complete;
        }

        if (state_ == state::chunked_body) {
            auto rc = chunks_.feed(buffer_, body_);
            if (rc == parse_result::error) {
                return fail(chunks_.oversized() ? "Request exceeds maximum size" : "Malformed chunked body");
            }
            if (rc == parse_result::need_more) {
                return rc;
            }
            state_ = state::complete;
        }

        request_.set_body(std::move(body_));
        body_.clear();
        return parse_result::complete;
    }

    bool is_complete() const noexcept { return state_ == state::complete; }
    bool has_error() const noexcept { return state_ == state::error; }
    std::string_view error_message() const noexcept { return error_; }

    const request& get() const noexcept { return request_; }
    request take_request() { return std::move(request_); }

    /// Bytes received after the end of the request
    std::string take_remaining() { return std::exchange(buffer_, {}); }

private:
    enum class state { request_line, headers, body, chunked_body, complete, error };

    parse_result fail(std::string_view message) {
        error_ = message;
        state_ = state::error;
        return parse_result::error;
    }

    bool parse_request_line(std::string_view line) {
        auto space1 = line.find(' ');
        auto space2 = space1 == std::string_view::npos ? space1 : line.find(' ', space1 + 1);
        if (space2 == std::string_view::npos) {
            fail("Invalid request line");
            return false;
        }

        auto m = string_to_method(line.substr(0, space1));
        if (!m) {
            fail("Unknown HTTP method");
            return false;
        }
        request_.set_method(*m);

        auto uri = line.substr(space1 + 1, space2 - space1 - 1);
        if (auto q = uri.find('?'); q != std::string_view::npos) {
            request_.set_path(uri.substr(0, q));
            request_.set_query(uri.substr(q + 1));
        } else {
            request_.set_path(uri);
        }

        if (!line.substr(space2 + 1).starts_with("HTTP/1.")) {
            fail("Invalid HTTP version");
            return false;
        }
        return true;
    }

    size_t max_size_;
    size_t received_ = 0;
    state state_ = state::request_line;
    std::string buffer_;
    std::string body_;
    std::string error_;
    size_t content_length_ = 0;
    chunked_decoder chunks_;
    request request_;
};

/// HTTP/1.1 response parser (client side)
///
/// The head is parsed first; body bytes are then decoded incrementally so a
/// streaming consumer can drain them with take_body() while the response is
/// still arriving. finish() marks end-of-stream for read-until-close bodies.
class response_parser {
public:
    /// @param head_request Response to a HEAD request (never carries a body)
    explicit response_parser(bool head_request = false) : head_request_(head_request) {}

    parse_result parse(std::string_view data) {
        buffer_ += data;
        if (state_ == state::error) {
            return parse_result::error;
        }

        if (state_ == state::status_line) {
            auto line_end = buffer_.find("\r\n");
            if (line_end == std::string::npos) {
                return parse_result::need_more;
            }
            if (!parse_status_line(std::string_view(buffer_.data(), line_end))) {
                return parse_result::error;
            }
            buffer_.erase(0, line_end + 2);
            state_ = state::headers;
        }

        if (state_ == state::headers) {
            auto rc = detail::parse_header_block(buffer_, response_.get_headers(), error_);
            if (rc != parse_result::complete) {
                if (rc == parse_result::error) state_ = state::error;
                return rc;
            }
            select_framing();
            state_ = framing_ == body_framing::none ? state::complete : state::body;
        }

        if (state_ == state::body) {
            switch (framing_) {
                case body_framing::content_length: {
                    size_t take = std::min(content_length_ - received_, buffer_.size());
                    body_.append(buffer_, 0, take);
                    buffer_.erase(0, take);
                    received_ += take;
                    if (received_ == content_length_) state_ = state::complete;
                    break;
                }
                case body_framing::chunked: {
                    auto rc = chunks_.feed(buffer_, body_);
                    if (rc == parse_result::error) {
                        error_ = "Malformed chunked body";
                        state_ = state::error;
                        return rc;
                    }
                    if (rc == parse_result::complete) state_ = state::complete;
                    break;
                }
                case body_framing::until_close:
                    body_ += buffer_;
                    buffer_.clear();
                    break;
                case body_framing::none:
                    state_ = state::complete;
                    break;
            }
        }

        return state_ == state::complete ? parse_result::complete : parse_result::need_more;
    }

    /// Peer closed the connection
    parse_result finish() {
        if (state_ == state::body && framing_ == body_framing::until_close) {
            state_ = state::complete;
        }
        if (state_ == state::complete) {
            return parse_result::complete;
        }
        error_ = "Connection closed before response completed";
        state_ = state::error;
        return parse_result::error;
    }

    bool head_complete() const noexcept {
        return state_ == state::body || state_ == state::complete;
    }
    bool is_complete() const noexcept { return state_ == state::complete; }
    bool has_error() const noexcept { return state_ == state::error; }
    std::string_view error_message() const noexcept { return error_; }
    body_framing framing() const noexcept { return framing_; }

    const response& get() const noexcept { return response_; }

    /// Decoded body bytes received so far (drained)
    std::string take_body() { return std::exchange(body_, {}); }

    /// Whole response with the body moved in
    response take_response() {
        response_.set_body(take_body());
        return std::move(response_);
    }

    /// Bytes after a bodyless response (e.g. frames after 101)
    std::string take_remaining() { return std::exchange(buffer_, {}); }

private:
    enum class state { status_line, headers, body, complete, error };

    bool parse_status_line(std::string_view line) {
        if (!line.starts_with("HTTP/1.")) {
            error_ = "Invalid status line";
            state_ = state::error;
            return false;
        }
        auto space1 = line.find(' ');
        if (space1 == std::string_view::npos) {
            error_ = "Invalid status line";
            state_ = state::error;
            return false;
        }
        auto rest = line.substr(space1 + 1);
        uint16_t code = 0;
        auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), code);
        if (ec != std::errc{} || code < 100 || code > 999) {
            error_ = "Invalid status code";
            state_ = state::error;
            return false;
        }
        response_.set_status(code);
        auto space2 = rest.find(' ');
        if (space2 != std::string_view::npos) {
            response_.set_reason(rest.substr(space2 + 1));
        }
        return true;
    }

    void select_framing() {
        auto code = response_.status_code();
        const auto& hdrs = response_.get_headers();
        if (head_request_ || code == 204 || code == 304 || (code >= 100 && code < 200)) {
            framing_ = body_framing::none;
        } else if (hdrs.is_chunked()) {
            framing_ = body_framing::chunked;
        } else if (auto len = hdrs.content_length()) {
            content_length_ = *len;
            framing_ = *len == 0 ? body_framing::none : body_framing::content_length;
        } else {
            framing_ = body_framing::until_close;
        }
    }

    bool head_request_;
    state state_ = state::status_line;
    body_framing framing_ = body_framing::none;
    std::string buffer_;
    std::string body_;
    std::string error_;
    size_t content_length_ = 0;
    size_t received_ = 0;
    chunked_decoder chunks_;
    response response_;
};

} // namespace accord::http
