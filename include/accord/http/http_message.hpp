#pragma once

#include <accord/http/http_common.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace accord::http {

/// HTTP/1.1 request
class request {
public:
    request() = default;
    request(method m, std::string_view path) : method_(m), path_(path) {}

    method get_method() const noexcept { return method_; }
    void set_method(method m) noexcept { method_ = m; }

    /// Path without the query string
    std::string_view path() const noexcept { return path_; }
    void set_path(std::string_view p) { path_ = p; }

    /// Raw query string (without '?')
    std::string_view query() const noexcept { return query_; }
    void set_query(std::string_view q) { query_ = q; }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }
    std::string_view header(std::string_view name) const { return headers_.get(name); }
    void set_header(std::string_view name, std::string_view value) { headers_.set(name, value); }

    std::string_view body() const noexcept { return body_; }
    void set_body(std::string b) { body_ = std::move(b); }

    std::string_view content_type() const { return headers_.content_type(); }

    /// Path joined with the query string, as it appears on the request line
    std::string target() const {
        std::string t = path_.empty() ? "/" : path_;
        if (!query_.empty()) {
            t += '?';
            t += query_;
        }
        return t;
    }

    std::string serialize() const {
        std::string result;
        result.reserve(128 + body_.size());
        result += method_to_string(method_);
        result += ' ';
        result += target();
        result += " HTTP/1.1\r\n";
        result += headers_.serialize();
        if (!body_.empty() && !headers_.contains("Content-Length")) {
            result += "Content-Length: ";
            result += std::to_string(body_.size());
            result += "\r\n";
        }
        result += "\r\n";
        result += body_;
        return result;
    }

private:
    method method_ = method::GET;
    std::string path_ = "/";
    std::string query_;
    headers headers_;
    std::string body_;
};

/// HTTP/1.1 response
class response {
public:
    response() = default;
    explicit response(uint16_t status_code) : status_(status_code) {}
    response(uint16_t status_code, std::string body, std::string_view content_type = mime::text_plain)
        : status_(status_code), body_(std::move(body)) {
        headers_.set_content_type(content_type);
    }

    uint16_t status_code() const noexcept { return status_; }
    void set_status(uint16_t code) noexcept { status_ = code; }

    /// Reason phrase (explicit one wins over the table)
    std::string_view reason() const noexcept {
        return reason_.empty() ? status_reason(status_) : std::string_view(reason_);
    }
    void set_reason(std::string_view r) { reason_ = r; }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }
    std::string_view header(std::string_view name) const { return headers_.get(name); }
    void set_header(std::string_view name, std::string_view value) { headers_.set(name, value); }

    std::string_view body() const noexcept { return body_; }
    void set_body(std::string b) { body_ = std::move(b); }

    std::string_view content_type() const { return headers_.content_type(); }

    bool is_success() const noexcept { return status_ >= 200 && status_ < 300; }

    /// Status line and headers only; used for streamed bodies
    std::string serialize_head() const {
        std::string result;
        result.reserve(128);
        result += "HTTP/1.1 ";
        result += std::to_string(status_);
        result += ' ';
        result += reason();
        result += "\r\n";
        result += headers_.serialize();
        result += "\r\n";
        return result;
    }

    /// Full response with Content-Length (204 and 1xx carry no body)
    std::string serialize() const {
        bool bodyless = status_ == 204 || status_ == 304 || (status_ >= 100 && status_ < 200);
        response copy = *this;
        if (bodyless) {
            copy.headers_.remove("Content-Length");
            copy.body_.clear();
        } else {
            copy.headers_.set_content_length(body_.size());
        }
        return copy.serialize_head() + copy.body_;
    }

private:
    uint16_t status_ = 200;
    std::string reason_;
    headers headers_;
    std::string body_;
};

} // namespace accord::http
