#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <initializer_list>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace accord::http {

/// HTTP methods
enum class method {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE_,  // DELETE is a C++ keyword
    OPTIONS,
    PATCH
};

inline constexpr std::string_view method_to_string(method m) noexcept {
    switch (m) {
        case method::GET:      return "GET";
        case method::HEAD:     return "HEAD";
        case method::POST:     return "POST";
        case method::PUT:      return "PUT";
        case method::DELETE_:  return "DELETE";
        case method::OPTIONS:  return "OPTIONS";
        case method::PATCH:    return "PATCH";
    }
    return "UNKNOWN";
}

inline std::optional<method> string_to_method(std::string_view str) noexcept {
    if (str == "GET")     return method::GET;
    if (str == "HEAD")    return method::HEAD;
    if (str == "POST")    return method::POST;
    if (str == "PUT")     return method::PUT;
    if (str == "DELETE")  return method::DELETE_;
    if (str == "OPTIONS") return method::OPTIONS;
    if (str == "PATCH")   return method::PATCH;
    return std::nullopt;
}

/// Reason phrase for a numeric status code
inline constexpr std::string_view status_reason(uint16_t code) noexcept {
    switch (code) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 426: return "Upgrade Required";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default: break;
    }
    if (code >= 200 && code < 300) return "Success";
    if (code >= 400 && code < 500) return "Client Error";
    if (code >= 500) return "Server Error";
    return "Unknown";
}

inline std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// Case-insensitive substring test used for header tokens
inline bool contains_token(std::string_view haystack, std::string_view needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

struct case_insensitive_hash {
    size_t operator()(std::string_view s) const noexcept {
        size_t hash = 0;
        for (char c : s) {
            hash = hash * 31 + static_cast<size_t>(std::tolower(static_cast<unsigned char>(c)));
        }
        return hash;
    }
};

struct case_insensitive_equal {
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }
};

/// HTTP headers collection (case-insensitive keys)
class headers {
public:
    using map_type = std::unordered_map<std::string, std::string, case_insensitive_hash, case_insensitive_equal>;
    using const_iterator = map_type::const_iterator;

    headers() = default;
    headers(std::initializer_list<std::pair<const std::string, std::string>> init)
        : headers_(init) {}

    /// Set a header (overwrites existing)
    void set(std::string_view name, std::string_view value) {
        headers_[std::string(name)] = std::string(value);
    }

    /// Add a header (appends with comma if exists)
    void add(std::string_view name, std::string_view value) {
        auto it = headers_.find(std::string(name));
        if (it != headers_.end()) {
            it->second += ", ";
            it->second += value;
        } else {
            headers_.emplace(std::string(name), std::string(value));
        }
    }

    /// Header value, or empty if absent
    std::string_view get(std::string_view name) const {
        auto it = headers_.find(std::string(name));
        if (it != headers_.end()) {
            return it->second;
        }
        return {};
    }

    bool contains(std::string_view name) const {
        return headers_.find(std::string(name)) != headers_.end();
    }

    void remove(std::string_view name) {
        headers_.erase(std::string(name));
    }

    std::optional<size_t> content_length() const {
        auto val = get("Content-Length");
        if (val.empty()) return std::nullopt;
        size_t len = 0;
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), len);
        if (ec == std::errc{} && ptr == val.data() + val.size()) return len;
        return std::nullopt;
    }

    void set_content_length(size_t len) {
        set("Content-Length", std::to_string(len));
    }

    std::string_view content_type() const {
        return get("Content-Type");
    }

    void set_content_type(std::string_view type) {
        set("Content-Type", type);
    }

    bool is_chunked() const {
        return contains_token(get("Transfer-Encoding"), "chunked");
    }

    /// Merge @p other into this collection, overwriting duplicates
    void merge(const headers& other) {
        for (const auto& [name, value] : other) {
            set(name, value);
        }
    }

    size_t size() const noexcept { return headers_.size(); }
    bool empty() const noexcept { return headers_.empty(); }

    const_iterator begin() const { return headers_.begin(); }
    const_iterator end() const { return headers_.end(); }

    std::string serialize() const {
        std::string result;
        for (const auto& [name, value] : headers_) {
            result += name;
            result += ": ";
            result += value;
            result += "\r\n";
        }
        return result;
    }

private:
    map_type headers_;
};

/// URL components
struct url {
    std::string scheme;     ///< http, https, ws or wss
    std::string host;
    uint16_t port = 0;      ///< 0 = scheme default
    std::string path;       ///< path including leading /
    std::string query;      ///< query string (without ?)

    std::string path_with_query() const {
        std::string p = path.empty() ? "/" : path;
        if (query.empty()) return p;
        return p + "?" + query;
    }

    uint16_t effective_port() const {
        if (port != 0) return port;
        return (scheme == "https" || scheme == "wss") ? 443 : 80;
    }

    /// host[:port] as sent in the Host header
    std::string authority() const {
        if (port == 0) return host;
        return host + ":" + std::to_string(port);
    }

    std::string to_string() const {
        return scheme + "://" + authority() + path_with_query();
    }

    static std::optional<url> parse(std::string_view str) {
        url result;

        auto scheme_end = str.find("://");
        if (scheme_end == std::string_view::npos) {
            result.scheme = "http";
        } else {
            result.scheme = to_lower(str.substr(0, scheme_end));
            str = str.substr(scheme_end + 3);
        }

        if (auto frag = str.find('#'); frag != std::string_view::npos) {
            str = str.substr(0, frag);
        }

        if (auto q = str.find('?'); q != std::string_view::npos) {
            result.query = str.substr(q + 1);
            str = str.substr(0, q);
        }

        if (auto slash = str.find('/'); slash != std::string_view::npos) {
            result.path = str.substr(slash);
            str = str.substr(0, slash);
        } else {
            result.path = "/";
        }

        if (auto at = str.find('@'); at != std::string_view::npos) {
            str = str.substr(at + 1);
        }

        auto colon = str.rfind(':');
        if (colon != std::string_view::npos) {
            result.host = str.substr(0, colon);
            auto port_str = str.substr(colon + 1);
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
            if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) {
                return std::nullopt;
            }
            result.port = port;
        } else {
            result.host = str;
        }

        if (result.host.empty()) {
            return std::nullopt;
        }
        return result;
    }
};

/// Percent-encode a URI component (RFC 3986 unreserved set kept verbatim)
inline std::string url_encode(std::string_view str) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex[c >> 4];
            result += hex[c & 0x0F];
        }
    }
    return result;
}

/// Decode percent-escapes; '+' becomes a space only in form/query context
inline std::string url_decode(std::string_view str, bool plus_as_space = true) {
    auto hex_value = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_value(str[i + 1]);
            int lo = hex_value(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
            result += str[i];
        } else if (plus_as_space && str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }
    return result;
}

/// Decoded key/value pairs in wire order (repeated keys preserved)
using query_pairs = std::vector<std::pair<std::string, std::string>>;

/// Split an application/x-www-form-urlencoded string
inline query_pairs parse_query_string(std::string_view query) {
    query_pairs result;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = (amp == std::string_view::npos) ? query : query.substr(0, amp);

        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq != std::string_view::npos) {
                result.emplace_back(url_decode(pair.substr(0, eq)), url_decode(pair.substr(eq + 1)));
            } else {
                result.emplace_back(url_decode(pair), "");
            }
        }

        if (amp == std::string_view::npos) break;
        query = query.substr(amp + 1);
    }
    return result;
}

/// Join pairs back into a query string
inline std::string build_query_string(const query_pairs& pairs) {
    std::string out;
    for (const auto& [key, value] : pairs) {
        if (!out.empty()) out += '&';
        out += url_encode(key);
        out += '=';
        out += url_encode(value);
    }
    return out;
}

/// Common MIME types
namespace mime {
    inline constexpr std::string_view text_plain = "text/plain";
    inline constexpr std::string_view text_event_stream = "text/event-stream";
    inline constexpr std::string_view application_json = "application/json";
    inline constexpr std::string_view application_ndjson = "application/x-ndjson";
    inline constexpr std::string_view application_form_urlencoded = "application/x-www-form-urlencoded";
    inline constexpr std::string_view multipart_form_data = "multipart/form-data";
}

} // namespace accord::http
