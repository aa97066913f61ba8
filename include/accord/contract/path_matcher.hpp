#pragma once

/// @file path_matcher.hpp
/// @brief Compiled `:name` path patterns
///
/// A pattern such as `/users/:id/posts/:postId` is compiled once into an
/// anchored regular expression. Every named segment captures one run of
/// non-`/` characters; everything else must match literally.

#include <accord/http/http_common.hpp>

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace accord::contract {

/// Parameter name -> decoded segment value
using path_params = std::map<std::string, std::string>;

namespace detail {

inline bool is_name_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

inline void append_escaped(std::string& out, char c) {
    static constexpr std::string_view special = R"(\^$.|?*+()[]{}-)";
    if (special.find(c) != std::string_view::npos) {
        out += '\\';
    }
    out += c;
}

/// Walk @p pattern, calling on_literal(char) and on_param(name) in order
template<typename Literal, typename Param>
void scan_pattern(std::string_view pattern, Literal&& on_literal, Param&& on_param) {
    size_t i = 0;
    while (i < pattern.size()) {
        if (pattern[i] == ':' && i + 1 < pattern.size() && is_name_char(pattern[i + 1])) {
            size_t end = i + 1;
            while (end < pattern.size() && pattern[end] != '/') {
                ++end;
            }
            on_param(pattern.substr(i + 1, end - i - 1));
            i = end;
        } else {
            on_literal(pattern[i]);
            ++i;
        }
    }
}

} // namespace detail

class path_matcher {
public:
    explicit path_matcher(std::string pattern) : pattern_(std::move(pattern)) {
        std::string expr = "^";
        detail::scan_pattern(pattern_,
            [&](char c) { detail::append_escaped(expr, c); },
            [&](std::string_view name) {
                names_.emplace_back(name);
                expr += "([^/]+)";
            });
        expr += "$";
        regex_ = std::regex(expr, std::regex::ECMAScript | std::regex::optimize);
    }

    const std::string& pattern() const noexcept { return pattern_; }
    const std::vector<std::string>& param_names() const noexcept { return names_; }

    /// Extract parameters from a concrete path, or nullopt on mismatch
    std::optional<path_params> match(std::string_view path) const {
        std::match_results<std::string_view::const_iterator> m;
        if (!std::regex_match(path.begin(), path.end(), m, regex_)) {
            return std::nullopt;
        }
        path_params params;
        for (size_t i = 0; i < names_.size(); ++i) {
            params[names_[i]] = http::url_decode(m[i + 1].str(), false);
        }
        return params;
    }

private:
    std::string pattern_;
    std::vector<std::string> names_;
    std::regex regex_;
};

/// Substitute parameters into @p pattern; missing names are left as `:name`
inline std::string interpolate(std::string_view pattern, const path_params& params) {
    std::string out;
    out.reserve(pattern.size() + 16);
    detail::scan_pattern(pattern,
        [&](char c) { out += c; },
        [&](std::string_view name) {
            auto it = params.find(std::string(name));
            if (it == params.end()) {
                out += ':';
                out += name;
            } else {
                out += http::url_encode(it->second);
            }
        });
    return out;
}

/// `:name` -> `{name}` for interface descriptions
inline std::string to_interface_path(std::string_view pattern) {
    std::string out;
    out.reserve(pattern.size() + 8);
    detail::scan_pattern(pattern,
        [&](char c) { out += c; },
        [&](std::string_view name) {
            out += '{';
            out += name;
            out += '}';
        });
    return out;
}

/// Join a base URL and a path, then append an encoded query string
inline std::string build_url(std::string_view base, std::string_view path, std::string_view query = {}) {
    std::string out(base);
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    if (!path.empty() && path.front() != '/') {
        out += '/';
    }
    out += path;
    if (!query.empty()) {
        out += '?';
        out += query;
    }
    return out;
}

} // namespace accord::contract
