#pragma once

/// @file websocket_handshake.hpp
/// @brief Opening handshake for the message transport (RFC 6455 Section 4)

#include <accord/http/http_common.hpp>
#include <accord/http/http_message.hpp>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cstdint>
#include <expected>
#include <random>
#include <string>
#include <string_view>

namespace accord::http::websocket {

/// GUID appended to the key before hashing (RFC 6455 Section 1.3)
inline constexpr std::string_view WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

inline std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

/// Random 16-byte Sec-WebSocket-Key, base64 encoded
inline std::string generate_websocket_key() {
    static thread_local std::mt19937 rng(std::random_device{}());
    std::array<uint8_t, 16> key;
    for (auto& byte : key) {
        byte = static_cast<uint8_t>(rng());
    }
    return base64_encode(key.data(), key.size());
}

/// Sec-WebSocket-Accept for a client key
inline std::string compute_websocket_accept(std::string_view key) {
    std::string concat;
    concat.reserve(key.size() + WS_GUID.size());
    concat.append(key);
    concat.append(WS_GUID);

    std::array<uint8_t, SHA_DIGEST_LENGTH> hash;
    SHA1(reinterpret_cast<const uint8_t*>(concat.data()), concat.size(), hash.data());
    return base64_encode(hash.data(), hash.size());
}

/// Whether the request asks to switch to the message transport at all
inline bool is_upgrade_request(const request& req) {
    return contains_token(req.header("Upgrade"), "websocket");
}

/// Check the mandatory handshake headers; returns the failure reason
inline std::expected<void, std::string> check_upgrade_request(const request& req) {
    if (req.get_method() != method::GET) {
        return std::unexpected("WebSocket upgrade requires GET");
    }
    if (!is_upgrade_request(req)) {
        return std::unexpected("Missing Upgrade: websocket header");
    }
    if (!contains_token(req.header("Connection"), "upgrade")) {
        return std::unexpected("Missing Connection: Upgrade header");
    }
    if (req.header("Sec-WebSocket-Version") != "13") {
        return std::unexpected("Unsupported Sec-WebSocket-Version");
    }
    // 16 random bytes encode to 24 base64 characters
    if (req.header("Sec-WebSocket-Key").size() != 24) {
        return std::unexpected("Invalid Sec-WebSocket-Key");
    }
    return {};
}

/// 101 response completing the server side of the handshake
inline response build_upgrade_response(std::string_view key) {
    response resp(101);
    resp.set_header("Upgrade", "websocket");
    resp.set_header("Connection", "Upgrade");
    resp.set_header("Sec-WebSocket-Accept", compute_websocket_accept(key));
    return resp;
}

/// Client handshake request for @p target; @p key is sent as Sec-WebSocket-Key
inline request build_client_handshake(const url& target, std::string_view key) {
    request req(method::GET, target.path.empty() ? "/" : target.path);
    req.set_query(target.query);
    req.set_header("Host", target.authority());
    req.set_header("Upgrade", "websocket");
    req.set_header("Connection", "Upgrade");
    req.set_header("Sec-WebSocket-Key", key);
    req.set_header("Sec-WebSocket-Version", "13");
    return req;
}

} // namespace accord::http::websocket
