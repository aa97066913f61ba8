#include <catch2/catch.hpp>
#include <accord/http/websocket_frame.hpp>
#include <accord/http/websocket_handshake.hpp>

#include <array>
#include <cstring>
#include <string>

using namespace accord::http;
using namespace accord::http::websocket;

// ============================================================================
// Frames
// ============================================================================

TEST_CASE("WebSocket opcode helpers", "[websocket][frame]") {
    REQUIRE_FALSE(is_control_frame(opcode::text));
    REQUIRE(is_control_frame(opcode::close));
    REQUIRE(is_control_frame(opcode::pong));

    REQUIRE(is_valid_opcode(0x0));
    REQUIRE(is_valid_opcode(0x2));
    REQUIRE_FALSE(is_valid_opcode(0x3));
    REQUIRE(is_valid_opcode(0xA));
    REQUIRE_FALSE(is_valid_opcode(0xB));
}

TEST_CASE("WebSocket frame encoding", "[websocket][frame]") {
    SECTION("short unmasked text frame") {
        auto frame = encode_text_frame("Hello", false);

        REQUIRE(frame.size() == 7);
        REQUIRE((frame[0] & 0x0F) == 0x01);
        REQUIRE((frame[0] & 0x80) != 0);
        REQUIRE((frame[1] & 0x80) == 0);
        REQUIRE((frame[1] & 0x7F) == 5);
        REQUIRE(frame.substr(2) == "Hello");
    }

    SECTION("masked frame carries a key and a scrambled payload") {
        auto frame = encode_text_frame("Hi", true);

        REQUIRE(frame.size() == 8);
        REQUIRE((frame[1] & 0x80) != 0);

        std::array<uint8_t, 4> key{};
        std::memcpy(key.data(), frame.data() + 2, 4);
        std::string payload = frame.substr(6);
        apply_mask(payload.data(), payload.size(), key);
        REQUIRE(payload == "Hi");
    }

    SECTION("16-bit extended length") {
        std::string text(300, 'a');
        auto frame = encode_text_frame(text, false);

        REQUIRE((frame[1] & 0x7F) == 126);
        REQUIRE(frame.size() == 4 + 300);
    }

    SECTION("64-bit extended length") {
        std::string text(70000, 'b');
        auto frame = encode_text_frame(text, false);

        REQUIRE((frame[1] & 0x7F) == 127);
        REQUIRE(frame.size() == 10 + 70000);
    }
}

TEST_CASE("WebSocket close payload", "[websocket][frame]") {
    auto frame = encode_close_frame(close_code::going_away, "bye");
    REQUIRE((frame[0] & 0x0F) == 0x08);

    auto [code, reason] = parse_close_payload(frame.substr(2));
    REQUIRE(code == close_code::going_away);
    REQUIRE(reason == "bye");

    auto [none, empty] = parse_close_payload("");
    REQUIRE(none == close_code::no_status);
    REQUIRE(empty.empty());

    // Reason is truncated to fit a control frame
    auto longest = encode_close_frame(close_code::normal, std::string(200, 'r'));
    REQUIRE((longest[1] & 0x7F) == 125);
}

TEST_CASE("frame_parser yields messages in arrival order", "[websocket][parser]") {
    frame_parser parser;

    std::string wire = encode_text_frame("one") + encode_ping_frame("p") + encode_text_frame("two");
    REQUIRE(parser.feed(wire));

    auto first = parser.next();
    REQUIRE(first.has_value());
    REQUIRE(first->op == opcode::text);
    REQUIRE(first->payload == "one");

    auto ping = parser.next();
    REQUIRE(ping->op == opcode::ping);
    REQUIRE(ping->payload == "p");

    REQUIRE(parser.next()->payload == "two");
    REQUIRE_FALSE(parser.next().has_value());
}

TEST_CASE("frame_parser handles partial input", "[websocket][parser]") {
    frame_parser parser(true);

    auto wire = encode_text_frame("{\"type\":\"ping\"}", true);
    for (char c : wire) {
        REQUIRE(parser.feed(std::string_view(&c, 1)));
    }
    auto ev = parser.next();
    REQUIRE(ev.has_value());
    REQUIRE(ev->payload == "{\"type\":\"ping\"}");
}

TEST_CASE("frame_parser reassembles fragments", "[websocket][parser]") {
    frame_parser parser;

    // "Hel" (text, FIN=0) + "lo" (continuation, FIN=1)
    std::string wire;
    wire += static_cast<char>(0x01);
    wire += static_cast<char>(3);
    wire += "Hel";
    wire += static_cast<char>(0x80);
    wire += static_cast<char>(2);
    wire += "lo";

    REQUIRE(parser.feed(wire));
    auto ev = parser.next();
    REQUIRE(ev.has_value());
    REQUIRE(ev->op == opcode::text);
    REQUIRE(ev->payload == "Hello");
}

TEST_CASE("frame_parser rejects protocol violations", "[websocket][parser]") {
    SECTION("unmasked frame on the server side") {
        frame_parser parser(true);
        REQUIRE_FALSE(parser.feed(encode_text_frame("x", false)));
        REQUIRE(parser.has_error());
        REQUIRE(parser.error_code() == close_code::protocol_error);
    }

    SECTION("reserved opcode") {
        frame_parser parser;
        std::string wire{static_cast<char>(0x83), static_cast<char>(0)};
        REQUIRE_FALSE(parser.feed(wire));
    }

    SECTION("continuation without a message") {
        frame_parser parser;
        std::string wire{static_cast<char>(0x80), static_cast<char>(0)};
        REQUIRE_FALSE(parser.feed(wire));
    }

    SECTION("oversized message") {
        frame_parser parser(false, 16);
        REQUIRE_FALSE(parser.feed(encode_text_frame(std::string(32, 'z'))));
        REQUIRE(parser.error_code() == close_code::too_large);
    }

    SECTION("errors are sticky") {
        frame_parser parser(true);
        REQUIRE_FALSE(parser.feed(encode_text_frame("x", false)));
        REQUIRE_FALSE(parser.feed(encode_text_frame("y", true)));
        REQUIRE_FALSE(parser.next().has_value());
    }
}

// ============================================================================
// Handshake
// ============================================================================

TEST_CASE("Sec-WebSocket-Accept follows RFC 6455", "[websocket][handshake]") {
    REQUIRE(compute_websocket_accept("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRrGXwT0=");
}

TEST_CASE("generated keys are 16 random bytes in base64", "[websocket][handshake]") {
    auto a = generate_websocket_key();
    auto b = generate_websocket_key();
    REQUIRE(a.size() == 24);
    REQUIRE(a != b);
}

TEST_CASE("upgrade request checks", "[websocket][handshake]") {
    auto target = url::parse("ws://localhost:9000/chat?room=1");
    REQUIRE(target.has_value());

    auto req = build_client_handshake(*target, generate_websocket_key());
    REQUIRE(req.path() == "/chat");
    REQUIRE(req.query() == "room=1");
    REQUIRE(req.header("Host") == "localhost:9000");
    REQUIRE(is_upgrade_request(req));
    REQUIRE(check_upgrade_request(req).has_value());

    SECTION("wrong version") {
        req.set_header("Sec-WebSocket-Version", "8");
        REQUIRE_FALSE(check_upgrade_request(req).has_value());
    }

    SECTION("missing Connection: upgrade") {
        req.set_header("Connection", "keep-alive");
        REQUIRE_FALSE(check_upgrade_request(req).has_value());
    }

    SECTION("plain request") {
        request plain(method::GET, "/chat");
        REQUIRE_FALSE(is_upgrade_request(plain));
    }
}

TEST_CASE("upgrade response carries the accept key", "[websocket][handshake]") {
    auto resp = build_upgrade_response("dGhlIHNhbXBsZSBub25jZQ==");
    REQUIRE(resp.status_code() == 101);
    REQUIRE(resp.header("Sec-WebSocket-Accept") == "s3pPLMBiTxaQ9kYGzzhZRrGXwT0=");

    auto raw = resp.serialize();
    REQUIRE(raw.starts_with("HTTP/1.1 101 Switching Protocols\r\n"));
}
