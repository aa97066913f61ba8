#include <catch2/catch.hpp>
#include <accord/http/content.hpp>
#include <accord/http/http_common.hpp>
#include <accord/http/http_message.hpp>
#include <accord/http/http_parser.hpp>

#include <string>

using namespace accord::http;

// ============================================================================
// Request parser
// ============================================================================

TEST_CASE("HTTP request parser - basic GET request", "[http][parser]") {
    request_parser parser;

    std::string raw =
        "GET /path/to/resource?q=hello&page=1 HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "User-Agent: test/1.0\r\n"
        "\r\n";

    REQUIRE(parser.parse(raw) == parse_result::complete);
    REQUIRE(parser.is_complete());

    auto req = parser.take_request();
    REQUIRE(req.get_method() == method::GET);
    REQUIRE(req.path() == "/path/to/resource");
    REQUIRE(req.query() == "q=hello&page=1");
    REQUIRE(req.header("host") == "example.com");
    REQUIRE(req.body().empty());
}

TEST_CASE("HTTP request parser - POST with body", "[http][parser]") {
    request_parser parser;

    std::string raw =
        "POST /api/data HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 13\r\n"
        "\r\n"
        "{\"key\":\"val\"}";

    REQUIRE(parser.parse(raw) == parse_result::complete);
    auto req = parser.take_request();
    REQUIRE(req.get_method() == method::POST);
    REQUIRE(req.body() == "{\"key\":\"val\"}");
    REQUIRE(req.content_type() == "application/json");
}

TEST_CASE("HTTP request parser - chunked encoding", "[http][parser]") {
    request_parser parser;

    std::string raw =
        "POST /upload HTTP/1.1\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nHello\r\n"
        "7\r\n, World\r\n"
        "0\r\n\r\n";

    REQUIRE(parser.parse(raw) == parse_result::complete);
    REQUIRE(parser.take_request().body() == "Hello, World");
}

TEST_CASE("HTTP request parser - incremental parsing", "[http][parser]") {
    request_parser parser;

    REQUIRE(parser.parse("GET /inc") == parse_result::need_more);
    REQUIRE(parser.parse("remental HTTP/1.1\r\nHost: a\r\n") == parse_result::need_more);
    REQUIRE_FALSE(parser.is_complete());
    REQUIRE(parser.parse("\r\n") == parse_result::complete);
    REQUIRE(parser.take_request().path() == "/incremental");
}

TEST_CASE("HTTP request parser - pipelined bytes are kept", "[http][parser]") {
    request_parser parser;

    std::string raw =
        "GET /first HTTP/1.1\r\n\r\n"
        "GET /second HTTP/1.1\r\n\r\n";

    REQUIRE(parser.parse(raw) == parse_result::complete);
    auto rest = parser.take_remaining();
    REQUIRE(parser.take_request().path() == "/first");

    request_parser next;
    REQUIRE(next.parse(rest) == parse_result::complete);
    REQUIRE(next.take_request().path() == "/second");
}

TEST_CASE("HTTP request parser - invalid requests", "[http][parser]") {
    SECTION("unknown method") {
        request_parser parser;
        REQUIRE(parser.parse("BREW /pot HTTP/1.1\r\n\r\n") == parse_result::error);
        REQUIRE(parser.has_error());
    }

    SECTION("not HTTP/1.x") {
        request_parser parser;
        REQUIRE(parser.parse("GET / SPDY/3\r\n\r\n") == parse_result::error);
    }

    SECTION("size limit") {
        request_parser parser(64);
        std::string raw = "POST / HTTP/1.1\r\nContent-Length: 100\r\n\r\n" + std::string(100, 'x');
        REQUIRE(parser.parse(raw) == parse_result::error);
        REQUIRE(parser.error_message() == "Request exceeds maximum size");
    }

    SECTION("declared length over the limit") {
        request_parser parser(1024);
        REQUIRE(parser.parse("POST / HTTP/1.1\r\nContent-Length: 99999999\r\n\r\n") == parse_result::error);
        REQUIRE(parser.error_message() == "Request exceeds maximum size");
    }

    SECTION("chunk size near SIZE_MAX") {
        request_parser parser;
        REQUIRE(parser.parse("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
                             "FFFFFFFFFFFFFFFF\r\nabc") == parse_result::error);
        REQUIRE(parser.error_message() == "Request exceeds maximum size");
    }

    SECTION("chunk larger than the request limit") {
        request_parser parser(1024);
        REQUIRE(parser.parse("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
                             "100000\r\nabc") == parse_result::error);
        REQUIRE(parser.error_message() == "Request exceeds maximum size");
    }

    SECTION("garbage after the chunk size") {
        request_parser parser;
        REQUIRE(parser.parse("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
                             "5zz\r\nHello\r\n0\r\n\r\n") == parse_result::error);
        REQUIRE(parser.error_message() == "Malformed chunked body");
    }
}

// ============================================================================
// Response parser
// ============================================================================

TEST_CASE("HTTP response parser - content length", "[http][parser]") {
    response_parser parser;

    REQUIRE(parser.parse("HTTP/1.1 201 Created\r\nContent-Length: 2\r\nContent-Type: application/json\r\n\r\n{}")
            == parse_result::complete);
    REQUIRE(parser.framing() == body_framing::content_length);

    auto resp = parser.take_response();
    REQUIRE(resp.status_code() == 201);
    REQUIRE(resp.reason() == "Created");
    REQUIRE(resp.body() == "{}");
}

TEST_CASE("HTTP response parser - body until close", "[http][parser]") {
    response_parser parser;

    REQUIRE(parser.parse("HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\n\r\nevent: a\n")
            == parse_result::need_more);
    REQUIRE(parser.head_complete());
    REQUIRE(parser.framing() == body_framing::until_close);
    REQUIRE(parser.take_body() == "event: a\n");

    parser.parse("data: 1\n\n");
    REQUIRE(parser.take_body() == "data: 1\n\n");
    REQUIRE(parser.finish() == parse_result::complete);
}

TEST_CASE("HTTP response parser - chunked response", "[http][parser]") {
    response_parser parser;

    REQUIRE(parser.parse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n0\r\n\r\n")
            == parse_result::complete);
    REQUIRE(parser.take_response().body() == "abc");
}

TEST_CASE("HTTP response parser - 101 keeps trailing frames", "[http][parser]") {
    response_parser parser;

    std::string raw = "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n\r\n\x81\x02hi";
    REQUIRE(parser.parse(raw) == parse_result::complete);
    REQUIRE(parser.get().status_code() == 101);
    REQUIRE(parser.take_remaining() == "\x81\x02hi");
}

TEST_CASE("HTTP response parser - truncated body is an error", "[http][parser]") {
    response_parser parser;

    parser.parse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc");
    REQUIRE(parser.finish() == parse_result::error);
    REQUIRE(parser.has_error());
}

// ============================================================================
// Messages
// ============================================================================

TEST_CASE("HTTP request serialization", "[http][message]") {
    request req(method::POST, "/users");
    req.set_query("notify=true");
    req.set_header("Host", "localhost");
    req.set_body("{\"name\":\"a\"}");

    auto raw = req.serialize();
    REQUIRE(raw.starts_with("POST /users?notify=true HTTP/1.1\r\n"));
    REQUIRE(raw.find("Content-Length: 12\r\n") != std::string::npos);
    REQUIRE(raw.ends_with("\r\n\r\n{\"name\":\"a\"}"));
}

TEST_CASE("HTTP response serialization drops bodies of 204", "[http][message]") {
    response ok(200, "hello", mime::text_plain);
    auto raw = ok.serialize();
    REQUIRE(raw.starts_with("HTTP/1.1 200 OK\r\n"));
    REQUIRE(raw.find("Content-Length: 5\r\n") != std::string::npos);
    REQUIRE(raw.ends_with("hello"));

    response empty(204, "ignored", mime::application_json);
    auto bodyless = empty.serialize();
    REQUIRE(bodyless.ends_with("\r\n\r\n"));
    REQUIRE(bodyless.find("ignored") == std::string::npos);
    REQUIRE(bodyless.find("Content-Length") == std::string::npos);
}

// ============================================================================
// Common helpers
// ============================================================================

TEST_CASE("Headers collection is case insensitive", "[http][headers]") {
    headers h;
    h.set("Content-Type", "text/html");
    h.add("Accept", "a");
    h.add("accept", "b");

    REQUIRE(h.get("content-type") == "text/html");
    REQUIRE(h.get("ACCEPT") == "a, b");
    REQUIRE(h.contains("Content-type"));

    h.remove("CONTENT-TYPE");
    REQUIRE_FALSE(h.contains("Content-Type"));
}

TEST_CASE("URL parsing", "[http][url]") {
    auto u = url::parse("http://example.com:8080/api/users?page=2#top");
    REQUIRE(u.has_value());
    REQUIRE(u->scheme == "http");
    REQUIRE(u->host == "example.com");
    REQUIRE(u->port == 8080);
    REQUIRE(u->path == "/api/users");
    REQUIRE(u->query == "page=2");
    REQUIRE(u->authority() == "example.com:8080");
    REQUIRE(u->path_with_query() == "/api/users?page=2");

    auto bare = url::parse("ws://chat.local");
    REQUIRE(bare.has_value());
    REQUIRE(bare->path == "/");
    REQUIRE(bare->effective_port() == 80);

    REQUIRE_FALSE(url::parse("http://:80/").has_value());
}

TEST_CASE("URL encoding/decoding", "[http][url]") {
    REQUIRE(url_encode("a b&c") == "a%20b%26c");
    REQUIRE(url_encode("safe-_.~") == "safe-_.~");
    REQUIRE(url_decode("a%20b%26c") == "a b&c");
    REQUIRE(url_decode("a+b") == "a b");
    REQUIRE(url_decode("a+b", false) == "a+b");
}

TEST_CASE("parse_query turns repeated keys into arrays", "[http][query]") {
    auto q = parse_query("tag=a&tag=b&tag=c&page=2&empty=");

    REQUIRE(q["page"].asString() == "2");
    REQUIRE(q["empty"].asString().empty());
    REQUIRE(q["tag"].isArray());
    REQUIRE(q["tag"].size() == 3);
    REQUIRE(q["tag"][2].asString() == "c");
}

TEST_CASE("build_query expands arrays and skips nulls", "[http][query]") {
    Json::Value q(Json::objectValue);
    q["tag"].append("x y");
    q["tag"].append("z");
    q["limit"] = 10;
    q["flag"] = true;
    q["skip"] = Json::Value();

    auto text = build_query(q);
    REQUIRE(text.find("tag=x%20y") != std::string::npos);
    REQUIRE(text.find("tag=z") != std::string::npos);
    REQUIRE(text.find("limit=10") != std::string::npos);
    REQUIRE(text.find("flag=true") != std::string::npos);
    REQUIRE(text.find("skip") == std::string::npos);

    auto back = parse_query(text);
    REQUIRE(back["tag"].size() == 2);
    REQUIRE(back["tag"][0].asString() == "x y");
}

TEST_CASE("form bodies decode like query strings", "[http][content]") {
    auto form = decode_form("name=Ada+Lovelace&lang=en&lang=fr");
    REQUIRE(form["name"].asString() == "Ada Lovelace");
    REQUIRE(form["lang"].size() == 2);
}

TEST_CASE("multipart bodies decode to fields", "[http][content]") {
    std::string body =
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"title\"\r\n"
        "\r\n"
        "Hello\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"a.txt\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "line one\r\nline two\r\n"
        "--XyZ--\r\n";

    auto fields = decode_multipart(body, "multipart/form-data; boundary=XyZ");
    REQUIRE(fields.has_value());
    REQUIRE((*fields)["title"].asString() == "Hello");
    REQUIRE((*fields)["file"].asString() == "line one\r\nline two");

    REQUIRE_FALSE(decode_multipart(body, "multipart/form-data").has_value());
    REQUIRE_FALSE(decode_multipart("garbage", "multipart/form-data; boundary=XyZ").has_value());
}

TEST_CASE("header_parameter reads quoted and bare values", "[http][content]") {
    REQUIRE(header_parameter("form-data; name=\"a\"; filename=\"b.txt\"", "filename") == "b.txt");
    REQUIRE(header_parameter("multipart/form-data; boundary=abc", "boundary") == "abc");
    REQUIRE_FALSE(header_parameter("text/plain", "charset").has_value());
}
