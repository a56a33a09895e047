#include <catch2/catch_test_macros.hpp>
#include "server/http_server.hpp"
#include <stdexcept>

using namespace chatmem;

// ── parse_listen_addr ────────────────────────────────────────────

TEST_CASE("parse_listen_addr: valid host:port", "[http_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_listen_addr("127.0.0.1:8000", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 8000);
}

TEST_CASE("parse_listen_addr: missing colon returns false", "[http_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1", host, port));
    REQUIRE_FALSE(parse_listen_addr(":8000", host, port));
}

TEST_CASE("parse_listen_addr: non-numeric port returns false", "[http_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("localhost:http", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost:80a", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost:", host, port));
}

TEST_CASE("parse_listen_addr: out of range ports rejected", "[http_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("localhost:0", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost:65536", host, port));
    REQUIRE(parse_listen_addr("localhost:65535", host, port));
    REQUIRE(port == 65535);
}

TEST_CASE("parse_listen_addr: empty string returns false", "[http_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("", host, port));
}

// ── URL decoding ─────────────────────────────────────────────────

TEST_CASE("url_decode: percent escapes and plus", "[http_server]") {
    REQUIRE(url_decode("a%20b") == "a b");
    REQUIRE(url_decode("a+b") == "a b");
    REQUIRE(url_decode("%E2%82%AC") == "\xE2\x82\xAC");
}

TEST_CASE("url_decode: malformed escapes pass through", "[http_server]") {
    REQUIRE(url_decode("100%") == "100%");
    REQUIRE(url_decode("%zz") == "%zz");
}

TEST_CASE("parse_query_string: pairs and bare keys", "[http_server]") {
    auto q = parse_query_string("session=alice%20b&flag&x=1");
    REQUIRE(q.size() == 3);
    REQUIRE(q["session"] == "alice b");
    REQUIRE(q["flag"].empty());
    REQUIRE(q["x"] == "1");
}

TEST_CASE("parse_query_string: empty input", "[http_server]") {
    REQUIRE(parse_query_string("").empty());
}

// ── ServerRequest ────────────────────────────────────────────────

TEST_CASE("ServerRequest::query_param: lookup and missing key", "[http_server]") {
    ServerRequest req;
    req.query_params["session"] = "s1";
    REQUIRE(req.query_param("session") == "s1");
    REQUIRE(req.query_param("other").empty());
}

// ── parse_request_head ───────────────────────────────────────────

TEST_CASE("parse_request_head: request line, query and headers", "[http_server]") {
    ServerRequest req;
    REQUIRE(parse_request_head(
        "POST /chat?session=s%201 HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Length:  12 \r\n"
        "Content-Type: application/json", req));

    REQUIRE(req.method == "POST");
    REQUIRE(req.path == "/chat");
    REQUIRE(req.query_param("session") == "s 1");
    REQUIRE(req.headers["host"] == "localhost");
    REQUIRE(req.headers["content-length"] == "12");
    REQUIRE(req.headers["content-type"] == "application/json");
}

TEST_CASE("parse_request_head: request line only", "[http_server]") {
    ServerRequest req;
    REQUIRE(parse_request_head("GET /memory/stats HTTP/1.0", req));
    REQUIRE(req.method == "GET");
    REQUIRE(req.path == "/memory/stats");
    REQUIRE(req.headers.empty());
}

TEST_CASE("parse_request_head: malformed heads rejected", "[http_server]") {
    ServerRequest req;
    REQUIRE_FALSE(parse_request_head("", req));
    REQUIRE_FALSE(parse_request_head("GET /chat", req));
    REQUIRE_FALSE(parse_request_head("GET  HTTP/1.1", req));
    REQUIRE_FALSE(parse_request_head("GET /chat FTP/1.0", req));
    REQUIRE_FALSE(parse_request_head("GET /chat HTTP/1.1\r\nno colon here", req));
}

// ── Dispatch ─────────────────────────────────────────────────────

static ServerRequest make_request(const std::string& method, const std::string& path) {
    ServerRequest req;
    req.method = method;
    req.path = path;
    return req;
}

TEST_CASE("json_error: detail body", "[http_server]") {
    auto resp = json_error(413, "too big");
    REQUIRE(resp.status == 413);
    REQUIRE(resp.content_type == "application/json");
    REQUIRE(resp.body == R"({"detail":"too big"})");
}

TEST_CASE("HttpServer::dispatch: routes by path and method", "[http_server]") {
    HttpServer server("127.0.0.1:8123", 1024);
    server.route("GET", "/a", [](const ServerRequest&) { return json_response(200, {{"r", "get"}}); });
    server.route("POST", "/a", [](const ServerRequest&) { return json_response(201, {{"r", "post"}}); });

    REQUIRE(server.dispatch(make_request("GET", "/a")).body == R"({"r":"get"})");
    REQUIRE(server.dispatch(make_request("POST", "/a")).status == 201);
}

TEST_CASE("HttpServer::dispatch: unknown path and wrong method", "[http_server]") {
    HttpServer server("127.0.0.1:8123", 1024);
    server.route("GET", "/a", [](const ServerRequest&) { return ServerResponse{}; });

    auto missing = server.dispatch(make_request("GET", "/a/b"));
    REQUIRE(missing.status == 404);
    REQUIRE(missing.body == R"({"detail":"Not Found"})");

    auto wrong = server.dispatch(make_request("DELETE", "/a"));
    REQUIRE(wrong.status == 405);
    REQUIRE(wrong.body == R"({"detail":"Method Not Allowed"})");
}

TEST_CASE("HttpServer::dispatch: handler exception becomes 500", "[http_server]") {
    HttpServer server("127.0.0.1:8123", 1024);
    server.route("GET", "/boom", [](const ServerRequest&) -> ServerResponse {
        throw std::runtime_error("kaboom");
    });

    auto resp = server.dispatch(make_request("GET", "/boom"));
    REQUIRE(resp.status == 500);
    REQUIRE(resp.content_type == "application/json");
    REQUIRE(resp.body == R"({"detail":"Internal Server Error"})");
}

// ── HttpServer lifecycle ─────────────────────────────────────────

TEST_CASE("HttpServer: start fails on invalid listen address", "[http_server]") {
    HttpServer server("no-port", 1024);
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(error.find("Invalid listen address") != std::string::npos);
    REQUIRE_FALSE(server.running());
}

TEST_CASE("HttpServer: start fails on unparseable bind host", "[http_server]") {
    HttpServer server("not.an.ip:8123", 1024);
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(error.find("Invalid bind address") != std::string::npos);
    REQUIRE_FALSE(server.running());
}

TEST_CASE("HttpServer: stop without start is a no-op", "[http_server]") {
    HttpServer server("127.0.0.1:8123", 1024);
    server.stop();
    REQUIRE_FALSE(server.running());
}
