/**
 * Unit tests for HttpServer
 *
 * Request parsing, response framing and route dispatch. No sockets are
 * opened here; the accept loop is covered by the integration suite.
 */

#include <gtest/gtest.h>
#include "http_server.h"
#include <stdexcept>

using namespace pyexec;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpServerTest : public ::testing::Test {
protected:
    HttpRequest create_request(const std::string& method, const std::string& path) {
        HttpRequest req;
        req.method = method;
        req.path = path;
        req.client_ip = "127.0.0.1";
        return req;
    }

    HttpResponse text(const std::string& body) {
        return HttpResponse::json(200, body);
    }
};

// ============================================================================
// Test Contract: Request Parsing
// ============================================================================

TEST_F(HttpServerTest, ParsesValidGetRequest) {
    // Given: A valid HTTP GET request
    std::string raw_request =
        "GET /health HTTP/1.1\r\n"
        "Host: localhost:8000\r\n"
        "User-Agent: curl/7.68.0\r\n"
        "\r\n";

    // When: Request is parsed
    HttpRequest req = HttpServer::parse_request(raw_request);

    // Then: Method, path and headers are extracted, header names lowercased
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, "/health");
    EXPECT_EQ(req.headers["host"], "localhost:8000");
    EXPECT_EQ(req.header("User-Agent"), "curl/7.68.0");
    EXPECT_EQ(req.header("X-Missing"), "");
    EXPECT_TRUE(req.body.empty());
}

TEST_F(HttpServerTest, ParsesPostRequestWithBody) {
    std::string raw_request =
        "POST /execute HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "X-API-Key: secret\r\n"
        "Content-Length: 37\r\n"
        "\r\n"
        "{\"session_id\":\"s1\",\"code\":\"print(1)\"}";

    HttpRequest req = HttpServer::parse_request(raw_request);

    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/execute");
    EXPECT_EQ(req.header("x-api-key"), "secret");
    EXPECT_EQ(req.body, "{\"session_id\":\"s1\",\"code\":\"print(1)\"}");
}

TEST_F(HttpServerTest, BodyKeepsBinaryAndBlankLines) {
    std::string body("line1\r\n\r\nline2\0end", 18);
    HttpRequest req = HttpServer::parse_request("POST /upload HTTP/1.1\r\n\r\n" + body);
    EXPECT_EQ(req.body, body);
}

TEST_F(HttpServerTest, SplitsAndDecodesQueryString) {
    HttpRequest req = HttpServer::parse_request(
        "GET /download?session_id=s1&filename=my%20data%2Fa.csv&flag HTTP/1.1\r\n\r\n");

    EXPECT_EQ(req.path, "/download");
    EXPECT_EQ(req.query["session_id"], "s1");
    EXPECT_EQ(req.query["filename"], "my data/a.csv");
    ASSERT_EQ(req.query.count("flag"), 1u);
    EXPECT_EQ(req.query["flag"], "");
}

TEST_F(HttpServerTest, MalformedRequestLineLeavesMethodEmpty) {
    HttpRequest req = HttpServer::parse_request("garbage\r\n\r\n");
    EXPECT_TRUE(req.method.empty());
    EXPECT_TRUE(req.path.empty());
}

TEST_F(HttpServerTest, UrlDecode) {
    EXPECT_EQ(HttpServer::url_decode("a+b"), "a b");
    EXPECT_EQ(HttpServer::url_decode("%41%62c"), "Abc");
    EXPECT_EQ(HttpServer::url_decode("100%"), "100%") << "Incomplete escape is kept";
    EXPECT_EQ(HttpServer::url_decode("%zz"), "%zz");
}

// ============================================================================
// Test Contract: Response Framing
// ============================================================================

TEST_F(HttpServerTest, BuildsResponseWithLengthAndClose) {
    HttpResponse resp = HttpResponse::json(202, "{\"ok\":true}");

    std::string wire = HttpServer::build_response(resp);

    EXPECT_EQ(wire.rfind("HTTP/1.1 202 Accepted\r\n", 0), 0u);
    EXPECT_NE(wire.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 11\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 11), "{\"ok\":true}");
}

TEST_F(HttpServerTest, StatusTextForServiceErrors) {
    EXPECT_NE(HttpServer::build_response(HttpResponse::json(409, "")).find("409 Conflict"),
              std::string::npos);
    EXPECT_NE(HttpServer::build_response(HttpResponse::json(503, "")).find("503 Service Unavailable"),
              std::string::npos);
    EXPECT_NE(HttpServer::build_response(HttpResponse::json(403, "")).find("403 Forbidden"),
              std::string::npos);
}

// ============================================================================
// Test Contract: Routing
// ============================================================================

TEST_F(HttpServerTest, DispatchesExactRoutesByMethod) {
    HttpServer server(0);
    server.route("GET", "/health", [this](const HttpRequest&) { return text("get"); });
    server.route("POST", "/health", [this](const HttpRequest&) { return text("post"); });

    EXPECT_EQ(server.dispatch(create_request("GET", "/health")).body, "get");
    EXPECT_EQ(server.dispatch(create_request("POST", "/health")).body, "post");
    EXPECT_EQ(server.dispatch(create_request("DELETE", "/health")).status_code, 404);
}

TEST_F(HttpServerTest, PrefixRouteMatchesSubpaths) {
    HttpServer server(0);
    server.route("GET", "/status/", [this](const HttpRequest& req) { return text(req.path); });

    EXPECT_EQ(server.dispatch(create_request("GET", "/status/execute/exec-s1-0000abcd")).body,
              "/status/execute/exec-s1-0000abcd");
    EXPECT_EQ(server.dispatch(create_request("GET", "/statusx")).status_code, 404);
    EXPECT_EQ(server.dispatch(create_request("GET", "/other")).status_code, 404);
}

TEST_F(HttpServerTest, ExactRouteWinsOverPrefix) {
    HttpServer server(0);
    server.route("GET", "/a/", [this](const HttpRequest&) { return text("prefix"); });
    server.route("GET", "/a/b", [this](const HttpRequest&) { return text("exact"); });

    EXPECT_EQ(server.dispatch(create_request("GET", "/a/b")).body, "exact");
    EXPECT_EQ(server.dispatch(create_request("GET", "/a/c")).body, "prefix");
}

TEST_F(HttpServerTest, HandlerExceptionBecomes500) {
    HttpServer server(0);
    server.route("POST", "/boom", [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("kaput");
    });

    HttpResponse resp = server.dispatch(create_request("POST", "/boom"));

    EXPECT_EQ(resp.status_code, 500);
    EXPECT_EQ(resp.body, "{\"error\":\"kaput\"}");
}

TEST_F(HttpServerTest, NotRunningUntilListen) {
    HttpServer server(0);
    EXPECT_FALSE(server.is_running());
    EXPECT_EQ(server.port(), 0);
}
