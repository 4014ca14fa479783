#include "test_support.h"
#include "transport/http_handler.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace pushhub::transport;
using pushhub::testing::RecordingSession;

TEST(HttpParseTest, RequestWithBody) {
    auto req = HttpHandler::parse_request(
            "POST /messages?session=abc HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "content-length:  7 \r\n"
            "\r\n"
            "{\"a\":1}");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->method, "POST");
    EXPECT_EQ(req->target, "/messages");
    EXPECT_EQ(req->version, "HTTP/1.1");
    EXPECT_EQ(req->body, "{\"a\":1}");
    EXPECT_EQ(HttpHandler::get_header_value(req->headers, "Content-Length"), "7");
    EXPECT_EQ(HttpHandler::get_header_value(req->headers, "HOST"), "localhost");
    EXPECT_EQ(HttpHandler::get_header_value(req->headers, "Accept"), "");
}

TEST(HttpParseTest, MalformedRequests) {
    EXPECT_FALSE(HttpHandler::parse_request("GET / HTTP/1.1\r\nHost: x\r\n").has_value());
    EXPECT_FALSE(HttpHandler::parse_request("GET /\r\n\r\n").has_value());
    EXPECT_FALSE(HttpHandler::parse_request("GET / FTP/1.0\r\n\r\n").has_value());
    EXPECT_FALSE(HttpHandler::parse_request("GET / HTTP/1.1\r\nno colon here\r\n\r\n").has_value());
    EXPECT_FALSE(HttpHandler::parse_request("POST / HTTP/1.1\r\nContent-Length: ten\r\n\r\n").has_value());
    EXPECT_FALSE(HttpHandler::parse_request("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nshort").has_value());
}

TEST(HttpParseTest, HeaderLookupInRawBlock) {
    std::string raw = "POST / HTTP/1.1\r\nCONTENT-LENGTH: 42\r\nConnection: close\r\n\r\n";
    EXPECT_EQ(HttpHandler::get_header_value(raw, "Content-Length"), "42");
    EXPECT_EQ(HttpHandler::get_header_value(raw, "connection"), "close");
    EXPECT_EQ(HttpHandler::get_header_value(raw, "Upgrade"), "");
}

class HttpRoutingTest : public ::testing::Test {
protected:
    void SetUp() override {
        session = std::make_shared<RecordingSession>(io.get_executor());
        endpoints.on_message = [this](const std::string &body) {
            messages.push_back(body);
            return HttpReply{200, R"({"ok":true})"};
        };
        endpoints.on_stream = [this](std::shared_ptr<Session> s) { streamed = s; };
        endpoints.on_health = [] { return HttpReply{200, R"({"status":"healthy","connections":0})"}; };
        endpoints.on_debug = [] { return HttpReply{200, R"({"tools":[]})"}; };
    }

    // Feed one raw request to a handler built from the current endpoints.
    std::string serve(const std::string &raw) {
        HttpHandler handler(endpoints);
        size_t before = session->writes.size();
        asio::co_spawn(io, handler.handle_request(session, raw), [](std::exception_ptr e) {
            if (e) {
                std::rethrow_exception(e);
            }
        });
        io.restart();
        io.run();
        std::string out;
        for (size_t i = before; i < session->writes.size(); ++i) {
            out += session->writes[i];
        }
        return out;
    }

    static std::string body_of(const std::string &response) {
        auto pos = response.find("\r\n\r\n");
        return pos == std::string::npos ? "" : response.substr(pos + 4);
    }

    asio::io_context io;
    std::shared_ptr<RecordingSession> session;
    Endpoints endpoints;
    std::vector<std::string> messages;
    std::shared_ptr<Session> streamed;
};

TEST_F(HttpRoutingTest, PostMessagesReachesEndpoint) {
    auto response = serve("POST /messages HTTP/1.1\r\nContent-Length: 2\r\n\r\n{}");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "{}");
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(response.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(response.find("Access-Control-Allow-Origin: *\r\n"), std::string::npos);
    EXPECT_NE(response.find("Content-Length: 11\r\n"), std::string::npos);
    EXPECT_EQ(body_of(response), R"({"ok":true})");
    EXPECT_FALSE(session->is_closed());
}

TEST_F(HttpRoutingTest, RootPathIsMessagesAlias) {
    serve("POST / HTTP/1.1\r\nContent-Length: 4\r\n\r\nnull");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "null");
}

TEST_F(HttpRoutingTest, EndpointStatusIsForwarded) {
    endpoints.on_message = [](const std::string &) { return HttpReply{500, R"({"error":{}})"}; };
    auto response = serve("POST /messages HTTP/1.1\r\nContent-Length: 1\r\n\r\nx");
    EXPECT_EQ(response.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0), 0u);
}

TEST_F(HttpRoutingTest, UnknownPathIsNotFound) {
    auto response = serve("GET /nowhere HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_EQ(body_of(response), R"({"error":"Not Found"})");
}

TEST_F(HttpRoutingTest, WrongMethodIsNotAllowed) {
    EXPECT_EQ(serve("GET /messages HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 405", 0), 0u);
    EXPECT_EQ(serve("POST /sse HTTP/1.1\r\nContent-Length: 0\r\n\r\n").rfind("HTTP/1.1 405", 0), 0u);
    EXPECT_TRUE(messages.empty());
    EXPECT_FALSE(streamed);
}

TEST_F(HttpRoutingTest, OptionsAnswersPreflight) {
    auto response = serve("OPTIONS /messages HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(response.find("Access-Control-Allow-Origin: *\r\n"), std::string::npos);
    EXPECT_NE(response.find("Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"), std::string::npos);
    EXPECT_NE(response.find("Access-Control-Allow-Headers: Content-Type"), std::string::npos);
}

TEST_F(HttpRoutingTest, HealthAndDebug) {
    EXPECT_EQ(body_of(serve("GET /health HTTP/1.1\r\n\r\n")), R"({"status":"healthy","connections":0})");
    EXPECT_EQ(body_of(serve("GET /debug/tools HTTP/1.1\r\n\r\n")), R"({"tools":[]})");
}

TEST_F(HttpRoutingTest, MalformedRequestIsBadRequest) {
    auto response = serve("garbage\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_EQ(body_of(response), R"({"error":"Invalid HTTP request"})");
}

TEST_F(HttpRoutingTest, ThrowingEndpointIsInternalError) {
    endpoints.on_health = []() -> HttpReply { throw std::runtime_error("boom"); };
    auto response = serve("GET /health HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 500", 0), 0u);
}

TEST_F(HttpRoutingTest, ConnectionCloseClosesSession) {
    serve("GET /health HTTP/1.1\r\nConnection: close\r\n\r\n");
    EXPECT_TRUE(session->is_closed());
}

TEST_F(HttpRoutingTest, SseHandsSessionToStream) {
    auto response = serve("GET /sse HTTP/1.1\r\nAccept: text/event-stream\r\n\r\n");
    EXPECT_TRUE(response.empty());
    EXPECT_EQ(streamed, session);
    EXPECT_TRUE(session->is_streaming());

    // A streaming session does not answer further requests
    EXPECT_TRUE(serve("GET /health HTTP/1.1\r\n\r\n").empty());
}
