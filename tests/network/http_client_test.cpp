#include <gtest/gtest.h>
#include "chunkup/network/http_client.hpp"
#include "chunkup/network/http_server_asio.hpp"

#include <boost/asio.hpp>

#include <memory>
#include <thread>

using namespace chunkup;
using namespace chunkup::network;

namespace {

class LoopbackServer {
public:
    explicit LoopbackServer(HttpRequestHandler handler, std::size_t max_body = 1024 * 1024)
        : server_(io_, 0, "127.0.0.1", max_body) {
        server_.set_handler(std::move(handler));
        thread_ = std::thread([this] { io_.run(); });
    }

    ~LoopbackServer() {
        server_.stop();
        io_.stop();
        thread_.join();
    }

    HttpEndpoint endpoint() const {
        HttpEndpoint ep;
        ep.host = "127.0.0.1";
        ep.port = server_.get_port();
        return ep;
    }

private:
    boost::asio::io_context io_;
    HttpServerAsio server_;
    std::thread thread_;
};

} // namespace

TEST(HttpEndpoint, ParsesHostPortAndBase) {
    auto ep = HttpEndpoint::parse("http://10.0.0.5:4000/node/");
    ASSERT_TRUE(ep.is_ok());
    EXPECT_EQ(ep.value().host, "10.0.0.5");
    EXPECT_EQ(ep.value().port, 4000);
    EXPECT_EQ(ep.value().base_path, "/node");
    EXPECT_EQ(ep.value().to_string(), "http://10.0.0.5:4000/node");
}

TEST(HttpEndpoint, DefaultsToPort80) {
    auto ep = HttpEndpoint::parse("http://storage.local");
    ASSERT_TRUE(ep.is_ok());
    EXPECT_EQ(ep.value().port, 80);
    EXPECT_TRUE(ep.value().base_path.empty());
}

TEST(HttpEndpoint, RejectsBadUrls) {
    EXPECT_TRUE(HttpEndpoint::parse("https://node").is_error());
    EXPECT_TRUE(HttpEndpoint::parse("http://:4000").is_error());
    EXPECT_TRUE(HttpEndpoint::parse("http://node:99999").is_error());
}

TEST(HttpClientParse, ContentLengthBody) {
    auto r = HttpClient::parse_response("HTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\nokEXTRA");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().status_code, 201);
    EXPECT_EQ(r.value().reason_phrase, "Created");
    EXPECT_EQ(r.value().body_as_string(), "ok");
}

TEST(HttpClientParse, ChunkedBody) {
    auto r = HttpClient::parse_response(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().body_as_string(), "Wikipedia");
}

TEST(HttpClientParse, MalformedIsRemoteUnavailable) {
    auto r = HttpClient::parse_response("garbage");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, ErrorCode::RemoteUnavailable);

    auto short_body = HttpClient::parse_response("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc");
    EXPECT_TRUE(short_body.is_error());
}

TEST(HttpClientParse, RejectsOversizedChunkSizeLine) {
    auto wrapped = HttpClient::parse_response(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nffffffffffffffff\r\nabc\r\n0\r\n\r\n");
    ASSERT_TRUE(wrapped.is_error());
    EXPECT_EQ(wrapped.error().code, ErrorCode::RemoteUnavailable);

    auto beyond_body = HttpClient::parse_response(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nfffffff\r\nabc\r\n0\r\n\r\n");
    EXPECT_TRUE(beyond_body.is_error());

    auto not_hex = HttpClient::parse_response(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\nabc\r\n0\r\n\r\n");
    EXPECT_TRUE(not_hex.is_error());
}

TEST(HttpClientLoopback, PostRoundTrip) {
    LoopbackServer server([](const HttpRequest& req) {
        HttpResponse response(HttpStatus::OK);
        response.set_body(req.get_header("X-Echo") + ":" + req.body_as_string() + ":" + req.path);
        return response;
    });

    HttpClient client(server.endpoint(), std::chrono::seconds(5));
    auto r = client.post("/chunk-append", {{"X-Echo", "hi"}}, "payload");
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value().status_code, 200);
    EXPECT_EQ(r.value().body_as_string(), "hi:payload:/chunk-append");
}

TEST(HttpClientLoopback, NonSuccessIsReturnedAsValue) {
    LoopbackServer server([](const HttpRequest&) {
        HttpResponse response(HttpStatus::SERVICE_UNAVAILABLE);
        response.set_body("busy");
        return response;
    });

    HttpClient client(server.endpoint(), std::chrono::seconds(5));
    auto r = client.post("/verify-file", {}, "{}");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().status_code, 503);
    EXPECT_FALSE(r.value().is_success());
}

TEST(HttpClientLoopback, OversizedBodyGets413) {
    LoopbackServer server([](const HttpRequest&) { return HttpResponse(HttpStatus::OK); }, 8);

    HttpClient client(server.endpoint(), std::chrono::seconds(5));
    auto r = client.post("/api/uploads/chunk", {}, std::string(64, 'x'));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().status_code, 413);
}

TEST(HttpClientLoopback, ConnectionRefusedIsRemoteUnavailable) {
    std::uint16_t unused_port = 0;
    {
        boost::asio::io_context io;
        HttpServerAsio placeholder(io, 0, "127.0.0.1");
        unused_port = placeholder.get_port();
    }

    HttpEndpoint ep;
    ep.host = "127.0.0.1";
    ep.port = unused_port;
    HttpClient client(ep, std::chrono::seconds(2));
    auto r = client.post("/chunk-append", {}, "x");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code, ErrorCode::RemoteUnavailable);
}
