#include <gtest/gtest.h>
#include "chunkup/network/http_parser.hpp"

#include <string>

using namespace chunkup::network;

namespace {

chunkup::Result<bool> feed(HttpParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpParser, ParsesRequestLineQueryAndHeaders) {
    HttpParser parser;
    auto result = feed(parser,
        "GET /api/uploads/status?uploadId=abc%2D1&x=y+z HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Authorization: Bearer  tok-1 \r\n"
        "\r\n");

    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value());

    HttpRequest req = parser.take_request();
    EXPECT_EQ(req.method, HttpMethod::GET);
    EXPECT_EQ(req.path, "/api/uploads/status");
    EXPECT_EQ(req.get_query("uploadId"), "abc-1");
    EXPECT_EQ(req.get_query("x"), "y z");
    EXPECT_EQ(req.get_header("host"), "localhost");
    EXPECT_EQ(req.bearer_token(), "tok-1");
}

TEST(HttpParser, BinaryBodyAcrossSeveralReads) {
    HttpParser parser;
    std::string body("\x00\x01\xff\r\n", 5);

    auto head = feed(parser, "POST /api/uploads/chunk HTTP/1.1\r\nContent-Length: 5\r\n\r\n");
    ASSERT_TRUE(head.is_ok());
    EXPECT_FALSE(head.value());

    auto part = feed(parser, body.substr(0, 2));
    ASSERT_TRUE(part.is_ok());
    EXPECT_FALSE(part.value());

    auto rest = feed(parser, body.substr(2));
    ASSERT_TRUE(rest.is_ok());
    ASSERT_TRUE(rest.value());

    HttpRequest req = parser.take_request();
    EXPECT_EQ(req.body_as_string(), body);
}

TEST(HttpParser, ByteAtATime) {
    HttpParser parser;
    const std::string wire = "DELETE /api/uploads/u-1 HTTP/1.1\r\nContent-Length: 2\r\n\r\nok";

    chunkup::Result<bool> last = chunkup::Ok(false);
    for (char c : wire) {
        last = parser.parse(&c, 1);
        ASSERT_TRUE(last.is_ok());
    }
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.get_request().method, HttpMethod::DELETE_METHOD);
    EXPECT_EQ(parser.get_request().body_as_string(), "ok");
}

TEST(HttpParser, RejectsUnknownMethod) {
    HttpParser parser;
    auto result = feed(parser, "BREW /pot HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, chunkup::ErrorCode::Validation);
}

TEST(HttpParser, RejectsBadContentLength) {
    HttpParser parser;
    auto result = feed(parser, "POST /x HTTP/1.1\r\nContent-Length: 12a\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_FALSE(parser.payload_too_large());
}

TEST(HttpParser, RejectsChunkedRequestBody) {
    HttpParser parser;
    auto result = feed(parser, "POST /x HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
    EXPECT_TRUE(result.is_error());
}

TEST(HttpParser, FlagsOversizedBody) {
    HttpParser parser(16);
    auto result = feed(parser, "POST /x HTTP/1.1\r\nContent-Length: 17\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(parser.payload_too_large());
}

TEST(HttpParser, ResetAllowsReuse) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "GET /a HTTP/1.1\r\n\r\n").value());
    parser.reset();
    ASSERT_TRUE(feed(parser, "GET /b HTTP/1.0\r\n\r\n").value());
    EXPECT_EQ(parser.get_request().path, "/b");
    EXPECT_EQ(parser.get_request().version, HttpVersion::HTTP_1_0);
}
