#include "wfsync/network/http_response_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using wfsync::ErrorCode;
using wfsync::network::HttpResponseParser;
using wfsync::network::ResponseParseState;

namespace {

wfsync::Result<bool> feed(HttpResponseParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpResponseParserTest, ContentLengthBody) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 11\r\n\r\n{\"ok\":true}");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.response().status_code, 200);
    EXPECT_EQ(parser.response().reason_phrase, "OK");
    EXPECT_EQ(parser.response().get_header("content-type"), "application/json");
    EXPECT_EQ(parser.response().body, "{\"ok\":true}");
}

TEST(HttpResponseParserTest, ByteByByteFeeding) {
    const std::string wire = "HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n\r\nnot found";
    HttpResponseParser parser;

    for (size_t i = 0; i + 1 < wire.size(); ++i) {
        auto partial = parser.parse(&wire[i], 1);
        ASSERT_TRUE(partial.is_ok());
        EXPECT_FALSE(partial.value());
    }
    auto last = parser.parse(&wire.back(), 1);

    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.response().status_code, 404);
    EXPECT_EQ(parser.response().reason_phrase, "Not Found");
    EXPECT_EQ(parser.response().body, "not found");
}

TEST(HttpResponseParserTest, ChunkedBodyWithExtensionAndTrailer) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 200 OK\r\n"
                       "Transfer-Encoding: chunked\r\n"
                       "\r\n"
                       "5;name=value\r\nhello\r\n"
                       "7\r\n, world\r\n"
                       "0\r\n"
                       "X-Trailer: yes\r\n"
                       "\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.response().body, "hello, world");
}

TEST(HttpResponseParserTest, BodyUntilEofCompletesOnFinish) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.0 200 OK\r\n\r\npartial body");

    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());
    EXPECT_EQ(parser.state(), ResponseParseState::BODY_UNTIL_EOF);

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_EQ(parser.response().body, "partial body");
}

TEST(HttpResponseParserTest, TruncatedResponseIsTransportError) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort").is_ok());

    auto finished = parser.finish();

    ASSERT_TRUE(finished.is_error());
    EXPECT_EQ(finished.error().code, ErrorCode::Transport);
}

TEST(HttpResponseParserTest, NoContentHasNoBody) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.1 204 No Content\r\nContent-Length: 0\r\n\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.response().body.empty());
}

TEST(HttpResponseParserTest, MalformedInputIsInvalidData) {
    HttpResponseParser version;
    auto bad_version = feed(version, "SPDY/3 200 OK\r\n\r\n");
    ASSERT_TRUE(bad_version.is_error());
    EXPECT_EQ(bad_version.error().code, ErrorCode::InvalidData);

    HttpResponseParser length;
    auto bad_length = feed(length, "HTTP/1.1 200 OK\r\nContent-Length: lots\r\n\r\n");
    ASSERT_TRUE(bad_length.is_error());

    HttpResponseParser chunk;
    auto bad_chunk = feed(chunk, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
    ASSERT_TRUE(bad_chunk.is_error());
}

TEST(HttpResponseParserTest, ResetAllowsReuse) {
    HttpResponseParser parser;
    ASSERT_TRUE(feed(parser, "HTTP/1.1 500 Internal Server Error\r\nContent-Length: 0\r\n\r\n").is_ok());
    EXPECT_EQ(parser.response().status_code, 500);

    parser.reset();
    ASSERT_TRUE(feed(parser, "HTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\n{}").is_ok());
    EXPECT_TRUE(parser.is_complete());
    EXPECT_EQ(parser.response().status_code, 201);
    EXPECT_TRUE(parser.response().is_success());
}
