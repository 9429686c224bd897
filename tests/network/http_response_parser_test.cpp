#include "tusup/network/http_response_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using tusup::ErrorKind;
using tusup::network::HttpResponseParser;
using tusup::network::ResponseParseState;

namespace {

tusup::Result<bool> feed(HttpResponseParser& parser, const std::string& data) {
    return parser.parse(data.data(), data.size());
}

} // namespace

TEST(HttpResponseParserTest, ParsesContentLengthBody) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 201 Created\r\n"
                       "Content-Type: application/json\r\n"
                       "Content-Length: 13\r\n"
                       "\r\n"
                       "{\"uri\":\"/v\"}X");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());

    const auto response = parser.get_response();
    EXPECT_EQ(response.status_code, 201);
    EXPECT_EQ(response.reason_phrase, "Created");
    EXPECT_EQ(response.header("content-type").value_or(""), "application/json");
    EXPECT_EQ(response.body_as_string(), "{\"uri\":\"/v\"}X");
}

TEST(HttpResponseParserTest, HandlesSplitInput) {
    HttpResponseParser parser;
    const std::string raw =
        "HTTP/1.1 204 No Content\r\n"
        "Tus-Resumable: 1.0.0\r\n"
        "Upload-Offset: 300\r\n"
        "\r\n";

    for (std::size_t i = 0; i + 1 < raw.size(); ++i) {
        auto partial = parser.parse(raw.data() + i, 1);
        ASSERT_TRUE(partial.is_ok());
        EXPECT_FALSE(partial.value());
    }
    auto last = parser.parse(raw.data() + raw.size() - 1, 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.get_response().header("Upload-Offset").value_or(""), "300");
}

TEST(HttpResponseParserTest, ParsesChunkedBody) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 200 OK\r\n"
                       "Transfer-Encoding: chunked\r\n"
                       "\r\n"
                       "5\r\nhello\r\n"
                       "6;ext=1\r\n world\r\n"
                       "0\r\n"
                       "\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_response().body_as_string(), "hello world");
}

TEST(HttpResponseParserTest, BodyUntilClose) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/1.0 200 OK\r\n\r\npartial ");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());
    ASSERT_TRUE(feed(parser, "body").is_ok());
    EXPECT_EQ(parser.state(), ResponseParseState::BODY_UNTIL_CLOSE);

    auto finished = parser.finish();
    ASSERT_TRUE(finished.is_ok());
    EXPECT_TRUE(parser.is_complete());
    EXPECT_EQ(parser.get_response().body_as_string(), "partial body");
}

TEST(HttpResponseParserTest, HeadResponseIgnoresContentLength) {
    HttpResponseParser parser;
    parser.expect_no_body(true);
    auto result = feed(parser,
                       "HTTP/1.1 200 OK\r\n"
                       "Upload-Offset: 100\r\n"
                       "Content-Length: 300\r\n"
                       "\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(parser.get_response().body.empty());
}

TEST(HttpResponseParserTest, SkipsInterimResponses) {
    HttpResponseParser parser;
    auto result = feed(parser,
                       "HTTP/1.1 100 Continue\r\n"
                       "\r\n"
                       "HTTP/1.1 204 No Content\r\n"
                       "Upload-Offset: 100\r\n"
                       "\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());
    EXPECT_EQ(parser.get_response().status_code, 204);
    EXPECT_EQ(parser.get_response().header("Upload-Offset").value_or(""), "100");
}

TEST(HttpResponseParserTest, RejectsMalformedStatusLine) {
    HttpResponseParser parser;
    auto result = feed(parser, "HTTP/2.0 200 OK\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Decode);
    EXPECT_EQ(parser.state(), ResponseParseState::PARSE_ERROR);

    HttpResponseParser bad_code;
    EXPECT_TRUE(feed(bad_code, "HTTP/1.1 2x0 OK\r\n").is_error());

    HttpResponseParser bad_length;
    EXPECT_TRUE(feed(bad_length, "HTTP/1.1 200 OK\r\nContent-Length: ten\r\n\r\n").is_error());
}

TEST(HttpResponseParserTest, TruncatedResponseIsTransportError) {
    HttpResponseParser empty;
    auto nothing = empty.finish();
    ASSERT_TRUE(nothing.is_error());
    EXPECT_EQ(nothing.error().kind, ErrorKind::Transport);

    HttpResponseParser truncated;
    ASSERT_TRUE(feed(truncated, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc").is_ok());
    auto cut = truncated.finish();
    ASSERT_TRUE(cut.is_error());
    EXPECT_EQ(cut.error().kind, ErrorKind::Transport);
}
