// ---------------------------------------------------------------------------
// test_http_message.cpp
//
// parse_request_head / HttpResponse 단위 테스트.
//
// [테스트 범위]
// - request-line 분해, path / query 분리, 헤더 이름 소문자 정규화
// - 오류 분류: request-line, 헤더, Content-Length, Transfer-Encoding, 버전
// - 응답 직렬화: Content-Length / Connection 은 항상 서버가 결정
// ---------------------------------------------------------------------------

#include "http/http_message.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(HttpMessage, ParsesRequestHead) {
    auto req = parse_request_head("POST /api/query?x=1&y=2 HTTP/1.1\r\n"
                                  "Host: localhost:8000\r\n"
                                  "Content-Type:   application/json  \r\n"
                                  "Content-Length: 27");
    ASSERT_TRUE(req.has_value()) << req.error().message;

    EXPECT_EQ(req->method, "POST");
    EXPECT_EQ(req->target, "/api/query?x=1&y=2");
    EXPECT_EQ(req->path, "/api/query");
    EXPECT_EQ(req->query, "x=1&y=2");
    EXPECT_EQ(req->version, "HTTP/1.1");
    EXPECT_EQ(req->content_length, 27u);

    ASSERT_EQ(req->headers.size(), 3u);
    EXPECT_EQ(req->headers[1].first, "content-type");
    EXPECT_EQ(req->headers[1].second, "application/json");
    EXPECT_EQ(req->header("CONTENT-TYPE"), "application/json");
    EXPECT_FALSE(req->header("origin").has_value());
}

TEST(HttpMessage, RequestWithoutHeaders) {
    auto req = parse_request_head("GET / HTTP/1.0");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->path, "/");
    EXPECT_TRUE(req->query.empty());
    EXPECT_EQ(req->content_length, 0u);
}

TEST(HttpMessage, MalformedRequestLine) {
    for (const char* head : {"", "GET", "GET /", "GET  / HTTP/1.1", "GET / HTTP/1.1 extra",
                             "G(T / HTTP/1.1", "GET api HTTP/1.1"}) {
        auto req = parse_request_head(head);
        ASSERT_FALSE(req.has_value()) << head;
        EXPECT_EQ(req.error().code, HttpParseErrorCode::kMalformedRequestLine) << head;
    }
}

TEST(HttpMessage, UnsupportedVersion) {
    auto req = parse_request_head("GET / HTTP/2.0\r\nHost: x");
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().code, HttpParseErrorCode::kUnsupportedVersion);
    EXPECT_EQ(req.error().message, "unsupported HTTP version 'HTTP/2.0'");
}

TEST(HttpMessage, MalformedHeaders) {
    for (const char* head : {"GET / HTTP/1.1\r\nNoColon",
                             "GET / HTTP/1.1\r\n: empty-name",
                             "GET / HTTP/1.1\r\nBad Name: x",
                             "GET / HTTP/1.1\r\nHost: x\r\n  folded"}) {
        auto req = parse_request_head(head);
        ASSERT_FALSE(req.has_value()) << head;
        EXPECT_EQ(req.error().code, HttpParseErrorCode::kMalformedHeader) << head;
    }
}

TEST(HttpMessage, ContentLengthValidation) {
    for (const char* value : {"abc", "-1", "1 2", "", "99999999999999999999999"}) {
        auto req = parse_request_head(std::string("POST / HTTP/1.1\r\nContent-Length: ") + value);
        ASSERT_FALSE(req.has_value()) << value;
        EXPECT_EQ(req.error().code, HttpParseErrorCode::kInvalidContentLength) << value;
    }

    auto conflicting = parse_request_head("POST / HTTP/1.1\r\nContent-Length: 5\r\n"
                                          "Content-Length: 6");
    ASSERT_FALSE(conflicting.has_value());
    EXPECT_EQ(conflicting.error().message, "conflicting Content-Length");

    auto repeated = parse_request_head("POST / HTTP/1.1\r\nContent-Length: 5\r\n"
                                       "content-length: 5");
    ASSERT_TRUE(repeated.has_value());
    EXPECT_EQ(repeated->content_length, 5u);
}

TEST(HttpMessage, TransferEncodingIsUnsupported) {
    auto req = parse_request_head("POST / HTTP/1.1\r\nTransfer-Encoding: chunked");
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().code, HttpParseErrorCode::kUnsupportedTransferEncoding);
}

TEST(HttpMessage, SerializeResponse) {
    HttpResponse resp = make_json_response(200, R"({"status":"ok"})");
    resp.set_header("Content-Length", "999");
    resp.set_header("Connection", "keep-alive");
    resp.set_header("Vary", "Origin");

    const auto wire = resp.serialize();
    EXPECT_EQ(wire,
              "HTTP/1.1 200 OK\r\n"
              "Content-Type: application/json\r\n"
              "Vary: Origin\r\n"
              "Content-Length: 15\r\n"
              "Connection: close\r\n"
              "\r\n"
              "{\"status\":\"ok\"}");
}

TEST(HttpMessage, SetHeaderReplacesCaseInsensitive) {
    HttpResponse resp;
    resp.set_header("Allow", "GET");
    resp.set_header("allow", "GET, POST");
    ASSERT_EQ(resp.headers.size(), 1u);
    EXPECT_EQ(resp.header("ALLOW"), "GET, POST");
}

TEST(HttpMessage, ErrorResponseBody) {
    auto resp = make_error_response(422, "Field 'sql' is required.");
    EXPECT_EQ(resp.status, 422);
    EXPECT_EQ(resp.header("content-type"), "application/json");
    EXPECT_EQ(resp.body, R"({"detail":"Field 'sql' is required."})");

    auto quoted = make_error_response(400, "bad \"quote\"");
    EXPECT_EQ(quoted.body, R"({"detail":"bad \"quote\""})");
}

TEST(HttpMessage, StatusText) {
    EXPECT_EQ(status_text(200), "OK");
    EXPECT_EQ(status_text(413), "Payload Too Large");
    EXPECT_EQ(status_text(422), "Unprocessable Entity");
    EXPECT_EQ(status_text(599), "Unknown");
}
