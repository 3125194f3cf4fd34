#pragma once

// ---------------------------------------------------------------------------
// http_message.hpp
//
// HTTP/1.1 요청 헤더 파싱과 응답 직렬화 (손으로 작성한 최소 구현).
//
// [지원 범위]
// - 요청: request-line + 헤더 + Content-Length 본문
// - 응답: 항상 Connection: close, Content-Length 명시
//
// [미지원 / 알려진 한계]
// - Transfer-Encoding (chunked 등) 요청 본문 → kUnsupportedTransferEncoding
// - keep-alive / 파이프라이닝: 연결당 요청 하나만 처리한다.
// - 헤더 폴딩 (obs-fold) 은 형식 오류로 처리한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// ---------------------------------------------------------------------------
// HttpRequest
//   헤더 이름은 소문자로 정규화되어 저장된다.
//   path 는 target 에서 '?' 앞부분, query 는 뒷부분.
// ---------------------------------------------------------------------------
struct HttpRequest {
    std::string   method{};
    std::string   target{};
    std::string   path{};
    std::string   query{};
    std::string   version{};
    HttpHeaders   headers{};
    std::uint64_t content_length{0};
    std::string   body{};

    // 대소문자 무시 헤더 조회. 같은 이름이 여러 개면 첫 번째 값.
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

struct HttpResponse {
    int         status{200};
    HttpHeaders headers{};
    std::string body{};

    // 같은 이름의 헤더가 있으면 교체한다.
    void set_header(std::string_view name, std::string value);

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;

    // status-line + 헤더 + Content-Length + Connection: close + 본문
    [[nodiscard]] std::string serialize() const;
};

enum class HttpParseErrorCode : std::uint8_t {
    kMalformedRequestLine        = 0,
    kMalformedHeader             = 1,
    kInvalidContentLength        = 2,
    kUnsupportedTransferEncoding = 3,
    kUnsupportedVersion          = 4,
};

struct HttpParseError {
    HttpParseErrorCode code{HttpParseErrorCode::kMalformedRequestLine};
    std::string        message{};
};

// parse_request_head
//   "\r\n\r\n" 를 포함하지 않는 헤더 블록 (request-line 부터 마지막 헤더 줄까지).
//   본문은 채우지 않는다. content_length 만 설정된다.
[[nodiscard]] std::expected<HttpRequest, HttpParseError>
parse_request_head(std::string_view head);

// 상태 코드 → reason phrase ("OK", "Not Found" ...)
[[nodiscard]] std::string_view status_text(int status) noexcept;

// application/json 응답 생성
[[nodiscard]] HttpResponse make_json_response(int status, std::string body);

// {"detail": "<message>"} 응답 생성
[[nodiscard]] HttpResponse make_error_response(int status, std::string_view detail);
