#pragma once

// ---------------------------------------------------------------------------
// multipart.hpp
//
// multipart/form-data 본문 분리 (RFC 7578).
//
// [수명 주의]
// - MultipartPart::data 는 입력 body 를 가리키는 view 이다.
//   body 문자열이 파트보다 먼저 소멸하면 안 된다.
//
// [알려진 한계]
// - 중첩 multipart (multipart/mixed) 는 하나의 불투명 파트로 취급한다.
// - filename* (RFC 5987 인코딩) 은 해석하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct MultipartPart {
    std::string                name{};          // Content-Disposition name
    std::optional<std::string> filename{};      // Content-Disposition filename
    std::string                content_type{};  // 파트 Content-Type (없으면 빈 문자열)
    std::string_view           data{};
};

// Content-Type 헤더에서 boundary 파라미터 추출.
// multipart/form-data 가 아니거나 boundary 가 없으면 std::nullopt.
[[nodiscard]] std::optional<std::string> multipart_boundary(std::string_view content_type);

// parse_multipart
//   실패 시 사람이 읽을 수 있는 오류 메시지.
[[nodiscard]] std::expected<std::vector<MultipartPart>, std::string>
parse_multipart(std::string_view body, std::string_view boundary);
