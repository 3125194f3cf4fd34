#pragma once

// ---------------------------------------------------------------------------
// json_util.hpp
//
// 최소 JSON 도구.
// - 출력: 문자열 이스케이프, SqlValue 직렬화 (직접 조립)
// - 입력: 최상위 객체에서 문자열 필드 하나 추출 (요청 본문 {"sql": "..."})
//         해석은 nlohmann::json 이 담당한다.
//
// [설계 원칙]
// - 호출자에게 JSON DOM 을 노출하지 않는다. 필요한 값만 꺼내 준다.
// - 입력은 문법 전체를 검사한다. 잘못된 JSON 은 필드 추출 전에 거부된다.
//
// [알려진 한계]
// - 이스케이프는 입력 바이트가 올바른 UTF-8 이라고 가정한다.
//   잘못된 UTF-8 바이트는 그대로 출력된다.
// - 입력 중첩 깊이는 제한하지 않는다. 본문 크기 상한(max_body_bytes)이
//   유일한 제한이다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "common/types.hpp"  // SqlValue

// "\"", "\\", 제어 문자 이스케이프. 따옴표로 감싸지 않는다.
[[nodiscard]] std::string escape_json_string(std::string_view str);

// "..." 로 감싼 JSON 문자열
[[nodiscard]] std::string quote_json_string(std::string_view str);

// SqlValue → JSON 값 (NULL/비유한 double → null)
void append_json_value(std::string& out, const SqlValue& value);

// ---------------------------------------------------------------------------
// JsonFieldError
//   kMalformed  : 본문이 JSON 객체가 아님
//   kMissing    : 필드 없음
//   kWrongType  : 필드가 문자열이 아님
// ---------------------------------------------------------------------------
enum class JsonFieldError : std::uint8_t {
    kMalformed = 0,
    kMissing   = 1,
    kWrongType = 2,
};

// extract_json_string_field
//   body 가 JSON 객체이면 key 필드의 문자열 값을 언이스케이프하여 반환한다.
//   키가 중복되면 마지막 값을 사용한다.
[[nodiscard]] std::expected<std::string, JsonFieldError>
extract_json_string_field(std::string_view body, std::string_view key);
