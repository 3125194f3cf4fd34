#pragma once

// ---------------------------------------------------------------------------
// sql_text.hpp
//
// SQL 텍스트 정규화 및 단어 경계 헬퍼.
// 토큰화/구문 분석은 하지 않는다. 검증기와 행 제한기가 같은 정규화를
// 공유하도록 한 곳에 모아 둔다.
//
// [알려진 한계]
// - case-fold 는 ASCII 범위만 처리한다. 유니코드 유사 문자(전각 'ＳＥＬＥＣＴ')
//   는 키워드로 인식되지 않는다.
// - 단어 문자는 [A-Za-z0-9_] 이다. 0x80 이상 바이트는 비단어 문자로 보므로
//   "éjoin" 의 join 도 단어로 매칭된다 (차단 쪽으로 기운다).
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// NormalizedSql
//   text   : 앞뒤 공백 제거 + 끝 종결자(;) 제거한 원문. 실행에 사용된다.
//   folded : text 의 ASCII 소문자 버전. 모든 규칙 판정에 사용된다.
//   empty  : 입력이 공백뿐이었는지 여부
// ---------------------------------------------------------------------------
struct NormalizedSql {
    std::string text{};
    std::string folded{};
    bool        empty{true};
};

// 앞뒤 공백(스페이스, 탭, 개행 포함) 제거
[[nodiscard]] std::string_view trim_sql(std::string_view s) noexcept;

// 앞뒤 공백을 자르고 끝의 ';' 하나를 제거한 뒤 다시 공백을 자른다.
// 예: "SELECT 1 ;" → "SELECT 1", "SELECT 1;;" → "SELECT 1;"
// ';' 앞의 공백도 제거되므로 "SELECT 1 ;" 의 결과에는 끝 공백이 남지 않는다.
[[nodiscard]] std::string_view strip_statement_terminator(std::string_view s) noexcept;

// ASCII 소문자 변환
[[nodiscard]] std::string fold_case(std::string_view s);

// [A-Za-z0-9_]
[[nodiscard]] bool is_word_char(char c) noexcept;

// haystack 안에 word 가 단어 경계로 둘러싸여 나타나는지 (정규식 \bword\b 와 동일).
// word 는 단어 문자로만 구성되어야 한다.
[[nodiscard]] bool contains_word(std::string_view haystack, std::string_view word) noexcept;

// 선행 공백을 건너뛴 첫 단어 문자열 (단어 문자 연속). 없으면 빈 view.
[[nodiscard]] std::string_view leading_word(std::string_view s) noexcept;

// trim → 종결자 제거 → case-fold 를 한 번에 수행한다.
[[nodiscard]] NormalizedSql normalize_sql(std::string_view raw);
