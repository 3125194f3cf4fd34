#pragma once

// ---------------------------------------------------------------------------
// sandbox_policy.hpp
//
// SQL 샌드박스 정책 값 정의.
// 프로세스 시작 시 한 번 생성되어 StatementValidator / RowLimiter 에
// 명시적으로 주입된다. 전역 상태로 두지 않는다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 정책은 외부 설정으로 바꿀 수 없다. config/*.yaml 은 서버 설정만 다룬다.
// - 모든 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// SqlVerb
//   허용 대상이 될 수 있는 선두 키워드.
// ---------------------------------------------------------------------------
enum class SqlVerb : std::uint8_t {
    kSelect = 0,
    kInsert = 1,
    kUpdate = 2,
    kDelete = 3,
};

// ---------------------------------------------------------------------------
// ForbiddenPattern
//   금지 구문 하나.
//   pattern 은 case-fold 된 SQL 에 적용되는 ECMAScript 정규식이며
//   단어 경계(\b)를 포함해야 한다.
//   category 는 감사 로그용 분류 ("file-read", "ddl" 등).
// ---------------------------------------------------------------------------
struct ForbiddenPattern {
    std::string name{};      // 로그 식별자 (예: "read_csv_auto")
    std::string pattern{};   // 정규식
    std::string category{};  // 분류
};

// ---------------------------------------------------------------------------
// SandboxPolicy
//   allowed_table     : 쿼리가 참조할 수 있는 유일한 테이블
//   allowed_verbs     : 허용 선두 키워드
//   forbidden_patterns: 순서 있는 금지 구문 목록 (첫 매칭으로 판정)
//   default_row_cap   : LIMIT 없는 SELECT 에 붙는 행 수 상한
// ---------------------------------------------------------------------------
struct SandboxPolicy {
    std::string                   allowed_table{"tablename"};
    std::vector<SqlVerb>          allowed_verbs{
        SqlVerb::kSelect, SqlVerb::kInsert, SqlVerb::kUpdate, SqlVerb::kDelete};
    std::vector<ForbiddenPattern> forbidden_patterns{};
    std::uint32_t                 default_row_cap{1000};
};

// make_default_sandbox_policy
//   운영 정책. 금지 구문 목록을 채운 SandboxPolicy 를 반환한다.
[[nodiscard]] SandboxPolicy make_default_sandbox_policy();

// validate_policy
//   allowed_table 이 식별자 형식인지, 금지 패턴이 컴파일되는지,
//   row cap 이 0 이 아닌지 검사한다.
//   allowed_table 은 정규식에 그대로 삽입되므로 식별자 문자만 허용한다.
[[nodiscard]] std::expected<void, std::string> validate_policy(const SandboxPolicy& policy);

// "select" / "insert" / "update" / "delete"
[[nodiscard]] std::string_view verb_to_string(SqlVerb verb) noexcept;

// 소문자 키워드 → SqlVerb. 매핑 없으면 std::nullopt.
[[nodiscard]] std::optional<SqlVerb> verb_from_string(std::string_view keyword) noexcept;
