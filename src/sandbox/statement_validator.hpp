#pragma once

// ---------------------------------------------------------------------------
// statement_validator.hpp
//
// SQL 문 하나를 SandboxPolicy 에 대해 분류/인가한다.
// 통과 시 정리된 Statement, 실패 시 Rejection 을 반환한다.
//
// [규칙 순서: 첫 실패가 판정을 결정한다]
//  1. kNotEmpty              : 공백뿐인 입력
//  -  정규화                 : trim, 끝 ';' 하나 제거, case-fold
//  2. kSingleStatement       : ';' 가 남아 있으면 거부 (문자열 리터럴 포함)
//  3. kAllowedVerb           : 허용 키워드 + 단어 경계로 시작해야 함
//  4. kNoFilesystemAccess    : "/etc/" 또는 ".."
//  5. kNoForbiddenConstruct  : 금지 구문 패턴
//  6. kNoJoin                : join 단어
//  7. kManagedTableReference : 모든 from 뒤에는 허용 테이블 또는 '('
//  8. kVerbTarget            : update/delete from/insert into 대상 테이블
//
// [설계 원칙]
// - 텍스트 기반 보수적 검사. 리터럴/주석 안의 키워드도 거부한다.
// - 호출 간 캐시된 판정은 없다. 매 호출이 전체 규칙을 다시 평가한다.
// - 생성 후 상태 변경 없음 → 여러 스레드에서 동시에 호출해도 안전하다.
//
// [알려진 한계 / 우회 가능성]
// - 주석 분할 (create/**/table), 유니코드 유사 문자는 탐지하지 않는다.
// - from 뒤 따옴표 식별자 ("tablename") 는 테이블로 인정하지 않는다 (거부).
// - select 목록 안의 스칼라 서브쿼리가 다른 테이블을 읽으려 해도
//   그 from 이 kManagedTableReference 에서 걸린다. FROM 없는 테이블 함수
//   호출 (select * from (values ...)) 은 허용된다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "parser/sql_text.hpp"
#include "policy/sandbox_policy.hpp"

// ---------------------------------------------------------------------------
// RuleId
//   검증 규칙 식별자. 값 순서가 평가 순서와 같다.
// ---------------------------------------------------------------------------
enum class RuleId : std::uint8_t {
    kNotEmpty              = 0,
    kSingleStatement       = 1,
    kAllowedVerb           = 2,
    kNoFilesystemAccess    = 3,
    kNoForbiddenConstruct  = 4,
    kNoJoin                = 5,
    kManagedTableReference = 6,
    kVerbTarget            = 7,
};

// 로그/응답용 규칙 이름 (예: "single-statement")
[[nodiscard]] std::string_view rule_name(RuleId id) noexcept;

// 규칙별 고정 사유 문자열 (예: "multiple statements not allowed")
// 클라이언트가 분기 조건으로 사용할 수 있도록 변경하지 않는다.
[[nodiscard]] std::string_view rule_reason(RuleId id) noexcept;

// ---------------------------------------------------------------------------
// Rejection
//   호출자 입력 오류. 항상 4xx 로 매핑된다.
//   matched 는 kNoForbiddenConstruct 의 매칭 패턴 이름 (감사 로그용).
// ---------------------------------------------------------------------------
struct Rejection {
    RuleId                 rule{RuleId::kNotEmpty};
    std::string            reason{};
    std::string            detail{};
    std::optional<SqlVerb> verb{};     // kVerbTarget 에서만 설정
    std::string            matched{};
};

// ---------------------------------------------------------------------------
// Statement
//   검증을 통과한 SQL.
//   text 는 원문 대소문자를 유지하며 실행에 사용된다.
// ---------------------------------------------------------------------------
struct Statement {
    std::string text{};
    std::string normalized{};
    SqlVerb     verb{SqlVerb::kSelect};
};

class StatementValidator {
public:
    // policy 가 validate_policy() 를 통과하지 못하면 std::invalid_argument.
    explicit StatementValidator(SandboxPolicy policy);

    ~StatementValidator() = default;

    // 복사/이동 허용 (컴파일된 정규식은 shared_ptr 로 공유, 읽기 전용)
    StatementValidator(const StatementValidator&)            = default;
    StatementValidator& operator=(const StatementValidator&) = default;
    StatementValidator(StatementValidator&&)                 = default;
    StatementValidator& operator=(StatementValidator&&)      = default;

    // validate
    //   모든 규칙을 순서대로 적용한다.
    [[nodiscard]] std::expected<Statement, Rejection> validate(std::string_view sql) const;

    // check_rule
    //   정규화 후 규칙 하나만 적용한다. 위반이 없으면 std::nullopt.
    [[nodiscard]] std::optional<Rejection> check_rule(RuleId id, std::string_view sql) const;

    // 평가 순서대로 나열된 규칙 목록
    [[nodiscard]] static const std::vector<RuleId>& rule_order();

    [[nodiscard]] const SandboxPolicy& policy() const noexcept { return policy_; }

private:
    [[nodiscard]] std::optional<Rejection> run_rule(RuleId id, const NormalizedSql& sql) const;

    std::optional<Rejection> check_not_empty(const NormalizedSql& sql) const;
    std::optional<Rejection> check_single_statement(const NormalizedSql& sql) const;
    std::optional<Rejection> check_allowed_verb(const NormalizedSql& sql) const;
    std::optional<Rejection> check_filesystem_access(const NormalizedSql& sql) const;
    std::optional<Rejection> check_forbidden_construct(const NormalizedSql& sql) const;
    std::optional<Rejection> check_join(const NormalizedSql& sql) const;
    std::optional<Rejection> check_table_reference(const NormalizedSql& sql) const;
    std::optional<Rejection> check_verb_target(const NormalizedSql& sql) const;

    [[nodiscard]] Rejection make_rejection(RuleId id, std::string detail) const;

    SandboxPolicy policy_;

    // 컴파일된 금지 패턴. 구현 파일에서만 <regex> 를 포함한다.
    struct CompiledPattern;
    std::shared_ptr<const std::vector<CompiledPattern>> forbidden_;
};
