#pragma once

// ---------------------------------------------------------------------------
// sql_sandbox.hpp
//
// 검증 → 행 제한 파이프라인.
// 실행 경로는 반드시 prepare() 를 거친다. 검증을 건너뛰는 경로는 없다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>

#include "policy/sandbox_policy.hpp"
#include "sandbox/row_limiter.hpp"
#include "sandbox/statement_validator.hpp"

// ---------------------------------------------------------------------------
// PreparedStatement
//   검증된 문장과 실제 엔진에 전달할 SQL.
//   limited 는 RowLimiter 가 재작성했는지 여부.
// ---------------------------------------------------------------------------
struct PreparedStatement {
    Statement   statement{};
    std::string executable_sql{};
    bool        limited{false};
};

class SqlSandbox {
public:
    explicit SqlSandbox(const SandboxPolicy& policy)
        : validator_(policy)
        , limiter_(policy) {}

    [[nodiscard]] std::expected<PreparedStatement, Rejection> prepare(std::string_view sql) const;

    [[nodiscard]] const StatementValidator& validator() const noexcept { return validator_; }
    [[nodiscard]] const RowLimiter&         limiter() const noexcept { return limiter_; }

private:
    StatementValidator validator_;
    RowLimiter         limiter_;
};
