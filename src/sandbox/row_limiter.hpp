#pragma once

// ---------------------------------------------------------------------------
// row_limiter.hpp
//
// 검증을 통과한 SELECT 에 행 수 상한을 씌운다.
//
//   select 가 아님          → 그대로
//   limit 단어가 이미 있음  → 그대로
//   그 외                   → SELECT * FROM (<stmt>) AS subquery LIMIT <cap>
//
// [알려진 한계]
// - limit 이 문자열 리터럴이나 서브쿼리 안에만 있어도 "이미 제한됨" 으로
//   본다. 이 경우 결과 행 수는 제한되지 않는다.
// - 거부하지 않는다. 검증되지 않은 텍스트를 넘기지 말 것.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>

#include "policy/sandbox_policy.hpp"

class RowLimiter {
public:
    explicit RowLimiter(const SandboxPolicy& policy) noexcept
        : row_cap_(policy.default_row_cap) {}

    // 호출자가 결과를 버리면 상한이 적용되지 않은 SQL 이 실행된다.
    [[nodiscard]] std::string apply(std::string_view sql) const;

    [[nodiscard]] std::uint32_t row_cap() const noexcept { return row_cap_; }

private:
    std::uint32_t row_cap_;
};
