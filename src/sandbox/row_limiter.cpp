// ---------------------------------------------------------------------------
// row_limiter.cpp
// ---------------------------------------------------------------------------

#include "sandbox/row_limiter.hpp"

#include <fmt/format.h>

#include "parser/sql_text.hpp"

std::string RowLimiter::apply(std::string_view sql) const {
    const std::string_view cleaned = strip_statement_terminator(sql);
    const std::string folded = fold_case(cleaned);

    if (leading_word(folded) != "select") {
        return std::string(sql);
    }
    if (contains_word(folded, "limit")) {
        return std::string(sql);
    }
    // 마지막 줄에 -- 주석이 있으면 닫는 괄호가 주석에 포함되지 않도록 줄을 바꾼다.
    const std::size_t last_line = cleaned.rfind('\n');
    const std::size_t line_start = (last_line == std::string_view::npos) ? 0 : last_line + 1;
    const bool trailing_comment = cleaned.find("--", line_start) != std::string_view::npos;
    return fmt::format("SELECT * FROM ({}{}) AS subquery LIMIT {}",
                       cleaned, trailing_comment ? "\n" : "", row_cap_);
}
