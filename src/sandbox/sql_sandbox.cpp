// ---------------------------------------------------------------------------
// sql_sandbox.cpp
//
// prepare(): 검증을 통과한 문장만 행 제한기로 넘긴다.
// limited 는 제한기가 문장을 실제로 바꿨는지로 판정한다.
// ---------------------------------------------------------------------------

#include "sandbox/sql_sandbox.hpp"

std::expected<PreparedStatement, Rejection> SqlSandbox::prepare(std::string_view sql) const {
    auto statement = validator_.validate(sql);
    if (!statement) {
        return std::unexpected(std::move(statement.error()));
    }

    PreparedStatement out;
    out.executable_sql = limiter_.apply(statement->text);
    out.limited        = (out.executable_sql != statement->text);
    out.statement      = std::move(*statement);
    return out;
}
