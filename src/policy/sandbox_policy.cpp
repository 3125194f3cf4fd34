// ---------------------------------------------------------------------------
// sandbox_policy.cpp
//
// 기본 샌드박스 정책과 정책 유효성 검사.
//
// [금지 구문 목록]
//  file-read     : read_csv_auto, read_parquet, parquet_scan, httpfs
//  export-import : copy, export, import
//  extension     : attach, detach, install, load
//  introspection : pragma
//  procedure     : call
//  system        : system
//  ddl           : create table, drop table, alter, truncate
//
// [오탐/미탐 트레이드오프]
// - "load", "copy", "system" 은 컬럼명/문자열 리터럴로도 흔히 쓰이므로
//   false positive 가 발생한다. 보수적(차단 우선) 기본값을 유지한다.
// - "create   table" 처럼 공백이 여러 개여도 \s+ 로 매칭된다.
//   "create/**/table" 같은 주석 분할은 매칭되지 않는다 (알려진 한계).
// ---------------------------------------------------------------------------

#include "policy/sandbox_policy.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include <fmt/format.h>

SandboxPolicy make_default_sandbox_policy() {
    SandboxPolicy policy{};
    policy.forbidden_patterns = {
        {"read_csv_auto", R"(\bread_csv_auto\b)",  "file-read"},
        {"read_parquet",  R"(\bread_parquet\b)",   "file-read"},
        {"parquet_scan",  R"(\bparquet_scan\b)",   "file-read"},
        {"httpfs",        R"(\bhttpfs\b)",         "file-read"},
        {"copy",          R"(\bcopy\b)",           "export-import"},
        {"attach",        R"(\battach\b)",         "extension"},
        {"detach",        R"(\bdetach\b)",         "extension"},
        {"pragma",        R"(\bpragma\b)",         "introspection"},
        {"install",       R"(\binstall\b)",        "extension"},
        {"load",          R"(\bload\b)",           "extension"},
        {"export",        R"(\bexport\b)",         "export-import"},
        {"import",        R"(\bimport\b)",         "export-import"},
        {"create table",  R"(\bcreate\s+table\b)", "ddl"},
        {"drop table",    R"(\bdrop\s+table\b)",   "ddl"},
        {"alter",         R"(\balter\b)",          "ddl"},
        {"truncate",      R"(\btruncate\b)",       "ddl"},
        {"call",          R"(\bcall\b)",           "procedure"},
        {"system",        R"(\bsystem\b)",         "system"},
    };
    return policy;
}

std::expected<void, std::string> validate_policy(const SandboxPolicy& policy) {
    const auto& table = policy.allowed_table;
    if (table.empty()) {
        return std::unexpected(std::string("allowed_table must not be empty"));
    }
    const bool first_ok =
        std::isalpha(static_cast<unsigned char>(table.front())) != 0 || table.front() == '_';
    const bool rest_ok = std::all_of(table.begin(), table.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_';
    });
    if (!first_ok || !rest_ok) {
        return std::unexpected(
            fmt::format("allowed_table '{}' is not a plain identifier", table));
    }

    if (policy.allowed_verbs.empty()) {
        return std::unexpected(std::string("allowed_verbs must not be empty"));
    }

    if (policy.default_row_cap == 0) {
        return std::unexpected(std::string("default_row_cap must be positive"));
    }

    for (const auto& fp : policy.forbidden_patterns) {
        try {
            const std::regex re(fp.pattern, std::regex_constants::ECMAScript);
            (void)re;  // 컴파일만 확인
        } catch (const std::regex_error& e) {
            return std::unexpected(
                fmt::format("forbidden pattern '{}' is not a valid regex: {}", fp.name, e.what()));
        }
    }

    return {};
}

std::string_view verb_to_string(SqlVerb verb) noexcept {
    switch (verb) {
        case SqlVerb::kSelect: return "select";
        case SqlVerb::kInsert: return "insert";
        case SqlVerb::kUpdate: return "update";
        case SqlVerb::kDelete: return "delete";
    }
    return "unknown";
}

std::optional<SqlVerb> verb_from_string(std::string_view keyword) noexcept {
    if (keyword == "select") { return SqlVerb::kSelect; }
    if (keyword == "insert") { return SqlVerb::kInsert; }
    if (keyword == "update") { return SqlVerb::kUpdate; }
    if (keyword == "delete") { return SqlVerb::kDelete; }
    return std::nullopt;
}
