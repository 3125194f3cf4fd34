// ---------------------------------------------------------------------------
// statement_validator.cpp
//
// [CompiledPattern 보관 방식]
// 헤더에서 전방 선언만 하므로 shared_ptr<const vector<CompiledPattern>> 로
// 보관한다. shared_ptr 은 소멸자를 생성 지점에서 캡처하므로
// 헤더의 = default 소멸자가 불완전 타입에서도 컴파일된다.
// 검증기를 복사해도 정규식은 다시 컴파일되지 않는다.
// ---------------------------------------------------------------------------

#include "sandbox/statement_validator.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <regex>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

struct StatementValidator::CompiledPattern {
    std::string name;
    std::string category;
    std::regex  re;
};

namespace {

std::string upper_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::size_t skip_spaces(std::string_view s, std::size_t pos) noexcept {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])) != 0) {
        ++pos;
    }
    return pos;
}

// s[pos..] 가 word 로 시작하고 바로 뒤가 단어 경계인지
bool word_at(std::string_view s, std::size_t pos, std::string_view word) noexcept {
    if (s.substr(pos, word.size()) != word) {
        return false;
    }
    const std::size_t end = pos + word.size();
    return end == s.size() || !is_word_char(s[end]);
}

// folded 가 tokens 순서대로 시작하는지 확인한다.
// 토큰 사이에는 공백이 하나 이상 있어야 하고 마지막 토큰 뒤는 단어 경계.
// 정규식 ^t0\s+t1\s+t2\b 와 동일하다.
bool starts_with_sequence(std::string_view folded, std::initializer_list<std::string_view> tokens) {
    std::size_t pos = 0;
    bool first = true;
    for (const auto token : tokens) {
        if (!first) {
            const std::size_t after = skip_spaces(folded, pos);
            if (after == pos) {
                return false;
            }
            pos = after;
        }
        if (!word_at(folded, pos, token)) {
            return false;
        }
        pos += token.size();
        first = false;
    }
    return true;
}

// open 위치의 '(' 와 짝이 맞는 ')' 위치. 작은따옴표 문자열 안의 괄호는 무시한다.
std::size_t find_closing_paren(std::string_view s, std::size_t open) noexcept {
    int depth = 0;
    bool in_string = false;
    for (std::size_t i = open; i < s.size(); ++i) {
        const char c = s[i];
        if (in_string) {
            in_string = (c != '\'');
            continue;
        }
        if (c == '\'') {
            in_string = true;
        } else if (c == '(') {
            ++depth;
        } else if (c == ')' && --depth == 0) {
            return i;
        }
    }
    return std::string_view::npos;
}

// 테이블 / 서브쿼리 뒤의 [as] alias 를 건너뛴다.
// alias 는 식별자 또는 "..", `..`, [..] 로 감싼 이름. 뒤의 공백까지 건너뛴 위치를 반환한다.
// 별칭 자리에 where / order 같은 키워드가 와도 ',' 판정에는 영향이 없다.
std::size_t skip_alias(std::string_view s, std::size_t pos) noexcept {
    pos = skip_spaces(s, pos);
    if (word_at(s, pos, "as")) {
        pos = skip_spaces(s, pos + 2);
    }
    if (pos >= s.size()) {
        return pos;
    }
    const char c = s[pos];
    if (is_word_char(c)) {
        while (pos < s.size() && is_word_char(s[pos])) {
            ++pos;
        }
    } else if (c == '"' || c == '`' || c == '[') {
        const char close = (c == '[') ? ']' : c;
        const std::size_t end = s.find(close, pos + 1);
        pos = (end == std::string_view::npos) ? s.size() : end + 1;
    }
    return skip_spaces(s, pos);
}

std::string describe_verbs(const std::vector<SqlVerb>& verbs) {
    std::string out;
    for (std::size_t i = 0; i < verbs.size(); ++i) {
        if (i > 0) {
            out += (i + 1 == verbs.size()) ? " and " : ", ";
        }
        out += upper_ascii(verb_to_string(verbs[i]));
    }
    return out;
}

}  // namespace

std::string_view rule_name(RuleId id) noexcept {
    switch (id) {
        case RuleId::kNotEmpty:              return "not-empty";
        case RuleId::kSingleStatement:       return "single-statement";
        case RuleId::kAllowedVerb:           return "allowed-verb";
        case RuleId::kNoFilesystemAccess:    return "no-filesystem-access";
        case RuleId::kNoForbiddenConstruct:  return "no-forbidden-construct";
        case RuleId::kNoJoin:                return "no-join";
        case RuleId::kManagedTableReference: return "managed-table-reference";
        case RuleId::kVerbTarget:            return "verb-target";
    }
    return "unknown";
}

std::string_view rule_reason(RuleId id) noexcept {
    switch (id) {
        case RuleId::kNotEmpty:              return "empty query";
        case RuleId::kSingleStatement:       return "multiple statements not allowed";
        case RuleId::kAllowedVerb:           return "verb not allowed";
        case RuleId::kNoFilesystemAccess:    return "filesystem access not allowed";
        case RuleId::kNoForbiddenConstruct:  return "disallowed command or function";
        case RuleId::kNoJoin:                return "JOIN not allowed";
        case RuleId::kManagedTableReference: return "must reference the managed table";
        case RuleId::kVerbTarget:            return "can only operate on the managed table";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// 생성자
//   정책 검증 실패는 프로세스 시작 단계의 설정 오류이므로 예외로 알린다.
//   패턴 하나라도 컴파일되지 않으면 검증기를 만들지 않는다 (fail-close).
// ---------------------------------------------------------------------------
StatementValidator::StatementValidator(SandboxPolicy policy)
    : policy_(std::move(policy))
{
    if (auto ok = validate_policy(policy_); !ok) {
        throw std::invalid_argument("invalid sandbox policy: " + ok.error());
    }

    auto compiled = std::make_shared<std::vector<CompiledPattern>>();
    compiled->reserve(policy_.forbidden_patterns.size());
    for (const auto& fp : policy_.forbidden_patterns) {
        compiled->push_back(CompiledPattern{
            fp.name,
            fp.category,
            std::regex(fp.pattern, std::regex_constants::ECMAScript | std::regex_constants::optimize),
        });
    }
    forbidden_ = std::move(compiled);

    spdlog::debug("[validator] table='{}' verbs={} forbidden_patterns={} row_cap={}",
                  policy_.allowed_table,
                  policy_.allowed_verbs.size(),
                  forbidden_->size(),
                  policy_.default_row_cap);
}

const std::vector<RuleId>& StatementValidator::rule_order() {
    static const std::vector<RuleId> kOrder = {
        RuleId::kNotEmpty,
        RuleId::kSingleStatement,
        RuleId::kAllowedVerb,
        RuleId::kNoFilesystemAccess,
        RuleId::kNoForbiddenConstruct,
        RuleId::kNoJoin,
        RuleId::kManagedTableReference,
        RuleId::kVerbTarget,
    };
    return kOrder;
}

std::expected<Statement, Rejection> StatementValidator::validate(std::string_view sql) const {
    const NormalizedSql normalized = normalize_sql(sql);

    for (const auto id : rule_order()) {
        if (auto rejection = run_rule(id, normalized)) {
            return std::unexpected(std::move(*rejection));
        }
    }

    // kAllowedVerb 를 통과했으므로 선두 단어는 반드시 허용 키워드다.
    const auto verb = verb_from_string(leading_word(normalized.folded));
    return Statement{
        normalized.text,
        normalized.folded,
        verb.value_or(SqlVerb::kSelect),
    };
}

std::optional<Rejection> StatementValidator::check_rule(RuleId id, std::string_view sql) const {
    return run_rule(id, normalize_sql(sql));
}

std::optional<Rejection> StatementValidator::run_rule(RuleId id, const NormalizedSql& sql) const {
    switch (id) {
        case RuleId::kNotEmpty:              return check_not_empty(sql);
        case RuleId::kSingleStatement:       return check_single_statement(sql);
        case RuleId::kAllowedVerb:           return check_allowed_verb(sql);
        case RuleId::kNoFilesystemAccess:    return check_filesystem_access(sql);
        case RuleId::kNoForbiddenConstruct:  return check_forbidden_construct(sql);
        case RuleId::kNoJoin:                return check_join(sql);
        case RuleId::kManagedTableReference: return check_table_reference(sql);
        case RuleId::kVerbTarget:            return check_verb_target(sql);
    }
    // 알 수 없는 규칙 ID 는 거부 (fail-close)
    return make_rejection(RuleId::kNotEmpty, "Unknown validation rule.");
}

Rejection StatementValidator::make_rejection(RuleId id, std::string detail) const {
    Rejection r;
    r.rule   = id;
    r.reason = std::string(rule_reason(id));
    r.detail = std::move(detail);
    return r;
}

std::optional<Rejection> StatementValidator::check_not_empty(const NormalizedSql& sql) const {
    if (sql.empty) {
        return make_rejection(RuleId::kNotEmpty, "SQL query cannot be empty.");
    }
    return std::nullopt;
}

std::optional<Rejection> StatementValidator::check_single_statement(const NormalizedSql& sql) const {
    if (sql.folded.find(';') != std::string::npos) {
        return make_rejection(
            RuleId::kSingleStatement,
            "Multiple SQL statements are not allowed. Please run one statement at a time.");
    }
    return std::nullopt;
}

std::optional<Rejection> StatementValidator::check_allowed_verb(const NormalizedSql& sql) const {
    const auto verb = verb_from_string(leading_word(sql.folded));
    const bool allowed =
        verb.has_value() &&
        std::find(policy_.allowed_verbs.begin(), policy_.allowed_verbs.end(), *verb)
            != policy_.allowed_verbs.end();
    if (!allowed) {
        return make_rejection(
            RuleId::kAllowedVerb,
            fmt::format("Only {} statements are allowed.", describe_verbs(policy_.allowed_verbs)));
    }
    return std::nullopt;
}

std::optional<Rejection> StatementValidator::check_filesystem_access(const NormalizedSql& sql) const {
    if (sql.folded.find("/etc/") != std::string::npos ||
        sql.folded.find("..") != std::string::npos) {
        return make_rejection(RuleId::kNoFilesystemAccess, "File system access is not allowed.");
    }
    return std::nullopt;
}

std::optional<Rejection> StatementValidator::check_forbidden_construct(const NormalizedSql& sql) const {
    for (const auto& cp : *forbidden_) {
        if (std::regex_search(sql.folded, cp.re)) {
            auto r = make_rejection(RuleId::kNoForbiddenConstruct,
                                    "This query uses a disallowed command or function.");
            r.matched = cp.name;
            return r;
        }
    }
    return std::nullopt;
}

std::optional<Rejection> StatementValidator::check_join(const NormalizedSql& sql) const {
    if (contains_word(sql.folded, "join")) {
        return make_rejection(
            RuleId::kNoJoin,
            fmt::format("JOIN is not allowed. You can only work with the '{}' table.",
                        policy_.allowed_table));
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// check_table_reference
//   from 이 나올 때마다 바로 뒤를 확인한다.
//     from ( select ... )  → 서브쿼리. 내부 from 은 루프에서 다시 검사된다.
//                            닫는 괄호 뒤 [as] alias 다음에 ',' 가 오면 거부
//     from ( 그 외         → 거부 (괄호로 감싼 임의 테이블 이름)
//     from <table>         → 허용. [as] alias 다음에 ',' 가 오면 다중 테이블이므로 거부
//     그 외                → 거부
// ---------------------------------------------------------------------------
std::optional<Rejection> StatementValidator::check_table_reference(const NormalizedSql& sql) const {
    const std::string_view folded = sql.folded;
    const std::string_view table  = policy_.allowed_table;
    const std::string table_lower = fold_case(table);

    const auto reject = [&] {
        return make_rejection(
            RuleId::kManagedTableReference,
            fmt::format("You can only access the '{}' table loaded from your CSV.", table));
    };

    std::size_t pos = folded.find("from");
    while (pos != std::string_view::npos) {
        const std::size_t end = pos + 4;
        const bool is_word = (pos == 0 || !is_word_char(folded[pos - 1])) &&
                             (end == folded.size() || !is_word_char(folded[end]));
        if (is_word) {
            const std::size_t target = skip_spaces(folded, end);
            std::size_t after = std::string_view::npos;
            if (target < folded.size() && folded[target] == '(') {
                if (!word_at(folded, skip_spaces(folded, target + 1), "select")) {
                    return reject();
                }
                const std::size_t close = find_closing_paren(folded, target);
                if (close == std::string_view::npos) {
                    return reject();
                }
                after = skip_alias(folded, close + 1);
            } else {
                if (target == end || !word_at(folded, target, table_lower)) {
                    return reject();
                }
                after = skip_alias(folded, target + table_lower.size());
            }
            if (after < folded.size() && folded[after] == ',') {
                return reject();
            }
        }
        pos = folded.find("from", end);
    }
    return std::nullopt;
}

std::optional<Rejection> StatementValidator::check_verb_target(const NormalizedSql& sql) const {
    const std::string_view folded = sql.folded;
    const std::string table_lower = fold_case(policy_.allowed_table);
    const auto verb = verb_from_string(leading_word(folded));
    if (!verb) {
        return std::nullopt;
    }

    std::string detail;
    switch (*verb) {
        case SqlVerb::kSelect:
            return std::nullopt;
        case SqlVerb::kUpdate:
            if (starts_with_sequence(folded, {"update", table_lower})) {
                return std::nullopt;
            }
            detail = fmt::format("You can only UPDATE the '{}' table.", policy_.allowed_table);
            break;
        case SqlVerb::kDelete:
            if (starts_with_sequence(folded, {"delete", "from", table_lower})) {
                return std::nullopt;
            }
            detail = fmt::format("You can only DELETE from the '{}' table.", policy_.allowed_table);
            break;
        case SqlVerb::kInsert:
            if (starts_with_sequence(folded, {"insert", "into", table_lower})) {
                return std::nullopt;
            }
            detail = fmt::format("You can only INSERT into the '{}' table.", policy_.allowed_table);
            break;
    }

    auto r = make_rejection(RuleId::kVerbTarget, std::move(detail));
    r.verb = verb;
    return r;
}
