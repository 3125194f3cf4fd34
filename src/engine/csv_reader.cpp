// ---------------------------------------------------------------------------
// csv_reader.cpp
//
// 상태 기계 기반 CSV 레코드 분리 + 컬럼 타입 추론.
//
// [헤더 정규화]
// - 이름 앞뒤 공백 제거
// - 빈 이름 → column<N> (N 은 1부터 시작하는 컬럼 위치)
// - 중복 이름 → 두 번째부터 _<N> 접미사 (대소문자 무시 비교, SQLite 식별자 규칙)
// ---------------------------------------------------------------------------

#include "engine/csv_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <set>
#include <system_error>

#include <fmt/format.h>

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

// 레코드 하나를 구성하는 필드. quoted 는 빈 문자열과 NULL 을 구분하기 위함.
struct RawField {
    std::string value;
    bool        quoted{false};
};

using RawRecord = std::vector<RawField>;

// ---------------------------------------------------------------------------
// split_records
//   data 전체를 레코드 목록으로 분리한다.
//   line 은 오류 메시지용 1-based 물리 행 번호.
// ---------------------------------------------------------------------------
std::expected<std::vector<std::pair<std::size_t, RawRecord>>, LoadError>
split_records(std::string_view data) {
    std::vector<std::pair<std::size_t, RawRecord>> records;

    RawRecord   record;
    RawField    field;
    bool        in_quotes      = false;
    bool        field_started  = false;  // 현재 레코드에 내용이 있었는지
    std::size_t line           = 1;
    std::size_t record_line    = 1;
    std::size_t quote_line     = 0;

    const auto end_field = [&] {
        record.push_back(std::move(field));
        field = RawField{};
    };
    const auto end_record = [&] {
        // 완전히 빈 줄은 레코드로 취급하지 않는다.
        if (field_started || !record.empty()) {
            end_field();
            records.emplace_back(record_line, std::move(record));
            record = RawRecord{};
        }
        field         = RawField{};
        field_started = false;
    };

    for (std::size_t i = 0; i < data.size(); ++i) {
        const char c = data[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < data.size() && data[i + 1] == '"') {
                    field.value.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field.value.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (!field.value.empty() || field.quoted) {
                    return std::unexpected(LoadError{
                        LoadErrorCode::kMalformedCsv,
                        fmt::format("unexpected quote inside unquoted field on line {}", line),
                        fmt::format("line={}", line)});
                }
                if (!field_started) {
                    record_line = line;
                }
                in_quotes     = true;
                field.quoted  = true;
                field_started = true;
                quote_line    = line;
                break;
            case ',':
                if (!field_started) {
                    record_line = line;
                }
                field_started = true;
                end_field();
                break;
            case '\r':
                if (i + 1 < data.size() && data[i + 1] == '\n') {
                    break;  // CRLF 는 '\n' 에서 처리
                }
                end_record();
                ++line;
                break;
            case '\n':
                end_record();
                ++line;
                break;
            default:
                if (field.quoted) {
                    return std::unexpected(LoadError{
                        LoadErrorCode::kMalformedCsv,
                        fmt::format("unexpected character after closing quote on line {}", line),
                        fmt::format("line={}", line)});
                }
                if (!field_started) {
                    record_line = line;
                }
                field_started = true;
                field.value.push_back(c);
                break;
        }
    }

    if (in_quotes) {
        return std::unexpected(LoadError{
            LoadErrorCode::kMalformedCsv,
            fmt::format("unterminated quoted field starting on line {}", quote_line),
            fmt::format("line={}", quote_line)});
    }
    end_record();

    return records;
}

std::string_view trim_field(std::string_view s) noexcept {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(static_cast<std::size_t>(begin - s.begin()),
                    static_cast<std::size_t>(end - begin));
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> normalize_header(const RawRecord& header) {
    std::vector<std::string> columns;
    columns.reserve(header.size());
    std::set<std::string> seen;

    for (std::size_t i = 0; i < header.size(); ++i) {
        std::string base(trim_field(header[i].value));
        if (base.empty()) {
            base = fmt::format("column{}", i + 1);
        }
        std::string name = base;
        for (std::size_t n = 1; seen.contains(lower(name)); ++n) {
            name = fmt::format("{}_{}", base, n);
        }
        seen.insert(lower(name));
        columns.push_back(std::move(name));
    }
    return columns;
}

// 후보 타입을 값 하나로 좁힌다. BIGINT ⊂ DOUBLE, BOOLEAN 은 별도 계열.
ColumnType narrow(ColumnType current, std::string_view value) {
    switch (current) {
        case ColumnType::kBigint:
            if (parse_integer_literal(value)) { return ColumnType::kBigint; }
            return parse_numeric_literal(value) ? ColumnType::kDouble : ColumnType::kVarchar;
        case ColumnType::kDouble:
            return parse_numeric_literal(value) ? ColumnType::kDouble : ColumnType::kVarchar;
        case ColumnType::kBoolean:
            return parse_boolean_literal(value).has_value() ? ColumnType::kBoolean
                                                            : ColumnType::kVarchar;
        case ColumnType::kVarchar:
            return ColumnType::kVarchar;
    }
    return ColumnType::kVarchar;
}

ColumnType initial_type(std::string_view value) {
    if (parse_integer_literal(value)) { return ColumnType::kBigint; }
    if (parse_numeric_literal(value)) { return ColumnType::kDouble; }
    if (parse_boolean_literal(value)) { return ColumnType::kBoolean; }
    return ColumnType::kVarchar;
}

}  // namespace

std::string_view column_type_name(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::kBigint:  return "BIGINT";
        case ColumnType::kDouble:  return "DOUBLE";
        case ColumnType::kBoolean: return "BOOLEAN";
        case ColumnType::kVarchar: return "VARCHAR";
    }
    return "VARCHAR";
}

std::optional<std::int64_t> parse_integer_literal(std::string_view value) noexcept {
    const bool plus = value.starts_with('+');
    const std::string_view body = plus ? value.substr(1) : value;
    if (body.empty() || (plus && body.front() == '-')) {
        return std::nullopt;
    }
    std::int64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), parsed);
    if (ec != std::errc{} || ptr != body.data() + body.size()) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> parse_numeric_literal(std::string_view value) noexcept {
    const bool negative = value.starts_with('-');
    std::string_view body = value;
    if (negative || value.starts_with('+')) {
        body.remove_prefix(1);
    }
    // from_chars 는 "inf"/"nan" 도 받아들이므로 숫자 또는 '.' 시작만 허용
    if (body.empty() ||
        !(std::isdigit(static_cast<unsigned char>(body.front())) != 0 || body.front() == '.')) {
        return std::nullopt;
    }
    double parsed = 0.0;
    const auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), parsed);
    if (ec != std::errc{} || ptr != body.data() + body.size()) {
        return std::nullopt;
    }
    return negative ? -parsed : parsed;
}

std::optional<bool> parse_boolean_literal(std::string_view value) noexcept {
    if (value.size() == 4 &&
        std::equal(value.begin(), value.end(), "true", [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        })) {
        return true;
    }
    if (value.size() == 5 &&
        std::equal(value.begin(), value.end(), "false", [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        })) {
        return false;
    }
    return std::nullopt;
}

std::expected<CsvTable, LoadError> parse_csv(std::string_view data) {
    if (data.starts_with(kUtf8Bom)) {
        data.remove_prefix(kUtf8Bom.size());
    }

    auto records = split_records(data);
    if (!records) {
        return std::unexpected(std::move(records.error()));
    }
    if (records->empty()) {
        return std::unexpected(LoadError{
            LoadErrorCode::kEmptyInput, "CSV file is empty", ""});
    }

    CsvTable table;
    table.columns = normalize_header(records->front().second);
    const std::size_t width = table.columns.size();

    std::vector<std::optional<ColumnType>> candidates(width);
    table.rows.reserve(records->size() - 1);

    for (std::size_t r = 1; r < records->size(); ++r) {
        auto& [line, record] = (*records)[r];
        if (record.size() > width) {
            return std::unexpected(LoadError{
                LoadErrorCode::kMalformedCsv,
                fmt::format("row on line {} has {} fields but the header has {}",
                            line, record.size(), width),
                fmt::format("line={}", line)});
        }

        std::vector<CsvCell> row(width);
        for (std::size_t c = 0; c < record.size(); ++c) {
            auto& field = record[c];
            if (field.value.empty() && !field.quoted) {
                continue;  // NULL
            }
            auto& cand = candidates[c];
            cand = cand ? narrow(*cand, field.value) : initial_type(field.value);
            row[c] = std::move(field.value);
        }
        table.rows.push_back(std::move(row));
    }

    table.types.reserve(width);
    for (const auto& cand : candidates) {
        table.types.push_back(cand.value_or(ColumnType::kVarchar));
    }
    return table;
}
