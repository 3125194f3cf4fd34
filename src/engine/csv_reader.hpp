#pragma once

// ---------------------------------------------------------------------------
// csv_reader.hpp
//
// 업로드된 CSV 바이트를 헤더 + 행 + 추론된 컬럼 타입으로 변환한다.
// 파일 시스템을 거치지 않고 메모리 상에서 처리한다.
//
// [지원 범위 (RFC 4180)]
// - ',' 구분자, '"' 인용, 인용 내부 "" 이스케이프, 인용 내부 개행
// - CRLF / LF 행 종료, 선행 UTF-8 BOM 제거
// - 완전히 빈 줄은 건너뛴다
//
// [알려진 한계]
// - 구분자 자동 감지 없음 (세미콜론/탭 CSV 는 한 컬럼으로 읽힌다).
// - 전체 내용을 메모리에 적재한다. 크기 제한은 HTTP 레이어 max_body_bytes.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // LoadError

// ---------------------------------------------------------------------------
// ColumnType
//   빈 값을 제외한 모든 값이 만족하는 가장 좁은 타입.
//   모든 값이 비어 있는 컬럼은 kVarchar.
// ---------------------------------------------------------------------------
enum class ColumnType : std::uint8_t {
    kBigint  = 0,
    kDouble  = 1,
    kBoolean = 2,
    kVarchar = 3,
};

// "BIGINT" / "DOUBLE" / "BOOLEAN" / "VARCHAR"
[[nodiscard]] std::string_view column_type_name(ColumnType type) noexcept;

// 셀 하나. std::nullopt = 인용되지 않은 빈 필드 (NULL 로 적재)
using CsvCell = std::optional<std::string>;

struct CsvTable {
    std::vector<std::string>          columns{};
    std::vector<ColumnType>           types{};
    std::vector<std::vector<CsvCell>> rows{};  // 각 행의 크기 == columns.size()
};

// parse_csv
//   실패 시 LoadError (kEmptyInput / kMalformedCsv).
[[nodiscard]] std::expected<CsvTable, LoadError> parse_csv(std::string_view data);

// 값 하나를 각 타입으로 해석한다. 타입 추론과 엔진 바인딩이 같은 규칙을 쓴다.
// 앞뒤 공백은 허용하지 않는다.
[[nodiscard]] std::optional<std::int64_t> parse_integer_literal(std::string_view value) noexcept;
[[nodiscard]] std::optional<double> parse_numeric_literal(std::string_view value) noexcept;
[[nodiscard]] std::optional<bool> parse_boolean_literal(std::string_view value) noexcept;
