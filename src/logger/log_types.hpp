#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사 로그 이벤트 타입 정의.
//
// [순환 의존성 방지 설계]
// - SqlVerb, RuleId 를 직접 include 하지 않는다.
// - 호출자가 verb_to_string() / rule_name() 결과를 문자열로 채운다.
//
// [민감정보 취급 주의]
// - raw_sql 은 원문 SQL 전체를 포함한다. 업로드 내용(CSV 본문)은
//   어떤 로그에도 기록하지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   감사 로거의 최소 출력 레벨. config 의 logging.level 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "trace"/"debug" → kDebug, "warn" → kWarn, "error"/"critical"/"off" → kError,
// 그 외 → kInfo
[[nodiscard]] LogLevel log_level_from_string(std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// RequestLog
//   HTTP 요청 하나의 접근 로그. 응답 전송 후 기록된다.
// ---------------------------------------------------------------------------
struct RequestLog {
    std::uint64_t                              request_id{0};
    std::string                                client_ip{};
    std::uint16_t                              client_port{0};
    std::string                                method{};
    std::string                                path{};
    int                                        status{0};
    std::uint64_t                              response_bytes{0};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};
};

// ---------------------------------------------------------------------------
// UploadLog
//   CSV 업로드 결과. error 가 비어 있으면 성공.
// ---------------------------------------------------------------------------
struct UploadLog {
    std::uint64_t                              request_id{0};
    std::string                                client_ip{};
    std::string                                filename{};
    std::uint64_t                              bytes{0};
    std::uint64_t                              rows_loaded{0};
    std::string                                error{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};
};

// ---------------------------------------------------------------------------
// QueryLog
//   검증을 통과한 쿼리의 실행 결과.
//   executed_sql: RowLimiter 적용 후 엔진에 전달된 SQL
//   error: 실행 실패 시 엔진 메시지, 성공 시 빈 문자열
// ---------------------------------------------------------------------------
struct QueryLog {
    std::uint64_t                              request_id{0};
    std::string                                client_ip{};
    std::string                                raw_sql{};      // 원문 SQL (마스킹 주의)
    std::string                                executed_sql{};
    std::string                                verb{};         // "select" 등
    bool                                       limited{false};
    std::uint64_t                              row_count{0};
    std::string                                error{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 검증 + 실행 소요 시간
};

// ---------------------------------------------------------------------------
// RejectLog
//   검증 거부 이벤트.
//   rule: 규칙 이름 ("single-statement" 등)
//   matched: 금지 구문 규칙에서 매칭된 패턴 이름 (그 외 빈 문자열)
// ---------------------------------------------------------------------------
struct RejectLog {
    std::uint64_t                              request_id{0};
    std::string                                client_ip{};
    std::string                                raw_sql{};      // 원문 SQL (마스킹 주의)
    std::string                                rule{};
    std::string                                reason{};
    std::string                                matched{};
    std::chrono::system_clock::time_point      timestamp{};
};
