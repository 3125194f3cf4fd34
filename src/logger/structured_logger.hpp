#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 한 이벤트 = JSON 객체 한 줄. 필드명은 snake_case.
// - 진단용 자유 형식 로그는 spdlog 기본 로거 (spdlog::info 등) 를 사용하고,
//   이 클래스는 감사 이벤트만 담당한다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   RequestLog / UploadLog / QueryLog / RejectLog 를 JSON 으로 기록한다.
//   sink: stdout + rotating file (100MB x 3)
//
//   [스레드 안전성]
//   - 모든 log_* 메서드는 여러 스레드에서 동시에 호출해도 안전하다 (_mt sink).
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   초기화 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    void log_request(const RequestLog& entry);
    void log_upload(const UploadLog& entry);

    // log_query
    //   [고빈도 호출 경로] const-ref 로 전달받아 복사를 줄인다.
    void log_query(const QueryLog& entry);

    // log_reject
    //   warn 레벨로 기록된다.
    void log_reject(const RejectLog& entry);

    // 모든 sink 즉시 flush (종료 직전 호출)
    void flush();

private:
    // 레벨 검사 후 JSON 한 줄 기록
    void write(LogLevel level, const std::string& json);

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
