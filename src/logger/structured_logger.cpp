// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/json_util.hpp"

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

static spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

LogLevel log_level_from_string(std::string_view name) noexcept {
    if (name == "trace" || name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "warn") {
        return LogLevel::kWarn;
    }
    if (name == "error" || name == "critical" || name == "off") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
//   레지스트리에 등록하지 않는다. 같은 프로세스에서 여러 인스턴스
//   (테스트 픽스처 등) 가 이름 충돌 없이 공존해야 한다.
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>("csvgate.audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (본문은 각 메서드에서 JSON 으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

void StructuredLogger::write(LogLevel level, const std::string& json) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }
    logger_->log(to_spdlog_level(level), json);
}

// ---------------------------------------------------------------------------
// log_request: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_request(const RequestLog& entry) {
    std::ostringstream json;
    json << R"({"event":"request","request_id":)" << entry.request_id
         << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","client_port":)" << entry.client_port
         << R"(,"method":")" << escape_json_string(entry.method)
         << R"(","path":")" << escape_json_string(entry.path)
         << R"(","status":)" << entry.status
         << R"(,"response_bytes":)" << entry.response_bytes
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    write(LogLevel::kInfo, json.str());
}

// ---------------------------------------------------------------------------
// log_upload: JSON 직렬화
//   실패한 업로드는 warn 레벨
// ---------------------------------------------------------------------------
void StructuredLogger::log_upload(const UploadLog& entry) {
    const bool ok = entry.error.empty();

    std::ostringstream json;
    json << R"({"event":")" << (ok ? "upload" : "upload_failed")
         << R"(","request_id":)" << entry.request_id
         << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","filename":")" << escape_json_string(entry.filename)
         << R"(","bytes":)" << entry.bytes
         << R"(,"rows_loaded":)" << entry.rows_loaded;
    if (!ok) {
        json << R"(,"error":")" << escape_json_string(entry.error) << '"';
    }
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    write(ok ? LogLevel::kInfo : LogLevel::kWarn, json.str());
}

// ---------------------------------------------------------------------------
// log_query: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_query(const QueryLog& entry) {
    const bool ok = entry.error.empty();

    std::ostringstream json;
    json << R"({"event":")" << (ok ? "query" : "query_failed")
         << R"(","request_id":)" << entry.request_id
         << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","raw_sql":")" << escape_json_string(entry.raw_sql)
         << R"(","executed_sql":")" << escape_json_string(entry.executed_sql)
         << R"(","verb":")" << escape_json_string(entry.verb)
         << R"(","limited":)" << (entry.limited ? "true" : "false")
         << R"(,"row_count":)" << entry.row_count;
    if (!ok) {
        json << R"(,"error":")" << escape_json_string(entry.error) << '"';
    }
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    write(ok ? LogLevel::kInfo : LogLevel::kWarn, json.str());
}

// ---------------------------------------------------------------------------
// log_reject: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_reject(const RejectLog& entry) {
    std::ostringstream json;
    json << R"({"event":"query_rejected","request_id":)" << entry.request_id
         << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","raw_sql":")" << escape_json_string(entry.raw_sql)
         << R"(","rule":")" << escape_json_string(entry.rule)
         << R"(","reason":")" << escape_json_string(entry.reason)
         << R"(","matched":")" << escape_json_string(entry.matched)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    write(LogLevel::kWarn, json.str());
}
