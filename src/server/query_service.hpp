#pragma once

// ---------------------------------------------------------------------------
// query_service.hpp
//
// HTTP 요청 → 응답 변환 (라우팅, CORS, 오류 매핑).
// 소켓을 다루지 않는 순수 핸들러이므로 테스트에서 직접 호출할 수 있다.
//
// [오류 매핑]
//   Rejection       → 400 {"detail","reason","rule"}
//   ExecutionError  → 400 {"detail":"Query failed: ...","reason":"execution failed"}
//   LoadError       → 500 {"detail":"Failed to load CSV: ..."}
//   잘못된 본문      → 422 / 400 {"detail"}
//   없는 경로        → 404,  메서드 불일치 → 405 (Allow 헤더 포함)
//
// [스레드 안전성]
// - handle() 은 여러 워커 스레드에서 동시에 호출해도 안전하다.
//   공유 가변 상태는 TableBackend (내부 mutex) 와 health 상태 (atomic + mutex) 뿐이다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "engine/table_store.hpp"
#include "http/http_message.hpp"
#include "logger/structured_logger.hpp"
#include "policy/sandbox_policy.hpp"
#include "sandbox/sql_sandbox.hpp"
#include "stats/stats_collector.hpp"

// ---------------------------------------------------------------------------
// HealthStatus
//   kHealthy   : GET /health → 200
//   kUnhealthy : GET /health → 503 (종료 진행 중 등)
// ---------------------------------------------------------------------------
enum class HealthStatus : std::uint8_t {
    kHealthy   = 0,
    kUnhealthy = 1,
};

class QueryService {
public:
    // backend/logger/stats 는 nullptr 이면 안 된다 (std::invalid_argument).
    QueryService(const SandboxPolicy&              policy,
                 std::shared_ptr<TableBackend>     backend,
                 std::shared_ptr<StructuredLogger> logger,
                 std::shared_ptr<StatsCollector>   stats,
                 std::vector<std::string>          allowed_origins);

    ~QueryService() = default;

    QueryService(const QueryService&)            = delete;
    QueryService& operator=(const QueryService&) = delete;
    QueryService(QueryService&&)                 = delete;
    QueryService& operator=(QueryService&&)      = delete;

    // handle
    //   요청 하나를 처리한다. 예외를 던지지 않고 항상 응답을 반환한다.
    [[nodiscard]] HttpResponse handle(const HttpRequest& request, const RequestContext& ctx);

    void set_unhealthy(std::string_view reason);
    void set_healthy();
    [[nodiscard]] HealthStatus status() const noexcept;

    [[nodiscard]] const SqlSandbox& sandbox() const noexcept { return sandbox_; }

private:
    HttpResponse route(const HttpRequest& request, const RequestContext& ctx);

    HttpResponse handle_root() const;
    HttpResponse handle_health() const;
    HttpResponse handle_stats() const;
    HttpResponse handle_upload(const HttpRequest& request, const RequestContext& ctx);
    HttpResponse handle_query(const HttpRequest& request, const RequestContext& ctx);
    HttpResponse handle_preflight(const HttpRequest& request) const;

    [[nodiscard]] bool origin_allowed(std::string_view origin) const;
    void apply_cors(const HttpRequest& request, HttpResponse& response) const;

    SqlSandbox                        sandbox_;
    std::shared_ptr<TableBackend>     backend_;
    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<StatsCollector>   stats_;
    std::vector<std::string>          allowed_origins_;

    std::atomic<HealthStatus> status_{HealthStatus::kHealthy};
    mutable std::mutex        reason_mutex_;
    std::string               unhealthy_reason_{};
};
