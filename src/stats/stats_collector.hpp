#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 실시간 통계 수집기. 헤더 전용 (atomic inline 구현).
// GET /api/stats 로 노출된다.
//
// [스레드 안전성]
// - on_* 갱신 메서드: 여러 워커 스레드에서 동시 호출 안전 (atomic).
// - snapshot(): mutex 없이 atomic 로드만 수행한다. 카운터 간 일관성은
//   보장하지 않는다 (예: total_queries 읽은 직후 rejected 가 증가할 수 있음).
//
// [격리 원칙]
// - 통계 갱신 실패가 요청 처리 실패로 전파되지 않도록 모든 갱신 메서드는
//   noexcept 이다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   qps        : 기동 이후 평균 초당 쿼리 수
//   reject_rate: rejected_queries / total_queries (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_requests{0};
    std::uint64_t                              active_connections{0};
    std::uint64_t                              uploads{0};
    std::uint64_t                              failed_uploads{0};
    std::uint64_t                              total_queries{0};
    std::uint64_t                              rejected_queries{0};
    std::uint64_t                              failed_queries{0};
    double                                     qps{0.0};
    double                                     reject_rate{0.0};
    double                                     uptime_sec{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

// ---------------------------------------------------------------------------
// QueryOutcome
//   쿼리 하나의 최종 결과 분류.
// ---------------------------------------------------------------------------
enum class QueryOutcome : std::uint8_t {
    kExecuted = 0,
    kRejected = 1,  // 검증 거부 (호출자 오류)
    kFailed   = 2,  // 엔진 실행 오류
};

class StatsCollector {
public:
    StatsCollector() noexcept
        : started_at_(std::chrono::steady_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    void on_connection_open() noexcept {
        active_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    // 0 아래로 내려가지 않는다 (open 없이 close 가 호출된 경우 방어).
    void on_connection_close() noexcept {
        std::uint64_t current = active_connections_.load(std::memory_order_relaxed);
        while (current > 0 &&
               !active_connections_.compare_exchange_weak(current, current - 1,
                                                          std::memory_order_relaxed)) {
        }
    }

    void on_request() noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_upload(bool success) noexcept {
        uploads_.fetch_add(1, std::memory_order_relaxed);
        if (!success) {
            failed_uploads_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void on_query(QueryOutcome outcome) noexcept {
        total_queries_.fetch_add(1, std::memory_order_relaxed);
        switch (outcome) {
            case QueryOutcome::kRejected:
                rejected_queries_.fetch_add(1, std::memory_order_relaxed);
                break;
            case QueryOutcome::kFailed:
                failed_queries_.fetch_add(1, std::memory_order_relaxed);
                break;
            case QueryOutcome::kExecuted:
                break;
        }
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto total_q    = total_queries_.load(std::memory_order_relaxed);
        const auto rejected_q = rejected_queries_.load(std::memory_order_relaxed);

        const double uptime = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started_at_).count();

        double qps = 0.0;
        if (uptime > 0.0) {
            qps = static_cast<double>(total_q) / uptime;
        }

        double reject_rate = 0.0;
        if (total_q > 0) {
            reject_rate = static_cast<double>(rejected_q) / static_cast<double>(total_q);
        }

        return StatsSnapshot{
            .total_requests     = total_requests_.load(std::memory_order_relaxed),
            .active_connections = active_connections_.load(std::memory_order_relaxed),
            .uploads            = uploads_.load(std::memory_order_relaxed),
            .failed_uploads     = failed_uploads_.load(std::memory_order_relaxed),
            .total_queries      = total_q,
            .rejected_queries   = rejected_q,
            .failed_queries     = failed_queries_.load(std::memory_order_relaxed),
            .qps                = qps,
            .reject_rate        = reject_rate,
            .uptime_sec         = uptime,
            .captured_at        = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> active_connections_{0};
    std::atomic<std::uint64_t> uploads_{0};
    std::atomic<std::uint64_t> failed_uploads_{0};
    std::atomic<std::uint64_t> total_queries_{0};
    std::atomic<std::uint64_t> rejected_queries_{0};
    std::atomic<std::uint64_t> failed_queries_{0};

    std::chrono::steady_clock::time_point started_at_;
};
