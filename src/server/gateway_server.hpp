#pragma once

#include "config/server_config.hpp"
#include "logger/structured_logger.hpp"
#include "server/query_service.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

// ---------------------------------------------------------------------------
// GatewayServer
//   TCP 리슨 → 연결별 HTTP 요청 1건 처리 → Graceful Shutdown 을 담당한다.
//
//   사용 예:
//     GatewayServer server(config, service, logger, stats);
//     server.run(io_ctx);   // io_ctx.run() 은 호출자가 (여러 스레드에서) 실행
//
//   연결 처리 흐름:
//     1. 헤더 블록 수신 ("\r\n\r\n" 까지, 상한 초과 시 431)
//     2. parse_request_head → 실패 시 400 / 501 / 505
//     3. Content-Length > max_body_bytes 이면 413
//     4. 본문 수신 → QueryService::handle → 응답 전송 → close
//   request_timeout_sec 안에 요청을 다 받지 못하면 408 후 close.
//
// [스레드 안전성]
// - 각 연결은 자신의 strand 위에서만 실행된다. 타이머 핸들러와
//   연결 코루틴이 같은 strand 를 공유하므로 소켓 접근이 직렬화된다.
// - stop() 은 어느 스레드에서 호출해도 안전하다.
//
// [알려진 한계]
// - keep-alive 를 지원하지 않는다. 모든 응답은 Connection: close.
// - chunked 요청 본문은 501 로 거부된다.
// ---------------------------------------------------------------------------
class GatewayServer {
public:
    GatewayServer(ServerConfig                      config,
                  std::shared_ptr<QueryService>     service,
                  std::shared_ptr<StructuredLogger> logger,
                  std::shared_ptr<StatsCollector>   stats);

    ~GatewayServer() = default;

    // 복사/이동 금지
    GatewayServer(const GatewayServer&)            = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;
    GatewayServer(GatewayServer&&)                 = delete;
    GatewayServer& operator=(GatewayServer&&)      = delete;

    // -----------------------------------------------------------------------
    // run
    //   리슨 소켓을 동기적으로 bind 한 뒤 accept 루프를 co_spawn 한다.
    //   bind 실패는 boost::system::system_error 로 호출자에게 전파된다.
    //   install_signals 가 true 면 SIGINT/SIGTERM 수신 시 stop() 을 호출한다.
    // -----------------------------------------------------------------------
    void run(boost::asio::io_context& io_ctx, bool install_signals = true);

    // -----------------------------------------------------------------------
    // stop
    //   새 연결 Accept 를 중단하고 health 를 unhealthy 로 전환한다.
    //   진행 중인 연결은 끝까지 처리된다. 모든 연결이 끝나면
    //   io_context 에 남은 작업이 없어 run() 이 반환된다.
    // -----------------------------------------------------------------------
    void stop();

    // 실제 bind 된 포트 (listen_port 0 으로 기동한 경우 조회용)
    [[nodiscard]] std::uint16_t bound_port() const noexcept { return bound_port_.load(); }

private:
    ServerConfig                      config_;
    std::shared_ptr<QueryService>     service_;
    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<StatsCollector>   stats_;

    boost::asio::io_context*                      io_ctx_{nullptr};
    std::optional<boost::asio::ip::tcp::acceptor> acceptor_{};
    std::optional<boost::asio::signal_set>        signals_{};

    std::atomic<bool>          stopping_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<std::uint64_t> next_request_id_{1};

    // accept_loop: TCP Accept 루프 코루틴
    boost::asio::awaitable<void> accept_loop();

    // handle_connection: 연결 하나를 처리하는 코루틴 (strand 위에서 실행)
    boost::asio::awaitable<void> handle_connection(boost::asio::ip::tcp::socket socket);
};
