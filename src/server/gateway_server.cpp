#include "server/gateway_server.hpp"

#include "http/http_message.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// GatewayServer 구현
//
// run() 흐름:
//   1. acceptor open/bind/listen (동기, 실패 시 예외 전파)
//   2. SIGTERM/SIGINT 핸들러 → stop()
//   3. accept 루프 co_spawn: 연결마다 새 strand 에서 handle_connection()
//
// stop() 흐름:
//   1. stopping_ = true (중복 호출 무시)
//   2. health → unhealthy
//   3. acceptor 실행자에서 acceptor.close() + signal 대기 취소
// ---------------------------------------------------------------------------

namespace {

using boost::asio::ip::tcp;

constexpr std::size_t kMaxHeadBytes = 64 * 1024;

// -----------------------------------------------------------------------
// ConnectionGuard
//   연결 수 통계를 open/close 쌍으로 유지한다.
// -----------------------------------------------------------------------
class ConnectionGuard {
public:
    explicit ConnectionGuard(StatsCollector& stats) noexcept : stats_{stats} {
        stats_.on_connection_open();
    }
    ~ConnectionGuard() { stats_.on_connection_close(); }

    ConnectionGuard(const ConnectionGuard&)            = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;
    ConnectionGuard(ConnectionGuard&&)                 = delete;
    ConnectionGuard& operator=(ConnectionGuard&&)      = delete;

private:
    StatsCollector& stats_;
};

int status_for_parse_error(const HttpParseError& error) noexcept {
    switch (error.code) {
        case HttpParseErrorCode::kUnsupportedTransferEncoding: return 501;
        case HttpParseErrorCode::kUnsupportedVersion:          return 505;
        case HttpParseErrorCode::kMalformedRequestLine:
        case HttpParseErrorCode::kMalformedHeader:
        case HttpParseErrorCode::kInvalidContentLength:        return 400;
    }
    return 400;
}

// -----------------------------------------------------------------------
// write_response
//   응답을 직렬화하여 전송한다. head_only 면 헤더 블록까지만 보낸다
//   (Content-Length 는 GET 과 동일하게 유지).
//   전송한 바이트 수를 반환한다. 쓰기 실패는 debug 로그만 남긴다.
// -----------------------------------------------------------------------
boost::asio::awaitable<std::size_t> write_response(tcp::socket&        socket,
                                                   const HttpResponse& response,
                                                   bool                head_only)
{
    std::string wire = response.serialize();
    if (head_only) {
        const auto head_end = wire.find("\r\n\r\n");
        if (head_end != std::string::npos) {
            wire.resize(head_end + 4);
        }
    }

    boost::system::error_code ec;
    const std::size_t written = co_await boost::asio::async_write(
        socket,
        boost::asio::buffer(wire),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );
    if (ec) {
        spdlog::debug("[server] write error: {}", ec.message());
    }
    co_return written;
}

void close_socket(tcp::socket& socket) noexcept {
    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}

}  // namespace

GatewayServer::GatewayServer(ServerConfig                      config,
                             std::shared_ptr<QueryService>     service,
                             std::shared_ptr<StructuredLogger> logger,
                             std::shared_ptr<StatsCollector>   stats)
    : config_{std::move(config)}
    , service_{std::move(service)}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
{
    if (!service_ || !logger_ || !stats_) {
        throw std::invalid_argument("GatewayServer: service, logger and stats are required");
    }
}

// ---------------------------------------------------------------------------
// GatewayServer::run
// ---------------------------------------------------------------------------
void GatewayServer::run(boost::asio::io_context& io_ctx, bool install_signals)
{
    const auto listen_addr = boost::asio::ip::make_address(config_.listen_address);
    const auto listen_ep   = tcp::endpoint{listen_addr, config_.listen_port};

    io_ctx_ = &io_ctx;

    // acceptor 는 자신의 strand 위에서만 조작된다 (stop() 의 close 와 직렬화)
    acceptor_.emplace(boost::asio::make_strand(io_ctx));
    acceptor_->open(listen_ep.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(listen_ep);
    acceptor_->listen();
    bound_port_.store(acceptor_->local_endpoint().port());

    spdlog::info("[server] listening on {}:{}", config_.listen_address, bound_port_.load());

    if (install_signals) {
        signals_.emplace(io_ctx, SIGTERM, SIGINT);
        signals_->async_wait(
            [this](const boost::system::error_code& ec, int signum) {
                if (!ec) {
                    spdlog::info("[server] shutdown signal received ({})", signum);
                    stop();
                }
            }
        );
    }

    boost::asio::co_spawn(
        acceptor_->get_executor(),
        accept_loop(),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[server] accept loop exception: {}", e.what());
                }
            }
        }
    );
}

// ---------------------------------------------------------------------------
// GatewayServer::stop
// ---------------------------------------------------------------------------
void GatewayServer::stop()
{
    if (stopping_.exchange(true)) {
        return;
    }

    spdlog::info("[server] stopping, active connections: {}",
                 stats_->snapshot().active_connections);

    // 로드밸런서 라우팅 제외
    service_->set_unhealthy("shutting down");

    if (!acceptor_) {
        return;
    }

    boost::asio::post(acceptor_->get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_->close(ec);
        if (signals_) {
            signals_->cancel(ec);
        }
    });
}

// ---------------------------------------------------------------------------
// GatewayServer::accept_loop
// ---------------------------------------------------------------------------
boost::asio::awaitable<void> GatewayServer::accept_loop()
{
    while (!stopping_.load()) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_->async_accept(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );

        if (ec) {
            if (ec == boost::asio::error::operation_aborted) {
                spdlog::info("[server] acceptor closed");
                break;
            }
            if (!stopping_.load()) {
                spdlog::warn("[server] accept error: {}", ec.message());
            }
            continue;
        }

        if (stopping_.load()) {
            // 이미 종료 중: 소켓 즉시 닫기
            close_socket(socket);
            continue;
        }

        // 연결마다 독립 strand: 타이머 핸들러와 연결 코루틴을 직렬화
        auto strand = boost::asio::make_strand(*io_ctx_);
        boost::asio::co_spawn(
            strand,
            handle_connection(std::move(socket)),
            [](std::exception_ptr eptr) {
                if (eptr) {
                    try { std::rethrow_exception(eptr); }
                    catch (const std::exception& e) {
                        spdlog::error("[server] connection exception: {}", e.what());
                    }
                }
            }
        );
    }
}

// ---------------------------------------------------------------------------
// GatewayServer::handle_connection
// ---------------------------------------------------------------------------
boost::asio::awaitable<void> GatewayServer::handle_connection(tcp::socket accepted)
{
    // 타이머 핸들러가 코루틴 종료 후 실행될 수 있으므로 소켓은 공유 소유
    const auto socket_ptr = std::make_shared<tcp::socket>(std::move(accepted));
    tcp::socket& socket   = *socket_ptr;

    const ConnectionGuard guard{*stats_};
    const auto started_at = std::chrono::steady_clock::now();

    RequestContext ctx{};
    ctx.request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
    {
        boost::system::error_code ep_ec;
        const auto remote = socket.remote_endpoint(ep_ec);
        if (!ep_ec) {
            ctx.client_ip   = remote.address().to_string();
            ctx.client_port = remote.port();
        }
    }

    // 요청 수신 제한 시간. 만료 시 대기 중인 읽기를 취소한다.
    const auto executor  = co_await boost::asio::this_coro::executor;
    auto       timed_out = std::make_shared<bool>(false);
    boost::asio::steady_timer deadline{executor};
    deadline.expires_after(std::chrono::seconds(config_.request_timeout_sec));
    deadline.async_wait([weak = std::weak_ptr<tcp::socket>(socket_ptr), timed_out](
                            const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto sock = weak.lock()) {
            *timed_out = true;
            boost::system::error_code ignored;
            sock->cancel(ignored);
        }
    });

    RequestLog entry{};
    entry.request_id  = ctx.request_id;
    entry.client_ip   = ctx.client_ip;
    entry.client_port = ctx.client_port;

    // 요청 처리 없이 종료하는 경로 공통: 오류 응답 전송 + 접근 로그
    auto respond = [&](const HttpResponse& response, bool head_only)
        -> boost::asio::awaitable<void> {
        deadline.cancel();
        entry.status         = response.status;
        entry.response_bytes = co_await write_response(socket, response, head_only);
        entry.timestamp      = std::chrono::system_clock::now();
        entry.duration       = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started_at);
        logger_->log_request(entry);
        close_socket(socket);
    };

    // -----------------------------------------------------------------------
    // 1. 헤더 블록
    // -----------------------------------------------------------------------
    std::string buffer;
    boost::system::error_code ec;
    const std::size_t head_bytes = co_await boost::asio::async_read_until(
        socket,
        boost::asio::dynamic_buffer(buffer, kMaxHeadBytes),
        "\r\n\r\n",
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );

    if (ec) {
        if (*timed_out) {
            co_await respond(make_error_response(408, "Request timed out"), false);
        } else if (ec == boost::asio::error::not_found) {
            co_await respond(make_error_response(431, "Request header too large"), false);
        } else {
            // 요청 없이 끊긴 연결 (헬스 프로브의 TCP connect 등)
            spdlog::debug("[server] request {} read error: {}", ctx.request_id, ec.message());
            deadline.cancel();
            close_socket(socket);
        }
        co_return;
    }

    ctx.received_at = std::chrono::system_clock::now();

    auto parsed = parse_request_head(std::string_view{buffer}.substr(0, head_bytes - 4));
    if (!parsed) {
        spdlog::debug("[server] request {} malformed head: {}",
                      ctx.request_id, parsed.error().message);
        co_await respond(make_error_response(status_for_parse_error(parsed.error()),
                                             parsed.error().message),
                         false);
        co_return;
    }

    HttpRequest request = std::move(*parsed);
    entry.method = request.method;
    entry.path   = request.path;
    const bool head_only = (request.method == "HEAD");

    if (request.content_length > config_.max_body_bytes) {
        co_await respond(make_error_response(413, "Request body too large"), head_only);
        co_return;
    }

    // -----------------------------------------------------------------------
    // 2. 본문
    // -----------------------------------------------------------------------
    const auto expect = request.header("expect");
    if (expect && request.content_length > 0) {
        std::string lowered{*expect};
        for (auto& c : lowered) {
            if (c >= 'A' && c <= 'Z') { c = static_cast<char>(c - 'A' + 'a'); }
        }
        if (lowered == "100-continue") {
            static constexpr std::string_view kContinue = "HTTP/1.1 100 Continue\r\n\r\n";
            co_await boost::asio::async_write(
                socket,
                boost::asio::buffer(kContinue.data(), kContinue.size()),
                boost::asio::redirect_error(boost::asio::use_awaitable, ec)
            );
            if (ec) {
                spdlog::debug("[server] request {} 100-continue write error: {}",
                              ctx.request_id, ec.message());
                deadline.cancel();
                close_socket(socket);
                co_return;
            }
        }
    }

    const auto content_length = static_cast<std::size_t>(request.content_length);
    request.body = buffer.substr(head_bytes);
    if (request.body.size() > content_length) {
        // 파이프라이닝된 후속 요청은 처리하지 않는다
        request.body.resize(content_length);
    } else if (request.body.size() < content_length) {
        const std::size_t have = request.body.size();
        request.body.resize(content_length);
        co_await boost::asio::async_read(
            socket,
            boost::asio::buffer(request.body.data() + have, content_length - have),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );
        if (ec) {
            if (*timed_out) {
                co_await respond(make_error_response(408, "Request timed out"), head_only);
            } else {
                spdlog::debug("[server] request {} body read error: {}",
                              ctx.request_id, ec.message());
                deadline.cancel();
                close_socket(socket);
            }
            co_return;
        }
    }
    deadline.cancel();

    // -----------------------------------------------------------------------
    // 3. 처리 + 응답
    // -----------------------------------------------------------------------
    const HttpResponse response = service_->handle(request, ctx);
    co_await respond(response, head_only);
}
