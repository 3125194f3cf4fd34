#include "config/config_loader.hpp"
#include "engine/table_store.hpp"
#include "logger/structured_logger.hpp"
#include "policy/sandbox_policy.hpp"
#include "server/gateway_server.hpp"
#include "server/query_service.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 설정 로드 (YAML → 환경변수 덮어쓰기 → 검증) ─────────────────────
    const std::string config_path = env_str("CSVGATE_CONFIG", "config/csvgate.yaml");

    auto loaded = ConfigLoader::load_or_default(config_path);
    if (!loaded) {
        spdlog::critical("config load failed: {}", loaded.error());
        return EXIT_FAILURE;
    }
    ServerConfig config = std::move(*loaded);
    ConfigLoader::apply_env_overrides(config);

    if (auto valid = ConfigLoader::validate(config); !valid) {
        spdlog::critical("invalid config: {}", valid.error());
        return EXIT_FAILURE;
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("Starting csvgate server");
    spdlog::info("Config: {}", config_path);
    spdlog::info("Listen: {}:{}", config.listen_address, config.listen_port);
    spdlog::info("Database: {}", config.db_path);
    spdlog::info("Worker threads: {}", config.worker_threads);
    spdlog::info("Log level: {}", config.log_level);

    // ── 저장소 / 로거 / 서비스 생성 ────────────────────────────────────
    const SandboxPolicy policy = make_default_sandbox_policy();

    auto store = SqliteTableStore::open(config.db_path, policy.allowed_table);
    if (!store) {
        spdlog::critical("database open failed: {}", store.error());
        return EXIT_FAILURE;
    }
    std::shared_ptr<TableBackend> backend = std::move(*store);

    std::shared_ptr<StructuredLogger> logger;
    try {
        logger = std::make_shared<StructuredLogger>(
            log_level_from_string(config.log_level), config.log_path);
    } catch (const std::exception& e) {
        spdlog::critical("audit logger init failed: {}", e.what());
        return EXIT_FAILURE;
    }

    auto stats   = std::make_shared<StatsCollector>();
    auto service = std::make_shared<QueryService>(
        policy, backend, logger, stats, config.allowed_origins);

    // ── GatewayServer 생성 및 실행 ──────────────────────────────────────
    const auto worker_threads = static_cast<int>(config.worker_threads);
    boost::asio::io_context ioc{worker_threads};
    GatewayServer server{config, service, logger, stats};
    try {
        server.run(ioc);
    } catch (const boost::system::system_error& e) {
        spdlog::critical("listen on {}:{} failed: {}",
                         config.listen_address, config.listen_port, e.what());
        return EXIT_FAILURE;
    }

    std::vector<std::thread> workers;
    workers.reserve(config.worker_threads > 0 ? config.worker_threads - 1 : 0);
    for (std::uint32_t i = 1; i < config.worker_threads; ++i) {
        workers.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();
    for (auto& worker : workers) {
        worker.join();
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    logger->flush();
    spdlog::info("csvgate server stopped");

    return EXIT_SUCCESS;
}
