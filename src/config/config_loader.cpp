// ---------------------------------------------------------------------------
// config_loader.cpp
//
// config/csvgate.yaml 형식:
//
//   server:
//     listen_address: "0.0.0.0"
//     listen_port: 8000
//     worker_threads: 1
//     max_body_bytes: 67108864
//     request_timeout_sec: 30
//     allowed_origins: ["http://localhost:5173"]
//   storage:
//     db_path: "data/db.sqlite"
//   logging:
//     path: "/tmp/csvgate.log"
//     level: "info"
//
// [알려진 한계]
// - 알 수 없는 키는 무시한다 (오타 키는 경고 없이 기본값 적용).
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 스칼라 읽기. 노드가 없으면 fallback.
// 변환 실패는 YAML::TypedBadConversion 을 그대로 던진다 (섹션 단위로 잡힘).
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] T read_scalar(const YAML::Node& node, const T& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<T>();
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node,
                                                            const std::vector<std::string>& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsSequence()) {
        throw YAML::RepresentationException(node.Mark(), "expected a sequence of strings");
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (const auto& item : node) {
        result.push_back(item.as<std::string>());
    }
    return result;
}

void parse_server(const YAML::Node& node, ServerConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.listen_address      = read_scalar(node["listen_address"], cfg.listen_address);
    cfg.listen_port         = read_scalar(node["listen_port"], cfg.listen_port);
    cfg.worker_threads      = read_scalar(node["worker_threads"], cfg.worker_threads);
    cfg.max_body_bytes      = read_scalar(node["max_body_bytes"], cfg.max_body_bytes);
    cfg.request_timeout_sec = read_scalar(node["request_timeout_sec"], cfg.request_timeout_sec);
    cfg.allowed_origins     = read_string_sequence(node["allowed_origins"], cfg.allowed_origins);
}

void parse_storage(const YAML::Node& node, ServerConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.db_path = read_scalar(node["db_path"], cfg.db_path);
}

void parse_logging(const YAML::Node& node, ServerConfig& cfg) {
    if (!node) {
        return;
    }
    cfg.log_path  = read_scalar(node["path"], cfg.log_path);
    cfg.log_level = read_scalar(node["level"], cfg.log_level);
}

// ---------------------------------------------------------------------------
// 환경변수 헬퍼: 없거나 빈 문자열이면 std::nullopt
// ---------------------------------------------------------------------------
std::optional<std::string_view> env_value(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return std::nullopt;
    }
    return std::string_view(val);
}

void env_str(const char* name, std::string& target) {
    if (const auto val = env_value(name)) {
        target = std::string(*val);
    }
}

template <typename T>
void env_unsigned(const char* name, T& target, T min_value) {
    const auto val = env_value(name);
    if (!val) {
        return;
    }
    T parsed{};
    const auto [ptr, ec] = std::from_chars(val->data(), val->data() + val->size(), parsed);
    if (ec != std::errc{} || ptr != val->data() + val->size()) {
        spdlog::warn("[config] env {}: invalid value '{}', keeping {}", name, *val, target);
        return;
    }
    if (parsed < min_value) {
        spdlog::warn("[config] env {}: value {} out of range, keeping {}", name, parsed, target);
        return;
    }
    target = parsed;
}

}  // namespace

std::expected<ServerConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}", config_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            config_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}", config_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    ServerConfig cfg{};
    if (!root || root.IsNull()) {
        spdlog::info("config_loader: '{}' is empty, using defaults", config_path.string());
        return cfg;
    }
    if (!root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", config_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 섹션 단위 파싱 (YAML 예외 → 섹션 이름이 포함된 오류)
    struct Section {
        const char* name;
        void (*parse)(const YAML::Node&, ServerConfig&);
    };
    constexpr std::array<Section, 3> kSections = {{
        {"server",  &parse_server},
        {"storage", &parse_storage},
        {"logging", &parse_logging},
    }};

    for (const auto& section : kSections) {
        try {
            section.parse(root[section.name], cfg);
        } catch (const YAML::Exception& e) {
            const std::string err = fmt::format(
                "config_loader: error parsing '{}' section: {}", section.name, e.what());
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
    }

    if (auto ok = validate(cfg); !ok) {
        const std::string err = fmt::format(
            "config_loader: invalid value in '{}': {}", config_path.string(), ok.error());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loaded '{}' (listen={}:{}, db='{}')",
                 config_path.string(), cfg.listen_address, cfg.listen_port, cfg.db_path);
    return cfg;
}

std::expected<ServerConfig, std::string>
ConfigLoader::load_or_default(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        spdlog::info("config_loader: '{}' not found, using defaults", config_path.string());
        return ServerConfig{};
    }
    return load(config_path);
}

void ConfigLoader::apply_env_overrides(ServerConfig& config) {
    env_str("CSVGATE_LISTEN_ADDR", config.listen_address);
    env_unsigned<std::uint16_t>("CSVGATE_LISTEN_PORT", config.listen_port, 0);
    env_unsigned<std::uint32_t>("CSVGATE_WORKER_THREADS", config.worker_threads, 1);
    env_unsigned<std::uint64_t>("CSVGATE_MAX_BODY_BYTES", config.max_body_bytes, 1);
    env_unsigned<std::uint32_t>("CSVGATE_REQUEST_TIMEOUT_SEC", config.request_timeout_sec, 1);
    env_str("CSVGATE_DB_PATH", config.db_path);
    env_str("CSVGATE_LOG_PATH", config.log_path);
    env_str("CSVGATE_LOG_LEVEL", config.log_level);
}

std::expected<void, std::string> ConfigLoader::validate(const ServerConfig& config) {
    if (config.listen_address.empty()) {
        return std::unexpected(std::string("server.listen_address must not be empty"));
    }
    if (config.worker_threads == 0) {
        return std::unexpected(std::string("server.worker_threads must be at least 1"));
    }
    if (config.max_body_bytes == 0) {
        return std::unexpected(std::string("server.max_body_bytes must be positive"));
    }
    if (config.request_timeout_sec == 0) {
        return std::unexpected(std::string("server.request_timeout_sec must be positive"));
    }
    if (config.db_path.empty()) {
        return std::unexpected(std::string("storage.db_path must not be empty"));
    }
    if (std::find(kLogLevels.begin(), kLogLevels.end(), config.log_level) == kLogLevels.end()) {
        return std::unexpected(fmt::format("logging.level '{}' is not a known level", config.log_level));
    }
    return {};
}
