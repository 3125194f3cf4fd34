#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일 로드 + 환경변수 덮어쓰기.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message). 부분적으로 파싱된
//   설정을 반환하지 않는다.
// - 키가 없으면 ServerConfig 기본값을 유지한다.
// - 타입이 맞지 않는 값 (port: "abc") 은 실패로 처리한다. 조용히 기본값으로
//   돌아가면 운영자가 오타를 알아채지 못한다.
// - 파일 전체 내용을 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "config/server_config.hpp"

class ConfigLoader {
public:
    // load
    //   config_path 의 YAML 을 파싱한다.
    //   파일 없음, 파싱 오류, 값 범위 오류 모두 실패.
    [[nodiscard]] static std::expected<ServerConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_or_default
    //   파일이 없으면 기본값을 반환한다. 파일이 있는데 잘못되었으면 실패.
    [[nodiscard]] static std::expected<ServerConfig, std::string>
    load_or_default(const std::filesystem::path& config_path);

    // apply_env_overrides
    //   CSVGATE_* 환경변수가 설정된 항목만 덮어쓴다.
    //   값이 잘못되면 경고 후 기존 값을 유지한다.
    static void apply_env_overrides(ServerConfig& config);

    // validate
    //   값 범위 검사 (worker_threads >= 1, log_level 이름 등)
    [[nodiscard]] static std::expected<void, std::string> validate(const ServerConfig& config);
};
