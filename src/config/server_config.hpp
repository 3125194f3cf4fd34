#pragma once

// ---------------------------------------------------------------------------
// server_config.hpp
//
// 서버 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 로 config/csvgate.yaml 에서 로드되고, 환경변수로 개별 값이
// 덮어써진다.
//
// [설계 원칙]
// - 샌드박스 정책 (허용 테이블/키워드/금지 구문) 은 여기에 두지 않는다.
//   정책은 코드 상수이며 설정으로 완화할 수 없다.
// - 모든 멤버는 기본값을 명시한다. 설정 파일이 없어도 기동 가능하다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

struct ServerConfig {
    // server
    std::string   listen_address{"0.0.0.0"};
    std::uint16_t listen_port{8000};           // 0 = 임의 포트 (테스트용)
    std::uint32_t worker_threads{1};           // io_context 를 돌리는 스레드 수
    std::uint64_t max_body_bytes{64ULL * 1024 * 1024};
    std::uint32_t request_timeout_sec{30};     // 요청 헤더+본문 수신 제한
    std::vector<std::string> allowed_origins{
        "http://localhost:5173",
        "https://csv-sql-tool.vercel.app",
    };

    // storage
    std::string db_path{"data/db.sqlite"};     // ":memory:" 허용

    // logging
    std::string log_path{"/tmp/csvgate.log"};
    std::string log_level{"info"};             // trace|debug|info|warn|error|critical|off
};
