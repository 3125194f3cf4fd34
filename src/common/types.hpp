#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// RequestContext
//   HTTP 요청 하나를 식별하는 불변 컨텍스트.
//   server 레이어가 생성하고 service/logger 레이어에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct RequestContext {
    std::uint64_t request_id{0};           // 프로세스 범위 내 유일 요청 ID
    std::string   client_ip{};             // 클라이언트 IPv4/IPv6 주소 문자열
    std::uint16_t client_port{0};          // 클라이언트 TCP 포트
    std::chrono::system_clock::time_point received_at{};  // 요청 헤더 수신 시각
};

// ---------------------------------------------------------------------------
// LoadErrorCode
//   CSV 적재 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class LoadErrorCode : std::uint8_t {
    kEmptyInput    = 0,  // 헤더 행조차 없음
    kMalformedCsv  = 1,  // 따옴표 미종결, 헤더보다 긴 행 등
    kStorageError  = 2,  // 엔진 측 DDL/INSERT 실패
};

// ---------------------------------------------------------------------------
// LoadError
//   CSV 적재 실패 시 반환되는 오류 정보.
//   std::expected<T, LoadError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct LoadError {
    LoadErrorCode code{LoadErrorCode::kStorageError};
    std::string   message{};  // 사람이 읽을 수 있는 오류 설명
    std::string   context{};  // 오류 위치 (행 번호 등, 로깅용)
};

// ---------------------------------------------------------------------------
// ExecutionError
//   검증을 통과한 SQL 이 엔진에서 실패한 경우.
//   호출자 입력 거부(Rejection)와는 별개의 오류 계층이다.
// ---------------------------------------------------------------------------
struct ExecutionError {
    std::string message{};  // 엔진 오류 메시지 (클라이언트에 그대로 전달)
    std::string sql{};      // 실제 실행된 SQL (로깅용)
};

// ---------------------------------------------------------------------------
// SqlValue / QueryResult
//   실행 결과의 스칼라 값과 결과 집합.
//   monostate = NULL
// ---------------------------------------------------------------------------
using SqlValue = std::variant<std::monostate, std::int64_t, double, std::string>;

struct QueryResult {
    std::vector<std::string>           columns{};  // 결과 집합이 없으면 빈 벡터
    std::vector<std::vector<SqlValue>> rows{};
};
