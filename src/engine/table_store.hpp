#pragma once

// ---------------------------------------------------------------------------
// table_store.hpp
//
// 관리 테이블 하나를 담는 실행 엔진 추상화와 SQLite 구현.
//
// [설계 원칙]
// - TableBackend 는 검증/제한이 끝난 SQL 만 받는다. 여기서는 재검증하지 않는다.
// - 테이블 이름은 SandboxPolicy::allowed_table 에서 오며 요청에서 받지 않는다.
// - 연결 하나를 mutex 로 직렬화한다. 동시 요청은 순서대로 실행된다.
//
// [스레드 안전성]
// - load_csv / execute 는 여러 스레드에서 동시에 호출해도 안전하다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "common/types.hpp"  // LoadError, ExecutionError, QueryResult

struct sqlite3;

class TableBackend {
public:
    virtual ~TableBackend() = default;

    // load_csv
    //   CSV 바이트로 관리 테이블을 원자적으로 교체한다.
    //   실패 시 이전 테이블이 그대로 남는다.
    //   반환: 적재된 행 수
    [[nodiscard]] virtual std::expected<std::uint64_t, LoadError>
    load_csv(std::string_view csv_bytes) = 0;

    // execute
    //   문장 하나를 실행하고 결과 집합을 반환한다.
    //   결과 집합이 없는 문장은 columns/rows 가 빈 QueryResult.
    [[nodiscard]] virtual std::expected<QueryResult, ExecutionError>
    execute(std::string_view sql) = 0;
};

class SqliteTableStore final : public TableBackend {
public:
    // open
    //   db_path 가 ":memory:" 이면 인메모리 DB.
    //   그 외에는 상위 디렉토리를 생성한 뒤 파일을 연다.
    [[nodiscard]] static std::expected<std::unique_ptr<SqliteTableStore>, std::string>
    open(const std::filesystem::path& db_path, std::string table_name);

    ~SqliteTableStore() override = default;

    SqliteTableStore(const SqliteTableStore&)            = delete;
    SqliteTableStore& operator=(const SqliteTableStore&) = delete;
    SqliteTableStore(SqliteTableStore&&)                 = delete;
    SqliteTableStore& operator=(SqliteTableStore&&)      = delete;

    [[nodiscard]] std::expected<std::uint64_t, LoadError>
    load_csv(std::string_view csv_bytes) override;

    [[nodiscard]] std::expected<QueryResult, ExecutionError>
    execute(std::string_view sql) override;

    [[nodiscard]] const std::string& table_name() const noexcept { return table_name_; }

private:
    struct DbCloser {
        void operator()(sqlite3* db) const noexcept;
    };

    SqliteTableStore(sqlite3* db, std::string table_name);

    std::unique_ptr<sqlite3, DbCloser> db_;
    std::string                        table_name_;
    std::mutex                         mutex_;
};
