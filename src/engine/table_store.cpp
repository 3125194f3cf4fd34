// ---------------------------------------------------------------------------
// table_store.cpp
//
// SQLite 기반 TableBackend.
//
// [적재 절차]
//  1. CSV 파싱 및 타입 추론 (락 밖에서 수행)
//  2. BEGIN IMMEDIATE
//  3. DROP TABLE IF EXISTS → CREATE TABLE → 행마다 준비된 INSERT 재사용
//  4. COMMIT. 어느 단계든 실패하면 ROLLBACK 으로 이전 테이블 복원
//
// [방어 설정]
// - SQLITE_DBCONFIG_DEFENSIVE: 스키마 손상 가능한 PRAGMA/쓰기 차단
// - 확장 로딩은 기본값(비활성)을 유지한다
// ---------------------------------------------------------------------------

#include "engine/table_store.hpp"

#include <cctype>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include "engine/csv_reader.hpp"

namespace {

// finalize 를 보장하는 준비된 문장 래퍼
struct StmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

// "..." 로 감싸고 내부 " 는 "" 로 이중화
std::string quote_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('"');
    for (const char c : name) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::expected<void, std::string> exec_sql(sqlite3* db, const std::string& sql) {
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        return std::unexpected(std::move(message));
    }
    return {};
}

std::string build_create_sql(const std::string& table, const CsvTable& csv) {
    std::string sql = fmt::format("CREATE TABLE {} (", quote_identifier(table));
    for (std::size_t i = 0; i < csv.columns.size(); ++i) {
        if (i > 0) {
            sql += ", ";
        }
        sql += fmt::format("{} {}", quote_identifier(csv.columns[i]), column_type_name(csv.types[i]));
    }
    sql += ")";
    return sql;
}

std::string build_insert_sql(const std::string& table, std::size_t width) {
    std::string sql = fmt::format("INSERT INTO {} VALUES (", quote_identifier(table));
    for (std::size_t i = 0; i < width; ++i) {
        sql += (i == 0) ? "?" : ", ?";
    }
    sql += ")";
    return sql;
}

// 추론된 컬럼 타입에 맞춰 셀 하나를 바인딩한다. index 는 1-based.
int bind_cell(sqlite3_stmt* stmt, int index, ColumnType type, const CsvCell& cell) {
    if (!cell) {
        return sqlite3_bind_null(stmt, index);
    }
    const std::string& value = *cell;
    switch (type) {
        case ColumnType::kBigint:
            if (const auto v = parse_integer_literal(value)) {
                return sqlite3_bind_int64(stmt, index, *v);
            }
            break;
        case ColumnType::kDouble:
            if (const auto v = parse_numeric_literal(value)) {
                return sqlite3_bind_double(stmt, index, *v);
            }
            break;
        case ColumnType::kBoolean:
            if (const auto v = parse_boolean_literal(value)) {
                return sqlite3_bind_int64(stmt, index, *v ? 1 : 0);
            }
            break;
        case ColumnType::kVarchar:
            break;
    }
    return sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                             SQLITE_TRANSIENT);
}

SqlValue read_column(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, index));
            const int   size = sqlite3_column_bytes(stmt, index);
            return std::string(data != nullptr ? data : "", static_cast<std::size_t>(size));
        }
        default:
            return std::monostate{};
    }
}

}  // namespace

void SqliteTableStore::DbCloser::operator()(sqlite3* db) const noexcept {
    sqlite3_close_v2(db);
}

SqliteTableStore::SqliteTableStore(sqlite3* db, std::string table_name)
    : db_(db)
    , table_name_(std::move(table_name))
{}

std::expected<std::unique_ptr<SqliteTableStore>, std::string>
SqliteTableStore::open(const std::filesystem::path& db_path, std::string table_name) {
    const std::string path_str = db_path.string();

    if (path_str != ":memory:" && db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            return std::unexpected(fmt::format(
                "failed to create directory '{}': {}", db_path.parent_path().string(), ec.message()));
        }
    }

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path_str.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                   nullptr);
    std::unique_ptr<sqlite3, DbCloser> guard(raw);
    if (rc != SQLITE_OK) {
        return std::unexpected(fmt::format(
            "failed to open database '{}': {}", path_str,
            raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc)));
    }

    sqlite3_db_config(raw, SQLITE_DBCONFIG_DEFENSIVE, 1, nullptr);
    sqlite3_extended_result_codes(raw, 1);

    spdlog::info("[table_store] opened database '{}' (table '{}')", path_str, table_name);
    return std::unique_ptr<SqliteTableStore>(
        new SqliteTableStore(guard.release(), std::move(table_name)));
}

std::expected<std::uint64_t, LoadError> SqliteTableStore::load_csv(std::string_view csv_bytes) {
    auto csv = parse_csv(csv_bytes);
    if (!csv) {
        return std::unexpected(std::move(csv.error()));
    }

    const auto storage_error = [](std::string message, std::string context) {
        return std::unexpected(LoadError{LoadErrorCode::kStorageError,
                                         std::move(message), std::move(context)});
    };

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();

    if (auto ok = exec_sql(db, "BEGIN IMMEDIATE"); !ok) {
        return storage_error(ok.error(), "begin");
    }

    // 이 블록을 벗어나기 전에 COMMIT 되지 않으면 ROLLBACK
    bool committed = false;
    const auto rollback = [&] {
        if (!committed) {
            if (auto ok = exec_sql(db, "ROLLBACK"); !ok) {
                spdlog::error("[table_store] rollback failed: {}", ok.error());
            }
        }
    };

    if (auto ok = exec_sql(db, fmt::format("DROP TABLE IF EXISTS {}", quote_identifier(table_name_)));
        !ok) {
        rollback();
        return storage_error(ok.error(), "drop");
    }
    if (auto ok = exec_sql(db, build_create_sql(table_name_, *csv)); !ok) {
        rollback();
        return storage_error(ok.error(), "create");
    }

    const std::string insert_sql = build_insert_sql(table_name_, csv->columns.size());
    sqlite3_stmt* raw_stmt = nullptr;
    if (sqlite3_prepare_v2(db, insert_sql.c_str(), -1, &raw_stmt, nullptr) != SQLITE_OK) {
        std::string message = sqlite3_errmsg(db);
        sqlite3_finalize(raw_stmt);
        rollback();
        return storage_error(std::move(message), "prepare insert");
    }
    StmtPtr insert(raw_stmt);

    std::uint64_t loaded = 0;
    for (const auto& row : csv->rows) {
        sqlite3_reset(insert.get());
        sqlite3_clear_bindings(insert.get());
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (bind_cell(insert.get(), static_cast<int>(c + 1), csv->types[c], row[c]) != SQLITE_OK) {
                std::string message = sqlite3_errmsg(db);
                insert.reset();
                rollback();
                return storage_error(std::move(message), fmt::format("row={}", loaded + 1));
            }
        }
        if (sqlite3_step(insert.get()) != SQLITE_DONE) {
            std::string message = sqlite3_errmsg(db);
            insert.reset();
            rollback();
            return storage_error(std::move(message), fmt::format("row={}", loaded + 1));
        }
        ++loaded;
    }
    insert.reset();

    if (auto ok = exec_sql(db, "COMMIT"); !ok) {
        rollback();
        return storage_error(ok.error(), "commit");
    }
    committed = true;

    spdlog::info("[table_store] loaded {} rows into '{}' ({} columns)",
                 loaded, table_name_, csv->columns.size());
    return loaded;
}

std::expected<QueryResult, ExecutionError> SqliteTableStore::execute(std::string_view sql) {
    const auto fail = [&sql](std::string message) {
        return std::unexpected(ExecutionError{std::move(message), std::string(sql)});
    };

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();

    sqlite3_stmt* raw_stmt = nullptr;
    const char*   tail     = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()),
                                      &raw_stmt, &tail);
    StmtPtr stmt(raw_stmt);
    if (rc != SQLITE_OK) {
        return fail(sqlite3_errmsg(db));
    }
    if (!stmt) {
        return fail("no statement to execute");
    }
    // 준비된 문장 뒤에 공백 외 텍스트가 남으면 실행하지 않는다.
    for (const char* p = tail; p != nullptr && p < sql.data() + sql.size(); ++p) {
        if (std::isspace(static_cast<unsigned char>(*p)) == 0) {
            return fail("only one statement can be executed at a time");
        }
    }

    QueryResult result;
    const int column_count = sqlite3_column_count(stmt.get());
    result.columns.reserve(static_cast<std::size_t>(column_count));
    for (int i = 0; i < column_count; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        result.columns.emplace_back(name != nullptr ? name : "");
    }

    while (true) {
        const int step = sqlite3_step(stmt.get());
        if (step == SQLITE_DONE) {
            break;
        }
        if (step != SQLITE_ROW) {
            return fail(sqlite3_errmsg(db));
        }
        std::vector<SqlValue> row;
        row.reserve(static_cast<std::size_t>(column_count));
        for (int i = 0; i < column_count; ++i) {
            row.push_back(read_column(stmt.get(), i));
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}
