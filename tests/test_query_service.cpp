// ---------------------------------------------------------------------------
// test_query_service.cpp
//
// QueryService 단위 테스트 (소켓 없이 handle() 직접 호출).
//
// [테스트 범위]
// - 라우팅: /, /health, /api/stats, 404, 405 (Allow 헤더), HEAD
// - /api/upload: multipart 검증, 확장자 검사, 적재 실패 → 500
// - /api/query : 본문 검증 (422), 거부 (400 + rule), 실행 실패 (400), 성공 JSON
// - 거부된 SQL 은 백엔드에 도달하지 않는다
// - CORS: 허용 origin 반사, preflight 204, 비허용 origin preflight 400
// - health 상태 전환
//
// [알려진 한계]
// - 실제 SQL 엔진 대신 FakeBackend 를 사용한다.
//   엔진 동작은 test_table_store.cpp 에서 검증한다.
// ---------------------------------------------------------------------------

#include "server/query_service.hpp"

#include "common/json_util.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// ---------------------------------------------------------------------------
// FakeBackend
//   실행된 SQL 을 기록하고, 미리 지정한 결과 / 오류를 돌려준다.
// ---------------------------------------------------------------------------
class FakeBackend : public TableBackend {
public:
    std::expected<std::uint64_t, LoadError> load_csv(std::string_view csv_bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        loaded.emplace_back(csv_bytes);
        if (load_error) {
            return std::unexpected(*load_error);
        }
        return rows_to_load;
    }

    std::expected<QueryResult, ExecutionError> execute(std::string_view sql) override {
        std::lock_guard<std::mutex> lock(mutex_);
        executed.emplace_back(sql);
        if (exec_error) {
            return std::unexpected(ExecutionError{*exec_error, std::string(sql)});
        }
        return result;
    }

    std::vector<std::string>   loaded;
    std::vector<std::string>   executed;
    std::optional<LoadError>   load_error;
    std::optional<std::string> exec_error;
    std::uint64_t              rows_to_load{0};
    QueryResult                result;

private:
    std::mutex mutex_;
};

const std::vector<std::string> kOrigins = {"http://localhost:5173",
                                           "https://csv-sql-tool.vercel.app"};

HttpRequest make_request(std::string method, std::string path, std::string body = {}) {
    HttpRequest req;
    req.method         = std::move(method);
    req.target         = path;
    req.path           = std::move(path);
    req.version        = "HTTP/1.1";
    req.body           = std::move(body);
    req.content_length = req.body.size();
    return req;
}

HttpRequest make_query(std::string_view sql) {
    auto req = make_request("POST", "/api/query",
                            std::string(R"({"sql":)") + quote_json_string(sql) + "}");
    req.headers.emplace_back("content-type", "application/json");
    return req;
}

HttpRequest make_upload(std::string_view filename, std::string_view data) {
    const std::string boundary = "----csvgateTestBoundary";
    std::string body = "--" + boundary + "\r\n"
                       "Content-Disposition: form-data; name=\"file\"; filename=\"" +
                       std::string(filename) + "\"\r\n"
                       "Content-Type: text/csv\r\n"
                       "\r\n" +
                       std::string(data) + "\r\n"
                       "--" + boundary + "--\r\n";
    auto req = make_request("POST", "/api/upload", std::move(body));
    req.headers.emplace_back("content-type", "multipart/form-data; boundary=" + boundary);
    return req;
}

std::string detail_of(const HttpResponse& resp) {
    auto v = extract_json_string_field(resp.body, "detail");
    return v ? *v : std::string("<no detail>");
}

}  // namespace

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------
class QueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        log_dir_ = fs::temp_directory_path() / "csvgate_test_service" / info->name();
        fs::create_directories(log_dir_);

        backend_ = std::make_shared<FakeBackend>();
        logger_  = std::make_shared<StructuredLogger>(LogLevel::kInfo, log_dir_ / "service.log");
        stats_   = std::make_shared<StatsCollector>();
        service_ = std::make_unique<QueryService>(make_default_sandbox_policy(), backend_, logger_,
                                                  stats_, kOrigins);
        ctx_.request_id = 1;
        ctx_.client_ip  = "127.0.0.1";
    }

    void TearDown() override {
        service_.reset();
        logger_.reset();
        fs::remove_all(log_dir_);
    }

    HttpResponse handle(const HttpRequest& req) {
        ++ctx_.request_id;
        return service_->handle(req, ctx_);
    }

    fs::path                          log_dir_;
    std::shared_ptr<FakeBackend>      backend_;
    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<StatsCollector>   stats_;
    std::unique_ptr<QueryService>     service_;
    RequestContext                    ctx_;
};

// ---------------------------------------------------------------------------
// 라우팅
// ---------------------------------------------------------------------------
TEST_F(QueryServiceTest, RootReturnsMessage) {
    auto resp = handle(make_request("GET", "/"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.header("content-type"), "application/json");
    auto message = extract_json_string_field(resp.body, "message");
    ASSERT_TRUE(message.has_value());
    EXPECT_NE(message->find("/api/upload"), std::string::npos);
}

TEST_F(QueryServiceTest, UnknownPathIs404) {
    auto resp = handle(make_request("GET", "/nope"));
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(detail_of(resp), "Not Found");
}

TEST_F(QueryServiceTest, WrongMethodIs405WithAllow) {
    auto resp = handle(make_request("GET", "/api/query"));
    EXPECT_EQ(resp.status, 405);
    EXPECT_EQ(resp.header("allow"), "POST");

    auto post_root = handle(make_request("POST", "/health"));
    EXPECT_EQ(post_root.status, 405);
    EXPECT_EQ(post_root.header("allow"), "GET");
}

TEST_F(QueryServiceTest, HeadIsRoutedAsGet) {
    auto resp = handle(make_request("HEAD", "/health"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, R"({"status":"ok"})");
}

TEST_F(QueryServiceTest, HealthTransitions) {
    EXPECT_EQ(handle(make_request("GET", "/health")).status, 200);

    service_->set_unhealthy("shutting down");
    EXPECT_EQ(service_->status(), HealthStatus::kUnhealthy);
    auto down = handle(make_request("GET", "/health"));
    EXPECT_EQ(down.status, 503);
    EXPECT_EQ(extract_json_string_field(down.body, "reason"), "shutting down");

    service_->set_healthy();
    EXPECT_EQ(handle(make_request("GET", "/health")).status, 200);
}

TEST_F(QueryServiceTest, StatsReflectTraffic) {
    (void)handle(make_query("SELECT * FROM tablename"));
    (void)handle(make_query("DROP TABLE tablename"));

    auto resp = handle(make_request("GET", "/api/stats"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_NE(resp.body.find("\"total_requests\":3"), std::string::npos) << resp.body;
    EXPECT_NE(resp.body.find("\"total_queries\":2"), std::string::npos) << resp.body;
    EXPECT_NE(resp.body.find("\"rejected_queries\":1"), std::string::npos) << resp.body;
    EXPECT_NE(resp.body.find("\"reject_rate\":0.5000"), std::string::npos) << resp.body;
}

// ---------------------------------------------------------------------------
// /api/query
// ---------------------------------------------------------------------------
TEST_F(QueryServiceTest, QuerySuccessReturnsColumnsAndRows) {
    backend_->result.columns = {"name", "age", "score", "note"};
    backend_->result.rows    = {
        {SqlValue{std::string("alice")}, SqlValue{std::int64_t{30}}, SqlValue{1.5}, SqlValue{}},
    };

    auto resp = handle(make_query("SELECT * FROM tablename"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, R"({"columns":["name","age","score","note"],"rows":[["alice",30,1.5,null]]})");

    ASSERT_EQ(backend_->executed.size(), 1u);
    EXPECT_EQ(backend_->executed[0],
              "SELECT * FROM (SELECT * FROM tablename) AS subquery LIMIT 1000");
}

TEST_F(QueryServiceTest, WriteStatementIsNotLimited) {
    auto resp = handle(make_query("UPDATE tablename SET a = 1;"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, R"({"columns":[],"rows":[]})");
    ASSERT_EQ(backend_->executed.size(), 1u);
    EXPECT_EQ(backend_->executed[0], "UPDATE tablename SET a = 1");
}

TEST_F(QueryServiceTest, RejectedQueryNeverReachesBackend) {
    for (const char* sql : {"", "SELECT 1; SELECT 2", "DROP TABLE tablename",
                            "SELECT * FROM read_csv_auto('/etc/passwd')",
                            "SELECT * FROM tablename JOIN other ON 1=1", "SELECT * FROM users"}) {
        auto resp = handle(make_query(sql));
        EXPECT_EQ(resp.status, 400) << sql;
        EXPECT_TRUE(extract_json_string_field(resp.body, "rule").has_value()) << sql;
    }
    EXPECT_TRUE(backend_->executed.empty());
    EXPECT_EQ(stats_->snapshot().rejected_queries, 6u);
}

TEST_F(QueryServiceTest, RejectionBodyCarriesReasonAndRule) {
    auto resp = handle(make_query("SELECT * FROM users"));
    EXPECT_EQ(resp.status, 400);
    EXPECT_EQ(detail_of(resp), "You can only access the 'tablename' table loaded from your CSV.");
    EXPECT_EQ(extract_json_string_field(resp.body, "reason"), "must reference the managed table");
    EXPECT_EQ(extract_json_string_field(resp.body, "rule"), "managed-table-reference");

    auto fs_resp = handle(make_query("COPY tablename TO '/tmp/out.csv'"));
    EXPECT_EQ(fs_resp.status, 400);
    EXPECT_EQ(extract_json_string_field(fs_resp.body, "rule"), "allowed-verb");
}

TEST_F(QueryServiceTest, ExecutionFailureIs400) {
    backend_->exec_error = "no such column: nope";
    auto resp = handle(make_query("SELECT nope FROM tablename"));
    EXPECT_EQ(resp.status, 400);
    EXPECT_EQ(detail_of(resp), "Query failed: no such column: nope");
    EXPECT_EQ(extract_json_string_field(resp.body, "reason"), "execution failed");
    EXPECT_EQ(stats_->snapshot().failed_queries, 1u);
}

TEST_F(QueryServiceTest, MalformedQueryBodies) {
    auto not_json = make_request("POST", "/api/query", "sql=SELECT");
    EXPECT_EQ(detail_of(handle(not_json)), "Request body must be a JSON object.");

    auto missing = handle(make_request("POST", "/api/query", R"({"query":"x"})"));
    EXPECT_EQ(missing.status, 422);
    EXPECT_EQ(detail_of(missing), "Field 'sql' is required.");

    auto wrong = handle(make_request("POST", "/api/query", R"({"sql":42})"));
    EXPECT_EQ(wrong.status, 422);
    EXPECT_EQ(detail_of(wrong), "Field 'sql' must be a string.");

    EXPECT_TRUE(backend_->executed.empty());
}

// ---------------------------------------------------------------------------
// /api/upload
// ---------------------------------------------------------------------------
TEST_F(QueryServiceTest, UploadLoadsCsv) {
    backend_->rows_to_load = 2;
    auto resp = handle(make_upload("people.CSV", "name,age\nalice,30\nbob,25"));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, R"({"status":"ok","rows_loaded":2})");
    ASSERT_EQ(backend_->loaded.size(), 1u);
    EXPECT_EQ(backend_->loaded[0], "name,age\nalice,30\nbob,25");
    EXPECT_EQ(stats_->snapshot().uploads, 1u);
}

TEST_F(QueryServiceTest, UploadRejectsNonCsvFilename) {
    auto resp = handle(make_upload("people.txt", "a\n1"));
    EXPECT_EQ(resp.status, 400);
    EXPECT_EQ(detail_of(resp), "Only .csv files are supported.");
    EXPECT_TRUE(backend_->loaded.empty());
    EXPECT_EQ(stats_->snapshot().failed_uploads, 1u);
}

TEST_F(QueryServiceTest, UploadLoadFailureIs500) {
    backend_->load_error = LoadError{LoadErrorCode::kMalformedCsv,
                                     "unterminated quoted field starting on line 2", "line=2"};
    auto resp = handle(make_upload("bad.csv", "a\n\"x"));
    EXPECT_EQ(resp.status, 500);
    EXPECT_EQ(detail_of(resp), "Failed to load CSV: unterminated quoted field starting on line 2");
}

TEST_F(QueryServiceTest, UploadRequiresMultipartFilePart) {
    auto json = make_request("POST", "/api/upload", "{}");
    json.headers.emplace_back("content-type", "application/json");
    EXPECT_EQ(handle(json).status, 422);

    auto no_file = make_request("POST", "/api/upload",
                                "--b\r\nContent-Disposition: form-data; name=\"other\"\r\n\r\n"
                                "x\r\n--b--\r\n");
    no_file.headers.emplace_back("content-type", "multipart/form-data; boundary=b");
    auto resp = handle(no_file);
    EXPECT_EQ(resp.status, 422);
    EXPECT_EQ(detail_of(resp), "Field 'file' is required.");

    auto broken = make_request("POST", "/api/upload", "garbage");
    broken.headers.emplace_back("content-type", "multipart/form-data; boundary=b");
    EXPECT_EQ(handle(broken).status, 400);

    EXPECT_TRUE(backend_->loaded.empty());
}

// ---------------------------------------------------------------------------
// CORS
// ---------------------------------------------------------------------------
TEST_F(QueryServiceTest, CorsHeadersForAllowedOrigin) {
    auto req = make_request("GET", "/health");
    req.headers.emplace_back("origin", "http://localhost:5173");
    auto resp = handle(req);
    EXPECT_EQ(resp.header("access-control-allow-origin"), "http://localhost:5173");
    EXPECT_EQ(resp.header("access-control-allow-credentials"), "true");
    EXPECT_EQ(resp.header("vary"), "Origin");

    auto other = make_request("GET", "/health");
    other.headers.emplace_back("origin", "https://evil.example");
    auto plain = handle(other);
    EXPECT_EQ(plain.status, 200);
    EXPECT_FALSE(plain.header("access-control-allow-origin").has_value());
}

TEST_F(QueryServiceTest, CorsHeadersOnErrorResponses) {
    auto req = make_query("SELECT * FROM users");
    req.headers.emplace_back("origin", "https://csv-sql-tool.vercel.app");
    auto resp = handle(req);
    EXPECT_EQ(resp.status, 400);
    EXPECT_EQ(resp.header("access-control-allow-origin"), "https://csv-sql-tool.vercel.app");
}

TEST_F(QueryServiceTest, PreflightAllowedOrigin) {
    auto req = make_request("OPTIONS", "/api/query");
    req.headers.emplace_back("origin", "http://localhost:5173");
    req.headers.emplace_back("access-control-request-method", "POST");
    req.headers.emplace_back("access-control-request-headers", "content-type, x-custom");

    auto resp = handle(req);
    EXPECT_EQ(resp.status, 204);
    EXPECT_TRUE(resp.body.empty());
    EXPECT_EQ(resp.header("access-control-allow-methods"), "GET, POST, OPTIONS");
    EXPECT_EQ(resp.header("access-control-allow-headers"), "content-type, x-custom");
    EXPECT_EQ(resp.header("access-control-max-age"), "600");
    EXPECT_EQ(resp.header("access-control-allow-origin"), "http://localhost:5173");
}

TEST_F(QueryServiceTest, PreflightDisallowedOrigin) {
    auto req = make_request("OPTIONS", "/api/query");
    req.headers.emplace_back("origin", "https://evil.example");
    req.headers.emplace_back("access-control-request-method", "POST");

    auto resp = handle(req);
    EXPECT_EQ(resp.status, 400);
    EXPECT_EQ(detail_of(resp), "Disallowed CORS origin");
    EXPECT_FALSE(resp.header("access-control-allow-origin").has_value());
}

TEST_F(QueryServiceTest, PlainOptionsWithoutPreflightHeadersIs405) {
    auto resp = handle(make_request("OPTIONS", "/api/query"));
    EXPECT_EQ(resp.status, 405);
}

TEST(QueryServiceCtor, NullDependenciesThrow) {
    auto stats = std::make_shared<StatsCollector>();
    EXPECT_THROW(QueryService(make_default_sandbox_policy(), nullptr, nullptr, stats, {}),
                 std::invalid_argument);
}
