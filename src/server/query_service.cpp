// ---------------------------------------------------------------------------
// query_service.cpp
//
// [라우팅 표]
//   GET  /            안내 메시지
//   GET  /health      health 상태
//   GET  /api/stats   통계 스냅샷
//   POST /api/upload  CSV 업로드 (multipart/form-data, file 파트)
//   POST /api/query   SQL 실행 ({"sql": "..."})
//   OPTIONS *         CORS preflight
// ---------------------------------------------------------------------------

#include "server/query_service.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/json_util.hpp"
#include "http/multipart.hpp"

namespace {

constexpr std::string_view kRootMessage =
    "Backend is running. Use /api/upload to upload a CSV and /api/query to run SQL.";

struct RouteEntry {
    std::string_view method;
    std::string_view path;
};

constexpr std::array<RouteEntry, 5> kRoutes = {{
    {"GET",  "/"},
    {"GET",  "/health"},
    {"GET",  "/api/stats"},
    {"POST", "/api/upload"},
    {"POST", "/api/query"},
}};

bool ends_with_icase(std::string_view s, std::string_view suffix) noexcept {
    if (s.size() < suffix.size()) {
        return false;
    }
    const auto tail = s.substr(s.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
}

std::chrono::microseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

std::string result_to_json(const QueryResult& result) {
    std::string out = R"({"columns":[)";
    for (std::size_t i = 0; i < result.columns.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out += quote_json_string(result.columns[i]);
    }
    out += R"(],"rows":[)";
    for (std::size_t r = 0; r < result.rows.size(); ++r) {
        if (r > 0) {
            out.push_back(',');
        }
        out.push_back('[');
        const auto& row = result.rows[r];
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c > 0) {
                out.push_back(',');
            }
            append_json_value(out, row[c]);
        }
        out.push_back(']');
    }
    out += "]}";
    return out;
}

std::string_view json_field_error_detail(JsonFieldError error) noexcept {
    switch (error) {
        case JsonFieldError::kMalformed: return "Request body must be a JSON object.";
        case JsonFieldError::kMissing:   return "Field 'sql' is required.";
        case JsonFieldError::kWrongType: return "Field 'sql' must be a string.";
    }
    return "Invalid request body.";
}

}  // namespace

QueryService::QueryService(const SandboxPolicy&              policy,
                           std::shared_ptr<TableBackend>     backend,
                           std::shared_ptr<StructuredLogger> logger,
                           std::shared_ptr<StatsCollector>   stats,
                           std::vector<std::string>          allowed_origins)
    : sandbox_(policy)
    , backend_(std::move(backend))
    , logger_(std::move(logger))
    , stats_(std::move(stats))
    , allowed_origins_(std::move(allowed_origins))
{
    if (!backend_ || !logger_ || !stats_) {
        throw std::invalid_argument("QueryService requires backend, logger and stats");
    }
}

HttpResponse QueryService::handle(const HttpRequest& request, const RequestContext& ctx) {
    stats_->on_request();

    HttpResponse response;
    try {
        response = route(request, ctx);
    } catch (const std::exception& e) {
        spdlog::error("[query_service] request_id={} {} {} failed: {}",
                      ctx.request_id, request.method, request.path, e.what());
        response = make_error_response(500, "Internal server error.");
    }

    apply_cors(request, response);
    return response;
}

HttpResponse QueryService::route(const HttpRequest& request, const RequestContext& ctx) {
    if (request.method == "OPTIONS" && request.header("origin") &&
        request.header("access-control-request-method")) {
        return handle_preflight(request);
    }

    const bool path_known = std::any_of(kRoutes.begin(), kRoutes.end(), [&](const RouteEntry& r) {
        return r.path == request.path;
    });
    if (!path_known) {
        return make_error_response(404, "Not Found");
    }

    // HEAD 는 GET 과 같은 경로로 처리한다 (본문은 서버 레이어에서 잘라낸다).
    std::string_view method = request.method;
    if (method == "HEAD") {
        method = "GET";
    }
    const auto it = std::find_if(kRoutes.begin(), kRoutes.end(), [&](const RouteEntry& r) {
        return r.path == request.path && r.method == method;
    });
    if (it == kRoutes.end()) {
        auto resp = make_error_response(405, "Method Not Allowed");
        std::string allow;
        for (const auto& r : kRoutes) {
            if (r.path == request.path) {
                allow += allow.empty() ? std::string(r.method) : ", " + std::string(r.method);
            }
        }
        resp.set_header("Allow", std::move(allow));
        return resp;
    }

    if (request.path == "/")            { return handle_root(); }
    if (request.path == "/health")      { return handle_health(); }
    if (request.path == "/api/stats")   { return handle_stats(); }
    if (request.path == "/api/upload")  { return handle_upload(request, ctx); }
    return handle_query(request, ctx);
}

HttpResponse QueryService::handle_root() const {
    return make_json_response(200, fmt::format(R"({{"message":{}}})", quote_json_string(kRootMessage)));
}

HttpResponse QueryService::handle_health() const {
    if (status() == HealthStatus::kHealthy) {
        return make_json_response(200, R"({"status":"ok"})");
    }
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        reason = unhealthy_reason_.empty() ? "service unavailable" : unhealthy_reason_;
    }
    return make_json_response(
        503, fmt::format(R"({{"status":"unhealthy","reason":{}}})", quote_json_string(reason)));
}

HttpResponse QueryService::handle_stats() const {
    const auto s = stats_->snapshot();
    return make_json_response(200, fmt::format(
        R"({{"total_requests":{},"active_connections":{},"uploads":{},"failed_uploads":{},)"
        R"("total_queries":{},"rejected_queries":{},"failed_queries":{},)"
        R"("qps":{:.3f},"reject_rate":{:.4f},"uptime_sec":{:.1f}}})",
        s.total_requests, s.active_connections, s.uploads, s.failed_uploads,
        s.total_queries, s.rejected_queries, s.failed_queries,
        s.qps, s.reject_rate, s.uptime_sec));
}

// ---------------------------------------------------------------------------
// handle_upload
//   file 파트를 메모리에서 바로 적재한다. 임시 파일을 만들지 않는다.
// ---------------------------------------------------------------------------
HttpResponse QueryService::handle_upload(const HttpRequest& request, const RequestContext& ctx) {
    const auto started = std::chrono::steady_clock::now();

    UploadLog entry;
    entry.request_id = ctx.request_id;
    entry.client_ip  = ctx.client_ip;
    entry.bytes      = request.body.size();
    entry.timestamp  = std::chrono::system_clock::now();

    const auto finish = [&](HttpResponse resp, std::string error) {
        entry.error    = std::move(error);
        entry.duration = elapsed_since(started);
        logger_->log_upload(entry);
        stats_->on_upload(entry.error.empty());
        return resp;
    };

    const auto content_type = request.header("content-type");
    const auto boundary = content_type ? multipart_boundary(*content_type) : std::nullopt;
    if (!boundary) {
        return finish(make_error_response(422, "Expected a multipart/form-data body with a 'file' part."),
                      "not multipart/form-data");
    }

    auto parts = parse_multipart(request.body, *boundary);
    if (!parts) {
        return finish(make_error_response(400, fmt::format("Malformed multipart body: {}", parts.error())),
                      parts.error());
    }

    const auto file = std::find_if(parts->begin(), parts->end(), [](const MultipartPart& p) {
        return p.name == "file" && p.filename.has_value();
    });
    if (file == parts->end()) {
        return finish(make_error_response(422, "Field 'file' is required."), "missing file part");
    }

    entry.filename = *file->filename;
    entry.bytes    = file->data.size();
    if (!ends_with_icase(*file->filename, ".csv")) {
        return finish(make_error_response(400, "Only .csv files are supported."),
                      "unsupported file type");
    }

    auto loaded = backend_->load_csv(file->data);
    if (!loaded) {
        const auto& err = loaded.error();
        spdlog::warn("[query_service] request_id={} CSV load failed ({}): {}",
                     ctx.request_id, err.context, err.message);
        return finish(make_error_response(500, fmt::format("Failed to load CSV: {}", err.message)),
                      err.message);
    }

    entry.rows_loaded = *loaded;
    return finish(make_json_response(200, fmt::format(R"({{"status":"ok","rows_loaded":{}}})", *loaded)),
                  "");
}

// ---------------------------------------------------------------------------
// handle_query
//   검증 → 행 제한 → 실행. 검증을 건너뛰는 경로는 없다.
// ---------------------------------------------------------------------------
HttpResponse QueryService::handle_query(const HttpRequest& request, const RequestContext& ctx) {
    const auto started = std::chrono::steady_clock::now();

    auto sql = extract_json_string_field(request.body, "sql");
    if (!sql) {
        return make_error_response(422, json_field_error_detail(sql.error()));
    }

    auto prepared = sandbox_.prepare(*sql);
    if (!prepared) {
        const Rejection& rej = prepared.error();
        logger_->log_reject(RejectLog{
            ctx.request_id,
            ctx.client_ip,
            *sql,
            std::string(rule_name(rej.rule)),
            rej.reason,
            rej.matched,
            std::chrono::system_clock::now(),
        });
        stats_->on_query(QueryOutcome::kRejected);
        return make_json_response(400, fmt::format(
            R"({{"detail":{},"reason":{},"rule":{}}})",
            quote_json_string(rej.detail),
            quote_json_string(rej.reason),
            quote_json_string(rule_name(rej.rule))));
    }

    QueryLog entry;
    entry.request_id   = ctx.request_id;
    entry.client_ip    = ctx.client_ip;
    entry.raw_sql      = *sql;
    entry.executed_sql = prepared->executable_sql;
    entry.verb         = std::string(verb_to_string(prepared->statement.verb));
    entry.limited      = prepared->limited;
    entry.timestamp    = std::chrono::system_clock::now();

    auto result = backend_->execute(prepared->executable_sql);
    entry.duration = elapsed_since(started);

    if (!result) {
        entry.error = result.error().message;
        logger_->log_query(entry);
        stats_->on_query(QueryOutcome::kFailed);
        return make_json_response(400, fmt::format(
            R"({{"detail":{},"reason":"execution failed"}})",
            quote_json_string(fmt::format("Query failed: {}", result.error().message))));
    }

    entry.row_count = result->rows.size();
    logger_->log_query(entry);
    stats_->on_query(QueryOutcome::kExecuted);
    return make_json_response(200, result_to_json(*result));
}

HttpResponse QueryService::handle_preflight(const HttpRequest& request) const {
    const auto origin = request.header("origin").value_or("");
    if (!origin_allowed(origin)) {
        return make_error_response(400, "Disallowed CORS origin");
    }

    HttpResponse resp;
    resp.status = 204;
    resp.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    const auto requested = request.header("access-control-request-headers");
    resp.set_header("Access-Control-Allow-Headers",
                    requested && !requested->empty() ? std::string(*requested) : "Content-Type");
    resp.set_header("Access-Control-Max-Age", "600");
    return resp;
}

bool QueryService::origin_allowed(std::string_view origin) const {
    if (origin.empty()) {
        return false;
    }
    return std::find(allowed_origins_.begin(), allowed_origins_.end(), origin)
        != allowed_origins_.end();
}

void QueryService::apply_cors(const HttpRequest& request, HttpResponse& response) const {
    const auto origin = request.header("origin");
    if (!origin || !origin_allowed(*origin)) {
        return;
    }
    response.set_header("Access-Control-Allow-Origin", std::string(*origin));
    response.set_header("Access-Control-Allow-Credentials", "true");
    response.set_header("Vary", "Origin");
}

void QueryService::set_unhealthy(std::string_view reason) {
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        unhealthy_reason_ = std::string(reason);
    }
    status_.store(HealthStatus::kUnhealthy, std::memory_order_release);
}

void QueryService::set_healthy() {
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        unhealthy_reason_.clear();
    }
    status_.store(HealthStatus::kHealthy, std::memory_order_release);
}

HealthStatus QueryService::status() const noexcept {
    return status_.load(std::memory_order_acquire);
}
