// ---------------------------------------------------------------------------
// http_message.cpp
// ---------------------------------------------------------------------------

#include "http/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

#include <fmt/format.h>

#include "common/json_util.hpp"

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim_ows(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) { s.remove_prefix(1); }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))   { s.remove_suffix(1); }
    return s;
}

// RFC 7230 tchar
bool is_token_char(char c) noexcept {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0) {
        return true;
    }
    return std::string_view("!#$%&'*+-.^_`|~").find(c) != std::string_view::npos;
}

std::optional<std::string_view> find_header(const HttpHeaders& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    return find_header(headers, name);
}

std::optional<std::string_view> HttpResponse::header(std::string_view name) const {
    return find_header(headers, name);
}

void HttpResponse::set_header(std::string_view name, std::string value) {
    for (auto& [key, existing] : headers) {
        if (iequals(key, name)) {
            existing = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::string(name), std::move(value));
}

std::string HttpResponse::serialize() const {
    std::string out = fmt::format("HTTP/1.1 {} {}\r\n", status, status_text(status));
    for (const auto& [key, value] : headers) {
        if (iequals(key, "content-length") || iequals(key, "connection")) {
            continue;
        }
        out += fmt::format("{}: {}\r\n", key, value);
    }
    out += fmt::format("Content-Length: {}\r\n", body.size());
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

std::expected<HttpRequest, HttpParseError> parse_request_head(std::string_view head) {
    const auto fail = [](HttpParseErrorCode code, std::string message) {
        return std::unexpected(HttpParseError{code, std::move(message)});
    };

    HttpRequest req;

    // request-line
    const auto line_end = head.find("\r\n");
    const std::string_view request_line = head.substr(0, line_end);
    std::string_view rest = (line_end == std::string_view::npos) ? std::string_view{}
                                                                 : head.substr(line_end + 2);

    const auto sp1 = request_line.find(' ');
    const auto sp2 = (sp1 == std::string_view::npos) ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos ||
        request_line.find(' ', sp2 + 1) != std::string_view::npos) {
        return fail(HttpParseErrorCode::kMalformedRequestLine, "malformed request line");
    }

    const auto method  = request_line.substr(0, sp1);
    const auto target  = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    const auto version = request_line.substr(sp2 + 1);

    if (method.empty() || !std::all_of(method.begin(), method.end(), is_token_char)) {
        return fail(HttpParseErrorCode::kMalformedRequestLine, "invalid method");
    }
    if (target.empty() || (target.front() != '/' && target != "*")) {
        return fail(HttpParseErrorCode::kMalformedRequestLine, "invalid request target");
    }
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return fail(HttpParseErrorCode::kUnsupportedVersion,
                    fmt::format("unsupported HTTP version '{}'", version));
    }

    req.method  = std::string(method);
    req.target  = std::string(target);
    req.version = std::string(version);
    const auto qpos = target.find('?');
    req.path  = std::string(target.substr(0, qpos));
    req.query = (qpos == std::string_view::npos) ? std::string{}
                                                 : std::string(target.substr(qpos + 1));

    // headers
    while (!rest.empty()) {
        const auto eol = rest.find("\r\n");
        const std::string_view line = rest.substr(0, eol);
        rest = (eol == std::string_view::npos) ? std::string_view{} : rest.substr(eol + 2);
        if (line.empty()) {
            break;
        }
        if (line.front() == ' ' || line.front() == '\t') {
            return fail(HttpParseErrorCode::kMalformedHeader, "obsolete header folding");
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return fail(HttpParseErrorCode::kMalformedHeader, "malformed header line");
        }
        const auto name = line.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(), is_token_char)) {
            return fail(HttpParseErrorCode::kMalformedHeader, "invalid header name");
        }
        req.headers.emplace_back(lower(name), std::string(trim_ows(line.substr(colon + 1))));
    }

    if (req.header("transfer-encoding")) {
        return fail(HttpParseErrorCode::kUnsupportedTransferEncoding,
                    "Transfer-Encoding request bodies are not supported");
    }

    // 서로 다른 Content-Length 가 여러 개면 요청 밀반입 위험이 있으므로 거부
    std::optional<std::uint64_t> length;
    for (const auto& [key, value] : req.headers) {
        if (key != "content-length") {
            continue;
        }
        std::uint64_t parsed = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
            return fail(HttpParseErrorCode::kInvalidContentLength, "invalid Content-Length");
        }
        if (length && *length != parsed) {
            return fail(HttpParseErrorCode::kInvalidContentLength, "conflicting Content-Length");
        }
        length = parsed;
    }
    req.content_length = length.value_or(0);

    return req;
}

std::string_view status_text(int status) noexcept {
    switch (status) {
        case 100: return "Continue";
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        case 505: return "HTTP Version Not Supported";
        default:  return "Unknown";
    }
}

HttpResponse make_json_response(int status, std::string body) {
    HttpResponse resp;
    resp.status = status;
    resp.set_header("Content-Type", "application/json");
    resp.body = std::move(body);
    return resp;
}

HttpResponse make_error_response(int status, std::string_view detail) {
    return make_json_response(status, fmt::format(R"({{"detail":{}}})", quote_json_string(detail)));
}
