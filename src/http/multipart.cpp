// ---------------------------------------------------------------------------
// multipart.cpp
//
// 본문 구조:
//   [preamble] --B CRLF headers CRLF CRLF data CRLF --B ... CRLF --B-- [epilogue]
// ---------------------------------------------------------------------------

#include "http/multipart.hpp"

#include <algorithm>
#include <cctype>

namespace {

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

// ---------------------------------------------------------------------------
// 헤더 값의 ';' 로 구분된 파라미터에서 name 의 값을 찾는다.
// 값은 token 또는 quoted-string. 인용된 값의 \" 이스케이프를 해제한다.
// ---------------------------------------------------------------------------
std::optional<std::string> header_param(std::string_view value, std::string_view name) {
    std::size_t pos = value.find(';');
    while (pos != std::string_view::npos) {
        ++pos;
        while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t')) {
            ++pos;
        }
        const auto eq = value.find('=', pos);
        if (eq == std::string_view::npos) {
            return std::nullopt;
        }
        const std::string key = lower(trim_ows(value.substr(pos, eq - pos)));
        std::size_t vpos = eq + 1;
        std::string param;

        if (vpos < value.size() && value[vpos] == '"') {
            ++vpos;
            while (vpos < value.size() && value[vpos] != '"') {
                if (value[vpos] == '\\' && vpos + 1 < value.size()) {
                    ++vpos;
                }
                param.push_back(value[vpos]);
                ++vpos;
            }
            ++vpos;  // 닫는 따옴표
            pos = value.find(';', vpos);
        } else {
            const auto end = value.find(';', vpos);
            param = std::string(trim_ows(value.substr(vpos, end - vpos)));
            pos = end;
        }

        if (key == name) {
            return param;
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> multipart_boundary(std::string_view content_type) {
    const auto semi = content_type.find(';');
    if (lower(trim_ows(content_type.substr(0, semi))) != "multipart/form-data") {
        return std::nullopt;
    }
    auto boundary = header_param(content_type, "boundary");
    if (!boundary || boundary->empty() || boundary->size() > 70) {
        return std::nullopt;
    }
    return boundary;
}

std::expected<std::vector<MultipartPart>, std::string>
parse_multipart(std::string_view body, std::string_view boundary) {
    const std::string delimiter = "--" + std::string(boundary);
    const std::string separator = "\r\n" + delimiter;

    std::vector<MultipartPart> parts;

    // 첫 구분자: 본문 맨 앞이거나 preamble 뒤 CRLF 다음
    std::size_t pos = 0;
    if (body.substr(0, delimiter.size()) != delimiter) {
        pos = body.find(separator);
        if (pos == std::string_view::npos) {
            return std::unexpected(std::string("multipart boundary not found"));
        }
        pos += 2;
    }
    pos += delimiter.size();

    while (true) {
        if (body.substr(pos, 2) == "--") {
            return parts;  // 종료 구분자
        }
        // 구분자 줄의 나머지 (transport padding) 건너뜀
        const auto line_end = body.find("\r\n", pos);
        if (line_end == std::string_view::npos) {
            return std::unexpected(std::string("truncated multipart body"));
        }
        pos = line_end + 2;

        const auto headers_end = body.find("\r\n\r\n", pos);
        const bool no_headers  = body.substr(pos, 2) == "\r\n";
        if (headers_end == std::string_view::npos && !no_headers) {
            return std::unexpected(std::string("truncated multipart part headers"));
        }

        MultipartPart part;
        std::string_view header_block =
            no_headers ? std::string_view{} : body.substr(pos, headers_end - pos);
        pos = no_headers ? pos + 2 : headers_end + 4;

        bool has_disposition = false;
        while (!header_block.empty()) {
            const auto eol = header_block.find("\r\n");
            const std::string_view line = header_block.substr(0, eol);
            header_block = (eol == std::string_view::npos) ? std::string_view{}
                                                           : header_block.substr(eol + 2);
            const auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                return std::unexpected(std::string("malformed multipart part header"));
            }
            const std::string name = lower(trim_ows(line.substr(0, colon)));
            const std::string_view value = trim_ows(line.substr(colon + 1));
            if (name == "content-disposition") {
                const auto semi = value.find(';');
                if (lower(trim_ows(value.substr(0, semi))) != "form-data") {
                    return std::unexpected(std::string("part is not form-data"));
                }
                has_disposition = true;
                part.name       = header_param(value, "name").value_or("");
                part.filename   = header_param(value, "filename");
            } else if (name == "content-type") {
                part.content_type = std::string(value);
            }
        }
        if (!has_disposition) {
            return std::unexpected(std::string("multipart part without Content-Disposition"));
        }

        const auto data_end = body.find(separator, pos);
        if (data_end == std::string_view::npos) {
            return std::unexpected(std::string("multipart closing boundary not found"));
        }
        part.data = body.substr(pos, data_end - pos);
        parts.push_back(std::move(part));

        pos = data_end + separator.size();
    }
}
