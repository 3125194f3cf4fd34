// ---------------------------------------------------------------------------
// json_util.cpp
//
// 출력은 직접 조립하고, 요청 본문 해석은 nlohmann::json 에 맡긴다.
// 파싱은 예외 없이 (allow_exceptions = false) 수행하고 discarded 값으로
// 실패를 판별한다.
// ---------------------------------------------------------------------------

#include "common/json_util.hpp"

#include <cmath>
#include <cstdint>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const char c : str) {
        const auto ch = static_cast<unsigned char>(c);
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned int>(ch));
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    return result;
}

std::string quote_json_string(std::string_view str) {
    std::string out;
    out.reserve(str.size() + 2);
    out.push_back('"');
    out += escape_json_string(str);
    out.push_back('"');
    return out;
}

void append_json_value(std::string& out, const SqlValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        out += "null";
    } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
        out += fmt::format("{}", *i);
    } else if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d)) {
            out += fmt::format("{}", *d);
        } else {
            out += "null";
        }
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        out += quote_json_string(*s);
    }
}

std::expected<std::string, JsonFieldError>
extract_json_string_field(std::string_view body, std::string_view key) {
    const auto doc = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected(JsonFieldError::kMalformed);
    }

    const auto it = doc.find(std::string(key));
    if (it == doc.end()) {
        return std::unexpected(JsonFieldError::kMissing);
    }
    if (!it->is_string()) {
        return std::unexpected(JsonFieldError::kWrongType);
    }
    return it->get<std::string>();
}
