// ---------------------------------------------------------------------------
// sql_text.cpp
// ---------------------------------------------------------------------------

#include "parser/sql_text.hpp"

#include <algorithm>
#include <cctype>

std::string_view trim_sql(std::string_view s) noexcept {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

std::string_view strip_statement_terminator(std::string_view s) noexcept {
    auto result = trim_sql(s);
    if (!result.empty() && result.back() == ';') {
        result.remove_suffix(1);
        result = trim_sql(result);
    }
    return result;
}

std::string fold_case(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_word_char(char c) noexcept {
    const auto uc = static_cast<unsigned char>(c);
    return uc < 0x80 && (std::isalnum(uc) != 0 || c == '_');
}

bool contains_word(std::string_view haystack, std::string_view word) noexcept {
    if (word.empty() || haystack.size() < word.size()) {
        return false;
    }
    std::size_t pos = haystack.find(word);
    while (pos != std::string_view::npos) {
        const std::size_t end = pos + word.size();
        const bool left_ok  = (pos == 0) || !is_word_char(haystack[pos - 1]);
        const bool right_ok = (end == haystack.size()) || !is_word_char(haystack[end]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = haystack.find(word, pos + 1);
    }
    return false;
}

std::string_view leading_word(std::string_view s) noexcept {
    const auto body = trim_sql(s);
    std::size_t n = 0;
    while (n < body.size() && is_word_char(body[n])) {
        ++n;
    }
    return body.substr(0, n);
}

NormalizedSql normalize_sql(std::string_view raw) {
    NormalizedSql out;
    out.empty  = trim_sql(raw).empty();
    out.text   = std::string(strip_statement_terminator(raw));
    out.folded = fold_case(out.text);
    return out;
}
