// ---------------------------------------------------------------------------
// test_json_util.cpp
//
// JSON 출력 / 요청 본문 필드 추출 단위 테스트.
//
// [테스트 범위]
// - escape_json_string: 따옴표, 역슬래시, 제어 문자
// - append_json_value: NULL, 정수, 실수(비유한 → null), 문자열
// - extract_json_string_field: 정상 / 누락 / 타입 불일치 / 문법 오류
//   유니코드 이스케이프, 서로게이트 쌍, 중복 키, 최상위 비-객체
// ---------------------------------------------------------------------------

#include "common/json_util.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

TEST(JsonUtil, EscapesSpecialCharacters) {
    EXPECT_EQ(escape_json_string("plain"), "plain");
    EXPECT_EQ(escape_json_string("a\"b"), "a\\\"b");
    EXPECT_EQ(escape_json_string("back\\slash"), "back\\\\slash");
    EXPECT_EQ(escape_json_string("l1\nl2\r\t"), "l1\\nl2\\r\\t");
    EXPECT_EQ(escape_json_string(std::string("\x01\x1f", 2)), "\\u0001\\u001f");
    EXPECT_EQ(escape_json_string("한글"), "한글") << "UTF-8 bytes pass through";
    EXPECT_EQ(quote_json_string("x\"y"), "\"x\\\"y\"");
}

TEST(JsonUtil, AppendsSqlValues) {
    std::string out;
    append_json_value(out, SqlValue{});
    out += ',';
    append_json_value(out, SqlValue{std::int64_t{-42}});
    out += ',';
    append_json_value(out, SqlValue{1.5});
    out += ',';
    append_json_value(out, SqlValue{std::string("hi \"there\"")});
    EXPECT_EQ(out, "null,-42,1.5,\"hi \\\"there\\\"\"");
}

TEST(JsonUtil, NonFiniteDoublesBecomeNull) {
    std::string out;
    append_json_value(out, SqlValue{std::numeric_limits<double>::infinity()});
    out += ',';
    append_json_value(out, SqlValue{std::numeric_limits<double>::quiet_NaN()});
    EXPECT_EQ(out, "null,null");
}

TEST(JsonUtil, DoublesUseShortestForm) {
    std::string out;
    append_json_value(out, SqlValue{0.1});
    out += ',';
    append_json_value(out, SqlValue{2.0});
    EXPECT_EQ(out, "0.1,2");
}

TEST(JsonUtil, ExtractsStringField) {
    auto sql = extract_json_string_field(R"({"sql": "SELECT * FROM tablename"})", "sql");
    ASSERT_TRUE(sql.has_value());
    EXPECT_EQ(*sql, "SELECT * FROM tablename");

    auto other_fields = extract_json_string_field(
        R"( { "a": [1, {"b": null}], "sql" : "x", "n": -1.5e3, "t": true } )", "sql");
    ASSERT_TRUE(other_fields.has_value());
    EXPECT_EQ(*other_fields, "x");
}

TEST(JsonUtil, UnescapesStringValue) {
    auto v = extract_json_string_field(R"({"sql":"a\"b\\c\/d\nAé"})", "sql");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "a\"b\\c/d\nA\xC3\xA9");

    auto pair = extract_json_string_field(R"({"sql":"\ud83d\ude00"})", "sql");
    ASSERT_TRUE(pair.has_value());
    EXPECT_EQ(*pair, "\xF0\x9F\x98\x80");
}

TEST(JsonUtil, LoneSurrogateIsMalformed) {
    EXPECT_EQ(extract_json_string_field(R"({"sql":"\ud83d"})", "sql").error(),
              JsonFieldError::kMalformed);
    EXPECT_EQ(extract_json_string_field(R"({"sql":"\ude00"})", "sql").error(),
              JsonFieldError::kMalformed);
}

TEST(JsonUtil, MissingField) {
    auto v = extract_json_string_field(R"({"query":"SELECT 1"})", "sql");
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error(), JsonFieldError::kMissing);

    auto empty = extract_json_string_field("{}", "sql");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), JsonFieldError::kMissing);
}

TEST(JsonUtil, WrongType) {
    for (const char* body : {R"({"sql": 1})", R"({"sql": null})", R"({"sql": ["x"]})",
                             R"({"sql": {"x": "y"}})", R"({"sql": false})"}) {
        auto v = extract_json_string_field(body, "sql");
        ASSERT_FALSE(v.has_value()) << body;
        EXPECT_EQ(v.error(), JsonFieldError::kWrongType) << body;
    }
}

TEST(JsonUtil, DuplicateKeyUsesLastValue) {
    auto v = extract_json_string_field(R"({"sql":"first","sql":"second"})", "sql");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "second");

    auto typed = extract_json_string_field(R"({"sql":"first","sql":2})", "sql");
    ASSERT_FALSE(typed.has_value());
    EXPECT_EQ(typed.error(), JsonFieldError::kWrongType);
}

TEST(JsonUtil, MalformedBodies) {
    for (const char* body : {"", "null", "\"sql\"", "[]", "{", R"({"sql":"x")",
                             R"({"sql":"x"} trailing)", R"({"sql":"x",})", R"({sql:"x"})",
                             R"({"sql":"x" "y":1})", R"({"n": 01, "sql":"x"})",
                             R"({"sql":"bad \q escape"})", "{\"sql\":\"raw\nnewline\"}"}) {
        auto v = extract_json_string_field(body, "sql");
        ASSERT_FALSE(v.has_value()) << body;
        EXPECT_EQ(v.error(), JsonFieldError::kMalformed) << body;
    }
}

TEST(JsonUtil, DeepNestingElsewhereIsAccepted) {
    std::string deep = R"({"sql":"x","d":)";
    deep += std::string(200, '[');
    deep += std::string(200, ']');
    deep += "}";
    auto v = extract_json_string_field(deep, "sql");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "x");
}

TEST(JsonUtil, InvalidUtf8InStringIsMalformed) {
    const std::string body = "{\"sql\":\"\xC3\x28\"}";
    auto v = extract_json_string_field(body, "sql");
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error(), JsonFieldError::kMalformed);
}
