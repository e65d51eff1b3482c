#include <gtest/gtest.h>
#include "json_util.h"

namespace pyexec {
namespace {

// ============================================================================
// Test Contract: Writing
// ============================================================================

TEST(JsonUtilTest, WritesCompactSingleLine) {
    Json::Value doc;
    doc["a"] = 1;
    doc["b"] = "x";

    std::string out = write_json(doc);
    EXPECT_EQ(out.find('\n'), std::string::npos) << out;
    EXPECT_EQ(out, "{\"a\":1,\"b\":\"x\"}");
}

TEST(JsonUtilTest, EscapedTextRoundTrips) {
    std::string awkward = "line\n\t\"quoted\"\\ \x02 end caf\xc3\xa9";
    Json::Value doc;
    doc["k"] = awkward;

    std::string out = write_json(doc);
    EXPECT_NE(out.find("\\u0002"), std::string::npos) << "Control characters must be escaped";
    EXPECT_NE(out.find("caf\xc3\xa9"), std::string::npos) << "UTF-8 passes through";
    EXPECT_EQ(*get_string(parse_json(out), "k"), awkward);
}

TEST(JsonUtilTest, ArrayAndObjectBuilders) {
    Json::Value empty_array = to_json_array({});
    EXPECT_TRUE(empty_array.isArray());
    EXPECT_EQ(empty_array.size(), 0u);

    Json::Value packages = to_json_array({"numpy", "a\"b"});
    ASSERT_EQ(packages.size(), 2u);
    EXPECT_EQ(packages[1].asString(), "a\"b");

    Json::Value env = to_json_object({{"B", "2"}, {"A", "1"}});
    EXPECT_TRUE(env.isObject());
    EXPECT_EQ(env["A"].asString(), "1");
    EXPECT_EQ(write_json(to_json_object({})), "{}");
}

// ============================================================================
// Test Contract: Parsing
// ============================================================================

TEST(JsonUtilTest, ParsesRequestBody) {
    Json::Value body = parse_json(
        R"({"session_id": "s1", "packages": ["numpy", "pandas==2.0"], "env": {"MODE": "x"}, "n": -12})");

    ASSERT_TRUE(body.isObject());
    EXPECT_EQ(get_string(body, "session_id"), "s1");
    EXPECT_EQ(*get_string_array(body, "packages"), (std::vector<std::string>{"numpy", "pandas==2.0"}));
    EXPECT_EQ(get_string_map(body, "env")->at("MODE"), "x");
    EXPECT_EQ(get_int(body, "n"), -12);
    EXPECT_FALSE(get_string(body, "absent").has_value());
}

TEST(JsonUtilTest, NullMembersReadAsAbsent) {
    Json::Value body = parse_json(R"({"env": null, "code": null})");
    EXPECT_FALSE(get_string_map(body, "env").has_value());
    EXPECT_FALSE(get_string(body, "code").has_value());
}

TEST(JsonUtilTest, WrongMemberTypesThrow) {
    Json::Value body = parse_json(R"({"code": 5, "packages": "numpy", "env": {"A": 1}, "f": 1.5, "b": true, "mixed": ["a", 1]})");
    EXPECT_THROW(get_string(body, "code"), JsonParseError);
    EXPECT_THROW(get_string_array(body, "packages"), JsonParseError);
    EXPECT_THROW(get_string_array(body, "mixed"), JsonParseError);
    EXPECT_THROW(get_string_map(body, "env"), JsonParseError);
    EXPECT_THROW(get_int(body, "f"), JsonParseError);
    EXPECT_THROW(get_int(body, "b"), JsonParseError);
}

TEST(JsonUtilTest, AccessorsOnNonObjectsReadAsAbsent) {
    Json::Value array = parse_json("[1, 2]");
    EXPECT_FALSE(get_string(array, "x").has_value());
}

TEST(JsonUtilTest, DecodesEscapes) {
    Json::Value v = parse_json(R"({"s": "a\"b\\c\nd\u00e9\ud83d\ude00"})");
    EXPECT_EQ(*get_string(v, "s"), "a\"b\\c\nd\xc3\xa9\xf0\x9f\x98\x80");
}

TEST(JsonUtilTest, RejectsMalformedDocuments) {
    EXPECT_THROW(parse_json(""), JsonParseError);
    EXPECT_THROW(parse_json("{"), JsonParseError);
    EXPECT_THROW(parse_json("{\"a\":1,}"), JsonParseError);
    EXPECT_THROW(parse_json("{\"a\" 1}"), JsonParseError);
    EXPECT_THROW(parse_json("[1 2]"), JsonParseError);
    EXPECT_THROW(parse_json("{} extra"), JsonParseError);
    EXPECT_THROW(parse_json("{\"a\":1} // comment"), JsonParseError);
    EXPECT_THROW(parse_json("{\"a\":1,\"a\":2}"), JsonParseError) << "Duplicate keys are rejected";
}

TEST(JsonUtilTest, RejectsScalarRoots) {
    EXPECT_THROW(parse_json("\"text\""), JsonParseError);
    EXPECT_THROW(parse_json("42"), JsonParseError);
}

TEST(JsonUtilTest, RejectsExcessiveNesting) {
    std::string deep(100, '[');
    deep += std::string(100, ']');
    EXPECT_THROW(parse_json(deep), JsonParseError);

    std::string shallow(8, '[');
    shallow += std::string(8, ']');
    EXPECT_NO_THROW(parse_json(shallow));
}

} // namespace
} // namespace pyexec
