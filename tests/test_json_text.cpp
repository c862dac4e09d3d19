#include <gtest/gtest.h>
#include <shellsage/ai/json_text.hpp>

using namespace shellsage::ai;

TEST(JsonText, EscapeControlCharacters) {
    EXPECT_EQ(escape_json("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
    EXPECT_EQ(escape_json(std::string("x\x01y")), "x\\u0001y");
}

TEST(JsonText, ExtractStringWithEscapes) {
    std::string body = R"({"model":"llama3","response":"🧠 Analysis: ok\n🛠️ Command: `ls \"-la\"`","done":true})";
    auto v = extract_json_string(body, "response");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "🧠 Analysis: ok\n🛠️ Command: `ls \"-la\"`");
}

TEST(JsonText, UnicodeEscapesDecoded) {
    auto v = extract_json_string(R"({"t":"caf\u00e9 \ud83d\ude00 \/tmp"})", "t");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "café 😀 /tmp");
}

TEST(JsonText, SearchStartsAtOffset) {
    std::string body = R"({"error":null,"choices":[{"message":{"role":"assistant","content":"hi"}}],"content":"late"})";
    EXPECT_EQ(extract_json_string(body, "content", body.find("\"choices\"")).value_or(""), "hi");
}

TEST(JsonText, MissingOrNonString) {
    EXPECT_FALSE(extract_json_string(R"({"a":1})", "a").has_value());
    EXPECT_FALSE(extract_json_string(R"({"a":"x"})", "b").has_value());
    EXPECT_FALSE(extract_json_string(R"({"a":"unterminated)", "a").has_value());
}

TEST(JsonText, ExtractInt) {
    std::string body = R"({"usage":{"prompt_tokens": 12,"completion_tokens":30,"total_tokens":42}})";
    EXPECT_EQ(extract_json_int(body, "prompt_tokens"), 12);
    EXPECT_EQ(extract_json_int(body, "total_tokens"), 42);
    EXPECT_EQ(extract_json_int(body, "missing"), -1);
}
