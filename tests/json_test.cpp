// json_test.cpp - Json value type: parsing, dumping and lookup helpers

#include <patchwise/json.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using patchwise::Json;
using patchwise::JsonArray;
using patchwise::JsonObject;

TEST(JsonParse, nested_object_with_every_scalar_type) {
    auto value = Json::parse(R"({"a": 1, "b": [true, false, null], "c": "text", "d": -2.5})");
    ASSERT_TRUE(value.is_object());
    const auto& obj = value.as_object();
    EXPECT_DOUBLE_EQ(obj.at("a").as_number(), 1.0);
    ASSERT_TRUE(obj.at("b").is_array());
    EXPECT_TRUE(obj.at("b").as_array()[0].as_bool());
    EXPECT_TRUE(obj.at("b").as_array()[2].is_null());
    EXPECT_EQ(obj.at("c").as_string(), "text");
    EXPECT_DOUBLE_EQ(obj.at("d").as_number(), -2.5);
}

TEST(JsonParse, escapes_and_surrogate_pairs) {
    auto value = Json::parse(R"("line\nbreak \"quoted\" é 😀")");
    EXPECT_EQ(value.as_string(), "line\nbreak \"quoted\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JsonParse, truncated_input_throws) {
    EXPECT_THROW(Json::parse(R"({"path": "src/ma)"), std::runtime_error);
    EXPECT_THROW(Json::parse(R"([1, 2)"), std::runtime_error);
    EXPECT_THROW(Json::parse(R"({"a": 1)"), std::runtime_error);
}

TEST(JsonParse, trailing_garbage_throws) {
    EXPECT_THROW(Json::parse("{} x"), std::runtime_error);
}

TEST(JsonDump, integral_numbers_print_without_fraction) {
    JsonObject obj;
    obj["max_tokens"] = Json(8000);
    obj["temperature"] = Json(0.5);
    EXPECT_EQ(Json(obj).dump(), R"({"max_tokens":8000,"temperature":0.5})");
}

TEST(JsonDump, control_characters_are_escaped) {
    EXPECT_EQ(Json(std::string("a\tb\x01")).dump(), "\"a\\tb\\u0001\"");
}

TEST(JsonDump, pretty_output_reparses_to_same_value) {
    JsonArray folders;
    folders.emplace_back(Json("/tmp/a"));
    JsonObject obj;
    obj["approved_folders"] = Json(folders);
    obj["model"] = Json("qwen3-coder");
    const std::string pretty = Json(obj).dump_pretty();
    EXPECT_NE(pretty.find('\n'), std::string::npos);
    EXPECT_EQ(Json::parse(pretty).dump(), Json(obj).dump());
}

TEST(JsonLookup, typed_helpers_reject_wrong_types) {
    auto value = Json::parse(R"({"name": "x", "flag": true, "count": 3})");
    const auto& obj = value.as_object();
    EXPECT_EQ(patchwise::find_string(obj, "name").value_or(""), "x");
    EXPECT_FALSE(patchwise::find_string(obj, "count").has_value());
    EXPECT_TRUE(patchwise::find_bool(obj, "flag").value_or(false));
    EXPECT_DOUBLE_EQ(patchwise::find_number(obj, "count").value_or(0), 3.0);
    EXPECT_EQ(patchwise::find_member(obj, "missing"), nullptr);
}
