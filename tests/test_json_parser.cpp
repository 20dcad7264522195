//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json_parser.cpp
// Purpose: GoogleTests for the JSON parser, serializer and typed object lookups
//==========================================================================================================

#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "authgate/JSONValue.h"

using namespace authgate;

TEST(JSONParser, ParsesNestedDocument) {
    JSONValue v = parseJSON(R"({"keys":[{"kid":"a","n":1},{"kid":"b","ok":true}],"x":null,"f":1.5})");
    const JSONValue::Object* obj = asObject(v);
    ASSERT_NE(obj, nullptr);
    const JSONValue* keys = findMember(*obj, "keys");
    ASSERT_NE(keys, nullptr);
    const auto* arr = std::get_if<JSONValue::Array>(&keys->value);
    ASSERT_NE(arr, nullptr);
    ASSERT_EQ(arr->size(), 2u);
    EXPECT_EQ(findString(*asObject(*(*arr)[0]), "kid").value_or(""), "a");
    EXPECT_EQ(findInt64(*asObject(*(*arr)[0]), "n").value_or(0), 1);
    EXPECT_EQ(findBool(*asObject(*(*arr)[1]), "ok").value_or(false), true);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(findMember(*obj, "x")->value));
    EXPECT_DOUBLE_EQ(std::get<double>(findMember(*obj, "f")->value), 1.5);
}

TEST(JSONParser, RejectsTrailingContent) {
    EXPECT_THROW(parseJSON("{} {}"), JSONParseError);
    EXPECT_THROW(parseJSON("[1,2] x"), JSONParseError);
    EXPECT_NO_THROW(parseJSON("  {\"a\":1}  \n"));
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(parseJSON(""), JSONParseError);
    EXPECT_THROW(parseJSON("{\"a\":}"), JSONParseError);
    EXPECT_THROW(parseJSON("{\"a\" 1}"), JSONParseError);
    EXPECT_THROW(parseJSON("[1,2"), JSONParseError);
    EXPECT_THROW(parseJSON("\"unterminated"), JSONParseError);
    EXPECT_THROW(parseJSON("\"bad \\q escape\""), JSONParseError);
}

TEST(JSONParser, RejectsExcessiveNesting) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    EXPECT_THROW(parseJSON(deep), JSONParseError);

    std::string ok(10, '[');
    ok += std::string(10, ']');
    EXPECT_NO_THROW(parseJSON(ok));
}

TEST(JSONParser, DecodesUnicodeEscapesAndSurrogatePairs) {
    JSONValue v = parseJSON(R"(["\u00e9", "\ud83d\ude00", "\ud800"])");
    const auto& arr = std::get<JSONValue::Array>(v.value);
    EXPECT_EQ(std::get<std::string>(arr[0]->value), "\xC3\xA9");
    EXPECT_EQ(std::get<std::string>(arr[1]->value), "\xF0\x9F\x98\x80");
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "\xEF\xBF\xBD");
}

TEST(JSONParser, LargeIntegersFallBackToDouble) {
    JSONValue v = parseJSON("{\"big\":123456789012345678901234567890}");
    const auto* big = findMember(*asObject(v), "big");
    ASSERT_NE(big, nullptr);
    EXPECT_TRUE(std::holds_alternative<double>(big->value));
}

TEST(JSONSerialize, EscapesStringsAndKeys) {
    JSONValue::Object o;
    o["q\"k"] = std::make_shared<JSONValue>("line\nbreak \"quoted\"");
    std::string s = serializeJSONValue(JSONValue(o));
    EXPECT_EQ(s, "{\"q\\\"k\":\"line\\nbreak \\\"quoted\\\"\"}");
    JSONValue back = parseJSON(s);
    EXPECT_EQ(findString(*asObject(back), "q\"k").value_or(""), "line\nbreak \"quoted\"");
}

TEST(JSONLookup, Int64LookupRejectsValuesOutsideTheInt64Range) {
    JSONValue v = parseJSON(R"({"min":-9223372036854775808,"two63":9223372036854775808,"big":1e19,"neg":-1e19})");
    const auto& obj = *asObject(v);
    EXPECT_EQ(findInt64(obj, "min").value_or(0), std::numeric_limits<int64_t>::min());
    EXPECT_FALSE(findInt64(obj, "two63").has_value());
    EXPECT_FALSE(findInt64(obj, "big").has_value());
    EXPECT_FALSE(findInt64(obj, "neg").has_value());
}

TEST(JSONLookup, TypedAccessorsIgnoreOtherTypes) {
    JSONValue v = parseJSON(R"({"s":"x","n":7,"d":9.9,"b":false,"l":["a",1,"b"],"one":"solo"})");
    const auto& obj = *asObject(v);
    EXPECT_FALSE(findString(obj, "n").has_value());
    EXPECT_FALSE(findBool(obj, "s").has_value());
    EXPECT_EQ(findInt64(obj, "d").value_or(0), 9);
    EXPECT_FALSE(findInt64(obj, "missing").has_value());
    auto list = findStringList(obj, "l");
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(*list, (std::vector<std::string>{"a", "b"}));
    auto solo = findStringList(obj, "one");
    ASSERT_TRUE(solo.has_value());
    EXPECT_EQ(*solo, (std::vector<std::string>{"solo"}));
    EXPECT_FALSE(findStringList(obj, "n").has_value());
    EXPECT_EQ(asObject(JSONValue(int64_t{3})), nullptr);
}
