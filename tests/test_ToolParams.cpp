#include <gtest/gtest.h>
#include "tools/ToolParams.h"

using nlohmann::json;

TEST(ToolParamsTest, StringReadsNativeAndDumpsOtherTypes) {
    json params = {{"type", "error"}, {"count", 5}, {"blank", "   "}, {"none", nullptr}};

    EXPECT_EQ(ToolParams::getString(params, "type"), std::optional<std::string>("error"));
    EXPECT_EQ(ToolParams::getString(params, "count"), std::optional<std::string>("5"));
    EXPECT_FALSE(ToolParams::getString(params, "blank").has_value());
    EXPECT_FALSE(ToolParams::getString(params, "none").has_value());
    EXPECT_FALSE(ToolParams::getString(params, "missing").has_value());
}

TEST(ToolParamsTest, IntAcceptsNumbersAndNumericStrings) {
    json params = {{"a", 42}, {"b", "17"}, {"c", " -3 "}, {"d", -5}};

    EXPECT_EQ(ToolParams::getInt(params, "a", 0), 42);
    EXPECT_EQ(ToolParams::getInt(params, "b", 0), 17);
    EXPECT_EQ(ToolParams::getInt(params, "c", 0), -3);
    EXPECT_EQ(ToolParams::getInt(params, "d", 0), -5);
}

TEST(ToolParamsTest, IntAcceptsWholeValuedFloats) {
    json params = {{"limit", 10.0}, {"offset", -2.0}, {"big", 1e12}};

    EXPECT_EQ(ToolParams::getInt(params, "limit", 50), 10);
    EXPECT_EQ(ToolParams::getInt(params, "offset", 0), -2);
    EXPECT_EQ(ToolParams::getInt(params, "big", 50), 50);
}

TEST(ToolParamsTest, IntFallsBackOnAnythingElse) {
    json params = {
        {"float", 4.2},
        {"word", "ten"},
        {"partial", "12abc"},
        {"flag", true},
        {"huge", "99999999999999"},
        {"hugeNumber", 99999999999LL},
        {"null", nullptr}
    };

    for (const char* key : {"float", "word", "partial", "flag", "huge", "hugeNumber", "null", "missing"}) {
        EXPECT_EQ(ToolParams::getInt(params, key, 50), 50) << key;
    }
}

TEST(ToolParamsTest, BoolAcceptsNativeAndCaseInsensitiveText) {
    json params = {{"a", true}, {"b", "False"}, {"c", " TRUE "}, {"d", false}};

    EXPECT_TRUE(ToolParams::getBool(params, "a", false));
    EXPECT_FALSE(ToolParams::getBool(params, "b", true));
    EXPECT_TRUE(ToolParams::getBool(params, "c", false));
    EXPECT_FALSE(ToolParams::getBool(params, "d", true));
}

TEST(ToolParamsTest, BoolFallsBackOnAnythingElse) {
    json params = {{"one", 1}, {"yes", "yes"}, {"null", nullptr}};

    EXPECT_TRUE(ToolParams::getBool(params, "one", true));
    EXPECT_FALSE(ToolParams::getBool(params, "yes", false));
    EXPECT_TRUE(ToolParams::getBool(params, "null", true));
    EXPECT_FALSE(ToolParams::getBool(params, "missing", false));
}

TEST(ToolParamsTest, NonObjectParamsGiveDefaults) {
    json params = json::array({1, 2});
    EXPECT_FALSE(ToolParams::getString(params, "type").has_value());
    EXPECT_EQ(ToolParams::getInt(params, "limit", 7), 7);
    EXPECT_TRUE(ToolParams::getBool(params, "flag", true));
}
