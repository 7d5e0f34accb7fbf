#include <gtest/gtest.h>

#include "redlight/json.hpp"

using redlight::JsonError;
using redlight::JsonValue;
using redlight::parseJson;

TEST(Json, ParsesNestedDocument) {
    const JsonValue doc = parseJson(R"({"a": [1, 2.5, true, null], "b": {"c": "d\"eA"}})");
    ASSERT_TRUE(doc.isObject());
    const auto& a = doc.at("a").asArray();
    ASSERT_EQ(a.size(), 4u);
    EXPECT_DOUBLE_EQ(a[0].asNumber(), 1.0);
    EXPECT_DOUBLE_EQ(a[1].asNumber(), 2.5);
    EXPECT_TRUE(a[2].asBool());
    EXPECT_TRUE(a[3].isNull());
    EXPECT_EQ(doc.at("b").getString("c"), "d\"eA");
}

TEST(Json, TypedGettersFallBack) {
    const JsonValue doc = parseJson(R"({"n": 3, "s": "x", "b": false})");
    EXPECT_DOUBLE_EQ(doc.getNumber("n", 9), 3.0);
    EXPECT_DOUBLE_EQ(doc.getNumber("s", 9), 9.0);
    EXPECT_EQ(doc.getString("missing", "dflt"), "dflt");
    EXPECT_FALSE(doc.getBool("b", true));
    EXPECT_TRUE(doc.getBool("n", true));
    EXPECT_THROW(doc.at("missing"), JsonError);
    EXPECT_THROW(doc.at("s").asNumber(), JsonError);
}

TEST(Json, DumpIsParseable) {
    JsonValue doc = redlight::makeObject();
    doc["plate"] = "AB\n12";
    doc["fine"] = 150.25;
    doc["ids"] = redlight::makeArray();
    doc["ids"].asArray().emplace_back("v1");

    const std::string compact = doc.dump(-1);
    EXPECT_EQ(compact.find('\n'), std::string::npos);
    const JsonValue back = parseJson(compact);
    EXPECT_EQ(back.getString("plate"), "AB\n12");
    EXPECT_DOUBLE_EQ(back.getNumber("fine"), 150.25);
    EXPECT_EQ(back.at("ids").asArray().front().asString(), "v1");
}

TEST(Json, RejectsMalformedText) {
    EXPECT_THROW(parseJson("{"), JsonError);
    EXPECT_THROW(parseJson(R"({"a": 1,})"), JsonError);
    EXPECT_THROW(parseJson("[1 2]"), JsonError);
    EXPECT_THROW(parseJson("{} trailing"), JsonError);
    EXPECT_THROW(redlight::parseJsonFile("/nonexistent/redlight.json"), JsonError);
}
