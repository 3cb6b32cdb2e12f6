// Nested JSON string expansion

#include "json_formatter_core.hpp"

#include <gtest/gtest.h>

TEST(ExpansionTest, ExpandsEmbeddedObject)
{
    json v = parseJson(R"({"x":"{\"y\":2}"})");
    EXPECT_EQ(expandNested(v), parseJson(R"({"x":{"y":2}})"));
}

TEST(ExpansionTest, ExpandsDoublyEncodedString)
{
    json v = parseJson(R"({"x":"\"{\\\"y\\\":2}\""})");
    EXPECT_EQ(expandNested(v), parseJson(R"({"x":{"y":2}})"));
}

TEST(ExpansionTest, ExpandsStringsInsideReplacement)
{
    json v = parseJson(R"({"a":"{\"b\":\"[1, \\\"{}\\\"]\"}"})");
    EXPECT_EQ(expandNested(v), parseJson(R"({"a":{"b":[1,{}]}})"));
}

TEST(ExpansionTest, LeavesPlainStringsAlone)
{
    json v = parseJson(R"({"s":"hello","t":"{not json","u":""})");
    EXPECT_EQ(expandNested(v), v);
}

TEST(ExpansionTest, ScalarTextBecomesScalar)
{
    json v = parseJson(R"({"n":"42","b":"true","z":"null"})");
    EXPECT_EQ(expandNested(v), parseJson(R"({"n":42,"b":true,"z":null})"));
}

TEST(ExpansionTest, ExpandsArrayElements)
{
    json v = parseJson(R"(["[1,2]","x",3])");
    EXPECT_EQ(expandNested(v), parseJson(R"([[1,2],"x",3])"));
}

TEST(ExpansionTest, LeavesRootStringAlone)
{
    json root("{\"k\":true}");
    EXPECT_EQ(expandNested(root), root);
    EXPECT_TRUE(expandNested(parseJson(R"("[1,2]")")).is_string());
}

TEST(ExpansionTest, ExpandsStringInsideSingleElementArray)
{
    EXPECT_EQ(expandNested(parseJson(R"(["{\"k\":true}"])")), parseJson(R"([{"k":true}])"));
}

TEST(ExpansionTest, KeepsKeyOrder)
{
    json v = parseJson(R"({"z":"[]","a":1,"m":"{\"q\":1,\"b\":2}"})");
    EXPECT_EQ(serializeJson(expandNested(v), SerializeMode::Compact), R"({"z":[],"a":1,"m":{"q":1,"b":2}})");
}

TEST(ExpansionTest, DoesNotModifyInput)
{
    json v = parseJson(R"({"x":"{\"y\":2}"})");
    json copy = v;
    expandNested(v);
    EXPECT_EQ(v, copy);
}

TEST(ExpansionTest, IsIdempotent)
{
    const char *samples[] = {
        R"({"x":"{\"y\":2}"})",
        R"({"x":"\"{\\\"y\\\":2}\""})",
        R"(["1","a","[\"b\"]",{"c":"{}"}])",
        R"("\"\\\"nested\\\"\"")",
        R"({"plain":"text","num":3.5,"none":null})",
    };
    for (const char *text : samples)
    {
        json once = expandNested(parseJson(text));
        EXPECT_EQ(expandNested(once), once) << text;
    }
}
