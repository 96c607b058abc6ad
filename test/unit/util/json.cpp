#include "util/json.hpp"

#include <gtest/gtest.h>

namespace
{

enum class Shape
{
    triangle,
    hexagon
};

struct Inner
{
    int size = 0;
    Shape shape = Shape::triangle;
};

struct Outer
{
    std::string name;
    std::optional<Inner> inner;
    std::vector<Inner> list;
};

void from_json(const nlohmann::json &j, Inner &out)
{
    Json::ObjectDeserializer d(j);
    d(out.size, "size", true);
    d(out.shape, "shape", {
        { Shape::triangle, "triangle" },
        { Shape::hexagon, "hexagon" }
    });
    d();
}

Outer parseOuter(std::string_view jsonString)
{
    Outer out;
    nlohmann::json j = Json::parse(jsonString, true);
    Json::ObjectDeserializer d(j);
    d(out.name, "name");
    d(out.inner, "inner");
    d(out.list, "list");
    d();
    return out;
}

/**
 * Get the key path and message of the exception from parsing something.
 */
std::pair<std::string, std::string> getError(std::string_view jsonString)
{
    try {
        parseOuter(jsonString);
    }
    catch (const Json::ObjectDeserializer::Exception &e) {
        return { e.getKey().value_or("<none>"), e.getMessage() };
    }
    return { "<no exception>", "" };
}

TEST(Json, Deserialize)
{
    Outer out = parseOuter(R"({
        // Comments are allowed.
        "name": "polygons",
        "inner": { "size": 6, "shape": "hexagon" },
        "list": [ { "size": 3 }, { "size": 4, "shape": "triangle" } ]
    })");
    EXPECT_EQ("polygons", out.name);
    ASSERT_TRUE(out.inner);
    EXPECT_EQ(6, out.inner->size);
    EXPECT_EQ(Shape::hexagon, out.inner->shape);
    ASSERT_EQ(2u, out.list.size());
    EXPECT_EQ(3, out.list[0].size);
    EXPECT_EQ(4, out.list[1].size);

    // Missing optional keys leave things as they were.
    Outer empty = parseOuter("{}");
    EXPECT_EQ("", empty.name);
    EXPECT_FALSE(empty.inner);
    EXPECT_TRUE(empty.list.empty());
}

TEST(Json, ErrorPaths)
{
    EXPECT_EQ(std::make_pair(std::string("<none>"), std::string("Value is not an object.")), getError("[]"));
    EXPECT_EQ(std::make_pair(std::string("octopus"), std::string("Unknown key.")), getError(R"({ "octopus": 1 })"));
    EXPECT_EQ("name", getError(R"({ "name": 1 })").first);
    EXPECT_EQ(std::make_pair(std::string("inner.size"), std::string("Required key not found.")),
              getError(R"({ "inner": {} })"));
    EXPECT_EQ("inner.octopus", getError(R"({ "inner": { "size": 1, "octopus": 1 } })").first);
    EXPECT_EQ("inner", getError(R"({ "inner": 1 })").first);
    EXPECT_EQ(std::make_pair(std::string("list"), std::string("Value is not an array.")),
              getError(R"({ "list": {} })"));
    EXPECT_EQ("list[1].size", getError(R"({ "list": [ { "size": 1 }, { "size": "big" } ] })").first);
    EXPECT_EQ(std::make_pair(std::string("list[0].shape"),
                             std::string("Value is \"square\", not any of: \"triangle\", \"hexagon\".")),
              getError(R"({ "list": [ { "size": 1, "shape": "square" } ] })"));
}

TEST(Json, What)
{
    try {
        parseOuter(R"({ "inner": {} })");
        ADD_FAILURE() << "No exception.";
    }
    catch (const Json::ObjectDeserializer::Exception &e) {
        EXPECT_STREQ("Error parsing JSON object at key \"inner.size\": Required key not found.", e.what());
    }
}

TEST(Json, Dump)
{
    EXPECT_EQ(R"({"a":[1,2],"b":"c"})", Json::dump(nlohmann::json{ { "a", { 1, 2 } }, { "b", "c" } }));
}

} // namespace
