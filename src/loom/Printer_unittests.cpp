#include "loom/Printer.hpp"

#include "loom/Program.hpp"
#include "loom/internal/TestFixtures.hpp"

#include "doctest/doctest.h"

namespace loom {

TEST_CASE("Printer printValue") {
    ir::Value value;
    CHECK(Printer::printValue(value) == "null");

    value.kind = ir::Value::Kind::kString;
    value.text = "say \"hi\"\n\\";
    CHECK(Printer::printValue(value) == "\"say \\\"hi\\\"\\n\\\\\"");

    value.kind = ir::Value::Kind::kVariable;
    value.text = "id";
    CHECK(Printer::printValue(value) == "$id");

    value.kind = ir::Value::Kind::kEnum;
    value.text = "LARGE";
    CHECK(Printer::printValue(value) == "LARGE");

    ir::Value one;
    one.kind = ir::Value::Kind::kInt;
    one.text = "1";
    ir::Value flag;
    flag.kind = ir::Value::Kind::kBoolean;
    flag.text = "true";

    ir::Value list;
    list.kind = ir::Value::Kind::kList;
    list.items = { one, flag };
    CHECK(Printer::printValue(list) == "[1, true]");

    ir::Value object;
    object.kind = ir::Value::Kind::kObject;
    object.fieldNames = { "a", "b" };
    object.items = { one, list };
    CHECK(Printer::printValue(object) == "{a: 1, b: [1, true]}");
}

TEST_CASE("Printer printDefinition") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", R"(
query FeedQuery($id: ID!, $size: Int = 64, $show: Boolean = false) @skip(if: $show) {
  user(id: $id) {
    handle: name
    avatar(size: $size)
    ... @include(if: $show) { email }
    ...Feed_user
  }
}
fragment Feed_user on User { id }
)" }});

    const auto* operation = program->findOperation("FeedQuery");
    REQUIRE(operation);
    CHECK(Printer::printDefinition(*operation) == "query FeedQuery($id: ID!, $size: Int = 64, $show: Boolean = false) "
            "@skip(if: $show) {\n"
            "  user(id: $id) {\n"
            "    handle: name\n"
            "    avatar(size: $size)\n"
            "    ... @include(if: $show) {\n"
            "      email\n"
            "    }\n"
            "    ...Feed_user\n"
            "  }\n"
            "}\n");

    const auto* fragment = program->findFragment("Feed_user");
    REQUIRE(fragment);
    CHECK(Printer::printDefinition(*fragment) == "fragment Feed_user on User {\n  id\n}\n");
}

TEST_CASE("Printer printOperationText") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", R"(
mutation FeedRenameMutation($id: ID!) { rename(id: $id, name: "new") { ...Feed_b } }
fragment Feed_b on User { name ...Feed_a }
fragment Feed_a on User { id }
fragment Feed_unused on User { email }
)" }});

    CHECK(Printer::printOperationText(*program, "FeedRenameMutation") ==
            "mutation FeedRenameMutation($id: ID!) {\n"
            "  rename(id: $id, name: \"new\") {\n"
            "    ...Feed_b\n"
            "  }\n"
            "}\n"
            "\n"
            "fragment Feed_a on User {\n"
            "  id\n"
            "}\n"
            "\n"
            "fragment Feed_b on User {\n"
            "  name\n"
            "  ...Feed_a\n"
            "}\n");
    CHECK(Printer::printOperationText(*program, "Missing").empty());
    CHECK(Printer::printOperationText(*program, "Feed_a").empty());
}

} // namespace loom
