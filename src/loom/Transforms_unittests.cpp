#include "loom/Transforms.hpp"

#include "loom/Printer.hpp"
#include "loom/TransformPipeline.hpp"
#include "loom/internal/TestFixtures.hpp"

#include "doctest/doctest.h"

#include <set>
#include <string>

namespace {

std::string print(const loom::ProgramPtr& program, const std::string& name) {
    const auto* definition = program->findDefinition(name);
    REQUIRE(definition);
    return loom::Printer::printDefinition(*definition);
}

} // namespace

namespace loom {

TEST_CASE("generateTypename") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    std::set<std::string> noBase;
    TransformContext context{ noBase };

    SUBCASE("abstract linked fields select __typename first") {
        auto program = test::buildProgram(sources, schema, {{ "Feed.graphql",
                "query FeedQuery { actor { ... on User { name } } viewer { name } }" }});
        auto transformed = transforms::generateTypename(program, context);
        CHECK(print(transformed, "FeedQuery") == "query FeedQuery {\n"
                                                 "  actor {\n"
                                                 "    __typename\n"
                                                 "    ... on User {\n"
                                                 "      name\n"
                                                 "    }\n"
                                                 "  }\n"
                                                 "  viewer {\n"
                                                 "    name\n"
                                                 "  }\n"
                                                 "}\n");
    }
    SUBCASE("existing __typename is kept") {
        auto program = test::buildProgram(sources, schema, {{ "Feed.graphql",
                "query FeedQuery { actor { __typename } }" }});
        auto transformed = transforms::generateTypename(program, context);
        CHECK(transformed->definitions()[0] == program->definitions()[0]);
    }
}

TEST_CASE("generateIdField") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    std::set<std::string> noBase;
    TransformContext context{ noBase };

    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql",
            "query FeedQuery { viewer { name } node(id: 4) { __typename } actor { __typename } }" }});
    auto transformed = transforms::generateIdField(program, context);
    CHECK(print(transformed, "FeedQuery") == "query FeedQuery {\n"
                                             "  viewer {\n"
                                             "    name\n"
                                             "    id\n"
                                             "  }\n"
                                             "  node(id: 4) {\n"
                                             "    __typename\n"
                                             "    id\n"
                                             "  }\n"
                                             "  actor {\n"
                                             "    __typename\n"
                                             "  }\n"
                                             "}\n");
    // The input Program is never modified.
    CHECK(print(program, "FeedQuery").find("    id\n") == std::string::npos);
}

TEST_CASE("inlineFragments and flattenInlineFragments") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    std::set<std::string> noBase;
    TransformContext context{ noBase };

    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", R"(
query FeedQuery { viewer { ...Feed_user } node(id: 1) { ...Feed_user } }
fragment Feed_user on User { name }
)" }});

    auto inlined = transforms::inlineFragments(program, context);
    CHECK(print(inlined, "FeedQuery") == "query FeedQuery {\n"
                                         "  viewer {\n"
                                         "    ... on User {\n"
                                         "      name\n"
                                         "    }\n"
                                         "  }\n"
                                         "  node(id: 1) {\n"
                                         "    ... on User {\n"
                                         "      name\n"
                                         "    }\n"
                                         "  }\n"
                                         "}\n");
    CHECK(!inlined->findFragment("Feed_user"));
    CHECK(inlined->documentCount() == 1);

    // Only the inline fragment that doesn't narrow the type is merged into its parent.
    auto flattened = transforms::flattenInlineFragments(inlined, context);
    CHECK(print(flattened, "FeedQuery") == "query FeedQuery {\n"
                                           "  viewer {\n"
                                           "    name\n"
                                           "  }\n"
                                           "  node(id: 1) {\n"
                                           "    ... on User {\n"
                                           "      name\n"
                                           "    }\n"
                                           "  }\n"
                                           "}\n");
}

TEST_CASE("skipUnreachableNodes") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    std::set<std::string> noBase;
    TransformContext context{ noBase };

    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", R"(
query FeedQuery($show: Boolean!) {
  viewer {
    name @include(if: false)
    email @skip(if: false)
    avatar @include(if: $show)
  }
  comments @skip(if: true) { body }
}
)" }});
    auto transformed = transforms::skipUnreachableNodes(program, context);
    CHECK(print(transformed, "FeedQuery") == "query FeedQuery($show: Boolean!) {\n"
                                             "  viewer {\n"
                                             "    email\n"
                                             "    avatar @include(if: $show)\n"
                                             "  }\n"
                                             "}\n");
}

TEST_CASE("skipClientExtensions") {
    Sources sources;
    auto schema = test::buildSchema(sources, test::kTestSchema, R"(
extend type User { isSelected: Boolean }
type Draft { text: String }
extend type Query { draft: Draft }
)");
    std::set<std::string> noBase;
    TransformContext context{ noBase };

    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", R"(
query FeedQuery { viewer { name isSelected } draft { ...Feed_draft } }
fragment Feed_draft on Draft { text }
)" }});
    auto transformed = transforms::skipClientExtensions(program, context);
    CHECK(!transformed->findFragment("Feed_draft"));
    CHECK(print(transformed, "FeedQuery") == "query FeedQuery {\n"
                                             "  viewer {\n"
                                             "    name\n"
                                             "  }\n"
                                             "}\n");
}

TEST_CASE("SelectionTransformer drops definitions left without selections") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    std::set<std::string> noBase;
    TransformContext context{ noBase };

    SUBCASE("emptied fragments go with their spreads") {
        auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", R"(
query FeedQuery { viewer { name ...Feed_outer } }
fragment Feed_outer on User { ...Feed_user }
fragment Feed_user on User { isSelected }
)" }});
        auto transformed = transforms::skipClientExtensions(program, context);
        CHECK(!transformed->findFragment("Feed_user"));
        CHECK(!transformed->findFragment("Feed_outer"));
        CHECK(transformed->documentCount() == 1);
        CHECK(print(transformed, "FeedQuery") == "query FeedQuery {\n"
                                                 "  viewer {\n"
                                                 "    name\n"
                                                 "  }\n"
                                                 "}\n");

        auto targets = TransformPipeline::makeDefault().apply(program, noBase);
        auto text = Printer::printOperationText(*targets.find(kOperationTextTarget), "FeedQuery");
        CHECK(text == "query FeedQuery {\n"
                      "  viewer {\n"
                      "    name\n"
                      "    id\n"
                      "  }\n"
                      "}\n");
        // The printed text is valid GraphQL.
        ErrorReporter errorReporter(true);
        CHECK(CompilerState::parseExecutableSource(sources, "FeedText.graphql", text, errorReporter));
    }
    SUBCASE("operations selecting only client extensions") {
        auto program = test::buildProgram(sources, schema, {{ "Feed.graphql",
                "query FeedQuery { viewer { isSelected } }" }});
        auto transformed = transforms::skipClientExtensions(program, context);
        CHECK(!transformed->findOperation("FeedQuery"));
        CHECK(transformed->documentCount() == 0);
    }
    SUBCASE("operations whose every selection is unreachable") {
        auto program = test::buildProgram(sources, schema, {{ "Feed.graphql",
                "query FeedQuery { viewer @include(if: false) { name } }" }});
        auto transformed = transforms::skipUnreachableNodes(program, context);
        CHECK(!transformed->findOperation("FeedQuery"));
    }
}

TEST_CASE("removeBaseFragments and onlyReachableFromOperations") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    std::set<std::string> baseFragmentNames;
    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", R"(
query FeedQuery { viewer { ...Feed_user ...Shared_user } }
fragment Feed_user on User { name ...Feed_avatar }
fragment Feed_avatar on User { avatar }
fragment Feed_unused on User { email }
)" }}, {{ "Shared.graphql", "fragment Shared_user on User { id }" }}, &baseFragmentNames);
    REQUIRE(baseFragmentNames == std::set<std::string>{ "Shared_user" });
    TransformContext context{ baseFragmentNames };

    auto withoutBase = transforms::removeBaseFragments(program, context);
    CHECK(!withoutBase->findFragment("Shared_user"));
    CHECK(withoutBase->documentCount() == program->documentCount() - 1);
    CHECK(program->findFragment("Shared_user"));

    auto reachable = transforms::onlyReachableFromOperations(program, context);
    CHECK(reachable->findOperation("FeedQuery"));
    CHECK(reachable->findFragment("Feed_user"));
    CHECK(reachable->findFragment("Feed_avatar"));
    CHECK(reachable->findFragment("Shared_user"));
    CHECK(!reachable->findFragment("Feed_unused"));
}

TEST_CASE("SelectionTransformer shares unchanged definitions") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    std::set<std::string> noBase;
    TransformContext context{ noBase };

    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", R"(
query FeedQuery { viewer { id name } actor { __typename } }
fragment Feed_user on User { friends { id } }
)" }});
    auto transformed = transforms::skipUnreachableNodes(program, context);
    REQUIRE(transformed->documentCount() == program->documentCount());
    for (size_t i = 0; i < program->documentCount(); ++i) {
        CHECK(transformed->definitions()[i] == program->definitions()[i]);
    }
    CHECK(transformed->schema() == program->schema());
}

} // namespace loom
