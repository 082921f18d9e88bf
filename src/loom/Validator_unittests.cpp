#include "loom/Validator.hpp"

#include "loom/Config.hpp"
#include "loom/Program.hpp"
#include "loom/TransformPipeline.hpp"
#include "loom/internal/TestFixtures.hpp"

#include "doctest/doctest.h"

namespace loom {

TEST_CASE("Validator moduleName") {
    CHECK(Validator::moduleName("src/Feed.graphql") == "Feed");
    CHECK(Validator::moduleName("Feed.react.graphql") == "Feed");
    CHECK(Validator::moduleName("a\\b\\Story.graphql") == "Story");
    CHECK(Validator::moduleName("NoExtension") == "NoExtension");
}

TEST_CASE("Validator valid program") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", R"(
query FeedQuery($first: Int) { viewer { ...Feed_user friends(first: $first) { id } } }
fragment Feed_user on User { name }
fragment FeedAvatar on User { avatar }
)" }});
    ProjectConfig projectConfig;
    projectConfig.name = "app";
    CHECK(Validator::validate(*program, projectConfig).empty());
    CHECK(Validator::validateProgram(program.get()));
}

TEST_CASE("Validator reports every violation") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    ProjectConfig projectConfig;
    projectConfig.name = "app";

    SUBCASE("two violations in one batch") {
        auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", R"(
query Viewer { viewer { id: name } }
)" }});
        auto diagnostics = Validator::validate(*program, projectConfig);
        REQUIRE(diagnostics.size() == 2);
        CHECK(diagnostics[0].message == "Operation 'Viewer' must be named 'Feed<Name>Query', starting with the module "
                "name and ending with 'Query'");
        CHECK(diagnostics[1].message == "Aliasing field 'name' as 'id' is not allowed, 'id' is reserved for object "
                "identifiers");
    }
    SUBCASE("violations from separate documents share one batch") {
        auto program = test::buildProgram(sources, schema, {
                { "app/Feed.graphql", "query Viewer { viewer { name } }" },
                { "app/Profile.graphql", "fragment Profile_user on User { id: name }" } });
        auto diagnostics = Validator::validate(*program, projectConfig);
        REQUIRE(diagnostics.size() == 2);
        CHECK(diagnostics[0].message == "Operation 'Viewer' must be named 'Feed<Name>Query', starting with the module "
                "name and ending with 'Query'");
        CHECK(diagnostics[1].message == "Aliasing field 'name' as 'id' is not allowed, 'id' is reserved for object "
                "identifiers");
        CHECK(diagnostics[0].locations[0].sourceID != diagnostics[1].locations[0].sourceID);
    }
    SUBCASE("fragment naming") {
        auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql",
                "fragment UserName on User { name }" }});
        auto diagnostics = Validator::validate(*program, projectConfig);
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].message == "Fragment 'UserName' must be named 'Feed_<name>' or 'Feed<Name>', starting "
                "with the module name");
    }
    SUBCASE("mutation suffix") {
        auto program = test::buildProgram(sources, schema, {{ "app/Rename.graphql",
                "mutation RenameQuery { rename(id: 1, name: \"a\") { id } }" }});
        auto diagnostics = Validator::validate(*program, projectConfig);
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].message.find("must be named 'Rename<Name>Mutation'") != std::string::npos);
    }
    SUBCASE("__typename on the operation root") {
        auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", "query FeedQuery { __typename }" }});
        auto diagnostics = Validator::validate(*program, projectConfig);
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].message == "Selecting '__typename' on the root of query 'FeedQuery' is not allowed");
    }
    SUBCASE("unused variables") {
        auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", R"(
query FeedQuery($first: Int, $unused: String) { viewer { ...Feed_user } }
fragment Feed_user on User { friends(first: $first) { id } }
)" }});
        auto diagnostics = Validator::validate(*program, projectConfig);
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].message == "Variable '$unused' is never used in operation 'FeedQuery'");
    }
    SUBCASE("selection depth") {
        projectConfig.maxSelectionDepth = 2;
        auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql",
                "query FeedQuery { viewer { friends { friends { id } } } }" }});
        auto diagnostics = Validator::validate(*program, projectConfig);
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].message == "Selections in 'FeedQuery' are nested 3 levels deep, deeper than the maximum "
                "of 2");
    }
    SUBCASE("base fragments are skipped") {
        std::set<std::string> baseFragmentNames;
        auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql",
                "query FeedQuery { viewer { ...Shared_user } }" }}, {{ "shared/Shared.graphql",
                "fragment Shared_user on User { id: name }" }}, &baseFragmentNames);
        CHECK(baseFragmentNames.count("Shared_user") == 1);
        CHECK(!Validator::validate(*program, projectConfig).empty());
        CHECK(Validator::validate(*program, projectConfig, baseFragmentNames).empty());
    }
}

TEST_CASE("Validator consistency checks") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", R"(
query FeedQuery { viewer { ...Feed_user } }
fragment Feed_user on User { name }
)" }});

    SUBCASE("default pipeline output is consistent") {
        auto targets = TransformPipeline::makeDefault().apply(program, {});
        CHECK(Validator::validateTargets(program.get(), targets, {}));
    }
    SUBCASE("null and duplicate definitions are caught") {
        CHECK(!Validator::validateProgram(nullptr));
        auto duplicated = program->withDefinitions({ program->definitions()[0], program->definitions()[0] });
        CHECK(!Validator::validateProgram(duplicated.get()));
    }
    SUBCASE("definitions without selections are caught") {
        auto emptied = std::make_shared<ir::Definition>(*program->definitions()[1]);
        emptied->selections.clear();
        CHECK(!Validator::validateProgram(program->withDefinitions({ program->definitions()[0], emptied }).get()));
    }
    SUBCASE("dangling spreads are caught") {
        TargetPrograms targets;
        targets.programs.emplace_back(std::make_pair(std::string("broken"),
                program->withDefinitions({ program->definitions()[0] })));
        CHECK(!Validator::validateTargets(program.get(), targets, {}));
    }
    SUBCASE("normalization must not spread fragments") {
        TargetPrograms targets;
        targets.programs.emplace_back(std::make_pair(std::string(kNormalizationTarget), program));
        CHECK(!Validator::validateTargets(program.get(), targets, {}));
    }
}

} // namespace loom
