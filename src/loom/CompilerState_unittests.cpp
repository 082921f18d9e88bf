#include "loom/CompilerState.hpp"

#include "loom/AST.hpp"
#include "loom/Config.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/Sources.hpp"
#include "loom/internal/TestFixtures.hpp"

#include "doctest/doctest.h"

#include <set>
#include <string>

namespace {

loom::ProjectConfig makeProject(const std::string& name, const std::string& directory) {
    loom::ProjectConfig project;
    project.name = name;
    project.schemaPath = "schema.graphql";
    project.documentDirectories = { directory };
    return project;
}

std::set<std::string> documentPaths(const loom::ProjectAstSet& astSet) {
    std::set<std::string> paths;
    for (const auto& document : astSet.documents) {
        paths.emplace(document->path);
    }
    return paths;
}

} // namespace

namespace loom {

TEST_CASE("CompilerState documents") {
    CompilerState compilerState;
    CHECK(compilerState.schemaDocuments("app").empty());
    CHECK(compilerState.extensionDocuments("app").empty());

    Sources sources;
    ErrorReporter errorReporter(true);
    auto schema = CompilerState::parseTypeSystemSource(sources, "schema.graphql", test::kTestSchema, errorReporter);
    REQUIRE(schema);
    CHECK(schema->path == "schema.graphql");
    compilerState.addSchema("app", schema);
    compilerState.addExtension("app", schema);
    CHECK(compilerState.schemaDocuments("app").size() == 1);
    CHECK(compilerState.extensionDocuments("app").size() == 1);
    CHECK(compilerState.schemaDocuments("other").empty());
}

TEST_CASE("CompilerState parse failures") {
    Sources sources;
    ErrorReporter errorReporter(true);

    SUBCASE("executable") {
        auto document = CompilerState::parseExecutableSource(sources, "Broken.graphql", "query {", errorReporter);
        CHECK(!document);
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.errors()[0].find("Broken.graphql:1:") == 0);
    }
    SUBCASE("type system") {
        auto document = CompilerState::parseTypeSystemSource(sources, "schema.graphql", "type {", errorReporter);
        CHECK(!document);
        CHECK(errorReporter.errorCount() == 1);
    }
    SUBCASE("text is registered even on failure") {
        CompilerState::parseExecutableSource(sources, "Broken.graphql", "query {", errorReporter);
        CHECK(sources.size() == 1);
    }
}

TEST_CASE("CompilerState loadFromConfig") {
    test::ScratchDirectory scratch;
    scratch.addFile("schema.graphql", test::kTestSchema);
    scratch.addFile("extension.graphql", test::kTestExtension);
    scratch.addFile("app/Feed.graphql", "query FeedQuery { viewer { name } }");
    scratch.addFile("app/nested/Profile.graphql", "fragment Profile_user on User { email }");
    scratch.addFile("app/__generated__/Old.graphql", "query {");
    scratch.addFile("app/notes.txt", "not a document");
    scratch.addFile("other/Other.graphql", "query OtherQuery { viewer { id } }");

    Config config;
    config.rootDirectory = scratch.path();
    auto app = makeProject("app", "app");
    app.extensionPaths = { "extension.graphql" };
    config.projects = { app, makeProject("other", "other") };

    Sources sources;
    CompilerState compilerState;
    AstSets astSets;
    ErrorReporter errorReporter(true);

    SUBCASE("loads every project") {
        REQUIRE(CompilerState::loadFromConfig(config, sources, compilerState, astSets, errorReporter));
        CHECK(errorReporter.ok());

        REQUIRE(compilerState.schemaDocuments("app").size() == 1);
        REQUIRE(compilerState.schemaDocuments("other").size() == 1);
        // The shared schema file is parsed once.
        CHECK(compilerState.schemaDocuments("app")[0] == compilerState.schemaDocuments("other")[0]);
        CHECK(compilerState.extensionDocuments("app").size() == 1);
        CHECK(compilerState.extensionDocuments("other").empty());

        REQUIRE(astSets.size() == 2);
        CHECK(documentPaths(astSets["app"]) ==
                std::set<std::string>{ "app/Feed.graphql", "app/nested/Profile.graphql" });
        CHECK(documentPaths(astSets["other"]) == std::set<std::string>{ "other/Other.graphql" });
    }
    SUBCASE("missing schema file") {
        config.projects[1].schemaPath = "missing.graphql";
        CHECK(!CompilerState::loadFromConfig(config, sources, compilerState, astSets, errorReporter));
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.errors()[0].find("File not found: '") == 0);
        CHECK(errorReporter.errors()[0].find("missing.graphql") != std::string::npos);
        CHECK(compilerState.schemaDocuments("other").empty());
        // Other projects still load.
        CHECK(compilerState.schemaDocuments("app").size() == 1);
        CHECK(astSets["other"].documents.size() == 1);
    }
    SUBCASE("document syntax errors are all reported") {
        scratch.addFile("app/Broken.graphql", "query {");
        scratch.addFile("other/AlsoBroken.graphql", "fragment Broken User { id }");
        CHECK(!CompilerState::loadFromConfig(config, sources, compilerState, astSets, errorReporter));
        CHECK(errorReporter.errorCount() == 2);
        CHECK(documentPaths(astSets["app"]) ==
                std::set<std::string>{ "app/Feed.graphql", "app/nested/Profile.graphql" });
    }
}

} // namespace loom
