#include "loom/Config.hpp"

#include "loom/ErrorReporter.hpp"

#include "doctest/doctest.h"

namespace loom {

TEST_CASE("Config parse") {
    SUBCASE("full config") {
        ErrorReporter errorReporter(true);
        auto config = Config::parse(R"({
            // Comments are allowed.
            "root": "app",
            "header": "@generated by loom",
            "artifactExtension": ".json",
            "removeStaleArtifacts": true,
            "projects": {
                "web": {
                    "schema": "schema.graphql",
                    "extensions": ["web/ext.graphql"],
                    "documents": ["web/src"],
                    "base": "shared",
                    "output": "web/__generated__",
                    "persist": true,
                    "maxSelectionDepth": 10
                },
                "shared": {
                    "schema": "schema.graphql",
                    "documents": ["shared"]
                }
            }
        })", "/work", &errorReporter);
        REQUIRE(config);
        CHECK(errorReporter.ok());
        CHECK(config->rootDirectory == std::filesystem::path("/work/app"));
        CHECK(config->header == "@generated by loom");
        CHECK(config->artifactExtension == ".json");
        CHECK(config->removeStaleArtifacts);
        REQUIRE(config->projects.size() == 2);
        // Sorted by name.
        CHECK(config->projects[0].name == "shared");
        CHECK(config->projects[1].name == "web");

        const auto* web = config->findProject("web");
        REQUIRE(web);
        CHECK(web->schemaPath == "schema.graphql");
        REQUIRE(web->extensionPaths.size() == 1);
        CHECK(web->extensionPaths[0] == "web/ext.graphql");
        REQUIRE(web->documentDirectories.size() == 1);
        REQUIRE(web->baseProject);
        CHECK(*web->baseProject == "shared");
        REQUIRE(web->outputDirectory);
        CHECK(*web->outputDirectory == "web/__generated__");
        CHECK(web->persist);
        CHECK(web->maxSelectionDepth == 10);

        const auto* shared = config->findProject("shared");
        REQUIRE(shared);
        CHECK(!shared->baseProject);
        CHECK(!shared->outputDirectory);
        CHECK(!shared->persist);
        CHECK(shared->maxSelectionDepth == 32);
        CHECK(!config->findProject("missing"));
    }
    SUBCASE("defaults") {
        ErrorReporter errorReporter(true);
        auto config = Config::parse(R"({"projects": {"p": {"schema": "s.graphql", "documents": ["src"]}}})", "/root",
                &errorReporter);
        REQUIRE(config);
        CHECK(config->rootDirectory == std::filesystem::path("/root"));
        CHECK(config->header == "@generated");
        CHECK(config->artifactExtension == ".graphql.json");
        CHECK(!config->removeStaleArtifacts);
    }
}

TEST_CASE("Config errors") {
    SUBCASE("malformed json") {
        ErrorReporter errorReporter(true);
        CHECK(!Config::parse("{ \"projects\": ", "/", &errorReporter));
        CHECK(errorReporter.errorCount() == 1);
    }
    SUBCASE("not an object") {
        ErrorReporter errorReporter(true);
        CHECK(!Config::parse("[]", "/", &errorReporter));
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.errors()[0] == "Config JSON is not a JSON object.");
    }
    SUBCASE("every problem is reported") {
        ErrorReporter errorReporter(true);
        CHECK(!Config::parse(R"({
            "colour": "blue",
            "projects": {
                "a": { "documents": ["a"], "persist": "yes" },
                "b": { "schema": "s.graphql", "documents": "b" }
            }
        })", "/", &errorReporter));
        CHECK(errorReporter.errorCount() == 5);
    }
    SUBCASE("no projects") {
        ErrorReporter errorReporter(true);
        CHECK(!Config::parse(R"({"projects": {}})", "/", &errorReporter));
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.errors()[0] == "Config must define at least one project.");
    }
    SUBCASE("unknown base project") {
        ErrorReporter errorReporter(true);
        CHECK(!Config::parse(R"({"projects": {"p": {"schema": "s", "documents": ["d"], "base": "q"}}})", "/",
                &errorReporter));
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.errors()[0] == "Project 'p' names unknown base project 'q'.");
    }
    SUBCASE("own base project") {
        ErrorReporter errorReporter(true);
        CHECK(!Config::parse(R"({"projects": {"p": {"schema": "s", "documents": ["d"], "base": "p"}}})", "/",
                &errorReporter));
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.errors()[0] == "Project 'p' cannot be its own base project.");
    }
    SUBCASE("bad selection depth") {
        ErrorReporter errorReporter(true);
        CHECK(!Config::parse(R"({"projects": {"p": {"schema": "s", "documents": ["d"], "maxSelectionDepth": 0}}})",
                "/", &errorReporter));
        CHECK(errorReporter.errorCount() == 1);
    }
    SUBCASE("missing file") {
        ErrorReporter errorReporter(true);
        CHECK(!Config::loadFromFile("no/such/loom.config.json", &errorReporter));
        CHECK(errorReporter.errorCount() == 1);
    }
}

} // namespace loom
