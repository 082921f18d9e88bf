#include "loom/ArtifactWriter.hpp"

#include "loom/Config.hpp"
#include "loom/internal/FileSystem.hpp"
#include "loom/internal/TestFixtures.hpp"

#include "doctest/doctest.h"

#include <string>

namespace {

std::string readFile(const fs::path& path) {
    std::string contents;
    REQUIRE(loom::readFileContents(path, contents));
    return contents;
}

} // namespace

namespace loom {

TEST_CASE("FileSystemWriter") {
    test::ScratchDirectory scratch;
    Config config;
    config.rootDirectory = scratch.path();
    ProjectConfig projectConfig;
    projectConfig.name = "app";
    projectConfig.documentDirectories = { "app" };
    FileSystemWriter writer;

    ArtifactSet artifacts{
        Artifact{ "app/__generated__/A.graphql.json", "{\"a\": 1}\n", "A", { "reader" } },
        Artifact{ "app/nested/__generated__/B.graphql.json", "{\"b\": 2}\n", "B", { "reader" } }
    };

    SUBCASE("writes every artifact, creating directories") {
        auto error = writer.write(config, projectConfig, artifacts);
        CHECK(!error);
        CHECK(readFile(scratch.path() / "app/__generated__/A.graphql.json") == "{\"a\": 1}\n");
        CHECK(readFile(scratch.path() / "app/nested/__generated__/B.graphql.json") == "{\"b\": 2}\n");
    }
    SUBCASE("unchanged files are not rewritten") {
        REQUIRE(!writer.write(config, projectConfig, artifacts));
        auto path = scratch.path() / "app/__generated__/A.graphql.json";
        auto before = fs::last_write_time(path);
        REQUIRE(!writer.write(config, projectConfig, artifacts));
        CHECK(fs::last_write_time(path) == before);
    }
    SUBCASE("stale artifacts are only removed when asked") {
        REQUIRE(writeFileContents(scratch.path() / "app/__generated__/Old.graphql.json", "{}"));
        REQUIRE(writeFileContents(scratch.path() / "app/__generated__/notes.txt", "keep"));

        REQUIRE(!writer.write(config, projectConfig, artifacts));
        CHECK(fs::exists(scratch.path() / "app/__generated__/Old.graphql.json"));

        config.removeStaleArtifacts = true;
        REQUIRE(!writer.write(config, projectConfig, artifacts));
        CHECK(!fs::exists(scratch.path() / "app/__generated__/Old.graphql.json"));
        CHECK(fs::exists(scratch.path() / "app/__generated__/notes.txt"));
        CHECK(fs::exists(scratch.path() / "app/__generated__/A.graphql.json"));
        CHECK(fs::exists(scratch.path() / "app/nested/__generated__/B.graphql.json"));
    }
    SUBCASE("stale removal in an output directory") {
        projectConfig.outputDirectory = "out";
        ArtifactSet outputArtifacts{ Artifact{ "out/A.graphql.json", "{}\n", "A", { "reader" } } };
        REQUIRE(writeFileContents(scratch.path() / "out/Gone.graphql.json", "{}"));
        config.removeStaleArtifacts = true;
        REQUIRE(!writer.write(config, projectConfig, outputArtifacts));
        CHECK(!fs::exists(scratch.path() / "out/Gone.graphql.json"));
        CHECK(fs::exists(scratch.path() / "out/A.graphql.json"));
    }
    SUBCASE("failure reports what was already written") {
        REQUIRE(writeFileContents(scratch.path() / "blocked", "a file, not a directory"));
        artifacts.emplace_back(Artifact{ "blocked/C.graphql.json", "{}\n", "C", { "reader" } });
        auto error = writer.write(config, projectConfig, artifacts);
        REQUIRE(error);
        CHECK(error->path == "blocked/C.graphql.json");
        CHECK(error->message == "Failed to write artifact for 'C'");
        CHECK(error->writtenPaths == std::vector<std::string>{ "app/__generated__/A.graphql.json",
                "app/nested/__generated__/B.graphql.json" });
    }
}

TEST_CASE("ValidatingWriter") {
    test::ScratchDirectory scratch;
    Config config;
    config.rootDirectory = scratch.path();
    ProjectConfig projectConfig;
    projectConfig.name = "app";
    ValidatingWriter writer;

    ArtifactSet artifacts{
        Artifact{ "gen/A.graphql.json", "a\n", "A", { "reader" } },
        Artifact{ "gen/B.graphql.json", "b\n", "B", { "reader" } }
    };

    SUBCASE("missing and different files are out of date") {
        REQUIRE(writeFileContents(scratch.path() / "gen/A.graphql.json", "old\n"));
        auto error = writer.write(config, projectConfig, artifacts);
        REQUIRE(error);
        CHECK(error->path == "gen/A.graphql.json");
        CHECK(error->message == "2 artifact(s) are out of date: gen/A.graphql.json, gen/B.graphql.json");
        CHECK(error->writtenPaths.empty());
        CHECK(readFile(scratch.path() / "gen/A.graphql.json") == "old\n");
        CHECK(!fs::exists(scratch.path() / "gen/B.graphql.json"));
    }
    SUBCASE("up to date") {
        REQUIRE(writeFileContents(scratch.path() / "gen/A.graphql.json", "a\n"));
        REQUIRE(writeFileContents(scratch.path() / "gen/B.graphql.json", "b\n"));
        CHECK(!writer.write(config, projectConfig, artifacts));
    }
}

} // namespace loom
