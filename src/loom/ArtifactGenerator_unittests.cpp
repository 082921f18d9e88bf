#include "loom/ArtifactGenerator.hpp"

#include "loom/Config.hpp"
#include "loom/Hash.hpp"
#include "loom/OperationPersister.hpp"
#include "loom/Printer.hpp"
#include "loom/TransformPipeline.hpp"
#include "loom/WorkerPool.hpp"
#include "loom/internal/TestFixtures.hpp"

#include "doctest/doctest.h"
#include "rapidjson/document.h"

#include <future>
#include <memory>
#include <string>
#include <variant>

namespace {

class FailingPersister : public loom::OperationPersister {
public:
    FailingPersister() = default;
    virtual ~FailingPersister() = default;

    void persist(std::string /* text */, std::function<void(loom::PersistResult)> callback) override {
        callback(loom::PersistError{ "store unavailable" });
    }
};

constexpr const char* kDocument = R"(
query FeedQuery($first: Int) { viewer { ...Feed_user friends(first: $first) { name } } actor { __typename } }
fragment Feed_user on User { handle: name }
)";

const loom::Artifact* findArtifact(const loom::ArtifactSet& artifacts, const std::string& path) {
    for (const auto& artifact : artifacts) {
        if (artifact.path == path) { return &artifact; }
    }
    return nullptr;
}

rapidjson::Document parseJSON(const std::string& json) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    REQUIRE(!document.HasParseError());
    REQUIRE(document.IsObject());
    return document;
}

} // namespace

namespace loom {

TEST_CASE("ArtifactGenerator artifactPath") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "app/feed/Feed.graphql", kDocument }});
    Config config;
    ArtifactGenerator generator(config, nullptr);
    ProjectConfig projectConfig;
    projectConfig.name = "app";
    const auto* operation = program->findOperation("FeedQuery");
    REQUIRE(operation);

    CHECK(generator.artifactPath(projectConfig, *operation, ".graphql.json")
            == "app/feed/__generated__/FeedQuery.graphql.json");
    projectConfig.outputDirectory = "out/app";
    CHECK(generator.artifactPath(projectConfig, *operation, ".graphql.json") == "out/app/FeedQuery.graphql.json");
}

TEST_CASE("ArtifactGenerator text artifacts") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", kDocument }});
    auto targets = TransformPipeline::makeDefault().apply(program, {});
    Config config;
    ProjectConfig projectConfig;
    projectConfig.name = "app";
    ArtifactGenerator generator(config, nullptr);

    auto result = generator.generate(projectConfig, targets).get();
    REQUIRE(std::holds_alternative<ArtifactSet>(result));
    const auto& artifacts = std::get<ArtifactSet>(result);
    REQUIRE(artifacts.size() == 2);

    SUBCASE("fragment artifact") {
        const auto* artifact = findArtifact(artifacts, "app/__generated__/Feed_user.graphql.json");
        REQUIRE(artifact);
        CHECK(artifact->definitionName == "Feed_user");
        CHECK(artifact->targets == std::vector<std::string>{ kReaderTarget });
        auto json = parseJSON(artifact->content);
        CHECK(std::string(json["header"].GetString()) == "@generated");
        CHECK(std::string(json["kind"].GetString()) == "fragment");
        CHECK(std::string(json["type"].GetString()) == "User");
        const auto& selections = json["selections"];
        REQUIRE(selections.IsArray());
        REQUIRE(selections.Size() == 1);
        CHECK(std::string(selections[0]["kind"].GetString()) == "ScalarField");
        CHECK(std::string(selections[0]["name"].GetString()) == "name");
        CHECK(std::string(selections[0]["alias"].GetString()) == "handle");
        CHECK(artifact->content.back() == '\n');
    }
    SUBCASE("request artifact") {
        const auto* artifact = findArtifact(artifacts, "app/__generated__/FeedQuery.graphql.json");
        REQUIRE(artifact);
        CHECK(artifact->targets.size() == 3);
        auto json = parseJSON(artifact->content);
        CHECK(std::string(json["kind"].GetString()) == "request");

        auto text = Printer::printOperationText(*targets.find(kOperationTextTarget), "FeedQuery");
        CHECK(std::string(json["hash"].GetString()) == hashToString(hash(text)));
        const auto& params = json["params"];
        CHECK(std::string(params["operationKind"].GetString()) == "query");
        CHECK(params["id"].IsNull());
        CHECK(std::string(params["text"].GetString()) == text);

        // The reader keeps the spread, normalization inlines and flattens it.
        const auto& readerViewer = json["fragment"]["selections"][0];
        CHECK(std::string(readerViewer["concreteType"].GetString()) == "User");
        CHECK(!readerViewer["plural"].GetBool());
        CHECK(std::string(readerViewer["selections"][0]["kind"].GetString()) == "FragmentSpread");
        const auto& normalizationViewer = json["operation"]["selections"][0];
        CHECK(std::string(normalizationViewer["selections"][0]["kind"].GetString()) == "ScalarField");
        CHECK(std::string(normalizationViewer["selections"][0]["alias"].GetString()) == "handle");

        const auto& friends = readerViewer["selections"][1];
        CHECK(friends["plural"].GetBool());
        REQUIRE(friends["args"].Size() == 1);
        CHECK(std::string(friends["args"][0]["kind"].GetString()) == "Variable");
        CHECK(std::string(friends["args"][0]["variableName"].GetString()) == "first");

        CHECK(json["fragment"]["selections"][1]["concreteType"].IsNull());
        CHECK(json["fragment"]["argumentDefinitions"].Size() == 1);
        CHECK(json["fragment"]["argumentDefinitions"][0]["defaultValue"].IsNull());
    }
}

TEST_CASE("ArtifactGenerator persisted operations") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", kDocument }});
    auto targets = TransformPipeline::makeDefault().apply(program, {});
    Config config;
    ProjectConfig projectConfig;
    projectConfig.name = "app";
    projectConfig.persist = true;
    projectConfig.outputDirectory = "generated";
    auto text = Printer::printOperationText(*targets.find(kOperationTextTarget), "FeedQuery");

    SUBCASE("ids replace text") {
        auto workerPool = std::make_shared<WorkerPool>();
        REQUIRE(workerPool->start(2));
        ArtifactGenerator generator(config, std::make_shared<LocalPersister>(workerPool));
        auto result = generator.generate(projectConfig, targets).get();
        workerPool->stop();
        REQUIRE(std::holds_alternative<ArtifactSet>(result));
        const auto& artifacts = std::get<ArtifactSet>(result);
        REQUIRE(artifacts.size() == 3);

        const auto* request = findArtifact(artifacts, "generated/FeedQuery.graphql.json");
        REQUIRE(request);
        auto json = parseJSON(request->content);
        CHECK(std::string(json["params"]["id"].GetString()) == hashToString(hash(text)));
        CHECK(json["params"]["text"].IsNull());

        const auto* persisted = findArtifact(artifacts, "generated/persisted_queries.json");
        REQUIRE(persisted);
        CHECK(persisted->definitionName.empty());
        auto queries = parseJSON(persisted->content);
        REQUIRE(queries.HasMember(hashToString(hash(text)).c_str()));
        CHECK(std::string(queries[hashToString(hash(text)).c_str()].GetString()) == text);
    }
    SUBCASE("persist failure fails the whole generation") {
        ArtifactGenerator generator(config, std::make_shared<FailingPersister>());
        auto result = generator.generate(projectConfig, targets).get();
        REQUIRE(std::holds_alternative<ArtifactGenerationError>(result));
        const auto& error = std::get<ArtifactGenerationError>(result);
        CHECK(error.target == kOperationTextTarget);
        CHECK(error.definitionName == "FeedQuery");
        CHECK(error.message == "Failed to persist operation text: store unavailable");
    }
    SUBCASE("no persister") {
        ArtifactGenerator generator(config, nullptr);
        auto result = generator.generate(projectConfig, targets).get();
        REQUIRE(std::holds_alternative<ArtifactGenerationError>(result));
        CHECK(std::get<ArtifactGenerationError>(result).message
                == "Project 'app' persists operations but no OperationPersister is configured");
    }
}

TEST_CASE("ArtifactGenerator client only operations") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql",
            "query FeedQuery { viewer { isSelected } }" }});
    auto targets = TransformPipeline::makeDefault().apply(program, {});
    REQUIRE(!targets.find(kOperationTextTarget)->findOperation("FeedQuery"));
    Config config;
    ProjectConfig projectConfig;
    projectConfig.name = "app";
    projectConfig.outputDirectory = "generated";

    auto checkRequest = [](const GenerationResult& result) {
        REQUIRE(std::holds_alternative<ArtifactSet>(result));
        const auto& artifacts = std::get<ArtifactSet>(result);
        REQUIRE(artifacts.size() == 1);
        auto json = parseJSON(artifacts[0].content);
        CHECK(std::string(json["kind"].GetString()) == "request");
        CHECK(json["params"]["id"].IsNull());
        CHECK(json["params"]["text"].IsNull());
        CHECK(std::string(json["hash"].GetString()).size() == 16);
    };

    SUBCASE("no text") {
        ArtifactGenerator generator(config, nullptr);
        checkRequest(generator.generate(projectConfig, targets).get());
    }
    SUBCASE("nothing is persisted") {
        projectConfig.persist = true;
        // The persister would fail if it were asked to store anything.
        ArtifactGenerator generator(config, std::make_shared<FailingPersister>());
        checkRequest(generator.generate(projectConfig, targets).get());
    }
}

TEST_CASE("ArtifactGenerator errors") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    Config config;
    ProjectConfig projectConfig;
    projectConfig.name = "app";
    ArtifactGenerator generator(config, nullptr);

    SUBCASE("missing target") {
        auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", kDocument }});
        TargetPrograms targets;
        targets.programs.emplace_back(std::make_pair(std::string(kReaderTarget), program));
        auto result = generator.generate(projectConfig, targets).get();
        REQUIRE(std::holds_alternative<ArtifactGenerationError>(result));
        CHECK(std::get<ArtifactGenerationError>(result).message == "No Program for target 'normalization'");
    }
    SUBCASE("operation missing from normalization") {
        auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", kDocument }});
        auto targets = TransformPipeline::makeDefault().apply(program, {});
        targets.programs[1].second = program->withDefinitions(program->fragments());
        auto result = generator.generate(projectConfig, targets).get();
        REQUIRE(std::holds_alternative<ArtifactGenerationError>(result));
        const auto& error = std::get<ArtifactGenerationError>(result);
        CHECK(error.target == kNormalizationTarget);
        CHECK(error.message == "Operation 'FeedQuery' has no normalization counterpart");
    }
    SUBCASE("two definitions claiming one path") {
        projectConfig.outputDirectory = "out";
        config.artifactExtension = ".json";
        projectConfig.persist = true;
        auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", R"(
query FeedQuery { viewer { ...persisted_queries } }
fragment persisted_queries on User { name }
)" }});
        auto targets = TransformPipeline::makeDefault().apply(program, {});
        ArtifactGenerator persistingGenerator(config, std::make_shared<FailingPersister>());
        auto result = persistingGenerator.generate(projectConfig, targets).get();
        REQUIRE(std::holds_alternative<ArtifactGenerationError>(result));
        CHECK(std::get<ArtifactGenerationError>(result).message == "Artifact path 'out/persisted_queries.json' is "
                "generated by both 'persisted_queries' and 'persisted_queries.json'");
    }
}

TEST_CASE("ArtifactGenerator custom targets") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "app/Feed.graphql", kDocument }});
    auto pipeline = TransformPipeline::makeDefault();
    pipeline.addTarget("printed", {});
    auto targets = pipeline.apply(program, {});
    Config config;
    config.header = "generated by loom";
    ProjectConfig projectConfig;
    projectConfig.name = "app";
    ArtifactGenerator generator(config, nullptr);

    auto result = generator.generate(projectConfig, targets).get();
    REQUIRE(std::holds_alternative<ArtifactSet>(result));
    const auto& artifacts = std::get<ArtifactSet>(result);
    CHECK(artifacts.size() == 4);
    const auto* printed = findArtifact(artifacts, "app/__generated__/Feed_user.printed.graphql");
    REQUIRE(printed);
    CHECK(printed->targets == std::vector<std::string>{ "printed" });
    CHECK(printed->content == "# generated by loom\nfragment Feed_user on User {\n  handle: name\n}\n");
}

} // namespace loom
