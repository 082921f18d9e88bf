#include "loom/Pipeline.hpp"

#include "loom/ArtifactWriter.hpp"
#include "loom/CompilerState.hpp"
#include "loom/Config.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/OperationPersister.hpp"
#include "loom/Sources.hpp"
#include "loom/Timer.hpp"
#include "loom/WorkerPool.hpp"
#include "loom/internal/TestFixtures.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

class RecordingPerfLogger : public loom::PerfLogger {
public:
    RecordingPerfLogger() = default;
    virtual ~RecordingPerfLogger() = default;

    void spanStarted(const std::string& /* name */) override {}
    void spanFinished(const std::string& name, std::chrono::microseconds /* duration */) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_spans.emplace_back(name);
    }

    bool hasSpan(const std::string& name) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::find(m_spans.begin(), m_spans.end(), name) != m_spans.end();
    }
    bool hasSpanStartingWith(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::any_of(m_spans.begin(), m_spans.end(),
                [&prefix](const std::string& span) { return span.compare(0, prefix.size(), prefix) == 0; });
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_spans;
};

// Remembers what it was asked to write instead of touching the file system.
class RecordingWriter : public loom::ArtifactWriter {
public:
    RecordingWriter() = default;
    virtual ~RecordingWriter() = default;

    std::optional<loom::ArtifactWriteError> write(const loom::Config& /* config */,
            const loom::ProjectConfig& projectConfig, const loom::ArtifactSet& artifacts) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_writeCount;
        m_written[projectConfig.name] = artifacts;
        if (m_failWith) { return m_failWith; }
        return std::nullopt;
    }

    void failWith(loom::ArtifactWriteError error) { m_failWith = std::move(error); }
    int writeCount() const { std::lock_guard<std::mutex> lock(m_mutex); return m_writeCount; }
    loom::ArtifactSet written(const std::string& projectName) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto iter = m_written.find(projectName);
        return iter == m_written.end() ? loom::ArtifactSet() : iter->second;
    }

private:
    mutable std::mutex m_mutex;
    int m_writeCount = 0;
    std::map<std::string, loom::ArtifactSet> m_written;
    std::optional<loom::ArtifactWriteError> m_failWith;
};

class FailingPersister : public loom::OperationPersister {
public:
    FailingPersister() = default;
    virtual ~FailingPersister() = default;

    void persist(std::string /* text */, std::function<void(loom::PersistResult)> callback) override {
        callback(loom::PersistError{ "store unavailable" });
    }
};

class StopAfterValidate : public loom::Pipeline {
public:
    StopAfterValidate(std::shared_ptr<loom::WorkerPool> workerPool, std::shared_ptr<loom::PerfLogger> perfLogger):
        Pipeline(std::move(workerPool), std::move(perfLogger)) {}
    virtual ~StopAfterValidate() = default;

    bool afterValidate(const loom::ProjectConfig& /* projectConfig */, const loom::Program* program) override {
        m_validatedDefinitions = program->documentCount();
        return false;
    }

    size_t m_validatedDefinitions = 0;
};

// Parsed inputs for any number of projects sharing the test schema.
struct Workspace {
    loom::Sources sources;
    loom::CompilerState compilerState;
    loom::AstSets astSets;
    loom::Config config;

    loom::ProjectConfig& addProject(const std::string& name, const loom::test::TestDocuments& documents) {
        loom::ErrorReporter errorReporter(true);
        auto schema = loom::CompilerState::parseTypeSystemSource(sources, name + "/schema.graphql",
                loom::test::kTestSchema, errorReporter);
        REQUIRE(schema);
        compilerState.addSchema(name, schema);
        auto extension = loom::CompilerState::parseTypeSystemSource(sources, name + "/extension.graphql",
                loom::test::kTestExtension, errorReporter);
        REQUIRE(extension);
        compilerState.addExtension(name, extension);
        for (auto& document : loom::test::parseDocuments(sources, documents)) {
            astSets[name].documents.emplace_back(std::move(document));
        }

        loom::ProjectConfig projectConfig;
        projectConfig.name = name;
        projectConfig.schemaPath = name + "/schema.graphql";
        projectConfig.documentDirectories = { name };
        config.projects.emplace_back(std::move(projectConfig));
        return config.projects.back();
    }
};

constexpr const char* kValidDocument = R"(
query FeedQuery($first: Int) { viewer { ...Feed_user friends(first: $first) { name } } }
fragment Feed_user on User { name isSelected }
)";

std::string outcomeString(const loom::BuildOutcome& outcome) {
    if (const auto* summary = std::get_if<loom::ProjectSummary>(&outcome)) {
        return summary->toString();
    }
    return std::get<loom::BuildProjectError>(outcome).toString();
}

} // namespace

namespace loom {

TEST_CASE("Pipeline builds a valid project") {
    Workspace workspace;
    workspace.addProject("app", {{ "app/Feed.graphql", kValidDocument }});
    const auto& projectConfig = workspace.config.projects[0];

    auto perfLogger = std::make_shared<RecordingPerfLogger>();
    auto writer = std::make_shared<RecordingWriter>();
    Pipeline pipeline(std::make_shared<WorkerPool>(), perfLogger);
    pipeline.setArtifactWriter(writer);

    auto outcome = pipeline.buildProject(workspace.compilerState, workspace.config, projectConfig,
            workspace.astSets, workspace.sources);
    REQUIRE(std::holds_alternative<ProjectSummary>(outcome));
    const auto& summary = std::get<ProjectSummary>(outcome);
    CHECK(summary.projectName == "app");
    CHECK(summary.artifactCount == 2);
    CHECK(summary.toString() == "[app] documents: 2 reader, 1 normalization, 2 operation_text");

    CHECK(writer->writeCount() == 1);
    auto written = writer->written("app");
    REQUIRE(written.size() == 2);
    CHECK(written[0].path == "app/__generated__/Feed_user.graphql.json");
    CHECK(written[1].path == "app/__generated__/FeedQuery.graphql.json");

    for (const char* stage : { "build_schema", "build_ir", "build_program", "validate", "apply_transforms",
                 "generate_artifacts", "write_artifacts" }) {
        CHECK(perfLogger->hasSpan(fmt::format("{} app", stage)));
    }
    CHECK(perfLogger->hasSpan("reader.removeBaseFragments"));
    CHECK(perfLogger->hasSpan("operation_text.onlyReachableFromOperations"));
}

TEST_CASE("Pipeline stops at the first failing stage") {
    Workspace workspace;
    auto perfLogger = std::make_shared<RecordingPerfLogger>();
    auto writer = std::make_shared<RecordingWriter>();
    Pipeline pipeline(std::make_shared<WorkerPool>(), perfLogger);
    pipeline.setArtifactWriter(writer);

    SUBCASE("missing schema") {
        ProjectConfig projectConfig;
        projectConfig.name = "nothing";
        auto outcome = pipeline.buildProject(workspace.compilerState, workspace.config, projectConfig,
                workspace.astSets, workspace.sources);
        REQUIRE(std::holds_alternative<BuildProjectError>(outcome));
        const auto& error = std::get<BuildProjectError>(outcome);
        CHECK(error.stage == Stage::kBuildSchema);
        CHECK(error.toString() == "[nothing] build_schema failed: Project 'nothing' has no schema documents");
    }
    SUBCASE("type errors resolve to the exact span") {
        const auto& projectConfig = workspace.addProject("app", {{ "app/Feed.graphql",
                "query FeedQuery {\n  viewer { id, phone }\n}\n" }});
        auto outcome = pipeline.buildProject(workspace.compilerState, workspace.config, projectConfig,
                workspace.astSets, workspace.sources);
        REQUIRE(std::holds_alternative<BuildProjectError>(outcome));
        const auto& error = std::get<BuildProjectError>(outcome);
        CHECK(error.stage == Stage::kBuildIR);
        CHECK(error.kind == BuildProjectError::Kind::kStageFailed);
        CHECK(error.message == "1 error(s) in documents");
        REQUIRE(error.diagnostics.size() == 1);
        CHECK(error.diagnostics[0].message == "Unknown field 'phone' on type 'User'");
        REQUIRE(error.diagnostics[0].locations.size() == 1);
        CHECK(error.diagnostics[0].locations[0].path == "app/Feed.graphql");
        CHECK(error.diagnostics[0].locations[0].lineNumber == 2);
        CHECK(error.diagnostics[0].locations[0].characterNumber == 16);
        CHECK(error.diagnostics[0].locations[0].text == "phone");
        CHECK(!perfLogger->hasSpan("validate app"));
        CHECK(writer->writeCount() == 0);
    }
    SUBCASE("validation errors stop before any transform runs") {
        const auto& projectConfig = workspace.addProject("app", {{ "app/Feed.graphql", R"(
query Viewer { viewer { id: name } }
)" }});
        auto outcome = pipeline.buildProject(workspace.compilerState, workspace.config, projectConfig,
                workspace.astSets, workspace.sources);
        REQUIRE(std::holds_alternative<BuildProjectError>(outcome));
        const auto& error = std::get<BuildProjectError>(outcome);
        CHECK(error.stage == Stage::kValidate);
        CHECK(error.message == "2 validation error(s)");
        CHECK(error.diagnostics.size() == 2);
        CHECK(perfLogger->hasSpan("validate app"));
        CHECK(!perfLogger->hasSpan("apply_transforms app"));
        CHECK(!perfLogger->hasSpanStartingWith("reader."));
        CHECK(!perfLogger->hasSpanStartingWith("normalization."));
        CHECK(!perfLogger->hasSpanStartingWith("operation_text."));
        CHECK(writer->writeCount() == 0);
    }
    SUBCASE("generation failure writes nothing") {
        auto& projectConfig = workspace.addProject("app", {{ "app/Feed.graphql", kValidDocument }});
        projectConfig.persist = true;
        pipeline.setOperationPersister(std::make_shared<FailingPersister>());
        auto outcome = pipeline.buildProject(workspace.compilerState, workspace.config, projectConfig,
                workspace.astSets, workspace.sources);
        REQUIRE(std::holds_alternative<BuildProjectError>(outcome));
        const auto& error = std::get<BuildProjectError>(outcome);
        CHECK(error.stage == Stage::kGenerateArtifacts);
        CHECK(error.message == "Failed to persist operation text: store unavailable (target 'operation_text', "
                "definition 'FeedQuery')");
        CHECK(writer->writeCount() == 0);
        CHECK(!perfLogger->hasSpan("write_artifacts app"));
    }
    SUBCASE("write failure keeps the written paths") {
        const auto& projectConfig = workspace.addProject("app", {{ "app/Feed.graphql", kValidDocument }});
        writer->failWith(ArtifactWriteError{ "app/__generated__/FeedQuery.graphql.json", "disk full",
                { "app/__generated__/Feed_user.graphql.json" } });
        auto outcome = pipeline.buildProject(workspace.compilerState, workspace.config, projectConfig,
                workspace.astSets, workspace.sources);
        REQUIRE(std::holds_alternative<BuildProjectError>(outcome));
        const auto& error = std::get<BuildProjectError>(outcome);
        CHECK(error.stage == Stage::kWriteArtifacts);
        CHECK(error.writtenPaths == std::vector<std::string>{ "app/__generated__/Feed_user.graphql.json" });
        CHECK(error.toString() == "[app] write_artifacts failed: 'app/__generated__/FeedQuery.graphql.json': disk "
                "full\n  already written: app/__generated__/Feed_user.graphql.json");
    }
}

TEST_CASE("Pipeline hooks can stop the build") {
    Workspace workspace;
    const auto& projectConfig = workspace.addProject("app", {{ "app/Feed.graphql", kValidDocument }});
    auto perfLogger = std::make_shared<RecordingPerfLogger>();
    auto writer = std::make_shared<RecordingWriter>();
    StopAfterValidate pipeline(std::make_shared<WorkerPool>(), perfLogger);
    pipeline.setArtifactWriter(writer);

    auto outcome = pipeline.buildProject(workspace.compilerState, workspace.config, projectConfig,
            workspace.astSets, workspace.sources);
    REQUIRE(std::holds_alternative<BuildProjectError>(outcome));
    const auto& error = std::get<BuildProjectError>(outcome);
    CHECK(error.kind == BuildProjectError::Kind::kAborted);
    CHECK(error.toString() == "[app] aborted after validate");
    CHECK(pipeline.m_validatedDefinitions == 2);
    CHECK(!perfLogger->hasSpan("apply_transforms app"));
    CHECK(writer->writeCount() == 0);
}

TEST_CASE("Pipeline builds projects concurrently and isolates failures") {
    Workspace workspace;
    workspace.addProject("good", {{ "good/Feed.graphql", kValidDocument }});
    workspace.addProject("bad", {{ "bad/Feed.graphql", "query FeedQuery { viewer { phone } }" }});
    workspace.addProject("other", {{ "other/Story.graphql",
            "query StoryQuery { node(id: 1) { ... on Page { title } } }" }});

    auto workerPool = std::make_shared<WorkerPool>();
    REQUIRE(workerPool->start(2));
    auto perfLogger = std::make_shared<RecordingPerfLogger>();
    auto writer = std::make_shared<RecordingWriter>();
    Pipeline pipeline(workerPool, perfLogger);
    pipeline.setArtifactWriter(writer);

    std::vector<BuildOutcome> outcomes(workspace.config.projects.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < workspace.config.projects.size(); ++i) {
        threads.emplace_back(std::thread([&workspace, &pipeline, &outcomes, i]() {
            outcomes[i] = pipeline.buildProject(workspace.compilerState, workspace.config,
                    workspace.config.projects[i], workspace.astSets, workspace.sources);
        }));
    }
    for (auto& thread : threads) {
        thread.join();
    }
    workerPool->stop();

    CHECK(std::holds_alternative<ProjectSummary>(outcomes[0]));
    REQUIRE(std::holds_alternative<BuildProjectError>(outcomes[1]));
    CHECK(std::get<BuildProjectError>(outcomes[1]).projectName == "bad");
    CHECK(std::holds_alternative<ProjectSummary>(outcomes[2]));

    CHECK(writer->writeCount() == 2);
    CHECK(writer->written("good").size() == 2);
    CHECK(writer->written("bad").empty());
    REQUIRE(writer->written("other").size() == 1);
    CHECK(writer->written("other")[0].path == "other/__generated__/StoryQuery.graphql.json");
    CHECK(perfLogger->hasSpan("write_artifacts good"));
    CHECK(!perfLogger->hasSpan("write_artifacts bad"));

    // The same projects built one after the other give the same outcomes and artifacts.
    auto sequentialWriter = std::make_shared<RecordingWriter>();
    Pipeline sequentialPipeline(std::make_shared<WorkerPool>(), nullptr);
    sequentialPipeline.setArtifactWriter(sequentialWriter);
    for (size_t i = 0; i < workspace.config.projects.size(); ++i) {
        const auto& projectConfig = workspace.config.projects[i];
        auto outcome = sequentialPipeline.buildProject(workspace.compilerState, workspace.config, projectConfig,
                workspace.astSets, workspace.sources);
        CHECK(outcomeString(outcome) == outcomeString(outcomes[i]));

        auto concurrentArtifacts = writer->written(projectConfig.name);
        auto sequentialArtifacts = sequentialWriter->written(projectConfig.name);
        REQUIRE(concurrentArtifacts.size() == sequentialArtifacts.size());
        for (size_t j = 0; j < concurrentArtifacts.size(); ++j) {
            CHECK(concurrentArtifacts[j].path == sequentialArtifacts[j].path);
            CHECK(concurrentArtifacts[j].content == sequentialArtifacts[j].content);
            CHECK(concurrentArtifacts[j].definitionName == sequentialArtifacts[j].definitionName);
        }
    }
    CHECK(sequentialWriter->writeCount() == 2);
}

} // namespace loom
