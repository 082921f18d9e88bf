#include "loom/TransformPipeline.hpp"

#include "loom/Printer.hpp"
#include "loom/Timer.hpp"
#include "loom/internal/TestFixtures.hpp"

#include "doctest/doctest.h"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace {

class RecordingPerfLogger : public loom::PerfLogger {
public:
    RecordingPerfLogger() = default;
    virtual ~RecordingPerfLogger() = default;

    void spanStarted(const std::string& name) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_started.emplace_back(name);
    }
    void spanFinished(const std::string& name, std::chrono::microseconds /* duration */) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_finished.emplace_back(name);
    }

    std::vector<std::string> started() const { std::lock_guard<std::mutex> lock(m_mutex); return m_started; }
    std::vector<std::string> finished() const { std::lock_guard<std::mutex> lock(m_mutex); return m_finished; }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_started;
    std::vector<std::string> m_finished;
};

std::string printProgram(const loom::ProgramPtr& program) {
    std::string text;
    for (const auto& definition : program->definitions()) {
        text += loom::Printer::printDefinition(*definition);
    }
    return text;
}

constexpr const char* kDocument = R"(
query FeedQuery($first: Int) {
  viewer { ...Feed_user friends(first: $first) @include(if: true) { name } }
  actor { ... on Page { title } }
}
fragment Feed_user on User { name isSelected ...Shared_user }
fragment Feed_unused on User { email }
)";

} // namespace

namespace loom {

TEST_CASE("TransformPipeline default targets") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    std::set<std::string> baseFragmentNames;
    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", kDocument }},
            {{ "Shared.graphql", "fragment Shared_user on User { email }" }}, &baseFragmentNames);

    auto pipeline = TransformPipeline::makeDefault();
    REQUIRE(pipeline.targets().size() == 3);
    CHECK(pipeline.targets()[0].name == kReaderTarget);
    CHECK(pipeline.targets()[1].name == kNormalizationTarget);
    CHECK(pipeline.targets()[2].name == kOperationTextTarget);

    auto targets = pipeline.apply(program, baseFragmentNames);
    REQUIRE(targets.programs.size() == 3);
    CHECK(targets.programs[0].first == kReaderTarget);
    CHECK(!targets.find("missing"));

    SUBCASE("reader drops base fragments and keeps spreads") {
        auto reader = targets.find(kReaderTarget);
        REQUIRE(reader);
        CHECK(!reader->findFragment("Shared_user"));
        CHECK(reader->findFragment("Feed_user"));
        CHECK(reader->findFragment("Feed_unused"));
        CHECK(printProgram(reader).find("...Shared_user") != std::string::npos);
    }
    SUBCASE("normalization has no spreads") {
        auto normalization = targets.find(kNormalizationTarget);
        REQUIRE(normalization);
        const auto* operation = normalization->findOperation("FeedQuery");
        REQUIRE(operation);
        bool hasSpread = false;
        ir::forEachFragmentSpread(operation->selections, [&hasSpread](const std::string&) { hasSpread = true; });
        CHECK(!hasSpread);
        auto text = Printer::printDefinition(*operation);
        CHECK(text.find("__typename") != std::string::npos);
        CHECK(text.find("@include") == std::string::npos);
    }
    SUBCASE("operation text omits client extensions and unreachable fragments") {
        auto operationText = targets.find(kOperationTextTarget);
        REQUIRE(operationText);
        CHECK(!operationText->findFragment("Feed_unused"));
        REQUIRE(operationText->findFragment("Shared_user"));
        auto text = Printer::printOperationText(*operationText, "FeedQuery");
        CHECK(text.find("isSelected") == std::string::npos);
        CHECK(text.find("fragment Feed_user on User") != std::string::npos);
        CHECK(text.find("fragment Shared_user on User") != std::string::npos);
    }
    SUBCASE("input program is untouched") {
        CHECK(program->findFragment("Shared_user"));
        CHECK(printProgram(program).find("isSelected") != std::string::npos);
    }
}

TEST_CASE("TransformPipeline is deterministic") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    std::set<std::string> baseFragmentNames;
    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", kDocument }},
            {{ "Shared.graphql", "fragment Shared_user on User { email }" }}, &baseFragmentNames);

    auto pipeline = TransformPipeline::makeDefault();
    auto first = pipeline.apply(program, baseFragmentNames);
    auto second = pipeline.apply(program, baseFragmentNames);
    REQUIRE(first.programs.size() == second.programs.size());
    for (size_t i = 0; i < first.programs.size(); ++i) {
        CHECK(first.programs[i].first == second.programs[i].first);
        CHECK(printProgram(first.programs[i].second) == printProgram(second.programs[i].second));
    }
}

TEST_CASE("TransformPipeline custom targets and timing") {
    Sources sources;
    auto schema = test::buildSchema(sources);
    auto program = test::buildProgram(sources, schema, {{ "Feed.graphql", "query FeedQuery { viewer { name } }" }});

    TransformPipeline pipeline;
    pipeline.addTarget("ids", {{ "generateIdField", transforms::generateIdField }});
    pipeline.addTarget("identity", {});
    // Replacing keeps the original target order.
    pipeline.addTarget("ids", {{ "generateTypename", transforms::generateTypename },
            { "generateIdField", transforms::generateIdField }});
    REQUIRE(pipeline.targets().size() == 2);
    CHECK(pipeline.targets()[0].transforms.size() == 2);

    RecordingPerfLogger perfLogger;
    auto targets = pipeline.apply(program, {}, &perfLogger);
    REQUIRE(targets.programs.size() == 2);
    CHECK(targets.programs[0].first == "ids");
    CHECK(targets.programs[1].first == "identity");
    CHECK(targets.programs[1].second == program);
    CHECK(perfLogger.started() == std::vector<std::string>{ "ids.generateTypename", "ids.generateIdField" });
    CHECK(perfLogger.finished() == perfLogger.started());
}

TEST_CASE("Timer") {
    RecordingPerfLogger perfLogger;

    SUBCASE("reports once when stopped early") {
        Timer timer("span", &perfLogger);
        CHECK(perfLogger.started() == std::vector<std::string>{ "span" });
        CHECK(perfLogger.finished().empty());
        timer.stop();
        timer.stop();
        CHECK(perfLogger.finished() == std::vector<std::string>{ "span" });
    }
    SUBCASE("time returns the result") {
        int value = Timer::time("compute", &perfLogger, []() { return 42; });
        CHECK(value == 42);
        CHECK(perfLogger.finished() == std::vector<std::string>{ "compute" });
    }
    SUBCASE("null logger") {
        int value = Timer::time("nothing", nullptr, []() { return 7; });
        CHECK(value == 7);
    }
}

} // namespace loom
