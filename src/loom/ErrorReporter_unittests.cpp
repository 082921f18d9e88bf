#include "loom/ErrorReporter.hpp"

#include "loom/Sources.hpp"

#include "doctest/doctest.h"

namespace loom {

TEST_CASE("ErrorReporter") {
    ErrorReporter errorReporter(true);
    CHECK(errorReporter.ok());
    CHECK(errorReporter.errorCount() == 0);

    SUBCASE("plain errors") {
        errorReporter.addError("first");
        errorReporter.addError("second");
        CHECK(!errorReporter.ok());
        CHECK(errorReporter.errors() == std::vector<std::string>{ "first", "second" });
    }
    SUBCASE("file errors") {
        errorReporter.addFileNotFoundError("schema.graphql");
        errorReporter.addFileReadError("app/Feed.graphql");
        REQUIRE(errorReporter.errorCount() == 2);
        CHECK(errorReporter.errors()[0] == "File not found: 'schema.graphql'");
        CHECK(errorReporter.errors()[1] == "Failed to read file: 'app/Feed.graphql'");
    }
    SUBCASE("diagnostics") {
        Sources sources;
        auto sourceID = sources.addSource("Feed.graphql", "query A {\n  bad\n}\n");
        errorReporter.addDiagnostic(sources.resolve(Diagnostic("Unknown field 'bad' on type 'Query'",
                Location{ sourceID, 12, 15 })));
        REQUIRE(errorReporter.errorCount() == 1);
        CHECK(errorReporter.errors()[0] == "Feed.graphql:2:3: Unknown field 'bad' on type 'Query'\n"
                                           "      bad\n"
                                           "      ^^^");
    }
    SUBCASE("diagnostic without a location") {
        errorReporter.addDiagnostic(ResolvedDiagnostic{ "no location", {} });
        CHECK(errorReporter.errors() == std::vector<std::string>{ "no location" });
    }
}

} // namespace loom
