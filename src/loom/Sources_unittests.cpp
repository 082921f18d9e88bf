#include "loom/Sources.hpp"

#include "loom/SourceFile.hpp"

#include "doctest/doctest.h"

namespace loom {

TEST_CASE("Sources resolve") {
    Sources sources;
    auto first = sources.addSource("a.graphql", "query A { a }");
    auto second = sources.addSource("b.graphql", "query B {\n  user {\n    email\n  }\n}\n");
    CHECK(first == 0);
    CHECK(second == 1);
    CHECK(sources.size() == 2);
    REQUIRE(sources.source(second));
    CHECK(sources.source(second)->path() == "b.graphql");
    CHECK(!sources.source(2));
    CHECK(!sources.source(kInvalidSourceID));

    SUBCASE("location on a later line") {
        auto resolved = sources.resolve(Location(second, 23, 28));
        REQUIRE(resolved);
        CHECK(resolved->path == "b.graphql");
        CHECK(resolved->lineNumber == 3);
        CHECK(resolved->characterNumber == 5);
        CHECK(resolved->text == "email");
        CHECK(resolved->lineText == "    email");
    }
    SUBCASE("unresolvable locations") {
        CHECK(!sources.resolve(Location()));
        CHECK(!sources.resolve(Location(5, 0, 1)));
        CHECK(!sources.resolve(Location(first, 10, 100)));
    }
    SUBCASE("diagnostic with related location") {
        Diagnostic diagnostic("Duplicate definition 'A'", { Location(first, 6, 7), Location(second, 6, 7) });
        auto resolved = sources.resolve(diagnostic);
        CHECK(resolved.message == "Duplicate definition 'A'");
        REQUIRE(resolved.locations.size() == 2);
        CHECK(resolved.locations[0].text == "A");
        CHECK(resolved.locations[1].text == "B");
        auto text = resolved.toString();
        CHECK(text.find("a.graphql:1:7: Duplicate definition 'A'") == 0);
        CHECK(text.find("b.graphql:1:7: related location") != std::string::npos);
    }
    SUBCASE("dropped locations keep the message") {
        Diagnostics diagnostics;
        diagnostics.emplace_back(Diagnostic("lost", Location(9, 0, 1)));
        auto resolved = sources.resolve(diagnostics);
        REQUIRE(resolved.size() == 1);
        CHECK(resolved[0].message == "lost");
        CHECK(resolved[0].locations.empty());
        CHECK(resolved[0].toString() == "lost");
    }
}

TEST_CASE("ResolvedDiagnostic toString underlines the text") {
    Sources sources;
    auto id = sources.addSource("q.graphql", "{ user { email } }");
    auto resolved = sources.resolve(Diagnostic("Unknown field 'email' on type 'User'", Location(id, 9, 14)));
    CHECK(resolved.toString() == "q.graphql:1:10: Unknown field 'email' on type 'User'\n"
                                 "    { user { email } }\n"
                                 "             ^^^^^");
}

} // namespace loom
