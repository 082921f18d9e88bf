#include "loom/SourceFile.hpp"

#include "doctest/doctest.h"

#include <string>

namespace loom {

TEST_CASE("SourceFile line numbers") {
    SUBCASE("empty string") {
        SourceFile file("empty.graphql", "");
        CHECK(file.getLineNumber(0) == 1);
        CHECK(file.getCharacterNumber(0) == 1);
    }
    SUBCASE("one liner") {
        std::string code("I met a man with a wooden leg named Steve. Oh yeah? What was his other leg named?");
        SourceFile file("one.graphql", code);
        CHECK(file.getLineNumber(0) == 1);
        CHECK(file.getLineNumber(10) == 1);
        CHECK(file.getCharacterNumber(10) == 11);
        CHECK(file.getLineNumber(static_cast<int32_t>(code.size())) == 1);
    }
    SUBCASE("multiline string") {
        SourceFile file("multi.graphql", "one\n two\n three\n four\n five\n six\n seven\n eight\n nine\n ten\n");
        CHECK(file.getLineNumber(1) == 1);
        CHECK(file.getLineNumber(4) == 2);
        CHECK(file.getLineNumber(9) == 3);
        CHECK(file.getLineNumber(16) == 4);
        CHECK(file.getLineNumber(22) == 5);
        CHECK(file.getLineNumber(28) == 6);
        CHECK(file.getLineNumber(33) == 7);
        CHECK(file.getLineNumber(40) == 8);
        CHECK(file.getLineNumber(47) == 9);
        CHECK(file.getLineNumber(53) == 10);
        CHECK(file.getCharacterNumber(11) == 3);
    }
    SUBCASE("multiple empty lines") {
        SourceFile file("empty_lines.graphql", "\n\n\n\n\n\n\n7");
        CHECK(file.getLineNumber(0) == 1);
        CHECK(file.getLineNumber(1) == 2);
        CHECK(file.getLineNumber(2) == 3);
        CHECK(file.getLineNumber(3) == 4);
        CHECK(file.getLineNumber(4) == 5);
        CHECK(file.getLineNumber(5) == 6);
        CHECK(file.getLineNumber(6) == 7);
        CHECK(file.getLineNumber(7) == 8);
        CHECK(file.getCharacterNumber(7) == 1);
    }
}

TEST_CASE("SourceFile line text") {
    SourceFile file("lines.graphql", "query Q {\r\n  a\n}");
    CHECK(file.lineText(1) == "query Q {");
    CHECK(file.lineText(2) == "  a");
    CHECK(file.lineText(3) == "}");
    CHECK(file.lineText(0).empty());
    CHECK(file.lineText(4).empty());
}

TEST_CASE("SourceFile read missing file") {
    SourceFile file("this/file/does/not/exist.graphql");
    CHECK(!file.read());
    CHECK(file.size() == 0);
}

} // namespace loom
