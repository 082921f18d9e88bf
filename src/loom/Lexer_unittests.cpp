#include "loom/Lexer.hpp"

#include "doctest/doctest.h"

#include <string_view>

namespace loom {

TEST_CASE("Lexer Base Cases") {
    SUBCASE("empty string") {
        Lexer lexer("");
        REQUIRE(lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
    SUBCASE("whitespace and commas only") {
        Lexer lexer("  \t\n\r ,,, ");
        REQUIRE(lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
    SUBCASE("comment only") {
        Lexer lexer("# query Foo { bar }");
        REQUIRE(lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
    SUBCASE("byte order mark") {
        Lexer lexer("\xEF\xBB\xBFquery");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::kName);
        CHECK(lexer.tokens()[0].offset == 3);
    }
}

TEST_CASE("Lexer Punctuators") {
    std::string_view code = "! $ & ( ) ... : = @ [ ] { | }";
    Lexer lexer(code);
    REQUIRE(lexer.lex());
    REQUIRE(lexer.tokens().size() == 14);
    CHECK(lexer.tokens()[0].name == Token::kBang);
    CHECK(lexer.tokens()[1].name == Token::kDollar);
    CHECK(lexer.tokens()[2].name == Token::kAmpersand);
    CHECK(lexer.tokens()[3].name == Token::kOpenParen);
    CHECK(lexer.tokens()[4].name == Token::kCloseParen);
    CHECK(lexer.tokens()[5].name == Token::kEllipses);
    CHECK(lexer.tokens()[5].range == "...");
    CHECK(lexer.tokens()[5].offset == 10);
    CHECK(lexer.tokens()[6].name == Token::kColon);
    CHECK(lexer.tokens()[7].name == Token::kEquals);
    CHECK(lexer.tokens()[8].name == Token::kAt);
    CHECK(lexer.tokens()[9].name == Token::kOpenSquare);
    CHECK(lexer.tokens()[10].name == Token::kCloseSquare);
    CHECK(lexer.tokens()[11].name == Token::kOpenCurly);
    CHECK(lexer.tokens()[12].name == Token::kPipe);
    CHECK(lexer.tokens()[13].name == Token::kCloseCurly);
    CHECK(lexer.tokens()[13].end() == static_cast<int32_t>(code.size()));
}

TEST_CASE("Lexer Names") {
    SUBCASE("keywords are names") {
        Lexer lexer("query fragment on");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].range == "query");
        CHECK(lexer.tokens()[1].range == "fragment");
        CHECK(lexer.tokens()[2].range == "on");
    }
    SUBCASE("underscores and digits") {
        Lexer lexer("__typename _a1");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].range == "__typename");
        CHECK(lexer.tokens()[1].range == "_a1");
        CHECK(lexer.tokens()[1].offset == 11);
    }
    SUBCASE("name directly after punctuator") {
        Lexer lexer("$id:ID!");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 5);
        CHECK(lexer.tokens()[1].range == "id");
        CHECK(lexer.tokens()[3].range == "ID");
        CHECK(lexer.tokens()[4].name == Token::kBang);
    }
}

TEST_CASE("Lexer Numbers") {
    SUBCASE("integers") {
        Lexer lexer("0 -12 345");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].name == Token::kInt);
        CHECK(lexer.tokens()[1].name == Token::kInt);
        CHECK(lexer.tokens()[1].range == "-12");
        CHECK(lexer.tokens()[2].range == "345");
    }
    SUBCASE("floats") {
        Lexer lexer("1.5 -0.25 1e10 2.5E-3");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 4);
        for (const auto& token : lexer.tokens()) {
            CHECK(token.name == Token::kFloat);
        }
        CHECK(lexer.tokens()[3].range == "2.5E-3");
    }
    SUBCASE("leading zero") {
        Lexer lexer("007");
        CHECK(!lexer.lex());
        REQUIRE(lexer.diagnostics().size() == 1);
        CHECK(lexer.diagnostics()[0].locations[0].start == 0);
    }
    SUBCASE("missing fraction") {
        Lexer lexer("1.");
        CHECK(!lexer.lex());
        CHECK(lexer.diagnostics().size() == 1);
    }
    SUBCASE("name immediately after number") {
        Lexer lexer("123abc");
        CHECK(!lexer.lex());
        CHECK(lexer.diagnostics().size() == 1);
    }
}

TEST_CASE("Lexer Strings") {
    SUBCASE("plain string") {
        Lexer lexer("\"hello\"");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::kString);
        CHECK(lexer.tokens()[0].range == "\"hello\"");
    }
    SUBCASE("escaped quote") {
        Lexer lexer("\"a\\\"b\" c");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].range == "\"a\\\"b\"");
        CHECK(lexer.tokens()[1].range == "c");
    }
    SUBCASE("block string spanning lines") {
        Lexer lexer("\"\"\"\n  line one\n  \"quoted\"\n\"\"\" x");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].name == Token::kBlockString);
        CHECK(lexer.tokens()[1].range == "x");
    }
    SUBCASE("unterminated string") {
        Lexer lexer("\"abc\n\"");
        CHECK(!lexer.lex());
        REQUIRE(lexer.diagnostics().size() == 1);
        CHECK(lexer.diagnostics()[0].message == "Unterminated string");
    }
    SUBCASE("unterminated block string") {
        Lexer lexer("\"\"\" abc");
        CHECK(!lexer.lex());
        CHECK(lexer.diagnostics().size() == 1);
    }
}

TEST_CASE("Lexer Errors") {
    SUBCASE("single dot") {
        Lexer lexer("..", 3);
        CHECK(!lexer.lex());
        REQUIRE(lexer.diagnostics().size() == 1);
        CHECK(lexer.diagnostics()[0].locations[0].sourceID == 3);
    }
    SUBCASE("unexpected character location") {
        Lexer lexer("{ a ? }", 7);
        CHECK(!lexer.lex());
        REQUIRE(lexer.diagnostics().size() == 1);
        REQUIRE(lexer.diagnostics()[0].locations.size() == 1);
        CHECK(lexer.diagnostics()[0].locations[0] == Location(7, 4, 5));
    }
}

} // namespace loom
