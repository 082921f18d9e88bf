#include "loom/IRBuilder.hpp"

#include "loom/AST.hpp"
#include "loom/CompilerState.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/Schema.hpp"
#include "loom/SchemaBuilder.hpp"
#include "loom/Sources.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

using Documents = std::vector<std::shared_ptr<const loom::ast::ExecutableDocument>>;

constexpr const char* kSchema = R"(
type User { id: ID!, name: String, friends(first: Int): [User!]! }
type Query { user(id: ID!): User, viewer: User }
)";

std::shared_ptr<const loom::Schema> buildSchema(loom::Sources& sources, const char* code) {
    loom::ErrorReporter errorReporter(true);
    auto document = loom::CompilerState::parseTypeSystemSource(sources, "schema.graphql", code, errorReporter);
    REQUIRE(document);
    auto result = loom::SchemaBuilder::buildFromDocuments({ document }, {});
    REQUIRE(std::holds_alternative<std::shared_ptr<const loom::Schema>>(result));
    return std::get<std::shared_ptr<const loom::Schema>>(result);
}

std::shared_ptr<const loom::ast::ExecutableDocument> parse(loom::Sources& sources, const std::string& path,
        const char* code) {
    loom::ErrorReporter errorReporter(true);
    auto document = loom::CompilerState::parseExecutableSource(sources, path, code, errorReporter);
    REQUIRE(document);
    return document;
}

} // namespace

namespace loom {

TEST_CASE("IRBuilder valid documents") {
    Sources sources;
    auto schema = buildSchema(sources, kSchema);
    Documents documents{ parse(sources, "a.graphql", R"(
query ViewerQuery($count: Int = 10) { viewer { ...UserName friends(first: $count) { id } } }
fragment UserName on User { name }
)") };

    IRBuilder builder(schema);
    auto result = builder.buildDocuments(documents, {});
    REQUIRE(std::holds_alternative<IRResult>(result));
    const auto& ir = std::get<IRResult>(result).ir;
    CHECK(std::get<IRResult>(result).baseFragmentNames.empty());
    REQUIRE(ir.definitions.size() == 2);

    const auto& operation = ir.definitions[0];
    CHECK(operation->isOperation());
    CHECK(operation->name == "ViewerQuery");
    CHECK(operation->typeCondition == "Query");
    CHECK(operation->sourcePath == "a.graphql");
    REQUIRE(operation->variables.size() == 1);
    CHECK(operation->variables[0].name == "count");
    REQUIRE(operation->variables[0].defaultValue);
    CHECK(operation->variables[0].defaultValue->text == "10");

    REQUIRE(operation->selections.size() == 1);
    REQUIRE(operation->selections[0]->kind == ir::SelectionKind::kLinkedField);
    const auto* viewer = static_cast<const ir::LinkedField*>(operation->selections[0].get());
    CHECK(viewer->name == "viewer");
    CHECK(viewer->parentType == "Query");
    REQUIRE(viewer->selections.size() == 2);
    CHECK(viewer->selections[0]->kind == ir::SelectionKind::kFragmentSpread);
    REQUIRE(viewer->selections[1]->kind == ir::SelectionKind::kLinkedField);
    const auto* friends = static_cast<const ir::LinkedField*>(viewer->selections[1].get());
    REQUIRE(friends->arguments.size() == 1);
    CHECK(friends->arguments[0].value.kind == ir::Value::Kind::kVariable);
    CHECK(friends->arguments[0].value.text == "count");

    const auto& fragment = ir.definitions[1];
    CHECK(fragment->isFragment());
    CHECK(fragment->typeCondition == "User");
    REQUIRE(fragment->selections.size() == 1);
    CHECK(fragment->selections[0]->kind == ir::SelectionKind::kScalarField);
}

TEST_CASE("IRBuilder unknown field reports the field name span") {
    Sources sources;
    auto schema = buildSchema(sources, "type User { id: ID!, name: String }\ntype Query { user: User }");
    Documents documents{ parse(sources, "q.graphql", "query Q { user { id, email } }") };

    IRBuilder builder(schema);
    auto result = builder.buildDocuments(documents, {});
    REQUIRE(std::holds_alternative<Diagnostics>(result));
    const auto& diagnostics = std::get<Diagnostics>(result);
    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].message == "Unknown field 'email' on type 'User'");
    REQUIRE(diagnostics[0].locations.size() == 1);
    CHECK(diagnostics[0].locations[0].start == 21);
    CHECK(diagnostics[0].locations[0].end == 26);

    auto resolved = sources.resolve(diagnostics[0]);
    REQUIRE(resolved.locations.size() == 1);
    CHECK(resolved.locations[0].path == "q.graphql");
    CHECK(resolved.locations[0].lineNumber == 1);
    CHECK(resolved.locations[0].characterNumber == 22);
    CHECK(resolved.locations[0].text == "email");
}

TEST_CASE("IRBuilder errors") {
    Sources sources;
    auto schema = buildSchema(sources, kSchema);
    IRBuilder builder(schema);

    SUBCASE("errors from every document are reported together") {
        Documents documents{
            parse(sources, "a.graphql", "query A { viewer { age } }"),
            parse(sources, "b.graphql", "query B { viewer { ...Missing } }")
        };
        auto result = builder.buildDocuments(documents, {});
        REQUIRE(std::holds_alternative<Diagnostics>(result));
        const auto& diagnostics = std::get<Diagnostics>(result);
        REQUIRE(diagnostics.size() == 2);
        CHECK(diagnostics[0].message == "Unknown field 'age' on type 'User'");
        CHECK(diagnostics[1].message == "Unknown fragment 'Missing'");
    }
    SUBCASE("duplicate definition names") {
        Documents documents{
            parse(sources, "a.graphql", "query A { viewer { id } }"),
            parse(sources, "b.graphql", "fragment A on User { id }")
        };
        auto result = builder.buildDocuments(documents, {});
        REQUIRE(std::holds_alternative<Diagnostics>(result));
        const auto& diagnostics = std::get<Diagnostics>(result);
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].message == "Duplicate definitions named 'A'");
        CHECK(diagnostics[0].locations.size() == 2);
    }
    SUBCASE("nullable variable in non-null position") {
        Documents documents{ parse(sources, "a.graphql", "query A($id: ID) { user(id: $id) { id } }") };
        auto result = builder.buildDocuments(documents, {});
        REQUIRE(std::holds_alternative<Diagnostics>(result));
        const auto& diagnostics = std::get<Diagnostics>(result);
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].message == "Variable '$id' of type 'ID' cannot be used where 'ID!' is expected");
    }
    SUBCASE("undefined variable") {
        Documents documents{ parse(sources, "a.graphql", "query A { user(id: $id) { id } }") };
        auto result = builder.buildDocuments(documents, {});
        REQUIRE(std::holds_alternative<Diagnostics>(result));
        REQUIRE(std::get<Diagnostics>(result).size() == 1);
        CHECK(std::get<Diagnostics>(result)[0].message == "Variable '$id' is not defined by operation 'A'");
    }
    SUBCASE("missing selection on a composite field") {
        Documents documents{ parse(sources, "a.graphql", "query A { viewer }") };
        auto result = builder.buildDocuments(documents, {});
        REQUIRE(std::holds_alternative<Diagnostics>(result));
        REQUIRE(std::get<Diagnostics>(result).size() == 1);
        CHECK(std::get<Diagnostics>(result)[0].message
                == "Field 'viewer' of type 'User' must have a selection of subfields");
    }
    SUBCASE("fragment cycle") {
        Documents documents{ parse(sources, "a.graphql", R"(
fragment A on User { ...B }
fragment B on User { friends { ...A } }
)") };
        auto result = builder.buildDocuments(documents, {});
        REQUIRE(std::holds_alternative<Diagnostics>(result));
        const auto& diagnostics = std::get<Diagnostics>(result);
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].message == "Cannot spread fragment 'A' within itself via 'B'");
    }
}

TEST_CASE("IRBuilder base project fragments") {
    Sources sources;
    auto schema = buildSchema(sources, kSchema);
    Documents baseDocuments{ parse(sources, "base/fragments.graphql", R"(
fragment BaseUser on User { id name }
fragment Unused on User { id }
query BaseQuery { viewer { id } }
)") };

    SUBCASE("reachable base fragments are included") {
        Documents documents{ parse(sources, "app/a.graphql", "query A { viewer { ...BaseUser } }") };
        IRBuilder builder(schema);
        auto result = builder.buildDocuments(documents, baseDocuments);
        REQUIRE(std::holds_alternative<IRResult>(result));
        const auto& irResult = std::get<IRResult>(result);
        REQUIRE(irResult.ir.definitions.size() == 2);
        CHECK(irResult.ir.definitions[0]->name == "A");
        CHECK(irResult.ir.definitions[1]->name == "BaseUser");
        CHECK(irResult.baseFragmentNames == std::set<std::string>{ "BaseUser" });
    }
    SUBCASE("project cannot redefine a base fragment") {
        Documents documents{ parse(sources, "app/a.graphql", "fragment BaseUser on User { id }") };
        IRBuilder builder(schema);
        auto result = builder.buildDocuments(documents, baseDocuments);
        REQUIRE(std::holds_alternative<Diagnostics>(result));
        REQUIRE(std::get<Diagnostics>(result).size() == 1);
        CHECK(std::get<Diagnostics>(result)[0].message
                == "Fragment 'BaseUser' is already defined by the base project");
    }
}

} // namespace loom
