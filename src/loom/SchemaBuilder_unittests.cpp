#include "loom/SchemaBuilder.hpp"

#include "loom/AST.hpp"
#include "loom/CompilerState.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/Schema.hpp"
#include "loom/Sources.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

using DocumentList = std::vector<std::shared_ptr<const loom::ast::TypeSystemDocument>>;

constexpr const char* kSchema = R"(
interface Node { id: ID! }
type User implements Node { id: ID! name: String friends(first: Int): [User!]! }
type Page implements Node { id: ID! title: String }
union Actor = User | Page
type Query { node(id: ID!): Node viewer: User actor: Actor }
)";

loom::SchemaResult buildSchema(loom::Sources& sources, const std::string& schemaCode,
        const std::string& extensionCode = std::string()) {
    loom::ErrorReporter errorReporter(true);
    DocumentList schemaDocuments;
    DocumentList extensionDocuments;
    auto schema = loom::CompilerState::parseTypeSystemSource(sources, "schema.graphql", schemaCode, errorReporter);
    REQUIRE(schema);
    schemaDocuments.emplace_back(std::move(schema));
    if (!extensionCode.empty()) {
        auto extension = loom::CompilerState::parseTypeSystemSource(sources, "extension.graphql", extensionCode,
                errorReporter);
        REQUIRE(extension);
        extensionDocuments.emplace_back(std::move(extension));
    }
    return loom::SchemaBuilder::buildFromDocuments(schemaDocuments, extensionDocuments);
}

} // namespace

namespace loom {

TEST_CASE("SchemaBuilder valid schema") {
    Sources sources;
    auto result = buildSchema(sources, kSchema);
    REQUIRE(std::holds_alternative<std::shared_ptr<const Schema>>(result));
    auto schema = std::get<std::shared_ptr<const Schema>>(result);

    SUBCASE("types and builtins") {
        const Type* user = schema->findType("User");
        REQUIRE(user);
        CHECK(user->kind == TypeKind::kObject);
        CHECK(user->fields.size() == 3);
        CHECK(!user->isExtension);
        REQUIRE(user->findField("friends"));
        CHECK(user->findField("friends")->arguments.size() == 1);
        CHECK(user->findField("friends")->type.toString() == "[User!]!");
        CHECK(schema->findType("String"));
        CHECK(schema->findType("Boolean"));
        CHECK(!schema->findType("Missing"));
        CHECK(schema->findDirective("include"));
        CHECK(schema->findDirective("skip"));
    }
    SUBCASE("root types") {
        REQUIRE(schema->rootType(OperationKind::kQuery));
        CHECK(schema->rootType(OperationKind::kQuery)->name == "Query");
        CHECK(!schema->rootType(OperationKind::kMutation));
    }
    SUBCASE("__typename on composite types") {
        const Field* typenameField = schema->findField(schema->findType("Actor"), "__typename");
        REQUIRE(typenameField);
        CHECK(typenameField->type.toString() == "String!");
        CHECK(schema->findField(schema->findType("User"), "__typename") == schema->typenameField());
        CHECK(!schema->findField(schema->findType("Actor"), "id"));
    }
    SUBCASE("possible types") {
        CHECK(schema->possibleTypes("Node") == std::vector<std::string>{ "Page", "User" });
        CHECK(schema->possibleTypes("Actor") == std::vector<std::string>{ "Page", "User" });
        CHECK(schema->possibleTypes("User") == std::vector<std::string>{ "User" });
        CHECK(schema->isPossibleType("Node", "User"));
        CHECK(!schema->isPossibleType("User", "Page"));
        CHECK(schema->typesOverlap("Node", "Actor"));
        CHECK(!schema->typesOverlap("User", "Page"));
    }
}

TEST_CASE("SchemaBuilder extensions") {
    Sources sources;
    SUBCASE("extension fields are flagged") {
        auto result = buildSchema(sources, kSchema, R"(
extend type User { isOnline: Boolean }
type LocalState { count: Int }
)");
        REQUIRE(std::holds_alternative<std::shared_ptr<const Schema>>(result));
        auto schema = std::get<std::shared_ptr<const Schema>>(result);
        const Type* user = schema->findType("User");
        REQUIRE(user);
        REQUIRE(user->findField("isOnline"));
        CHECK(user->findField("isOnline")->isExtension);
        CHECK(!user->findField("name")->isExtension);
        REQUIRE(schema->findType("LocalState"));
        CHECK(schema->findType("LocalState")->isExtension);
    }
    SUBCASE("extending an unknown type") {
        auto result = buildSchema(sources, kSchema, "extend type Missing { a: Int }");
        REQUIRE(std::holds_alternative<SchemaBuildError>(result));
        const auto& error = std::get<SchemaBuildError>(result);
        CHECK(error.message == "1 error building schema");
        REQUIRE(error.diagnostics.size() == 1);
        CHECK(error.diagnostics[0].message == "Cannot extend unknown type 'Missing'");
        auto resolved = sources.resolve(error.diagnostics[0]);
        REQUIRE(resolved.locations.size() == 1);
        CHECK(resolved.locations[0].path == "extension.graphql");
        CHECK(resolved.locations[0].text == "Missing");
    }
    SUBCASE("extensions cannot change root types") {
        auto result = buildSchema(sources, kSchema, "schema { query: User }");
        REQUIRE(std::holds_alternative<SchemaBuildError>(result));
        const auto& error = std::get<SchemaBuildError>(result);
        REQUIRE(error.diagnostics.size() == 1);
        CHECK(error.diagnostics[0].message == "Project extensions cannot change the schema root types");
    }
}

TEST_CASE("SchemaBuilder errors") {
    Sources sources;
    SUBCASE("duplicate type has both locations") {
        auto result = buildSchema(sources, "type Query { a: Int }\ntype Query { b: Int }\n");
        REQUIRE(std::holds_alternative<SchemaBuildError>(result));
        const auto& error = std::get<SchemaBuildError>(result);
        REQUIRE(error.diagnostics.size() == 1);
        CHECK(error.diagnostics[0].message == "Duplicate definition of type 'Query'");
        auto resolved = sources.resolve(error.diagnostics[0]);
        REQUIRE(resolved.locations.size() == 2);
        CHECK(resolved.locations[0].lineNumber == 2);
        CHECK(resolved.locations[1].lineNumber == 1);
    }
    SUBCASE("undefined type reference") {
        auto result = buildSchema(sources, "type Query { a: Missing }");
        REQUIRE(std::holds_alternative<SchemaBuildError>(result));
        const auto& error = std::get<SchemaBuildError>(result);
        REQUIRE(error.diagnostics.size() == 1);
        CHECK(error.diagnostics[0].message == "Reference to undefined type 'Missing'");
    }
    SUBCASE("restating a builtin scalar is allowed") {
        auto result = buildSchema(sources, "scalar String\ntype Query { a: String }");
        CHECK(std::holds_alternative<std::shared_ptr<const Schema>>(result));
    }
    SUBCASE("redefining a builtin as an object") {
        auto result = buildSchema(sources, "type String { a: Int }\ntype Query { a: String }");
        REQUIRE(std::holds_alternative<SchemaBuildError>(result));
        CHECK(std::get<SchemaBuildError>(result).diagnostics[0].message == "Cannot redefine built in type 'String'");
    }
    SUBCASE("interface field missing") {
        auto result = buildSchema(sources, "interface Node { id: ID! }\ntype Query implements Node { a: Int }");
        REQUIRE(std::holds_alternative<SchemaBuildError>(result));
        const auto& error = std::get<SchemaBuildError>(result);
        REQUIRE(error.diagnostics.size() == 1);
        CHECK(error.diagnostics[0].message
                == "Type 'Query' does not define field 'id' required by interface 'Node'");
    }
    SUBCASE("every problem is reported") {
        auto result = buildSchema(sources, R"(
type Query { a: Missing, __secret: Int, a: Int }
union U = Query | Other
schema { query: Root }
)");
        REQUIRE(std::holds_alternative<SchemaBuildError>(result));
        const auto& error = std::get<SchemaBuildError>(result);
        CHECK(error.message == "5 errors building schema");
        CHECK(error.diagnostics.size() == 5);
    }
}

} // namespace loom
