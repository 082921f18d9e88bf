#include "loom/Parser.hpp"

#include "doctest/doctest.h"

namespace loom {

TEST_CASE("Parser Operations") {
    SUBCASE("named query with variables") {
        Parser parser("query UserQuery($id: ID!, $count: Int = 10) { user(id: $id) { id name } }");
        REQUIRE(parser.parseExecutable());
        const auto* document = parser.executableDocument();
        REQUIRE(document);
        REQUIRE(document->definitions.size() == 1);
        REQUIRE(document->definitions[0]->definitionType == ast::DefinitionType::kOperation);
        const auto* operation = static_cast<const ast::OperationDefinition*>(document->definitions[0].get());
        CHECK(operation->operationKind == OperationKind::kQuery);
        CHECK(operation->name == "UserQuery");
        CHECK(operation->nameLocation == Location(kInvalidSourceID, 6, 15));
        REQUIRE(operation->variables.size() == 2);
        CHECK(operation->variables[0].name == "id");
        CHECK(operation->variables[0].type.toString() == "ID!");
        CHECK(!operation->variables[0].defaultValue);
        CHECK(operation->variables[1].name == "count");
        REQUIRE(operation->variables[1].defaultValue);
        CHECK(operation->variables[1].defaultValue->kind == ast::Value::Kind::kInt);
        CHECK(operation->variables[1].defaultValue->text == "10");

        REQUIRE(operation->selections.size() == 1);
        REQUIRE(operation->selections[0]->selectionType == ast::SelectionType::kField);
        const auto* user = static_cast<const ast::FieldSelection*>(operation->selections[0].get());
        CHECK(user->name == "user");
        CHECK(user->hasSelectionSet);
        REQUIRE(user->arguments.size() == 1);
        CHECK(user->arguments[0].name == "id");
        CHECK(user->arguments[0].value.kind == ast::Value::Kind::kVariable);
        CHECK(user->arguments[0].value.text == "id");
        CHECK(user->selections.size() == 2);
    }
    SUBCASE("shorthand query") {
        Parser parser("{ viewer { id } }");
        REQUIRE(parser.parseExecutable());
        REQUIRE(parser.executableDocument()->definitions.size() == 1);
        const auto* operation = static_cast<const ast::OperationDefinition*>(
                parser.executableDocument()->definitions[0].get());
        CHECK(operation->name.empty());
        CHECK(operation->operationKind == OperationKind::kQuery);
    }
    SUBCASE("mutation and subscription") {
        Parser parser("mutation M { like } subscription S { feed { id } }");
        REQUIRE(parser.parseExecutable());
        REQUIRE(parser.executableDocument()->definitions.size() == 2);
        const auto* mutation = static_cast<const ast::OperationDefinition*>(
                parser.executableDocument()->definitions[0].get());
        const auto* subscription = static_cast<const ast::OperationDefinition*>(
                parser.executableDocument()->definitions[1].get());
        CHECK(mutation->operationKind == OperationKind::kMutation);
        CHECK(subscription->operationKind == OperationKind::kSubscription);
    }
    SUBCASE("aliases and directives") {
        Parser parser("query Q($show: Boolean!) { smallPic: picture(size: 64) @include(if: $show) }");
        REQUIRE(parser.parseExecutable());
        const auto* operation = static_cast<const ast::OperationDefinition*>(
                parser.executableDocument()->definitions[0].get());
        const auto* field = static_cast<const ast::FieldSelection*>(operation->selections[0].get());
        CHECK(field->alias == "smallPic");
        CHECK(field->name == "picture");
        CHECK(!field->hasSelectionSet);
        REQUIRE(field->directives.size() == 1);
        CHECK(field->directives[0].name == "include");
        REQUIRE(field->directives[0].arguments.size() == 1);
        CHECK(field->directives[0].arguments[0].value.kind == ast::Value::Kind::kVariable);
    }
}

TEST_CASE("Parser Fragments") {
    SUBCASE("definition and spreads") {
        Parser parser("fragment UserFields on User { id ...Other ... on Admin { level } ... @skip(if: true) { x } }");
        REQUIRE(parser.parseExecutable());
        REQUIRE(parser.executableDocument()->definitions.size() == 1);
        const auto* fragment = static_cast<const ast::FragmentDefinition*>(
                parser.executableDocument()->definitions[0].get());
        CHECK(fragment->definitionType == ast::DefinitionType::kFragment);
        CHECK(fragment->name == "UserFields");
        CHECK(fragment->typeCondition == "User");
        REQUIRE(fragment->selections.size() == 4);
        CHECK(fragment->selections[0]->selectionType == ast::SelectionType::kField);
        REQUIRE(fragment->selections[1]->selectionType == ast::SelectionType::kFragmentSpread);
        CHECK(static_cast<const ast::FragmentSpreadSelection*>(fragment->selections[1].get())->name == "Other");
        REQUIRE(fragment->selections[2]->selectionType == ast::SelectionType::kInlineFragment);
        CHECK(static_cast<const ast::InlineFragmentSelection*>(fragment->selections[2].get())->typeCondition
                == "Admin");
        REQUIRE(fragment->selections[3]->selectionType == ast::SelectionType::kInlineFragment);
        const auto* untyped = static_cast<const ast::InlineFragmentSelection*>(fragment->selections[3].get());
        CHECK(untyped->typeCondition.empty());
        CHECK(untyped->directives.size() == 1);
    }
    SUBCASE("fragment named on") {
        Parser parser("fragment on on User { id }");
        CHECK(!parser.parseExecutable());
        REQUIRE(parser.diagnostics().size() == 1);
        CHECK(parser.diagnostics()[0].message == "Fragment name cannot be 'on'");
    }
}

TEST_CASE("Parser Values") {
    Parser parser("{ f(a: 1, b: -2.5, c: \"s\\n\\u0041\", d: true, e: null, g: RED, h: [1, 2], i: {x: 1, y: \"z\"}) }");
    REQUIRE(parser.parseExecutable());
    const auto* operation = static_cast<const ast::OperationDefinition*>(
            parser.executableDocument()->definitions[0].get());
    const auto* field = static_cast<const ast::FieldSelection*>(operation->selections[0].get());
    REQUIRE(field->arguments.size() == 8);
    CHECK(field->arguments[0].value.kind == ast::Value::Kind::kInt);
    CHECK(field->arguments[1].value.kind == ast::Value::Kind::kFloat);
    CHECK(field->arguments[1].value.text == "-2.5");
    CHECK(field->arguments[2].value.kind == ast::Value::Kind::kString);
    CHECK(field->arguments[2].value.text == "s\nA");
    CHECK(field->arguments[3].value.kind == ast::Value::Kind::kBoolean);
    CHECK(field->arguments[4].value.kind == ast::Value::Kind::kNull);
    CHECK(field->arguments[5].value.kind == ast::Value::Kind::kEnum);
    CHECK(field->arguments[5].value.text == "RED");
    REQUIRE(field->arguments[6].value.kind == ast::Value::Kind::kList);
    CHECK(field->arguments[6].value.items.size() == 2);
    REQUIRE(field->arguments[7].value.kind == ast::Value::Kind::kObject);
    REQUIRE(field->arguments[7].value.fields.size() == 2);
    CHECK(field->arguments[7].value.fields[1].name == "y");
    CHECK(field->arguments[7].value.fields[1].value.text == "z");
}

TEST_CASE("Parser Executable Errors") {
    SUBCASE("empty selection set") {
        Parser parser("query Q { }");
        CHECK(!parser.parseExecutable());
        REQUIRE(parser.diagnostics().size() == 1);
        CHECK(parser.diagnostics()[0].message == "Selection set cannot be empty");
        CHECK(parser.diagnostics()[0].locations[0] == Location(kInvalidSourceID, 10, 11));
    }
    SUBCASE("type system definition in executable document") {
        Parser parser("type User { id: ID }");
        CHECK(!parser.parseExecutable());
        REQUIRE(parser.diagnostics().size() == 1);
        CHECK(parser.diagnostics()[0].message
                == "Unexpected 'type', only operations and fragments are allowed in documents");
    }
    SUBCASE("unterminated selection set") {
        Parser parser("query Q { a");
        CHECK(!parser.parseExecutable());
        CHECK(parser.diagnostics().size() == 1);
    }
    SUBCASE("variables in constant default") {
        Parser parser("query Q($a: Int = $b) { a }");
        CHECK(!parser.parseExecutable());
        REQUIRE(parser.diagnostics().size() == 1);
        CHECK(parser.diagnostics()[0].message == "Variables are not allowed in constant values");
    }
    SUBCASE("lex errors are reported") {
        Parser parser("query Q { a ? }", 2);
        CHECK(!parser.parseExecutable());
        REQUIRE(parser.diagnostics().size() == 1);
        CHECK(parser.diagnostics()[0].locations[0].sourceID == 2);
    }
    SUBCASE("invalid escape") {
        Parser parser("{ f(a: \"\\q\") }");
        CHECK(!parser.parseExecutable());
        REQUIRE(parser.diagnostics().size() == 1);
        CHECK(parser.diagnostics()[0].message == "Invalid escape sequence '\\q'");
    }
}

TEST_CASE("Parser Type System") {
    SUBCASE("object types and interfaces") {
        Parser parser(R"(
"""
A person.
"""
type User implements Node & Entity @key {
  "The id."
  id: ID!
  friends(first: Int = 10, after: String): [User!]
}
interface Node { id: ID! }
)");
        REQUIRE(parser.parseTypeSystem());
        const auto* document = parser.typeSystemDocument();
        REQUIRE(document->definitions.size() == 2);
        const auto& user = document->definitions[0];
        CHECK(user.kind == ast::TypeSystemKind::kObject);
        CHECK(!user.isExtension);
        CHECK(user.name == "User");
        REQUIRE(user.interfaces.size() == 2);
        CHECK(user.interfaces[1] == "Entity");
        REQUIRE(user.fields.size() == 2);
        CHECK(user.fields[0].type.toString() == "ID!");
        REQUIRE(user.fields[1].arguments.size() == 2);
        CHECK(user.fields[1].arguments[0].defaultValue);
        CHECK(user.fields[1].type.toString() == "[User!]");
        CHECK(document->definitions[1].kind == ast::TypeSystemKind::kInterface);
    }
    SUBCASE("schema, scalars, enums, unions and inputs") {
        Parser parser(R"(
schema { query: Root mutation: Mutations }
scalar DateTime
enum Color { RED GREEN BLUE }
union SearchResult = | User | Page
input Filter { name: String, limit: Int = 5 }
directive @cached(ttl: Int) repeatable on FIELD | FRAGMENT_SPREAD
)");
        REQUIRE(parser.parseTypeSystem());
        const auto& definitions = parser.typeSystemDocument()->definitions;
        REQUIRE(definitions.size() == 6);
        CHECK(definitions[0].kind == ast::TypeSystemKind::kSchema);
        REQUIRE(definitions[0].rootOperationTypes.size() == 2);
        CHECK(definitions[0].rootOperationTypes[1].first == OperationKind::kMutation);
        CHECK(definitions[0].rootOperationTypes[1].second == "Mutations");
        CHECK(definitions[1].kind == ast::TypeSystemKind::kScalar);
        CHECK(definitions[2].enumValues.size() == 3);
        CHECK(definitions[3].unionMembers.size() == 2);
        CHECK(definitions[4].inputFields.size() == 2);
        CHECK(definitions[5].kind == ast::TypeSystemKind::kDirective);
        CHECK(definitions[5].name == "cached");
        CHECK(definitions[5].directiveLocations.size() == 2);
    }
    SUBCASE("extensions") {
        Parser parser("extend type User { nickname: String }");
        REQUIRE(parser.parseTypeSystem());
        REQUIRE(parser.typeSystemDocument()->definitions.size() == 1);
        CHECK(parser.typeSystemDocument()->definitions[0].isExtension);
        CHECK(parser.typeSystemDocument()->definitions[0].fields.size() == 1);
    }
    SUBCASE("bad enum value") {
        Parser parser("enum Flag { true }");
        CHECK(!parser.parseTypeSystem());
        REQUIRE(parser.diagnostics().size() == 1);
        CHECK(parser.diagnostics()[0].message == "Enum values cannot be named 'true'");
    }
    SUBCASE("unknown keyword") {
        Parser parser("table User { id: ID }");
        CHECK(!parser.parseTypeSystem());
        REQUIRE(parser.diagnostics().size() == 1);
        CHECK(parser.diagnostics()[0].message == "Unexpected 'table', expected a type system definition");
    }
}

} // namespace loom
