#ifndef SRC_LOOM_AST_HPP_
#define SRC_LOOM_AST_HPP_

#include "loom/Diagnostic.hpp"
#include "loom/TypeRef.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace loom {
namespace ast {

// The AST is a direct representation of the parsed source, before any type checking. Every node records the Location
// of the text it was parsed from so later stages can attribute errors.

struct ObjectField;

struct Value {
    enum class Kind { kVariable, kInt, kFloat, kString, kBoolean, kNull, kEnum, kList, kObject };

    Kind kind = Kind::kNull;
    // Variable name without '$', numeric text, unescaped string contents, "true"/"false" or enum value name.
    std::string text;
    std::vector<Value> items;
    std::vector<ObjectField> fields;
    Location location;
};

struct ObjectField {
    std::string name;
    Location nameLocation;
    Value value;
};

struct Argument {
    std::string name;
    Location nameLocation;
    Value value;
    Location location;
};

struct Directive {
    std::string name;
    std::vector<Argument> arguments;
    Location location;
};

struct VariableDefinition {
    std::string name;
    Location location;
    TypeRef type;
    Location typeLocation;
    std::optional<Value> defaultValue;
    std::vector<Directive> directives;
};

enum class SelectionType { kField, kFragmentSpread, kInlineFragment };

struct Selection {
    Selection() = delete;
    Selection(SelectionType type, Location loc): selectionType(type), location(loc) {}
    virtual ~Selection() = default;

    SelectionType selectionType;
    Location location;
    std::vector<Directive> directives;
};

using SelectionList = std::vector<std::unique_ptr<Selection>>;

struct FieldSelection : public Selection {
    explicit FieldSelection(Location loc): Selection(SelectionType::kField, loc) {}
    virtual ~FieldSelection() = default;

    // Empty if there is no alias.
    std::string alias;
    Location aliasLocation;
    std::string name;
    Location nameLocation;
    std::vector<Argument> arguments;
    bool hasSelectionSet = false;
    SelectionList selections;
};

struct FragmentSpreadSelection : public Selection {
    explicit FragmentSpreadSelection(Location loc): Selection(SelectionType::kFragmentSpread, loc) {}
    virtual ~FragmentSpreadSelection() = default;

    std::string name;
    Location nameLocation;
};

struct InlineFragmentSelection : public Selection {
    explicit InlineFragmentSelection(Location loc): Selection(SelectionType::kInlineFragment, loc) {}
    virtual ~InlineFragmentSelection() = default;

    // Empty if the inline fragment has no type condition.
    std::string typeCondition;
    Location typeConditionLocation;
    SelectionList selections;
};

enum class DefinitionType { kOperation, kFragment };

struct ExecutableDefinition {
    ExecutableDefinition() = delete;
    ExecutableDefinition(DefinitionType type, Location loc): definitionType(type), location(loc) {}
    virtual ~ExecutableDefinition() = default;

    DefinitionType definitionType;
    Location location;
    // Empty for anonymous operations.
    std::string name;
    Location nameLocation;
    std::vector<Directive> directives;
    SelectionList selections;
};

struct OperationDefinition : public ExecutableDefinition {
    explicit OperationDefinition(Location loc): ExecutableDefinition(DefinitionType::kOperation, loc) {}
    virtual ~OperationDefinition() = default;

    OperationKind operationKind = OperationKind::kQuery;
    std::vector<VariableDefinition> variables;
};

struct FragmentDefinition : public ExecutableDefinition {
    explicit FragmentDefinition(Location loc): ExecutableDefinition(DefinitionType::kFragment, loc) {}
    virtual ~FragmentDefinition() = default;

    std::string typeCondition;
    Location typeConditionLocation;
};

// One parsed file of operations and fragments.
struct ExecutableDocument {
    SourceID sourceID = kInvalidSourceID;
    // Path of the source file, relative to the configuration root when known. Generated artifacts are placed
    // relative to it and naming conventions are derived from it.
    std::string path;
    std::vector<std::unique_ptr<ExecutableDefinition>> definitions;
};

// Type system language.

struct InputValueDefinition {
    std::string name;
    Location location;
    TypeRef type;
    std::optional<Value> defaultValue;
    std::vector<Directive> directives;
};

struct FieldDefinition {
    std::string name;
    Location location;
    std::vector<InputValueDefinition> arguments;
    TypeRef type;
    std::vector<Directive> directives;
};

enum class TypeSystemKind { kSchema, kScalar, kObject, kInterface, kUnion, kEnum, kInputObject, kDirective };

// A flat record covering every type system definition. Only the members relevant to |kind| are populated.
struct TypeSystemDefinition {
    TypeSystemKind kind = TypeSystemKind::kScalar;
    // True for 'extend ...' definitions.
    bool isExtension = false;
    // Empty for schema definitions.
    std::string name;
    Location location;
    Location nameLocation;
    std::vector<Directive> directives;

    // kObject, kInterface
    std::vector<std::string> interfaces;
    std::vector<FieldDefinition> fields;
    // kInputObject fields, kDirective arguments
    std::vector<InputValueDefinition> inputFields;
    // kEnum
    std::vector<std::string> enumValues;
    // kUnion
    std::vector<std::string> unionMembers;
    // kSchema
    std::vector<std::pair<OperationKind, std::string>> rootOperationTypes;
    // kDirective
    std::vector<std::string> directiveLocations;
};

struct TypeSystemDocument {
    SourceID sourceID = kInvalidSourceID;
    std::string path;
    std::vector<TypeSystemDefinition> definitions;
};

} // namespace ast
} // namespace loom

#endif // SRC_LOOM_AST_HPP_
