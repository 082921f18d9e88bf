#ifndef SRC_LOOM_IR_HPP_
#define SRC_LOOM_IR_HPP_

#include "loom/Diagnostic.hpp"
#include "loom/TypeRef.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loom {
namespace ir {

// The IR is the type checked form of a project's documents. Every node is immutable once built and held by
// shared_ptr<const>, so transforms produce new trees that share all unchanged subtrees with their input.

struct Value {
    enum class Kind { kVariable, kInt, kFloat, kString, kBoolean, kNull, kEnum, kList, kObject };

    Kind kind = Kind::kNull;
    // Variable name, literal text, unescaped string contents or enum value name.
    std::string text;
    // List items, or object field values in the same order as |fieldNames|.
    std::vector<Value> items;
    std::vector<std::string> fieldNames;
    // The input type expected at this position.
    TypeRef type;
    Location location;
};

struct Argument {
    std::string name;
    Value value;
    Location location;
};

struct Directive {
    std::string name;
    std::vector<Argument> arguments;
    Location location;

    const Argument* findArgument(const std::string& argumentName) const;
};

enum class SelectionKind { kScalarField, kLinkedField, kFragmentSpread, kInlineFragment };

struct Selection {
    Selection() = delete;
    Selection(SelectionKind k, Location loc): kind(k), location(loc) {}
    virtual ~Selection() = default;

    SelectionKind kind;
    Location location;
    std::vector<Directive> directives;

    bool isField() const { return kind == SelectionKind::kScalarField || kind == SelectionKind::kLinkedField; }
    bool hasDirective(const std::string& directiveName) const;
};

using SelectionPtr = std::shared_ptr<const Selection>;
using Selections = std::vector<SelectionPtr>;

struct Field : public Selection {
    Field(SelectionKind k, Location loc): Selection(k, loc) {}
    virtual ~Field() = default;

    // Empty if the field isn't aliased.
    std::string alias;
    std::string name;
    std::vector<Argument> arguments;
    TypeRef type;
    // Name of the composite type the field was selected on.
    std::string parentType;
    // True for fields only known to the client through schema extensions.
    bool isClientExtension = false;

    const std::string& responseKey() const { return alias.empty() ? name : alias; }
};

struct ScalarField : public Field {
    explicit ScalarField(Location loc): Field(SelectionKind::kScalarField, loc) {}
    virtual ~ScalarField() = default;
};

struct LinkedField : public Field {
    explicit LinkedField(Location loc): Field(SelectionKind::kLinkedField, loc) {}
    virtual ~LinkedField() = default;

    Selections selections;
};

struct FragmentSpread : public Selection {
    explicit FragmentSpread(Location loc): Selection(SelectionKind::kFragmentSpread, loc) {}
    virtual ~FragmentSpread() = default;

    std::string fragmentName;
};

struct InlineFragment : public Selection {
    explicit InlineFragment(Location loc): Selection(SelectionKind::kInlineFragment, loc) {}
    virtual ~InlineFragment() = default;

    // Empty if the fragment has no type condition, in which case it applies to the enclosing type.
    std::string typeCondition;
    Selections selections;
};

struct VariableDefinition {
    std::string name;
    TypeRef type;
    std::optional<Value> defaultValue;
    Location location;
};

enum class DefinitionKind { kOperation, kFragment };

struct Definition {
    DefinitionKind kind = DefinitionKind::kFragment;
    std::string name;
    // Only meaningful for operations.
    OperationKind operationKind = OperationKind::kQuery;
    // Fragment type condition, or the root type name for operations.
    std::string typeCondition;
    std::vector<VariableDefinition> variables;
    std::vector<Directive> directives;
    Selections selections;
    Location location;
    Location nameLocation;
    // Path of the document the definition came from, relative to the configuration root.
    std::string sourcePath;

    bool isOperation() const { return kind == DefinitionKind::kOperation; }
    bool isFragment() const { return kind == DefinitionKind::kFragment; }
};

using DefinitionPtr = std::shared_ptr<const Definition>;

struct IR {
    std::vector<DefinitionPtr> definitions;
};

// Calls |function| with the name of every fragment spread directly or indirectly (through inline fragments and
// fields) within |selections|, in document order.
template <typename F> void forEachFragmentSpread(const Selections& selections, F&& function) {
    for (const auto& selection : selections) {
        switch (selection->kind) {
        case SelectionKind::kFragmentSpread:
            function(static_cast<const FragmentSpread*>(selection.get())->fragmentName);
            break;
        case SelectionKind::kLinkedField:
            forEachFragmentSpread(static_cast<const LinkedField*>(selection.get())->selections, function);
            break;
        case SelectionKind::kInlineFragment:
            forEachFragmentSpread(static_cast<const InlineFragment*>(selection.get())->selections, function);
            break;
        case SelectionKind::kScalarField:
            break;
        }
    }
}

} // namespace ir
} // namespace loom

#endif // SRC_LOOM_IR_HPP_
