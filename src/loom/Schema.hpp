#ifndef SRC_LOOM_SCHEMA_HPP_
#define SRC_LOOM_SCHEMA_HPP_

#include "loom/Diagnostic.hpp"
#include "loom/TypeRef.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace loom {

enum class TypeKind { kScalar, kObject, kInterface, kUnion, kEnum, kInputObject };

const char* typeKindName(TypeKind kind);

struct ArgumentDefinition {
    std::string name;
    TypeRef type;
    bool hasDefault = false;
    Location location;
};

struct Field {
    std::string name;
    std::vector<ArgumentDefinition> arguments;
    TypeRef type;
    // True for fields added by a project's schema extensions, which the server does not know about.
    bool isExtension = false;
    Location location;

    // Returns nullptr if there's no argument named |argumentName|.
    const ArgumentDefinition* findArgument(const std::string& argumentName) const;
};

struct Type {
    TypeKind kind = TypeKind::kScalar;
    std::string name;
    // Output fields for objects and interfaces, in declaration order.
    std::vector<Field> fields;
    // Input object fields.
    std::vector<ArgumentDefinition> inputFields;
    // Interfaces implemented by an object or interface.
    std::vector<std::string> interfaces;
    // Union members.
    std::vector<std::string> members;
    std::vector<std::string> enumValues;
    // True if the whole type was defined by a project extension.
    bool isExtension = false;
    Location location;

    const Field* findField(const std::string& fieldName) const;
    const ArgumentDefinition* findInputField(const std::string& fieldName) const;

    bool isComposite() const { return kind == TypeKind::kObject || kind == TypeKind::kInterface
            || kind == TypeKind::kUnion; }
    bool isAbstract() const { return kind == TypeKind::kInterface || kind == TypeKind::kUnion; }
    bool isLeaf() const { return kind == TypeKind::kScalar || kind == TypeKind::kEnum; }
    bool isInput() const { return kind == TypeKind::kScalar || kind == TypeKind::kEnum
            || kind == TypeKind::kInputObject; }
};

struct DirectiveDefinition {
    std::string name;
    std::vector<ArgumentDefinition> arguments;
    std::vector<std::string> locations;
    Location location;

    const ArgumentDefinition* findArgument(const std::string& argumentName) const;
};

// The typed universe a project's documents are checked against. Schemas are built by SchemaBuilder and are immutable
// afterwards, so one instance can be shared freely between the stages of a single build.
class Schema {
public:
    Schema();
    ~Schema() = default;

    // Returns nullptr for unknown names.
    const Type* findType(const std::string& typeName) const;
    const DirectiveDefinition* findDirective(const std::string& directiveName) const;

    // Returns nullptr if the schema has no root type for |kind|.
    const Type* rootType(OperationKind kind) const;
    const std::string& rootTypeName(OperationKind kind) const;

    // Looks up |fieldName| on |type|, including the implicit __typename field on composite types.
    const Field* findField(const Type* type, const std::string& fieldName) const;
    const Field* typenameField() const { return &m_typenameField; }

    // True if |objectTypeName| is one of the concrete types of |abstractOrObjectTypeName|.
    bool isPossibleType(const std::string& abstractOrObjectTypeName, const std::string& objectTypeName) const;
    // True if some object type could satisfy both type conditions, used to validate fragment spreads.
    bool typesOverlap(const std::string& typeA, const std::string& typeB) const;
    // Concrete object types of a composite type, sorted by name.
    std::vector<std::string> possibleTypes(const std::string& typeName) const;

    // True if a value of type |variableType| may be passed where |locationType| is expected.
    bool isTypeSubtypeOf(const TypeRef& variableType, const TypeRef& locationType) const;

    const std::map<std::string, Type>& types() const { return m_types; }
    const std::map<std::string, DirectiveDefinition>& directives() const { return m_directives; }

private:
    friend class SchemaBuilder;

    std::map<std::string, Type> m_types;
    std::map<std::string, DirectiveDefinition> m_directives;
    std::string m_queryTypeName;
    std::string m_mutationTypeName;
    std::string m_subscriptionTypeName;
    Field m_typenameField;
};

} // namespace loom

#endif // SRC_LOOM_SCHEMA_HPP_
