#include "loom/SchemaBuilder.hpp"

#include "loom/AST.hpp"
#include "loom/CompilerState.hpp"
#include "loom/Config.hpp"
#include "loom/Schema.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>

namespace {

loom::TypeKind typeKindFor(loom::ast::TypeSystemKind kind) {
    switch (kind) {
    case loom::ast::TypeSystemKind::kScalar: return loom::TypeKind::kScalar;
    case loom::ast::TypeSystemKind::kObject: return loom::TypeKind::kObject;
    case loom::ast::TypeSystemKind::kInterface: return loom::TypeKind::kInterface;
    case loom::ast::TypeSystemKind::kUnion: return loom::TypeKind::kUnion;
    case loom::ast::TypeSystemKind::kEnum: return loom::TypeKind::kEnum;
    case loom::ast::TypeSystemKind::kInputObject: return loom::TypeKind::kInputObject;
    default: break;
    }
    assert(false);
    return loom::TypeKind::kScalar;
}

loom::ArgumentDefinition makeArgument(const loom::ast::InputValueDefinition& inputValue) {
    loom::ArgumentDefinition argument;
    argument.name = inputValue.name;
    argument.type = inputValue.type;
    argument.hasDefault = inputValue.defaultValue.has_value();
    argument.location = inputValue.location;
    return argument;
}

} // namespace

namespace loom {

SchemaBuilder::SchemaBuilder(): m_schema(std::make_shared<Schema>()) {}

SchemaBuilder::~SchemaBuilder() {}

// static
SchemaResult SchemaBuilder::build(const CompilerState& compilerState, const ProjectConfig& projectConfig) {
    const auto& schemaDocuments = compilerState.schemaDocuments(projectConfig.name);
    if (schemaDocuments.empty()) {
        return SchemaBuildError{fmt::format("Project '{}' has no schema documents", projectConfig.name), {}};
    }
    return buildFromDocuments(schemaDocuments, compilerState.extensionDocuments(projectConfig.name));
}

// static
SchemaResult SchemaBuilder::buildFromDocuments(
        const std::vector<std::shared_ptr<const ast::TypeSystemDocument>>& schemaDocuments,
        const std::vector<std::shared_ptr<const ast::TypeSystemDocument>>& extensionDocuments) {
    SchemaBuilder builder;
    builder.addBuiltins();

    // New definitions first so that extensions may extend types defined later in the same or another document.
    for (const auto& document : schemaDocuments) {
        for (const auto& definition : document->definitions) {
            if (!definition.isExtension) { builder.addDefinition(definition, false); }
        }
    }
    for (const auto& document : extensionDocuments) {
        for (const auto& definition : document->definitions) {
            if (!definition.isExtension) { builder.addDefinition(definition, true); }
        }
    }
    for (const auto& document : schemaDocuments) {
        for (const auto& definition : document->definitions) {
            if (definition.isExtension) { builder.addDefinition(definition, false); }
        }
    }
    for (const auto& document : extensionDocuments) {
        for (const auto& definition : document->definitions) {
            if (definition.isExtension) { builder.addDefinition(definition, true); }
        }
    }

    builder.checkTypes();

    if (!builder.m_diagnostics.empty()) {
        size_t count = builder.m_diagnostics.size();
        return SchemaBuildError{fmt::format("{} error{} building schema", count, count == 1 ? "" : "s"),
                std::move(builder.m_diagnostics)};
    }

    SPDLOG_DEBUG("Built schema with {} types and {} directives", builder.m_schema->types().size(),
            builder.m_schema->directives().size());
    return std::shared_ptr<const Schema>(std::move(builder.m_schema));
}

void SchemaBuilder::addBuiltins() {
    for (const char* scalarName : { "ID", "String", "Int", "Float", "Boolean" }) {
        Type scalar;
        scalar.kind = TypeKind::kScalar;
        scalar.name = scalarName;
        m_schema->m_types.emplace(scalar.name, std::move(scalar));
    }

    for (const char* directiveName : { "include", "skip" }) {
        DirectiveDefinition directive;
        directive.name = directiveName;
        ArgumentDefinition ifArgument;
        ifArgument.name = "if";
        ifArgument.type = TypeRef::nonNull(TypeRef::named("Boolean"));
        directive.arguments.emplace_back(std::move(ifArgument));
        directive.locations = { "FIELD", "FRAGMENT_SPREAD", "INLINE_FRAGMENT" };
        m_schema->m_directives.emplace(directive.name, std::move(directive));
    }
}

void SchemaBuilder::addDefinition(const ast::TypeSystemDefinition& definition, bool fromExtension) {
    switch (definition.kind) {
    case ast::TypeSystemKind::kSchema:
        if (fromExtension) {
            addError("Project extensions cannot change the schema root types", definition.location);
            return;
        }
        for (const auto& rootType : definition.rootOperationTypes) {
            switch (rootType.first) {
            case OperationKind::kQuery: m_schema->m_queryTypeName = rootType.second; break;
            case OperationKind::kMutation: m_schema->m_mutationTypeName = rootType.second; break;
            case OperationKind::kSubscription: m_schema->m_subscriptionTypeName = rootType.second; break;
            }
        }
        m_schemaDefinitionLocation = definition.location;
        return;

    case ast::TypeSystemKind::kDirective:
        addDirectiveDefinition(definition);
        return;

    default:
        break;
    }

    if (definition.isExtension) {
        extendType(definition, fromExtension);
    } else {
        addTypeDefinition(definition, fromExtension);
    }
}

void SchemaBuilder::addTypeDefinition(const ast::TypeSystemDefinition& definition, bool fromExtension) {
    auto existing = m_schema->m_types.find(definition.name);
    if (existing != m_schema->m_types.end()) {
        // Schemas commonly restate the built in scalars.
        if (!existing->second.location.isValid() && definition.kind == ast::TypeSystemKind::kScalar) {
            existing->second.location = definition.nameLocation;
            return;
        }
        if (existing->second.location.isValid()) {
            addError(fmt::format("Duplicate definition of type '{}'", definition.name),
                    std::vector<Location>{ definition.nameLocation, existing->second.location });
        } else {
            addError(fmt::format("Cannot redefine built in type '{}'", definition.name), definition.nameLocation);
        }
        return;
    }

    Type type;
    type.kind = typeKindFor(definition.kind);
    type.name = definition.name;
    type.isExtension = fromExtension;
    type.location = definition.nameLocation;
    addFields(type, definition, fromExtension);
    m_schema->m_types.emplace(type.name, std::move(type));
}

void SchemaBuilder::extendType(const ast::TypeSystemDefinition& definition, bool fromExtension) {
    auto iter = m_schema->m_types.find(definition.name);
    if (iter == m_schema->m_types.end()) {
        addError(fmt::format("Cannot extend unknown type '{}'", definition.name), definition.nameLocation);
        return;
    }
    auto& type = iter->second;
    auto kind = typeKindFor(definition.kind);
    if (type.kind != kind) {
        addError(fmt::format("Cannot extend {} '{}' with a {} extension", typeKindName(type.kind), type.name,
                typeKindName(kind)), definition.nameLocation);
        return;
    }
    addFields(type, definition, fromExtension);
}

void SchemaBuilder::addDirectiveDefinition(const ast::TypeSystemDefinition& definition) {
    auto existing = m_schema->m_directives.find(definition.name);
    if (existing != m_schema->m_directives.end()) {
        std::vector<Location> locations{ definition.nameLocation };
        if (existing->second.location.isValid()) {
            locations.emplace_back(existing->second.location);
        }
        addError(fmt::format("Duplicate definition of directive '@{}'", definition.name), std::move(locations));
        return;
    }

    DirectiveDefinition directive;
    directive.name = definition.name;
    directive.location = definition.nameLocation;
    directive.locations = definition.directiveLocations;
    for (const auto& inputValue : definition.inputFields) {
        if (directive.findArgument(inputValue.name)) {
            addError(fmt::format("Duplicate argument '{}' on directive '@{}'", inputValue.name, definition.name),
                    inputValue.location);
            continue;
        }
        directive.arguments.emplace_back(makeArgument(inputValue));
    }
    m_schema->m_directives.emplace(directive.name, std::move(directive));
}

void SchemaBuilder::addFields(Type& type, const ast::TypeSystemDefinition& definition, bool fromExtension) {
    for (const auto& fieldDefinition : definition.fields) {
        const Field* existing = type.findField(fieldDefinition.name);
        if (existing) {
            std::vector<Location> locations{ fieldDefinition.location };
            if (existing->location.isValid()) {
                locations.emplace_back(existing->location);
            }
            addError(fmt::format("Duplicate field '{}' on type '{}'", fieldDefinition.name, type.name),
                    std::move(locations));
            continue;
        }
        if (fieldDefinition.name.compare(0, 2, "__") == 0) {
            addError(fmt::format("Field name '{}' is reserved for introspection", fieldDefinition.name),
                    fieldDefinition.location);
            continue;
        }
        Field field;
        field.name = fieldDefinition.name;
        field.type = fieldDefinition.type;
        field.isExtension = fromExtension;
        field.location = fieldDefinition.location;
        for (const auto& inputValue : fieldDefinition.arguments) {
            if (field.findArgument(inputValue.name)) {
                addError(fmt::format("Duplicate argument '{}' on field '{}.{}'", inputValue.name, type.name,
                        field.name), inputValue.location);
                continue;
            }
            field.arguments.emplace_back(makeArgument(inputValue));
        }
        type.fields.emplace_back(std::move(field));
    }

    for (const auto& inputValue : definition.inputFields) {
        if (type.findInputField(inputValue.name)) {
            addError(fmt::format("Duplicate input field '{}' on type '{}'", inputValue.name, type.name),
                    inputValue.location);
            continue;
        }
        type.inputFields.emplace_back(makeArgument(inputValue));
    }

    for (const auto& interfaceName : definition.interfaces) {
        if (std::find(type.interfaces.begin(), type.interfaces.end(), interfaceName) != type.interfaces.end()) {
            addError(fmt::format("Type '{}' implements interface '{}' more than once", type.name, interfaceName),
                    definition.nameLocation);
            continue;
        }
        type.interfaces.emplace_back(interfaceName);
    }

    for (const auto& member : definition.unionMembers) {
        if (std::find(type.members.begin(), type.members.end(), member) != type.members.end()) {
            addError(fmt::format("Union '{}' includes member '{}' more than once", type.name, member),
                    definition.nameLocation);
            continue;
        }
        type.members.emplace_back(member);
    }

    for (const auto& enumValue : definition.enumValues) {
        if (std::find(type.enumValues.begin(), type.enumValues.end(), enumValue) != type.enumValues.end()) {
            addError(fmt::format("Duplicate value '{}' in enum '{}'", enumValue, type.name), definition.nameLocation);
            continue;
        }
        type.enumValues.emplace_back(enumValue);
    }
}

void SchemaBuilder::checkTypes() {
    for (const auto& pair : m_schema->m_types) {
        const auto& type = pair.second;

        for (const auto& field : type.fields) {
            checkTypeReference(field.type.namedType(), field.location, false, true);
            for (const auto& argument : field.arguments) {
                checkTypeReference(argument.type.namedType(), argument.location, true, false);
            }
        }

        for (const auto& inputField : type.inputFields) {
            checkTypeReference(inputField.type.namedType(), inputField.location, true, false);
        }

        for (const auto& interfaceName : type.interfaces) {
            const Type* interfaceType = m_schema->findType(interfaceName);
            if (!interfaceType || interfaceType->kind != TypeKind::kInterface) {
                addError(fmt::format("Type '{}' implements '{}', which is not a defined interface", type.name,
                        interfaceName), type.location);
                continue;
            }
            for (const auto& interfaceField : interfaceType->fields) {
                if (!type.findField(interfaceField.name)) {
                    addError(fmt::format("Type '{}' does not define field '{}' required by interface '{}'", type.name,
                            interfaceField.name, interfaceName), type.location);
                }
            }
        }

        for (const auto& member : type.members) {
            const Type* memberType = m_schema->findType(member);
            if (!memberType || memberType->kind != TypeKind::kObject) {
                addError(fmt::format("Union '{}' member '{}' is not a defined object type", type.name, member),
                        type.location);
            }
        }

        if (type.kind == TypeKind::kObject && type.fields.empty()) {
            addError(fmt::format("Object type '{}' must define at least one field", type.name), type.location);
        }
    }

    for (const auto& pair : m_schema->m_directives) {
        for (const auto& argument : pair.second.arguments) {
            checkTypeReference(argument.type.namedType(), argument.location, true, false);
        }
    }

    for (auto kind : { OperationKind::kQuery, OperationKind::kMutation, OperationKind::kSubscription }) {
        const Type* rootType = m_schema->findType(m_schema->rootTypeName(kind));
        if (!rootType && m_schemaDefinitionLocation.isValid() && kind == OperationKind::kQuery) {
            addError(fmt::format("Root query type '{}' is not defined", m_schema->rootTypeName(kind)),
                    m_schemaDefinitionLocation);
        }
        if (rootType && rootType->kind != TypeKind::kObject) {
            addError(fmt::format("Root {} type '{}' must be an object type", operationKindName(kind),
                    rootType->name), rootType->location);
        }
    }
}

void SchemaBuilder::checkTypeReference(const std::string& typeName, const Location& location, bool mustBeInput,
        bool mustBeOutput) {
    const Type* type = m_schema->findType(typeName);
    if (!type) {
        addError(fmt::format("Reference to undefined type '{}'", typeName), location);
        return;
    }
    if (mustBeInput && !type->isInput()) {
        addError(fmt::format("Type '{}' is not an input type", typeName), location);
    }
    if (mustBeOutput && type->kind == TypeKind::kInputObject) {
        addError(fmt::format("Input type '{}' cannot be used as a field type", typeName), location);
    }
}

void SchemaBuilder::addError(std::string message, Location location) {
    SPDLOG_DEBUG("Schema error: {}", message);
    m_diagnostics.emplace_back(Diagnostic(std::move(message), location));
}

void SchemaBuilder::addError(std::string message, std::vector<Location> locations) {
    SPDLOG_DEBUG("Schema error: {}", message);
    m_diagnostics.emplace_back(Diagnostic(std::move(message), std::move(locations)));
}

} // namespace loom
