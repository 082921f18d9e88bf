#ifndef SRC_LOOM_SCHEMA_BUILDER_HPP_
#define SRC_LOOM_SCHEMA_BUILDER_HPP_

#include "loom/Errors.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace loom {

namespace ast {
struct TypeSystemDefinition;
struct TypeSystemDocument;
} // namespace ast

class CompilerState;
struct ProjectConfig;
class Schema;
struct Type;

using SchemaResult = std::variant<std::shared_ptr<const Schema>, SchemaBuildError>;

// Merges a project's base schema documents with its extension documents into a Schema, checking the result for
// consistency. Every problem found is collected before failing.
class SchemaBuilder {
public:
    SchemaBuilder();
    ~SchemaBuilder();

    static SchemaResult build(const CompilerState& compilerState, const ProjectConfig& projectConfig);

    // Used by build() and for testing.
    static SchemaResult buildFromDocuments(
            const std::vector<std::shared_ptr<const ast::TypeSystemDocument>>& schemaDocuments,
            const std::vector<std::shared_ptr<const ast::TypeSystemDocument>>& extensionDocuments);

private:
    void addBuiltins();
    void addDefinition(const ast::TypeSystemDefinition& definition, bool fromExtension);
    void addTypeDefinition(const ast::TypeSystemDefinition& definition, bool fromExtension);
    void extendType(const ast::TypeSystemDefinition& definition, bool fromExtension);
    void addDirectiveDefinition(const ast::TypeSystemDefinition& definition);
    void addFields(Type& type, const ast::TypeSystemDefinition& definition, bool fromExtension);
    void checkTypes();
    void checkTypeReference(const std::string& typeName, const Location& location, bool mustBeInput,
            bool mustBeOutput);

    void addError(std::string message, Location location);
    void addError(std::string message, std::vector<Location> locations);

    std::shared_ptr<Schema> m_schema;
    Location m_schemaDefinitionLocation;
    Diagnostics m_diagnostics;
};

} // namespace loom

#endif // SRC_LOOM_SCHEMA_BUILDER_HPP_
