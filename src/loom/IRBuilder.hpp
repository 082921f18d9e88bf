#ifndef SRC_LOOM_IR_BUILDER_HPP_
#define SRC_LOOM_IR_BUILDER_HPP_

#include "loom/CompilerState.hpp"
#include "loom/Diagnostic.hpp"
#include "loom/IR.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace loom {

namespace ast {
struct Argument;
struct Directive;
struct ExecutableDefinition;
struct ExecutableDocument;
struct FragmentDefinition;
struct OperationDefinition;
struct Selection;
struct Value;
} // namespace ast

struct ArgumentDefinition;
struct ProjectConfig;
class Schema;
struct Type;

struct IRResult {
    ir::IR ir;
    // Fragments spread by the project that are owned by its base project. They are type checked and included in |ir|,
    // but no stage treats them as defined by this project.
    std::set<std::string> baseFragmentNames;
};

using IRBuildResult = std::variant<IRResult, Diagnostics>;

// Type checks a project's executable documents against its Schema, producing the IR. All problems found across all
// documents are reported together.
class IRBuilder {
public:
    IRBuilder() = delete;
    explicit IRBuilder(std::shared_ptr<const Schema> schema);
    ~IRBuilder();

    static IRBuildResult build(const ProjectConfig& projectConfig, std::shared_ptr<const Schema> schema,
            const AstSets& astSets);

    // |baseDocuments| only contribute fragments, and only the ones reachable from |documents| are type checked.
    IRBuildResult buildDocuments(const std::vector<std::shared_ptr<const ast::ExecutableDocument>>& documents,
            const std::vector<std::shared_ptr<const ast::ExecutableDocument>>& baseDocuments);

private:
    struct VariableUsage {
        std::string name;
        TypeRef expectedType;
        // True if the usage position has a default value of its own, which makes a nullable variable acceptable.
        bool positionHasDefault;
        Location location;
    };

    struct SourceDefinition {
        const ast::ExecutableDefinition* definition;
        const ast::ExecutableDocument* document;
        bool isBase;
    };

    // Per definition state while building.
    struct DefinitionContext {
        std::string definitionName;
        std::vector<VariableUsage> variableUsages;
        std::vector<std::pair<std::string, Location>> spreads;
    };

    void collectDefinitions(const std::vector<std::shared_ptr<const ast::ExecutableDocument>>& documents,
            bool isBase);
    std::vector<std::string> reachableBaseFragments() const;

    ir::DefinitionPtr buildOperation(const ast::OperationDefinition* operation,
            const ast::ExecutableDocument* document);
    ir::DefinitionPtr buildFragment(const ast::FragmentDefinition* fragment, const ast::ExecutableDocument* document);

    ir::Selections buildSelections(const std::vector<std::unique_ptr<ast::Selection>>& selections,
            const Type* parentType, DefinitionContext& context);
    ir::SelectionPtr buildSelection(const ast::Selection* selection, const Type* parentType,
            DefinitionContext& context);

    std::vector<ir::Argument> buildArguments(const std::vector<ast::Argument>& arguments,
            const std::vector<ArgumentDefinition>& definitions, const std::string& ownerDescription,
            const Location& ownerLocation, DefinitionContext& context);
    std::vector<ir::Directive> buildDirectives(const std::vector<ast::Directive>& directives,
            DefinitionContext& context);
    ir::Value buildValue(const ast::Value& value, const TypeRef& expectedType, bool positionHasDefault,
            DefinitionContext& context);
    ir::Value buildConstValue(const ast::Value& value, const TypeRef& expectedType);
    bool checkScalarValue(const ast::Value& value, const Type* type);

    void checkConflicts(const ir::Selections& selections);
    void checkFragmentCycles();
    void checkVariables(const ir::Definition& operation, const DefinitionContext& context);

    void addError(std::string message, Location location);
    void addError(std::string message, std::vector<Location> locations);

    std::shared_ptr<const Schema> m_schema;

    // Project definitions that survived duplicate name checks.
    std::unordered_set<const ast::ExecutableDefinition*> m_acceptedDefinitions;
    std::map<std::string, Location> m_definitionNames;
    std::map<std::string, SourceDefinition> m_fragments;
    // Keyed by definition name, holds spreads and variable usage of every built fragment.
    std::unordered_map<std::string, DefinitionContext> m_fragmentContexts;
    std::unordered_map<std::string, DefinitionContext> m_operationContexts;

    Diagnostics m_diagnostics;
};

} // namespace loom

#endif // SRC_LOOM_IR_BUILDER_HPP_
