#ifndef SRC_LOOM_TRANSFORMS_HPP_
#define SRC_LOOM_TRANSFORMS_HPP_

#include "loom/IR.hpp"
#include "loom/Program.hpp"

#include <string>

namespace loom {

struct TransformContext;

// Rebuilds selection trees, copying only the nodes on the path to a change so that untouched subtrees stay shared
// with the input Program. The default implementation is the identity; transforms override transformSelection().
// Definitions left with no selections are dropped from the result, along with every spread of a dropped fragment.
class SelectionTransformer {
public:
    explicit SelectionTransformer(ProgramPtr program): m_program(std::move(program)) {}
    virtual ~SelectionTransformer() = default;

    ProgramPtr transformProgram();

protected:
    virtual ir::DefinitionPtr transformDefinition(const ir::DefinitionPtr& definition);
    // Appends the replacement for |selection|, if any, to |out|. |parentType| is the type |selection| was made on.
    virtual void transformSelection(const ir::SelectionPtr& selection, const std::string& parentType,
            ir::Selections& out);

    ir::Selections transformSelections(const ir::Selections& selections, const std::string& parentType);
    // Returns |selection| with its children transformed. Linked fields and inline fragments left with no children
    // after their children changed come back as nullptr.
    ir::SelectionPtr transformChildren(const ir::SelectionPtr& selection, const std::string& parentType);

    ProgramPtr m_program;
};

namespace transforms {

// Drops fragment definitions owned by the base project. Spreads of them are left in place.
ProgramPtr removeBaseFragments(const ProgramPtr& program, const TransformContext& context);

// Merges inline fragments with no directives that don't narrow the type into their parent selections.
ProgramPtr flattenInlineFragments(const ProgramPtr& program, const TransformContext& context);

// Replaces every fragment spread with an inline fragment holding the fragment's selections. The result holds
// operations only.
ProgramPtr inlineFragments(const ProgramPtr& program, const TransformContext& context);

// Adds a __typename selection to every linked field of abstract type that doesn't already select one.
ProgramPtr generateTypename(const ProgramPtr& program, const TransformContext& context);

// Adds an 'id' selection to every linked field whose type has an 'id: ID' field that isn't already selected.
ProgramPtr generateIdField(const ProgramPtr& program, const TransformContext& context);

// Removes selections under @include(if: false) or @skip(if: true), and drops constant @include and @skip directives
// that always pass.
ProgramPtr skipUnreachableNodes(const ProgramPtr& program, const TransformContext& context);

// Removes fields, fragments and inline fragments that only exist in the client's schema extensions.
ProgramPtr skipClientExtensions(const ProgramPtr& program, const TransformContext& context);

// Keeps operations and the fragments they reach, dropping every other fragment.
ProgramPtr onlyReachableFromOperations(const ProgramPtr& program, const TransformContext& context);

} // namespace transforms

} // namespace loom

#endif // SRC_LOOM_TRANSFORMS_HPP_
