#ifndef SRC_LOOM_PROGRAM_HPP_
#define SRC_LOOM_PROGRAM_HPP_

#include "loom/IR.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace loom {

class Schema;

// An immutable, indexed collection of IR definitions checked against one Schema. Transforms never modify a Program,
// they build a new one with withDefinitions(), which shares every untouched definition with the original.
class Program {
public:
    Program() = delete;
    Program(std::shared_ptr<const Schema> schema, std::vector<ir::DefinitionPtr> definitions);
    ~Program() = default;

    static std::shared_ptr<const Program> fromDefinitions(std::shared_ptr<const Schema> schema, const ir::IR& ir);

    // Returns a new Program over the same Schema.
    std::shared_ptr<const Program> withDefinitions(std::vector<ir::DefinitionPtr> definitions) const;

    const std::shared_ptr<const Schema>& schema() const { return m_schema; }
    // In the order they were provided.
    const std::vector<ir::DefinitionPtr>& definitions() const { return m_definitions; }
    size_t documentCount() const { return m_definitions.size(); }

    // Return nullptr if there's no matching definition.
    const ir::Definition* findDefinition(const std::string& name) const;
    const ir::Definition* findFragment(const std::string& name) const;
    const ir::Definition* findOperation(const std::string& name) const;

    std::vector<ir::DefinitionPtr> operations() const;
    std::vector<ir::DefinitionPtr> fragments() const;

private:
    std::shared_ptr<const Schema> m_schema;
    std::vector<ir::DefinitionPtr> m_definitions;
    std::map<std::string, size_t> m_index;
};

using ProgramPtr = std::shared_ptr<const Program>;

} // namespace loom

#endif // SRC_LOOM_PROGRAM_HPP_
