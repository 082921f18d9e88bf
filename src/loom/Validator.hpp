#ifndef SRC_LOOM_VALIDATOR_HPP_
#define SRC_LOOM_VALIDATOR_HPP_

#include "loom/Diagnostic.hpp"
#include "loom/IR.hpp"

#include <set>
#include <string>
#include <vector>

namespace loom {

class Program;
struct ProjectConfig;
struct TargetPrograms;

// Runs the semantic rules that type checking can't express against a Program, collecting every violation. Also hosts
// the internal consistency checks the Pipeline runs between stages when LOOM_PIPELINE_VALIDATE is on.
class Validator {
public:
    Validator() = delete;
    Validator(const ProjectConfig& projectConfig, const std::set<std::string>& baseFragmentNames);
    ~Validator() = default;

    // Never modifies |program|. An empty result means the Program passed every rule.
    Diagnostics validate(const Program& program) const;

    // Convenience wrapper constructing a Validator.
    static Diagnostics validate(const Program& program, const ProjectConfig& projectConfig,
            const std::set<std::string>& baseFragmentNames = std::set<std::string>());

    // Module name used by the naming conventions: the file name of |sourcePath| up to its first '.'.
    static std::string moduleName(const std::string& sourcePath);

    // Internal consistency checks, these log any problem found and return false. A failure is a compiler defect.
    static bool validateProgram(const Program* program);
    static bool validateTargets(const Program* program, const TargetPrograms& targets,
            const std::set<std::string>& baseFragmentNames);

private:
    void checkOperationName(const ir::Definition& definition, Diagnostics& diagnostics) const;
    void checkFragmentName(const ir::Definition& definition, Diagnostics& diagnostics) const;
    void checkSelections(const ir::Selections& selections, int depth, const ir::Definition& definition,
            bool& reportedDepth, Diagnostics& diagnostics) const;
    void checkTypenameOnRoot(const ir::Definition& definition, const ir::Selections& selections,
            Diagnostics& diagnostics) const;
    void checkUnusedVariables(const Program& program, const ir::Definition& definition,
            Diagnostics& diagnostics) const;

    static bool validateSelections(const Program* program, const ir::Selections& selections);

    int m_maxSelectionDepth;
    std::set<std::string> m_baseFragmentNames;
};

} // namespace loom

#endif // SRC_LOOM_VALIDATOR_HPP_
