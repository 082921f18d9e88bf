#ifndef SRC_LOOM_BUILD_PROJECT_ERROR_HPP_
#define SRC_LOOM_BUILD_PROJECT_ERROR_HPP_

#include "loom/Sources.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace loom {

// The stages of a project build, in the order the Pipeline runs them.
enum class Stage {
    kBuildSchema,
    kBuildIR,
    kBuildProgram,
    kValidate,
    kApplyTransforms,
    kGenerateArtifacts,
    kWriteArtifacts
};

// "build_schema", "build_ir" and so on, as used in timing span names.
const char* stageName(Stage stage);

// The single terminal failure of a project build.
struct BuildProjectError {
    enum class Kind {
        // The stage reported a user facing problem.
        kStageFailed,
        // An internal consistency check failed after the stage, a compiler defect.
        kInternal,
        // A Pipeline hook asked to stop after the stage.
        kAborted
    };

    std::string projectName;
    Stage stage = Stage::kBuildSchema;
    Kind kind = Kind::kStageFailed;
    std::string message;
    // Source attributed problems, for the schema, IR and validation stages.
    std::vector<ResolvedDiagnostic> diagnostics;
    // For write failures, artifacts already committed before the failure.
    std::vector<std::string> writtenPaths;

    std::string toString() const;
};

// Reported for a project that built successfully.
struct ProjectSummary {
    std::string projectName;
    // Number of definitions in each target Program, in target order.
    std::vector<std::pair<std::string, size_t>> documentCounts;
    size_t artifactCount = 0;

    // "[<project>] documents: <n> reader, <n> normalization, <n> operation_text"
    std::string toString() const;
};

using BuildOutcome = std::variant<ProjectSummary, BuildProjectError>;

} // namespace loom

#endif // SRC_LOOM_BUILD_PROJECT_ERROR_HPP_
