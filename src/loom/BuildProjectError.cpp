#include "loom/BuildProjectError.hpp"

#include "fmt/format.h"

namespace loom {

const char* stageName(Stage stage) {
    switch (stage) {
    case Stage::kBuildSchema:
        return "build_schema";
    case Stage::kBuildIR:
        return "build_ir";
    case Stage::kBuildProgram:
        return "build_program";
    case Stage::kValidate:
        return "validate";
    case Stage::kApplyTransforms:
        return "apply_transforms";
    case Stage::kGenerateArtifacts:
        return "generate_artifacts";
    case Stage::kWriteArtifacts:
        return "write_artifacts";
    }
    return "unknown";
}

std::string BuildProjectError::toString() const {
    std::string text;
    switch (kind) {
    case Kind::kStageFailed:
        text = fmt::format("[{}] {} failed: {}", projectName, stageName(stage), message);
        break;
    case Kind::kInternal:
        text = fmt::format("[{}] internal error after {}: {}", projectName, stageName(stage), message);
        break;
    case Kind::kAborted:
        text = fmt::format("[{}] aborted after {}", projectName, stageName(stage));
        break;
    }

    for (const auto& diagnostic : diagnostics) {
        text += '\n';
        text += diagnostic.toString();
    }
    for (const auto& path : writtenPaths) {
        text += fmt::format("\n  already written: {}", path);
    }
    return text;
}

std::string ProjectSummary::toString() const {
    std::string text = fmt::format("[{}] documents:", projectName);
    for (size_t i = 0; i < documentCounts.size(); ++i) {
        text += fmt::format("{} {} {}", i == 0 ? "" : ",", documentCounts[i].second, documentCounts[i].first);
    }
    return text;
}

} // namespace loom
