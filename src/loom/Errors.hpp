#ifndef SRC_LOOM_ERRORS_HPP_
#define SRC_LOOM_ERRORS_HPP_

#include "loom/Diagnostic.hpp"

#include <string>
#include <vector>

namespace loom {

// Stage failure payloads. Each stage returns its value or one of these, see BuildProjectError for how the Pipeline
// surfaces them.

struct SchemaBuildError {
    std::string message;
    Diagnostics diagnostics;
};

struct ArtifactGenerationError {
    // Name of the target Program being generated, or empty if the failure isn't tied to one target.
    std::string target;
    std::string definitionName;
    std::string message;
};

struct ArtifactWriteError {
    std::string path;
    std::string message;
    // Files this write attempt had already committed before failing.
    std::vector<std::string> writtenPaths;
};

} // namespace loom

#endif // SRC_LOOM_ERRORS_HPP_
