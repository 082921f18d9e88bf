#ifndef SRC_LOOM_ARTIFACT_HPP_
#define SRC_LOOM_ARTIFACT_HPP_

#include <string>
#include <vector>

namespace loom {

// One generated output file, held in memory until an ArtifactWriter commits it.
struct Artifact {
    // Relative to Config::rootDirectory, with '/' separators.
    std::string path;
    std::string content;
    // The definition the artifact was generated from, empty for project wide artifacts.
    std::string definitionName;
    // Names of the targets whose Programs contributed to the content.
    std::vector<std::string> targets;
};

using ArtifactSet = std::vector<Artifact>;

} // namespace loom

#endif // SRC_LOOM_ARTIFACT_HPP_
