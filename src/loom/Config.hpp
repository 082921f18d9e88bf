#ifndef SRC_LOOM_CONFIG_HPP_
#define SRC_LOOM_CONFIG_HPP_

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom {

class ErrorReporter;

// Settings for one project. Paths are relative to Config::rootDirectory.
struct ProjectConfig {
    std::string name;
    std::string schemaPath;
    std::vector<std::string> extensionPaths;
    std::vector<std::string> documentDirectories;
    // Project whose fragments this project may spread without owning them.
    std::optional<std::string> baseProject;
    // If unset, artifacts go in a __generated__ directory beside the document that defined them.
    std::optional<std::string> outputDirectory;
    // Hand operation text to the OperationPersister and emit ids instead of text.
    bool persist = false;
    int maxSelectionDepth = 32;
};

// Settings shared by every project, normally parsed from loom.config.json.
struct Config {
    std::filesystem::path rootDirectory;
    std::string header = "@generated";
    std::string artifactExtension = ".graphql.json";
    bool removeStaleArtifacts = false;
    // Sorted by project name.
    std::vector<ProjectConfig> projects;

    // Returns nullptr if there's no project called |projectName|.
    const ProjectConfig* findProject(std::string_view projectName) const;

    // Reads and parses the configuration file at |path|. Relative roots are resolved against the file's directory.
    // Returns an empty optional after reporting problems to |errorReporter|.
    static std::optional<Config> loadFromFile(const std::filesystem::path& path, ErrorReporter* errorReporter);

    // Parses configuration JSON, resolving a relative root against |baseDirectory|.
    static std::optional<Config> parse(std::string_view json, const std::filesystem::path& baseDirectory,
            ErrorReporter* errorReporter);
};

} // namespace loom

#endif // SRC_LOOM_CONFIG_HPP_
