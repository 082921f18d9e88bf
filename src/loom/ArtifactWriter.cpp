#include "loom/ArtifactWriter.hpp"

#include "loom/Config.hpp"
#include "loom/internal/FileSystem.hpp"

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "spdlog/spdlog.h"

#include <set>
#include <string>
#include <system_error>

namespace {

// True if the file at |path| exists and holds exactly |contents|.
bool hasContents(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) { return false; }
    auto fileSize = fs::file_size(path, ec);
    if (ec || fileSize != contents.size()) { return false; }
    std::string existing;
    if (!loom::readFileContents(path, existing)) { return false; }
    return existing == contents;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Directories the project's artifacts may have been written to by this or an earlier build.
std::set<fs::path> outputDirectories(const loom::Config& config, const loom::ProjectConfig& projectConfig) {
    std::set<fs::path> directories;
    if (projectConfig.outputDirectory) {
        directories.emplace(config.rootDirectory / *projectConfig.outputDirectory);
        return directories;
    }

    std::error_code ec;
    for (const auto& documentDirectory : projectConfig.documentDirectories) {
        auto root = config.rootDirectory / documentDirectory;
        if (!fs::is_directory(root, ec)) { continue; }
        for (auto iter = fs::recursive_directory_iterator(root, ec); !ec && iter != fs::recursive_directory_iterator();
                iter.increment(ec)) {
            if (iter->path().filename() == "__generated__" && iter->is_directory(ec)) {
                directories.emplace(iter->path());
            }
        }
        if (ec) {
            SPDLOG_WARN("Error scanning '{}' for stale artifacts: {}", root.string(), ec.message());
            ec.clear();
        }
    }
    return directories;
}

} // namespace

namespace loom {

std::optional<ArtifactWriteError> FileSystemWriter::write(const Config& config, const ProjectConfig& projectConfig,
        const ArtifactSet& artifacts) {
    std::vector<std::string> writtenPaths;
    std::set<fs::path> artifactPaths;
    size_t unchanged = 0;

    for (const auto& artifact : artifacts) {
        auto path = config.rootDirectory / fs::path(artifact.path);
        artifactPaths.emplace(path.lexically_normal());
        if (hasContents(path, artifact.content)) {
            ++unchanged;
            continue;
        }
        if (!writeFileContents(path, artifact.content)) {
            return ArtifactWriteError{ artifact.path, fmt::format("Failed to write artifact for '{}'",
                    artifact.definitionName), std::move(writtenPaths) };
        }
        writtenPaths.emplace_back(artifact.path);
    }

    size_t removed = 0;
    if (config.removeStaleArtifacts) {
        std::error_code ec;
        for (const auto& directory : outputDirectories(config, projectConfig)) {
            for (auto iter = fs::directory_iterator(directory, ec); !ec && iter != fs::directory_iterator();
                    iter.increment(ec)) {
                const auto& path = iter->path();
                if (!iter->is_regular_file(ec) || !endsWith(path.filename().string(), config.artifactExtension)
                    || artifactPaths.count(path.lexically_normal())) {
                    continue;
                }
                SPDLOG_DEBUG("Removing stale artifact '{}'", path.string());
                if (!fs::remove(path, ec)) {
                    return ArtifactWriteError{ relativePathString(path, config.rootDirectory),
                            fmt::format("Failed to remove stale artifact: {}", ec.message()),
                            std::move(writtenPaths) };
                }
                ++removed;
            }
            if (ec) {
                SPDLOG_WARN("Error listing '{}': {}", directory.string(), ec.message());
                ec.clear();
            }
        }
    }

    SPDLOG_DEBUG("[{}] wrote {} artifacts, {} unchanged, {} removed", projectConfig.name, writtenPaths.size(),
            unchanged, removed);
    return std::nullopt;
}

std::optional<ArtifactWriteError> ValidatingWriter::write(const Config& config, const ProjectConfig& projectConfig,
        const ArtifactSet& artifacts) {
    std::vector<std::string> outOfDate;
    for (const auto& artifact : artifacts) {
        if (!hasContents(config.rootDirectory / fs::path(artifact.path), artifact.content)) {
            outOfDate.emplace_back(artifact.path);
        }
    }

    if (outOfDate.empty()) {
        SPDLOG_DEBUG("[{}] all {} artifacts are up to date", projectConfig.name, artifacts.size());
        return std::nullopt;
    }

    return ArtifactWriteError{ outOfDate.front(), fmt::format("{} artifact(s) are out of date: {}", outOfDate.size(),
            fmt::join(outOfDate, ", ")), {} };
}

} // namespace loom
