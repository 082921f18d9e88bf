#ifndef SRC_LOOM_ARTIFACT_WRITER_HPP_
#define SRC_LOOM_ARTIFACT_WRITER_HPP_

#include "loom/Artifact.hpp"
#include "loom/Errors.hpp"

#include <optional>

namespace loom {

struct Config;
struct ProjectConfig;

// Commits a project's generated artifacts. Only called once generation of the whole project succeeded. Writers are
// shared by concurrent project builds so implementations must be safe to call from multiple threads.
class ArtifactWriter {
public:
    ArtifactWriter() = default;
    virtual ~ArtifactWriter() = default;

    // Returns an empty optional on success. A failure part way through may leave the files written before it.
    virtual std::optional<ArtifactWriteError> write(const Config& config, const ProjectConfig& projectConfig,
            const ArtifactSet& artifacts) = 0;
};

// Writes artifacts under Config::rootDirectory, skipping files whose content is unchanged. When the Config asks for
// it, also deletes files with the artifact extension left in the project's output directories by earlier builds.
class FileSystemWriter : public ArtifactWriter {
public:
    FileSystemWriter() = default;
    virtual ~FileSystemWriter() = default;

    std::optional<ArtifactWriteError> write(const Config& config, const ProjectConfig& projectConfig,
            const ArtifactSet& artifacts) override;
};

// Writes nothing. Fails listing every artifact that is missing or differs from the file on disk, for checking in
// continuous integration that generated files were committed.
class ValidatingWriter : public ArtifactWriter {
public:
    ValidatingWriter() = default;
    virtual ~ValidatingWriter() = default;

    std::optional<ArtifactWriteError> write(const Config& config, const ProjectConfig& projectConfig,
            const ArtifactSet& artifacts) override;
};

} // namespace loom

#endif // SRC_LOOM_ARTIFACT_WRITER_HPP_
