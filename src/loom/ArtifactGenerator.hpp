#ifndef SRC_LOOM_ARTIFACT_GENERATOR_HPP_
#define SRC_LOOM_ARTIFACT_GENERATOR_HPP_

#include "loom/Artifact.hpp"
#include "loom/Errors.hpp"
#include "loom/IR.hpp"
#include "loom/TransformPipeline.hpp"

#include <future>
#include <memory>
#include <string>
#include <variant>

namespace loom {

struct Config;
class OperationPersister;
struct ProjectConfig;

using GenerationResult = std::variant<ArtifactSet, ArtifactGenerationError>;

// Turns the target Programs of one project into in-memory artifacts:
//   * one JSON fragment artifact per reader fragment,
//   * one JSON request artifact per operation, combining its reader and normalization selections with the operation
//     text, or the persisted id of the text when the project persists. Operations that select only client
//     extensions have neither text nor id,
//   * a persisted_queries.json map from id to text when the project persists,
//   * one printed .graphql artifact per definition of any target beyond the default three.
// Either every artifact is returned or none are.
class ArtifactGenerator {
public:
    ArtifactGenerator() = delete;
    // |persister| may be nullptr, in which case projects that persist fail to generate.
    ArtifactGenerator(const Config& config, std::shared_ptr<OperationPersister> persister);
    ~ArtifactGenerator() = default;

    // Returns an already fulfilled future unless operation text is being persisted, in which case the future is
    // fulfilled from the persister's callbacks.
    std::future<GenerationResult> generate(const ProjectConfig& projectConfig, const TargetPrograms& targets) const;

    // Path of the artifact for |definition|, relative to the configuration root.
    std::string artifactPath(const ProjectConfig& projectConfig, const ir::Definition& definition,
            const std::string& extension) const;

private:
    const Config& m_config;
    std::shared_ptr<OperationPersister> m_persister;
};

} // namespace loom

#endif // SRC_LOOM_ARTIFACT_GENERATOR_HPP_
