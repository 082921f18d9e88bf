#ifndef SRC_LOOM_PIPELINE_HPP_
#define SRC_LOOM_PIPELINE_HPP_

// By default we turn off pipeline validation in Release builds.
#ifndef LOOM_PIPELINE_VALIDATE
#ifdef NDEBUG
#define LOOM_PIPELINE_VALIDATE 0
#else
#define LOOM_PIPELINE_VALIDATE 1
#endif // NDEBUG
#endif // LOOM_PIPELINE_VALIDATE

#include "loom/Artifact.hpp"
#include "loom/BuildProjectError.hpp"
#include "loom/CompilerState.hpp"
#include "loom/Program.hpp"
#include "loom/TransformPipeline.hpp"

#include <memory>
#include <string>
#include <vector>

namespace loom {

class ArtifactWriter;
struct Config;
struct IRResult;
class OperationPersister;
class PerfLogger;
struct ProjectConfig;
class Schema;
class Sources;
class WorkerPool;

// Builds one project from parsed inputs to written artifacts. Runs the stages in a fixed order, stopping at the first
// failure, and times each stage as "<stage> <project>". With LOOM_PIPELINE_VALIDATE on the Pipeline also checks the
// internal consistency of the Program and target Programs between stages.
//
// One Pipeline may build several projects concurrently from different threads, as long as its setters are not called
// once building has started. buildProject() blocks on work running on the WorkerPool, so it must not itself be called
// from a WorkerPool thread.
class Pipeline {
public:
    // Runs persistence on the calling thread, logs timing spans and writes artifacts to the file system.
    Pipeline();
    Pipeline(std::shared_ptr<WorkerPool> workerPool, std::shared_ptr<PerfLogger> perfLogger);
    virtual ~Pipeline();

    void setArtifactWriter(std::shared_ptr<ArtifactWriter> artifactWriter) { m_artifactWriter = artifactWriter; }
    void setOperationPersister(std::shared_ptr<OperationPersister> persister) { m_persister = persister; }
    // Add or replace targets here before building.
    TransformPipeline& transformPipeline() { return m_transformPipeline; }

    BuildOutcome buildProject(const CompilerState& compilerState, const Config& config,
            const ProjectConfig& projectConfig, const AstSets& astSets, const Sources& sources);

    // Called after each stage succeeds. The default implementations do nothing. They are intended primarily for use
    // by the Pipeline unittests, allowing for additional testing work on each stage's output. Any method that returns
    // false will stop the pipeline from moving to the next stage. Implementations must be thread safe if the
    // Pipeline builds projects concurrently.
    virtual bool afterBuildSchema(const ProjectConfig& projectConfig, const Schema* schema);
    virtual bool afterBuildIR(const ProjectConfig& projectConfig, const IRResult& irResult);
    virtual bool afterBuildProgram(const ProjectConfig& projectConfig, const Program* program);
    virtual bool afterValidate(const ProjectConfig& projectConfig, const Program* program);
    virtual bool afterApplyTransforms(const ProjectConfig& projectConfig, const TargetPrograms& targets);
    virtual bool afterGenerateArtifacts(const ProjectConfig& projectConfig, const ArtifactSet& artifacts);
    virtual bool afterWriteArtifacts(const ProjectConfig& projectConfig, const ArtifactSet& artifacts);

protected:
    BuildProjectError makeError(const ProjectConfig& projectConfig, Stage stage, BuildProjectError::Kind kind,
            std::string message, std::vector<ResolvedDiagnostic> diagnostics = std::vector<ResolvedDiagnostic>());
    std::string spanName(Stage stage, const ProjectConfig& projectConfig) const;

    std::shared_ptr<WorkerPool> m_workerPool;
    std::shared_ptr<PerfLogger> m_perfLogger;
    std::shared_ptr<ArtifactWriter> m_artifactWriter;
    std::shared_ptr<OperationPersister> m_persister;
    TransformPipeline m_transformPipeline;
};

} // namespace loom

#endif // SRC_LOOM_PIPELINE_HPP_
