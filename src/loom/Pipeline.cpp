#include "loom/Pipeline.hpp"

#include "loom/ArtifactGenerator.hpp"
#include "loom/ArtifactWriter.hpp"
#include "loom/Config.hpp"
#include "loom/IRBuilder.hpp"
#include "loom/OperationPersister.hpp"
#include "loom/Schema.hpp"
#include "loom/SchemaBuilder.hpp"
#include "loom/Sources.hpp"
#include "loom/Timer.hpp"
#include "loom/Validator.hpp"
#include "loom/WorkerPool.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cassert>

namespace loom {

Pipeline::Pipeline(): Pipeline(std::make_shared<WorkerPool>(), std::make_shared<LogPerfLogger>()) {}

Pipeline::Pipeline(std::shared_ptr<WorkerPool> workerPool, std::shared_ptr<PerfLogger> perfLogger):
    m_workerPool(std::move(workerPool)),
    m_perfLogger(std::move(perfLogger)),
    m_artifactWriter(std::make_shared<FileSystemWriter>()),
    m_persister(std::make_shared<LocalPersister>(m_workerPool)),
    m_transformPipeline(TransformPipeline::makeDefault()) {
    assert(m_workerPool);
}

Pipeline::~Pipeline() {}

BuildOutcome Pipeline::buildProject(const CompilerState& compilerState, const Config& config,
        const ProjectConfig& projectConfig, const AstSets& astSets, const Sources& sources) {
    PerfLogger* perfLogger = m_perfLogger.get();
    SPDLOG_DEBUG("[{}] build starting", projectConfig.name);

    auto schemaResult = Timer::time(spanName(Stage::kBuildSchema, projectConfig), perfLogger,
            [&compilerState, &projectConfig]() { return SchemaBuilder::build(compilerState, projectConfig); });
    if (const auto* error = std::get_if<SchemaBuildError>(&schemaResult)) {
        return makeError(projectConfig, Stage::kBuildSchema, BuildProjectError::Kind::kStageFailed, error->message,
                sources.resolve(error->diagnostics));
    }
    auto schema = std::get<std::shared_ptr<const Schema>>(schemaResult);
    if (!afterBuildSchema(projectConfig, schema.get())) {
        return makeError(projectConfig, Stage::kBuildSchema, BuildProjectError::Kind::kAborted, "stopped by hook");
    }

    auto irBuildResult = Timer::time(spanName(Stage::kBuildIR, projectConfig), perfLogger,
            [&projectConfig, &schema, &astSets]() { return IRBuilder::build(projectConfig, schema, astSets); });
    if (const auto* diagnostics = std::get_if<Diagnostics>(&irBuildResult)) {
        return makeError(projectConfig, Stage::kBuildIR, BuildProjectError::Kind::kStageFailed,
                fmt::format("{} error(s) in documents", diagnostics->size()), sources.resolve(*diagnostics));
    }
    const auto& irResult = std::get<IRResult>(irBuildResult);
    if (!afterBuildIR(projectConfig, irResult)) {
        return makeError(projectConfig, Stage::kBuildIR, BuildProjectError::Kind::kAborted, "stopped by hook");
    }

    auto program = Timer::time(spanName(Stage::kBuildProgram, projectConfig), perfLogger,
            [&schema, &irResult]() { return Program::fromDefinitions(schema, irResult.ir); });
#if LOOM_PIPELINE_VALIDATE
    if (!Validator::validateProgram(program.get())) {
        return makeError(projectConfig, Stage::kBuildProgram, BuildProjectError::Kind::kInternal,
                "Program failed consistency checks");
    }
#endif // LOOM_PIPELINE_VALIDATE
    if (!afterBuildProgram(projectConfig, program.get())) {
        return makeError(projectConfig, Stage::kBuildProgram, BuildProjectError::Kind::kAborted, "stopped by hook");
    }

    auto validationErrors = Timer::time(spanName(Stage::kValidate, projectConfig), perfLogger,
            [&projectConfig, &irResult, &program]() {
                return Validator(projectConfig, irResult.baseFragmentNames).validate(*program);
            });
    if (!validationErrors.empty()) {
        return makeError(projectConfig, Stage::kValidate, BuildProjectError::Kind::kStageFailed,
                fmt::format("{} validation error(s)", validationErrors.size()), sources.resolve(validationErrors));
    }
    if (!afterValidate(projectConfig, program.get())) {
        return makeError(projectConfig, Stage::kValidate, BuildProjectError::Kind::kAborted, "stopped by hook");
    }

    auto targets = Timer::time(spanName(Stage::kApplyTransforms, projectConfig), perfLogger,
            [this, &program, &irResult, perfLogger]() {
                return m_transformPipeline.apply(program, irResult.baseFragmentNames, perfLogger);
            });
#if LOOM_PIPELINE_VALIDATE
    if (!Validator::validateTargets(program.get(), targets, irResult.baseFragmentNames)) {
        return makeError(projectConfig, Stage::kApplyTransforms, BuildProjectError::Kind::kInternal,
                "target Programs failed consistency checks");
    }
#endif // LOOM_PIPELINE_VALIDATE
    if (!afterApplyTransforms(projectConfig, targets)) {
        return makeError(projectConfig, Stage::kApplyTransforms, BuildProjectError::Kind::kAborted,
                "stopped by hook");
    }

    ArtifactGenerator generator(config, m_persister);
    auto generationResult = Timer::time(spanName(Stage::kGenerateArtifacts, projectConfig), perfLogger,
            [&generator, &projectConfig, &targets]() { return generator.generate(projectConfig, targets).get(); });
    if (const auto* error = std::get_if<ArtifactGenerationError>(&generationResult)) {
        std::string message = error->message;
        if (!error->definitionName.empty()) {
            message = fmt::format("{} (target '{}', definition '{}')", error->message, error->target,
                    error->definitionName);
        } else if (!error->target.empty()) {
            message = fmt::format("{} (target '{}')", error->message, error->target);
        }
        return makeError(projectConfig, Stage::kGenerateArtifacts, BuildProjectError::Kind::kStageFailed,
                std::move(message));
    }
    const auto& artifacts = std::get<ArtifactSet>(generationResult);
    if (!afterGenerateArtifacts(projectConfig, artifacts)) {
        return makeError(projectConfig, Stage::kGenerateArtifacts, BuildProjectError::Kind::kAborted,
                "stopped by hook");
    }

    assert(m_artifactWriter);
    auto writeError = Timer::time(spanName(Stage::kWriteArtifacts, projectConfig), perfLogger,
            [this, &config, &projectConfig, &artifacts]() {
                return m_artifactWriter->write(config, projectConfig, artifacts);
            });
    if (writeError) {
        auto error = makeError(projectConfig, Stage::kWriteArtifacts, BuildProjectError::Kind::kStageFailed,
                fmt::format("'{}': {}", writeError->path, writeError->message));
        error.writtenPaths = std::move(writeError->writtenPaths);
        return error;
    }
    if (!afterWriteArtifacts(projectConfig, artifacts)) {
        return makeError(projectConfig, Stage::kWriteArtifacts, BuildProjectError::Kind::kAborted,
                "stopped by hook");
    }

    ProjectSummary summary;
    summary.projectName = projectConfig.name;
    for (const auto& target : targets.programs) {
        summary.documentCounts.emplace_back(std::make_pair(target.first, target.second->documentCount()));
    }
    summary.artifactCount = artifacts.size();
    SPDLOG_INFO("{}", summary.toString());
    return summary;
}

bool Pipeline::afterBuildSchema(const ProjectConfig&, const Schema*) { return true; }
bool Pipeline::afterBuildIR(const ProjectConfig&, const IRResult&) { return true; }
bool Pipeline::afterBuildProgram(const ProjectConfig&, const Program*) { return true; }
bool Pipeline::afterValidate(const ProjectConfig&, const Program*) { return true; }
bool Pipeline::afterApplyTransforms(const ProjectConfig&, const TargetPrograms&) { return true; }
bool Pipeline::afterGenerateArtifacts(const ProjectConfig&, const ArtifactSet&) { return true; }
bool Pipeline::afterWriteArtifacts(const ProjectConfig&, const ArtifactSet&) { return true; }

BuildProjectError Pipeline::makeError(const ProjectConfig& projectConfig, Stage stage, BuildProjectError::Kind kind,
        std::string message, std::vector<ResolvedDiagnostic> diagnostics) {
    SPDLOG_DEBUG("[{}] {} stopped the build: {}", projectConfig.name, stageName(stage), message);
    BuildProjectError error;
    error.projectName = projectConfig.name;
    error.stage = stage;
    error.kind = kind;
    error.message = std::move(message);
    error.diagnostics = std::move(diagnostics);
    return error;
}

std::string Pipeline::spanName(Stage stage, const ProjectConfig& projectConfig) const {
    return fmt::format("{} {}", stageName(stage), projectConfig.name);
}

} // namespace loom
