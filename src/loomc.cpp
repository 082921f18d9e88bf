// loomc is a command-line GraphQL query compiler. It builds the artifacts for every project in a loom.config.json.
#include "loom/ArtifactWriter.hpp"
#include "loom/BuildProjectError.hpp"
#include "loom/CompilerState.hpp"
#include "loom/Config.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/Pipeline.hpp"
#include "loom/Sources.hpp"
#include "loom/Timer.hpp"
#include "loom/WorkerPool.hpp"
#include "loom/internal/FileSystem.hpp"

#include "fmt/format.h"
#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <iostream>
#include <memory>
#include <thread>
#include <vector>

DEFINE_string(config, "", "path to the configuration file, if empty searches upwards for loom.config.json");
DEFINE_string(project, "", "build only the named project, if empty builds every project");
DEFINE_bool(validate, false, "write nothing, fail if any artifact on disk is out of date");
DEFINE_uint32(threads, 0, "number of worker threads, if zero picks a default based on hardware");
DEFINE_bool(verbose, false, "log debug output including stage timings");

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("loomc [--config path] [--project name] [--validate]");
    gflags::ParseCommandLineFlags(&argc, &argv, false);
    spdlog::set_level(FLAGS_verbose ? spdlog::level::debug : spdlog::level::info);

    loom::ErrorReporter errorReporter;
    fs::path configPath(FLAGS_config);
    if (configPath.empty()) {
        std::error_code ec;
        configPath = loom::findFileUpwards(fs::current_path(ec), "loom.config.json");
        if (configPath.empty()) {
            errorReporter.addFileNotFoundError("loom.config.json");
            return -1;
        }
    }

    auto config = loom::Config::loadFromFile(configPath, &errorReporter);
    if (!config) {
        return -1;
    }

    std::vector<const loom::ProjectConfig*> projects;
    if (FLAGS_project.empty()) {
        for (const auto& projectConfig : config->projects) {
            projects.emplace_back(&projectConfig);
        }
    } else {
        const auto* projectConfig = config->findProject(FLAGS_project);
        if (!projectConfig) {
            errorReporter.addError(fmt::format("No project named '{}' in '{}'", FLAGS_project, configPath.string()));
            return -1;
        }
        projects.emplace_back(projectConfig);
    }

    loom::Sources sources;
    loom::CompilerState compilerState;
    loom::AstSets astSets;
    if (!loom::CompilerState::loadFromConfig(*config, sources, compilerState, astSets, errorReporter)) {
        SPDLOG_ERROR("{} error(s) loading sources", errorReporter.errorCount());
        return -1;
    }

    auto workerPool = std::make_shared<loom::WorkerPool>();
    if (!workerPool->start(FLAGS_threads)) {
        return -1;
    }

    loom::Pipeline pipeline(workerPool, std::make_shared<loom::LogPerfLogger>());
    if (FLAGS_validate) {
        pipeline.setArtifactWriter(std::make_shared<loom::ValidatingWriter>());
    }

    // Projects are independent, so each builds on its own thread.
    std::vector<loom::BuildOutcome> outcomes(projects.size());
    std::vector<std::thread> builders;
    for (size_t i = 0; i < projects.size(); ++i) {
        builders.emplace_back(std::thread([&, i]() {
            outcomes[i] = pipeline.buildProject(compilerState, *config, *projects[i], astSets, sources);
        }));
    }
    for (auto& builder : builders) {
        builder.join();
    }
    workerPool->stop();

    int failures = 0;
    for (const auto& outcome : outcomes) {
        if (const auto* error = std::get_if<loom::BuildProjectError>(&outcome)) {
            std::cerr << error->toString() << std::endl;
            ++failures;
        }
    }

    if (failures) {
        SPDLOG_ERROR("{} of {} project(s) failed", failures, projects.size());
        return -1;
    }
    return 0;
}
