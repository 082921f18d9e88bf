#include "loom/TransformPipeline.hpp"

#include "loom/Timer.hpp"
#include "loom/Transforms.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cassert>

namespace loom {

ProgramPtr TargetPrograms::find(const std::string& targetName) const {
    for (const auto& target : programs) {
        if (target.first == targetName) { return target.second; }
    }
    return nullptr;
}

// static
TransformPipeline TransformPipeline::makeDefault() {
    TransformPipeline pipeline;
    pipeline.addTarget(kReaderTarget, {
        { "removeBaseFragments", transforms::removeBaseFragments },
        { "flattenInlineFragments", transforms::flattenInlineFragments }
    });
    pipeline.addTarget(kNormalizationTarget, {
        { "inlineFragments", transforms::inlineFragments },
        { "flattenInlineFragments", transforms::flattenInlineFragments },
        { "generateTypename", transforms::generateTypename },
        { "generateIdField", transforms::generateIdField },
        { "skipUnreachableNodes", transforms::skipUnreachableNodes }
    });
    pipeline.addTarget(kOperationTextTarget, {
        { "skipClientExtensions", transforms::skipClientExtensions },
        { "skipUnreachableNodes", transforms::skipUnreachableNodes },
        { "generateTypename", transforms::generateTypename },
        { "generateIdField", transforms::generateIdField },
        { "onlyReachableFromOperations", transforms::onlyReachableFromOperations }
    });
    return pipeline;
}

void TransformPipeline::addTarget(std::string name, std::vector<NamedTransform> transforms) {
    for (auto& target : m_targets) {
        if (target.name == name) {
            target.transforms = std::move(transforms);
            return;
        }
    }
    m_targets.emplace_back(Target{ std::move(name), std::move(transforms) });
}

TargetPrograms TransformPipeline::apply(const ProgramPtr& program, const std::set<std::string>& baseFragmentNames,
        PerfLogger* perfLogger) const {
    TransformContext context{ baseFragmentNames };
    TargetPrograms targetPrograms;

    for (const auto& target : m_targets) {
        ProgramPtr current = program;
        for (const auto& transform : target.transforms) {
            Timer timer(fmt::format("{}.{}", target.name, transform.name), perfLogger);
            current = transform.transform(current, context);
            assert(current);
        }
        SPDLOG_DEBUG("Target '{}' has {} definitions", target.name, current->documentCount());
        targetPrograms.programs.emplace_back(std::make_pair(target.name, std::move(current)));
    }

    return targetPrograms;
}

} // namespace loom
