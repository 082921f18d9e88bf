#ifndef SRC_LOOM_TRANSFORM_PIPELINE_HPP_
#define SRC_LOOM_TRANSFORM_PIPELINE_HPP_

#include "loom/Program.hpp"

#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace loom {

class PerfLogger;

static constexpr const char* kReaderTarget = "reader";
static constexpr const char* kNormalizationTarget = "normalization";
static constexpr const char* kOperationTextTarget = "operation_text";

// Inputs shared by every transform of one pipeline run.
struct TransformContext {
    const std::set<std::string>& baseFragmentNames;
};

// A pure Program to Program function. Transforms must not modify their input.
using Transform = std::function<ProgramPtr(const ProgramPtr& program, const TransformContext& context)>;

struct NamedTransform {
    std::string name;
    Transform transform;
};

// The Programs produced for each target, in the order the targets were added to the TransformPipeline.
struct TargetPrograms {
    std::vector<std::pair<std::string, ProgramPtr>> programs;

    // Returns nullptr if there's no target called |targetName|.
    ProgramPtr find(const std::string& targetName) const;
};

// Fans one validated Program out into a Program per target by running each target's ordered chain of transforms.
// Targets are independent: every chain starts from the same input Program.
class TransformPipeline {
public:
    struct Target {
        std::string name;
        std::vector<NamedTransform> transforms;
    };

    TransformPipeline() = default;
    ~TransformPipeline() = default;

    // The reader, normalization and operation_text targets.
    static TransformPipeline makeDefault();

    // Appends a target, or replaces the transforms of an existing target with the same name.
    void addTarget(std::string name, std::vector<NamedTransform> transforms);

    TargetPrograms apply(const ProgramPtr& program, const std::set<std::string>& baseFragmentNames,
            PerfLogger* perfLogger = nullptr) const;

    const std::vector<Target>& targets() const { return m_targets; }

private:
    std::vector<Target> m_targets;
};

} // namespace loom

#endif // SRC_LOOM_TRANSFORM_PIPELINE_HPP_
