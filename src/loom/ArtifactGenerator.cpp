#include "loom/ArtifactGenerator.hpp"

#include "loom/Config.hpp"
#include "loom/Hash.hpp"
#include "loom/OperationPersister.hpp"
#include "loom/Printer.hpp"
#include "loom/Schema.hpp"
#include "loom/internal/FileSystem.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>

namespace {

using Allocator = rapidjson::Document::AllocatorType;

constexpr const char* kPersistedQueriesFile = "persisted_queries.json";

rapidjson::Value stringValue(const std::string& text, Allocator& allocator) {
    rapidjson::Value value;
    value.SetString(text.data(), static_cast<rapidjson::SizeType>(text.size()), allocator);
    return value;
}

std::string serialize(const rapidjson::Document& document) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    document.Accept(writer);
    std::string json(buffer.GetString(), buffer.GetSize());
    json += '\n';
    return json;
}

rapidjson::Value encodeArguments(const std::vector<loom::ir::Argument>& arguments, Allocator& allocator) {
    rapidjson::Value array;
    array.SetArray();
    for (const auto& argument : arguments) {
        rapidjson::Value object;
        object.SetObject();
        object.AddMember("name", stringValue(argument.name, allocator), allocator);
        if (argument.value.kind == loom::ir::Value::Kind::kVariable) {
            object.AddMember("kind", rapidjson::Value("Variable"), allocator);
            object.AddMember("variableName", stringValue(argument.value.text, allocator), allocator);
        } else {
            object.AddMember("kind", rapidjson::Value("Literal"), allocator);
            object.AddMember("value", stringValue(loom::Printer::printValue(argument.value), allocator), allocator);
        }
        array.PushBack(object, allocator);
    }
    return array;
}

void encodeDirectives(const std::vector<loom::ir::Directive>& directives, rapidjson::Value& object,
        Allocator& allocator) {
    if (directives.empty()) { return; }
    rapidjson::Value array;
    array.SetArray();
    for (const auto& directive : directives) {
        rapidjson::Value directiveObject;
        directiveObject.SetObject();
        directiveObject.AddMember("name", stringValue(directive.name, allocator), allocator);
        directiveObject.AddMember("args", encodeArguments(directive.arguments, allocator), allocator);
        array.PushBack(directiveObject, allocator);
    }
    object.AddMember("directives", array, allocator);
}

rapidjson::Value encodeSelections(const loom::ir::Selections& selections, const loom::Schema& schema,
        Allocator& allocator) {
    rapidjson::Value array;
    array.SetArray();
    for (const auto& selection : selections) {
        rapidjson::Value object;
        object.SetObject();
        switch (selection->kind) {
        case loom::ir::SelectionKind::kScalarField:
        case loom::ir::SelectionKind::kLinkedField: {
            const auto* field = static_cast<const loom::ir::Field*>(selection.get());
            bool isLinked = selection->kind == loom::ir::SelectionKind::kLinkedField;
            const char* kind = isLinked ? "LinkedField" : "ScalarField";
            object.AddMember("kind", rapidjson::Value(rapidjson::StringRef(kind)), allocator);
            object.AddMember("name", stringValue(field->name, allocator), allocator);
            if (!field->alias.empty()) {
                object.AddMember("alias", stringValue(field->alias, allocator), allocator);
            }
            if (!field->arguments.empty()) {
                object.AddMember("args", encodeArguments(field->arguments, allocator), allocator);
            }
            object.AddMember("type", stringValue(field->type.toString(), allocator), allocator);
            if (isLinked) {
                object.AddMember("plural", rapidjson::Value(field->type.isList()), allocator);
                const auto* type = schema.findType(field->type.namedType());
                if (type && !type->isAbstract()) {
                    object.AddMember("concreteType", stringValue(type->name, allocator), allocator);
                } else {
                    object.AddMember("concreteType", rapidjson::Value(), allocator);
                }
                object.AddMember("selections",
                        encodeSelections(static_cast<const loom::ir::LinkedField*>(field)->selections, schema,
                                allocator),
                        allocator);
            }
        } break;

        case loom::ir::SelectionKind::kFragmentSpread: {
            const auto* spread = static_cast<const loom::ir::FragmentSpread*>(selection.get());
            object.AddMember("kind", rapidjson::Value("FragmentSpread"), allocator);
            object.AddMember("name", stringValue(spread->fragmentName, allocator), allocator);
        } break;

        case loom::ir::SelectionKind::kInlineFragment: {
            const auto* inlineFragment = static_cast<const loom::ir::InlineFragment*>(selection.get());
            object.AddMember("kind", rapidjson::Value("InlineFragment"), allocator);
            if (inlineFragment->typeCondition.empty()) {
                object.AddMember("type", rapidjson::Value(), allocator);
            } else {
                object.AddMember("type", stringValue(inlineFragment->typeCondition, allocator), allocator);
            }
            object.AddMember("selections", encodeSelections(inlineFragment->selections, schema, allocator),
                    allocator);
        } break;
        }
        encodeDirectives(selection->directives, object, allocator);
        array.PushBack(object, allocator);
    }
    return array;
}

rapidjson::Value encodeVariables(const std::vector<loom::ir::VariableDefinition>& variables, Allocator& allocator) {
    rapidjson::Value array;
    array.SetArray();
    for (const auto& variable : variables) {
        rapidjson::Value object;
        object.SetObject();
        object.AddMember("name", stringValue(variable.name, allocator), allocator);
        object.AddMember("type", stringValue(variable.type.toString(), allocator), allocator);
        if (variable.defaultValue) {
            object.AddMember("defaultValue", stringValue(loom::Printer::printValue(*variable.defaultValue),
                    allocator), allocator);
        } else {
            object.AddMember("defaultValue", rapidjson::Value(), allocator);
        }
        array.PushBack(object, allocator);
    }
    return array;
}

// A request artifact waiting on the persisted id of its operation text.
struct RequestPlan {
    const loom::ir::Definition* reader;
    const loom::ir::Definition* normalization;
    // Empty for client-only operations, which have nothing to send to the server.
    std::string text;
    std::string path;
    std::string id;
};

// Shared between generate() and the persister callbacks, which may outlive the ArtifactGenerator.
struct GenerationState {
    std::string header;
    bool persist = false;
    loom::ProgramPtr readerProgram;
    loom::ProgramPtr normalizationProgram;
    loom::ArtifactSet artifacts;
    std::vector<RequestPlan> requests;
    std::string persistedQueriesPath;

    // Protects pending and error.
    std::mutex mutex;
    size_t pending = 0;
    std::optional<loom::ArtifactGenerationError> error;
    std::promise<loom::GenerationResult> promise;
};

loom::Artifact makeRequestArtifact(const GenerationState& state, const RequestPlan& plan) {
    const auto& schema = *state.readerProgram->schema();
    rapidjson::Document document;
    document.SetObject();
    auto& allocator = document.GetAllocator();
    document.AddMember("header", stringValue(state.header, allocator), allocator);
    document.AddMember("kind", rapidjson::Value("request"), allocator);
    document.AddMember("name", stringValue(plan.reader->name, allocator), allocator);
    const auto& hashedText = plan.text.empty() ? loom::Printer::printDefinition(*plan.reader) : plan.text;
    document.AddMember("hash", stringValue(loom::hashToString(loom::hash(hashedText)), allocator), allocator);

    rapidjson::Value fragment;
    fragment.SetObject();
    fragment.AddMember("name", stringValue(plan.reader->name, allocator), allocator);
    fragment.AddMember("type", stringValue(plan.reader->typeCondition, allocator), allocator);
    fragment.AddMember("argumentDefinitions", encodeVariables(plan.reader->variables, allocator), allocator);
    fragment.AddMember("selections", encodeSelections(plan.reader->selections, schema, allocator), allocator);
    document.AddMember("fragment", fragment, allocator);

    rapidjson::Value operation;
    operation.SetObject();
    operation.AddMember("name", stringValue(plan.normalization->name, allocator), allocator);
    operation.AddMember("argumentDefinitions", encodeVariables(plan.normalization->variables, allocator), allocator);
    operation.AddMember("selections", encodeSelections(plan.normalization->selections, schema, allocator),
            allocator);
    document.AddMember("operation", operation, allocator);

    rapidjson::Value params;
    params.SetObject();
    params.AddMember("name", stringValue(plan.reader->name, allocator), allocator);
    const char* operationKind = loom::operationKindName(plan.reader->operationKind);
    params.AddMember("operationKind", rapidjson::Value(rapidjson::StringRef(operationKind)), allocator);
    if (plan.text.empty()) {
        params.AddMember("id", rapidjson::Value(), allocator);
        params.AddMember("text", rapidjson::Value(), allocator);
    } else if (state.persist) {
        params.AddMember("id", stringValue(plan.id, allocator), allocator);
        params.AddMember("text", rapidjson::Value(), allocator);
    } else {
        params.AddMember("id", rapidjson::Value(), allocator);
        params.AddMember("text", stringValue(plan.text, allocator), allocator);
    }
    document.AddMember("params", params, allocator);

    return loom::Artifact{ plan.path, serialize(document), plan.reader->name,
            { loom::kReaderTarget, loom::kNormalizationTarget, loom::kOperationTextTarget } };
}

// Called once every operation text has an id, or immediately if nothing is persisted.
loom::GenerationResult finishGeneration(GenerationState& state) {
    if (state.error) {
        return *state.error;
    }

    loom::ArtifactSet artifacts = std::move(state.artifacts);
    std::map<std::string, std::string> persistedQueries;
    for (const auto& plan : state.requests) {
        artifacts.emplace_back(makeRequestArtifact(state, plan));
        if (state.persist && !plan.text.empty()) {
            persistedQueries.emplace(plan.id, plan.text);
        }
    }

    if (!state.persistedQueriesPath.empty()) {
        rapidjson::Document document;
        document.SetObject();
        auto& allocator = document.GetAllocator();
        for (const auto& entry : persistedQueries) {
            document.AddMember(stringValue(entry.first, allocator), stringValue(entry.second, allocator), allocator);
        }
        artifacts.emplace_back(loom::Artifact{ state.persistedQueriesPath, serialize(document), std::string(),
                { loom::kOperationTextTarget } });
    }

    SPDLOG_DEBUG("Generated {} artifacts", artifacts.size());
    return artifacts;
}

std::future<loom::GenerationResult> readyFuture(loom::GenerationResult result) {
    std::promise<loom::GenerationResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace

namespace loom {

ArtifactGenerator::ArtifactGenerator(const Config& config, std::shared_ptr<OperationPersister> persister):
    m_config(config), m_persister(std::move(persister)) {}

std::future<GenerationResult> ArtifactGenerator::generate(const ProjectConfig& projectConfig,
        const TargetPrograms& targets) const {
    auto state = std::make_shared<GenerationState>();
    state->header = m_config.header;
    state->persist = projectConfig.persist;
    state->readerProgram = targets.find(kReaderTarget);
    state->normalizationProgram = targets.find(kNormalizationTarget);
    auto operationTextProgram = targets.find(kOperationTextTarget);

    for (const auto& required : { std::make_pair(kReaderTarget, state->readerProgram),
                 std::make_pair(kNormalizationTarget, state->normalizationProgram),
                 std::make_pair(kOperationTextTarget, operationTextProgram) }) {
        if (!required.second) {
            return readyFuture(ArtifactGenerationError{ required.first, std::string(),
                    fmt::format("No Program for target '{}'", required.first) });
        }
    }

    // Artifact path to the name of the definition that claimed it.
    std::map<std::string, std::string> claimedPaths;
    auto claimPath = [&claimedPaths](const std::string& path, const std::string& definitionName,
            const std::string& target) -> std::optional<ArtifactGenerationError> {
        auto inserted = claimedPaths.emplace(path, definitionName);
        if (inserted.second) { return std::nullopt; }
        return ArtifactGenerationError{ target, definitionName, fmt::format("Artifact path '{}' is generated by "
                "both '{}' and '{}'", path, inserted.first->second, definitionName) };
    };

    const auto& schema = *state->readerProgram->schema();
    for (const auto& definition : state->readerProgram->definitions()) {
        if (definition->isFragment()) {
            auto path = artifactPath(projectConfig, *definition, m_config.artifactExtension);
            if (auto error = claimPath(path, definition->name, kReaderTarget)) {
                return readyFuture(std::move(*error));
            }

            rapidjson::Document document;
            document.SetObject();
            auto& allocator = document.GetAllocator();
            document.AddMember("header", stringValue(m_config.header, allocator), allocator);
            document.AddMember("kind", rapidjson::Value("fragment"), allocator);
            document.AddMember("name", stringValue(definition->name, allocator), allocator);
            document.AddMember("type", stringValue(definition->typeCondition, allocator), allocator);
            document.AddMember("hash", stringValue(hashToString(hash(Printer::printDefinition(*definition))),
                    allocator), allocator);
            document.AddMember("selections", encodeSelections(definition->selections, schema, allocator), allocator);
            encodeDirectives(definition->directives, document, allocator);
            state->artifacts.emplace_back(Artifact{ std::move(path), serialize(document), definition->name,
                    { kReaderTarget } });
            continue;
        }

        const auto* normalization = state->normalizationProgram->findOperation(definition->name);
        if (!normalization) {
            return readyFuture(ArtifactGenerationError{ kNormalizationTarget, definition->name,
                    fmt::format("Operation '{}' has no normalization counterpart", definition->name) });
        }
        // Operations selecting only client extensions have no operation text left.
        std::string text;
        if (operationTextProgram->findOperation(definition->name)) {
            text = Printer::printOperationText(*operationTextProgram, definition->name);
        } else {
            SPDLOG_DEBUG("Operation '{}' is client only", definition->name);
        }

        auto path = artifactPath(projectConfig, *definition, m_config.artifactExtension);
        if (auto error = claimPath(path, definition->name, kReaderTarget)) {
            return readyFuture(std::move(*error));
        }
        state->requests.emplace_back(RequestPlan{ definition.get(), normalization, std::move(text), std::move(path),
                std::string() });
    }

    for (const auto& target : targets.programs) {
        if (target.first == kReaderTarget || target.first == kNormalizationTarget
            || target.first == kOperationTextTarget) {
            continue;
        }
        for (const auto& definition : target.second->definitions()) {
            auto path = artifactPath(projectConfig, *definition, fmt::format(".{}.graphql", target.first));
            if (auto error = claimPath(path, definition->name, target.first)) {
                return readyFuture(std::move(*error));
            }
            auto content = fmt::format("# {}\n{}", m_config.header, Printer::printDefinition(*definition));
            state->artifacts.emplace_back(Artifact{ std::move(path), std::move(content), definition->name,
                    { target.first } });
        }
    }

    size_t persistable = std::count_if(state->requests.begin(), state->requests.end(),
            [](const RequestPlan& plan) { return !plan.text.empty(); });
    if (!projectConfig.persist || persistable == 0) {
        return readyFuture(finishGeneration(*state));
    }

    if (!m_persister) {
        return readyFuture(ArtifactGenerationError{ kOperationTextTarget, state->requests.front().reader->name,
                fmt::format("Project '{}' persists operations but no OperationPersister is configured",
                        projectConfig.name) });
    }

    fs::path queriesDirectory(projectConfig.outputDirectory ? *projectConfig.outputDirectory : "__generated__");
    state->persistedQueriesPath = (queriesDirectory / kPersistedQueriesFile).generic_string();
    if (auto error = claimPath(state->persistedQueriesPath, kPersistedQueriesFile, kOperationTextTarget)) {
        return readyFuture(std::move(*error));
    }

    auto future = state->promise.get_future();
    state->pending = persistable;
    for (size_t i = 0; i < state->requests.size(); ++i) {
        if (state->requests[i].text.empty()) { continue; }
        m_persister->persist(state->requests[i].text, [state, i](PersistResult result) {
            bool isLast = false;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (const auto* persistError = std::get_if<PersistError>(&result)) {
                    SPDLOG_DEBUG("Persisting '{}' failed: {}", state->requests[i].reader->name,
                            persistError->message);
                    if (!state->error) {
                        state->error = ArtifactGenerationError{ kOperationTextTarget, state->requests[i].reader->name,
                                fmt::format("Failed to persist operation text: {}", persistError->message) };
                    }
                } else {
                    state->requests[i].id = std::get<std::string>(result);
                }
                isLast = (--state->pending == 0);
            }
            if (isLast) {
                state->promise.set_value(finishGeneration(*state));
            }
        });
    }

    return future;
}

std::string ArtifactGenerator::artifactPath(const ProjectConfig& projectConfig, const ir::Definition& definition,
        const std::string& extension) const {
    fs::path directory;
    if (projectConfig.outputDirectory) {
        directory = fs::path(*projectConfig.outputDirectory);
    } else {
        directory = fs::path(definition.sourcePath).parent_path() / "__generated__";
    }
    return (directory / (definition.name + extension)).generic_string();
}

} // namespace loom
