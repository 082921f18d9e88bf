#include "loom/Config.hpp"

#include "loom/ErrorReporter.hpp"
#include "loom/internal/FileSystem.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "spdlog/spdlog.h"

#include <algorithm>

namespace {

bool readStringArray(const rapidjson::Value& value, const char* key, const std::string& projectName,
        std::vector<std::string>& out, loom::ErrorReporter* errorReporter) {
    if (!value.IsArray()) {
        errorReporter->addError(fmt::format("Project '{}': '{}' must be an array of strings.", projectName, key));
        return false;
    }
    for (const auto& item : value.GetArray()) {
        if (!item.IsString()) {
            errorReporter->addError(fmt::format("Project '{}': '{}' must be an array of strings.", projectName, key));
            return false;
        }
        out.emplace_back(item.GetString(), item.GetStringLength());
    }
    return true;
}

bool parseProject(const std::string& projectName, const rapidjson::Value& value, loom::ProjectConfig& project,
        loom::ErrorReporter* errorReporter) {
    if (!value.IsObject()) {
        errorReporter->addError(fmt::format("Project '{}' must be a JSON object.", projectName));
        return false;
    }
    project.name = projectName;

    bool ok = true;
    for (const auto& member : value.GetObject()) {
        std::string key(member.name.GetString(), member.name.GetStringLength());
        const auto& memberValue = member.value;

        if (key == "schema") {
            if (!memberValue.IsString()) {
                errorReporter->addError(fmt::format("Project '{}': 'schema' must be a string.", projectName));
                ok = false;
                continue;
            }
            project.schemaPath = memberValue.GetString();
        } else if (key == "extensions") {
            ok &= readStringArray(memberValue, "extensions", projectName, project.extensionPaths, errorReporter);
        } else if (key == "documents") {
            ok &= readStringArray(memberValue, "documents", projectName, project.documentDirectories, errorReporter);
        } else if (key == "base") {
            if (!memberValue.IsString()) {
                errorReporter->addError(fmt::format("Project '{}': 'base' must be a string.", projectName));
                ok = false;
                continue;
            }
            project.baseProject = std::string(memberValue.GetString());
        } else if (key == "output") {
            if (!memberValue.IsString()) {
                errorReporter->addError(fmt::format("Project '{}': 'output' must be a string.", projectName));
                ok = false;
                continue;
            }
            project.outputDirectory = std::string(memberValue.GetString());
        } else if (key == "persist") {
            if (!memberValue.IsBool()) {
                errorReporter->addError(fmt::format("Project '{}': 'persist' must be a boolean.", projectName));
                ok = false;
                continue;
            }
            project.persist = memberValue.GetBool();
        } else if (key == "maxSelectionDepth") {
            if (!memberValue.IsInt() || memberValue.GetInt() < 1) {
                errorReporter->addError(fmt::format("Project '{}': 'maxSelectionDepth' must be a positive integer.",
                        projectName));
                ok = false;
                continue;
            }
            project.maxSelectionDepth = memberValue.GetInt();
        } else {
            errorReporter->addError(fmt::format("Project '{}': unknown key '{}'.", projectName, key));
            ok = false;
        }
    }

    if (project.schemaPath.empty()) {
        errorReporter->addError(fmt::format("Project '{}' is missing required key 'schema'.", projectName));
        ok = false;
    }
    if (project.documentDirectories.empty()) {
        errorReporter->addError(fmt::format("Project '{}' is missing required key 'documents'.", projectName));
        ok = false;
    }

    return ok;
}

} // namespace

namespace loom {

const ProjectConfig* Config::findProject(std::string_view projectName) const {
    for (const auto& project : projects) {
        if (project.name == projectName) {
            return &project;
        }
    }
    return nullptr;
}

// static
std::optional<Config> Config::loadFromFile(const std::filesystem::path& path, ErrorReporter* errorReporter) {
    std::string json;
    if (!readFileContents(path, json)) {
        errorReporter->addFileReadError(path.string());
        return std::nullopt;
    }
    SPDLOG_DEBUG("Loaded config file '{}', {} bytes", path.string(), json.size());

    std::error_code ec;
    auto baseDirectory = std::filesystem::absolute(path, ec).parent_path();
    if (ec) {
        errorReporter->addError(fmt::format("Unable to resolve config path '{}': {}", path.string(), ec.message()));
        return std::nullopt;
    }
    return parse(json, baseDirectory, errorReporter);
}

// static
std::optional<Config> Config::parse(std::string_view json, const std::filesystem::path& baseDirectory,
        ErrorReporter* errorReporter) {
    rapidjson::Document document;
    rapidjson::ParseResult parseResult = document.Parse<rapidjson::kParseCommentsFlag>(json.data(), json.size());
    if (!parseResult) {
        errorReporter->addError(fmt::format("Failed to parse config JSON at offset {}: {}", parseResult.Offset(),
                rapidjson::GetParseError_En(parseResult.Code())));
        return std::nullopt;
    }
    if (!document.IsObject()) {
        errorReporter->addError("Config JSON is not a JSON object.");
        return std::nullopt;
    }

    Config config;
    config.rootDirectory = baseDirectory;
    bool ok = true;

    for (const auto& member : document.GetObject()) {
        std::string key(member.name.GetString(), member.name.GetStringLength());
        const auto& value = member.value;

        if (key == "root") {
            if (!value.IsString()) {
                errorReporter->addError("Config 'root' must be a string.");
                ok = false;
                continue;
            }
            std::filesystem::path root(value.GetString());
            config.rootDirectory = root.is_absolute() ? root : (baseDirectory / root);
        } else if (key == "header") {
            if (!value.IsString()) {
                errorReporter->addError("Config 'header' must be a string.");
                ok = false;
                continue;
            }
            config.header = value.GetString();
        } else if (key == "artifactExtension") {
            if (!value.IsString() || value.GetStringLength() == 0 || value.GetString()[0] != '.') {
                errorReporter->addError("Config 'artifactExtension' must be a string starting with '.'.");
                ok = false;
                continue;
            }
            config.artifactExtension = value.GetString();
        } else if (key == "removeStaleArtifacts") {
            if (!value.IsBool()) {
                errorReporter->addError("Config 'removeStaleArtifacts' must be a boolean.");
                ok = false;
                continue;
            }
            config.removeStaleArtifacts = value.GetBool();
        } else if (key == "projects") {
            if (!value.IsObject()) {
                errorReporter->addError("Config 'projects' must be a JSON object.");
                ok = false;
                continue;
            }
            for (const auto& projectMember : value.GetObject()) {
                ProjectConfig project;
                std::string projectName(projectMember.name.GetString(), projectMember.name.GetStringLength());
                if (!parseProject(projectName, projectMember.value, project, errorReporter)) {
                    ok = false;
                    continue;
                }
                config.projects.emplace_back(std::move(project));
            }
        } else {
            errorReporter->addError(fmt::format("Unknown config key '{}'.", key));
            ok = false;
        }
    }

    if (!ok) {
        return std::nullopt;
    }

    config.rootDirectory = config.rootDirectory.lexically_normal();

    if (config.projects.empty()) {
        errorReporter->addError("Config must define at least one project.");
        return std::nullopt;
    }

    std::sort(config.projects.begin(), config.projects.end(),
            [](const ProjectConfig& a, const ProjectConfig& b) { return a.name < b.name; });

    for (const auto& project : config.projects) {
        if (!project.baseProject) { continue; }
        if (*project.baseProject == project.name) {
            errorReporter->addError(fmt::format("Project '{}' cannot be its own base project.", project.name));
            ok = false;
        } else if (!config.findProject(*project.baseProject)) {
            errorReporter->addError(fmt::format("Project '{}' names unknown base project '{}'.", project.name,
                    *project.baseProject));
            ok = false;
        }
    }

    if (!ok) {
        return std::nullopt;
    }
    return config;
}

} // namespace loom
