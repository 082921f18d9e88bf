#include "loom/Sources.hpp"

#include "loom/SourceFile.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>

namespace loom {

std::string ResolvedDiagnostic::toString() const {
    if (locations.empty()) {
        return message;
    }

    const auto& primary = locations.front();
    std::string result = fmt::format("{}:{}:{}: {}", primary.path, primary.lineNumber, primary.characterNumber,
            message);
    for (const auto& location : locations) {
        // Only underline the part of the text that lives on the first line.
        size_t underline = location.text.find('\n');
        if (underline == std::string::npos) {
            underline = location.text.size();
        }
        underline = std::max<size_t>(underline, 1);
        size_t indent = location.characterNumber > 0 ? location.characterNumber - 1 : 0;
        if (&location != &primary) {
            result += fmt::format("\n{}:{}:{}: related location", location.path, location.lineNumber,
                    location.characterNumber);
        }
        result += fmt::format("\n    {}\n    {}{}", location.lineText, std::string(indent, ' '),
                std::string(underline, '^'));
    }
    return result;
}

Sources::Sources() {}

Sources::~Sources() {}

SourceID Sources::add(std::unique_ptr<SourceFile> sourceFile) {
    m_sources.emplace_back(std::move(sourceFile));
    return static_cast<SourceID>(m_sources.size() - 1);
}

SourceID Sources::addSource(std::string path, std::string code) {
    return add(std::make_unique<SourceFile>(std::move(path), std::move(code)));
}

const SourceFile* Sources::source(SourceID sourceID) const {
    if (sourceID < 0 || sourceID >= static_cast<SourceID>(m_sources.size())) {
        return nullptr;
    }
    return m_sources[sourceID].get();
}

std::optional<ResolvedLocation> Sources::resolve(const Location& location) const {
    if (!location.isValid()) {
        return std::nullopt;
    }
    const auto* sourceFile = source(location.sourceID);
    if (!sourceFile || location.end > static_cast<int32_t>(sourceFile->size())) {
        return std::nullopt;
    }

    ResolvedLocation resolved;
    resolved.path = sourceFile->path();
    resolved.lineNumber = sourceFile->getLineNumber(location.start);
    resolved.characterNumber = sourceFile->getCharacterNumber(location.start);
    resolved.text = std::string(sourceFile->codeView().substr(location.start, location.length()));
    resolved.lineText = std::string(sourceFile->lineText(resolved.lineNumber));
    return resolved;
}

ResolvedDiagnostic Sources::resolve(const Diagnostic& diagnostic) const {
    ResolvedDiagnostic resolved;
    resolved.message = diagnostic.message;
    for (const auto& location : diagnostic.locations) {
        auto resolvedLocation = resolve(location);
        if (!resolvedLocation) {
            SPDLOG_CRITICAL("Unable to resolve location (source {}, {}-{}) for error '{}'", location.sourceID,
                    location.start, location.end, diagnostic.message);
            continue;
        }
        resolved.locations.emplace_back(std::move(resolvedLocation.value()));
    }
    return resolved;
}

std::vector<ResolvedDiagnostic> Sources::resolve(const Diagnostics& diagnostics) const {
    std::vector<ResolvedDiagnostic> resolved;
    resolved.reserve(diagnostics.size());
    for (const auto& diagnostic : diagnostics) {
        resolved.emplace_back(resolve(diagnostic));
    }
    return resolved;
}

} // namespace loom
