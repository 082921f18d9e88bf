#include "loom/ErrorReporter.hpp"

#include "loom/Sources.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace loom {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(const std::string& error) {
    if (!m_suppress) {
        spdlog::error(error);
    }
    m_errors.emplace_back(error);
}

void ErrorReporter::addDiagnostic(const ResolvedDiagnostic& diagnostic) {
    addError(diagnostic.toString());
}

void ErrorReporter::addFileNotFoundError(const std::string& filePath) {
    addError(fmt::format("File not found: '{}'", filePath));
}

void ErrorReporter::addFileReadError(const std::string& filePath) {
    addError(fmt::format("Failed to read file: '{}'", filePath));
}

} // namespace loom
