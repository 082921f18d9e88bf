#ifndef SRC_LOOM_SOURCES_HPP_
#define SRC_LOOM_SOURCES_HPP_

#include "loom/Diagnostic.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loom {

class SourceFile;

// A Location turned into something a person can read.
struct ResolvedLocation {
    std::string path;
    // Both one-based.
    int32_t lineNumber = 0;
    int32_t characterNumber = 0;
    // The exact text covered by the location, and the full text of the line it starts on.
    std::string text;
    std::string lineText;
};

struct ResolvedDiagnostic {
    std::string message;
    std::vector<ResolvedLocation> locations;

    // Formats as "path:line:column: message" followed by the source line and a caret marker under the text.
    std::string toString() const;
};

// The set of all source text known to a compilation, shared read-only by every project build. SourceIDs are indices
// into the set and remain valid for its lifetime. Adding sources is not thread safe and must be finished before any
// build starts.
class Sources {
public:
    Sources();
    ~Sources();

    SourceID add(std::unique_ptr<SourceFile> sourceFile);
    SourceID addSource(std::string path, std::string code);

    // Returns nullptr for unknown IDs.
    const SourceFile* source(SourceID sourceID) const;
    size_t size() const { return m_sources.size(); }

    // Returns an empty optional if the location doesn't refer to a known source or is out of range.
    std::optional<ResolvedLocation> resolve(const Location& location) const;

    // Resolves every location in |diagnostic|. Unresolvable locations are logged as defects and dropped.
    ResolvedDiagnostic resolve(const Diagnostic& diagnostic) const;
    std::vector<ResolvedDiagnostic> resolve(const Diagnostics& diagnostics) const;

private:
    std::vector<std::unique_ptr<SourceFile>> m_sources;
};

} // namespace loom

#endif // SRC_LOOM_SOURCES_HPP_
