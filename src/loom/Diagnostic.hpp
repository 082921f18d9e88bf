#ifndef SRC_LOOM_DIAGNOSTIC_HPP_
#define SRC_LOOM_DIAGNOSTIC_HPP_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace loom {

using SourceID = int32_t;
static constexpr SourceID kInvalidSourceID = -1;

// An abstract reference into a source unit: a half-open byte range [start, end) inside the source identified by
// |sourceID|. Stages carry these around without knowing anything about the source text; only Sources can turn them into
// file, line and column information.
struct Location {
    Location() = default;
    Location(SourceID id, int32_t s, int32_t e): sourceID(id), start(s), end(e) {}
    ~Location() = default;

    bool isValid() const { return sourceID != kInvalidSourceID && start >= 0 && end >= start; }
    int32_t length() const { return end - start; }

    // Returns a location covering both this and |other|, which must be in the same source.
    Location merge(const Location& other) const {
        if (!isValid()) { return other; }
        if (!other.isValid()) { return *this; }
        return Location(sourceID, start < other.start ? start : other.start, end > other.end ? end : other.end);
    }

    bool operator==(const Location& other) const {
        return sourceID == other.sourceID && start == other.start && end == other.end;
    }
    bool operator!=(const Location& other) const { return !(*this == other); }

    SourceID sourceID = kInvalidSourceID;
    int32_t start = 0;
    int32_t end = 0;
};

// A single problem found by a compilation stage. The first location is the primary one, any others are related
// locations (the other half of a duplicate definition, for instance).
struct Diagnostic {
    Diagnostic() = default;
    Diagnostic(std::string m, Location location): message(std::move(m)), locations({location}) {}
    Diagnostic(std::string m, std::vector<Location> l): message(std::move(m)), locations(std::move(l)) {}
    ~Diagnostic() = default;

    std::string message;
    std::vector<Location> locations;
};

using Diagnostics = std::vector<Diagnostic>;

} // namespace loom

#endif // SRC_LOOM_DIAGNOSTIC_HPP_
