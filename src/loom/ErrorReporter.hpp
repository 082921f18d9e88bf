#ifndef SRC_LOOM_ERROR_REPORTER_HPP_
#define SRC_LOOM_ERROR_REPORTER_HPP_

#include <string>
#include <vector>

namespace loom {

struct ResolvedDiagnostic;

// Collects user-facing errors found outside of a project build (configuration, file loading, parsing) and echoes them
// to the log. Not thread safe.
class ErrorReporter {
public:
    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log)
    explicit ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(const std::string& error);
    void addDiagnostic(const ResolvedDiagnostic& diagnostic);

    // Specific errors.

    // Fatal error, unable to locate a file under filePath.
    void addFileNotFoundError(const std::string& filePath);
    // Fatal error, failed to read file at filePath.
    void addFileReadError(const std::string& filePath);

    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.size() == 0; }
    const std::vector<std::string>& errors() const { return m_errors; }

private:
    bool m_suppress;
    std::vector<std::string> m_errors;
};

} // namespace loom

#endif // SRC_LOOM_ERROR_REPORTER_HPP_
