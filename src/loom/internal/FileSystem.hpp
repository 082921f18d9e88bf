#ifndef SRC_LOOM_INTERNAL_FILE_SYSTEM_HPP_
#define SRC_LOOM_INTERNAL_FILE_SYSTEM_HPP_

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace loom {

// Walks up from |startDirectory| looking for a file named |fileName|. Returns an empty path if none was found.
fs::path findFileUpwards(const fs::path& startDirectory, std::string_view fileName);

// Recursively collects all regular files under |directory| with |extension|, sorted so that scans are deterministic.
std::vector<fs::path> findFilesWithExtension(const fs::path& directory, std::string_view extension);

// Returns |path| relative to |base| using generic separators, or |path| unchanged if it isn't under |base|.
std::string relativePathString(const fs::path& path, const fs::path& base);

// Reads the whole file at |path| into |contents|. Logs and returns false on any failure.
bool readFileContents(const fs::path& path, std::string& contents);

// Replaces the file at |path| with |contents|, creating missing parent directories. Logs and returns false on any
// failure.
bool writeFileContents(const fs::path& path, std::string_view contents);

} // namespace loom

#endif // SRC_LOOM_INTERNAL_FILE_SYSTEM_HPP_
