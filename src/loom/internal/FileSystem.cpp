#include "loom/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace loom {

fs::path findFileUpwards(const fs::path& startDirectory, std::string_view fileName) {
    std::error_code ec;
    auto directory = fs::absolute(startDirectory, ec);
    if (ec) {
        SPDLOG_ERROR("Unable to make path '{}' absolute: {}", startDirectory.string(), ec.message());
        return fs::path();
    }

    while (true) {
        auto candidate = directory / fs::path(fileName);
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
        if (!directory.has_parent_path() || directory.parent_path() == directory) {
            break;
        }
        directory = directory.parent_path();
    }

    return fs::path();
}

std::vector<fs::path> findFilesWithExtension(const fs::path& directory, std::string_view extension) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        SPDLOG_WARN("Document directory '{}' does not exist", directory.string());
        return files;
    }

    for (auto iter = fs::recursive_directory_iterator(directory, ec); !ec && iter != fs::recursive_directory_iterator();
            iter.increment(ec)) {
        const auto& path = iter->path();
        if (!iter->is_regular_file(ec) || path.extension() != extension) {
            continue;
        }
        // Never scan our own output.
        bool inGenerated = false;
        for (const auto& part : path) {
            if (part == "__generated__") {
                inGenerated = true;
                break;
            }
        }
        if (!inGenerated) {
            files.emplace_back(path);
        }
    }
    if (ec) {
        SPDLOG_ERROR("Error scanning directory '{}': {}", directory.string(), ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string relativePathString(const fs::path& path, const fs::path& base) {
    std::error_code ec;
    auto relative = fs::relative(path, base, ec);
    if (ec || relative.empty() || *relative.begin() == "..") {
        return path.generic_string();
    }
    return relative.generic_string();
}

bool readFileContents(const fs::path& path, std::string& contents) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        SPDLOG_ERROR("File: '{}' not found", path.string());
        return false;
    }

    auto fileSize = fs::file_size(path, ec);
    if (ec) {
        SPDLOG_ERROR("File: '{}' size error: {}", path.string(), ec.message());
        return false;
    }

    std::ifstream inFile(path, std::ifstream::binary);
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' open error", path.string());
        return false;
    }

    contents.resize(fileSize);
    inFile.read(contents.data(), static_cast<std::streamsize>(fileSize));
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' read error", path.string());
        return false;
    }

    return true;
}

bool writeFileContents(const fs::path& path, std::string_view contents) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            SPDLOG_ERROR("Unable to create directory '{}': {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream outFile(path, std::ofstream::binary | std::ofstream::trunc);
    if (!outFile) {
        SPDLOG_ERROR("File: '{}' open for writing error", path.string());
        return false;
    }

    outFile.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    outFile.close();
    if (!outFile) {
        SPDLOG_ERROR("File: '{}' write error", path.string());
        return false;
    }

    return true;
}

} // namespace loom
