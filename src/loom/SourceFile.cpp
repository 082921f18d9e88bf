#include "loom/SourceFile.hpp"

#include "loom/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace loom {

SourceFile::SourceFile(std::string path): m_path(std::move(path)) { buildLineTable(); }

SourceFile::SourceFile(std::string path, std::string code): m_path(std::move(path)), m_code(std::move(code)) {
    buildLineTable();
}

bool SourceFile::read() {
    if (!readFileContents(fs::path(m_path), m_code)) {
        return false;
    }
    buildLineTable();
    return true;
}

int32_t SourceFile::getLineNumber(int32_t offset) const {
    // Binary search for the last line starting at or before offset.
    auto iter = std::upper_bound(m_lineStarts.begin(), m_lineStarts.end(), offset);
    if (iter == m_lineStarts.begin()) {
        return 1;
    }
    return static_cast<int32_t>(iter - m_lineStarts.begin());
}

int32_t SourceFile::getCharacterNumber(int32_t offset) const {
    auto lineNumber = getLineNumber(offset);
    return offset - m_lineStarts[lineNumber - 1] + 1;
}

std::string_view SourceFile::lineText(int32_t lineNumber) const {
    if (lineNumber < 1 || lineNumber > static_cast<int32_t>(m_lineStarts.size())) {
        return std::string_view();
    }
    size_t start = m_lineStarts[lineNumber - 1];
    size_t end = m_code.find('\n', start);
    if (end == std::string::npos) {
        end = m_code.size();
    }
    auto line = std::string_view(m_code).substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

void SourceFile::buildLineTable() {
    m_lineStarts.clear();
    m_lineStarts.emplace_back(0);
    for (size_t i = 0; i < m_code.size(); ++i) {
        if (m_code[i] == '\n') {
            m_lineStarts.emplace_back(static_cast<int32_t>(i + 1));
        }
    }
}

} // namespace loom
