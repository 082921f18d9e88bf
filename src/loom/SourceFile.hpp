#ifndef SRC_LOOM_SOURCE_FILE_HPP_
#define SRC_LOOM_SOURCE_FILE_HPP_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace loom {

// Represents a file of source code, either read from disk or provided directly. The line table is built as soon as the
// code is available, so that a SourceFile can be shared read-only between threads.
class SourceFile {
public:
    SourceFile() = delete;
    explicit SourceFile(std::string path);
    SourceFile(std::string path, std::string code);
    ~SourceFile() = default;

    bool read();

    const std::string& path() const { return m_path; }
    size_t size() const { return m_code.size(); }
    std::string_view codeView() const { return std::string_view(m_code); }

    // Both are one-based. Offsets at a newline character belong to the line the newline terminates.
    int32_t getLineNumber(int32_t offset) const;
    int32_t getCharacterNumber(int32_t offset) const;

    // Text of the one-based |lineNumber| without its line terminator.
    std::string_view lineText(int32_t lineNumber) const;

private:
    void buildLineTable();

    std::string m_path;
    std::string m_code;
    // Byte offsets of the first character of each line.
    std::vector<int32_t> m_lineStarts;
};

} // namespace loom

#endif // SRC_LOOM_SOURCE_FILE_HPP_
