#pragma once

/**
 * @file line_source.hpp
 * @brief Line-oriented input sources
 *
 * A source yields lines one at a time, each including the '\n' terminator
 * it was read with. Only the final line of an input may lack a terminator.
 * Other bytes, including '\r', are delivered untouched.
 */

#include <linepipe/common/error.hpp>

#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace linepipe::stream {

using linepipe::common::ErrorCode;
using linepipe::common::Result;

/**
 * @brief Result of a read: a line, or std::nullopt at end of input
 */
using NextLine = Result<std::optional<std::string>>;

// ============================================================================
// SOURCE INTERFACE
// ============================================================================

class ILineSource {
public:
    virtual ~ILineSource() = default;

    /**
     * @brief Read the next line
     *
     * @return The line, std::nullopt once the input is exhausted, or READ_ERROR
     */
    virtual NextLine next() = 0;
};

// ============================================================================
// STREAM SOURCE
// ============================================================================

/**
 * @brief Reads lines from a caller-owned std::istream
 */
class StreamLineSource : public ILineSource {
public:
    explicit StreamLineSource(std::istream& in) noexcept : in_(in) {}

    NextLine next() override;

private:
    std::istream& in_;
};

// ============================================================================
// FILE SOURCE
// ============================================================================

/**
 * @brief Reads lines from a file it owns
 *
 * The file is closed when the source is destroyed.
 */
class FileLineSource final : public ILineSource {
public:
    /**
     * @brief Open a file for reading
     * @return The source, FILE_NOT_FOUND, or FILE_OPEN_FAILED
     */
    static Result<std::unique_ptr<FileLineSource>> open(const std::string& path);

    FileLineSource(const FileLineSource&)            = delete;
    FileLineSource& operator=(const FileLineSource&) = delete;

    NextLine next() override { return reader_.next(); }

    const std::string& path() const noexcept { return path_; }

private:
    FileLineSource(std::string path, std::ifstream file);

    std::string path_;
    std::ifstream file_;
    StreamLineSource reader_;
};

}  // namespace linepipe::stream
