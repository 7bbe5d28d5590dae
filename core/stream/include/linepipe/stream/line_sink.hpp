#pragma once

/**
 * @file line_sink.hpp
 * @brief Line-oriented output sinks
 *
 * write() appends text verbatim; no separator or terminator is added.
 * flush() hands buffered data to the underlying medium.
 */

#include <linepipe/common/error.hpp>

#include <cstdint>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace linepipe::stream {

using linepipe::common::ErrorCode;
using linepipe::common::Result;

// ============================================================================
// SINK INTERFACE
// ============================================================================

class ILineSink {
public:
    virtual ~ILineSink() = default;

    /**
     * @brief Append text to the output
     * @return Success or WRITE_ERROR
     */
    virtual Result<void> write(std::string_view text) = 0;

    /**
     * @brief Flush buffered output
     * @return Success or WRITE_ERROR
     */
    virtual Result<void> flush() = 0;
};

// ============================================================================
// STREAM SINK
// ============================================================================

/**
 * @brief Writes to a caller-owned std::ostream
 */
class StreamLineSink : public ILineSink {
public:
    explicit StreamLineSink(std::ostream& out) noexcept : out_(out) {}

    Result<void> write(std::string_view text) override;
    Result<void> flush() override;

private:
    std::ostream& out_;
};

// ============================================================================
// FILE SINK
// ============================================================================

/**
 * @brief Writes to a file it owns
 */
class FileLineSink final : public ILineSink {
public:
    enum class Mode : uint8_t {
        TRUNCATE,
        APPEND
    };

    /**
     * @brief Open a file for writing, creating it if needed
     * @return The sink, or FILE_OPEN_FAILED
     */
    static Result<std::unique_ptr<FileLineSink>> open(const std::string& path,
                                                      Mode mode = Mode::TRUNCATE);

    FileLineSink(const FileLineSink&)            = delete;
    FileLineSink& operator=(const FileLineSink&) = delete;

    Result<void> write(std::string_view text) override { return writer_.write(text); }
    Result<void> flush() override { return writer_.flush(); }

    const std::string& path() const noexcept { return path_; }

private:
    FileLineSink(std::string path, std::ofstream file);

    std::string path_;
    std::ofstream file_;
    StreamLineSink writer_;
};

}  // namespace linepipe::stream
