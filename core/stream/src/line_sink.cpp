#include <linepipe/stream/line_sink.hpp>

#include <linepipe/common/debug.hpp>

namespace linepipe::stream {

using linepipe::common::Error;
using linepipe::common::ok;
namespace category = linepipe::common::debug::category;

// ============================================================================
// StreamLineSink
// ============================================================================

Result<void> StreamLineSink::write(std::string_view text) {
    out_.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out_) {
        return Result<void>(ErrorCode::WRITE_ERROR, "failed to write to output stream");
    }
    return ok();
}

Result<void> StreamLineSink::flush() {
    out_.flush();
    if (!out_) {
        return Result<void>(ErrorCode::WRITE_ERROR, "failed to flush output stream");
    }
    return ok();
}

// ============================================================================
// FileLineSink
// ============================================================================

FileLineSink::FileLineSink(std::string path, std::ofstream file)
    : path_(std::move(path)), file_(std::move(file)), writer_(file_) {}

Result<std::unique_ptr<FileLineSink>> FileLineSink::open(const std::string& path, Mode mode) {
    using ResultType = Result<std::unique_ptr<FileLineSink>>;

    auto flags = std::ios::out | std::ios::binary;
    flags |= (mode == Mode::APPEND) ? std::ios::app : std::ios::trunc;

    std::ofstream file(path, flags);
    if (!file.is_open()) {
        Error error(ErrorCode::FILE_OPEN_FAILED, "cannot open output file: " + path,
                    LINEPIPE_CURRENT_LOCATION);
        error.with_context("path", path);
        return ResultType(std::move(error));
    }

    LINEPIPE_LOG_DEBUG(category::STREAM,
                       "Opened output file " << path
                                             << (mode == Mode::APPEND ? " (append)" : ""));
    return ResultType(std::unique_ptr<FileLineSink>(new FileLineSink(path, std::move(file))));
}

}  // namespace linepipe::stream
