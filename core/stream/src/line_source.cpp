#include <linepipe/stream/line_source.hpp>

#include <linepipe/common/debug.hpp>

#include <filesystem>
#include <system_error>

namespace linepipe::stream {

using linepipe::common::Error;
namespace category = linepipe::common::debug::category;

// ============================================================================
// StreamLineSource
// ============================================================================

NextLine StreamLineSource::next() {
    std::string line;
    if (!std::getline(in_, line)) {
        if (in_.bad()) {
            return NextLine(ErrorCode::READ_ERROR, "failed to read from input stream");
        }
        return NextLine(std::optional<std::string>{});
    }

    // getline sets eof only when the last line had no terminator
    if (!in_.eof()) {
        line.push_back('\n');
    }

    return NextLine(std::optional<std::string>(std::move(line)));
}

// ============================================================================
// FileLineSource
// ============================================================================

FileLineSource::FileLineSource(std::string path, std::ifstream file)
    : path_(std::move(path)), file_(std::move(file)), reader_(file_) {}

Result<std::unique_ptr<FileLineSource>> FileLineSource::open(const std::string& path) {
    using ResultType = Result<std::unique_ptr<FileLineSource>>;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        Error error(ErrorCode::FILE_NOT_FOUND, "input file not found: " + path,
                    LINEPIPE_CURRENT_LOCATION);
        error.with_context("path", path);
        return ResultType(std::move(error));
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        Error error(ErrorCode::FILE_OPEN_FAILED, "cannot open input file: " + path,
                    LINEPIPE_CURRENT_LOCATION);
        error.with_context("path", path);
        return ResultType(std::move(error));
    }

    LINEPIPE_LOG_DEBUG(category::STREAM, "Opened input file " << path);
    return ResultType(std::unique_ptr<FileLineSource>(new FileLineSource(path, std::move(file))));
}

}  // namespace linepipe::stream
