#include <linepipe/stream/processor.hpp>

#include <linepipe/common/debug.hpp>

#include <charconv>
#include <exception>
#include <string>

namespace linepipe::stream {

using linepipe::common::Error;
using linepipe::transform::CallbackTransformer;
using linepipe::transform::ILineTransformer;
namespace category = linepipe::common::debug::category;

namespace {

constexpr std::string_view LINE_KEY = "line";

Error line_failure(uint64_t line, Error cause) {
    Error error(ErrorCode::LINE_FAILED, "processing failed on line " + std::to_string(line),
                LINEPIPE_CURRENT_LOCATION);
    error.with_context(LINE_KEY, std::to_string(line));
    error.with_cause(std::move(cause));
    return error;
}

constexpr const char* UNKNOWN_EXCEPTION = "unknown exception";

NextLine read_line(ILineSource& source) {
    try {
        return source.next();
    } catch (const std::exception& e) {
        return NextLine(ErrorCode::READ_ERROR, e.what());
    } catch (...) {
        return NextLine(ErrorCode::READ_ERROR, UNKNOWN_EXCEPTION);
    }
}

Result<std::string> apply_transform(const ILineTransformer& transformer, std::string_view line) {
    try {
        return transformer.transform(line);
    } catch (const std::exception& e) {
        return Result<std::string>(ErrorCode::TRANSFORM_FAILED, e.what());
    } catch (...) {
        return Result<std::string>(ErrorCode::TRANSFORM_FAILED, UNKNOWN_EXCEPTION);
    }
}

Result<void> write_line(ILineSink& sink, std::string_view text) {
    try {
        return sink.write(text);
    } catch (const std::exception& e) {
        return Result<void>(ErrorCode::WRITE_ERROR, e.what());
    } catch (...) {
        return Result<void>(ErrorCode::WRITE_ERROR, UNKNOWN_EXCEPTION);
    }
}

}  // anonymous namespace

// ============================================================================
// process
// ============================================================================

Result<uint64_t> process(ILineSource& source, const ILineTransformer* transformer,
                         ILineSink& sink) {
    if (transformer == nullptr || !transformer->is_invocable()) {
        LINEPIPE_LOG_ERROR(category::STREAM, "Transformation is not invocable");
        return Result<uint64_t>(ErrorCode::TRANSFORM_NOT_INVOCABLE,
                                "transformation must be invocable");
    }

    LINEPIPE_SPAN_CAT(span, "process", category::STREAM);
    span.add_context("transform", transformer->name());

    uint64_t count = 0;
    for (;;) {
        const uint64_t line_no = count + 1;

        auto next = read_line(source);
        if (!next) {
            span.set_error(ErrorCode::LINE_FAILED, next.message());
            return line_failure(line_no, next.error());
        }
        if (!next.value()) {
            break;
        }

        auto output = apply_transform(*transformer, *next.value());
        if (!output) {
            LINEPIPE_LOG_DEBUG(category::STREAM,
                               "Line " << line_no << " rejected: " << output.message());
            span.set_error(ErrorCode::LINE_FAILED, output.message());
            return line_failure(line_no, output.error());
        }

        auto written = write_line(sink, output.value());
        if (!written) {
            span.set_error(ErrorCode::LINE_FAILED, written.message());
            return line_failure(line_no, written.error());
        }

        count = line_no;
        LINEPIPE_LOG_TRACE(category::STREAM, "Line " << line_no << " written");
    }

    auto flushed = sink.flush();
    if (!flushed) {
        Error error(ErrorCode::WRITE_ERROR,
                    "failed to flush output after " + std::to_string(count) + " lines",
                    LINEPIPE_CURRENT_LOCATION);
        error.with_cause(flushed.error());
        span.set_error(ErrorCode::WRITE_ERROR, flushed.message());
        return error;
    }

    span.add_context("lines", count);
    return count;
}

Result<uint64_t> process(ILineSource& source, LineFunction fn, ILineSink& sink) {
    CallbackTransformer transformer(std::move(fn));
    return process(source, &transformer, sink);
}

// ============================================================================
// failed_line
// ============================================================================

std::optional<uint64_t> failed_line(const common::Error& error) noexcept {
    if (error.code() != ErrorCode::LINE_FAILED) {
        return std::nullopt;
    }

    auto value = error.context(LINE_KEY);
    if (!value) {
        return std::nullopt;
    }

    uint64_t line = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), line);
    if (ec != std::errc() || ptr != value->data() + value->size()) {
        return std::nullopt;
    }
    return line;
}

}  // namespace linepipe::stream
