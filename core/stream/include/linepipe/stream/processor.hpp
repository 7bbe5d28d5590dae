#pragma once

/**
 * @file processor.hpp
 * @brief Line stream processor
 *
 * Drives a source through a transformer into a sink:
 *
 *   for each line k = 1, 2, ...:  sink.write(transform(line_k))
 *   sink.flush()
 *
 * Guarantees:
 * - Lines are written in input order, one write per line
 * - The first failure stops processing. Nothing further is read or written
 *   and the sink is not flushed. Writes already made stay in the sink.
 * - The sink is flushed exactly once, after the input is exhausted
 * - The returned count equals the number of sink writes
 *
 * Failures are reported as LINE_FAILED. The message names the 1-based line,
 * the context key "line" holds its number and the cause is the underlying
 * error (transformation, read or write). A transformer that cannot be
 * invoked fails with TRANSFORM_NOT_INVOCABLE before the source is touched.
 * A failed final flush is WRITE_ERROR with no line attached.
 */

#include "line_sink.hpp"
#include "line_source.hpp"

#include <linepipe/transform/line_transformer.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace linepipe::stream {

/**
 * @brief Plain callable form of a transformation
 */
using LineFunction = std::function<Result<std::string>(std::string_view)>;

/**
 * @brief Process every line of @p source into @p sink
 *
 * The caller keeps ownership of all three arguments. Exceptions thrown by
 * the source, the transformer or the sink are caught and reported as
 * READ_ERROR, TRANSFORM_FAILED or WRITE_ERROR causes of the line in progress.
 *
 * @return Number of lines processed
 */
Result<uint64_t> process(ILineSource& source, const transform::ILineTransformer* transformer,
                         ILineSink& sink);

/**
 * @brief Overload taking a reference
 */
inline Result<uint64_t> process(ILineSource& source,
                                const transform::ILineTransformer& transformer,
                                ILineSink& sink) {
    return process(source, &transformer, sink);
}

/**
 * @brief Overload taking a plain callable
 *
 * An empty std::function is rejected with TRANSFORM_NOT_INVOCABLE.
 */
Result<uint64_t> process(ILineSource& source, LineFunction fn, ILineSink& sink);

/**
 * @brief Extract the failing line number from a process() error
 *
 * @return The 1-based line, or std::nullopt if @p error carries none
 */
std::optional<uint64_t> failed_line(const common::Error& error) noexcept;

}  // namespace linepipe::stream
