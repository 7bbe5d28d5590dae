#pragma once

/**
 * @file error.hpp
 * @brief Error handling system for linepipe
 *
 * This header provides:
 * - Hierarchical error codes organized by category
 * - Rich error context with source location and key/value fields
 * - Error wrapping with a linked cause chain
 * - Result<T> for value-or-error returns
 */

#include "platform.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(LINEPIPE_HAS_SOURCE_LOCATION)
    #include <source_location>
#endif

namespace linepipe::common {

// ============================================================================
// ERROR CATEGORY SYSTEM
// ============================================================================

/**
 * @brief Error categories for hierarchical classification
 *
 * Categories are grouped by functional area:
 * - 0x00xx: General/Common errors
 * - 0x01xx: I/O errors (sources, sinks, files)
 * - 0x02xx: Configuration errors (selectors, config files)
 * - 0x03xx: Transformation errors
 * - 0x04xx: Stream processing errors
 * - 0x05xx: Serialization errors
 * - 0x06xx: Validation errors
 * - 0x07xx: Platform-specific errors
 */
enum class ErrorCategory : uint8_t {
    GENERAL       = 0x00,
    IO            = 0x01,
    CONFIG        = 0x02,
    TRANSFORM     = 0x03,
    PROCESSING    = 0x04,
    SERIALIZATION = 0x05,
    VALIDATION    = 0x06,
    PLATFORM      = 0x07,
};

/**
 * @brief Get category name as string
 */
constexpr std::string_view category_name(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::GENERAL:       return "General";
        case ErrorCategory::IO:            return "I/O";
        case ErrorCategory::CONFIG:        return "Configuration";
        case ErrorCategory::TRANSFORM:     return "Transform";
        case ErrorCategory::PROCESSING:    return "Processing";
        case ErrorCategory::SERIALIZATION: return "Serialization";
        case ErrorCategory::VALIDATION:    return "Validation";
        case ErrorCategory::PLATFORM:      return "Platform";
        default:                           return "Unknown";
    }
}

// ============================================================================
// ERROR CODE DEFINITIONS
// ============================================================================

/**
 * @brief Error codes
 *
 * Format: 0xCCEE where CC = category, EE = specific error
 */
enum class ErrorCode : uint32_t {
    // ========== General (0x00xx) ==========
    SUCCESS             = 0x0000,
    UNKNOWN_ERROR       = 0x0001,
    INVALID_ARGUMENT    = 0x0002,
    ALREADY_EXISTS      = 0x0003,

    // ========== I/O (0x01xx) ==========
    READ_ERROR          = 0x0100,
    WRITE_ERROR         = 0x0101,
    BROKEN_PIPE         = 0x0102,
    FILE_NOT_FOUND      = 0x0103,
    FILE_OPEN_FAILED    = 0x0104,

    // ========== Configuration (0x02xx) ==========
    CONFIG_INVALID          = 0x0200,
    CONFIG_MISSING          = 0x0201,
    CONFIG_PARSE_ERROR      = 0x0202,
    CONFIG_TYPE_MISMATCH    = 0x0203,
    CONFIG_FILE_NOT_FOUND   = 0x0204,
    CONFIG_INVALID_VALUE    = 0x0205,
    UNKNOWN_SELECTOR        = 0x0206,
    TRANSFORM_NOT_INVOCABLE = 0x0207,

    // ========== Transform (0x03xx) ==========
    TRANSFORM_FAILED    = 0x0300,
    MALFORMED_LINE      = 0x0301,
    STAGE_FAILED        = 0x0302,

    // ========== Processing (0x04xx) ==========
    LINE_FAILED         = 0x0400,

    // ========== Serialization (0x05xx) ==========
    SERIALIZE_FAILED    = 0x0500,
    FORMAT_UNSUPPORTED  = 0x0501,

    // ========== Validation (0x06xx) ==========
    VALUE_OUT_OF_RANGE  = 0x0600,
    EMPTY_VALUE         = 0x0601,
    NULL_POINTER        = 0x0602,

    // ========== Platform (0x07xx) ==========
    SYSCALL_FAILED      = 0x0700,
};

/**
 * @brief Extract category from error code
 */
constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

/**
 * @brief Check if error code is success
 */
constexpr bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS;
}

/**
 * @brief Get human-readable error name
 */
constexpr std::string_view error_name(ErrorCode code) noexcept {
    switch (code) {
        // General
        case ErrorCode::SUCCESS:              return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR:        return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
        case ErrorCode::ALREADY_EXISTS:       return "ALREADY_EXISTS";

        // I/O
        case ErrorCode::READ_ERROR:           return "READ_ERROR";
        case ErrorCode::WRITE_ERROR:          return "WRITE_ERROR";
        case ErrorCode::BROKEN_PIPE:          return "BROKEN_PIPE";
        case ErrorCode::FILE_NOT_FOUND:       return "FILE_NOT_FOUND";
        case ErrorCode::FILE_OPEN_FAILED:     return "FILE_OPEN_FAILED";

        // Configuration
        case ErrorCode::CONFIG_INVALID:          return "CONFIG_INVALID";
        case ErrorCode::CONFIG_MISSING:          return "CONFIG_MISSING";
        case ErrorCode::CONFIG_PARSE_ERROR:      return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_TYPE_MISMATCH:    return "CONFIG_TYPE_MISMATCH";
        case ErrorCode::CONFIG_FILE_NOT_FOUND:   return "CONFIG_FILE_NOT_FOUND";
        case ErrorCode::CONFIG_INVALID_VALUE:    return "CONFIG_INVALID_VALUE";
        case ErrorCode::UNKNOWN_SELECTOR:        return "UNKNOWN_SELECTOR";
        case ErrorCode::TRANSFORM_NOT_INVOCABLE: return "TRANSFORM_NOT_INVOCABLE";

        // Transform
        case ErrorCode::TRANSFORM_FAILED:     return "TRANSFORM_FAILED";
        case ErrorCode::MALFORMED_LINE:       return "MALFORMED_LINE";
        case ErrorCode::STAGE_FAILED:         return "STAGE_FAILED";

        // Processing
        case ErrorCode::LINE_FAILED:          return "LINE_FAILED";

        // Serialization
        case ErrorCode::SERIALIZE_FAILED:     return "SERIALIZE_FAILED";
        case ErrorCode::FORMAT_UNSUPPORTED:   return "FORMAT_UNSUPPORTED";

        // Validation
        case ErrorCode::VALUE_OUT_OF_RANGE:   return "VALUE_OUT_OF_RANGE";
        case ErrorCode::EMPTY_VALUE:          return "EMPTY_VALUE";
        case ErrorCode::NULL_POINTER:         return "NULL_POINTER";

        // Platform
        case ErrorCode::SYSCALL_FAILED:       return "SYSCALL_FAILED";

        default:                              return "UNKNOWN";
    }
}

// ============================================================================
// SOURCE LOCATION
// ============================================================================

/**
 * @brief Source location information for error tracking
 */
struct SourceLocation {
    const char* file = "";
    const char* function = "";
    uint32_t line = 0;
    uint32_t column = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_,
                             uint32_t line_, uint32_t col_ = 0) noexcept
        : file(file_), function(func_), line(line_), column(col_) {}

#if defined(LINEPIPE_HAS_SOURCE_LOCATION)
    constexpr SourceLocation(const std::source_location& loc) noexcept
        : file(loc.file_name())
        , function(loc.function_name())
        , line(loc.line())
        , column(loc.column()) {}

    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc);
    }
#else
    static constexpr SourceLocation current() noexcept {
        return SourceLocation();
    }
#endif

    constexpr bool is_valid() const noexcept {
        return line > 0 && file[0] != '\0';
    }
};

#if defined(LINEPIPE_HAS_SOURCE_LOCATION)
    #define LINEPIPE_CURRENT_LOCATION ::linepipe::common::SourceLocation::current()
#else
    #define LINEPIPE_CURRENT_LOCATION \
        ::linepipe::common::SourceLocation(__FILE__, __func__, __LINE__)
#endif

// ============================================================================
// ERROR CONTEXT
// ============================================================================

/**
 * @brief Rich error information with context and cause chain
 *
 * Wrapping keeps the original failure intact so callers can walk from the
 * outermost context down to the root cause. Causes are immutable and shared
 * between copies.
 */
class Error {
public:
    Error() noexcept = default;

    Error(ErrorCode code) noexcept
        : code_(code) {}

    Error(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    Error(ErrorCode code, std::string_view message, SourceLocation loc)
        : code_(code), message_(message), location_(loc) {}

    // Accessors
    constexpr ErrorCode code() const noexcept { return code_; }
    constexpr ErrorCategory category() const noexcept { return get_category(code_); }
    const std::string& message() const noexcept { return message_; }
    constexpr const SourceLocation& location() const noexcept { return location_; }

    // Status checks
    constexpr bool is_success() const noexcept { return linepipe::common::is_success(code_); }
    constexpr bool is_error() const noexcept { return !is_success(); }

    constexpr explicit operator bool() const noexcept { return is_success(); }

    // Get formatted error string, including the full cause chain
    std::string to_string() const;

    // Messages of this error and its causes joined with ": ", no codes or locations
    std::string full_message() const;

    // Chain errors (for error wrapping)
    Error& with_cause(Error cause) {
        cause_ = std::make_shared<const Error>(std::move(cause));
        return *this;
    }

    const Error* cause() const noexcept { return cause_.get(); }

    // Innermost error of the cause chain (this error when there is no cause)
    const Error& root_cause() const noexcept;

    // Context addition
    Error& with_context(std::string_view key, std::string_view value);

    // Context lookup, first match wins
    std::optional<std::string_view> context(std::string_view key) const noexcept;

private:
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    SourceLocation location_;
    std::shared_ptr<const Error> cause_;
    std::vector<std::pair<std::string, std::string>> context_;
};

// ============================================================================
// RESULT TYPE
// ============================================================================

/**
 * @brief Value-or-error return type
 */
template<typename T = void>
class Result;

// Specialization for void
template<>
class Result<void> {
public:
    // Success
    Result() noexcept = default;

    // Error from code
    Result(ErrorCode code) noexcept : error_(code) {}

    // Error with message
    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = LINEPIPE_CURRENT_LOCATION)
        : error_(code, message, loc) {}

    // Error from Error object
    Result(Error error) noexcept : error_(std::move(error)) {}

    // Status
    bool is_success() const noexcept { return error_.is_success(); }
    bool is_error() const noexcept { return error_.is_error(); }
    explicit operator bool() const noexcept { return is_success(); }

    // Error access
    ErrorCode code() const noexcept { return error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

private:
    Error error_;
};

// Specialization for non-void types
template<typename T>
class Result {
public:
    // Success with value
    Result(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : value_(std::move(value)) {}

    // Error from code
    Result(ErrorCode code) noexcept : error_(code) {}

    // Error with message
    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = LINEPIPE_CURRENT_LOCATION)
        : error_(code, message, loc) {}

    // Error from Error object
    Result(Error error) noexcept : error_(std::move(error)) {}

    // Status
    bool is_success() const noexcept { return value_.has_value(); }
    bool is_error() const noexcept { return !value_.has_value(); }
    explicit operator bool() const noexcept { return is_success(); }

    // Value access (only call if is_success())
    T& value() & noexcept { return *value_; }
    const T& value() const& noexcept { return *value_; }
    T&& value() && noexcept { return std::move(*value_); }

    T value_or(T default_value) const& {
        return value_ ? *value_ : std::move(default_value);
    }

    // Error access
    ErrorCode code() const noexcept { return value_ ? ErrorCode::SUCCESS : error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

private:
    std::optional<T> value_;
    Error error_;
};

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Create a success Result<void>
 */
inline Result<void> ok() {
    return Result<void>();
}

// ============================================================================
// ERROR PROPAGATION MACROS
// ============================================================================

/**
 * @brief Return early if result is error
 *
 * Usage: LINEPIPE_TRY(some_function_returning_result_void());
 */
#define LINEPIPE_TRY(expr)                                          \
    do {                                                            \
        auto _lp_result = (expr);                                   \
        if (LINEPIPE_UNLIKELY(_lp_result.is_error())) {             \
            return ::linepipe::common::Error(_lp_result.error());   \
        }                                                           \
    } while (0)

/**
 * @brief Assign value or return error
 *
 * Usage: LINEPIPE_TRY_ASSIGN(var, some_function_returning_result());
 */
#define LINEPIPE_TRY_ASSIGN(var, expr)                              \
    auto _lp_try_##var = (expr);                                    \
    if (LINEPIPE_UNLIKELY(_lp_try_##var.is_error())) {              \
        return ::linepipe::common::Error(_lp_try_##var.error());    \
    }                                                               \
    var = std::move(_lp_try_##var).value()

}  // namespace linepipe::common
