#pragma once

/**
 * @file line_transformer.hpp
 * @brief Line transformation interface for linepipe
 *
 * A line transformer maps one input line to one output line, or fails.
 * Transformers are immutable after construction and carry no per-call
 * state, so a single instance may be shared by any number of readers.
 *
 * @code
 * UpperTransformer upper;
 * auto out = upper.transform("hello\n");   // "HELLO\n"
 * @endcode
 */

#include <linepipe/common/error.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace linepipe::transform {

using linepipe::common::ErrorCode;
using linepipe::common::Result;

// ============================================================================
// TRANSFORMER IDENTIFIERS
// ============================================================================

/**
 * @brief Built-in transformer identifiers
 */
enum class TransformerId : uint16_t {
    NONE      = 0x0000,
    UPPER     = 0x0001,
    LOWER     = 0x0002,
    STRIP     = 0x0003,
    REDACT_IP = 0x0004,
    CHAIN     = 0x0100,
    CUSTOM    = 0xFF00
};

/**
 * @brief Get selector name for a transformer ID
 */
constexpr std::string_view transformer_name(TransformerId id) noexcept {
    switch (id) {
        case TransformerId::NONE:      return "none";
        case TransformerId::UPPER:     return "upper";
        case TransformerId::LOWER:     return "lower";
        case TransformerId::STRIP:     return "strip";
        case TransformerId::REDACT_IP: return "redact_ip";
        case TransformerId::CHAIN:     return "chain";
        default:                       return "custom";
    }
}

// ============================================================================
// TRANSFORMER INTERFACE
// ============================================================================

/**
 * @brief Abstract base class for line transformers
 *
 * Thread Safety:
 * - transform() must be safe to call concurrently
 * - Configuration is immutable after construction
 */
class ILineTransformer {
public:
    virtual ~ILineTransformer() = default;

    /**
     * @brief Transform a single line
     *
     * @param line Input line, including any terminator the source kept
     * @return Output line or error
     */
    virtual Result<std::string> transform(std::string_view line) const = 0;

    /**
     * @brief Get transformer identifier
     */
    virtual TransformerId id() const noexcept = 0;

    /**
     * @brief Get selector name
     */
    virtual std::string_view name() const noexcept { return transformer_name(id()); }

    /**
     * @brief One-line human readable description, used for help output
     */
    virtual std::string description() const { return std::string(name()); }

    /**
     * @brief Check whether transform() can actually be called
     *
     * Wrappers around a user callable report false when the callable is empty.
     */
    virtual bool is_invocable() const noexcept { return true; }
};

// ============================================================================
// CALLBACK TRANSFORMER
// ============================================================================

/**
 * @brief Adapts an arbitrary callable to ILineTransformer
 */
class CallbackTransformer final : public ILineTransformer {
public:
    using Function = std::function<Result<std::string>(std::string_view)>;

    explicit CallbackTransformer(Function fn, std::string name = "custom")
        : fn_(std::move(fn)), name_(std::move(name)) {}

    Result<std::string> transform(std::string_view line) const override {
        if (!fn_) {
            return Result<std::string>(ErrorCode::TRANSFORM_NOT_INVOCABLE,
                                       "transformation is not callable");
        }
        return fn_(line);
    }

    TransformerId id() const noexcept override { return TransformerId::CUSTOM; }

    std::string_view name() const noexcept override { return name_; }

    bool is_invocable() const noexcept override { return static_cast<bool>(fn_); }

private:
    Function fn_;
    std::string name_;
};

}  // namespace linepipe::transform
