#pragma once

/**
 * @file builtin.hpp
 * @brief Built-in line transformers
 *
 * Supported:
 * - upper:     ASCII uppercase, terminator preserved
 * - lower:     ASCII lowercase, terminator preserved
 * - strip:     trim surrounding whitespace, terminate with exactly one '\n'
 * - redact_ip: replace IPv4-shaped substrings with [REDACTED_IP]
 *
 * Case mapping works byte by byte in the "C" locale. Bytes outside ASCII,
 * including UTF-8 sequences, pass through unchanged.
 */

#include "line_transformer.hpp"

#include <regex>

namespace linepipe::transform {

// ============================================================================
// CASE MAPPING
// ============================================================================

class UpperTransformer final : public ILineTransformer {
public:
    Result<std::string> transform(std::string_view line) const override;

    TransformerId id() const noexcept override { return TransformerId::UPPER; }

    std::string description() const override {
        return "convert every character to uppercase";
    }
};

class LowerTransformer final : public ILineTransformer {
public:
    Result<std::string> transform(std::string_view line) const override;

    TransformerId id() const noexcept override { return TransformerId::LOWER; }

    std::string description() const override {
        return "convert every character to lowercase";
    }
};

// ============================================================================
// WHITESPACE
// ============================================================================

/**
 * @brief Trims leading and trailing whitespace, then appends one '\n'
 *
 * The terminator counts as trailing whitespace, so the output always ends
 * in exactly one newline and strip is idempotent. A blank line yields "\n".
 */
class StripTransformer final : public ILineTransformer {
public:
    static constexpr std::string_view WHITESPACE = " \t\n\r\v\f";

    Result<std::string> transform(std::string_view line) const override;

    TransformerId id() const noexcept override { return TransformerId::STRIP; }

    std::string description() const override {
        return "trim surrounding whitespace and end the line with a single newline";
    }
};

// ============================================================================
// REDACTION
// ============================================================================

/**
 * @brief Replaces IPv4-shaped tokens with a fixed marker
 *
 * Matches four dot-separated groups of 1-3 decimal digits bounded by word
 * boundaries. Octet ranges are not validated: "999.999.999.999" is redacted.
 * Shorter runs such as "10.0.0" are left untouched.
 */
class RedactIpTransformer final : public ILineTransformer {
public:
    static constexpr std::string_view TOKEN = "[REDACTED_IP]";
    static constexpr const char* PATTERN   = R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)";

    RedactIpTransformer();

    Result<std::string> transform(std::string_view line) const override;

    TransformerId id() const noexcept override { return TransformerId::REDACT_IP; }

    std::string description() const override {
        return "replace IPv4-like addresses with " + std::string(TOKEN);
    }

private:
    std::regex pattern_;
};

}  // namespace linepipe::transform
