#pragma once

/**
 * @file transform_registry.hpp
 * @brief Name to transformer mapping
 *
 * The registry is a closed, immutable set of named transformers. It is
 * built once and never modified, so concurrent readers need no locking.
 * Lookups never invoke a transformation.
 *
 * @code
 * const auto& reg = TransformRegistry::builtin();
 * auto t = reg.lookup("redact_ip");
 * if (!t) {
 *     std::cerr << t.error().to_string() << '\n';
 * }
 * @endcode
 */

#include "line_transformer.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace linepipe::transform {

class TransformRegistry {
public:
    using Entry = std::shared_ptr<const ILineTransformer>;

    /**
     * @brief Build a registry from an explicit list of transformers
     *
     * Entries are keyed by ILineTransformer::name().
     *
     * @return The registry, or NULL_POINTER for a null entry, INVALID_ARGUMENT
     *         for an empty name, ALREADY_EXISTS for a duplicate name
     */
    static Result<TransformRegistry> create(std::vector<Entry> entries);

    /**
     * @brief Process-wide registry holding upper, lower, strip and redact_ip
     */
    static const TransformRegistry& builtin();

    TransformRegistry(TransformRegistry&&) = default;
    TransformRegistry& operator=(TransformRegistry&&) = default;
    TransformRegistry(const TransformRegistry&) = delete;
    TransformRegistry& operator=(const TransformRegistry&) = delete;

    // ========== Lookup ==========

    /**
     * @brief Find a transformer by selector name
     * @return The transformer, or UNKNOWN_SELECTOR
     */
    Result<Entry> lookup(std::string_view name) const;

    bool contains(std::string_view name) const noexcept;

    /**
     * @brief All selector names in ascending order
     */
    std::vector<std::string> names() const;

    /**
     * @brief Help text for a selector
     */
    Result<std::string> describe(std::string_view name) const;

    /**
     * @brief Resolve an ordered selector list to a single transformer
     *
     * One selector resolves to the registry entry itself. Several resolve to
     * a TransformChain applying them in order. Every name is validated
     * before anything is built.
     *
     * @return The transformer, INVALID_ARGUMENT for an empty list, or
     *         UNKNOWN_SELECTOR naming the first unknown selector
     */
    Result<Entry> resolve(const std::vector<std::string>& selectors) const;

    size_t size() const noexcept { return entries_.size(); }

private:
    TransformRegistry() = default;

    std::map<std::string, Entry, std::less<>> entries_;
};

/**
 * @brief Split a comma separated selector list
 *
 * Surrounding whitespace is trimmed and empty items are dropped:
 * " strip, redact_ip ," yields {"strip", "redact_ip"}.
 */
std::vector<std::string> split_selectors(std::string_view list);

}  // namespace linepipe::transform
