#pragma once

/**
 * @file transform_chain.hpp
 * @brief Ordered composition of line transformers
 *
 * A TransformChain is itself a line transformer: each stage receives the
 * output of the previous one. An empty chain passes lines through unchanged.
 *
 * @code
 * const auto& reg = TransformRegistry::builtin();
 * TransformChain chain({reg.lookup("strip").value(), reg.lookup("redact_ip").value()});
 * auto out = chain.transform("  10.0.0.1 up  \n");  // "[REDACTED_IP] up\n"
 * @endcode
 */

#include "line_transformer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace linepipe::transform {

class TransformChain final : public ILineTransformer {
public:
    using Stage = std::shared_ptr<const ILineTransformer>;

    TransformChain() = default;

    /**
     * @brief Construct from an ordered list of stages
     *
     * Null stages are skipped.
     */
    explicit TransformChain(std::vector<Stage> stages);

    /**
     * @brief Append a stage
     */
    TransformChain& add(Stage stage);

    // ========== ILineTransformer Implementation ==========

    /**
     * @brief Apply all stages in order
     *
     * A failing stage stops the chain. The returned error has code
     * STAGE_FAILED, carries the stage name under context key "stage" and
     * holds the stage's own error as its cause.
     */
    Result<std::string> transform(std::string_view line) const override;

    TransformerId id() const noexcept override { return TransformerId::CHAIN; }

    /**
     * @brief Comma-joined stage names, e.g. "strip,redact_ip"
     */
    std::string_view name() const noexcept override { return name_; }

    std::string description() const override;

    bool is_invocable() const noexcept override;

    // ========== Accessors ==========

    size_t size() const noexcept { return stages_.size(); }
    bool empty() const noexcept { return stages_.empty(); }
    const std::vector<Stage>& stages() const noexcept { return stages_; }

private:
    void rebuild_name();

    std::vector<Stage> stages_;
    std::string name_;
};

}  // namespace linepipe::transform
