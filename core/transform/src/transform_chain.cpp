#include <linepipe/transform/transform_chain.hpp>

#include <linepipe/common/debug.hpp>

#include <algorithm>

namespace linepipe::transform {

using linepipe::common::Error;
namespace category = linepipe::common::debug::category;

TransformChain::TransformChain(std::vector<Stage> stages) {
    stages_.reserve(stages.size());
    for (auto& stage : stages) {
        if (stage) {
            stages_.push_back(std::move(stage));
        }
    }
    rebuild_name();
}

TransformChain& TransformChain::add(Stage stage) {
    if (stage) {
        stages_.push_back(std::move(stage));
        rebuild_name();
    }
    return *this;
}

Result<std::string> TransformChain::transform(std::string_view line) const {
    std::string current(line);

    for (const auto& stage : stages_) {
        auto result = stage->transform(current);
        if (!result) {
            LINEPIPE_LOG_DEBUG(category::TRANSFORM,
                               "Stage '" << stage->name() << "' failed: " << result.message());

            Error error(ErrorCode::STAGE_FAILED,
                        "stage '" + std::string(stage->name()) + "' failed",
                        LINEPIPE_CURRENT_LOCATION);
            error.with_context("stage", stage->name());
            error.with_cause(result.error());
            return error;
        }
        current = std::move(result).value();
    }

    return current;
}

std::string TransformChain::description() const {
    if (stages_.empty()) {
        return "pass lines through unchanged";
    }

    std::string desc;
    for (size_t i = 0; i < stages_.size(); ++i) {
        if (i > 0)
            desc += ", then ";
        desc += stages_[i]->description();
    }
    return desc;
}

bool TransformChain::is_invocable() const noexcept {
    return std::all_of(stages_.begin(), stages_.end(),
                       [](const Stage& s) { return s->is_invocable(); });
}

void TransformChain::rebuild_name() {
    name_.clear();
    for (const auto& stage : stages_) {
        if (!name_.empty())
            name_ += ',';
        name_ += stage->name();
    }
}

}  // namespace linepipe::transform
