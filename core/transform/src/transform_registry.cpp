#include <linepipe/transform/transform_registry.hpp>

#include <linepipe/common/debug.hpp>
#include <linepipe/transform/builtin.hpp>
#include <linepipe/transform/transform_chain.hpp>

namespace linepipe::transform {

using linepipe::common::Error;
namespace category = linepipe::common::debug::category;

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty())
            out += ", ";
        out += n;
    }
    return out;
}

TransformRegistry make_builtin() {
    auto result = TransformRegistry::create({
        std::make_shared<UpperTransformer>(),
        std::make_shared<LowerTransformer>(),
        std::make_shared<StripTransformer>(),
        std::make_shared<RedactIpTransformer>(),
    });
    // Built-in names are distinct
    return std::move(result).value();
}

}  // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Result<TransformRegistry> TransformRegistry::create(std::vector<Entry> entries) {
    TransformRegistry registry;

    for (auto& entry : entries) {
        if (!entry) {
            return Result<TransformRegistry>(ErrorCode::NULL_POINTER,
                                             "registry entry is null");
        }

        std::string name(entry->name());
        if (name.empty()) {
            return Result<TransformRegistry>(ErrorCode::INVALID_ARGUMENT,
                                             "registry entry has an empty name");
        }

        if (registry.entries_.count(name) > 0) {
            Error error(ErrorCode::ALREADY_EXISTS, "duplicate selector '" + name + "'",
                        LINEPIPE_CURRENT_LOCATION);
            error.with_context("selector", name);
            return error;
        }

        registry.entries_.emplace(std::move(name), std::move(entry));
    }

    return Result<TransformRegistry>(std::move(registry));
}

const TransformRegistry& TransformRegistry::builtin() {
    static const TransformRegistry registry = make_builtin();
    return registry;
}

// ============================================================================
// Lookup
// ============================================================================

Result<TransformRegistry::Entry> TransformRegistry::lookup(std::string_view name) const {
    auto it = entries_.find(name);
    if (it != entries_.end()) {
        return it->second;
    }

    Error error(ErrorCode::UNKNOWN_SELECTOR,
                "unknown selector '" + std::string(name) + "' (expected one of: " +
                    join_names(names()) + ")",
                LINEPIPE_CURRENT_LOCATION);
    error.with_context("selector", name);
    return error;
}

bool TransformRegistry::contains(std::string_view name) const noexcept {
    return entries_.find(name) != entries_.end();
}

std::vector<std::string> TransformRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, _] : entries_) {
        out.push_back(name);
    }
    return out;
}

Result<std::string> TransformRegistry::describe(std::string_view name) const {
    Entry entry;
    LINEPIPE_TRY_ASSIGN(entry, lookup(name));
    return entry->description();
}

Result<TransformRegistry::Entry>
TransformRegistry::resolve(const std::vector<std::string>& selectors) const {
    if (selectors.empty()) {
        return Result<Entry>(ErrorCode::INVALID_ARGUMENT, "no transformation selected");
    }

    std::vector<Entry> stages;
    stages.reserve(selectors.size());
    for (const auto& selector : selectors) {
        Entry stage;
        LINEPIPE_TRY_ASSIGN(stage, lookup(selector));
        stages.push_back(std::move(stage));
    }

    if (stages.size() == 1) {
        return stages.front();
    }

    auto chain = std::make_shared<TransformChain>(std::move(stages));
    LINEPIPE_LOG_DEBUG(category::TRANSFORM, "Resolved selector chain: " << chain->name());
    return Entry(std::move(chain));
}

// ============================================================================
// Selector parsing
// ============================================================================

std::vector<std::string> split_selectors(std::string_view list) {
    constexpr std::string_view WS = " \t";

    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        if (comma == std::string_view::npos)
            comma = list.size();

        auto item  = list.substr(pos, comma - pos);
        auto first = item.find_first_not_of(WS);
        if (first != std::string_view::npos) {
            auto last = item.find_last_not_of(WS);
            out.emplace_back(item.substr(first, last - first + 1));
        }

        pos = comma + 1;
    }
    return out;
}

}  // namespace linepipe::transform
