#include <linepipe/transform/builtin.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace linepipe::transform {

namespace {

template<typename Fn>
std::string map_bytes(std::string_view line, Fn fn) {
    std::string out(line);
    std::transform(out.begin(), out.end(), out.begin(), [&fn](char c) {
        return static_cast<char>(fn(static_cast<unsigned char>(c)));
    });
    return out;
}

}  // anonymous namespace

// ============================================================================
// UpperTransformer / LowerTransformer
// ============================================================================

Result<std::string> UpperTransformer::transform(std::string_view line) const {
    return map_bytes(line, [](unsigned char c) { return std::toupper(c); });
}

Result<std::string> LowerTransformer::transform(std::string_view line) const {
    return map_bytes(line, [](unsigned char c) { return std::tolower(c); });
}

// ============================================================================
// StripTransformer
// ============================================================================

Result<std::string> StripTransformer::transform(std::string_view line) const {
    std::string out;

    auto first = line.find_first_not_of(WHITESPACE);
    if (first != std::string_view::npos) {
        auto last = line.find_last_not_of(WHITESPACE);
        out.reserve(last - first + 2);
        out.append(line.substr(first, last - first + 1));
    }

    out.push_back('\n');
    return out;
}

// ============================================================================
// RedactIpTransformer
// ============================================================================

RedactIpTransformer::RedactIpTransformer()
    : pattern_(PATTERN, std::regex::ECMAScript | std::regex::optimize) {}

Result<std::string> RedactIpTransformer::transform(std::string_view line) const {
    std::string out;
    out.reserve(line.size());
    std::regex_replace(std::back_inserter(out), line.begin(), line.end(), pattern_,
                       std::string(TOKEN));
    return out;
}

}  // namespace linepipe::transform
