#include <linepipe/config/config_loader.hpp>

#include <linepipe/common/debug.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>

#include <json/json.h>
#include <yaml-cpp/yaml.h>

namespace linepipe::config {

using linepipe::common::Error;
using linepipe::common::ok;
namespace category = linepipe::common::debug::category;

namespace {

// ============================================================================
// KEYS
// ============================================================================

constexpr const char* KEY_TRANSFORMS   = "transforms";
constexpr const char* KEY_INPUT        = "input";
constexpr const char* KEY_OUTPUT       = "output";
constexpr const char* KEY_APPEND       = "append";
constexpr const char* KEY_REPORT_COUNT = "report_count";
constexpr const char* KEY_LOGGING      = "logging";
constexpr const char* KEY_LOG_LEVEL    = "level";
constexpr const char* KEY_LOG_FILE     = "file";
constexpr const char* KEY_LOG_MAX_SIZE = "max_size";
constexpr const char* KEY_LOG_CATEGORIES = "categories";

constexpr std::array<std::string_view, 6> ROOT_KEYS = {
    KEY_TRANSFORMS, KEY_INPUT, KEY_OUTPUT, KEY_APPEND, KEY_REPORT_COUNT, KEY_LOGGING};

constexpr std::array<std::string_view, 4> LOGGING_KEYS = {KEY_LOG_LEVEL, KEY_LOG_FILE,
                                                          KEY_LOG_MAX_SIZE, KEY_LOG_CATEGORIES};

template<size_t N>
void warn_unknown_key(const std::array<std::string_view, N>& known, const std::string& key,
                      std::string_view section) {
    if (std::find(known.begin(), known.end(), key) == known.end()) {
        LINEPIPE_LOG_WARN(category::CONFIG,
                          "Ignoring unknown configuration key '" << section << key << "'");
    }
}

Error type_mismatch(std::string_view key, std::string_view expected) {
    Error error(ErrorCode::CONFIG_TYPE_MISMATCH,
                "configuration key '" + std::string(key) + "' must be " + std::string(expected),
                LINEPIPE_CURRENT_LOCATION);
    error.with_context("key", key);
    return error;
}

void append_selectors(std::vector<std::string>& out, std::string_view list) {
    for (auto& selector : transform::split_selectors(list)) {
        out.push_back(std::move(selector));
    }
}

// ============================================================================
// YAML PARSING
// ============================================================================

template<typename T>
Result<void> yaml_get(const YAML::Node& node, const char* key, T& out,
                      std::string_view expected) {
    const YAML::Node value = node[key];
    if (!value) {
        return ok();
    }
    if (!value.IsScalar()) {
        return type_mismatch(key, expected);
    }
    try {
        out = value.as<T>();
    } catch (const YAML::BadConversion&) {
        return type_mismatch(key, expected);
    }
    return ok();
}

Result<void> yaml_get_selectors(const YAML::Node& node, std::vector<std::string>& out) {
    const YAML::Node value = node[KEY_TRANSFORMS];
    if (!value) {
        return ok();
    }

    std::vector<std::string> selectors;
    if (value.IsScalar()) {
        append_selectors(selectors, value.Scalar());
    } else if (value.IsSequence()) {
        for (const auto& item : value) {
            if (!item.IsScalar()) {
                return type_mismatch(KEY_TRANSFORMS, "a list of selector names");
            }
            append_selectors(selectors, item.Scalar());
        }
    } else {
        return type_mismatch(KEY_TRANSFORMS, "a selector name or a list of selector names");
    }

    out = std::move(selectors);
    return ok();
}

Result<void> yaml_get_categories(const YAML::Node& node,
                                 std::map<std::string, std::string>& out) {
    const YAML::Node value = node[KEY_LOG_CATEGORIES];
    if (!value) {
        return ok();
    }
    if (!value.IsMap()) {
        return type_mismatch("logging.categories", "a mapping of category names to levels");
    }

    std::map<std::string, std::string> levels;
    for (const auto& entry : value) {
        if (!entry.second.IsScalar()) {
            return type_mismatch("logging.categories", "a mapping of category names to levels");
        }
        levels[entry.first.as<std::string>()] = entry.second.Scalar();
    }

    out = std::move(levels);
    return ok();
}

Result<AppConfig> parse_yaml(const std::string& content) {
    YAML::Node root = YAML::Load(content);

    AppConfig config;
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return Result<AppConfig>(ErrorCode::CONFIG_INVALID,
                                 "configuration root must be a mapping");
    }

    for (const auto& entry : root) {
        warn_unknown_key(ROOT_KEYS, entry.first.as<std::string>(), "");
    }

    LINEPIPE_TRY(yaml_get_selectors(root, config.transforms));
    LINEPIPE_TRY(yaml_get(root, KEY_INPUT, config.input_path, "a string"));
    LINEPIPE_TRY(yaml_get(root, KEY_OUTPUT, config.output_path, "a string"));
    LINEPIPE_TRY(yaml_get(root, KEY_APPEND, config.append_output, "a boolean"));
    LINEPIPE_TRY(yaml_get(root, KEY_REPORT_COUNT, config.report_count, "a boolean"));

    const YAML::Node logging = root[KEY_LOGGING];
    if (logging) {
        if (!logging.IsMap()) {
            return type_mismatch(KEY_LOGGING, "a mapping");
        }
        for (const auto& entry : logging) {
            warn_unknown_key(LOGGING_KEYS, entry.first.as<std::string>(), "logging.");
        }
        LINEPIPE_TRY(yaml_get(logging, KEY_LOG_LEVEL, config.log_level, "a string"));
        LINEPIPE_TRY(yaml_get(logging, KEY_LOG_FILE, config.log_file, "a string"));
        LINEPIPE_TRY(yaml_get(logging, KEY_LOG_MAX_SIZE, config.log_max_size,
                              "a non-negative integer"));
        LINEPIPE_TRY(yaml_get_categories(logging, config.log_categories));
    }

    return config;
}

// ============================================================================
// JSON PARSING
// ============================================================================

Result<void> json_get(const Json::Value& node, const char* key, std::string& out) {
    if (!node.isMember(key)) {
        return ok();
    }
    const Json::Value& value = node[key];
    if (!value.isString()) {
        return type_mismatch(key, "a string");
    }
    out = value.asString();
    return ok();
}

Result<void> json_get(const Json::Value& node, const char* key, bool& out) {
    if (!node.isMember(key)) {
        return ok();
    }
    const Json::Value& value = node[key];
    if (!value.isBool()) {
        return type_mismatch(key, "a boolean");
    }
    out = value.asBool();
    return ok();
}

Result<void> json_get(const Json::Value& node, const char* key, uint64_t& out) {
    if (!node.isMember(key)) {
        return ok();
    }
    const Json::Value& value = node[key];
    if (!value.isIntegral() || !value.isUInt64()) {
        return type_mismatch(key, "a non-negative integer");
    }
    out = static_cast<uint64_t>(value.asUInt64());
    return ok();
}

Result<void> json_get_selectors(const Json::Value& node, std::vector<std::string>& out) {
    if (!node.isMember(KEY_TRANSFORMS)) {
        return ok();
    }
    const Json::Value& value = node[KEY_TRANSFORMS];

    std::vector<std::string> selectors;
    if (value.isString()) {
        append_selectors(selectors, value.asString());
    } else if (value.isArray()) {
        for (const auto& item : value) {
            if (!item.isString()) {
                return type_mismatch(KEY_TRANSFORMS, "a list of selector names");
            }
            append_selectors(selectors, item.asString());
        }
    } else {
        return type_mismatch(KEY_TRANSFORMS, "a selector name or a list of selector names");
    }

    out = std::move(selectors);
    return ok();
}

Result<void> json_get_categories(const Json::Value& node,
                                 std::map<std::string, std::string>& out) {
    if (!node.isMember(KEY_LOG_CATEGORIES)) {
        return ok();
    }
    const Json::Value& value = node[KEY_LOG_CATEGORIES];
    if (!value.isObject()) {
        return type_mismatch("logging.categories", "an object of category names to levels");
    }

    std::map<std::string, std::string> levels;
    for (const auto& name : value.getMemberNames()) {
        if (!value[name].isString()) {
            return type_mismatch("logging.categories", "an object of category names to levels");
        }
        levels[name] = value[name].asString();
    }

    out = std::move(levels);
    return ok();
}

Result<AppConfig> parse_json(const std::string& content) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(content);

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        return Result<AppConfig>(ErrorCode::CONFIG_PARSE_ERROR, "JSON parse error: " + errors);
    }

    AppConfig config;
    if (root.isNull()) {
        return config;
    }
    if (!root.isObject()) {
        return Result<AppConfig>(ErrorCode::CONFIG_INVALID,
                                 "configuration root must be an object");
    }

    for (const auto& key : root.getMemberNames()) {
        warn_unknown_key(ROOT_KEYS, key, "");
    }

    LINEPIPE_TRY(json_get_selectors(root, config.transforms));
    LINEPIPE_TRY(json_get(root, KEY_INPUT, config.input_path));
    LINEPIPE_TRY(json_get(root, KEY_OUTPUT, config.output_path));
    LINEPIPE_TRY(json_get(root, KEY_APPEND, config.append_output));
    LINEPIPE_TRY(json_get(root, KEY_REPORT_COUNT, config.report_count));

    if (root.isMember(KEY_LOGGING)) {
        const Json::Value& logging = root[KEY_LOGGING];
        if (!logging.isObject()) {
            return type_mismatch(KEY_LOGGING, "an object");
        }
        for (const auto& key : logging.getMemberNames()) {
            warn_unknown_key(LOGGING_KEYS, key, "logging.");
        }
        LINEPIPE_TRY(json_get(logging, KEY_LOG_LEVEL, config.log_level));
        LINEPIPE_TRY(json_get(logging, KEY_LOG_FILE, config.log_file));
        LINEPIPE_TRY(json_get(logging, KEY_LOG_MAX_SIZE, config.log_max_size));
        LINEPIPE_TRY(json_get_categories(logging, config.log_categories));
    }

    return config;
}

// ============================================================================
// SERIALIZATION
// ============================================================================

Result<std::string> to_yaml(const AppConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << KEY_TRANSFORMS << YAML::Value << YAML::Flow << config.transforms;
    out << YAML::Key << KEY_INPUT << YAML::Value << config.input_path;
    out << YAML::Key << KEY_OUTPUT << YAML::Value << config.output_path;
    out << YAML::Key << KEY_APPEND << YAML::Value << config.append_output;
    out << YAML::Key << KEY_REPORT_COUNT << YAML::Value << config.report_count;
    out << YAML::Key << KEY_LOGGING << YAML::Value << YAML::BeginMap;
    out << YAML::Key << KEY_LOG_LEVEL << YAML::Value << config.log_level;
    out << YAML::Key << KEY_LOG_FILE << YAML::Value << config.log_file;
    out << YAML::Key << KEY_LOG_MAX_SIZE << YAML::Value << config.log_max_size;
    if (!config.log_categories.empty()) {
        out << YAML::Key << KEY_LOG_CATEGORIES << YAML::Value << config.log_categories;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    if (!out.good()) {
        return Result<std::string>(ErrorCode::SERIALIZE_FAILED,
                                   "YAML emit error: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

Result<std::string> to_json(const AppConfig& config) {
    Json::Value root(Json::objectValue);

    Json::Value transforms(Json::arrayValue);
    for (const auto& selector : config.transforms) {
        transforms.append(selector);
    }
    root[KEY_TRANSFORMS]   = transforms;
    root[KEY_INPUT]        = config.input_path;
    root[KEY_OUTPUT]       = config.output_path;
    root[KEY_APPEND]       = config.append_output;
    root[KEY_REPORT_COUNT] = config.report_count;

    Json::Value logging(Json::objectValue);
    logging[KEY_LOG_LEVEL]    = config.log_level;
    logging[KEY_LOG_FILE]     = config.log_file;
    logging[KEY_LOG_MAX_SIZE] = Json::UInt64(config.log_max_size);
    if (!config.log_categories.empty()) {
        Json::Value categories(Json::objectValue);
        for (const auto& [name, level] : config.log_categories) {
            categories[name] = level;
        }
        logging[KEY_LOG_CATEGORIES] = categories;
    }
    root[KEY_LOGGING]         = logging;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root) + "\n";
}

}  // anonymous namespace

// ============================================================================
// FORMAT DETECTION
// ============================================================================

ConfigFormat ConfigLoader::detect_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

ConfigFormat ConfigLoader::detect_format_from_content(std::string_view content) {
    size_t pos = 0;
    while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) {
        ++pos;
    }

    if (pos < content.size() && content[pos] == '{') {
        return ConfigFormat::JSON;
    }

    // Default to YAML (more permissive)
    return ConfigFormat::YAML;
}

Result<ConfigFormat> ConfigLoader::parse_format_name(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "yaml" || lower == "yml") {
        return ConfigFormat::YAML;
    }
    if (lower == "json") {
        return ConfigFormat::JSON;
    }

    Error error(ErrorCode::FORMAT_UNSUPPORTED,
                "unsupported configuration format '" + std::string(name) + "'",
                LINEPIPE_CURRENT_LOCATION);
    error.with_context("format", name);
    return error;
}

// ============================================================================
// LOADING
// ============================================================================

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& path, ConfigFormat format) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        Error error(ErrorCode::CONFIG_FILE_NOT_FOUND,
                    "configuration file not found: " + path.string(), LINEPIPE_CURRENT_LOCATION);
        error.with_context("path", path.string());
        return error;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        Error error(ErrorCode::FILE_OPEN_FAILED,
                    "failed to open configuration file: " + path.string(),
                    LINEPIPE_CURRENT_LOCATION);
        error.with_context("path", path.string());
        return error;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (format == ConfigFormat::AUTO) {
        format = detect_format(path);
    }

    LINEPIPE_LOG_DEBUG(category::CONFIG,
                       "Loading " << format_name(format) << " configuration from " << path.string());

    auto result = parse(buffer.str(), format);
    if (!result) {
        Error error(result.code(), "invalid configuration file: " + path.string(),
                    LINEPIPE_CURRENT_LOCATION);
        error.with_context("path", path.string());
        error.with_cause(result.error());
        return error;
    }
    return result;
}

Result<AppConfig> ConfigLoader::parse(std::string_view content, ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        format = detect_format_from_content(content);
    }

    std::string text(content);
    try {
        if (format == ConfigFormat::JSON) {
            return parse_json(text);
        }
        return parse_yaml(text);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                 std::string("YAML parse error: ") + e.what());
    } catch (const Json::Exception& e) {
        return Result<AppConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                 std::string("JSON parse error: ") + e.what());
    }
}

// ============================================================================
// SERIALIZATION
// ============================================================================

Result<std::string> ConfigLoader::serialize(const AppConfig& config, ConfigFormat format) {
    if (format == ConfigFormat::JSON) {
        return to_json(config);
    }
    return to_yaml(config);
}

// ============================================================================
// VALIDATION
// ============================================================================

Result<void> ConfigLoader::validate(const AppConfig& config,
                                    const transform::TransformRegistry& registry) {
    if (config.transforms.empty()) {
        return Result<void>(ErrorCode::CONFIG_MISSING, "no transformation selected");
    }

    for (const auto& selector : config.transforms) {
        LINEPIPE_TRY(registry.lookup(selector));
    }

    if (config.input_path.empty()) {
        return Result<void>(ErrorCode::EMPTY_VALUE, "input path must not be empty");
    }
    if (config.output_path.empty()) {
        return Result<void>(ErrorCode::EMPTY_VALUE, "output path must not be empty");
    }

    if (!common::debug::try_parse_log_level(config.log_level)) {
        Error error(ErrorCode::CONFIG_INVALID_VALUE,
                    "unknown log level '" + config.log_level + "'", LINEPIPE_CURRENT_LOCATION);
        error.with_context("key", "logging.level");
        return error;
    }

    const auto& known = category::ALL;
    for (const auto& [name, level] : config.log_categories) {
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            Error error(ErrorCode::CONFIG_INVALID_VALUE, "unknown log category '" + name + "'",
                        LINEPIPE_CURRENT_LOCATION);
            error.with_context("key", "logging.categories");
            return error;
        }
        if (!common::debug::try_parse_log_level(level)) {
            Error error(ErrorCode::CONFIG_INVALID_VALUE,
                        "unknown log level '" + level + "' for category '" + name + "'",
                        LINEPIPE_CURRENT_LOCATION);
            error.with_context("key", "logging.categories." + name);
            return error;
        }
    }

    return ok();
}

}  // namespace linepipe::config
