#pragma once

/**
 * @file config_loader.hpp
 * @brief Configuration loading, serialization and validation
 *
 * Supports YAML (yaml-cpp) and JSON (jsoncpp). Missing keys keep their
 * AppConfig defaults; keys of the wrong type are rejected.
 */

#include "config_types.hpp"

#include <linepipe/common/error.hpp>
#include <linepipe/transform/transform_registry.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace linepipe::config {

using linepipe::common::ErrorCode;
using linepipe::common::Result;

/**
 * @brief Environment variable naming a default configuration file
 */
constexpr const char* CONFIG_ENV_VAR = "LINEPIPE_CONFIG";

class ConfigLoader {
public:
    // ========== Format Detection ==========

    /**
     * @brief Detect format from file extension
     *
     * .json is JSON; everything else, including .yaml and .yml, is YAML.
     */
    static ConfigFormat detect_format(const std::filesystem::path& path);

    /**
     * @brief Detect format from content
     *
     * Content whose first non-blank character is '{' is JSON.
     */
    static ConfigFormat detect_format_from_content(std::string_view content);

    /**
     * @brief Parse a format name ("yaml", "yml", "json")
     */
    static Result<ConfigFormat> parse_format_name(std::string_view name);

    // ========== Loading ==========

    /**
     * @brief Load configuration from a file
     *
     * With ConfigFormat::AUTO the format comes from the file extension.
     *
     * @return The configuration, CONFIG_FILE_NOT_FOUND, CONFIG_PARSE_ERROR or
     *         CONFIG_TYPE_MISMATCH
     */
    static Result<AppConfig> load(const std::filesystem::path& path,
                                  ConfigFormat format = ConfigFormat::AUTO);

    /**
     * @brief Parse configuration from a string
     *
     * With ConfigFormat::AUTO the format comes from the content.
     */
    static Result<AppConfig> parse(std::string_view content,
                                   ConfigFormat format = ConfigFormat::AUTO);

    // ========== Serialization ==========

    /**
     * @brief Render configuration as YAML or JSON (AUTO renders YAML)
     */
    static Result<std::string> serialize(const AppConfig& config, ConfigFormat format);

    // ========== Validation ==========

    /**
     * @brief Check a configuration before any I/O takes place
     *
     * Rejects an empty selector list (CONFIG_MISSING), unknown selectors
     * (UNKNOWN_SELECTOR), empty paths (EMPTY_VALUE) and unknown log levels
     * (CONFIG_INVALID_VALUE).
     */
    static Result<void> validate(const AppConfig& config,
                                 const transform::TransformRegistry& registry =
                                     transform::TransformRegistry::builtin());
};

}  // namespace linepipe::config
