#pragma once

/**
 * @file config_types.hpp
 * @brief Application configuration for linepipe
 *
 * YAML form (JSON uses the same keys):
 *
 * @code
 * transforms: [strip, redact_ip]    # or "strip,redact_ip"
 * input: /var/log/app.log           # "-" = stdin (quoted in YAML)
 * output: "-"                       # "-" = stdout
 * append: false
 * report_count: true
 * logging:
 *   level: warn
 *   file: /tmp/linepipe.log
 *   max_size: 10485760
 *   categories:                     # per-category minimum level
 *     stream: error
 * @endcode
 */

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace linepipe::config {

/**
 * @brief Path value meaning stdin or stdout
 */
constexpr std::string_view STDIO_PATH = "-";

/**
 * @brief Configuration file format
 */
enum class ConfigFormat : uint8_t {
    AUTO = 0,  // Detect from extension or content
    YAML,
    JSON
};

constexpr std::string_view format_name(ConfigFormat format) noexcept {
    switch (format) {
        case ConfigFormat::YAML:
            return "yaml";
        case ConfigFormat::JSON:
            return "json";
        default:
            return "auto";
    }
}

/**
 * @brief Complete application configuration
 */
struct AppConfig {
    // Ordered selector list, applied left to right
    std::vector<std::string> transforms;

    std::string input_path{STDIO_PATH};
    std::string output_path{STDIO_PATH};
    bool append_output = false;

    // Logging
    std::string log_level = "warn";
    std::string log_file;                          // Empty = console only
    uint64_t log_max_size = 10 * 1024 * 1024;      // 0 disables rotation
    std::map<std::string, std::string> log_categories;  // category -> level

    // Report the processed line count on stderr
    bool report_count = true;

    bool reads_stdin() const noexcept { return input_path == STDIO_PATH; }
    bool writes_stdout() const noexcept { return output_path == STDIO_PATH; }
};

}  // namespace linepipe::config
