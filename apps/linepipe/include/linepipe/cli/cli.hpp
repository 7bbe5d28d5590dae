#pragma once

/**
 * @file cli.hpp
 * @brief Command-line front end for linepipe
 *
 * Usage: linepipe [OPTIONS] [SELECTOR[,SELECTOR...]]...
 *
 * Command-line values override those from the configuration file, which
 * is taken from --config or else from LINEPIPE_CONFIG.
 */

#include <linepipe/common/error.hpp>
#include <linepipe/config/config_types.hpp>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace linepipe::cli {

using linepipe::common::Result;

// ============================================================================
// EXIT CODES
// ============================================================================

constexpr int EXIT_OK                 = 0;
constexpr int EXIT_PROCESSING_FAILURE = 1;  // Line failure or I/O error
constexpr int EXIT_USAGE_ERROR        = 2;  // Bad arguments or configuration

// ============================================================================
// OPTIONS
// ============================================================================

enum class Action : uint8_t {
    RUN,
    LIST,
    DUMP_CONFIG,
    HELP,
    VERSION
};

struct CliOptions {
    Action action = Action::RUN;
    std::string program = "linepipe";

    std::string config_path;

    // Selectors from -t and positional arguments, in command-line order
    std::vector<std::string> transforms;

    std::optional<std::string> input_path;
    std::optional<std::string> output_path;
    std::optional<std::string> log_file;
    bool append = false;

    // +1 per -v, -1 per -q
    int verbosity = 0;

    config::ConfigFormat dump_format = config::ConfigFormat::YAML;
};

/**
 * @brief Parse command-line arguments
 *
 * Reentrant across calls: getopt state is reset first.
 *
 * @return Options, or INVALID_ARGUMENT / FORMAT_UNSUPPORTED with a message
 *         suitable for the user
 */
Result<CliOptions> parse_args(int argc, char* argv[]);

/**
 * @brief Merge a loaded configuration with command-line overrides
 */
void apply_overrides(const CliOptions& options, config::AppConfig& config);

/**
 * @brief Execute the selected action
 *
 * @param in  Used when the input path is "-"
 * @param out Used when the output path is "-", and for help output
 * @param err Diagnostics and the processed line count
 * @return Process exit code
 */
int run(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err);

void print_usage(std::ostream& out, const std::string& program);

void print_version(std::ostream& out);

}  // namespace linepipe::cli
