#include <linepipe/cli/cli.hpp>

#include <linepipe/build_info.hpp>
#include <linepipe/common/debug.hpp>
#include <linepipe/common/platform.hpp>
#include <linepipe/config/config_loader.hpp>
#include <linepipe/stream/line_sink.hpp>
#include <linepipe/stream/line_source.hpp>
#include <linepipe/stream/processor.hpp>
#include <linepipe/transform/transform_registry.hpp>

#include <getopt.h>

#include <algorithm>
#include <iomanip>
#include <istream>
#include <memory>
#include <ostream>

namespace linepipe::cli {

using linepipe::common::Error;
using linepipe::common::ErrorCode;
using linepipe::config::AppConfig;
using linepipe::config::ConfigLoader;
namespace debug    = linepipe::common::debug;
namespace category = linepipe::common::debug::category;

namespace {

// Long-only options
constexpr int OPT_DUMP_CONFIG = 0x100;
constexpr int OPT_LOG_FILE    = 0x101;

Error usage_error(std::string message) {
    return Error(ErrorCode::INVALID_ARGUMENT, message, LINEPIPE_CURRENT_LOCATION);
}

void report(std::ostream& err, const Error& error) {
    err << "linepipe: " << error.full_message() << '\n';
    LINEPIPE_LOG_DEBUG(category::CLI, error.to_string());
}

debug::LogLevel effective_log_level(const AppConfig& config, int verbosity) {
    auto level = debug::parse_log_level(config.log_level);
    if (verbosity > 0) {
        int shifted = static_cast<int>(debug::LogLevel::WARN) - verbosity;
        level       = static_cast<debug::LogLevel>(std::max(shifted, 0));
    } else if (verbosity < 0) {
        level = debug::LogLevel::ERROR;
    }
    return level;
}

void setup_logging(const AppConfig& config, int verbosity) {
    auto& filter = debug::Logger::instance().filter();
    filter.reset();
    debug::init_logging(effective_log_level(config, verbosity));

    // Invalid entries are left for validate() to report
    for (const auto& [name, level] : config.log_categories) {
        if (auto parsed = debug::try_parse_log_level(level)) {
            filter.set_category_level(name, *parsed);
        }
    }

    if (!config.log_file.empty()) {
        debug::FileSink::Config sink_config;
        sink_config.file_path     = config.log_file;
        sink_config.max_file_size = static_cast<size_t>(config.log_max_size);

        auto sink = std::make_shared<debug::FileSink>(sink_config);
        if (sink->is_ready()) {
            debug::Logger::instance().add_sink(std::move(sink));
        } else {
            LINEPIPE_LOG_WARN(category::CLI, "Cannot open log file " << config.log_file);
        }
    }
}

Result<AppConfig> build_config(const CliOptions& options) {
    AppConfig config;

    std::string config_path = options.config_path;
    if (config_path.empty()) {
        config_path = common::platform::get_env(config::CONFIG_ENV_VAR);
    }

    if (!config_path.empty()) {
        LINEPIPE_TRY_ASSIGN(config, ConfigLoader::load(config_path));
    }

    apply_overrides(options, config);
    return config;
}

int list_transforms(std::ostream& out) {
    const auto& registry = transform::TransformRegistry::builtin();

    out << "Available transformations:\n";
    for (const auto& name : registry.names()) {
        auto description = registry.describe(name);
        out << "  " << std::left << std::setw(12) << name << ' '
            << description.value_or(std::string()) << '\n';
    }
    return EXIT_OK;
}

}  // anonymous namespace

// ============================================================================
// USAGE
// ============================================================================

void print_usage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [OPTIONS] [SELECTOR[,SELECTOR...]]...\n\n"
        << "Reads lines, applies the selected transformations in order and writes\n"
        << "the result.\n\n"
        << "Options:\n"
        << "  -t, --transform <list>   Comma separated selectors (repeatable)\n"
        << "  -i, --input <file>       Input file, '-' for stdin (default)\n"
        << "  -o, --output <file>      Output file, '-' for stdout (default)\n"
        << "  -a, --append             Append to the output file instead of truncating\n"
        << "  -c, --config <file>      Configuration file (YAML or JSON)\n"
        << "  -l, --list               List available transformations and exit\n"
        << "      --dump-config[=fmt]  Print the effective configuration (yaml|json)\n"
        << "      --log-file <file>    Also write log records to a file\n"
        << "  -v, --verbose            Increase verbosity (repeatable)\n"
        << "  -q, --quiet              Errors only, no line count report\n"
        << "  -V, --version            Print version and exit\n"
        << "  -h, --help               Print this help\n"
        << "\n"
        << "Examples:\n"
        << "  " << program << " redact_ip < app.log > app.redacted.log\n"
        << "  " << program << " -t strip,upper -i in.txt -o out.txt\n"
        << "\n"
        << "Exit status:\n"
        << "  0  success\n"
        << "  1  a line could not be processed, or an I/O error occurred\n"
        << "  2  invalid arguments or configuration\n"
        << "\n"
        << "Environment:\n"
        << "  LINEPIPE_CONFIG          Default configuration file path\n"
        << "  LINEPIPE_LOG_LEVEL       Log level (trace,debug,info,warn,error,off)\n";
}

void print_version(std::ostream& out) {
    const auto info = common::platform::get_platform_info();
    out << "linepipe " << LINEPIPE_VERSION_STRING << '\n'
        << "Line stream transformer\n"
        << "Build: " << info.build_type << " (" << info.compiler_name << ", " << info.os_name
        << ", C++" << info.cpp_version << ")\n";
}

// ============================================================================
// ARGUMENT PARSING
// ============================================================================

Result<CliOptions> parse_args(int argc, char* argv[]) {
    static const struct option long_options[] = {
        {"transform",   required_argument, nullptr, 't'            },
        {"input",       required_argument, nullptr, 'i'            },
        {"output",      required_argument, nullptr, 'o'            },
        {"append",      no_argument,       nullptr, 'a'            },
        {"config",      required_argument, nullptr, 'c'            },
        {"list",        no_argument,       nullptr, 'l'            },
        {"dump-config", optional_argument, nullptr, OPT_DUMP_CONFIG},
        {"log-file",    required_argument, nullptr, OPT_LOG_FILE   },
        {"verbose",     no_argument,       nullptr, 'v'            },
        {"quiet",       no_argument,       nullptr, 'q'            },
        {"version",     no_argument,       nullptr, 'V'            },
        {"help",        no_argument,       nullptr, 'h'            },
        {nullptr,       0,                 nullptr, 0              }
    };

    CliOptions options;
    if (argc > 0 && argv[0] != nullptr) {
        options.program = argv[0];
    }

    // Full reset of getopt state, so parsing can run more than once
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":t:i:o:ac:lvqVh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 't':
                for (auto& selector : transform::split_selectors(optarg)) {
                    options.transforms.push_back(std::move(selector));
                }
                break;
            case 'i':
                options.input_path = optarg;
                break;
            case 'o':
                options.output_path = optarg;
                break;
            case 'a':
                options.append = true;
                break;
            case 'c':
                options.config_path = optarg;
                break;
            case 'l':
                options.action = Action::LIST;
                break;
            case OPT_DUMP_CONFIG: {
                options.action = Action::DUMP_CONFIG;
                if (optarg != nullptr) {
                    auto format = ConfigLoader::parse_format_name(optarg);
                    if (!format) {
                        return format.error();
                    }
                    options.dump_format = format.value();
                }
                break;
            }
            case OPT_LOG_FILE:
                options.log_file = optarg;
                break;
            case 'v':
                options.verbosity++;
                break;
            case 'q':
                options.verbosity--;
                break;
            case 'V':
                options.action = Action::VERSION;
                return options;
            case 'h':
                options.action = Action::HELP;
                return options;
            case ':':
                return usage_error("option '" + std::string(argv[optind - 1]) +
                                   "' requires an argument");
            default: {
                std::string name = optopt != 0 ? std::string("-") + static_cast<char>(optopt)
                                               : std::string(argv[optind - 1]);
                return usage_error("unrecognized option '" + name + "'");
            }
        }
    }

    for (int i = optind; i < argc; ++i) {
        for (auto& selector : transform::split_selectors(argv[i])) {
            options.transforms.push_back(std::move(selector));
        }
    }

    return options;
}

void apply_overrides(const CliOptions& options, AppConfig& config) {
    if (!options.transforms.empty()) {
        config.transforms = options.transforms;
    }
    if (options.input_path) {
        config.input_path = *options.input_path;
    }
    if (options.output_path) {
        config.output_path = *options.output_path;
    }
    if (options.append) {
        config.append_output = true;
    }
    if (options.log_file) {
        config.log_file = *options.log_file;
    }
    if (options.verbosity < 0) {
        config.report_count = false;
    }
}

// ============================================================================
// EXECUTION
// ============================================================================

int run(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err) {
    switch (options.action) {
        case Action::HELP:
            print_usage(out, options.program);
            return EXIT_OK;
        case Action::VERSION:
            print_version(out);
            return EXIT_OK;
        case Action::LIST:
            return list_transforms(out);
        default:
            break;
    }

    auto config_result = build_config(options);
    if (!config_result) {
        report(err, config_result.error());
        return EXIT_USAGE_ERROR;
    }
    const AppConfig& config = config_result.value();

    setup_logging(config, options.verbosity);

    if (options.action == Action::DUMP_CONFIG) {
        auto text = ConfigLoader::serialize(config, options.dump_format);
        if (!text) {
            report(err, text.error());
            return EXIT_PROCESSING_FAILURE;
        }
        out << text.value();
        out.flush();
        return EXIT_OK;
    }

    // Selectors and settings are checked before any file is touched
    const auto& registry = transform::TransformRegistry::builtin();
    if (auto valid = ConfigLoader::validate(config, registry); !valid) {
        report(err, valid.error());
        return EXIT_USAGE_ERROR;
    }

    auto transformer = registry.resolve(config.transforms);
    if (!transformer) {
        report(err, transformer.error());
        return EXIT_USAGE_ERROR;
    }

    LINEPIPE_LOG_INFO(category::CLI, "Transform '" << transformer.value()->name() << "' from "
                                                   << config.input_path << " to "
                                                   << config.output_path);

    // Input
    std::unique_ptr<stream::ILineSource> source;
    if (config.reads_stdin()) {
        source = std::make_unique<stream::StreamLineSource>(in);
    } else {
        auto opened = stream::FileLineSource::open(config.input_path);
        if (!opened) {
            report(err, opened.error());
            return EXIT_PROCESSING_FAILURE;
        }
        source = std::move(opened).value();
    }

    // Output
    std::unique_ptr<stream::ILineSink> sink;
    if (config.writes_stdout()) {
        sink = std::make_unique<stream::StreamLineSink>(out);
    } else {
        auto mode = config.append_output ? stream::FileLineSink::Mode::APPEND
                                         : stream::FileLineSink::Mode::TRUNCATE;
        auto opened = stream::FileLineSink::open(config.output_path, mode);
        if (!opened) {
            report(err, opened.error());
            return EXIT_PROCESSING_FAILURE;
        }
        sink = std::move(opened).value();
    }

    auto processed = stream::process(*source, transformer.value().get(), *sink);
    if (!processed) {
        report(err, processed.error());
        return EXIT_PROCESSING_FAILURE;
    }

    if (config.report_count) {
        err << "linepipe: " << processed.value() << " lines processed\n";
    }
    return EXIT_OK;
}

}  // namespace linepipe::cli
