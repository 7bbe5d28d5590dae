/**
 * @file test_cli.cpp
 * @brief Unit tests for the linepipe command-line front end
 */

#include <gtest/gtest.h>
#include <linepipe/build_info.hpp>
#include <linepipe/cli/cli.hpp>
#include <linepipe_test.hpp>

#include <cstdlib>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

using namespace linepipe::cli;
using linepipe::common::ErrorCode;
using linepipe::common::debug::LogLevel;
using linepipe::config::ConfigFormat;
using linepipe::test::LogCaptureTest;
using linepipe::test::TempFile;

namespace {

/**
 * @brief Mutable argv built from string literals
 *
 * getopt_long permutes argv, so each parse gets its own copy.
 */
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    Args(const Args&)            = delete;
    Args& operator=(const Args&) = delete;

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

CliOptions parse_ok(Args args) {
    auto result = parse_args(args.argc(), args.argv());
    EXPECT_TRUE(result) << result.error().to_string();
    return result ? result.value() : CliOptions{};
}

}  // namespace

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(CliParseTest, PositionalSelectors) {
    auto options = parse_ok({"linepipe", "strip,upper", "redact_ip"});

    EXPECT_EQ(options.action, Action::RUN);
    std::vector<std::string> expected = {"strip", "upper", "redact_ip"};
    EXPECT_EQ(options.transforms, expected);
    EXPECT_FALSE(options.input_path.has_value());
    EXPECT_FALSE(options.output_path.has_value());
}

TEST(CliParseTest, TransformOptionRepeatable) {
    auto options = parse_ok({"linepipe", "-t", "strip", "--transform=lower,redact_ip"});

    std::vector<std::string> expected = {"strip", "lower", "redact_ip"};
    EXPECT_EQ(options.transforms, expected);
}

TEST(CliParseTest, FilesAndFlags) {
    auto options = parse_ok({"linepipe", "-i", "in.txt", "--output", "out.txt", "-a", "-c",
                             "conf.yaml", "--log-file", "run.log", "-vv", "upper"});

    EXPECT_EQ(options.input_path, "in.txt");
    EXPECT_EQ(options.output_path, "out.txt");
    EXPECT_TRUE(options.append);
    EXPECT_EQ(options.config_path, "conf.yaml");
    EXPECT_EQ(options.log_file, "run.log");
    EXPECT_EQ(options.verbosity, 2);
    EXPECT_EQ(options.transforms, std::vector<std::string>{"upper"});
}

TEST(CliParseTest, Quiet) {
    auto options = parse_ok({"linepipe", "-q", "upper"});
    EXPECT_EQ(options.verbosity, -1);
}

TEST(CliParseTest, Actions) {
    EXPECT_EQ(parse_ok({"linepipe", "--list"}).action, Action::LIST);
    EXPECT_EQ(parse_ok({"linepipe", "-h", "--bogus"}).action, Action::HELP);
    EXPECT_EQ(parse_ok({"linepipe", "--version"}).action, Action::VERSION);
}

TEST(CliParseTest, DumpConfigFormat) {
    auto yaml = parse_ok({"linepipe", "--dump-config", "upper"});
    EXPECT_EQ(yaml.action, Action::DUMP_CONFIG);
    EXPECT_EQ(yaml.dump_format, ConfigFormat::YAML);
    EXPECT_EQ(yaml.transforms, std::vector<std::string>{"upper"});

    auto json = parse_ok({"linepipe", "--dump-config=json"});
    EXPECT_EQ(json.dump_format, ConfigFormat::JSON);

    Args bad{"linepipe", "--dump-config=toml"};
    auto result = parse_args(bad.argc(), bad.argv());
    EXPECT_EQ(result.code(), ErrorCode::FORMAT_UNSUPPORTED);
}

TEST(CliParseTest, UnknownOption) {
    Args args{"linepipe", "-x", "upper"};

    auto result = parse_args(args.argc(), args.argv());

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_NE(result.message().find("'-x'"), std::string::npos);
}

TEST(CliParseTest, UnknownLongOption) {
    Args args{"linepipe", "--frobnicate"};

    auto result = parse_args(args.argc(), args.argv());

    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.message().find("--frobnicate"), std::string::npos);
}

TEST(CliParseTest, MissingArgument) {
    Args args{"linepipe", "upper", "-i"};

    auto result = parse_args(args.argc(), args.argv());

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_NE(result.message().find("requires an argument"), std::string::npos);
}

TEST(CliParseTest, ApplyOverrides) {
    linepipe::config::AppConfig config;
    config.transforms  = {"lower"};
    config.input_path  = "from_file.txt";
    config.output_path = "out_file.txt";

    CliOptions options;
    options.output_path = "-";
    options.verbosity   = -1;
    apply_overrides(options, config);

    EXPECT_EQ(config.transforms, std::vector<std::string>{"lower"});
    EXPECT_EQ(config.input_path, "from_file.txt");
    EXPECT_TRUE(config.writes_stdout());
    EXPECT_FALSE(config.report_count);

    options.transforms = {"upper"};
    options.append     = true;
    apply_overrides(options, config);
    EXPECT_EQ(config.transforms, std::vector<std::string>{"upper"});
    EXPECT_TRUE(config.append_output);
}

// ============================================================================
// Execution
// ============================================================================

class CliRunTest : public LogCaptureTest {
protected:
    void SetUp() override {
        LogCaptureTest::SetUp();
        unsetenv("LINEPIPE_CONFIG");
        unsetenv("LINEPIPE_LOG_LEVEL");
    }

    void TearDown() override {
        unsetenv("LINEPIPE_CONFIG");
        LogCaptureTest::TearDown();
    }

    int run_with(Args args, const std::string& input = "") {
        auto options = parse_args(args.argc(), args.argv());
        if (!options) {
            return -1;
        }
        in_.str(input);
        in_.clear();
        out_.str("");
        err_.str("");
        return run(options.value(), in_, out_, err_);
    }

    std::istringstream in_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CliRunTest, Help) {
    EXPECT_EQ(run_with({"linepipe", "--help"}), EXIT_OK);
    EXPECT_NE(out_.str().find("Usage: linepipe"), std::string::npos);
    EXPECT_NE(out_.str().find("--dump-config"), std::string::npos);
}

TEST_F(CliRunTest, Version) {
    EXPECT_EQ(run_with({"linepipe", "-V"}), EXIT_OK);
    EXPECT_EQ(out_.str().rfind(std::string("linepipe ") + LINEPIPE_VERSION_STRING, 0), 0u);
    EXPECT_NE(out_.str().find(", C++"), std::string::npos);
}

TEST_F(CliRunTest, ListTransforms) {
    EXPECT_EQ(run_with({"linepipe", "--list"}), EXIT_OK);

    const std::string text = out_.str();
    auto lower = text.find("  lower");
    auto redact = text.find("  redact_ip");
    auto strip = text.find("  strip");
    auto upper = text.find("  upper");
    ASSERT_NE(lower, std::string::npos);
    ASSERT_NE(upper, std::string::npos);
    EXPECT_LT(lower, redact);
    EXPECT_LT(redact, strip);
    EXPECT_LT(strip, upper);
}

TEST_F(CliRunTest, TransformsStdinToStdout) {
    int code = run_with({"linepipe", "redact_ip"}, "10.0.0.1 connected\nno ip here\n");

    EXPECT_EQ(code, EXIT_OK);
    EXPECT_EQ(out_.str(), "[REDACTED_IP] connected\nno ip here\n");
    EXPECT_EQ(err_.str(), "linepipe: 2 lines processed\n");
}

TEST_F(CliRunTest, ChainedSelectors) {
    int code = run_with({"linepipe", "-q", "strip,upper"}, "  host 10.1.2.3  \n");

    EXPECT_EQ(code, EXIT_OK);
    EXPECT_EQ(out_.str(), "HOST 10.1.2.3\n");
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliRunTest, UnknownSelectorRejectedBeforeReading) {
    int code = run_with({"linepipe", "rot13"}, "data\n");

    EXPECT_EQ(code, EXIT_USAGE_ERROR);
    EXPECT_NE(err_.str().find("unknown selector 'rot13'"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(static_cast<std::streamoff>(in_.tellg()), 0);
}

TEST_F(CliRunTest, MissingSelector) {
    EXPECT_EQ(run_with({"linepipe"}, "data\n"), EXIT_USAGE_ERROR);
    EXPECT_NE(err_.str().find("no transformation selected"), std::string::npos);
}

TEST_F(CliRunTest, FileInputAndOutput) {
    TempFile input;
    TempFile output;
    input.write("Alpha\nBeta");

    int code = run_with({"linepipe", "-q", "-i", input.path(), "-o", output.path(), "lower"});

    EXPECT_EQ(code, EXIT_OK);
    EXPECT_EQ(output.read(), "alpha\nbeta");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliRunTest, AppendOutput) {
    TempFile output;
    output.write("existing\n");

    int code = run_with({"linepipe", "-q", "-a", "-o", output.path(), "upper"}, "new\n");

    EXPECT_EQ(code, EXIT_OK);
    EXPECT_EQ(output.read(), "existing\nNEW\n");
}

TEST_F(CliRunTest, MissingInputFile) {
    int code = run_with({"linepipe", "-i", "/nonexistent/input.log", "upper"});

    EXPECT_EQ(code, EXIT_PROCESSING_FAILURE);
    EXPECT_NE(err_.str().find("/nonexistent/input.log"), std::string::npos);
}

TEST_F(CliRunTest, ConfigFileAndOverride) {
    TempFile config(".yaml");
    config.write("transforms: [upper]\nreport_count: false\n");

    EXPECT_EQ(run_with({"linepipe", "-c", config.path()}, "abc\n"), EXIT_OK);
    EXPECT_EQ(out_.str(), "ABC\n");
    EXPECT_TRUE(err_.str().empty());

    EXPECT_EQ(run_with({"linepipe", "-c", config.path(), "lower"}, "ABC\n"), EXIT_OK);
    EXPECT_EQ(out_.str(), "abc\n");
}

TEST_F(CliRunTest, ConfiguredLevelLogsTransformSummary) {
    TempFile config(".yaml");
    config.write("transforms: [upper]\nreport_count: false\nlogging:\n  level: info\n");

    EXPECT_EQ(run_with({"linepipe", "-c", config.path()}, "abc\n"), EXIT_OK);
    EXPECT_TRUE(logged(LogLevel::INFO, "Transform 'upper'"));
}

TEST_F(CliRunTest, CategoryLevelSilencesCategory) {
    TempFile config(".yaml");
    config.write("transforms: [upper]\nreport_count: false\n"
                 "logging:\n  level: info\n  categories:\n    cli: error\n");

    EXPECT_EQ(run_with({"linepipe", "-c", config.path()}, "abc\n"), EXIT_OK);
    EXPECT_EQ(out_.str(), "ABC\n");
    EXPECT_FALSE(logged(LogLevel::INFO, "Transform 'upper'"));
}

TEST_F(CliRunTest, UnknownLogCategoryRejected) {
    TempFile config(".json");
    config.write(R"({"transforms": "upper", "logging": {"categories": {"network": "debug"}}})");

    EXPECT_EQ(run_with({"linepipe", "-c", config.path()}, "abc\n"), EXIT_USAGE_ERROR);
    EXPECT_NE(err_.str().find("unknown log category 'network'"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliRunTest, ConfigFromEnvironment) {
    TempFile config(".json");
    config.write(R"({"transforms": "strip", "report_count": false})");
    setenv("LINEPIPE_CONFIG", config.path().c_str(), 1);

    EXPECT_EQ(run_with({"linepipe"}, "  x  \n"), EXIT_OK);
    EXPECT_EQ(out_.str(), "x\n");
}

TEST_F(CliRunTest, BadConfigFile) {
    EXPECT_EQ(run_with({"linepipe", "-c", "/nonexistent/linepipe.yaml", "upper"}),
              EXIT_USAGE_ERROR);
    EXPECT_NE(err_.str().find("configuration file not found"), std::string::npos);
}

TEST_F(CliRunTest, DumpConfig) {
    EXPECT_EQ(run_with({"linepipe", "--dump-config=json", "-o", "out.txt", "strip"}), EXIT_OK);

    const std::string text = out_.str();
    EXPECT_NE(text.find("\"output\" : \"out.txt\""), std::string::npos);
    EXPECT_NE(text.find("\"strip\""), std::string::npos);
}
