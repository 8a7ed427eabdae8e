#include "core/ArgumentParser.h"
#include "core/Config.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <string>

namespace lan_scan {

class ArgumentParserTest : public ::testing::Test {
protected:
    bool parse(std::initializer_list<const char*> args) {
        argv_.assign(args.begin(), args.end());
        return parser.parse(static_cast<int>(argv_.size()), const_cast<char**>(argv_.data()), cfg);
    }

    ArgumentParser parser;
    Config cfg;
    std::vector<const char*> argv_;
};

TEST_F(ArgumentParserTest, DefaultsWithoutArguments) {
    EXPECT_TRUE(parse({"lan-scan"}));
    EXPECT_TRUE(cfg.network_range.empty());
    EXPECT_EQ(cfg.scan_mode, "fast");
    EXPECT_EQ(cfg.threads, 0);
    EXPECT_EQ(cfg.timeout_seconds, 1);
    EXPECT_EQ(cfg.output_format, "table");
    EXPECT_FALSE(parser.exit_requested());
}

TEST_F(ArgumentParserTest, ParseScanOptions) {
    EXPECT_TRUE(parse({"lan-scan", "--range", "192.168.1.0/24", "--mode", "deep", "--threads", "16",
                       "--timeout", "3", "--attempts", "4"}));
    EXPECT_EQ(cfg.network_range, "192.168.1.0/24");
    EXPECT_EQ(cfg.scan_mode, "deep");
    EXPECT_EQ(cfg.threads, 16);
    EXPECT_EQ(cfg.timeout_seconds, 3);
    EXPECT_EQ(cfg.deep_attempts, 4);
}

TEST_F(ArgumentParserTest, ParseOutputOptions) {
    EXPECT_TRUE(parse({"lan-scan", "--output", "devices.json", "--format", "json", "--pretty", "--progress"}));
    EXPECT_EQ(cfg.output_file, "devices.json");
    EXPECT_EQ(cfg.output_format, "json");
    EXPECT_TRUE(cfg.pretty);
    EXPECT_TRUE(cfg.progress);
    EXPECT_FALSE(cfg.compact);
}

TEST_F(ArgumentParserTest, ParseMiscFlags) {
    EXPECT_TRUE(parse({"lan-scan", "--detect-only", "--log-level", "debug", "--drop-priv", "--compact"}));
    EXPECT_TRUE(cfg.detect_only);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_TRUE(cfg.drop_priv);
    EXPECT_TRUE(cfg.compact);
}

TEST_F(ArgumentParserTest, ParseHelpFlag) {
    testing::internal::CaptureStdout();
    EXPECT_FALSE(parse({"lan-scan", "--help"}));
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_TRUE(parser.exit_requested());
    EXPECT_EQ(parser.exit_code(), 0);
    EXPECT_THAT(out, ::testing::HasSubstr("--range VALUE"));
    EXPECT_THAT(out, ::testing::HasSubstr("--threads N"));
}

TEST_F(ArgumentParserTest, ParseVersionFlag) {
    testing::internal::CaptureStdout();
    EXPECT_FALSE(parse({"lan-scan", "--version"}));
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(parser.exit_code(), 0);
    EXPECT_THAT(out, ::testing::StartsWith("lan-scan "));
}

TEST_F(ArgumentParserTest, UnknownArgument) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"lan-scan", "--frobnicate"}));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(parser.exit_code(), 2);
    EXPECT_THAT(err, ::testing::HasSubstr("Unknown arg: --frobnicate"));
}

TEST_F(ArgumentParserTest, ParseMissingValues) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"lan-scan", "--range"}));
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(parser.exit_code(), 2);
}

TEST_F(ArgumentParserTest, ParseInvalidIntegers) {
    for (const char* bad : {"abc", "12x", "", "99999999999"}) {
        Config fresh;
        cfg = fresh;
        testing::internal::CaptureStderr();
        EXPECT_FALSE(parse({"lan-scan", "--threads", bad})) << bad;
        testing::internal::GetCapturedStderr();
        EXPECT_EQ(parser.exit_code(), 2) << bad;
        EXPECT_EQ(cfg.threads, 0) << bad;
    }
}

TEST_F(ArgumentParserTest, NegativeIntegerParsesForValidator) {
    EXPECT_TRUE(parse({"lan-scan", "--timeout", "-1"}));
    EXPECT_EQ(cfg.timeout_seconds, -1);
}

TEST_F(ArgumentParserTest, ParserIsReusable) {
    testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"lan-scan", "--bogus"}));
    testing::internal::GetCapturedStderr();
    EXPECT_TRUE(parse({"lan-scan", "--mode", "fast"}));
    EXPECT_FALSE(parser.exit_requested());
    EXPECT_EQ(parser.exit_code(), 0);
}

TEST_F(ArgumentParserTest, EffectiveSettingsFollowMode) {
    EXPECT_EQ(effective_threads(cfg), FAST_SCAN_THREADS);
    EXPECT_EQ(effective_attempts(cfg), 1);
    EXPECT_EQ(scan_mode_label(cfg), "Fast Scan");

    cfg.scan_mode = "deep";
    EXPECT_EQ(effective_threads(cfg), DEEP_SCAN_THREADS);
    EXPECT_EQ(effective_attempts(cfg), cfg.deep_attempts);
    EXPECT_EQ(scan_mode_label(cfg), "Deep Scan");

    cfg.threads = 7;
    EXPECT_EQ(effective_threads(cfg), 7);
}

} // namespace lan_scan
