#include "umpcore/base64.hpp"
#include "umpcore/cli_colors.hpp"
#include "umpcore/config.hpp"
#include "umpcore/env.hpp"
#include "umpcore/errors.hpp"
#include "umpcore/log.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>

namespace umpcore::test {
namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) { setenv(name, value, 1); }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

TEST(EnvTest, FlagsAndSizes) {
    ScopedEnv on("UMPCORE_TEST_FLAG", "Yes");
    ScopedEnv size("UMPCORE_TEST_SIZE", "4096");
    ScopedEnv junk("UMPCORE_TEST_JUNK", "lots");
    EXPECT_TRUE(env::IsEnabled("UMPCORE_TEST_FLAG", false));
    EXPECT_FALSE(env::IsEnabled("UMPCORE_TEST_UNSET", false));
    EXPECT_TRUE(env::IsEnabled("UMPCORE_TEST_UNSET", true));
    EXPECT_EQ(env::GetSize("UMPCORE_TEST_SIZE", 1), 4096u);
    EXPECT_EQ(env::GetSize("UMPCORE_TEST_JUNK", 7), 7u);
    EXPECT_EQ(env::Get("UMPCORE_TEST_UNSET"), "");
}

TEST(ConfigTest, DefaultsWithoutEnvironment) {
    Config config = Config::FromEnv();
    EXPECT_FALSE(config.lenient);
    EXPECT_EQ(config.continuation, ContinuationFraming::kReframed);
    EXPECT_TRUE(config.retain_media);
    EXPECT_EQ(config.chunk_size, constants::kStreamChunkSize);
}

TEST(ConfigTest, ReadsEnvironment) {
    ScopedEnv lenient("UMPCORE_LENIENT", "1");
    ScopedEnv framing("UMPCORE_CONTINUATION", "RAW");
    ScopedEnv retain("UMPCORE_RETAIN_MEDIA", "off");
    ScopedEnv chunk("UMPCORE_CHUNK_SIZE", "1024");
    ScopedEnv level("UMPCORE_LOG_LEVEL", "debug");
    Config config = Config::FromEnv();
    EXPECT_TRUE(config.lenient);
    EXPECT_EQ(config.continuation, ContinuationFraming::kRaw);
    EXPECT_FALSE(config.retain_media);
    EXPECT_EQ(config.chunk_size, 1024u);
    EXPECT_EQ(config.log_level, log::Level::kDebug);
}

TEST(ConfigTest, UnknownFramingKeepsDefault) {
    ScopedEnv framing("UMPCORE_CONTINUATION", "sideways");
    std::ostringstream sink;
    log::SetSink(&sink);
    Config config = Config::FromEnv();
    log::SetSink(nullptr);
    EXPECT_EQ(config.continuation, ContinuationFraming::kReframed);
    EXPECT_NE(sink.str().find("sideways"), std::string::npos);
    EXPECT_EQ(ContinuationFramingName(ContinuationFraming::kRaw), "raw");
}

TEST(LogTest, ThresholdFiltersLines) {
    std::ostringstream sink;
    log::SetSink(&sink);
    log::Level saved = log::Threshold();
    log::SetThreshold(log::Level::kWarn);
    log::Info("quiet line");
    log::Warn("loud line");
    log::SetThreshold(saved);
    log::SetSink(nullptr);
    EXPECT_EQ(sink.str().find("quiet line"), std::string::npos);
    EXPECT_NE(sink.str().find("loud line"), std::string::npos);
    EXPECT_NE(sink.str().find("warn"), std::string::npos);
    EXPECT_EQ(log::ParseLevel("WARNING").value_or(log::Level::kOff), log::Level::kWarn);
    EXPECT_FALSE(log::ParseLevel("loud").has_value());
}

TEST(ColorsTest, DisabledColorsLeaveTextAlone) {
    cli::SetColorsEnabled(false);
    EXPECT_EQ(cli::Red("plain"), "plain");
    cli::SetColorsEnabled(true);
    EXPECT_EQ(cli::Red("plain"), std::string(cli::color::RED) + "plain" + cli::color::RESET);
    cli::SetColorsEnabled(false);
}

TEST(Base64Test, StandardAndUrlSafe) {
    const std::vector<std::uint8_t> data = {0xFB, 0xFF, 0x00, 0x10, 0x3E};
    std::string encoded = base64::Encode(data);
    EXPECT_EQ(encoded, "+/8AED4=");
    EXPECT_EQ(base64::Decode(encoded), data);
    EXPECT_EQ(base64::Decode("-_8AED4"), data);
    EXPECT_EQ(base64::Encode({'f', 'o', 'o', 'b'}), "Zm9vYg==");

    bool ok = true;
    EXPECT_TRUE(base64::Decode("not*base64", &ok).empty());
    EXPECT_FALSE(ok);
    EXPECT_THROW(base64::DecodeOrThrow("abcde", "key"), std::runtime_error);
}

TEST(ErrorsTest, KindNames) {
    UmpError err(ErrorKind::kAuthenticationFailed, "bad mac");
    EXPECT_EQ(err.kind(), ErrorKind::kAuthenticationFailed);
    EXPECT_STREQ(err.what(), "bad mac");
    EXPECT_EQ(ErrorKindName(ErrorKind::kTruncatedInput), "truncated_input");
    EXPECT_EQ(ErrorKindName(ErrorKind::kUnknownHeaderId), "unknown_header_id");
}

}  // namespace
}  // namespace umpcore::test
