#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "nectar/core/config.hpp"
#include "nectar/core/errors.hpp"
#include "nectar/core/log.hpp"

using namespace nectar::core;

namespace {

class EnvGuard {
public:
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }

private:
    static void clear() {
        unsetenv("NECTAR_BLOCK_TIME");
        unsetenv("NECTAR_BUCKET_DEPTH");
        unsetenv("NECTAR_LOG_LEVEL");
    }
};

struct CapturedLine {
    LogLevel level;
    std::string component;
    std::string message;
};

void capture_sink(LogLevel level, const char* component, const char* message, void* user) {
    static_cast<std::vector<CapturedLine>*>(user)->push_back(CapturedLine{level, component, message});
}

} // namespace

//====================================================================
// Environment
//====================================================================

TEST(Config, Defaults) {
    EnvGuard env;
    NetworkConfig cfg{};
    cfg.block_time_seconds = 99;
    ASSERT_EQ(config_from_env(&cfg).code, StatusCode::Ok);
    EXPECT_EQ(cfg.block_time_seconds, 5u);
    EXPECT_EQ(cfg.default_bucket_depth, 16);
    EXPECT_EQ(cfg.log_level, LogLevel::Warn);
}

TEST(Config, ReadsOverrides) {
    EnvGuard env;
    setenv("NECTAR_BLOCK_TIME", "12", 1);
    setenv("NECTAR_BUCKET_DEPTH", "20", 1);
    setenv("NECTAR_LOG_LEVEL", "debug", 1);
    NetworkConfig cfg{};
    ASSERT_EQ(config_from_env(&cfg).code, StatusCode::Ok);
    EXPECT_EQ(cfg.block_time_seconds, 12u);
    EXPECT_EQ(cfg.default_bucket_depth, 20);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST(Config, EmptyVariablesAreIgnored) {
    EnvGuard env;
    setenv("NECTAR_BLOCK_TIME", "", 1);
    NetworkConfig cfg{};
    ASSERT_EQ(config_from_env(&cfg).code, StatusCode::Ok);
    EXPECT_EQ(cfg.block_time_seconds, 5u);
}

TEST(Config, RejectsMalformedValues) {
    struct Case {
        const char* name;
        const char* value;
        ConfigKey key;
    };
    const Case cases[] = {
        {"NECTAR_BLOCK_TIME", "0", ConfigKey::BlockTime},
        {"NECTAR_BLOCK_TIME", "5s", ConfigKey::BlockTime},
        {"NECTAR_BUCKET_DEPTH", "15", ConfigKey::BucketDepth},
        {"NECTAR_BUCKET_DEPTH", "33", ConfigKey::BucketDepth},
        {"NECTAR_LOG_LEVEL", "verbose", ConfigKey::Log},
    };
    for (const Case& c : cases) {
        EnvGuard env;
        setenv(c.name, c.value, 1);
        NetworkConfig cfg{};
        const Status s = config_from_env(&cfg);
        EXPECT_EQ(s.code, StatusCode::Invalid) << c.name << "=" << c.value;
        EXPECT_EQ(s.aux, static_cast<u32>(c.key)) << c.name << "=" << c.value;
    }
}

TEST(Config, NullOut) {
    EXPECT_EQ(config_from_env(nullptr).code, StatusCode::Invalid);
}

//====================================================================
// Logging
//====================================================================

TEST(Log, LevelNames) {
    LogLevel level{};
    ASSERT_TRUE(log_level_parse("trace", &level));
    EXPECT_EQ(level, LogLevel::Trace);
    ASSERT_TRUE(log_level_parse("off", &level));
    EXPECT_EQ(level, LogLevel::Off);
    EXPECT_FALSE(log_level_parse("WARN", &level));
    EXPECT_FALSE(log_level_parse(nullptr, &level));
    EXPECT_STREQ(log_level_name(LogLevel::Error), "error");
}

TEST(Log, SinkReceivesEnabledLines) {
    std::vector<CapturedLine> lines;
    const LogLevel saved = log_level();
    log_set_sink(capture_sink, &lines);

    NetworkConfig cfg = default_network_config();
    cfg.log_level = LogLevel::Info;
    config_apply(cfg);

    log_debug("test", "dropped %d", 1);
    log_info("test", "kept %d", 2);
    log_error("other", "kept %s", "too");

    log_set_sink(nullptr, nullptr);
    log_set_level(saved);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].level, LogLevel::Info);
    EXPECT_EQ(lines[0].component, "test");
    EXPECT_EQ(lines[0].message, "kept 2");
    EXPECT_EQ(lines[1].component, "other");
    EXPECT_EQ(lines[1].message, "kept too");
}

TEST(Log, WriteBypassesLevelGate) {
    std::vector<CapturedLine> lines;
    const LogLevel saved = log_level();
    log_set_sink(capture_sink, &lines);
    log_set_level(LogLevel::Error);

    log_warn("gated", "dropped");
    log_write(LogLevel::Debug, nullptr, "direct %d", 3);

    log_set_sink(nullptr, nullptr);
    log_set_level(saved);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].level, LogLevel::Debug);
    EXPECT_EQ(lines[0].component, "-");
    EXPECT_EQ(lines[0].message, "direct 3");
}

TEST(Log, OffDisablesEverything) {
    const LogLevel saved = log_level();
    log_set_level(LogLevel::Off);
    EXPECT_FALSE(log_enabled(LogLevel::Error));
    log_set_level(LogLevel::Trace);
    EXPECT_TRUE(log_enabled(LogLevel::Trace));
    EXPECT_FALSE(log_enabled(LogLevel::Off));
    log_set_level(saved);
}

//====================================================================
// Status names
//====================================================================

TEST(Status, Names) {
    EXPECT_STREQ(status_code_name(StatusCode::Ok), "ok");
    EXPECT_STREQ(status_code_name(StatusCode::BucketFull), "bucket full");
    EXPECT_STREQ(status_code_name(StatusCode::StampUsed), "stamp already used");
    EXPECT_STREQ(status_domain_name(StatusDomain::Postage), "postage");
    EXPECT_STREQ(status_domain_name(StatusDomain::External), "external");
}

TEST(Status, MakeStatus) {
    const Status s = make_status(StatusDomain::Chunk, StatusCode::SizeExceeded, 4097, 4096);
    EXPECT_FALSE(is_ok(s));
    EXPECT_EQ(s.domain, StatusDomain::Chunk);
    EXPECT_EQ(s.aux, 4097u);
    EXPECT_EQ(s.limit, 4096u);
    EXPECT_TRUE(is_ok(ok_status()));
}
