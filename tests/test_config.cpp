#include "testing.hpp"
#include "util/config.hpp"

#include <cerrno>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace {

TEST(EngineConfigTests, EmptyObjectKeepsDefaults) {
    ddi::EngineConfig cfg;
    auto r = ddi::EngineConfig::LoadFromString("{}", cfg);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(cfg.log_file, "ddi.log");
    EXPECT_EQ(cfg.log_level, ddi::LogLevel::Info);
    EXPECT_EQ(cfg.log_retention, 500u);
    EXPECT_EQ(cfg.cancel_grace_ms, 5000u);
    EXPECT_EQ(cfg.kill_wait_ms, 2000u);
    EXPECT_EQ(cfg.render_interval_ms, 250u);
    EXPECT_DOUBLE_EQ(cfg.rate_window_seconds, 10.0);
    EXPECT_EQ(cfg.rate_window_samples, 64u);
    EXPECT_EQ(cfg.block_size, 65536u);
    EXPECT_EQ(cfg.default_view, ddi::ViewMode::ProgressBar);
    EXPECT_EQ(cfg.map_rows, 1u);
    EXPECT_TRUE(cfg.color);
}

TEST(EngineConfigTests, ParsesAllKeys) {
    const std::string text = R"({
        "LogFile": "/var/log/ddi.log",
        "LogLevel": "debug",
        "LogRetention": 100,
        "CancelGracePeriodMs": 1500,
        "KillWaitMs": 500,
        "RenderIntervalMs": 100,
        "RateWindowSeconds": 2.5,
        "RateWindowSamples": 8,
        "BlockSize": "1M",
        "DefaultView": "blockmap",
        "MapRows": 4,
        "Color": false
    })";

    ddi::EngineConfig cfg;
    auto r = ddi::EngineConfig::LoadFromString(text, cfg);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(cfg.log_file, "/var/log/ddi.log");
    EXPECT_EQ(cfg.log_level, ddi::LogLevel::Debug);
    EXPECT_EQ(cfg.log_retention, 100u);
    EXPECT_EQ(cfg.cancel_grace_ms, 1500u);
    EXPECT_EQ(cfg.kill_wait_ms, 500u);
    EXPECT_EQ(cfg.render_interval_ms, 100u);
    EXPECT_DOUBLE_EQ(cfg.rate_window_seconds, 2.5);
    EXPECT_EQ(cfg.rate_window_samples, 8u);
    EXPECT_EQ(cfg.block_size, 1048576u);
    EXPECT_EQ(cfg.default_view, ddi::ViewMode::BlockMap);
    EXPECT_EQ(cfg.map_rows, 4u);
    EXPECT_FALSE(cfg.color);
}

TEST(EngineConfigTests, InvalidValueLeavesConfigUntouched) {
    ddi::EngineConfig cfg;
    cfg.kill_wait_ms = 42;
    auto r = ddi::EngineConfig::LoadFromString(R"({"KillWaitMs": 1, "MapRows": 17})", cfg);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("MapRows"), std::string::npos);
    EXPECT_EQ(cfg.kill_wait_ms, 42u);
}

TEST(EngineConfigTests, RejectsBadTypesAndValues) {
    ddi::EngineConfig cfg;
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"({"KillWaitMs": "soon"})", cfg).ok);
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"({"KillWaitMs": -1})", cfg).ok);
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"({"RenderIntervalMs": 5})", cfg).ok);
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"({"RateWindowSeconds": 0})", cfg).ok);
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"({"RateWindowSamples": 1})", cfg).ok);
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"({"BlockSize": "lots"})", cfg).ok);
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"({"DefaultView": "tree"})", cfg).ok);
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"({"LogLevel": "loud"})", cfg).ok);
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"({"Color": "yes"})", cfg).ok);
    EXPECT_FALSE(ddi::EngineConfig::LoadFromString(R"([1, 2])", cfg).ok);
}

TEST(EngineConfigTests, MalformedJsonFails) {
    ddi::EngineConfig cfg;
    auto r = ddi::EngineConfig::LoadFromString("{ not json", cfg);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("invalid JSON"), std::string::npos);
}

TEST(EngineConfigTests, LoadFromFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/ddi.json";
    {
        std::ofstream os(path);
        os << R"({"BlockSize": "4K", "DefaultView": "map"})";
    }

    ddi::EngineConfig cfg;
    auto r = ddi::EngineConfig::LoadFromFile(path, cfg);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.block_size, 4096u);
    EXPECT_EQ(cfg.default_view, ddi::ViewMode::BlockMap);
}

TEST(EngineConfigTests, MissingFileReportsENOENT) {
    testutil::TemporaryDirectory tmp;
    ddi::EngineConfig cfg;
    auto r = ddi::EngineConfig::LoadFromFile(tmp.Path() + "/absent.json", cfg);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ENOENT);
}

TEST(EngineConfigTests, UnreadableFileKeepsItsErrno) {
    testutil::TemporaryDirectory tmp;
    ddi::EngineConfig cfg;
    // A directory opens but cannot be read, so this is not "missing".
    auto r = ddi::EngineConfig::LoadFromFile(tmp.Path(), cfg);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, EISDIR) << r.msg;
}

} // namespace
