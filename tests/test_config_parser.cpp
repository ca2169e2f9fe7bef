#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/config_parser.hpp"

#include <string>

namespace janitor::config {
namespace {

TEST(ConfigParserTest, LoadsAllKeys) {
    JanitorConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadString(R"({
        "UploadsRoot": "/srv/api/data/uploads",
        "LogLevel": "debug",
        "LogFile": "/var/log/janitor.log",
        "SortResults": true
    })")) << cfg.LastError();

    EXPECT_EQ(cfg.uploads_root.value_or(""), "/srv/api/data/uploads");
    EXPECT_EQ(cfg.log_level.value_or(""), "debug");
    EXPECT_EQ(cfg.log_file.value_or(""), "/var/log/janitor.log");
    EXPECT_TRUE(cfg.sort_results.value_or(false));
    EXPECT_EQ(cfg.EffectiveUploadsRoot(), "/srv/api/data/uploads");
}

TEST(ConfigParserTest, BaseDirDerivesUploadsRoot) {
    JanitorConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadString(R"({"BaseDir": "/srv/api"})"));
    EXPECT_FALSE(cfg.uploads_root.has_value());
    EXPECT_EQ(cfg.EffectiveUploadsRoot(), "/srv/api/data/uploads");
}

TEST(ConfigParserTest, UploadsRootWinsOverBaseDir) {
    JanitorConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadString(R"({"BaseDir": "/srv/api", "UploadsRoot": "/mnt/uploads"})"));
    EXPECT_EQ(cfg.EffectiveUploadsRoot(), "/mnt/uploads");
}

TEST(ConfigParserTest, RejectsBadInput) {
    JanitorConfigFromFile cfg;

    EXPECT_FALSE(cfg.LoadString("not json"));
    EXPECT_NE(cfg.LastError().find("invalid JSON"), std::string::npos);

    EXPECT_FALSE(cfg.LoadString("[1, 2]"));
    EXPECT_NE(cfg.LastError().find("JSON object"), std::string::npos);

    EXPECT_FALSE(cfg.LoadString(R"({"SortResults": "yes"})"));
    EXPECT_NE(cfg.LastError().find("SortResults"), std::string::npos);

    EXPECT_FALSE(cfg.LoadString(R"({"LogLevel": "chatty"})"));
    EXPECT_NE(cfg.LastError().find("LogLevel"), std::string::npos);

    EXPECT_FALSE(cfg.LoadString(R"({"UploadsRoot": ""})"));
}

TEST(ConfigParserTest, LoadFile) {
    testutil::TemporaryDirectory tmp;
    const auto path = tmp.Path() / "janitor.conf";
    testutil::WriteFile(path, R"({"UploadsRoot": "/data/uploads", "LogLevel": "WARN"})");

    JanitorConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadFile(path.string())) << cfg.LastError();
    EXPECT_EQ(cfg.EffectiveUploadsRoot(), "/data/uploads");
    EXPECT_EQ(cfg.log_level.value_or(""), "WARN");
}

TEST(ConfigParserTest, LoadFileMissing) {
    JanitorConfigFromFile cfg;
    EXPECT_FALSE(cfg.LoadFile("/nonexistent/janitor.conf"));
    EXPECT_NE(cfg.LastError().find("cannot open"), std::string::npos);
    EXPECT_EQ(cfg.EffectiveUploadsRoot(), "");
}

} // namespace
} // namespace janitor::config
