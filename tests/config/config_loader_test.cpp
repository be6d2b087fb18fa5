#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include "sandbox/test_support.hpp"

namespace lrunbox::config {
namespace {

using sandbox::testing::ScopedEnv;
using sandbox::testing::ScratchFile;

TEST(LoadConfigTest, DefaultsWithoutFile) {
    const auto config = LoadConfig("/nonexistent/lrunbox/config.json");
    EXPECT_EQ(config.lrun.binary, "lrun");
    EXPECT_TRUE(config.lrun.path.empty());
    EXPECT_EQ(config.lrun.truncate, 4096u);
    EXPECT_FALSE(config.lrun.exact_exceed_match);
    EXPECT_EQ(config.logging.min_level, utils::LogLevel::kWarn);
    EXPECT_TRUE(config.defaults.empty());
}

TEST(LoadConfigTest, ReadsJsonFile) {
    ScratchFile file("config.json");
    file.Write(R"({
        "lrun": {"binary": "lrun2", "path": "/opt/lrun", "truncate": 16, "tempDir": "/var/tmp",
                 "exactExceedMatch": true},
        "logging": {"level": "debug"},
        "defaults": {"max_cpu_time": 1, "env": {"LANG": "C"}}
    })");
    const auto config = LoadConfig(file.path());
    EXPECT_EQ(config.lrun.binary, "lrun2");
    EXPECT_EQ(config.lrun.path, "/opt/lrun");
    EXPECT_EQ(config.lrun.truncate, 16u);
    EXPECT_EQ(config.lrun.temp_dir, "/var/tmp");
    EXPECT_TRUE(config.lrun.exact_exceed_match);
    EXPECT_EQ(config.logging.min_level, utils::LogLevel::kDebug);
    EXPECT_EQ(config.defaults.json(), options::Json::parse(R"({"max_cpu_time": 1, "env": [["LANG", "C"]]})"));
}

TEST(LoadConfigTest, BrokenFileKeepsDefaults) {
    ScratchFile file("broken.json");
    file.Write("{ not json");
    const auto config = LoadConfig(file.path());
    EXPECT_EQ(config.lrun.binary, "lrun");
    EXPECT_EQ(config.lrun.truncate, 4096u);
}

TEST(LoadConfigTest, IgnoresMistypedFields) {
    ScratchFile file("mistyped.json");
    file.Write(R"({"lrun": {"truncate": "big", "binary": 3}, "defaults": [1, 2]})");
    const auto config = LoadConfig(file.path());
    EXPECT_EQ(config.lrun.truncate, 4096u);
    EXPECT_EQ(config.lrun.binary, "lrun");
    EXPECT_TRUE(config.defaults.empty());
}

TEST(LoadConfigTest, EnvironmentOverridesFile) {
    ScratchFile file("env.json");
    file.Write(R"({"lrun": {"truncate": 16, "binary": "lrun2"}})");
    ScopedEnv truncate("LRUNBOX_LRUN__TRUNCATE", "32");
    ScopedEnv binary("LRUNBOX_LRUN_BINARY", "lrun3");
    ScopedEnv exact("LRUNBOX_LRUN__EXACT_EXCEED_MATCH", "yes");
    ScopedEnv level("LRUNBOX_LOG_LEVEL", "error");
    const auto config = LoadConfig(file.path());
    EXPECT_EQ(config.lrun.truncate, 32u);
    EXPECT_EQ(config.lrun.binary, "lrun3");
    EXPECT_TRUE(config.lrun.exact_exceed_match);
    EXPECT_EQ(config.logging.min_level, utils::LogLevel::kError);
}

TEST(LoadConfigTest, BadNumbersInEnvironmentAreIgnored) {
    ScopedEnv truncate("LRUNBOX_LRUN_TRUNCATE", "lots");
    EXPECT_EQ(LoadConfig("/nonexistent/lrunbox/config.json").lrun.truncate, 4096u);
}

}  // namespace
}  // namespace lrunbox::config
