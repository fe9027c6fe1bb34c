#include <gtest/gtest.h>
#include "tradebook/config.hpp"
#include "tradebook/logging.hpp"
#include <fstream>
#include <stdexcept>

namespace {

std::string write_temp(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(ConfigTest, DefaultsPointAtVenue) {
    tradebook::Config config;
    EXPECT_EQ(config.api_url, "https://api.hyperliquid.xyz/info");
    EXPECT_EQ(config.engine_workers, 1u);
    EXPECT_EQ(config.enrich_workers, 4u);
    EXPECT_EQ(config.http_timeout_sec, 30);
    EXPECT_EQ(config.log_level, "info");
}

TEST(ConfigTest, FileOverridesOnlyGivenKeys) {
    auto path = write_temp("tradebook_config.json", R"({"enrich_workers": 8, "log_level": "debug"})");

    auto config = tradebook::load_config(path);
    EXPECT_EQ(config.enrich_workers, 8u);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.engine_workers, 1u);
    EXPECT_EQ(config.api_url, "https://api.hyperliquid.xyz/info");
}

TEST(ConfigTest, BadFilesThrow) {
    EXPECT_THROW(tradebook::load_config(::testing::TempDir() + "does_not_exist.json"), std::runtime_error);
    EXPECT_THROW(tradebook::load_config(write_temp("tradebook_broken.json", "{not json")), std::runtime_error);
    EXPECT_THROW(tradebook::load_config(write_temp("tradebook_array.json", "[1, 2]")), std::runtime_error);
}

TEST(ConfigTest, UnknownLogLevelIsRejected) {
    EXPECT_THROW(tradebook::load_config(write_temp("tradebook_level.json", R"({"log_level": "verbose"})")),
                 std::runtime_error);
    EXPECT_THROW(tradebook::set_log_level("verbose"), std::runtime_error);
    EXPECT_THROW(tradebook::set_log_level("Info"), std::runtime_error);
}

TEST(ConfigTest, KnownLogLevelsAreAccepted) {
    for (const char* level : {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"}) {
        EXPECT_TRUE(tradebook::is_log_level(level)) << level;
    }
    EXPECT_NO_THROW(tradebook::set_log_level("off"));
    EXPECT_NO_THROW(tradebook::set_log_level("info"));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
