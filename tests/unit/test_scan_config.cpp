#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "scan_config.h"

using namespace sectorscan;
using sectorscan::outliers::Universe;

class ScanConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("DB_CONNECTION_STRING");
        unsetenv("SECTORSCAN_UNIVERSE");
    }

    void TearDown() override {
        unsetenv("DB_CONNECTION_STRING");
        unsetenv("SECTORSCAN_UNIVERSE");
    }

    ScanConfig Parse(std::vector<const char*> args) {
        args.insert(args.begin(), "outlier_scan");
        return ParseScanArgs(static_cast<int>(args.size()), args.data());
    }
};

TEST_F(ScanConfigTest, Defaults) {
    auto config = Parse({});
    EXPECT_EQ(config.universe, Universe::Sp500);
    EXPECT_FALSE(config.threshold.has_value());
    EXPECT_FALSE(config.sector_id.has_value());
    EXPECT_TRUE(config.input_path.empty());
    EXPECT_EQ(config.pool_size, 4u);
    EXPECT_EQ(config.max_parallel_sectors, 1u);
    EXPECT_TRUE(config.persist);
    EXPECT_EQ(config.log_level, spdlog::level::info);
    EXPECT_FALSE(config.show_help);
}

TEST_F(ScanConfigTest, ParsesAllFlags) {
    auto config = Parse({"--universe", "russell2000", "--threshold", "2.5", "--sector_id", "8",
                         "--input", "rows.json", "--output", "out.json", "--db_conn", "host=db",
                         "--pool_size", "6", "--parallel", "3", "--no_persist", "--log_level", "debug"});

    EXPECT_EQ(config.universe, Universe::Russell2000);
    EXPECT_DOUBLE_EQ(*config.threshold, 2.5);
    EXPECT_EQ(*config.sector_id, 8);
    EXPECT_EQ(config.input_path, "rows.json");
    EXPECT_EQ(config.output_path, "out.json");
    EXPECT_EQ(config.db_conn_str, "host=db");
    EXPECT_EQ(config.pool_size, 6u);
    EXPECT_EQ(config.max_parallel_sectors, 3u);
    EXPECT_FALSE(config.persist);
    EXPECT_EQ(config.log_level, spdlog::level::debug);
}

TEST_F(ScanConfigTest, EnvironmentThenFlags) {
    setenv("DB_CONNECTION_STRING", "host=from_env", 1);
    setenv("SECTORSCAN_UNIVERSE", "russell2000", 1);

    auto config = Parse({});
    EXPECT_EQ(config.db_conn_str, "host=from_env");
    EXPECT_EQ(config.universe, Universe::Russell2000);

    config = Parse({"--universe", "sp500", "--db_conn", "host=flag"});
    EXPECT_EQ(config.db_conn_str, "host=flag");
    EXPECT_EQ(config.universe, Universe::Sp500);
}

TEST_F(ScanConfigTest, BadEnvironmentUniverseThrows) {
    setenv("SECTORSCAN_UNIVERSE", "nasdaq", 1);
    EXPECT_THROW(Parse({}), std::invalid_argument);
}

TEST_F(ScanConfigTest, RejectsBadThreshold) {
    EXPECT_THROW(Parse({"--threshold", "0"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--threshold", "-1.5"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--threshold", "abc"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--threshold", "1.5x"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--threshold"}), std::invalid_argument);
}

TEST_F(ScanConfigTest, RejectsBadCounts) {
    EXPECT_THROW(Parse({"--pool_size", "0"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--parallel", "-2"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--sector_id", "eight"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--sector_id", "4294967298"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--sector_id", "-4294967297"}), std::invalid_argument);
    EXPECT_EQ(*Parse({"--sector_id", "2147483647"}).sector_id, 2147483647);
}

TEST_F(ScanConfigTest, RejectsUnknownInput) {
    EXPECT_THROW(Parse({"--universe", "ftse100"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--log_level", "loud"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--verbose"}), std::invalid_argument);
}

TEST_F(ScanConfigTest, HelpFlag) {
    EXPECT_TRUE(Parse({"-h"}).show_help);
    EXPECT_TRUE(Parse({"--help"}).show_help);
    EXPECT_NE(ScanUsage().find("--threshold"), std::string::npos);
}
