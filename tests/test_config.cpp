/**
 * @file test_config.cpp
 * @brief Tests for the key = value configuration loader.
 *
 * Validates:
 *  - Defaults for every optional key
 *  - Comments, blank lines and [Key] bracket syntax
 *  - Validation of required and numeric keys
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "opcua_client/config.hpp"

using opcualogger::ConfigLoader;
using opcualogger::DataPointId;
using opcualogger::LoggerConfig;

namespace {

std::optional<LoggerConfig> parseText(const std::string& text) {
    std::istringstream input(text);
    return ConfigLoader::parse(input);
}

} // namespace

/**
 * @test Config_Minimal_UsesDefaults
 * @brief Only the URL is required; everything else has a default.
 */
TEST(ConfigLoader, Config_Minimal_UsesDefaults) {
    auto config = parseText("OPC_UA_URL = opc.tcp://10.0.5.76:4840\n");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->server_url, "opc.tcp://10.0.5.76:4840");
    EXPECT_EQ(config->security_mode, "None");
    EXPECT_FALSE(config->data_point.has_value());
    EXPECT_EQ(config->unit, "mbar");
    EXPECT_EQ(config->log_file, std::filesystem::path("pressure_log.txt"));
    EXPECT_DOUBLE_EQ(config->poll_interval_seconds, 10.0);
    EXPECT_DOUBLE_EQ(config->connect_timeout_seconds, 5.0);
    EXPECT_DOUBLE_EQ(config->reconnect_base_seconds, 1.0);
    EXPECT_DOUBLE_EQ(config->reconnect_max_seconds, 30.0);
    EXPECT_TRUE(config->reconnect_jitter);
    EXPECT_EQ(config->max_browse_depth, 8u);
    EXPECT_EQ(config->browse_root, DataPointId::objectsFolder());
    EXPECT_FALSE(config->timestamp_utc);
    EXPECT_TRUE(config->verbose);
}

/**
 * @test Config_Full_AllKeys
 * @brief Every key is read, including bracketed keys and comments.
 */
TEST(ConfigLoader, Config_Full_AllKeys) {
    auto config = parseText(
        "# telemetry logger\n"
        "\n"
        "[OPC_UA_URL] = opc.tcp://[::1]:48010\n"
        "OPC_UA_SecurityMode = SignAndEncrypt\n"
        "OPC_UA_Username = operator\n"
        "OPC_UA_Password = s3cret\n"
        "DataPointId = ns=1;s=G1_pressure\n"
        "Unit = Pa\n"
        "LogFile = /var/log/pressure.txt\n"
        "PollIntervalSeconds = 0.5\n"
        "ConnectTimeoutSeconds = 2\n"
        "ReconnectBaseSeconds = 0.25\n"
        "ReconnectMaxSeconds = 60\n"
        "ReconnectJitter = false\n"
        "MaxBrowseDepth = 3\n"
        "BrowseRoot = ns=2;i=1000\n"
        "TimestampUtc = yes\n"
        "Verbose = 0\n");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->server_url, "opc.tcp://[::1]:48010");
    EXPECT_EQ(config->security_mode, "SignAndEncrypt");
    EXPECT_EQ(config->username, "operator");
    EXPECT_EQ(config->password, "s3cret");
    ASSERT_TRUE(config->data_point.has_value());
    EXPECT_EQ(*config->data_point, DataPointId(1, std::string("G1_pressure")));
    EXPECT_EQ(config->unit, "Pa");
    EXPECT_EQ(config->log_file, std::filesystem::path("/var/log/pressure.txt"));
    EXPECT_DOUBLE_EQ(config->poll_interval_seconds, 0.5);
    EXPECT_DOUBLE_EQ(config->connect_timeout_seconds, 2.0);
    EXPECT_DOUBLE_EQ(config->reconnect_base_seconds, 0.25);
    EXPECT_DOUBLE_EQ(config->reconnect_max_seconds, 60.0);
    EXPECT_FALSE(config->reconnect_jitter);
    EXPECT_EQ(config->max_browse_depth, 3u);
    EXPECT_EQ(config->browse_root, DataPointId(2, static_cast<uint32_t>(1000)));
    EXPECT_TRUE(config->timestamp_utc);
    EXPECT_FALSE(config->verbose);
}

/**
 * @test Config_MissingUrl_Fails
 */
TEST(ConfigLoader, Config_MissingUrl_Fails) {
    EXPECT_FALSE(parseText("DataPointId = ns=1;s=G1_pressure\n").has_value());
}

/**
 * @test Config_InvalidValues_Fail
 * @brief Non-positive intervals, inverted backoff and bad ids are rejected.
 */
TEST(ConfigLoader, Config_InvalidValues_Fail) {
    const std::string url = "OPC_UA_URL = opc.tcp://host:4840\n";

    EXPECT_FALSE(parseText(url + "PollIntervalSeconds = 0\n").has_value());
    EXPECT_FALSE(parseText(url + "PollIntervalSeconds = -1\n").has_value());
    EXPECT_FALSE(parseText(url + "ConnectTimeoutSeconds = 0\n").has_value());
    EXPECT_FALSE(parseText(url + "ReconnectBaseSeconds = 10\nReconnectMaxSeconds = 5\n").has_value());
    EXPECT_FALSE(parseText(url + "MaxBrowseDepth = 0\n").has_value());
    EXPECT_FALSE(parseText(url + "DataPointId = G1_pressure\n").has_value());
    EXPECT_FALSE(parseText(url + "BrowseRoot = Objects\n").has_value());
    EXPECT_FALSE(parseText(url + "LogFile =\n").has_value());
}

/**
 * @test Config_OutOfRangeNumbers_Fail
 * @brief Non-finite, oversized and negative numeric values are rejected.
 */
TEST(ConfigLoader, Config_OutOfRangeNumbers_Fail) {
    const std::string url = "OPC_UA_URL = opc.tcp://host:4840\n";

    EXPECT_FALSE(parseText(url + "ConnectTimeoutSeconds = inf\n").has_value());
    EXPECT_FALSE(parseText(url + "ConnectTimeoutSeconds = 1e12\n").has_value());
    EXPECT_FALSE(parseText(url + "PollIntervalSeconds = nan\n").has_value());
    EXPECT_FALSE(parseText(url + "ReconnectBaseSeconds = 1e300\nReconnectMaxSeconds = 1e300\n").has_value());
    EXPECT_FALSE(parseText(url + "ReconnectMaxSeconds = 86401\n").has_value());
    EXPECT_FALSE(parseText(url + "MaxBrowseDepth = -1\n").has_value());
    EXPECT_FALSE(parseText(url + "MaxBrowseDepth = 4294967296\n").has_value());

    auto config = parseText(url + "ReconnectMaxSeconds = 86400\nMaxBrowseDepth = 1000\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->reconnect_max_seconds, 86400.0);
    EXPECT_EQ(config->max_browse_depth, 1000u);
}

/**
 * @test Config_UnparsableNumber_KeepsDefault
 * @brief Garbage in a numeric key is reported and the default stays in force.
 */
TEST(ConfigLoader, Config_UnparsableNumber_KeepsDefault) {
    auto config = parseText("OPC_UA_URL = opc.tcp://host:4840\nPollIntervalSeconds = 10s\nUnknownKey = 1\n");

    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->poll_interval_seconds, 10.0);
}

/**
 * @test Config_LoadFromFile
 * @brief File loading reads the same format; a missing file fails.
 */
TEST(ConfigLoader, Config_LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "opcua_logger_test_config.conf";
    {
        std::ofstream out(path);
        out << "OPC_UA_URL = opc.tcp://host:4840\n";
        out << "DataPointId = ns=3;i=42\n";
    }

    auto config = ConfigLoader::loadFromFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(*config->data_point, DataPointId(3, static_cast<uint32_t>(42)));
    EXPECT_FALSE(ConfigLoader::loadFromFile(path).has_value());
}
