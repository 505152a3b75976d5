#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include "config_loader.hpp"

TEST(ConfigLoader, ParsesDottedKeysCommentsAndQuotes)
{
    std::istringstream in(
        "# trigger box\n"
        "serial.port: \"/dev/ttyACM1\"\n"
        "\n"
        "  serial.baud : 57600\n"
        "debug.verbose: 'true'\n"
        "not a key value line\n");
    ConfigMap cfg = parseConfig(in);
    EXPECT_EQ(cfg.size(), 3u);
    EXPECT_EQ(cfgStr(cfg, "serial.port", ""), "/dev/ttyACM1");
    EXPECT_EQ(cfgInt(cfg, "serial.baud", 0), 57600);
    EXPECT_TRUE(cfgBool(cfg, "debug.verbose", false));
}

TEST(ConfigLoader, MalformedValuesFallBackToDefaults)
{
    std::istringstream in(
        "sender.write_retries: three\n"
        "sender.retry_delay_ms: 5ms\n"
        "serial.emulate_on_fail: maybe\n");
    ConfigMap cfg = parseConfig(in);
    EXPECT_EQ(cfgInt(cfg, "sender.write_retries", 3), 3);
    EXPECT_EQ(cfgInt(cfg, "sender.retry_delay_ms", 2), 2);
    EXPECT_TRUE(cfgBool(cfg, "serial.emulate_on_fail", true));
    EXPECT_EQ(cfgStr(cfg, "missing", "fallback"), "fallback");
}

TEST(ConfigLoader, BuildsDispatcherConfig)
{
    std::istringstream in(
        "serial.port: /dev/ttyS3\n"
        "serial.baud: 9600\n"
        "serial.emulate_on_fail: false\n"
        "sender.write_retries: -4\n"
        "sender.retry_delay_ms: 10\n"
        "sender.write_timeout_ms: 0\n");
    DispatcherConfig dc = dispatcherConfigFrom(parseConfig(in));
    EXPECT_EQ(dc.port, "/dev/ttyS3");
    EXPECT_EQ(dc.baudRate, 9600);
    EXPECT_FALSE(dc.emulateOnFail);
    EXPECT_EQ(dc.writeRetries, 0);
    EXPECT_EQ(dc.retryDelayMs, 10);
    EXPECT_EQ(dc.writeTimeoutMs, 1);
    EXPECT_FALSE(dc.verbose);
}

TEST(ConfigLoader, EmptyMapGivesDefaults)
{
    DispatcherConfig dc = dispatcherConfigFrom(ConfigMap());
    DispatcherConfig def;
    EXPECT_EQ(dc.port, def.port);
    EXPECT_EQ(dc.baudRate, def.baudRate);
    EXPECT_EQ(dc.writeRetries, def.writeRetries);
    EXPECT_EQ(dc.writeTimeoutMs, def.writeTimeoutMs);
}

TEST(ConfigLoader, UsesFirstExistingCandidate)
{
    std::string first = ::testing::TempDir() + "portcode_cfg_first.yaml";
    std::string second = ::testing::TempDir() + "portcode_cfg_second.yaml";
    {
        std::ofstream out(first, std::ios::trunc);
        out << "serial.port: /dev/first\n";
    }
    {
        std::ofstream out(second, std::ios::trunc);
        out << "serial.port: /dev/second\n";
    }

    std::string used;
    ConfigMap cfg = loadConfig({"/nonexistent/portcode.yaml", first, second}, &used);
    EXPECT_EQ(used, first);
    EXPECT_EQ(cfgStr(cfg, "serial.port", ""), "/dev/first");

    std::remove(first.c_str());
    std::remove(second.c_str());
}

TEST(ConfigLoader, NoCandidateFound)
{
    std::string used = "stale";
    ConfigMap cfg = loadConfig({"/nonexistent/a.yaml", "/nonexistent/b.yaml"}, &used);
    EXPECT_TRUE(cfg.empty());
    EXPECT_TRUE(used.empty());
}
