#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>
#include "config.hpp"

TEST(Config, Defaults)
{
    Config c;
    EXPECT_TRUE(c.interface.empty());
    EXPECT_EQ("192.168.178.0/24", c.scan_range);
    ASSERT_EQ(2u, c.gateways.size());
    EXPECT_EQ("192.168.178.1", c.gateways[0]);
    EXPECT_EQ("192.168.0.1", c.gateways[1]);
    EXPECT_EQ(2000u, c.scan_timeout_ms);
    EXPECT_EQ(2000u, c.retry_timeout_ms);
    EXPECT_EQ(5000u, c.gateway_timeout_ms);
    EXPECT_EQ("homebox_map_data.json", c.data_file);
    EXPECT_EQ("fav_devices", c.favourites_key);
    EXPECT_EQ(1u, c.verbosity);
}

TEST(Config, SetValues)
{
    Config c;
    EXPECT_TRUE(set_config_value(c, "gateways", " 10.0.0.1 , 10.0.0.254,"));
    ASSERT_EQ(2u, c.gateways.size());
    EXPECT_EQ("10.0.0.1", c.gateways[0]);
    EXPECT_EQ("10.0.0.254", c.gateways[1]);

    EXPECT_TRUE(set_config_value(c, "retry_timeout_ms", "500"));
    EXPECT_EQ(500u, c.retry_timeout_ms);

    EXPECT_TRUE(set_config_value(c, "verbosity", "2"));
    EXPECT_EQ(2u, c.verbosity);
}

TEST(Config, RejectInvalidValues)
{
    Config c;
    EXPECT_FALSE(set_config_value(c, "unknown", "1"));
    EXPECT_FALSE(set_config_value(c, "verbosity", "3"));
    EXPECT_FALSE(set_config_value(c, "scan_timeout_ms", "-1"));
    EXPECT_FALSE(set_config_value(c, "http_port", "70000"));
    EXPECT_FALSE(set_config_value(c, "monitor_period_s", "0"));
    EXPECT_FALSE(set_config_value(c, "gateways", " , "));
    EXPECT_FALSE(set_config_value(c, "data_file", ""));

    Config defaults;
    EXPECT_EQ(defaults.verbosity, c.verbosity);
    EXPECT_EQ(defaults.gateways, c.gateways);
    EXPECT_EQ(defaults.http_port, c.http_port);
}

TEST(Config, LoadFile)
{
    char path[] = "/tmp/device_tracker_config_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);

    {
        std::ofstream file(path);
        file << "# home network\n"
             << "\n"
             << "  interface = eth1  \n"
             << "scan_range=10.0.0.0/24\n"
             << "gateways=10.0.0.1\n"
             << "scan_timeout_ms = abc\n"
             << "no equal sign\n";
    }

    Config c;
    EXPECT_TRUE(load_config(path, c));
    EXPECT_EQ("eth1", c.interface);
    EXPECT_EQ("10.0.0.0/24", c.scan_range);
    ASSERT_EQ(1u, c.gateways.size());
    EXPECT_EQ("10.0.0.1", c.gateways[0]);
    EXPECT_EQ(2000u, c.scan_timeout_ms);

    unlink(path);
}

TEST(Config, MissingFile)
{
    Config c;
    EXPECT_FALSE(load_config("/nonexistent/device_tracker.conf", c));
}
