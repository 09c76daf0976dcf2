#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "config.hpp"
#include "logger.hpp"

namespace {

class ConfigTest : public ::testing::Test
{
protected:
    std::string write(const std::string& body)
    {
        path_ = ::testing::TempDir() + "ldapattr_config_test.conf";
        std::ofstream out(path_);
        out << body;
        return path_;
    }

    void TearDown() override
    {
        if (!path_.empty()) std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(ConfigTest, defaults_without_keys)
{
    Config cfg;
    std::string err;
    ASSERT_TRUE(load_config(write("# nothing\n\n"), cfg, err)) << err;
    EXPECT_EQ(cfg.log_file, "");
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_FALSE(cfg.sort_output);
    EXPECT_FALSE(cfg.hex_uppercase);
    EXPECT_EQ(cfg.hex_wrap, 0u);
}

TEST_F(ConfigTest, reads_all_keys)
{
    Config cfg;
    std::string err;
    ASSERT_TRUE(load_config(write(
        "log_file = /tmp/ldapattr.log\n"
        "log_level = debug\n"
        "sort_output = yes\n"
        "hex_uppercase = 1\n"
        "hex_wrap = 64\n"), cfg, err)) << err;
    EXPECT_EQ(cfg.log_file, "/tmp/ldapattr.log");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_TRUE(cfg.sort_output);
    EXPECT_TRUE(cfg.hex_uppercase);
    EXPECT_EQ(cfg.hex_wrap, 64u);
}

TEST_F(ConfigTest, unknown_key_reports_line)
{
    Config cfg;
    std::string err;
    EXPECT_FALSE(load_config(write("log_level = warn\nbogus = 1\n"), cfg, err));
    EXPECT_EQ(err, "unknown config key at line 2: bogus");
}

TEST_F(ConfigTest, bad_values_fail)
{
    Config cfg;
    std::string err;
    EXPECT_FALSE(load_config(write("sort_output = maybe\n"), cfg, err));
    EXPECT_FALSE(load_config(write("hex_wrap = wide\n"), cfg, err));
    EXPECT_FALSE(load_config(write("log_level = loud\n"), cfg, err));
    EXPECT_FALSE(load_config(write("no equals sign\n"), cfg, err));
}

TEST_F(ConfigTest, missing_file_fails)
{
    Config cfg;
    std::string err;
    EXPECT_FALSE(load_config(::testing::TempDir() + "does-not-exist.conf", cfg, err));
    EXPECT_NE(err.find("failed to open config"), std::string::npos);
}

TEST(LogLevel, parses_names)
{
    EXPECT_EQ(parse_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_level("whatever"), LogLevel::INFO);
}

TEST(Logger, filters_below_level)
{
    std::string path = ::testing::TempDir() + "ldapattr_logger_test.log";
    std::remove(path.c_str());
    {
        Logger logger(path, LogLevel::WARN);
        logger.info("hidden");
        logger.error("shown");
    }
    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    EXPECT_NE(line.find("[ERROR] shown"), std::string::npos);
    EXPECT_FALSE(static_cast<bool>(std::getline(in, line)));
    std::remove(path.c_str());
}

} // namespace
