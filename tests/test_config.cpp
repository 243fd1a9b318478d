#include <gtest/gtest.h>

#include "config.hpp"
#include "test_helpers.hpp"

using namespace lempctl_test;
using Lempctl::Config;
using Lempctl::ConfigError;

TEST(ConfigTest, DefaultsMatchStockUbuntuLayout)
{
    Config config;

    EXPECT_EQ(config.phpVersion, "7.4");
    EXPECT_TRUE(config.phpModules.empty());
    EXPECT_TRUE(config.secureDatabase);
    EXPECT_TRUE(config.phpUseSocket);
    EXPECT_EQ(config.nginxConfDir, "/etc/nginx/conf.d");
    EXPECT_EQ(config.ports, (std::vector<int>{80, 3306}));
    EXPECT_EQ(config.runtimePort, 9000);
    EXPECT_EQ(config.runtimeSocketPath(), "/run/php/php7.4-fpm.sock");
    EXPECT_EQ(config.runtimeServiceName(), "php7.4-fpm");
}

TEST(ConfigTest, FileValuesOverrideDefaults)
{
    Config config = Config::loadFromString(
        "php_version: \"8.1\"\n"
        "php_modules: curl,gd\n"
        "secure_database: false\n"
        "php_use_socket: false\n"
        "ports: [80, 443, 3306]\n"
        "command_timeout: 30\n"
        "web_user: \"\"\n");

    EXPECT_EQ(config.phpVersion, "8.1");
    EXPECT_EQ(config.phpModules, "curl,gd");
    EXPECT_FALSE(config.secureDatabase);
    EXPECT_FALSE(config.phpUseSocket);
    EXPECT_EQ(config.ports, (std::vector<int>{80, 443, 3306}));
    EXPECT_EQ(config.commandTimeout.count(), 30);
    EXPECT_EQ(config.installTimeout.count(), 1800);
    EXPECT_TRUE(config.webUser.empty());
    EXPECT_EQ(config.runtimeServiceName(), "php8.1-fpm");
}

TEST(ConfigTest, WrongTypeIsRejected)
{
    EXPECT_THROW(Config::loadFromString("runtime_port: ninety\n"), ConfigError);
    EXPECT_THROW(Config::loadFromString("ports: 80\n"), ConfigError);
    EXPECT_THROW(Config::loadFromString("- just\n- a list\n"), ConfigError);
}

TEST(ConfigTest, NonPositiveTimeoutIsRejected)
{
    EXPECT_THROW(Config::loadFromString("http_timeout: 0\n"), ConfigError);
}

TEST(ConfigTest, MissingFileYieldsDefaults)
{
    TempDir dir;
    Config config = Config::loadFromFile(dir.file("absent.yaml"));

    EXPECT_EQ(config.phpVersion, "7.4");
}

TEST(ConfigTest, InaccessibleFileIsAConfigError)
{
    TempDir dir;
    const fs::path loop = dir.path() / "lempctl.yaml";
    fs::create_symlink(loop, loop);

    EXPECT_THROW(Config::loadFromFile(loop.string()), ConfigError);
}

TEST(ConfigTest, LoadsFromDisk)
{
    TempDir dir;
    writeFile(dir.file("lempctl.yaml"), "php_version: \"8.2\"\nweb_root: /srv/www\n");

    Config config = Config::loadFromFile(dir.file("lempctl.yaml"));

    EXPECT_EQ(config.phpVersion, "8.2");
    EXPECT_EQ(config.webRoot, "/srv/www");
}

TEST(ConfigTest, PhpVersionFormat)
{
    EXPECT_TRUE(Lempctl::isValidPhpVersion("7.4"));
    EXPECT_TRUE(Lempctl::isValidPhpVersion("8.1"));
    EXPECT_FALSE(Lempctl::isValidPhpVersion("8"));
    EXPECT_FALSE(Lempctl::isValidPhpVersion("8.1.2"));
    EXPECT_FALSE(Lempctl::isValidPhpVersion("8.1;rm"));
    EXPECT_FALSE(Lempctl::isValidPhpVersion(""));
}

TEST(ConfigTest, UnpackagedVersionIsMappedToSuccessor)
{
    EXPECT_EQ(Lempctl::normalizePhpVersion("7.2"), "7.4");
    EXPECT_EQ(Lempctl::normalizePhpVersion("7.4"), "7.4");
    EXPECT_EQ(Lempctl::normalizePhpVersion("8.1"), "8.1");
}
