#include "config.hpp"
#include <iostream>
#include <filesystem>
#include <regex>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Lempctl {

namespace {

    template <typename T>
    void readKey(const YAML::Node& root, const char* key, T& target)
    {
        const YAML::Node node = root[key];
        if (!node) {
            return;
        }
        try {
            target = node.as<T>();
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
        }
    }

    void readSeconds(const YAML::Node& root, const char* key, std::chrono::seconds& target)
    {
        long seconds = static_cast<long>(target.count());
        readKey(root, key, seconds);
        if (seconds <= 0) {
            throw ConfigError(std::string("'") + key + "' must be a positive number of seconds");
        }
        target = std::chrono::seconds(seconds);
    }

    Config fromNode(const YAML::Node& root)
    {
        Config config;

        // An empty document is a valid "use all defaults"
        if (!root || root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            throw ConfigError("Configuration root must be a mapping");
        }

        readKey(root, "php_version", config.phpVersion);
        readKey(root, "php_modules", config.phpModules);
        readKey(root, "secure_database", config.secureDatabase);
        readKey(root, "php_use_socket", config.phpUseSocket);
        readKey(root, "log_file", config.logFile);
        readKey(root, "nginx_conf_dir", config.nginxConfDir);
        readKey(root, "web_root", config.webRoot);
        readKey(root, "web_user", config.webUser);
        readKey(root, "public_ip_url", config.publicIpUrl);
        readKey(root, "ports", config.ports);
        readKey(root, "runtime_port", config.runtimePort);
        readSeconds(root, "command_timeout", config.commandTimeout);
        readSeconds(root, "install_timeout", config.installTimeout);
        readSeconds(root, "http_timeout", config.httpTimeout);

        return config;
    }

} // namespace

std::string Config::runtimeSocketPath() const
{
    return "/run/php/php" + phpVersion + "-fpm.sock";
}

std::string Config::runtimeServiceName() const
{
    return "php" + phpVersion + "-fpm";
}

Config Config::loadFromFile(const std::string& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw ConfigError("Unable to access configuration file " + path + ": " + ec.message());
        }
        return Config();
    }

    try {
        return fromNode(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Unable to parse configuration file " + path + ": " + e.what());
    }
}

Config Config::loadFromString(const std::string& yaml)
{
    try {
        return fromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Unable to parse configuration: ") + e.what());
    }
}

void Config::print() const
{
    std::cout << "Effective settings:" << std::endl;
    std::cout << "  php_version:     " << phpVersion << std::endl;
    std::cout << "  php_modules:     " << (phpModules.empty() ? "(none)" : phpModules) << std::endl;
    std::cout << "  secure_database: " << (secureDatabase ? "yes" : "no") << std::endl;
    std::cout << "  php_use_socket:  " << (phpUseSocket ? "yes" : "no") << std::endl;
    std::cout << "  nginx_conf_dir:  " << nginxConfDir << std::endl;
    std::cout << "  web_root:        " << webRoot << std::endl;
}

std::string normalizePhpVersion(const std::string& version)
{
    // 7.2 is not packaged for Ubuntu 20.04; its successor is
    if (version == "7.2") {
        return "7.4";
    }
    return version;
}

bool isValidPhpVersion(const std::string& version)
{
    static const std::regex pattern(R"(^[0-9]+\.[0-9]+$)");
    return std::regex_match(version, pattern);
}

} // namespace Lempctl
