#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace Lempctl {

/**
 * @brief Raised when the settings file exists but cannot be parsed or
 *        holds a value of the wrong type.
 */
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class Config
{
public:
    /**
     * @brief Runtime (PHP) version, "<major>.<minor>".
     */
    std::string phpVersion = "7.4";

    /**
     * @brief Comma-separated list of optional runtime modules.
     */
    std::string phpModules;

    bool secureDatabase = true;

    /**
     * @brief Whether the runtime upstream uses its unix socket (true) or
     *        TCP on runtimePort (false).
     */
    bool phpUseSocket = true;

    std::string logFile = "lemp_install.log";
    std::string nginxConfDir = "/etc/nginx/conf.d";
    std::string webRoot = "/var/www/html";

    /**
     * @brief Owner given to smoke-test content files. Empty skips chown.
     */
    std::string webUser = "www-data";

    std::string publicIpUrl = "http://icanhazip.com";

    std::vector<int> ports = {80, 3306};
    int runtimePort = 9000;

    std::chrono::seconds commandTimeout{120};
    std::chrono::seconds installTimeout{1800};
    std::chrono::seconds httpTimeout{10};

    /**
     * @brief Path of the runtime's default unix socket for phpVersion.
     */
    std::string runtimeSocketPath() const;

    /**
     * @brief Name of the runtime's service unit, e.g. "php8.1-fpm".
     */
    std::string runtimeServiceName() const;

    /**
     * @brief Loads configuration from a YAML file on disk.
     *
     * A missing file is not an error: defaults are returned. Keys that are
     * absent keep their default value.
     *
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws ConfigError if the file is malformed.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Parses configuration from YAML text. Same rules as loadFromFile.
     */
    static Config loadFromString(const std::string& yaml);

    /**
     * @brief Prints the effective settings to standard output.
     */
    void print() const;
};

/**
 * @brief Maps a requested runtime version to one the repository ships.
 *
 * Only "7.2" is rewritten (to "7.4"); anything else is returned unchanged.
 */
std::string normalizePhpVersion(const std::string& version);

/**
 * @brief Checks a runtime version string ("8.1", "7.4", ...).
 */
bool isValidPhpVersion(const std::string& version);

} // namespace Lempctl

#endif // CONFIG_HPP
