#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include <chrono>
#include <string>

namespace Lempctl {

class CommandRunner;
class Report;

/**
 * @class WebServer
 * @brief Thin wrapper over the nginx binary.
 */
class WebServer
{
public:
    /**
     * @param confDir Directory nginx includes fragments from (conf.d).
     */
    WebServer(CommandRunner& runner, Report& report, const std::string& confDir,
              std::chrono::seconds timeout = std::chrono::seconds(120));

    /**
     * @brief Validates the configuration with `nginx -t`.
     */
    bool validate();

    /**
     * @brief Validates, then reloads with `nginx -s reload`.
     *
     * An invalid configuration is reported and the reload is skipped, so
     * the running server keeps its last good configuration.
     *
     * @return True if the reload was issued and succeeded.
     */
    bool reload();

    /**
     * @brief Installs the permanent `php-fpm` upstream fragment and reloads.
     *
     * @param server Upstream target, e.g. "unix:/run/php/php8.1-fpm.sock"
     *               or "127.0.0.1:9000".
     */
    bool installUpstream(const std::string& server);

    /**
     * @brief Path of the permanent upstream fragment.
     */
    std::string upstreamPath() const;

    const std::string& confDir() const { return confDir_; }

private:
    CommandRunner& runner_;
    Report& report_;
    std::string confDir_;
    std::chrono::seconds timeout_;
};

} // namespace Lempctl

#endif // WEB_SERVER_HPP
