#ifndef SMOKE_TEST_HPP
#define SMOKE_TEST_HPP

#include <string>
#include <vector>

namespace Lempctl {

class DatabaseClient;
class HttpClient;
class Report;
class WebServer;

struct SmokeTestOptions
{
    std::string webRoot = "/var/www/html";
    std::string webUser = "www-data";
    std::string localUrl = "http://localhost";
    std::string publicIpUrl = "http://icanhazip.com";
};

/**
 * @class SmokeTestHarness
 * @brief End-to-end checks of the installed stack with real traffic.
 *
 * Each test creates only the files and database objects it needs and
 * removes them before returning, whether or not its assertion held.
 */
class SmokeTestHarness
{
public:
    SmokeTestHarness(HttpClient& http, WebServer& web, DatabaseClient& db,
                     Report& report, const SmokeTestOptions& options);

    /**
     * @brief Requests the default page locally and via the public address.
     *
     * Only the local check can fail the test; the public-address check is
     * advisory because external firewalls commonly block it.
     */
    bool testHttp();

    /**
     * @brief Routes *.php to the runtime and fetches a generated script.
     */
    bool testRuntime();

    /**
     * @brief Creates a throwaway database and user, then has a generated
     *        script connect to it through the web server and runtime.
     *
     * If a database of the same name already exists the test is skipped
     * and nothing is dropped.
     */
    bool testDatabase();

    /**
     * @brief Files created by the most recent test, all of which should be
     *        gone by the time the test returned.
     */
    const std::vector<std::string>& lastArtifacts() const { return lastArtifacts_; }

    /**
     * @brief Server block that passes *.php requests to the php-fpm upstream.
     */
    std::string routeConfig() const;

    static const char* const kDatabaseName;
    static const char* const kDatabaseUser;

private:
    bool fetchContains(const std::string& path, const std::string& expected);
    bool runScriptTest(const std::string& scriptName, const std::string& scriptBody,
                       const std::string& expected);

    HttpClient& http_;
    WebServer& web_;
    DatabaseClient& db_;
    Report& report_;
    SmokeTestOptions options_;
    std::vector<std::string> lastArtifacts_;
};

} // namespace Lempctl

#endif // SMOKE_TEST_HPP
