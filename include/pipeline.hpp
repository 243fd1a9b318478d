#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "database_client.hpp"
#include "firewall.hpp"
#include "install.hpp"
#include "package_resolver.hpp"
#include "port_auditor.hpp"
#include "security_hardener.hpp"
#include "service_reconciler.hpp"
#include "smoke_test.hpp"
#include "web_server.hpp"

namespace Lempctl {

class CommandRunner;
class HttpClient;
class Report;

/**
 * @brief The steps of a provisioning run, in pipeline order.
 *
 * This is also the closed set of names accepted by --debug.
 */
enum class Step
{
    BuildPackageList,
    InstallPackages,
    VerifyServices,
    SecureDatabase,
    CheckPorts,
    ConfigureFirewall,
    ConfigureUpstream,
    TestHttp,
    TestRuntime,
    TestDatabase
};

/**
 * @brief Command-line name of a step, e.g. "check-ports".
 */
const char* stepName(Step step);

/**
 * @brief Looks a step up by its command-line name.
 */
std::optional<Step> parseStep(const std::string& name);

/**
 * @brief Every step, in pipeline order.
 */
const std::vector<Step>& allSteps();

/**
 * @class Pipeline
 * @brief Runs the provisioning and verification steps against one host.
 *
 * All non-fatal failures land in the Report handed to the constructor; the
 * pipeline itself never aborts once started.
 */
class Pipeline
{
public:
    Pipeline(const Config& config, CommandRunner& runner, HttpClient& http, Report& report);

    /**
     * @brief Runs every step in order and writes the closing summary.
     *
     * @return True if no non-fatal error was reported.
     */
    bool run();

    /**
     * @brief Runs a single step in isolation (debug mode).
     *
     * install-packages resolves the package list first if needed.
     */
    void runStep(Step step);

    /**
     * @brief Writes the final "ready" or "needs manual configuration" line.
     */
    bool summarize();

    const PackageSet& packageSet() const { return packageSet_; }

    /**
     * @brief Services the stack needs: nginx, mariadb and the runtime.
     */
    std::vector<std::string> services() const;

    /**
     * @brief Listener expectations: the configured ports plus the runtime
     *        port with its unix-socket fallback.
     */
    std::vector<PortExpectation> portExpectations() const;

private:
    Config config_;
    Report& report_;

    DatabaseClient db_;
    PackageResolver resolver_;
    Installer installer_;
    ServiceReconciler services_;
    SecurityHardener hardener_;
    PortAuditor ports_;
    Firewall firewall_;
    WebServer web_;
    SmokeTestHarness smoke_;

    PackageSet packageSet_;
    bool resolved_ = false;
};

} // namespace Lempctl

#endif // PIPELINE_HPP
