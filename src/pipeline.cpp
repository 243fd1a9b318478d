#include "pipeline.hpp"
#include "command.hpp"
#include "http_client.hpp"
#include "report.hpp"

#include <utility>

namespace Lempctl {

namespace {

    const std::vector<std::pair<Step, const char*>>& stepTable()
    {
        static const std::vector<std::pair<Step, const char*>> table = {
            {Step::BuildPackageList,  "build-package-list"},
            {Step::InstallPackages,   "install-packages"},
            {Step::VerifyServices,    "verify-services"},
            {Step::SecureDatabase,    "secure-database"},
            {Step::CheckPorts,        "check-ports"},
            {Step::ConfigureFirewall, "configure-firewall"},
            {Step::ConfigureUpstream, "configure-upstream"},
            {Step::TestHttp,          "test-http"},
            {Step::TestRuntime,       "test-php"},
            {Step::TestDatabase,      "test-database"}
        };
        return table;
    }

    SmokeTestOptions smokeOptions(const Config& config)
    {
        SmokeTestOptions options;
        options.webRoot = config.webRoot;
        options.webUser = config.webUser;
        options.publicIpUrl = config.publicIpUrl;
        return options;
    }

} // namespace

const char* stepName(Step step)
{
    for (const auto& [value, name] : stepTable()) {
        if (value == step) {
            return name;
        }
    }
    return "unknown";
}

std::optional<Step> parseStep(const std::string& name)
{
    for (const auto& [value, label] : stepTable()) {
        if (name == label) {
            return value;
        }
    }
    return std::nullopt;
}

const std::vector<Step>& allSteps()
{
    static const std::vector<Step> steps = [] {
        std::vector<Step> out;
        for (const auto& entry : stepTable()) {
            out.push_back(entry.first);
        }
        return out;
    }();
    return steps;
}

Pipeline::Pipeline(const Config& config, CommandRunner& runner, HttpClient& http, Report& report)
    : config_(config)
    , report_(report)
    , db_(runner, config.commandTimeout)
    , resolver_(runner, report, config.commandTimeout)
    , installer_(runner, report, config.installTimeout)
    , services_(runner, report, config.commandTimeout)
    , hardener_(db_, report)
    , ports_(runner, report, config.commandTimeout)
    , firewall_(runner, report, config.commandTimeout)
    , web_(runner, report, config.nginxConfDir, config.commandTimeout)
    , smoke_(http, web_, db_, report, smokeOptions(config))
{
}

std::vector<std::string> Pipeline::services() const
{
    return {"nginx", "mariadb", config_.runtimeServiceName()};
}

std::vector<PortExpectation> Pipeline::portExpectations() const
{
    std::vector<PortExpectation> expectations;
    for (int port : config_.ports) {
        expectations.push_back({port, "tcp", ""});
    }
    expectations.push_back({config_.runtimePort, "tcp", config_.runtimeSocketPath()});
    return expectations;
}

void Pipeline::runStep(Step step)
{
    switch (step) {
        case Step::BuildPackageList:
            packageSet_ = resolver_.resolve(config_.phpVersion, config_.phpModules);
            resolved_ = true;
            break;

        case Step::InstallPackages:
            if (!resolved_) {
                runStep(Step::BuildPackageList);
            }
            installer_.installPackages(packageSet_.packages);
            break;

        case Step::VerifyServices:
            services_.reconcile(services());
            break;

        case Step::SecureDatabase:
            hardener_.harden();
            break;

        case Step::CheckPorts:
            ports_.audit(portExpectations());
            break;

        case Step::ConfigureFirewall:
            firewall_.configure();
            break;

        case Step::ConfigureUpstream:
            web_.installUpstream(config_.phpUseSocket
                                     ? "unix:" + config_.runtimeSocketPath()
                                     : "127.0.0.1:" + std::to_string(config_.runtimePort));
            break;

        case Step::TestHttp:
            smoke_.testHttp();
            break;

        case Step::TestRuntime:
            smoke_.testRuntime();
            break;

        case Step::TestDatabase:
            smoke_.testDatabase();
            break;
    }
}

bool Pipeline::run()
{
    report_.info("Installing LEMP stack...");

    // Index refresh belongs to the full run only; debug steps never upgrade
    installer_.refreshAndUpgrade();

    for (Step step : allSteps()) {
        if (step == Step::SecureDatabase && !config_.secureDatabase) {
            report_.info("Not securing mariadb installation.");
            continue;
        }
        runStep(step);
    }

    return summarize();
}

bool Pipeline::summarize()
{
    if (report_.clean()) {
        report_.ok("Your LEMP stack is ready !!");
        return true;
    }
    report_.info("LEMP stack installation is finished with errors. Need manual configuration. ("
                 + std::to_string(report_.errorCount()) + " error(s))");
    return false;
}

} // namespace Lempctl
