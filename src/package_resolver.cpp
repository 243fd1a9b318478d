#include "package_resolver.hpp"
#include "command.hpp"
#include "report.hpp"
#include "utils.hpp"

#include <sstream>

namespace Lempctl {

PackageResolver::PackageResolver(CommandRunner& runner, Report& report, std::chrono::seconds timeout)
    : runner_(runner)
    , report_(report)
    , timeout_(timeout)
{
}

std::vector<std::string> PackageResolver::basePackages(const std::string& phpVersion)
{
    const std::string prefix = "php" + phpVersion;
    return {
        prefix,
        prefix + "-fpm",
        prefix + "-common",
        prefix + "-cli",
        prefix + "-mysql"
    };
}

bool PackageResolver::packageExists(const std::string& packageName)
{
    Command command;
    command.argv = {"apt-cache", "search", "--names-only", "^" + packageName + "$"};
    command.timeout = timeout_;

    CommandResult result = runner_.run(command);
    if (!result.succeeded()) {
        report_.warn("Repository query for " + packageName + " failed: " + result.describe());
        return false;
    }

    // Output lines look like "php8.1-curl - CURL module for PHP"
    std::istringstream iss(result.output);
    std::string line;
    while (std::getline(iss, line)) {
        std::istringstream fields(line);
        std::string name;
        fields >> name;
        if (name == packageName) {
            return true;
        }
    }
    return false;
}

PackageSet PackageResolver::resolve(const std::string& phpVersion, const std::string& moduleList)
{
    report_.info("Checking packages...");

    PackageSet set;
    set.packages = basePackages(phpVersion);

    for (const auto& module : splitCommaList(moduleList)) {
        PackageCandidate candidate{"php" + phpVersion + "-" + module, false};

        report_.info("Checking if " + candidate.name + " exists in repo...");
        candidate.validated = packageExists(candidate.name);

        if (candidate.validated) {
            report_.info(candidate.name + " exists.");
            set.packages.push_back(candidate.name);
        } else {
            report_.error(candidate.name + " doesn't exist. Added to invalid modules.");
            set.invalidModules.push_back(candidate.name);
        }
        set.candidates.push_back(candidate);
    }

    for (const char* infra : {"nginx", "mariadb-server", "mariadb-common"}) {
        set.packages.emplace_back(infra);
    }

    if (!set.invalidModules.empty()) {
        std::string joined;
        for (const auto& name : set.invalidModules) {
            joined += (joined.empty() ? "" : ", ") + name;
        }
        report_.warn("Skipping modules not found in the repository: " + joined);
    }

    return set;
}

} // namespace Lempctl
