//============================================================================
// Includes
//============================================================================

#include "install.hpp"         // Class definition
#include "command.hpp"         // CommandRunner, CommandResult
#include "report.hpp"          // Non-fatal error reporting

namespace Lempctl {

Installer::Installer(CommandRunner& runner, Report& report, std::chrono::seconds timeout)
    : runner_(runner)
    , report_(report)
    , timeout_(timeout)
{
}

/**
 * ---------------------------------------------------------------------------
 * runAptGet
 *
 * Runs apt-get with DEBIAN_FRONTEND=noninteractive so no debconf prompt can
 * block the run. Failures are reported but never thrown.
 * ---------------------------------------------------------------------------
 */
bool Installer::runAptGet(const std::vector<std::string>& args, const std::string& what)
{
    Command command;
    command.argv = {"apt-get"};
    command.argv.insert(command.argv.end(), args.begin(), args.end());
    command.timeout = timeout_;
    command.env = {{"DEBIAN_FRONTEND", "noninteractive"}};

    CommandResult result = runner_.run(command);
    if (!result.succeeded()) {
        report_.error("Failed to " + what + " (" + result.describe() + ").");
        return false;
    }
    return true;
}

bool Installer::refreshAndUpgrade()
{
    report_.info("Upgrading current packages...");

    // Upgrade is pointless against a stale index
    if (!runAptGet({"update"}, "update the package index")) {
        return false;
    }
    return runAptGet({"upgrade", "-y"}, "upgrade installed packages");
}

bool Installer::installPackages(const std::vector<std::string>& packages)
{
    if (packages.empty()) {
        report_.warn("No packages to install.");
        return true;
    }

    report_.info("Installing LEMP stack packages...");

    std::vector<std::string> args = {"install", "-y"};
    args.insert(args.end(), packages.begin(), packages.end());

    if (!runAptGet(args, "install LEMP stack packages")) {
        return false;
    }
    report_.ok("Packages installed.");
    return true;
}

} // namespace Lempctl
