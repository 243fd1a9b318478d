#ifndef INSTALL_HPP
#define INSTALL_HPP

#include <chrono>            // For std::chrono::seconds
#include <string>            // For std::string
#include <vector>            // For std::vector

namespace Lempctl {

class CommandRunner;
class Report;

/**
 * @class Installer
 * @brief Drives the system package manager: refreshes the package index,
 *        upgrades what is installed, and installs the resolved package set.
 */
class Installer
{
public:
    /**
     * @param runner  Executes apt-get.
     * @param report  Receives progress and non-fatal errors.
     * @param timeout Deadline applied to each apt-get invocation.
     */
    Installer(CommandRunner& runner, Report& report,
              std::chrono::seconds timeout = std::chrono::seconds(1800));

    /**
     * @brief Runs `apt-get update` followed by `apt-get upgrade -y`.
     *
     * @return True if both commands succeeded.
     */
    bool refreshAndUpgrade();

    /**
     * @brief Installs the given packages non-interactively.
     *
     * @param packages Package names, e.g. as produced by PackageResolver.
     * @return True if apt-get reported success.
     */
    bool installPackages(const std::vector<std::string>& packages);

private:
    bool runAptGet(const std::vector<std::string>& args, const std::string& what);

    CommandRunner& runner_;
    Report& report_;
    std::chrono::seconds timeout_;
};

} // namespace Lempctl

#endif // INSTALL_HPP
